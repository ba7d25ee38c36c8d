//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2021-2022 Anthony Paul Astolfi
//
#pragma once
#ifndef FFAIL_LOGGING_HPP
#define FFAIL_LOGGING_HPP

#include <ffail/config.hpp>

// Verbose diagnostics from the sequence drivers.
//
//   FFAIL_VLOG(level) << ...;   // glog VLOG
//   FFAIL_DVLOG(level) << ...;  // glog DVLOG; nothing in NDEBUG builds
//
// Without glog both compile to a stream insertion that is type-checked but never evaluated.
//
#ifdef FFAIL_GLOG_AVAILABLE

#include <glog/logging.h>

#define FFAIL_VLOG(level) VLOG(level)
#define FFAIL_DVLOG(level) DVLOG(level)

#else  // ==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -

#include <ostream>

namespace ffail {
namespace detail {

inline std::ostream& unused_log_stream()
{
    static std::ostream discard{nullptr};
    return discard;
}

}  // namespace detail
}  // namespace ffail

#define FFAIL_VLOG(level)                                                                                    \
    while (false && (level))                                                                                 \
    ::ffail::detail::unused_log_stream()

#define FFAIL_DVLOG(level) FFAIL_VLOG(level)

#endif  // FFAIL_GLOG_AVAILABLE

#endif  // FFAIL_LOGGING_HPP

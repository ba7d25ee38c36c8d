//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2021-2022 Anthony Paul Astolfi
//
#pragma once
#ifndef FFAIL_CONFIG_HPP
#define FFAIL_CONFIG_HPP

#if __cplusplus < 201703L
#error ffail requires C++17 or later!
#endif

namespace ffail {

// Define this preprocessor symbol to send logging and check failures to Google Log (GLOG).
//
//#define FFAIL_GLOG_AVAILABLE

}  // namespace ffail

#endif  // FFAIL_CONFIG_HPP

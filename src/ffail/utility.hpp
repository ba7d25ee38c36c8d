//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2021-2022 Anthony Paul Astolfi
//
#pragma once
#ifndef FFAIL_UTILITY_HPP
#define FFAIL_UTILITY_HPP

#include <ffail/config.hpp>
//

#include <type_traits>
#include <utility>

namespace ffail {

// =============================================================================

/// Perfectly forward `x`.  Avoids having to include redundant information in a `std::forward`
/// expression.
///
#define FFAIL_FORWARD(x) std::forward<decltype(x)>(x)

/// Warn/error if a value of the marked class is returned and then ignored:
///
/// ```
/// template <typename T, typename E>
/// class FFAIL_WARN_UNUSED_RESULT Result;
/// ```
///
#if defined(__has_attribute) && __has_attribute(nodiscard)
#define FFAIL_WARN_UNUSED_RESULT [[nodiscard]]

#elif defined(__has_attribute) && __has_attribute(warn_unused_result)
#define FFAIL_WARN_UNUSED_RESULT __attribute__((warn_unused_result))

#else
#define FFAIL_WARN_UNUSED_RESULT

#endif

}  // namespace ffail

#endif  // FFAIL_UTILITY_HPP

// Copyright 2021-2022 Anthony Paul Astolfi
//
#pragma once
#ifndef FFAIL_HINT_HPP
#define FFAIL_HINT_HPP

#include <ffail/config.hpp>
//

namespace ffail {

// =============================================================================
// Branch prediction hints.
//
#define FFAIL_HINT_TRUE(expr) __builtin_expect(static_cast<bool>(expr), 1)
#define FFAIL_HINT_FALSE(expr) __builtin_expect(static_cast<bool>(expr), 0)

}  // namespace ffail

#endif  // FFAIL_HINT_HPP

//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2021-2022 Anthony Paul Astolfi
//
#pragma once
#ifndef FFAIL_HPP
#define FFAIL_HPP

#include <ffail/assert.hpp>
#include <ffail/case_of.hpp>
#include <ffail/config.hpp>
#include <ffail/fallible_traits.hpp>
#include <ffail/hint.hpp>
#include <ffail/int_types.hpp>
#include <ffail/logging.hpp>
#include <ffail/optional.hpp>
#include <ffail/ref.hpp>
#include <ffail/result.hpp>
#include <ffail/seq.hpp>
#include <ffail/type_traits.hpp>
#include <ffail/utility.hpp>

#endif  // FFAIL_HPP

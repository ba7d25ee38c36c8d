// Copyright 2021 Anthony Paul Astolfi
//
#pragma once
#ifndef FFAIL_OPTIONAL_HPP
#define FFAIL_OPTIONAL_HPP

#include <ffail/config.hpp>
//

#include <boost/none.hpp>
#include <boost/optional.hpp>
#include <boost/optional/optional_io.hpp>

#include <type_traits>

namespace ffail {

// ffail::Optional is boost::optional.  An empty Optional prints as "--"; a full one prints as a space
// followed by the value.
//
template <typename T>
using Optional = boost::optional<T>;

using NoneType = boost::none_t;

namespace {
decltype(auto) None = boost::none;
decltype(auto) InPlaceInit = boost::in_place_init;
}  // namespace

}  // namespace ffail

#endif  // FFAIL_OPTIONAL_HPP

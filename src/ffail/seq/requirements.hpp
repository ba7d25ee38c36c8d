//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef FFAIL_SEQ_REQUIREMENTS_HPP
#define FFAIL_SEQ_REQUIREMENTS_HPP

#include <ffail/config.hpp>
//
#include <ffail/optional.hpp>

#include <type_traits>

namespace ffail {

// A Seq is any type with a nested `Item` type and the member functions:
//
//   Optional<Item> next();  // consume and return the next item, or None at the end
//   Optional<Item> peek();  // return the next item without consuming it
//
// `Item` may be an lvalue reference (for sequences over storage owned elsewhere) but never an rvalue
// reference.
//
template <typename T>
using SeqItem = typename std::decay_t<T>::Item;

namespace detail {

template <typename T, typename = void>
struct IsSeqImpl : std::false_type {
};

template <typename T>
struct IsSeqImpl<T, std::void_t<SeqItem<T>, decltype(std::declval<T&>().next()),
                                decltype(std::declval<T&>().peek())>>
    : std::bool_constant<!std::is_rvalue_reference_v<SeqItem<T>> &&
                         std::is_same_v<decltype(std::declval<T&>().next()), Optional<SeqItem<T>>> &&
                         std::is_same_v<decltype(std::declval<T&>().peek()), Optional<SeqItem<T>>>> {
};

}  // namespace detail

template <typename T>
using IsSeq = detail::IsSeqImpl<std::decay_t<T>>;

}  // namespace ffail

#endif  // FFAIL_SEQ_REQUIREMENTS_HPP

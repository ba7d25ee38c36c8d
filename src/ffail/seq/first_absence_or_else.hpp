//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef FFAIL_SEQ_FIRST_ABSENCE_OR_ELSE_HPP
#define FFAIL_SEQ_FIRST_ABSENCE_OR_ELSE_HPP

#include <ffail/config.hpp>
//
#include <ffail/fallible_traits.hpp>
#include <ffail/seq/first_failure_or_else.hpp>
#include <ffail/utility.hpp>

#include <utility>

namespace ffail {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// first_absence_or_else(fn), first_absence_or(value), first_absence_or_try(fn)
//
// The same as the first_failure_* family, for Seqs of `Optional<T>` (or `std::optional<T>`): `fn` sees the
// present values up to the first None, and the result is None if any item is None, else
// `Optional<O>{fn's output}`.
//
template <typename Fn>
inline FirstFailureOrElseBinder<AbsenceTraits, Fn> first_absence_or_else(Fn&& fn)
{
    return {FFAIL_FORWARD(fn)};
}

template <typename T>
inline auto first_absence_or(T&& value)
{
    return first_absence_or_else([value = FFAIL_FORWARD(value)](auto&&) mutable {
        return std::move(value);
    });
}

template <typename Fn>
inline FirstFailureOrTryBinder<AbsenceTraits, Fn> first_absence_or_try(Fn&& fn)
{
    return {FFAIL_FORWARD(fn)};
}

}  // namespace seq
}  // namespace ffail

#endif  // FFAIL_SEQ_FIRST_ABSENCE_OR_ELSE_HPP

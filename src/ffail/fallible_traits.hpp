//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef FFAIL_FALLIBLE_TRAITS_HPP
#define FFAIL_FALLIBLE_TRAITS_HPP

#include <ffail/config.hpp>
//
#include <ffail/optional.hpp>
#include <ffail/result.hpp>
#include <ffail/utility.hpp>

#include <optional>
#include <type_traits>

namespace ffail {

// =============================================================================
// Fallible traits describe a two-variant item type to the first-failure machinery:
//
// ```
// struct SomeTraits {
//     using value_type = ...;    // the unwrapped success value
//     using failure_type = ...;  // what is retained when a failure is found
//
//     template <typename O>
//     using Outcome = ...;       // the result of a driver whose function returns `O`
//
//     static bool is_failure(const Item&);
//     static value_type unwrap_value(Item&&);
//     static failure_type unwrap_failure(Item&&);
//
//     template <typename O> static Outcome<std::decay_t<O>> make_success(O&&);
//     template <typename O> static Outcome<O> make_failure(failure_type&&);
//     template <typename O> static Outcome<O> flatten(Outcome<Outcome<O>>&&);
// };
// ```
//
// `FailureTraits<T>` covers success/failure items (`Result<T, E>`), `AbsenceTraits<T>` covers
// presence/absence items (`Optional<T>`, `std::optional<T>`).  Specialize either one to teach the library
// about another two-variant type.
//
template <typename T>
struct FailureTraits;

template <typename T>
struct AbsenceTraits;

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
//
template <typename T, typename E>
struct FailureTraits<Result<T, E>> {
    using value_type = T;
    using failure_type = E;

    template <typename O>
    using Outcome = Result<O, E>;

    static bool is_failure(const Result<T, E>& item) noexcept
    {
        return !item.ok();
    }

    template <typename R>
    static value_type unwrap_value(R&& item)
    {
        return FFAIL_FORWARD(item).value();
    }

    template <typename R>
    static failure_type unwrap_failure(R&& item)
    {
        return FFAIL_FORWARD(item).error();
    }

    template <typename O>
    static Outcome<std::decay_t<O>> make_success(O&& output)
    {
        return success(FFAIL_FORWARD(output));
    }

    template <typename O>
    static Outcome<O> make_failure(failure_type&& error)
    {
        return failure(std::move(error));
    }

    template <typename O>
    static Outcome<O> flatten(Outcome<Outcome<O>>&& nested)
    {
        return std::move(nested).and_then([](Outcome<O>&& inner) -> Outcome<O> {
            return std::move(inner);
        });
    }
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
//
namespace detail {

template <typename T>
struct OptionalAbsenceTraits {
    using value_type = T;
    using failure_type = NoneType;

    template <typename O>
    using Outcome = Optional<O>;

    template <typename Opt>
    static bool is_failure(const Opt& item) noexcept
    {
        return !item;
    }

    template <typename Opt>
    static value_type unwrap_value(Opt&& item)
    {
        return *FFAIL_FORWARD(item);
    }

    template <typename Opt>
    static failure_type unwrap_failure(Opt&&) noexcept
    {
        return None;
    }

    template <typename O>
    static Outcome<std::decay_t<O>> make_success(O&& output)
    {
        return Outcome<std::decay_t<O>>{InPlaceInit, FFAIL_FORWARD(output)};
    }

    template <typename O>
    static Outcome<O> make_failure(failure_type&&) noexcept
    {
        return None;
    }

    template <typename O>
    static Outcome<O> flatten(Outcome<Outcome<O>>&& nested)
    {
        if (!nested) {
            return None;
        }
        return *std::move(nested);
    }
};

}  // namespace detail

template <typename T>
struct AbsenceTraits<Optional<T>> : detail::OptionalAbsenceTraits<T> {
};

template <typename T>
struct AbsenceTraits<std::optional<T>> : detail::OptionalAbsenceTraits<T> {
};

}  // namespace ffail

#endif  // FFAIL_FALLIBLE_TRAITS_HPP

//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef FFAIL_SEQ_FIRST_FAILURE_OR_ELSE_HPP
#define FFAIL_SEQ_FIRST_FAILURE_OR_ELSE_HPP

#include <ffail/config.hpp>
//
#include <ffail/case_of.hpp>
#include <ffail/fallible_traits.hpp>
#include <ffail/logging.hpp>
#include <ffail/result.hpp>
#include <ffail/seq/first_failure_seq.hpp>
#include <ffail/seq/requirements.hpp>
#include <ffail/type_traits.hpp>
#include <ffail/utility.hpp>

#include <type_traits>
#include <utility>

namespace ffail {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// first_failure_or_else(fn) - run `fn` over the success values of a Seq of `Result<T, E>`, returning
// either the first failure in the Seq or `fn`'s output:
//
// ```
// std::vector<ffail::Result<int, std::string>> items = ...;
//
// ffail::Result<int, std::string> total = ffail::as_seq(items)  //
//     | ffail::seq::first_failure_or_else([](auto& values) {
//           return ffail::as_ref(values) | ffail::seq::sum();
//       });
// ```
//
// `fn` receives a `FirstFailureSeq&` which is only valid for the duration of the call.  It may pull as many
// or as few values as it likes; once it returns, the rest of the source is drained (successes are
// discarded) until the first failure or the end.  The result is a failure iff the whole source contains
// one, in which case it is always the first one.  A failure that has been found wins over `fn`'s output.
//
// `fn` returning void is treated as returning `ffail::Unit`.  Returning anything that refers to the adapter
// (a reference, pointer, `Ref`, or a pipeline built on one) is a compile-time error.
//
template <template <typename> class TraitsTmpl, typename Fn>
struct FirstFailureOrElseBinder {
    Fn fn;
};

template <typename Fn>
inline FirstFailureOrElseBinder<FailureTraits, Fn> first_failure_or_else(Fn&& fn)
{
    return {FFAIL_FORWARD(fn)};
}

// first_failure_or(value) - the first failure in the Seq, or else `value`.  Does not look at the successes.
//
template <typename T>
inline auto first_failure_or(T&& value)
{
    return first_failure_or_else([value = FFAIL_FORWARD(value)](auto&&) mutable {
        return std::move(value);
    });
}

// first_failure_or_try(fn) - like first_failure_or_else, but `fn` returns a `Result<O, E>` of its own.  A
// failure from the Seq takes precedence over a failure from `fn`.
//
template <template <typename> class TraitsTmpl, typename Fn>
struct FirstFailureOrTryBinder {
    Fn fn;
};

template <typename Fn>
inline FirstFailureOrTryBinder<FailureTraits, Fn> first_failure_or_try(Fn&& fn)
{
    return {FFAIL_FORWARD(fn)};
}

namespace detail {

template <typename Fn, typename Adapter>
auto invoke_with_adapter(Fn& fn, Adapter& adapter)
{
    if constexpr (std::is_void_v<std::invoke_result_t<Fn&, Adapter&>>) {
        fn(adapter);
        return Unit{};
    } else {
        return fn(adapter);
    }
}

template <template <typename> class TraitsTmpl, typename SeqT, typename Fn>
auto run_first_failure_or_else(SeqT&& seq, Fn& fn)
{
    using Traits = TraitsTmpl<std::decay_t<SeqItem<SeqT>>>;
    using Adapter = FirstFailureSeq<SeqT, Traits>;

    static_assert(!RefersTo<std::invoke_result_t<Fn&, Adapter&>, Adapter>{},
                  "The function passed to first_failure_or_else must not return the sequence it was given, "
                  "or anything referring to it");

    Adapter adapter{FFAIL_FORWARD(seq)};

    auto output = invoke_with_adapter(fn, adapter);

    using Output = decltype(output);
    using Outcome = typename Traits::template Outcome<Output>;

    return case_of(
        FirstFailureSeqAccess::state(adapter),

        //+++++++++++-+-+--+----- --- -- -  -  -   -
        [&](typename Adapter::Active& active) -> Outcome {
            for (;;) {
                auto item = active.source.next();
                if (!item) {
                    break;
                }
                if (Traits::is_failure(*item)) {
                    FFAIL_VLOG(1) << "found the first failure while draining the source after fn returned;"
                                  << FFAIL_INSPECT(name_of<Fn>());
                    return Traits::template make_failure<Output>(
                        Traits::unwrap_failure(std::forward<SeqItem<SeqT>>(*item)));
                }
            }
            return Traits::make_success(std::move(output));
        },

        //+++++++++++-+-+--+----- --- -- -  -  -   -
        [&](typename Adapter::FoundFailure& found) -> Outcome {
            return Traits::template make_failure<Output>(std::move(found.failure));
        },

        //+++++++++++-+-+--+----- --- -- -  -  -   -
        [&](typename Adapter::Exhausted&) -> Outcome {
            return Traits::make_success(std::move(output));
        });
}

}  // namespace detail

template <typename SeqT, template <typename> class TraitsTmpl, typename Fn>
[[nodiscard]] auto operator|(SeqT&& seq, FirstFailureOrElseBinder<TraitsTmpl, Fn>&& binder)
{
    static_assert(std::is_same_v<SeqT, std::decay_t<SeqT>>,
                  "(seq::first_failure_or_else) Sequences may not be captured implicitly by reference.");

    return detail::run_first_failure_or_else<TraitsTmpl>(FFAIL_FORWARD(seq), binder.fn);
}

template <typename SeqT, template <typename> class TraitsTmpl, typename Fn>
[[nodiscard]] auto operator|(SeqT&& seq, FirstFailureOrTryBinder<TraitsTmpl, Fn>&& binder)
{
    static_assert(std::is_same_v<SeqT, std::decay_t<SeqT>>,
                  "(seq::first_failure_or_try) Sequences may not be captured implicitly by reference.");

    using Traits = TraitsTmpl<std::decay_t<SeqItem<SeqT>>>;

    return Traits::flatten(detail::run_first_failure_or_else<TraitsTmpl>(FFAIL_FORWARD(seq), binder.fn));
}

}  // namespace seq
}  // namespace ffail

#endif  // FFAIL_SEQ_FIRST_FAILURE_OR_ELSE_HPP

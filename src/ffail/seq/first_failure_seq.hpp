//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef FFAIL_SEQ_FIRST_FAILURE_SEQ_HPP
#define FFAIL_SEQ_FIRST_FAILURE_SEQ_HPP

#include <ffail/config.hpp>
//
#include <ffail/assert.hpp>
#include <ffail/fallible_traits.hpp>
#include <ffail/logging.hpp>
#include <ffail/optional.hpp>
#include <ffail/seq/requirements.hpp>
#include <ffail/type_traits.hpp>
#include <ffail/utility.hpp>

#include <ostream>
#include <type_traits>
#include <utility>
#include <variant>

namespace ffail {
namespace seq {

namespace detail {
struct FirstFailureSeqAccess;
}  // namespace detail

// Adapts a Seq of two-variant items (success/failure, or presence/absence) into a Seq of the unwrapped
// success values.  The first failure pulled from `SeqT` ends the sequence and is retained; the source is
// destroyed at that point and never pulled again.
//
//   Active ---(failure)---> FoundFailure
//     |
//     +-----(end of seq)--> Exhausted
//
// Once `next()` returns None it will always return None, whatever the source would do if pulled again.
//
// Instances are handed out only by reference (see seq::first_failure_or_else), so this type is neither
// copyable nor movable.
//
template <typename SeqT, typename TraitsT = FailureTraits<std::decay_t<SeqItem<SeqT>>>>
class FirstFailureSeq
{
    friend struct detail::FirstFailureSeqAccess;

   public:
    using Traits = TraitsT;
    using Item = typename Traits::value_type;
    using failure_type = typename Traits::failure_type;

    struct Active {
        SeqT source;
    };

    struct FoundFailure {
        failure_type failure;
    };

    struct Exhausted {
    };

    using State = std::variant<Active, FoundFailure, Exhausted>;

    explicit FirstFailureSeq(SeqT&& source) noexcept
        : state_{std::in_place_type<Active>, Active{FFAIL_FORWARD(source)}}
    {
    }

    FirstFailureSeq(const FirstFailureSeq&) = delete;
    FirstFailureSeq& operator=(const FirstFailureSeq&) = delete;

    Optional<Item> peek()
    {
        Active* const active = std::get_if<Active>(&this->state_);
        if (!active) {
            return None;
        }

        auto item = active->source.peek();
        if (!item || Traits::is_failure(*item)) {
            return None;
        }
        return Traits::unwrap_value(std::forward<SeqItem<SeqT>>(*item));
    }

    Optional<Item> next()
    {
        Active* const active = std::get_if<Active>(&this->state_);
        if (!active) {
            return None;
        }

        auto item = active->source.next();
        if (!item) {
            this->state_.template emplace<Exhausted>();
            return None;
        }
        if (Traits::is_failure(*item)) {
            // `item` may point into the source; take the failure value out before the source goes away.
            //
            failure_type found = Traits::unwrap_failure(std::forward<SeqItem<SeqT>>(*item));
            this->state_.template emplace<FoundFailure>(FoundFailure{std::move(found)});
            FFAIL_DVLOG(2) << "first failure found; source released";
            return None;
        }
        return Traits::unwrap_value(std::forward<SeqItem<SeqT>>(*item));
    }

    bool is_active() const noexcept
    {
        return std::holds_alternative<Active>(this->state_);
    }

    bool found_failure() const noexcept
    {
        return std::holds_alternative<FoundFailure>(this->state_);
    }

    bool is_exhausted() const noexcept
    {
        return std::holds_alternative<Exhausted>(this->state_);
    }

    // The retained failure, if one has been found.
    //
    const failure_type* failure() const noexcept
    {
        const FoundFailure* const found = std::get_if<FoundFailure>(&this->state_);
        if (!found) {
            return nullptr;
        }
        return &found->failure;
    }

   private:
    State state_;
};

template <typename SeqT>
using FirstAbsenceSeq = FirstFailureSeq<SeqT, AbsenceTraits<std::decay_t<SeqItem<SeqT>>>>;

template <typename SeqT, typename TraitsT>
inline std::ostream& operator<<(std::ostream& out, const FirstFailureSeq<SeqT, TraitsT>& t)
{
    out << "FirstFailureSeq{";
    if (t.is_active()) {
        out << "Active";
    } else if (t.is_exhausted()) {
        out << "Exhausted";
    } else {
        out << "FoundFailure{" << make_printable(*t.failure()) << "}";
    }
    return out << "}";
}

namespace detail {

// Gives the drivers in seq/first_failure_or_else.hpp direct access to the adapter state, so the source can
// be finished off after the caller's function returns.
//
struct FirstFailureSeqAccess {
    template <typename SeqT, typename TraitsT>
    static auto& state(FirstFailureSeq<SeqT, TraitsT>& adapter) noexcept
    {
        return adapter.state_;
    }
};

}  // namespace detail
}  // namespace seq
}  // namespace ffail

#endif  // FFAIL_SEQ_FIRST_FAILURE_SEQ_HPP

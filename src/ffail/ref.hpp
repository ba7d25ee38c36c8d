//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2021-2022 Anthony Paul Astolfi
//
#pragma once
#ifndef FFAIL_REF_HPP
#define FFAIL_REF_HPP

#include <ffail/config.hpp>
//
#include <ffail/optional.hpp>
#include <ffail/seq/requirements.hpp>

namespace ffail {

// Non-owning, copyable Seq that pulls from another Seq in place.  This is how a sequence that must stay
// where it is (for example the adapter lent to a `seq::first_failure_or_else` function) is passed to
// pipeline binders, which only accept sequences by value.  Progress made through a Ref is progress made
// on the referenced Seq.
//
template <typename SeqT>
class Ref
{
   public:
    using Item = SeqItem<SeqT>;

    explicit Ref(SeqT& seq) noexcept : seq_{&seq}
    {
    }

    SeqT& get() const noexcept
    {
        return *this->seq_;
    }

    Optional<Item> peek() const
    {
        return this->seq_->peek();
    }

    Optional<Item> next() const
    {
        return this->seq_->next();
    }

   private:
    SeqT* seq_;
};

template <typename SeqT>
inline Ref<SeqT> as_ref(SeqT& seq)
{
    return Ref<SeqT>{seq};
}

}  // namespace ffail

#endif  // FFAIL_REF_HPP

//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2021-2022 Anthony Paul Astolfi
//

// Sequences: sources, binders and the first-failure drivers.
//
#pragma once
#ifndef FFAIL_SEQ_HPP
#define FFAIL_SEQ_HPP

#include <ffail/config.hpp>
//
#include <ffail/optional.hpp>
#include <ffail/ref.hpp>
#include <ffail/seq/first_absence_or_else.hpp>
#include <ffail/seq/first_failure_or_else.hpp>
#include <ffail/seq/first_failure_seq.hpp>
#include <ffail/seq/map.hpp>
#include <ffail/seq/requirements.hpp>
#include <ffail/seq/sub_range_seq.hpp>
#include <ffail/seq/sum.hpp>

#include <cstddef>
#include <utility>
#include <vector>

namespace ffail {

// Owns a std::vector and yields const references to its elements, in order.  The references stay valid
// until the VecSeq is destroyed, including across moves of the VecSeq.
//
template <typename T>
class VecSeq
{
   public:
    using Item = const T&;

    explicit VecSeq(std::vector<T>&& items) noexcept : items_(std::move(items))
    {
    }

    Optional<Item> peek() const
    {
        if (this->front_ == this->items_.size()) {
            return None;
        }
        return Optional<Item>{this->items_[this->front_]};
    }

    Optional<Item> next()
    {
        Optional<Item> item = this->peek();
        if (item) {
            this->front_ += 1;
        }
        return item;
    }

   private:
    std::vector<T> items_;
    std::size_t front_ = 0;
};

template <typename T>
inline VecSeq<T> into_seq(std::vector<T>&& items)
{
    return VecSeq<T>{std::move(items)};
}

}  // namespace ffail

#endif  // FFAIL_SEQ_HPP

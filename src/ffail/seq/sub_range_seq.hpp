// Copyright 2021-2022 Anthony Paul Astolfi
//
#pragma once
#ifndef FFAIL_SEQ_SUB_RANGE_SEQ_HPP
#define FFAIL_SEQ_SUB_RANGE_SEQ_HPP

#include <ffail/config.hpp>
//
#include <ffail/optional.hpp>

#include <boost/range/iterator_range.hpp>

#include <type_traits>
#include <utility>

namespace ffail {

// Yields the elements of `[begin, end)` front to back.  When the iterator dereferences to an lvalue the
// items are references into the underlying storage, which must outlive the Seq.
//
template <typename Iter>
class SubRangeSeq
{
   public:
    using Item = decltype(*std::declval<const Iter&>());

    explicit SubRangeSeq(Iter begin, Iter end) noexcept : front_{std::move(begin)}, end_{std::move(end)}
    {
    }

    Optional<Item> peek()
    {
        if (this->front_ == this->end_) {
            return None;
        }
        return Optional<Item>{*this->front_};
    }

    Optional<Item> next()
    {
        if (this->front_ == this->end_) {
            return None;
        }
        Optional<Item> item{*this->front_};
        ++this->front_;
        return item;
    }

   private:
    Iter front_;
    Iter end_;
};

template <typename Iter>
SubRangeSeq<Iter> as_seq(Iter begin, Iter end)
{
    return SubRangeSeq<Iter>{std::move(begin), std::move(end)};
}

// Boost ranges, including `boost::irange`.
//
template <typename Iter>
SubRangeSeq<Iter> as_seq(const boost::iterator_range<Iter>& range)
{
    return SubRangeSeq<Iter>{range.begin(), range.end()};
}

// Contiguous containers (`std::vector`, `std::array`, ...).  The container is borrowed, not copied, so
// only lvalues are accepted.
//
template <typename VectorLike, typename = decltype(std::declval<VectorLike&>().data() +
                                                   std::declval<VectorLike&>().size())>
auto as_seq(VectorLike& v)
{
    return as_seq(v.data(), v.data() + v.size());
}

}  // namespace ffail

#endif  // FFAIL_SEQ_SUB_RANGE_SEQ_HPP

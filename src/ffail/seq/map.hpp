// Copyright 2021 Anthony Paul Astolfi
//
#pragma once
#ifndef FFAIL_SEQ_MAP_HPP
#define FFAIL_SEQ_MAP_HPP

#include <ffail/config.hpp>
//
#include <ffail/optional.hpp>
#include <ffail/seq/requirements.hpp>
#include <ffail/type_traits.hpp>
#include <ffail/utility.hpp>

#include <type_traits>
#include <utility>

namespace ffail {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// map(fn) - apply `fn` to each item as it is pulled.  `fn` runs once per `next()` and once per `peek()`, so
// it should not have side effects that must happen exactly once per item.
//
template <typename SeqT, typename MapFn>
class Map
{
   public:
    using Item = DecayRValueRef<std::invoke_result_t<MapFn&, SeqItem<SeqT>>>;

    explicit Map(SeqT&& source, MapFn&& fn) noexcept : source_(std::move(source)), fn_(std::move(fn))
    {
    }

    Optional<Item> peek()
    {
        return this->apply(this->source_.peek());
    }

    Optional<Item> next()
    {
        return this->apply(this->source_.next());
    }

   private:
    Optional<Item> apply(Optional<SeqItem<SeqT>>&& item)
    {
        if (!item) {
            return None;
        }
        return Optional<Item>{this->fn_(std::forward<SeqItem<SeqT>>(*item))};
    }

    SeqT source_;
    MapFn fn_;
};

template <typename MapFn>
struct MapBinder {
    MapFn fn;
};

template <typename MapFn>
inline MapBinder<std::decay_t<MapFn>> map(MapFn&& fn)
{
    return {FFAIL_FORWARD(fn)};
}

template <typename SeqT, typename MapFn>
[[nodiscard]] Map<SeqT, MapFn> operator|(SeqT&& seq, MapBinder<MapFn>&& binder)
{
    static_assert(std::is_same_v<SeqT, std::decay_t<SeqT>>,
                  "(seq::map) Sequences may not be captured implicitly by reference.");

    return Map<SeqT, MapFn>{FFAIL_FORWARD(seq), std::move(binder.fn)};
}

}  // namespace seq
}  // namespace ffail

#endif  // FFAIL_SEQ_MAP_HPP

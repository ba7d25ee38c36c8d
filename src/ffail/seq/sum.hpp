//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef FFAIL_SEQ_SUM_HPP
#define FFAIL_SEQ_SUM_HPP

#include <ffail/config.hpp>
//
#include <ffail/seq/requirements.hpp>

#include <type_traits>

namespace ffail {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// sum() - pull every item and add them up, starting from a value-initialized total.
//
struct SumBinder {
};

inline SumBinder sum()
{
    return {};
}

template <typename SeqT>
[[nodiscard]] auto operator|(SeqT&& seq, SumBinder)
{
    static_assert(std::is_same_v<SeqT, std::decay_t<SeqT>>,
                  "(seq::sum) Sequences may not be captured implicitly by reference.");

    std::decay_t<SeqItem<SeqT>> total{};
    while (auto item = seq.next()) {
        total = total + *item;
    }
    return total;
}

}  // namespace seq
}  // namespace ffail

#endif  // FFAIL_SEQ_SUM_HPP

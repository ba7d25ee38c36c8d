//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#include <ffail/seq/first_failure_seq.hpp>
//
#include <ffail/seq/first_failure_seq.hpp>

#include <ffail/int_types.hpp>
#include <ffail/optional.hpp>
#include <ffail/result.hpp>
#include <ffail/seq.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <boost/range/irange.hpp>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

using namespace ffail::int_types;

using ffail::as_seq;
using ffail::failure;
using ffail::None;
using ffail::Optional;
using ffail::Result;
using ffail::success;

namespace seq = ffail::seq;

using IntResult = Result<int, int>;

// Starts over from the first item after returning None, so it never stays exhausted.  Counts calls to
// `next()`.
//
class CyclingSeq
{
   public:
    using Item = IntResult;

    explicit CyclingSeq(std::vector<IntResult> items, int* pull_count) noexcept
        : items_(std::move(items))
        , pull_count_{pull_count}
    {
    }

    Optional<Item> peek()
    {
        if (i_ == items_.size()) {
            return None;
        }
        return items_[i_];
    }

    Optional<Item> next()
    {
        ++*pull_count_;
        if (i_ == items_.size()) {
            i_ = 0;
            return None;
        }
        return items_[i_++];
    }

   private:
    std::vector<IntResult> items_;
    usize i_ = 0;
    int* pull_count_;
};

// Yields success(0), success(1), ..., success(n - 1), failure("at n"), success(n + 1), ...; the values are
// move-only.  Holds `token` for as long as it lives.
//
class UniquePtrSeq
{
   public:
    using Item = Result<std::unique_ptr<int>, std::string>;

    explicit UniquePtrSeq(int fail_at, std::shared_ptr<int> token) noexcept
        : fail_at_{fail_at}
        , token_{std::move(token)}
    {
    }

    Optional<Item> peek()
    {
        return this->make_item(this->i_);
    }

    Optional<Item> next()
    {
        return this->make_item(this->i_++);
    }

   private:
    Item make_item(int i) const
    {
        if (i == this->fail_at_) {
            return failure("at " + std::to_string(i));
        }
        return success(std::make_unique<int>(i));
    }

    int fail_at_;
    int i_ = 0;
    std::shared_ptr<int> token_;
};

TEST(FirstFailureSeqTest, YieldsSuccessesUntilFirstFailure)
{
    std::vector<IntResult> items{success(1), success(2), failure(3), success(4), failure(5)};

    seq::FirstFailureSeq<decltype(as_seq(items))> adapter{as_seq(items)};

    EXPECT_TRUE(adapter.is_active());
    EXPECT_EQ(adapter.failure(), nullptr);

    EXPECT_EQ(adapter.next(), 1);
    EXPECT_EQ(adapter.next(), 2);
    EXPECT_EQ(adapter.next(), None);

    EXPECT_FALSE(adapter.is_active());
    EXPECT_FALSE(adapter.is_exhausted());
    ASSERT_TRUE(adapter.found_failure());
    ASSERT_NE(adapter.failure(), nullptr);
    EXPECT_EQ(*adapter.failure(), 3);

    EXPECT_EQ(adapter.next(), None);
    EXPECT_EQ(adapter.next(), None);
    EXPECT_EQ(*adapter.failure(), 3);
}

TEST(FirstFailureSeqTest, ExhaustedWhenThereIsNoFailure)
{
    std::vector<IntResult> items{success(1), success(2)};

    seq::FirstFailureSeq<decltype(as_seq(items))> adapter{as_seq(items)};

    EXPECT_EQ(adapter.next(), 1);
    EXPECT_EQ(adapter.next(), 2);
    EXPECT_EQ(adapter.next(), None);

    EXPECT_TRUE(adapter.is_exhausted());
    EXPECT_FALSE(adapter.found_failure());
    EXPECT_EQ(adapter.failure(), nullptr);
}

TEST(FirstFailureSeqTest, EmptySource)
{
    seq::FirstFailureSeq<ffail::VecSeq<IntResult>> adapter{ffail::into_seq(std::vector<IntResult>{})};

    EXPECT_EQ(adapter.peek(), None);
    EXPECT_TRUE(adapter.is_active());

    EXPECT_EQ(adapter.next(), None);
    EXPECT_TRUE(adapter.is_exhausted());
}

TEST(FirstFailureSeqTest, StaysDoneAfterExhaustingNonFusedSource)
{
    int pull_count = 0;
    seq::FirstFailureSeq<CyclingSeq> adapter{CyclingSeq{{success(1), success(2)}, &pull_count}};

    EXPECT_EQ(adapter.next(), 1);
    EXPECT_EQ(adapter.next(), 2);
    EXPECT_EQ(adapter.next(), None);
    EXPECT_EQ(pull_count, 3);

    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(adapter.next(), None);
        EXPECT_EQ(adapter.peek(), None);
    }
    EXPECT_EQ(pull_count, 3);
    EXPECT_TRUE(adapter.is_exhausted());
}

TEST(FirstFailureSeqTest, StaysDoneAfterFailureInNonFusedSource)
{
    int pull_count = 0;
    seq::FirstFailureSeq<CyclingSeq> adapter{CyclingSeq{{success(1), failure(2), success(3)}, &pull_count}};

    EXPECT_EQ(adapter.next(), 1);
    EXPECT_EQ(adapter.next(), None);
    EXPECT_EQ(pull_count, 2);

    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(adapter.next(), None);
    }
    EXPECT_EQ(pull_count, 2);
    EXPECT_EQ(*adapter.failure(), 2);
}

TEST(FirstFailureSeqTest, PeekNeverConsumesOrTransitions)
{
    int pull_count = 0;
    seq::FirstFailureSeq<CyclingSeq> adapter{CyclingSeq{{success(1), failure(2)}, &pull_count}};

    EXPECT_EQ(adapter.peek(), 1);
    EXPECT_EQ(adapter.peek(), 1);
    EXPECT_EQ(pull_count, 0);

    EXPECT_EQ(adapter.next(), 1);

    EXPECT_EQ(adapter.peek(), None);
    EXPECT_TRUE(adapter.is_active());
    EXPECT_EQ(pull_count, 1);

    EXPECT_EQ(adapter.next(), None);
    EXPECT_TRUE(adapter.found_failure());
}

TEST(FirstFailureSeqTest, PeekMoveOnlyValues)
{
    auto source = as_seq(boost::irange(0, 3))  //
                  | seq::map([](int i) -> Result<std::unique_ptr<int>, int> {
                        if (i == 2) {
                            return failure(i);
                        }
                        return success(std::make_unique<int>(i));
                    });

    seq::FirstFailureSeq<decltype(source)> adapter{std::move(source)};

    Optional<std::unique_ptr<int>> peeked = adapter.peek();
    ASSERT_TRUE(peeked);
    EXPECT_EQ(**peeked, 0);

    peeked = adapter.peek();
    ASSERT_TRUE(peeked);
    EXPECT_EQ(**peeked, 0);

    Optional<std::unique_ptr<int>> first = adapter.next();
    ASSERT_TRUE(first);
    EXPECT_EQ(**first, 0);

    peeked = adapter.peek();
    ASSERT_TRUE(peeked);
    EXPECT_EQ(**peeked, 1);

    EXPECT_TRUE(adapter.next());
    EXPECT_FALSE(adapter.peek());
    EXPECT_TRUE(adapter.is_active());

    EXPECT_FALSE(adapter.next());
    EXPECT_TRUE(adapter.found_failure());
    EXPECT_EQ(*adapter.failure(), 2);
}

TEST(FirstFailureSeqTest, MoveOnlyValuesAndSourceReleasedOnFailure)
{
    auto token = std::make_shared<int>(0);
    std::weak_ptr<int> watch = token;

    seq::FirstFailureSeq<UniquePtrSeq> adapter{UniquePtrSeq{/*fail_at=*/2, std::move(token)}};

    Optional<std::unique_ptr<int>> first = adapter.next();
    ASSERT_TRUE(first);
    EXPECT_EQ(**first, 0);

    Optional<std::unique_ptr<int>> second = adapter.next();
    ASSERT_TRUE(second);
    EXPECT_EQ(**second, 1);

    EXPECT_FALSE(watch.expired());

    EXPECT_FALSE(adapter.next());
    EXPECT_TRUE(watch.expired());
    EXPECT_EQ(*adapter.failure(), "at 2");
}

TEST(FirstFailureSeqTest, PrintState)
{
    std::vector<IntResult> items{success(1), failure(7)};
    {
        seq::FirstFailureSeq<decltype(as_seq(items))> adapter{as_seq(items)};

        std::ostringstream oss;
        oss << adapter;
        EXPECT_EQ(oss.str(), "FirstFailureSeq{Active}");

        while (adapter.next()) {
        }

        oss.str("");
        oss << adapter;
        EXPECT_EQ(oss.str(), "FirstFailureSeq{FoundFailure{7}}");
    }
    {
        seq::FirstFailureSeq<decltype(as_seq(items))> adapter{as_seq(items.data(), items.data() + 1)};
        adapter.next();
        adapter.next();

        std::ostringstream oss;
        oss << adapter;
        EXPECT_EQ(oss.str(), "FirstFailureSeq{Exhausted}");
    }
}

TEST(FirstFailureSeqTest, AbsenceTraits)
{
    std::vector<Optional<int>> items{1, 2, None, 4};

    seq::FirstAbsenceSeq<decltype(as_seq(items))> adapter{as_seq(items)};

    EXPECT_EQ(adapter.next(), 1);
    EXPECT_EQ(adapter.next(), 2);
    EXPECT_EQ(adapter.next(), None);
    EXPECT_TRUE(adapter.found_failure());
    EXPECT_EQ(adapter.next(), None);
}

TEST(FirstFailureSeqTest, IsASeq)
{
    std::vector<IntResult> items;

    static_assert(ffail::IsSeq<seq::FirstFailureSeq<decltype(as_seq(items))>>{}, "");
    static_assert(
        std::is_same_v<ffail::SeqItem<seq::FirstFailureSeq<decltype(as_seq(items))>>, int>, "");
    static_assert(!std::is_copy_constructible_v<seq::FirstFailureSeq<decltype(as_seq(items))>>, "");
    static_assert(!std::is_move_constructible_v<seq::FirstFailureSeq<decltype(as_seq(items))>>, "");
}

}  // namespace

// Copyright 2021-2022 Anthony Paul Astolfi
//
#include <ffail/case_of.hpp>
//
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <ffail/assert.hpp>
#include <ffail/case_of.hpp>

#include <string>
#include <variant>

namespace {

struct Running {
    int steps;
};

struct Stopped {
};

struct Crashed {
    std::string reason;
};

using RunState = std::variant<Running, Stopped, Crashed>;

TEST(CaseOf, ExactHandlerBeatsGenericHandler)
{
    auto describe = [](const RunState& state) {
        return ffail::case_of(
            state,
            [](const Crashed& c) {
                return "crashed: " + c.reason;
            },
            [](const auto&) {
                return std::string{"fine"};
            });
    };

    EXPECT_EQ(describe(Running{3}), "fine");
    EXPECT_EQ(describe(Stopped{}), "fine");
    EXPECT_EQ(describe(Crashed{"oops"}), "crashed: oops");
}

TEST(CaseOf, MutateThroughLvalue)
{
    RunState state = Running{0};

    for (int i = 0; i < 3; ++i) {
        ffail::case_of(
            state,
            [](Running& r) {
                r.steps += 1;
            },
            [](auto&) {
                FFAIL_PANIC() << "unexpected state";
            });
    }

    ASSERT_TRUE(std::holds_alternative<Running>(state));
    EXPECT_EQ(std::get<Running>(state).steps, 3);
}

TEST(CaseOf, CommonResultType)
{
    RunState state = Stopped{};

    auto code = ffail::case_of(
        std::move(state),
        [](Running&&) {
            return (char)1;
        },
        [](Stopped&&) {
            return 2;
        },
        [](Crashed&&) {
            return (long)3;
        });

    static_assert(std::is_same_v<decltype(code), long>, "");
    EXPECT_EQ(code, 2);
}

TEST(CaseOf, MoveOutOfRvalue)
{
    RunState state = Crashed{"disk full"};

    std::string reason = ffail::case_of(
        std::move(state),
        [](Crashed&& c) {
            return std::move(c.reason);
        },
        [](auto&&) {
            return std::string{};
        });

    EXPECT_THAT(reason, ::testing::StrEq("disk full"));
}

}  // namespace

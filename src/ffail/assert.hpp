// Copyright 2021-2022 Anthony Paul Astolfi
//
#pragma once
#ifndef FFAIL_ASSERT_HPP
#define FFAIL_ASSERT_HPP

#include <ffail/config.hpp>
#include <ffail/hint.hpp>
#include <ffail/int_types.hpp>
#include <ffail/type_traits.hpp>
#include <ffail/utility.hpp>

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

#ifdef FFAIL_GLOG_AVAILABLE
#include <glog/logging.h>
#define FFAIL_FAIL_CHECK_OUT LOG(ERROR)
#else
#define FFAIL_FAIL_CHECK_OUT std::cerr
#endif

namespace ffail {

template <typename T, typename = std::enable_if_t<IsPrintable<T>{}>>
decltype(auto) make_printable(T&& obj)
{
    return FFAIL_FORWARD(obj);
}

template <typename T, typename = std::enable_if_t<!IsPrintable<T>{}>, typename = void>
std::string make_printable(T&& obj)
{
    std::ostringstream oss;
    oss << "(" << name_of<T>() << ") " << std::hex << std::setw(2) << std::setfill('0');

    for (const u8* bytes = (const u8*)&obj; bytes != (const u8*)((&obj) + 1); ++bytes) {
        oss << (int)*bytes;
    }
    return oss.str();
}

// =============================================================================
// ASSERT and CHECK macros with ostream-style message appending, branch prediction hinting, and
// human-friendly messages.
//
// FFAIL_ASSERT* statements are only enabled when NDEBUG is not defined.
// FFAIL_CHECK* statements are always enabled.
//
#define FFAIL_FAIL_CHECK_MESSAGE(left_str, left_val, op_str, right_str, right_val, file, line, fn_name)      \
    FFAIL_FAIL_CHECK_OUT << "FATAL: " << file << ":" << line << ": Assertion failed: " << left_str << " "    \
                         << op_str << " " << right_str << "\n (in `" << fn_name << "`)\n\n"                  \
                         << "  " << left_str << " == " << ::ffail::make_printable(left_val) << ::std::endl   \
                         << ::std::endl                                                                      \
                         << "  " << right_str << " == " << ::ffail::make_printable(right_val)                \
                         << ::std::endl                                                                      \
                         << ::std::endl

#ifdef __GNUC__
#define FFAIL_NORETURN __attribute__((noreturn))
#define FFAIL_UNREACHABLE __builtin_unreachable
#else
#define FFAIL_NORETURN
#define FFAIL_UNREACHABLE() (void)
#endif

FFAIL_NORETURN inline void fail_check_exit()
{
    FFAIL_FAIL_CHECK_OUT << std::endl << std::endl;
    std::abort();
    FFAIL_UNREACHABLE();
}

template <typename... Ts>
inline bool ignore(Ts&&...)
{
    return false;
}

inline bool lock_fail_check_mutex()
{
    static std::mutex m;
    m.lock();
    return false;
}

#define FFAIL_CHECK_RELATION(left, op, right)                                                                \
    for (; !FFAIL_HINT_TRUE(((left)op(right)) || ::ffail::lock_fail_check_mutex());                          \
         ::ffail::fail_check_exit())                                                                         \
    FFAIL_FAIL_CHECK_MESSAGE(#left, (left), #op, #right, (right), __FILE__, __LINE__, __PRETTY_FUNCTION__)

#define FFAIL_CHECK(x) FFAIL_CHECK_RELATION(bool{x}, ==, true)
#define FFAIL_CHECK_EQ(x, y) FFAIL_CHECK_RELATION(x, ==, y)
#define FFAIL_CHECK_NE(x, y) FFAIL_CHECK_RELATION(x, !=, y)
#define FFAIL_CHECK_GE(x, y) FFAIL_CHECK_RELATION(x, >=, y)
#define FFAIL_CHECK_GT(x, y) FFAIL_CHECK_RELATION(x, >, y)
#define FFAIL_CHECK_LE(x, y) FFAIL_CHECK_RELATION(x, <=, y)
#define FFAIL_CHECK_LT(x, y) FFAIL_CHECK_RELATION(x, <, y)

#define FFAIL_ASSERT_DISABLED(ignored_inputs)                                                                \
    if (false && ignored_inputs)                                                                             \
    FFAIL_FAIL_CHECK_OUT << ""

#ifndef NDEBUG  //==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -

#define FFAIL_ASSERT(x) FFAIL_CHECK(x)

#else  // NDEBUG  ==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -

#define FFAIL_ASSERT(x) FFAIL_ASSERT_DISABLED(::ffail::ignore((x)))

#endif  // NDEBUG ==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -

#define FFAIL_PANIC()                                                                                        \
    for (bool one_time = true; one_time; one_time = false, ::ffail::fail_check_exit(), FFAIL_UNREACHABLE())  \
    FFAIL_FAIL_CHECK_OUT << "*** PANIC *** At:" << __FILE__ << ":" << __LINE__ << ":" << std::endl

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// FFAIL_INSPECT(expr) : expand to debug-friendly stream insertion expression.
//
#define FFAIL_INSPECT(expr) " " << #expr << " == " << (expr)

}  // namespace ffail

#endif  // FFAIL_ASSERT_HPP

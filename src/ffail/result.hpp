//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2021-2022 Anthony Paul Astolfi
//
#pragma once
#ifndef FFAIL_RESULT_HPP
#define FFAIL_RESULT_HPP

#include <ffail/config.hpp>
//
#include <ffail/assert.hpp>
#include <ffail/hint.hpp>
#include <ffail/type_traits.hpp>
#include <ffail/utility.hpp>

#include <boost/preprocessor/cat.hpp>

#include <ostream>
#include <type_traits>
#include <utility>
#include <variant>

namespace ffail {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Unit - the (only) value of an empty result.
//
struct Unit {
};

inline bool operator==(const Unit&, const Unit&)
{
    return true;
}

inline bool operator!=(const Unit&, const Unit&)
{
    return false;
}

inline std::ostream& operator<<(std::ostream& out, const Unit&)
{
    return out << "()";
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Success<T>, Failure<E> - tagged constructor arguments for Result<T, E>.  These let `T` and `E` be the
// same type:
//
// ```
// ffail::Result<int, int> a = ffail::success(1);
// ffail::Result<int, int> b = ffail::failure(1);
// ```
//
template <typename T>
struct Success {
    T value;
};

template <typename E>
struct Failure {
    E error;
};

template <typename T>
inline Success<std::decay_t<T>> success(T&& value)
{
    return Success<std::decay_t<T>>{FFAIL_FORWARD(value)};
}

inline Success<Unit> success()
{
    return Success<Unit>{Unit{}};
}

template <typename E>
inline Failure<std::decay_t<E>> failure(E&& error)
{
    return Failure<std::decay_t<E>>{FFAIL_FORWARD(error)};
}

template <typename T, typename U, typename = std::enable_if_t<CanBeEqCompared<T, U>{}>>
inline bool operator==(const Success<T>& l, const Success<U>& r)
{
    return l.value == r.value;
}

template <typename E, typename G, typename = std::enable_if_t<CanBeEqCompared<E, G>{}>>
inline bool operator==(const Failure<E>& l, const Failure<G>& r)
{
    return l.error == r.error;
}

template <typename T>
inline std::ostream& operator<<(std::ostream& out, const Success<T>& t)
{
    return out << "Ok{" << make_printable(t.value) << "}";
}

template <typename E>
inline std::ostream& operator<<(std::ostream& out, const Failure<E>& t)
{
    return out << "Err{" << make_printable(t.error) << "}";
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Result<T, E> - holds either a success value of type `T` or a failure value of type `E`.
//
template <typename T, typename E>
class FFAIL_WARN_UNUSED_RESULT Result;

namespace detail {

template <typename T>
struct IsResultImpl : std::false_type {
};

template <typename T, typename E>
struct IsResultImpl<Result<T, E>> : std::true_type {
};

}  // namespace detail

template <typename T>
using IsResult = detail::IsResultImpl<std::decay_t<T>>;

template <typename T, typename E>
class Result
{
    template <typename U, typename G>
    friend class Result;

    static constexpr std::size_t kSuccessIndex = 0;
    static constexpr std::size_t kFailureIndex = 1;

   public:
    static_assert(std::is_object_v<T> && std::is_object_v<E>,
                  "Result<T, E> requires object types; use ffail::Unit in place of void");

    using value_type = T;
    using error_type = E;

    //==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
    // Constructors

    template <typename U, typename = std::enable_if_t<std::is_constructible_v<T, U&&>>>
    /*implicit*/ Result(Success<U>&& s) noexcept(std::is_nothrow_constructible_v<T, U&&>)
        : storage_{std::in_place_index<kSuccessIndex>, std::move(s.value)}
    {
    }

    template <typename U, typename = std::enable_if_t<std::is_constructible_v<T, const U&>>>
    /*implicit*/ Result(const Success<U>& s) : storage_{std::in_place_index<kSuccessIndex>, s.value}
    {
    }

    template <typename G, typename = std::enable_if_t<std::is_constructible_v<E, G&&>>>
    /*implicit*/ Result(Failure<G>&& f) noexcept(std::is_nothrow_constructible_v<E, G&&>)
        : storage_{std::in_place_index<kFailureIndex>, std::move(f.error)}
    {
    }

    template <typename G, typename = std::enable_if_t<std::is_constructible_v<E, const G&>>>
    /*implicit*/ Result(const Failure<G>& f) : storage_{std::in_place_index<kFailureIndex>, f.error}
    {
    }

    template <typename U, typename G,
              typename = std::enable_if_t<!std::is_same_v<Result<U, G>, Result> &&
                                          std::is_constructible_v<T, U&&> && std::is_constructible_v<E, G&&>>>
    /*implicit*/ Result(Result<U, G>&& that) : storage_{Result::convert_storage(std::move(that.storage_))}
    {
    }

    Result(const Result&) = default;
    Result(Result&&) = default;

    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    //==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -

    bool ok() const noexcept
    {
        return this->storage_.index() == kSuccessIndex;
    }

    T& value() & noexcept
    {
        FFAIL_ASSERT(this->ok()) << "Result::value() called on a failure";
        return std::get<kSuccessIndex>(this->storage_);
    }

    const T& value() const& noexcept
    {
        FFAIL_ASSERT(this->ok()) << "Result::value() called on a failure";
        return std::get<kSuccessIndex>(this->storage_);
    }

    T value() && noexcept
    {
        FFAIL_ASSERT(this->ok()) << "Result::value() called on a failure";
        return std::move(std::get<kSuccessIndex>(this->storage_));
    }

    E& error() & noexcept
    {
        FFAIL_ASSERT(!this->ok()) << "Result::error() called on a success";
        return std::get<kFailureIndex>(this->storage_);
    }

    const E& error() const& noexcept
    {
        FFAIL_ASSERT(!this->ok()) << "Result::error() called on a success";
        return std::get<kFailureIndex>(this->storage_);
    }

    E error() && noexcept
    {
        FFAIL_ASSERT(!this->ok()) << "Result::error() called on a success";
        return std::move(std::get<kFailureIndex>(this->storage_));
    }

    T& operator*() & noexcept
    {
        return this->value();
    }

    const T& operator*() const& noexcept
    {
        return this->value();
    }

    T operator*() && noexcept
    {
        return std::move(*this).value();
    }

    T* operator->() noexcept
    {
        return &this->value();
    }

    const T* operator->() const noexcept
    {
        return &this->value();
    }

    // Applies `fn` to the success value; failures pass through unchanged.
    //
    template <typename Fn, typename U = std::decay_t<std::invoke_result_t<Fn, T&&>>>
    Result<U, E> map(Fn&& fn) &&
    {
        if (!this->ok()) {
            return failure(std::move(*this).error());
        }
        return success(FFAIL_FORWARD(fn)(std::move(*this).value()));
    }

    template <typename Fn, typename U = std::decay_t<std::invoke_result_t<Fn, const T&>>>
    Result<U, E> map(Fn&& fn) const&
    {
        if (!this->ok()) {
            return failure(this->error());
        }
        return success(FFAIL_FORWARD(fn)(this->value()));
    }

    // `fn` must return a Result with the same error type; failures pass through unchanged.
    //
    template <typename Fn, typename R = std::decay_t<std::invoke_result_t<Fn, T&&>>>
    R and_then(Fn&& fn) &&
    {
        static_assert(IsResult<R>{} && std::is_same_v<typename R::error_type, E>,
                      "and_then: fn must return a Result<U, E> with the same error type E");
        if (!this->ok()) {
            return failure(std::move(*this).error());
        }
        return FFAIL_FORWARD(fn)(std::move(*this).value());
    }

    template <typename Fn, typename R = std::decay_t<std::invoke_result_t<Fn, const T&>>>
    R and_then(Fn&& fn) const&
    {
        static_assert(IsResult<R>{} && std::is_same_v<typename R::error_type, E>,
                      "and_then: fn must return a Result<U, E> with the same error type E");
        if (!this->ok()) {
            return failure(this->error());
        }
        return FFAIL_FORWARD(fn)(this->value());
    }

   private:
    using Storage = std::variant<T, E>;

    template <typename U, typename G>
    static Storage convert_storage(std::variant<U, G>&& that)
    {
        if (that.index() == kSuccessIndex) {
            return Storage{std::in_place_index<kSuccessIndex>, std::move(std::get<kSuccessIndex>(that))};
        }
        return Storage{std::in_place_index<kFailureIndex>, std::move(std::get<kFailureIndex>(that))};
    }

    Storage storage_;
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

template <typename T, typename E, typename U, typename G,
          typename = std::enable_if_t<CanBeEqCompared<T, U>{} && CanBeEqCompared<E, G>{}>>
inline bool operator==(const Result<T, E>& l, const Result<U, G>& r)
{
    return (l.ok() && r.ok() && l.value() == r.value()) || (!l.ok() && !r.ok() && l.error() == r.error());
}

template <typename T, typename E, typename U, typename G>
inline bool operator!=(const Result<T, E>& l, const Result<U, G>& r)
{
    return !(l == r);
}

template <typename T, typename E, typename U, typename = std::enable_if_t<CanBeEqCompared<T, U>{}>>
inline bool operator==(const Result<T, E>& l, const Success<U>& r)
{
    return l.ok() && l.value() == r.value;
}

template <typename T, typename E, typename U>
inline bool operator==(const Success<U>& l, const Result<T, E>& r)
{
    return r == l;
}

template <typename T, typename E, typename U>
inline bool operator!=(const Result<T, E>& l, const Success<U>& r)
{
    return !(l == r);
}

template <typename T, typename E, typename U>
inline bool operator!=(const Success<U>& l, const Result<T, E>& r)
{
    return !(r == l);
}

template <typename T, typename E, typename G, typename = std::enable_if_t<CanBeEqCompared<E, G>{}>>
inline bool operator==(const Result<T, E>& l, const Failure<G>& r)
{
    return !l.ok() && l.error() == r.error;
}

template <typename T, typename E, typename G>
inline bool operator==(const Failure<G>& l, const Result<T, E>& r)
{
    return r == l;
}

template <typename T, typename E, typename G>
inline bool operator!=(const Result<T, E>& l, const Failure<G>& r)
{
    return !(l == r);
}

template <typename T, typename E, typename G>
inline bool operator!=(const Failure<G>& l, const Result<T, E>& r)
{
    return !(r == l);
}

template <typename T, typename E>
inline std::ostream& operator<<(std::ostream& out, const Result<T, E>& t)
{
    if (!t.ok()) {
        return out << "Err{" << make_printable(t.error()) << "}";
    }
    return out << "Ok{" << make_printable(t.value()) << "}";
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// FFAIL_REQUIRE_OK(expr) - if the Result `expr` is a failure, return that failure from the enclosing
// function.
//
// FFAIL_ASSIGN_OK_RESULT(lvalue_expr, result_expr) - evaluate `result_expr`; return its failure from the
// enclosing function, or else move the success value into `lvalue_expr`.
//
#define FFAIL_REQUIRE_OK(expr)                                                                               \
    for (decltype(auto) BOOST_PP_CAT(FFAIL_temp_result_, __LINE__) = (expr);                                 \
         !BOOST_PP_CAT(FFAIL_temp_result_, __LINE__).ok();)                                                  \
    return ::ffail::failure(FFAIL_FORWARD(BOOST_PP_CAT(FFAIL_temp_result_, __LINE__)).error())

#define FFAIL_ASSIGN_OK_RESULT(lvalue_expr, result_expr)                                                     \
    auto BOOST_PP_CAT(FFAIL_temp_Result_, __LINE__) = result_expr;                                           \
    FFAIL_REQUIRE_OK(std::move(BOOST_PP_CAT(FFAIL_temp_Result_, __LINE__)));                                 \
    lvalue_expr = std::move(*BOOST_PP_CAT(FFAIL_temp_Result_, __LINE__))

}  // namespace ffail

#endif  // FFAIL_RESULT_HPP

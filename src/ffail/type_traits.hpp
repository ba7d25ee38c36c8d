// Copyright 2021-2022 Anthony Paul Astolfi
//
#pragma once
#ifndef FFAIL_TYPE_TRAITS_HPP
#define FFAIL_TYPE_TRAITS_HPP

#include <ffail/config.hpp>
//

#include <boost/core/demangle.hpp>

#include <ostream>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <variant>

namespace ffail {

// =============================================================================
// name_of<T>()
//
//  Returns the demangled name of type `T`.
//
template <typename T>
inline std::string name_of()
{
    return boost::core::demangle(typeid(T).name());
}

// =============================================================================
// IsCallable<Fn, Args...>
//
//  Type alias for std::true_type if `Fn` is callable with `Args...`.
//  Type alias for std::false_type otherwise.
//
namespace detail {

template <typename Fn, typename... Args, typename Result = std::invoke_result_t<Fn, Args...>>
std::true_type is_callable_impl(void*);

template <typename Fn, typename... Args>
std::false_type is_callable_impl(...);

}  // namespace detail

template <typename Fn, typename... Args>
using IsCallable = decltype(detail::is_callable_impl<Fn, Args...>(nullptr));

// =============================================================================
// IsPrintable<T>
//
namespace detail {

template <typename T, typename Result = decltype(std::declval<std::ostream&>() << std::declval<T>())>
std::true_type is_printable_impl(void*);

template <typename T>
std::false_type is_printable_impl(...);

}  // namespace detail

template <typename T>
using IsPrintable = decltype(detail::is_printable_impl<T>(nullptr));

// =============================================================================
// CanBeEqCompared<T, U>
//
namespace detail {

template <typename T, typename U,
          typename Result = decltype(std::declval<const T&>() == std::declval<const U&>())>
std::true_type can_be_eq_compared_impl(void*);

template <typename T, typename U>
std::false_type can_be_eq_compared_impl(...);

}  // namespace detail

template <typename T, typename U = T>
using CanBeEqCompared = decltype(detail::can_be_eq_compared_impl<T, U>(nullptr));

// =============================================================================
// IsVariant<T>
//
//  Derives std::true_type if `T` is a std::variant type.
//  Derives std::false_type otherwise.
//
template <typename T>
struct IsVariant : std::false_type {
};

template <typename... Ts>
struct IsVariant<std::variant<Ts...>> : std::true_type {
};

// =============================================================================
// DecayRValueRef<T>
//
//  Decays `T` iff it is an rvalue reference type.
//
template <typename T>
using DecayRValueRef = std::conditional_t<std::is_rvalue_reference_v<T>, std::decay_t<T>, T>;

// =============================================================================
// RefersTo<T, Target>
//
//  Derives std::true_type if `T` is `Target` (cv-qualified, by reference or by pointer), or if `T` is a
//  class template instantiation with such a type anywhere in its (type) template arguments, e.g.
//  `std::reference_wrapper<Target>` or `Map<Ref<Target>, Fn>`.
//
//  Only type template parameters are inspected; closure types are opaque.
//
template <typename T, typename Target>
struct RefersTo;

namespace detail {

template <typename T, typename Target>
struct RefersToArgs : std::false_type {
};

template <template <typename...> class Tmpl, typename... Args, typename Target>
struct RefersToArgs<Tmpl<Args...>, Target> : std::disjunction<RefersTo<Args, Target>...> {
};

template <typename T>
using StripRefPtrCV = std::remove_cv_t<std::remove_pointer_t<std::remove_reference_t<T>>>;

}  // namespace detail

template <typename T, typename Target>
struct RefersTo
    : std::conditional_t<std::is_same_v<detail::StripRefPtrCV<T>, Target>,  //
                         std::true_type,                                    //
                         detail::RefersToArgs<detail::StripRefPtrCV<T>, Target>> {
};

}  // namespace ffail

#endif  // FFAIL_TYPE_TRAITS_HPP

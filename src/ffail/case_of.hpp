// Copyright 2021-2022 Anthony Paul Astolfi
//
#pragma once
#ifndef FFAIL_CASE_OF_HPP
#define FFAIL_CASE_OF_HPP

#include <ffail/config.hpp>
//
#include <ffail/type_traits.hpp>
#include <ffail/utility.hpp>

#include <type_traits>
#include <utility>
#include <variant>

namespace ffail {

namespace detail {

// All the handlers passed to case_of, merged into one overload set.
//
template <typename... Handlers>
struct CaseHandlers : Handlers... {
    using Handlers::operator()...;
};

// The alternative at index `I` of `VarT`, with the const-ness and value category of `VarT`.
//
template <typename VarT, std::size_t I>
using CaseArg = decltype(std::get<I>(std::declval<VarT>()));

template <typename HandlersT, typename VarT, std::size_t... I>
constexpr bool handles_every_case(std::index_sequence<I...>)
{
    return (IsCallable<HandlersT&, CaseArg<VarT, I>>{} && ...);
}

template <typename HandlersT, typename VarT, std::size_t... I>
auto case_of_result(std::index_sequence<I...>)
    -> std::common_type_t<std::invoke_result_t<HandlersT&, CaseArg<VarT, I>>...>;

}  // namespace detail

// =============================================================================
/// Dispatches on the current alternative of a std::variant.  The handlers form a single overload set, so
/// ordinary overload resolution picks the handler for each alternative: an exact non-template handler
/// beats a generic `auto` one.  Every alternative must be handled.  The result type is the common type of
/// all the handlers' results.
///
/// \code{.cpp}
/// std::variant<Foo, Bar> var = Bar{};
///
/// int result = ffail::case_of(
///   var,
///   [](const Foo &) {
///       return 1;
///   },
///   [](const auto &) {
///       return 2;
///   });
///
/// FFAIL_CHECK_EQ(result, 2);
/// \endcode
///
template <typename VarT, typename... Cases>
decltype(auto) case_of(VarT&& var, Cases&&... cases)
{
    static_assert(IsVariant<std::decay_t<VarT>>{}, "case_of must be applied to a std::variant");

    using Handlers = detail::CaseHandlers<std::decay_t<Cases>...>;
    using Indices = std::make_index_sequence<std::variant_size_v<std::decay_t<VarT>>>;

    static_assert(detail::handles_every_case<Handlers, VarT&&>(Indices{}), "Unhandled case in case_of");

    using Result = decltype(detail::case_of_result<Handlers, VarT&&>(Indices{}));

    Handlers handlers{FFAIL_FORWARD(cases)...};

    return std::visit(
        [&handlers](auto&& alternative) -> Result {
            return handlers(FFAIL_FORWARD(alternative));
        },
        FFAIL_FORWARD(var));
}

}  // namespace ffail

#endif  // FFAIL_CASE_OF_HPP

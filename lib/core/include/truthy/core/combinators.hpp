#pragma once
#include <truthy/core/coerce.hpp>
#include <truthy/core/either.hpp>
#include <truthy/defines.hpp>
#include <concepts>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace truthy {
///
/// \brief Concept for values the combinators can move around and replace.
///
template <typename Type>
concept Combinable = Coercible<Type> && std::movable<Type>;

///
/// \brief Obtain value if truthy, else fallback.
///
/// \code
/// or_(std::string{}, "default") == "default"
/// \endcode
///
template <Combinable Type>
[[nodiscard]] constexpr Type or_(Type value, std::type_identity_t<Type> fallback) {
	if (truthy(value)) { return value; }
	return fallback;
}

///
/// \brief Replace value with fallback if value is falsy.
///
template <Combinable Type>
constexpr void or_assign(Type& value, std::type_identity_t<Type> fallback) {
	if (falsy(value)) { value = std::move(fallback); }
}

///
/// \brief Obtain value if truthy, else the result of func().
///
/// func is invoked at most once, and never when value is truthy.
///
template <Combinable Type, std::invocable Func>
	requires std::convertible_to<std::invoke_result_t<Func>, Type>
[[nodiscard]] constexpr Type or_else(Type value, Func&& func) {
	if (truthy(value)) { return value; }
	return std::invoke(std::forward<Func>(func));
}

template <Combinable Type, std::invocable Func>
	requires std::convertible_to<std::invoke_result_t<Func>, Type>
constexpr void or_else_assign(Type& value, Func&& func) {
	if (falsy(value)) { value = std::invoke(std::forward<Func>(func)); }
}

///
/// \brief Obtain value if falsy, else replacement.
///
/// Mirrors the result of a short-circuit &&: the second operand once the first is truthy.
///
template <Combinable Type>
[[nodiscard]] constexpr Type and_(Type value, std::type_identity_t<Type> replacement) {
	if (falsy(value)) { return value; }
	return replacement;
}

///
/// \brief Replace value with replacement if value is truthy.
///
template <Combinable Type>
constexpr void and_assign(Type& value, std::type_identity_t<Type> replacement) {
	if (truthy(value)) { value = std::move(replacement); }
}

///
/// \brief Obtain value if falsy, else the result of func(value).
///
/// func receives the current value, and is invoked at most once, only when value is truthy.
///
template <Combinable Type, std::invocable<Type> Func>
	requires std::convertible_to<std::invoke_result_t<Func, Type>, Type>
[[nodiscard]] constexpr Type and_then(Type value, Func&& func) {
	if (falsy(value)) { return value; }
	return std::invoke(std::forward<Func>(func), std::move(value));
}

template <Combinable Type, std::invocable<Type const&> Func>
	requires std::convertible_to<std::invoke_result_t<Func, Type const&>, Type>
constexpr void and_then_assign(Type& value, Func&& func) {
	if (truthy(value)) { value = std::invoke(std::forward<Func>(func), std::as_const(value)); }
}

#if TRUTHY_WRAPPED
#if TRUTHY_EITHER
///
/// \brief Obtain value in the left slot if truthy, else other in the right slot.
///
template <Combinable Type, typename Other>
[[nodiscard]] constexpr Either<Type, Other> truthy_or(Type value, Other other) {
	if (truthy(value)) { return Either<Type, Other>::make_left(std::move(value)); }
	return Either<Type, Other>::make_right(std::move(other));
}
#endif

///
/// \brief Obtain other if value is truthy, else nothing.
///
template <Coercible Type, typename Other>
[[nodiscard]] constexpr std::optional<Other> truthy_and(Type const& value, Other other) {
	if (truthy(value)) { return std::optional<Other>{std::move(other)}; }
	return std::nullopt;
}
#endif

///
/// \brief Check whether every value is truthy; stops at the first falsy one.
///
template <Coercible... Types>
[[nodiscard]] constexpr bool all(Types const&... values) {
	return (... && truthy(values));
}

///
/// \brief Check whether any value is truthy; stops at the first truthy one.
///
template <Coercible... Types>
[[nodiscard]] constexpr bool any(Types const&... values) {
	return (... || truthy(values));
}
} // namespace truthy

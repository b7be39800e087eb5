#pragma once
#include <concepts>
#include <cstddef>
#include <memory>
#include <optional>
#include <ranges>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace truthy {
///
/// \brief Customization point: whether a value of Type counts as logically true.
///
/// Participating types specialize Coerce with exactly one member:
/// \code
/// template <>
/// struct truthy::Coerce<Colour> {
/// 	static constexpr bool truthy(Colour const& colour) { return colour.alpha > 0; }
/// };
/// \endcode
/// The predicate must be total and pure: no throwing, no shared state.
///
template <typename Type>
struct Coerce {};

///
/// \brief Concept for types with a Coerce specialization.
///
template <typename Type>
concept Coercible = requires(Type const& value) {
	{ Coerce<std::remove_cvref_t<Type>>::truthy(value) } -> std::same_as<bool>;
};

///
/// \brief Check whether value is truthy (non-zero, non-empty, present).
///
template <Coercible Type>
[[nodiscard]] constexpr bool truthy(Type const& value) {
	return Coerce<std::remove_cvref_t<Type>>::truthy(value);
}

///
/// \brief Check whether value is falsy. Always the exact complement of truthy().
///
template <Coercible Type>
[[nodiscard]] constexpr bool falsy(Type const& value) {
	return !truthy(value);
}

template <typename Type>
concept Character = std::same_as<Type, char> || std::same_as<Type, wchar_t> || std::same_as<Type, char8_t> || std::same_as<Type, char16_t> ||
					std::same_as<Type, char32_t>;

///
/// \brief Concept for fallible results shaped like std::expected.
///
template <typename Type>
concept ExpectedLike = requires(Type const& t) {
	typename Type::value_type;
	typename Type::error_type;
	{ t.has_value() } -> std::convertible_to<bool>;
	t.error();
} && (std::is_void_v<typename Type::value_type> || Coercible<typename Type::value_type>);

// integers, bool, characters
template <std::integral Type>
struct Coerce<Type> {
	static constexpr bool truthy(Type const value) { return value != Type{}; }
};

// NaN compares unequal to zero, so it is truthy; -0.0 compares equal, so it is not
template <std::floating_point Type>
struct Coerce<Type> {
	static constexpr bool truthy(Type const value) { return value != Type{}; }
};

template <Character Type>
struct Coerce<Type const*> {
	static constexpr bool truthy(Type const* str) { return str != nullptr && *str != Type{}; }
};

template <Character Type>
struct Coerce<Type*> {
	static constexpr bool truthy(Type const* str) { return str != nullptr && *str != Type{}; }
};

///
/// \brief Character arrays are treated as null-terminated strings.
///
template <Character Type, std::size_t N>
struct Coerce<Type[N]> {
	static constexpr bool truthy(Type const (&str)[N]) { return str[0] != Type{}; }
};

///
/// \brief Strings, string views, containers, spans: non-empty.
///
template <typename Type>
	requires std::ranges::sized_range<Type const>
struct Coerce<Type> {
	static constexpr bool truthy(Type const& range) { return std::ranges::size(range) > 0; }
};

template <Coercible Type>
struct Coerce<std::optional<Type>> {
	static constexpr bool truthy(std::optional<Type> const& optional) { return optional.has_value() && ::truthy::truthy(*optional); }
};

///
/// \brief Success with a truthy payload; the error variant is always falsy.
///
template <ExpectedLike Type>
struct Coerce<Type> {
	static constexpr bool truthy(Type const& result) {
		if (!result.has_value()) { return false; }
		if constexpr (std::is_void_v<typename Type::value_type>) {
			return true;
		} else {
			return ::truthy::truthy(*result);
		}
	}
};

template <Coercible... Types>
struct Coerce<std::variant<Types...>> {
	static constexpr bool truthy(std::variant<Types...> const& variant) {
		if (variant.valueless_by_exception()) { return false; }
		return std::visit([](auto const& payload) { return ::truthy::truthy(payload); }, variant);
	}
};

template <Coercible Type>
	requires(!std::is_array_v<Type>)
struct Coerce<std::unique_ptr<Type>> {
	static bool truthy(std::unique_ptr<Type> const& ptr) { return ptr && ::truthy::truthy(*ptr); }
};

template <Coercible Type>
	requires(!std::is_array_v<Type>)
struct Coerce<std::shared_ptr<Type>> {
	static bool truthy(std::shared_ptr<Type> const& ptr) { return ptr && ::truthy::truthy(*ptr); }
};

// records: any field set implies a value
template <typename... Types>
struct Coerce<std::tuple<Types...>> {
	static constexpr bool truthy(std::tuple<Types...> const&) { return sizeof...(Types) > 0; }
};

template <typename First, typename Second>
struct Coerce<std::pair<First, Second>> {
	static constexpr bool truthy(std::pair<First, Second> const&) { return true; }
};

template <>
struct Coerce<std::monostate> {
	static constexpr bool truthy(std::monostate) { return false; }
};

template <>
struct Coerce<std::nullptr_t> {
	static constexpr bool truthy(std::nullptr_t) { return false; }
};
} // namespace truthy

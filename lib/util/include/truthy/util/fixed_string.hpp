#pragma once
#include <algorithm>
#include <cstddef>
#include <string_view>

namespace truthy {
///
/// \brief Compile-time "stringy" wrapper around a char array, usable as a template argument.
///
/// All members are public to keep the type structural.
///
template <std::size_t Capacity>
struct FixedString {
	char buffer[Capacity + 1]{};
	std::size_t length{};

	constexpr FixedString() = default;

	constexpr FixedString(char const (&str)[Capacity + 1]) : length(Capacity) { std::copy_n(str, Capacity + 1, buffer); }

	///
	/// \brief Copy at most Capacity characters of str.
	///
	constexpr explicit FixedString(std::string_view const str) : length(std::min(str.size(), Capacity)) { std::copy_n(str.data(), length, buffer); }

	constexpr std::string_view view() const { return {buffer, length}; }
	constexpr char const* c_str() const { return buffer; }
	constexpr std::size_t size() const { return length; }
	constexpr bool empty() const { return length == 0; }

	constexpr operator std::string_view() const { return view(); }
};

///
/// \brief Deduction guide for string literals (drops the terminating null).
///
template <std::size_t N>
FixedString(char const (&)[N]) -> FixedString<N - 1>;
} // namespace truthy

#pragma once
#include <truthy/defines.hpp>

#if TRUTHY_EITHER
#include <truthy/core/coerce.hpp>
#include <utility>
#include <variant>

namespace truthy {
///
/// \brief Two-variant sum: holds exactly one of Left or Right.
///
/// Alternatives are addressed by position, so Left and Right may be the same type.
///
template <typename Left, typename Right>
class Either {
  public:
	static constexpr Either make_left(Left value) { return Either{std::in_place_index<0>, std::move(value)}; }
	static constexpr Either make_right(Right value) { return Either{std::in_place_index<1>, std::move(value)}; }

	constexpr bool is_left() const { return m_value.index() == 0; }
	constexpr bool is_right() const { return m_value.index() == 1; }

	///
	/// \brief Obtain the left payload, if active.
	///
	constexpr Left const* left() const { return std::get_if<0>(&m_value); }
	constexpr Left* left() { return std::get_if<0>(&m_value); }
	///
	/// \brief Obtain the right payload, if active.
	///
	constexpr Right const* right() const { return std::get_if<1>(&m_value); }
	constexpr Right* right() { return std::get_if<1>(&m_value); }

	template <typename Visitor>
	constexpr decltype(auto) visit(Visitor&& visitor) const {
		return std::visit(std::forward<Visitor>(visitor), m_value);
	}

	bool operator==(Either const&) const = default;

  private:
	template <std::size_t Index, typename Type>
	constexpr Either(std::in_place_index_t<Index> index, Type&& value) : m_value(index, std::forward<Type>(value)) {}

	std::variant<Left, Right> m_value;
};

template <Coercible Left, Coercible Right>
struct Coerce<Either<Left, Right>> {
	static constexpr bool truthy(Either<Left, Right> const& either) {
		return either.visit([](auto const& payload) { return ::truthy::truthy(payload); });
	}
};
} // namespace truthy
#endif

#pragma once
#include <truthy/core/coerce.hpp>
#include <functional>
#include <type_traits>
#include <utility>

namespace truthy::expr {
///
/// \brief Concept for expression nodes built by t(), lazy() and the boolean operators.
///
template <typename Type>
concept Expression = requires(std::remove_cvref_t<Type> const& node) {
	typename std::remove_cvref_t<Type>::expression_tag;
	{ node() } -> std::same_as<bool>;
};

///
/// \brief Leaf coercing a value: references lvalues, owns rvalues.
///
template <typename Type>
class Term {
  public:
	using expression_tag = void;

	constexpr explicit Term(Type&& value) : m_value(std::forward<Type>(value)) {}

	constexpr bool operator()() const { return truthy(m_value); }
	explicit constexpr operator bool() const { return (*this)(); }

  private:
	Type m_value;
};

///
/// \brief Leaf producing its value only when reached.
///
template <typename Func>
class Lazy {
  public:
	using expression_tag = void;

	constexpr explicit Lazy(Func func) : m_func(std::move(func)) {}

	constexpr bool operator()() const { return truthy(std::invoke(m_func)); }
	explicit constexpr operator bool() const { return (*this)(); }

  private:
	Func m_func;
};

template <Expression Operand>
class Not {
  public:
	using expression_tag = void;

	constexpr explicit Not(Operand operand) : m_operand(std::move(operand)) {}

	constexpr bool operator()() const { return !m_operand(); }
	explicit constexpr operator bool() const { return (*this)(); }

  private:
	Operand m_operand;
};

template <Expression Lhs, Expression Rhs>
class And {
  public:
	using expression_tag = void;

	constexpr And(Lhs lhs, Rhs rhs) : m_lhs(std::move(lhs)), m_rhs(std::move(rhs)) {}

	constexpr bool operator()() const { return m_lhs() && m_rhs(); }
	explicit constexpr operator bool() const { return (*this)(); }

  private:
	Lhs m_lhs;
	Rhs m_rhs;
};

template <Expression Lhs, Expression Rhs>
class Or {
  public:
	using expression_tag = void;

	constexpr Or(Lhs lhs, Rhs rhs) : m_lhs(std::move(lhs)), m_rhs(std::move(rhs)) {}

	constexpr bool operator()() const { return m_lhs() || m_rhs(); }
	explicit constexpr operator bool() const { return (*this)(); }

  private:
	Lhs m_lhs;
	Rhs m_rhs;
};

template <typename Type>
	requires Coercible<Type>
constexpr Term<Type> t(Type&& value) {
	return Term<Type>{std::forward<Type>(value)};
}

template <std::invocable Func>
	requires Coercible<std::invoke_result_t<Func const&>>
constexpr Lazy<Func> lazy(Func func) {
	return Lazy<Func>{std::move(func)};
}

template <Expression Operand>
constexpr Not<Operand> not_(Operand operand) {
	return Not<Operand>{std::move(operand)};
}

template <Expression Lhs, Expression Rhs>
constexpr And<Lhs, Rhs> and_(Lhs lhs, Rhs rhs) {
	return {std::move(lhs), std::move(rhs)};
}

template <Expression Lhs, Expression Rhs>
constexpr Or<Lhs, Rhs> or_(Lhs lhs, Rhs rhs) {
	return {std::move(lhs), std::move(rhs)};
}

template <Expression Operand>
constexpr Not<Operand> operator!(Operand operand) {
	return not_(std::move(operand));
}

///
/// \brief Builds a node; the right operand is still only evaluated if the left one is truthy.
///
template <Expression Lhs, Expression Rhs>
constexpr And<Lhs, Rhs> operator&&(Lhs lhs, Rhs rhs) {
	return and_(std::move(lhs), std::move(rhs));
}

template <Expression Lhs, Expression Rhs>
constexpr Or<Lhs, Rhs> operator||(Lhs lhs, Rhs rhs) {
	return or_(std::move(lhs), std::move(rhs));
}
} // namespace truthy::expr

namespace truthy {
template <expr::Expression Type>
struct Coerce<Type> {
	static constexpr bool truthy(Type const& node) { return node(); }
};
} // namespace truthy

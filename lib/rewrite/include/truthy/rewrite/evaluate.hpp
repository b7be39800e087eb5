#pragma once
#include <truthy/core/coerce.hpp>
#include <truthy/rewrite/expr.hpp>
#include <truthy/rewrite/grammar.hpp>
#include <truthy/util/fixed_string.hpp>
#include <array>
#include <cstddef>
#include <string_view>
#include <tuple>

namespace truthy {
namespace detail {
template <FixedString Source>
struct Compiled {
	using Check = Checked<Source>;

	static constexpr auto program = Check::parsed.program;
	static constexpr bool valid = MalformedBooleanExpression<Source, Check::offset, FixedString<Check::token.size()>{Check::token}>::value;
};

///
/// \brief Instantiated with the name of an identifier in Source that has no binding.
///
template <FixedString Source, FixedString Identifier>
struct UnboundIdentifier {
	static_assert(Identifier.empty(), "identifier in boolean expression has no binding: see Identifier");
	static constexpr bool value = Identifier.empty();
};

///
/// \brief Instantiated with a binding name in Names that Source does not use.
///
template <FixedString Names, FixedString Binding>
struct UnusedBinding {
	static_assert(Binding.empty(), "binding names no identifier in boolean expression: see Binding");
	static constexpr bool value = Binding.empty();
};

constexpr std::size_t count_names(std::string_view const list) {
	if (list.find_first_not_of(" \t\n\r\f\v") == std::string_view::npos) { return 0; }
	std::size_t ret{1};
	for (char const c : list) {
		if (c == ',') { ++ret; }
	}
	return ret;
}

///
/// \brief Split a comma separated list of identifiers.
///
template <std::size_t Count>
constexpr std::array<std::string_view, Count> split_names(std::string_view list) {
	auto ret = std::array<std::string_view, Count>{};
	std::size_t count{};
	while (!list.empty() && count < Count) {
		auto const comma = list.find(',');
		auto name = list.substr(0, comma);
		while (!name.empty() && is_space(name.front())) { name.remove_prefix(1); }
		while (!name.empty() && is_space(name.back())) { name.remove_suffix(1); }
		ret[count++] = name;
		if (comma == std::string_view::npos) { break; }
		list.remove_prefix(comma + 1);
	}
	return ret;
}

template <std::size_t Count>
constexpr std::size_t index_of(std::array<std::string_view, Count> const& names, std::string_view const name) {
	std::size_t ret{};
	while (ret < Count && names[ret] != name) { ++ret; }
	return ret;
}

// slot -> argument index
template <std::size_t Slots>
struct Positional {
	static constexpr auto binding = [] {
		auto ret = std::array<std::size_t, Slots>{};
		for (std::size_t slot = 0; slot < Slots; ++slot) { ret[slot] = slot; }
		return ret;
	}();
};

template <FixedString Source, FixedString Names, std::size_t Count>
struct Named {
	static constexpr auto const& program = Compiled<Source>::program;
	static constexpr auto names = split_names<Count>(Names.view());
	static constexpr std::size_t listed = count_names(Names.view());

	// a malformed Source is reported on its own
	static constexpr std::string_view unbound = [] {
		if (Checked<Source>::offset != npos_v) { return std::string_view{}; }
		for (std::size_t slot = 0; slot < program.slot_count; ++slot) {
			if (index_of(names, program.name(slot)) == Count) { return program.name(slot); }
		}
		return std::string_view{};
	}();

	static constexpr std::string_view unused = [] {
		if (Checked<Source>::offset != npos_v) { return std::string_view{}; }
		for (auto const name : names) {
			bool used{};
			for (std::size_t slot = 0; slot < program.slot_count; ++slot) { used = used || program.name(slot) == name; }
			if (!used) { return name; }
		}
		return std::string_view{};
	}();

	static constexpr bool valid =
		UnboundIdentifier<Source, FixedString<unbound.size()>{unbound}>::value && UnusedBinding<Names, FixedString<unused.size()>{unused}>::value;

	static constexpr auto binding = [] {
		auto ret = std::array<std::size_t, program.slot_count>{};
		for (std::size_t slot = 0; slot < program.slot_count; ++slot) { ret[slot] = index_of(names, program.name(slot)); }
		return ret;
	}();
};

template <auto const& Rewritten, auto const& Binding, std::size_t Index, typename Args>
constexpr bool evaluate_node(Args const& args) {
	constexpr auto instruction = Rewritten.instructions[Index];
	if constexpr (instruction.op == Op::eIdent) {
		return truthy(std::get<Binding[instruction.slot]>(args));
	} else if constexpr (instruction.op == Op::eNot) {
		return !evaluate_node<Rewritten, Binding, instruction.lhs>(args);
	} else if constexpr (instruction.op == Op::eGroup) {
		return evaluate_node<Rewritten, Binding, instruction.lhs>(args);
	} else if constexpr (instruction.op == Op::eAnd) {
		return evaluate_node<Rewritten, Binding, instruction.lhs>(args) && evaluate_node<Rewritten, Binding, instruction.rhs>(args);
	} else {
		return evaluate_node<Rewritten, Binding, instruction.lhs>(args) || evaluate_node<Rewritten, Binding, instruction.rhs>(args);
	}
}
} // namespace detail

///
/// \brief Evaluate a boolean expression over identifiers, binding arguments by position.
/// \param args One value per distinct identifier, in order of first appearance
///
/// The expression is parsed and rewritten at compile time; each identifier leaf becomes truthy(arg).
/// Operators keep native short-circuiting: pass expr::lazy(f) for operands that must not be computed eagerly.
///
/// \code
/// truthy::evaluate<"x && (y || !z)">(x, y, z)
/// \endcode
///
template <FixedString Source, Coercible... Args>
[[nodiscard]] constexpr bool evaluate(Args const&... args) {
	using Rewrite = detail::Compiled<Source>;
	constexpr bool arity = sizeof...(Args) == Rewrite::program.slot_count;
	static_assert(!Rewrite::valid || arity, "Expected one argument per distinct identifier");
	if constexpr (Rewrite::valid && arity) {
		return detail::evaluate_node<Rewrite::program, detail::Positional<sizeof...(Args)>::binding, Rewrite::program.root>(std::forward_as_tuple(args...));
	} else {
		return false;
	}
}

///
/// \brief Evaluate a boolean expression over identifiers, binding arguments by name.
/// \param args One value per name in Names
///
/// Names is a comma separated list of the identifiers in Source, in the order of args.
/// An identifier missing from Names, or a name not in Source, fails compilation.
///
template <FixedString Source, FixedString Names, Coercible... Args>
[[nodiscard]] constexpr bool evaluate(Args const&... args) {
	using Rewrite = detail::Compiled<Source>;
	using Binding = detail::Named<Source, Names, sizeof...(Args)>;
	static_assert(Binding::listed == sizeof...(Args), "Expected one argument per binding name");
	if constexpr (Rewrite::valid && Binding::valid) {
		return detail::evaluate_node<Rewrite::program, Binding::binding, Rewrite::program.root>(std::forward_as_tuple(args...));
	} else {
		return false;
	}
}
} // namespace truthy

///
/// \brief Rewrite a boolean expression over identifiers in scope into truthy() calls.
///
/// \code
/// if (TRUTHY(name && (count || !fallback), name, count, fallback)) { ... }
/// \endcode
///
#define TRUTHY(expression, ...) (::truthy::evaluate<#expression, #__VA_ARGS__>(__VA_ARGS__))

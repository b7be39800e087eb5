#pragma once
#include <truthy/util/error.hpp>
#include <truthy/util/fixed_string.hpp>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace truthy {
///
/// \brief Thrown when a boolean expression does not match the grammar.
///
class ParseError : public Error {
  public:
	ParseError(std::string const& message, std::size_t offset) : Error(message), m_offset(offset) {}

	///
	/// \brief Offset of the offending token in the source.
	///
	std::size_t offset() const { return m_offset; }

  private:
	std::size_t m_offset{};
};

enum class TokenType : std::uint8_t { eIdent, eNot, eAnd, eOr, eOpen, eClose, eEnd, eInvalid };

struct Token {
	TokenType type{};
	std::size_t offset{};
	std::size_t length{};
};

enum class Op : std::uint8_t { eIdent, eNot, eAnd, eOr, eGroup };

///
/// \brief Node in a rewritten expression.
///
/// eIdent reads slot; eNot and eGroup read lhs; eAnd and eOr read lhs then rhs.
///
struct Instruction {
	Op op{};
	std::size_t lhs{};
	std::size_t rhs{};
	std::size_t slot{};
};

///
/// \brief Identifier bound to a slot, as a range in the source.
///
struct Name {
	std::size_t offset{};
	std::size_t length{};
};

struct ProgramView {
	std::string_view source{};
	std::span<Instruction const> instructions{};
	std::span<Name const> names{};
	std::size_t root{};
};

///
/// \brief Rewritten boolean expression: every identifier leaf becomes a truthy() call.
///
/// Distinct identifiers are numbered (slots) in order of first appearance.
///
template <std::size_t Capacity>
struct Program {
	FixedString<Capacity> source{};
	Instruction instructions[Capacity + 1]{};
	Name names[Capacity + 1]{};
	std::size_t instruction_count{};
	std::size_t slot_count{};
	std::size_t root{};

	constexpr std::string_view name(std::size_t slot) const { return source.view().substr(names[slot].offset, names[slot].length); }

	ProgramView view() const { return {source.view(), {instructions, instruction_count}, {names, slot_count}, root}; }
};

std::string to_string(ProgramView const& program);

template <std::size_t Capacity>
std::string to_string(Program<Capacity> const& program) {
	return to_string(program.view());
}

///
/// \brief Result of parsing without throwing on a grammar violation.
///
/// When failed is set, rejected is the first token that does not fit the grammar and program is incomplete.
///
template <std::size_t Capacity>
struct Parsed {
	Program<Capacity> program{};
	Token rejected{};
	bool failed{};
};

namespace detail {
inline constexpr auto npos_v = std::string_view::npos;

[[noreturn]] void malformed_boolean_expression(std::string_view source, Token token);
[[noreturn]] void program_overflow(std::string_view source, std::size_t capacity);

constexpr bool is_ident_head(char const c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_'; }
constexpr bool is_ident_tail(char const c) { return is_ident_head(c) || (c >= '0' && c <= '9'); }
constexpr bool is_space(char const c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v'; }

class Lexer {
  public:
	constexpr explicit Lexer(std::string_view source) : m_source(source) {}

	constexpr Token next() {
		while (m_index < m_source.size() && is_space(m_source[m_index])) { ++m_index; }
		if (m_index >= m_source.size()) { return {TokenType::eEnd, m_source.size(), 0}; }
		auto const start = m_index;
		auto const c = m_source[m_index];
		if (is_ident_head(c)) {
			while (m_index < m_source.size() && is_ident_tail(m_source[m_index])) { ++m_index; }
			return {TokenType::eIdent, start, m_index - start};
		}
		switch (c) {
		case '!': return single(TokenType::eNot);
		case '(': return single(TokenType::eOpen);
		case ')': return single(TokenType::eClose);
		case '&': return pair('&', TokenType::eAnd);
		case '|': return pair('|', TokenType::eOr);
		default: return single(TokenType::eInvalid);
		}
	}

  private:
	constexpr Token single(TokenType type) { return {type, m_index++, 1}; }

	constexpr Token pair(char const c, TokenType type) {
		if (m_index + 1 < m_source.size() && m_source[m_index + 1] == c) {
			m_index += 2;
			return {type, m_index - 2, 2};
		}
		return single(TokenType::eInvalid);
	}

	std::string_view m_source{};
	std::size_t m_index{};
};

///
/// \brief Recursive descent over the token stream.
///
/// Expr := Conj ('||' Expr)?
/// Conj := Unary ('&&' Conj)?
/// Unary := '!' Unary | '(' Expr ')' | identifier
///
/// Each level recognizes its first term, then an operator, then recursively rewrites the rest,
/// so a chain a && b && c becomes truthy(a) && (truthy(b) && truthy(c)).
/// Parsing stops at the first token that does not fit.
///
template <std::size_t Capacity>
class Parser {
  public:
	constexpr explicit Parser(std::string_view source) : m_lexer(source), m_source(source) {
		if (source.size() > Capacity) { program_overflow(source, Capacity); }
		m_parsed.program.source = FixedString<Capacity>{source};
		m_current = m_lexer.next();
	}

	constexpr Parsed<Capacity> parse() {
		m_parsed.program.root = expr();
		if (m_current.type != TokenType::eEnd) { reject(m_current); }
		return m_parsed;
	}

  private:
	constexpr std::size_t expr() {
		auto const lhs = conj();
		if (m_parsed.failed || m_current.type != TokenType::eOr) { return lhs; }
		advance();
		auto const rhs = expr();
		if (m_parsed.failed) { return 0; }
		return push({.op = Op::eOr, .lhs = lhs, .rhs = rhs});
	}

	constexpr std::size_t conj() {
		auto const lhs = unary();
		if (m_parsed.failed || m_current.type != TokenType::eAnd) { return lhs; }
		advance();
		auto const rhs = conj();
		if (m_parsed.failed) { return 0; }
		return push({.op = Op::eAnd, .lhs = lhs, .rhs = rhs});
	}

	constexpr std::size_t unary() {
		auto const token = m_current;
		switch (token.type) {
		case TokenType::eNot: {
			advance();
			auto const operand = unary();
			if (m_parsed.failed) { return 0; }
			return push({.op = Op::eNot, .lhs = operand});
		}
		case TokenType::eOpen: {
			advance();
			auto const inner = expr();
			if (m_parsed.failed) { return 0; }
			if (m_current.type != TokenType::eClose) { return reject(m_current); }
			advance();
			return push({.op = Op::eGroup, .lhs = inner});
		}
		case TokenType::eIdent: {
			advance();
			return push({.op = Op::eIdent, .slot = intern(token)});
		}
		default: return reject(token);
		}
	}

	constexpr void advance() { m_current = m_lexer.next(); }

	constexpr std::size_t reject(Token const& token) {
		if (!m_parsed.failed) {
			m_parsed.rejected = token;
			m_parsed.failed = true;
		}
		return 0;
	}

	constexpr std::size_t push(Instruction const instruction) {
		auto& program = m_parsed.program;
		if (program.instruction_count >= Capacity) { program_overflow(m_source, Capacity); }
		program.instructions[program.instruction_count] = instruction;
		return program.instruction_count++;
	}

	constexpr std::size_t intern(Token const& token) {
		auto& program = m_parsed.program;
		auto const name = m_source.substr(token.offset, token.length);
		for (std::size_t slot = 0; slot < program.slot_count; ++slot) {
			if (program.name(slot) == name) { return slot; }
		}
		program.names[program.slot_count] = {token.offset, token.length};
		return program.slot_count++;
	}

	Lexer m_lexer;
	std::string_view m_source{};
	Token m_current{};
	Parsed<Capacity> m_parsed{};
};

///
/// \brief Text naming a rejected token in diagnostics.
///
constexpr std::string_view culprit(std::string_view source, Token const& token) {
	if (token.type == TokenType::eEnd) { return "end of expression"; }
	return source.substr(token.offset, token.length);
}

///
/// \brief Instantiated with the offset and text of the rejected token when Source is malformed.
///
/// The compiler prints Source, Offset and Culprit as the template arguments of the failed assertion.
///
template <FixedString Source, std::size_t Offset, FixedString Culprit>
struct MalformedBooleanExpression {
	static_assert(Offset == npos_v, "malformed boolean expression: unexpected Culprit at Offset in Source");
	static constexpr bool value = Offset == npos_v;
};

///
/// \brief Parse of a string literal template argument, with its rejection (if any) as constants.
///
template <FixedString Source>
struct Checked {
	static constexpr auto parsed = detail::Parser<Source.size()>{Source.view()}.parse();
	static constexpr std::size_t offset = parsed.failed ? parsed.rejected.offset : npos_v;
	static constexpr std::string_view token = parsed.failed ? culprit(Source.view(), parsed.rejected) : std::string_view{};
};
} // namespace detail

///
/// \brief Parse and rewrite a boolean expression, reporting the first rejected token instead of throwing.
///
template <std::size_t Capacity>
constexpr Parsed<Capacity> parse(std::string_view source) {
	return detail::Parser<Capacity>{source}.parse();
}

///
/// \brief Parse and rewrite a boolean expression over identifiers.
/// \param source Expression using identifiers, !, &&, || and parentheses
/// \returns Rewritten program
///
/// At run time a grammar violation throws ParseError naming the first offending token.
/// Evaluate string literal expressions through evaluate<"...">, which rejects them at compile time.
///
template <std::size_t Capacity>
constexpr Program<Capacity> compile(std::string_view source) {
	auto ret = parse<Capacity>(source);
	if (ret.failed) { detail::malformed_boolean_expression(source, ret.rejected); }
	return ret.program;
}
} // namespace truthy

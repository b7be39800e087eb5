#include <truthy/rewrite/grammar.hpp>
#include <truthy/util/logger.hpp>
#include <fmt/format.h>
#include <iterator>

namespace truthy {
namespace {
std::string describe(std::string_view source, Token const& token) {
	switch (token.type) {
	case TokenType::eEnd: return "end of expression";
	case TokenType::eInvalid: return fmt::format("character '{}'", source.substr(token.offset, token.length));
	default: return fmt::format("'{}'", source.substr(token.offset, token.length));
	}
}

void append(std::string& out, ProgramView const& program, std::size_t index) {
	auto const& instruction = program.instructions[index];
	switch (instruction.op) {
	case Op::eIdent: {
		auto const& name = program.names[instruction.slot];
		fmt::format_to(std::back_inserter(out), "truthy({})", program.source.substr(name.offset, name.length));
		break;
	}
	case Op::eNot: {
		out += '!';
		append(out, program, instruction.lhs);
		break;
	}
	case Op::eGroup: {
		out += '(';
		append(out, program, instruction.lhs);
		out += ')';
		break;
	}
	case Op::eAnd:
	case Op::eOr: {
		append(out, program, instruction.lhs);
		out += instruction.op == Op::eAnd ? " && " : " || ";
		// the remainder of a chain was rewritten on its own
		auto const rest = program.instructions[instruction.rhs].op;
		bool const wrap = rest == Op::eAnd || rest == Op::eOr;
		if (wrap) { out += '('; }
		append(out, program, instruction.rhs);
		if (wrap) { out += ')'; }
		break;
	}
	}
}
} // namespace

void detail::malformed_boolean_expression(std::string_view source, Token token) {
	auto const what = describe(source, token);
	logger::warn("[Rewrite] Rejected [{}]: unexpected {} at offset {}", source, what, token.offset);
	throw ParseError{fmt::format("malformed boolean expression: unexpected {} at offset {} in \"{}\"", what, token.offset, source), token.offset};
}

void detail::program_overflow(std::string_view source, std::size_t capacity) {
	logger::error("[Rewrite] Program capacity {} exceeded by [{}]", capacity, source);
	throw Error{fmt::format("boolean expression \"{}\" exceeds program capacity {}", source, capacity)};
}

std::string to_string(ProgramView const& program) {
	auto ret = std::string{};
	if (program.instructions.empty()) { return ret; }
	append(ret, program, program.root);
	return ret;
}
} // namespace truthy

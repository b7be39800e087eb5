#include <gtest/gtest.h>
#include <truthy/rewrite/expr.hpp>
#include <optional>
#include <string>
#include <vector>

namespace {
namespace expr = truthy::expr;
using expr::t;

static_assert((t(1) && !t(0))());
static_assert(!(t(0) || t(0.0))());
static_assert(truthy::Coercible<decltype(t(1) && t(2))>);

TEST(Expr, MixedTypes) {
	bool const x = true;
	auto const y = std::string{};
	auto const z = std::optional<int>{};
	EXPECT_TRUE((t(x) && (t(y) || !t(z)))());
	EXPECT_TRUE(static_cast<bool>(t(x) && (t(y) || !t(z))));
	EXPECT_FALSE(truthy::truthy(t(y) || t(z)));
}

TEST(Expr, MatchesNativeOperators) {
	for (int const a : {0, 1}) {
		for (int const b : {0, 1}) {
			for (int const c : {0, 1}) {
				bool const ta = a != 0;
				bool const tb = b != 0;
				bool const tc = c != 0;
				EXPECT_EQ(((t(a) && t(b)) || t(c))(), (ta && tb) || tc);
				EXPECT_EQ((t(a) || (t(b) && t(c)))(), ta || (tb && tc));
				EXPECT_EQ((!t(a) && t(b))(), !ta && tb);
				EXPECT_EQ((!(t(a) || t(b)) && t(c))(), !(ta || tb) && tc);
				EXPECT_EQ(expr::and_(t(a), expr::or_(t(b), expr::not_(t(c))))(), ta && (tb || !tc));
			}
		}
	}
}

TEST(Expr, ShortCircuits) {
	int const dividend = 10;
	int divisor = 0;
	int calls{};
	auto const quotient = expr::lazy([&] {
		++calls;
		return dividend / divisor;
	});
	EXPECT_FALSE((t(divisor) && quotient)());
	EXPECT_TRUE((!t(divisor) || quotient)());
	EXPECT_EQ(calls, 0);

	auto const fallback = expr::lazy([&] {
		++calls;
		return std::vector<int>{1};
	});
	EXPECT_TRUE((t(divisor) || fallback)());
	EXPECT_EQ(calls, 1);
}

TEST(Expr, TermsReferenceLvalues) {
	auto name = std::string{};
	auto const check = t(name) && !t(std::string{});
	EXPECT_FALSE(check());
	name = "set";
	EXPECT_TRUE(check());
}
} // namespace

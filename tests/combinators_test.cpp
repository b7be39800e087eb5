#include <gtest/gtest.h>
#include <truthy/core/combinators.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {
using namespace std::string_literals;

static_assert(truthy::or_(0, 5) == 5);
static_assert(truthy::or_(3, 5) == 3);
static_assert(truthy::and_(0, 5) == 0);
static_assert(truthy::and_(3, 5) == 5);
static_assert(truthy::all(1, 'x', 0.5) && !truthy::all(1, 0, 2));
static_assert(truthy::any(0, 0.0, 'x') && !truthy::any(0, '\0', false));
static_assert(truthy::all() && !truthy::any());

TEST(Combinators, Or) {
	EXPECT_EQ(std::string_view{truthy::or_("", "default")}, "default");
	EXPECT_EQ(std::string_view{truthy::or_("foo", "default")}, "foo");
	EXPECT_EQ(truthy::or_(std::string{}, "default"), "default");
	EXPECT_EQ(truthy::or_(std::optional<int>{0}, std::optional<int>{4}).value_or(-1), 4);
}

TEST(Combinators, OrAssign) {
	auto a = ""s;
	auto b = "foo"s;
	auto other = "untouched"s;
	truthy::or_assign(a, "default");
	truthy::or_assign(b, "default");
	EXPECT_EQ(a, "default");
	EXPECT_EQ(b, "foo");
	EXPECT_EQ(other, "untouched");

	// in place equals the value form
	for (int const value : {0, 1, -1}) {
		auto in_place = value;
		truthy::or_assign(in_place, 9);
		EXPECT_EQ(in_place, truthy::or_(value, 9));
	}
}

TEST(Combinators, OrElseIsLazy) {
	int calls{};
	auto const fallback = [&calls] {
		++calls;
		return "default"s;
	};
	EXPECT_EQ(truthy::or_else("foo"s, fallback), "foo");
	EXPECT_EQ(calls, 0);
	EXPECT_EQ(truthy::or_else(""s, fallback), "default");
	EXPECT_EQ(calls, 1);

	auto value = std::vector<int>{1};
	truthy::or_else_assign(value, [&calls] {
		++calls;
		return std::vector<int>{2, 3};
	});
	EXPECT_EQ(value, std::vector<int>{1});
	EXPECT_EQ(calls, 1);
	value.clear();
	truthy::or_else_assign(value, [&calls] {
		++calls;
		return std::vector<int>{2, 3};
	});
	EXPECT_EQ(value, (std::vector<int>{2, 3}));
	EXPECT_EQ(calls, 2);
}

TEST(Combinators, And) {
	EXPECT_EQ(std::string_view{truthy::and_("", "replacement")}, "");
	EXPECT_EQ(std::string_view{truthy::and_("foo", "replacement")}, "replacement");

	auto a = ""s;
	auto b = "foo"s;
	truthy::and_assign(a, "replacement");
	truthy::and_assign(b, "replacement");
	EXPECT_EQ(a, "");
	EXPECT_EQ(b, "replacement");
}

TEST(Combinators, AndThenIsLazy) {
	int calls{};
	auto const decrement = [&calls](std::uint8_t n) {
		++calls;
		return static_cast<std::uint8_t>(n - 1);
	};
	EXPECT_EQ(truthy::and_then(std::uint8_t{0}, decrement), 0);
	EXPECT_EQ(calls, 0);
	EXPECT_EQ(truthy::and_then(std::uint8_t{2}, decrement), 1);
	EXPECT_EQ(calls, 1);
}

TEST(Combinators, AndThenAssign) {
	auto a = std::uint8_t{0};
	auto b = std::uint8_t{2};
	auto const decrement = [](std::uint8_t const& n) { return static_cast<std::uint8_t>(n - 1); };
	truthy::and_then_assign(a, decrement);
	truthy::and_then_assign(b, decrement);
	EXPECT_EQ(a, 0);
	EXPECT_EQ(b, 1);
}

TEST(Combinators, Sequence) {
	// or_assign, then and_then_assign on the same counter
	auto count = std::uint8_t{0};
	EXPECT_EQ(truthy::and_then(count, [](std::uint8_t n) { return static_cast<std::uint8_t>(n - 1); }), 0);
	truthy::or_assign(count, std::uint8_t{2});
	truthy::and_then_assign(count, [](std::uint8_t const& n) { return static_cast<std::uint8_t>(n - 1); });
	EXPECT_EQ(count, 1);
}

#if TRUTHY_WRAPPED
TEST(Combinators, TruthyAnd) {
	auto const some = truthy::truthy_and(1, "other"s);
	ASSERT_TRUE(some.has_value());
	EXPECT_EQ(*some, "other");
	EXPECT_FALSE(truthy::truthy_and(std::string{}, 4).has_value());
}

#if TRUTHY_EITHER
TEST(Combinators, TruthyOr) {
	auto const left = truthy::truthy_or("value"s, 7);
	ASSERT_TRUE(left.is_left());
	EXPECT_EQ(*left.left(), "value");

	auto const right = truthy::truthy_or(""s, 7);
	ASSERT_TRUE(right.is_right());
	EXPECT_EQ(*right.right(), 7);
}
#endif
#endif

TEST(Combinators, AllAny) {
	auto const empty = std::vector<int>{};
	EXPECT_FALSE(truthy::all(std::string{"x"}, empty, 1));
	EXPECT_TRUE(truthy::all(std::string{"x"}, std::vector<int>{0}, 1));
	EXPECT_TRUE(truthy::any(empty, std::optional<int>{}, std::string{"x"}));
	EXPECT_FALSE(truthy::any(empty, std::optional<int>{}, std::string{}));
}
} // namespace

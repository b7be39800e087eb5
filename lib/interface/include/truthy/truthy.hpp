#pragma once
#include <truthy/defines.hpp>

#include <truthy/core/coerce.hpp>
#include <truthy/core/combinators.hpp>
#include <truthy/core/either.hpp>

#include <truthy/rewrite/evaluate.hpp>
#include <truthy/rewrite/expr.hpp>
#include <truthy/rewrite/grammar.hpp>

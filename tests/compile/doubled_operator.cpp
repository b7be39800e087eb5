#include <truthy/truthy.hpp>

bool rejects_doubled_operator(bool const a, bool const b) { return TRUTHY(a && && b, a, b); }

#include <truthy/truthy.hpp>

bool rejects_missing_argument(int const x) { return truthy::evaluate<"a && b">(x); }

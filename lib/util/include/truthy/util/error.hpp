#pragma once
#include <stdexcept>

namespace truthy {
///
/// \brief Base truthy exception.
///
struct Error : std::runtime_error {
	using std::runtime_error::runtime_error;
};
} // namespace truthy

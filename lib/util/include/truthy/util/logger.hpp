#pragma once
#include <fmt/format.h>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace truthy::logger {
enum class Level : std::uint8_t { eError, eWarn };
inline constexpr char levels_v[] = {'E', 'W'};

///
/// \brief Pattern used to format every entry.
///
/// Available arguments: level, message, timestamp (local time, takes chrono specs).
///
inline std::string g_format{"[{level}] {message} [{timestamp:%H:%M:%S}]"};

struct Entry {
	std::string message{};
	Level level{};
};

std::string format(Level level, std::string_view message);
void write(Entry entry);

///
/// \brief Receives entries in place of stderr while alive.
///
/// Captures nest; the most recent one receives entries.
///
class Capture {
  public:
	Capture();
	~Capture();

	Capture(Capture const&) = delete;
	Capture& operator=(Capture const&) = delete;

	std::vector<Entry> entries() const;

  private:
	std::vector<Entry> m_entries{};
	Capture* m_previous{};

	friend void write(Entry entry);
};

template <typename... Args>
void error(fmt::format_string<Args...> fmt, Args const&... args) {
	write({format(Level::eError, fmt::vformat(fmt, fmt::make_format_args(args...))), Level::eError});
}

template <typename... Args>
void warn(fmt::format_string<Args...> fmt, Args const&... args) {
	write({format(Level::eWarn, fmt::vformat(fmt, fmt::make_format_args(args...))), Level::eWarn});
}
} // namespace truthy::logger

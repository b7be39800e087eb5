#include <truthy/util/logger.hpp>
#include <fmt/chrono.h>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <utility>

namespace truthy {
namespace {
struct Sink {
	std::mutex mutex{};
	logger::Capture* capture{};
};

Sink g_sink{};
} // namespace

std::string logger::format(Level level, std::string_view const message) {
	auto const now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
	return fmt::format(fmt::runtime(g_format), fmt::arg("level", levels_v[static_cast<std::size_t>(level)]), fmt::arg("message", message),
					   fmt::arg("timestamp", fmt::localtime(now)));
}

void logger::write(Entry entry) {
	auto lock = std::scoped_lock{g_sink.mutex};
	if (g_sink.capture) {
		g_sink.capture->m_entries.push_back(std::move(entry));
		return;
	}
	std::fprintf(stderr, "%s\n", entry.message.c_str());
}

logger::Capture::Capture() {
	auto lock = std::scoped_lock{g_sink.mutex};
	m_previous = std::exchange(g_sink.capture, this);
}

logger::Capture::~Capture() {
	auto lock = std::scoped_lock{g_sink.mutex};
	g_sink.capture = m_previous;
}

std::vector<logger::Entry> logger::Capture::entries() const {
	auto lock = std::scoped_lock{g_sink.mutex};
	return m_entries;
}
} // namespace truthy

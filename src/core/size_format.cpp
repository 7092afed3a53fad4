#include "core/size_format.hpp"
#include <array>
#include <cmath>
#include <format>

namespace romscope {

std::string format_size(std::uint64_t byte_count) {
	static constexpr std::array<const char *, 4> UNITS = {"B", "KB", "MB", "GB"};

	std::size_t unit = 0;
	std::uint64_t divisor = 1;
	while (unit + 1 < UNITS.size() && byte_count / divisor >= 1024) {
		divisor *= 1024;
		++unit;
	}

	if (byte_count % divisor == 0) {
		return std::format("{} {}", byte_count / divisor, UNITS[unit]);
	}

	double value = static_cast<double>(byte_count) / static_cast<double>(divisor);
	// 1023.95 and up would print as "1024.0" in this unit
	if (std::round(value * 10.0) >= 10240.0 && unit + 1 < UNITS.size()) {
		divisor *= 1024;
		++unit;
		value = static_cast<double>(byte_count) / static_cast<double>(divisor);
	}
	return std::format("{:.1f} {}", value, UNITS[unit]);
}

} // namespace romscope

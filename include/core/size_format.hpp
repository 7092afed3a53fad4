#pragma once

#include <cstdint>
#include <string>

namespace romscope {

/**
 * Format a byte count for display: "0 B", "512 B", "32 KB", "1.5 MB"
 * Scales by 1024 up to GB. Whole values print without decimals,
 * everything else with one decimal place. A value that would print as
 * "1024.0" moves up to the next unit.
 */
[[nodiscard]] std::string format_size(std::uint64_t byte_count);

} // namespace romscope

#pragma once

#include "core/types.hpp"
#include <string_view>

namespace romscope {

/// Returned by mapper_name() for numbers missing from the table
constexpr std::string_view UNKNOWN_MAPPER_NAME = "Unknown/Custom";

/**
 * Human-readable board name for an iNES mapper number
 * @param mapper Mapper number (0-4095)
 * @return Name from the built-in table, or UNKNOWN_MAPPER_NAME
 */
[[nodiscard]] std::string_view mapper_name(Word mapper) noexcept;

} // namespace romscope

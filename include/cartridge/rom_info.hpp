#pragma once

#include "cartridge/ines_header.hpp"
#include "core/types.hpp"
#include <string>
#include <vector>

namespace romscope {

// Display names
const char *to_string(HeaderFormat format) noexcept;
const char *to_string(Mirroring mirroring) noexcept;
const char *to_string(ConsoleType console_type) noexcept;
const char *to_string(TvSystem tv_system) noexcept;
const char *to_string(RomRegion region) noexcept;

/**
 * One-line description of a load failure, e.g.
 * "File truncated: CHR ROM is smaller than indicated by header"
 */
std::string describe(const RomError &error);

/**
 * Cartridge summary as "Label: value" lines, in display order
 * (format, mapper, ROM/RAM sizes, mirroring, flags, console, TV system)
 */
std::vector<std::string> summary_lines(const InesHeader &header);

} // namespace romscope

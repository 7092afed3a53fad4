#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace romscope {

enum class HeaderFormat { INes1, Nes2 };

enum class Mirroring { Horizontal, Vertical, FourScreen };

enum class ConsoleType { Standard, VsSystem, PlayChoice10, Extended };

enum class TvSystem { NTSC, PAL, Multi, Unknown };

/**
 * Decoded iNES / NES 2.0 header
 * Produced once by parse_header() and never modified afterwards.
 * All sizes are in bytes.
 */
struct InesHeader {
	HeaderFormat format = HeaderFormat::INes1;

	Word mapper = 0;						// 8 bits for iNES 1.0, 12 bits for NES 2.0
	std::optional<std::uint8_t> submapper; // NES 2.0 only

	std::size_t prg_rom_size = 0;
	std::size_t chr_rom_size = 0;
	std::size_t prg_ram_size = 0;
	std::size_t prg_nvram_size = 0;
	std::size_t chr_ram_size = 0;
	std::size_t chr_nvram_size = 0;

	Mirroring mirroring = Mirroring::Horizontal;
	bool battery_backed = false;
	bool has_trainer = false;

	ConsoleType console_type = ConsoleType::Standard;
	TvSystem tv_system = TvSystem::NTSC;

	bool is_nes2() const noexcept {
		return format == HeaderFormat::Nes2;
	}

	bool uses_chr_ram() const noexcept {
		return chr_rom_size == 0;
	}

	bool operator==(const InesHeader &) const = default;
};

/**
 * Decode the 16-byte header at the start of an image
 * Only the first 16 bytes are inspected.
 * @param bytes Image bytes (at least 16)
 * @return Decoded header, or TOO_SHORT / BAD_MAGIC
 */
[[nodiscard]] RomResult<InesHeader> parse_header(std::span<const Byte> bytes);

/// True if flags7 bits 2-3 carry the NES 2.0 identifier (0b10)
[[nodiscard]] bool is_nes2_header(std::span<const Byte> bytes) noexcept;

/**
 * NES 2.0 RAM size field: 0 means none, otherwise 64 << shift bytes
 * Only the low nibble of shift is used.
 */
constexpr std::size_t decode_ram_size(std::uint8_t shift) noexcept {
	shift = low_nibble(shift);
	if (shift == 0) {
		return 0;
	}
	return std::size_t{64} << shift;
}

} // namespace romscope

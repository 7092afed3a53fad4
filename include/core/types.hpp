#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>

namespace romscope {

// =============================================================================
// Basic Types
// =============================================================================

/// 8-bit data value as stored in a ROM image
using Byte = std::uint8_t;

/// 16-bit value (mapper numbers, unit counts)
using Word = std::uint16_t;

// =============================================================================
// iNES Format Constants
// =============================================================================

/// iNES / NES 2.0 file layout
constexpr std::size_t INES_HEADER_SIZE = 16;
constexpr std::size_t TRAINER_SIZE = 512;
constexpr std::size_t PRG_ROM_UNIT_SIZE = 16384; // 16KB
constexpr std::size_t CHR_ROM_UNIT_SIZE = 8192;	 // 8KB
constexpr std::size_t PRG_RAM_UNIT_SIZE = 8192;	 // iNES 1.0 byte 8 units

/// Default work RAM / CHR RAM assumed for iNES 1.0 images that do not declare one
constexpr std::size_t DEFAULT_PRG_RAM_SIZE = 8192;
constexpr std::size_t DEFAULT_CHR_RAM_SIZE = 8192;

/// iNES magic number "NES\x1A"
constexpr std::array<Byte, 4> INES_MAGIC = {0x4E, 0x45, 0x53, 0x1A};

// =============================================================================
// Error Handling
// =============================================================================

/// Error types for ROM loading operations
enum class RomErrorCode {
	TOO_SHORT,
	BAD_MAGIC,
	TRUNCATED_TRAINER,
	TRUNCATED_ROM,
	FILE_READ_FAILED
};

/// Region of the image an error refers to
enum class RomRegion {
	NONE,
	TRAINER,
	PRG_ROM,
	CHR_ROM
};

struct RomError {
	RomErrorCode code;
	RomRegion region = RomRegion::NONE;

	bool operator==(const RomError &) const = default;
};

/// Result type for operations that can fail
template <typename T> using RomResult = std::expected<T, RomError>;

// =============================================================================
// Utility Functions
// =============================================================================

/// Extract low nibble (bits 0-3)
constexpr Byte low_nibble(Byte value) noexcept {
	return static_cast<Byte>(value & 0x0F);
}

/// Extract high nibble (bits 4-7)
constexpr Byte high_nibble(Byte value) noexcept {
	return static_cast<Byte>((value >> 4) & 0x0F);
}

/// Test a single bit
constexpr bool test_bit(Byte value, unsigned bit) noexcept {
	return ((value >> bit) & 0x01) != 0;
}

} // namespace romscope

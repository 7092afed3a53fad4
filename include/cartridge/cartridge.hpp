#pragma once

#include "cartridge/ines_header.hpp"
#include "core/types.hpp"
#include <array>
#include <optional>
#include <span>
#include <vector>

namespace romscope {

class Cartridge;

/**
 * Slice an image into trainer / PRG ROM / CHR ROM using an already parsed header
 * Every region is checked against the buffer before anything is copied.
 * @param bytes Whole image, header included
 * @param header Result of parse_header() on the same bytes
 * @return Cartridge owning copies of the regions, or TRUNCATED_TRAINER / TRUNCATED_ROM
 */
[[nodiscard]] RomResult<Cartridge> load_cartridge(std::span<const Byte> bytes, const InesHeader &header);

/**
 * NES Cartridge - validated header plus owned ROM data
 * Only load_cartridge() creates one, so every instance holds at least the
 * number of bytes its header declares. Read-only after construction.
 */
class Cartridge final {
  public:
	using RawHeader = std::array<Byte, INES_HEADER_SIZE>;

	const InesHeader &header() const noexcept {
		return header_;
	}
	const RawHeader &raw_header() const noexcept {
		return raw_header_;
	}

	bool has_trainer() const noexcept {
		return trainer_.has_value();
	}
	const std::optional<std::vector<Byte>> &trainer() const noexcept {
		return trainer_;
	}
	const std::vector<Byte> &prg_rom() const noexcept {
		return prg_rom_;
	}
	const std::vector<Byte> &chr_rom() const noexcept {
		return chr_rom_;
	}

	// CHR is backed by RAM when the image carries no CHR ROM
	bool uses_chr_ram() const noexcept {
		return chr_rom_.empty();
	}

  private:
	friend RomResult<Cartridge> load_cartridge(std::span<const Byte> bytes, const InesHeader &header);

	Cartridge(const InesHeader &header, const RawHeader &raw_header, std::optional<std::vector<Byte>> trainer,
			  std::vector<Byte> prg_rom, std::vector<Byte> chr_rom);

	InesHeader header_;
	RawHeader raw_header_;
	std::optional<std::vector<Byte>> trainer_;
	std::vector<Byte> prg_rom_;
	std::vector<Byte> chr_rom_;
};

} // namespace romscope

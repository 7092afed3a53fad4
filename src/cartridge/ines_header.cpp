#include "cartridge/ines_header.hpp"
#include <algorithm>

namespace romscope {

namespace {

// iNES 1.0 has no field for work RAM on these boards; assume the usual 8KB
constexpr std::array<Word, 2> MAPPERS_WITH_WORK_RAM = {1, 4};

bool has_default_work_ram(Word mapper) {
	return std::find(MAPPERS_WITH_WORK_RAM.begin(), MAPPERS_WITH_WORK_RAM.end(), mapper) !=
		   MAPPERS_WITH_WORK_RAM.end();
}

Mirroring decode_mirroring(Byte flags6) {
	if (test_bit(flags6, 3)) {
		return Mirroring::FourScreen;
	}
	return test_bit(flags6, 0) ? Mirroring::Vertical : Mirroring::Horizontal;
}

ConsoleType decode_console_type(Byte flags7) {
	switch (flags7 & 0x03) {
	case 1:
		return ConsoleType::VsSystem;
	case 2:
		return ConsoleType::PlayChoice10;
	case 3:
		return ConsoleType::Extended;
	default:
		return ConsoleType::Standard;
	}
}

TvSystem decode_nes2_tv_system(Byte byte12) {
	switch (byte12 & 0x03) {
	case 0:
		return TvSystem::NTSC;
	case 1:
		return TvSystem::PAL;
	case 2:
		return TvSystem::Multi;
	default:
		return TvSystem::Unknown;
	}
}

} // namespace

bool is_nes2_header(std::span<const Byte> bytes) noexcept {
	if (bytes.size() < 8) {
		return false;
	}
	return (bytes[7] & 0x0C) == 0x08;
}

RomResult<InesHeader> parse_header(std::span<const Byte> bytes) {
	if (bytes.size() < INES_HEADER_SIZE) {
		return std::unexpected(RomError{RomErrorCode::TOO_SHORT});
	}

	// Bytes 0-3: "NES\x1A"
	if (!std::equal(INES_MAGIC.begin(), INES_MAGIC.end(), bytes.begin())) {
		return std::unexpected(RomError{RomErrorCode::BAD_MAGIC});
	}

	const Byte flags6 = bytes[6];
	const Byte flags7 = bytes[7];
	const Byte byte8 = bytes[8];
	const Byte byte9 = bytes[9];

	InesHeader header{};
	header.format = is_nes2_header(bytes) ? HeaderFormat::Nes2 : HeaderFormat::INes1;

	// Mapper bits 0-3 from flags6, bits 4-7 from flags7
	header.mapper = static_cast<Word>(high_nibble(flags6) | (flags7 & 0xF0));

	// Bytes 4-5: ROM sizes in 16KB / 8KB units
	std::size_t prg_units = bytes[4];
	std::size_t chr_units = bytes[5];

	if (header.is_nes2()) {
		// Byte 8: mapper bits 8-11 and submapper
		header.mapper = static_cast<Word>(header.mapper | (low_nibble(byte8) << 8));
		header.submapper = high_nibble(byte8);

		// Byte 9: ROM size MSBs. The 0xF exponent-multiplier form is not decoded.
		prg_units |= static_cast<std::size_t>(low_nibble(byte9)) << 8;
		chr_units |= static_cast<std::size_t>(high_nibble(byte9)) << 8;
	}

	header.prg_rom_size = prg_units * PRG_ROM_UNIT_SIZE;
	header.chr_rom_size = chr_units * CHR_ROM_UNIT_SIZE;

	if (header.is_nes2()) {
		// Bytes 10-11: volatile / battery-backed RAM shift counts
		header.prg_ram_size = decode_ram_size(low_nibble(bytes[10]));
		header.prg_nvram_size = decode_ram_size(high_nibble(bytes[10]));
		header.chr_ram_size = decode_ram_size(low_nibble(bytes[11]));
		header.chr_nvram_size = decode_ram_size(high_nibble(bytes[11]));
	} else {
		if (byte8 != 0) {
			header.prg_ram_size = byte8 * PRG_RAM_UNIT_SIZE;
		} else if (has_default_work_ram(header.mapper)) {
			header.prg_ram_size = DEFAULT_PRG_RAM_SIZE;
		}
		if (header.chr_rom_size == 0) {
			header.chr_ram_size = DEFAULT_CHR_RAM_SIZE;
		}
	}

	// Byte 6: mirroring, battery, trainer, four-screen
	header.mirroring = decode_mirroring(flags6);
	header.battery_backed = test_bit(flags6, 1);
	header.has_trainer = test_bit(flags6, 2);

	// Byte 7: console type is a 2-bit field, not independent VS / PC10 flags
	header.console_type = decode_console_type(flags7);

	if (header.is_nes2()) {
		header.tv_system = decode_nes2_tv_system(bytes[12]);
	} else {
		header.tv_system = test_bit(byte9, 0) ? TvSystem::PAL : TvSystem::NTSC;
	}

	return header;
}

} // namespace romscope

// RomScope - iNES cartridge header decoder
// Test helper: builds synthetic iNES / NES 2.0 images in memory

#pragma once

#include "../include/core/types.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace romscope::test {

// Header (16 bytes) with the given fields; bytes 8-15 are zero unless set later
inline std::vector<uint8_t> build_header(uint8_t prg_units, uint8_t chr_units, uint8_t flags6 = 0x00,
										 uint8_t flags7 = 0x00) {
	std::vector<uint8_t> data = {0x4E, 0x45, 0x53, 0x1A, prg_units, chr_units, flags6, flags7};
	data.resize(16, 0x00);
	return data;
}

// Header + optional trainer + PRG ROM + CHR ROM with recognisable fill patterns:
// trainer bytes are 0xA5, PRG bytes count up from 0x00, CHR bytes count up from 0x80
inline std::vector<uint8_t> build_ines_rom(uint8_t prg_units, uint8_t chr_units, uint8_t flags6 = 0x00,
										   uint8_t flags7 = 0x00, bool include_trainer = false) {
	std::vector<uint8_t> data = build_header(prg_units, chr_units, flags6, flags7);

	if (include_trainer) {
		data.insert(data.end(), 512, 0xA5);
	}

	size_t prg_size = prg_units * 16384;
	for (size_t i = 0; i < prg_size; i++) {
		data.push_back(static_cast<uint8_t>(i & 0xFF));
	}

	size_t chr_size = chr_units * 8192;
	for (size_t i = 0; i < chr_size; i++) {
		data.push_back(static_cast<uint8_t>((i + 0x80) & 0xFF));
	}

	return data;
}

// Same as build_header but with the NES 2.0 identifier set in flags7
inline std::vector<uint8_t> build_nes2_header(uint8_t prg_units, uint8_t chr_units, uint8_t flags6 = 0x00,
											  uint8_t flags7 = 0x00) {
	return build_header(prg_units, chr_units, flags6, static_cast<uint8_t>((flags7 & 0xF3) | 0x08));
}

} // namespace romscope::test

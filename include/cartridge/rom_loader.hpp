#pragma once

#include "cartridge/cartridge.hpp"
#include "cartridge/ines_header.hpp"
#include "core/types.hpp"
#include <filesystem>
#include <span>
#include <vector>

namespace romscope {

/**
 * Utility class for loading NES ROM files in iNES / NES 2.0 format
 * The file is read once; everything after that is parse_header() followed
 * by load_cartridge() on the in-memory bytes.
 */
class RomLoader {
  public:
	/**
	 * Load a ROM file from disk
	 * @param filepath Path to the .nes file
	 * @return Cartridge, or the first error hit while reading, parsing or slicing
	 */
	static RomResult<Cartridge> load_rom(const std::filesystem::path &filepath);

	/**
	 * Parse and slice an image that is already in memory
	 * @param bytes Whole image, header included
	 */
	static RomResult<Cartridge> parse_rom(std::span<const Byte> bytes);

	/**
	 * Decode only the header of a ROM file
	 * Declared sizes are not checked against the file length.
	 */
	static RomResult<InesHeader> load_header(const std::filesystem::path &filepath);

	/**
	 * Validate that a file appears to be a valid iNES ROM
	 * @param filepath Path to check
	 * @return true if file has valid iNES header
	 */
	static bool is_valid_nes_file(const std::filesystem::path &filepath);

	/**
	 * Read an entire file into memory
	 * @return File contents, or FILE_READ_FAILED
	 */
	static RomResult<std::vector<Byte>> read_file(const std::filesystem::path &filepath);
};

} // namespace romscope

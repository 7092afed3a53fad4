#include "cartridge/rom_loader.hpp"
#include "cartridge/rom_info.hpp"
#include <fstream>
#include <iostream>
#include <system_error>

namespace romscope {

namespace {

void report_failure(const std::filesystem::path &filepath, const RomError &error) {
	std::cerr << "Failed to load ROM: " << filepath.string() << ": " << describe(error) << std::endl;
}

// Directories and devices open as streams on some platforms, so only regular files are read
RomResult<std::uintmax_t> regular_file_size(const std::filesystem::path &filepath) {
	std::error_code ec;
	if (!std::filesystem::is_regular_file(filepath, ec) || ec) {
		return std::unexpected(RomError{RomErrorCode::FILE_READ_FAILED});
	}
	const auto size = std::filesystem::file_size(filepath, ec);
	if (ec) {
		return std::unexpected(RomError{RomErrorCode::FILE_READ_FAILED});
	}
	return size;
}

} // namespace

RomResult<Cartridge> RomLoader::load_rom(const std::filesystem::path &filepath) {
	// Read entire file
	auto file_data = read_file(filepath);
	if (!file_data) {
		report_failure(filepath, file_data.error());
		return std::unexpected(file_data.error());
	}

	auto cartridge = parse_rom(*file_data);
	if (!cartridge) {
		report_failure(filepath, cartridge.error());
	}
	return cartridge;
}

RomResult<Cartridge> RomLoader::parse_rom(std::span<const Byte> bytes) {
	auto header = parse_header(bytes);
	if (!header) {
		return std::unexpected(header.error());
	}
	return load_cartridge(bytes, *header);
}

RomResult<InesHeader> RomLoader::load_header(const std::filesystem::path &filepath) {
	if (auto size = regular_file_size(filepath); !size) {
		report_failure(filepath, size.error());
		return std::unexpected(size.error());
	}

	std::ifstream file(filepath, std::ios::binary);
	if (!file.is_open()) {
		report_failure(filepath, RomError{RomErrorCode::FILE_READ_FAILED});
		return std::unexpected(RomError{RomErrorCode::FILE_READ_FAILED});
	}

	std::array<Byte, INES_HEADER_SIZE> header_bytes{};
	file.read(reinterpret_cast<char *>(header_bytes.data()), static_cast<std::streamsize>(header_bytes.size()));
	if (file.bad()) {
		report_failure(filepath, RomError{RomErrorCode::FILE_READ_FAILED});
		return std::unexpected(RomError{RomErrorCode::FILE_READ_FAILED});
	}

	const auto bytes_read = static_cast<std::size_t>(file.gcount());
	auto header = parse_header(std::span<const Byte>(header_bytes.data(), bytes_read));
	if (!header) {
		report_failure(filepath, header.error());
	}
	return header;
}

bool RomLoader::is_valid_nes_file(const std::filesystem::path &filepath) {
	auto file_data = read_file(filepath);
	if (!file_data) {
		return false;
	}
	return parse_header(*file_data).has_value();
}

RomResult<std::vector<Byte>> RomLoader::read_file(const std::filesystem::path &filepath) {
	auto file_size = regular_file_size(filepath);
	if (!file_size) {
		return std::unexpected(file_size.error());
	}
	const auto size = static_cast<std::size_t>(*file_size);

	std::ifstream file(filepath, std::ios::binary);
	if (!file.is_open()) {
		return std::unexpected(RomError{RomErrorCode::FILE_READ_FAILED});
	}

	// Read entire file
	std::vector<Byte> data(size);
	file.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(size));
	if (static_cast<std::size_t>(file.gcount()) != size) {
		return std::unexpected(RomError{RomErrorCode::FILE_READ_FAILED});
	}

	return data;
}

} // namespace romscope

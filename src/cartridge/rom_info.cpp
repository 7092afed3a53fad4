#include "cartridge/rom_info.hpp"
#include "cartridge/mapper_names.hpp"
#include "core/size_format.hpp"
#include <format>
#include <utility>

namespace romscope {

const char *to_string(HeaderFormat format) noexcept {
	switch (format) {
	case HeaderFormat::INes1:
		return "iNES 1.0";
	case HeaderFormat::Nes2:
		return "NES 2.0";
	}
	return "Unknown";
}

const char *to_string(Mirroring mirroring) noexcept {
	switch (mirroring) {
	case Mirroring::Horizontal:
		return "Horizontal";
	case Mirroring::Vertical:
		return "Vertical";
	case Mirroring::FourScreen:
		return "Four Screen";
	}
	return "Unknown";
}

const char *to_string(ConsoleType console_type) noexcept {
	switch (console_type) {
	case ConsoleType::Standard:
		return "NES/Famicom";
	case ConsoleType::VsSystem:
		return "VS System";
	case ConsoleType::PlayChoice10:
		return "PlayChoice-10";
	case ConsoleType::Extended:
		return "Extended";
	}
	return "Unknown";
}

const char *to_string(TvSystem tv_system) noexcept {
	switch (tv_system) {
	case TvSystem::NTSC:
		return "NTSC";
	case TvSystem::PAL:
		return "PAL";
	case TvSystem::Multi:
		return "Multi-region";
	case TvSystem::Unknown:
		return "Unknown";
	}
	return "Unknown";
}

const char *to_string(RomRegion region) noexcept {
	switch (region) {
	case RomRegion::NONE:
		return "none";
	case RomRegion::TRAINER:
		return "Trainer";
	case RomRegion::PRG_ROM:
		return "PRG ROM";
	case RomRegion::CHR_ROM:
		return "CHR ROM";
	}
	return "unknown";
}

std::string describe(const RomError &error) {
	switch (error.code) {
	case RomErrorCode::TOO_SHORT:
		return "File too small to contain an iNES header";
	case RomErrorCode::BAD_MAGIC:
		return "Missing NES<1A> magic; not an iNES/NES 2.0 ROM";
	case RomErrorCode::TRUNCATED_TRAINER:
		return "Header indicates trainer but file is too small";
	case RomErrorCode::TRUNCATED_ROM:
		return std::format("File truncated: {} is smaller than indicated by header", to_string(error.region));
	case RomErrorCode::FILE_READ_FAILED:
		return "Unable to read ROM file";
	}
	return "Unknown error";
}

std::vector<std::string> summary_lines(const InesHeader &header) {
	std::vector<std::string> lines;

	lines.push_back(std::format("Format: {}", to_string(header.format)));

	std::string mapper_line = std::format("Mapper: {} ({})", header.mapper, mapper_name(header.mapper));
	if (header.submapper) {
		mapper_line += std::format("  Submapper: {}", *header.submapper);
	}
	lines.push_back(std::move(mapper_line));

	lines.push_back(std::format("PRG-ROM: {}", format_size(header.prg_rom_size)));
	lines.push_back(std::format("CHR-ROM: {}{}", format_size(header.chr_rom_size),
								header.uses_chr_ram() ? " (uses CHR-RAM)" : ""));
	lines.push_back(std::format("PRG-RAM: {}", format_size(header.prg_ram_size)));
	lines.push_back(std::format("PRG-NVRAM: {}", format_size(header.prg_nvram_size)));
	lines.push_back(std::format("CHR-RAM: {}", format_size(header.chr_ram_size)));
	lines.push_back(std::format("CHR-NVRAM: {}", format_size(header.chr_nvram_size)));

	lines.push_back(std::format("Mirroring: {}", to_string(header.mirroring)));
	lines.push_back(std::format("Battery: {}", header.battery_backed ? "Yes" : "No"));
	lines.push_back(std::format("Trainer: {}", header.has_trainer ? "Yes" : "No"));
	lines.push_back(std::format("Console: {}", to_string(header.console_type)));
	lines.push_back(std::format("TV System: {}", to_string(header.tv_system)));

	return lines;
}

} // namespace romscope

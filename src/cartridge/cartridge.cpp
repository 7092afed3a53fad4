#include "cartridge/cartridge.hpp"
#include <algorithm>
#include <utility>

namespace romscope {

namespace {

struct Region {
	std::size_t offset;
	std::size_t size;
};

bool fits(std::span<const Byte> bytes, const Region &region) {
	// offset never exceeds bytes.size(), so this cannot overflow
	return region.size <= bytes.size() - region.offset;
}

std::vector<Byte> copy_region(std::span<const Byte> bytes, const Region &region) {
	auto slice = bytes.subspan(region.offset, region.size);
	return std::vector<Byte>(slice.begin(), slice.end());
}

} // namespace

Cartridge::Cartridge(const InesHeader &header, const RawHeader &raw_header, std::optional<std::vector<Byte>> trainer,
					 std::vector<Byte> prg_rom, std::vector<Byte> chr_rom)
	: header_(header), raw_header_(raw_header), trainer_(std::move(trainer)), prg_rom_(std::move(prg_rom)),
	  chr_rom_(std::move(chr_rom)) {
}

RomResult<Cartridge> load_cartridge(std::span<const Byte> bytes, const InesHeader &header) {
	if (bytes.size() < INES_HEADER_SIZE) {
		return std::unexpected(RomError{RomErrorCode::TOO_SHORT});
	}

	// Lay out every region first, then validate, then copy
	std::size_t offset = INES_HEADER_SIZE;

	const Region trainer{offset, header.has_trainer ? TRAINER_SIZE : 0};
	if (!fits(bytes, trainer)) {
		return std::unexpected(RomError{RomErrorCode::TRUNCATED_TRAINER, RomRegion::TRAINER});
	}
	offset += trainer.size;

	const Region prg{offset, header.prg_rom_size};
	if (!fits(bytes, prg)) {
		return std::unexpected(RomError{RomErrorCode::TRUNCATED_ROM, RomRegion::PRG_ROM});
	}
	offset += prg.size;

	const Region chr{offset, header.chr_rom_size};
	if (!fits(bytes, chr)) {
		return std::unexpected(RomError{RomErrorCode::TRUNCATED_ROM, RomRegion::CHR_ROM});
	}

	Cartridge::RawHeader raw_header{};
	std::copy_n(bytes.begin(), INES_HEADER_SIZE, raw_header.begin());

	std::optional<std::vector<Byte>> trainer_data;
	if (header.has_trainer) {
		trainer_data = copy_region(bytes, trainer);
	}

	return Cartridge(header, raw_header, std::move(trainer_data), copy_region(bytes, prg), copy_region(bytes, chr));
}

} // namespace romscope

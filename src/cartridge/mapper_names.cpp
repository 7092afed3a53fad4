#include "cartridge/mapper_names.hpp"
#include <algorithm>
#include <array>

namespace romscope {

namespace {

struct MapperEntry {
	Word id;
	std::string_view name;
};

// Sorted by id
constexpr std::array MAPPER_TABLE = {
	MapperEntry{0, "NROM"},					// Super Mario Bros, Donkey Kong
	MapperEntry{1, "MMC1 (SxROM)"},			// Zelda, Metroid
	MapperEntry{2, "UNROM (UxROM)"},		// Mega Man, Castlevania
	MapperEntry{3, "CNROM (CxROM)"},		// Q*bert, Solomon's Key
	MapperEntry{4, "MMC3 (TxROM)"},			// Super Mario Bros 3
	MapperEntry{5, "MMC5 (ExROM)"},			// Castlevania III
	MapperEntry{7, "AOROM (AxROM)"},		// Battletoads
	MapperEntry{9, "MMC2 (PxROM)"},			// Punch-Out!!
	MapperEntry{10, "MMC4 (FxROM)"},		// Fire Emblem
	MapperEntry{11, "Color Dreams"},
	MapperEntry{13, "CPROM"},				// Videomation
	MapperEntry{15, "100-in-1"},
	MapperEntry{66, "GxROM/MxROM"},			// Super Mario Bros + Duck Hunt
	MapperEntry{69, "FME-7 / Sunsoft 5"},	// Batman: Return of the Joker
	MapperEntry{71, "Camerica (BF909x)"},	// Micro Machines
	MapperEntry{73, "VRC3"},				// Salamander
	MapperEntry{75, "VRC1"},
	MapperEntry{76, "VRC4"},
	MapperEntry{78, "Irem 74HC161/32"},
	MapperEntry{79, "NINA-003/006"},
	MapperEntry{85, "VRC7"},				// Lagrange Point
	MapperEntry{87, "VRC2"},
	MapperEntry{94, "HVC-UN1ROM"},			// Senjou no Ookami
	MapperEntry{118, "TxSROM"},
	MapperEntry{119, "TQROM"},				// Pinbot
	MapperEntry{210, "Namco 129/163"},
};

static_assert(std::is_sorted(MAPPER_TABLE.begin(), MAPPER_TABLE.end(),
							 [](const MapperEntry &a, const MapperEntry &b) { return a.id < b.id; }),
			  "MAPPER_TABLE must be sorted by id");

} // namespace

std::string_view mapper_name(Word mapper) noexcept {
	auto it = std::lower_bound(MAPPER_TABLE.begin(), MAPPER_TABLE.end(), mapper,
							   [](const MapperEntry &entry, Word id) { return entry.id < id; });
	if (it == MAPPER_TABLE.end() || it->id != mapper) {
		return UNKNOWN_MAPPER_NAME;
	}
	return it->name;
}

} // namespace romscope

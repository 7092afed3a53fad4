// RomScope - iNES cartridge header decoder
// Core Types Tests
// Tests for format constants, error values and bit helpers

#include "../../include/core/types.hpp"
#include <catch2/catch_all.hpp>

using namespace romscope;

TEST_CASE("Format Constants", "[types][core]") {
	SECTION("iNES magic is NES followed by MS-DOS EOF") {
		REQUIRE(INES_MAGIC[0] == 'N');
		REQUIRE(INES_MAGIC[1] == 'E');
		REQUIRE(INES_MAGIC[2] == 'S');
		REQUIRE(INES_MAGIC[3] == 0x1A);
	}

	SECTION("Layout sizes") {
		REQUIRE(INES_HEADER_SIZE == 16);
		REQUIRE(TRAINER_SIZE == 512);
		REQUIRE(PRG_ROM_UNIT_SIZE == 16 * 1024);
		REQUIRE(CHR_ROM_UNIT_SIZE == 8 * 1024);
	}
}

TEST_CASE("Error Values", "[types][core]") {
	SECTION("Region defaults to NONE") {
		RomError error{RomErrorCode::BAD_MAGIC};
		REQUIRE(error.region == RomRegion::NONE);
	}

	SECTION("Equality compares code and region") {
		RomError prg{RomErrorCode::TRUNCATED_ROM, RomRegion::PRG_ROM};
		RomError chr{RomErrorCode::TRUNCATED_ROM, RomRegion::CHR_ROM};
		RomError prg_again{RomErrorCode::TRUNCATED_ROM, RomRegion::PRG_ROM};
		REQUIRE(prg != chr);
		REQUIRE(prg == prg_again);
	}

	SECTION("RomResult carries either value or error") {
		RomResult<int> ok = 42;
		RomResult<int> failed = std::unexpected(RomError{RomErrorCode::TOO_SHORT});
		REQUIRE(ok.has_value());
		REQUIRE(*ok == 42);
		REQUIRE_FALSE(failed.has_value());
		REQUIRE(failed.error().code == RomErrorCode::TOO_SHORT);
	}
}

TEST_CASE("Bit Helpers", "[types][core]") {
	SECTION("Nibble extraction") {
		REQUIRE(low_nibble(0xA5) == 0x05);
		REQUIRE(high_nibble(0xA5) == 0x0A);
		REQUIRE(low_nibble(0x00) == 0x00);
		REQUIRE(high_nibble(0xFF) == 0x0F);
	}

	SECTION("Single bit test") {
		REQUIRE(test_bit(0x01, 0));
		REQUIRE_FALSE(test_bit(0x01, 1));
		REQUIRE(test_bit(0x80, 7));
		REQUIRE(test_bit(0x08, 3));
	}

	SECTION("Helpers are constexpr") {
		static_assert(low_nibble(0x3C) == 0x0C);
		static_assert(high_nibble(0x3C) == 0x03);
		static_assert(test_bit(0x04, 2));
	}
}

// RomScope - iNES cartridge header decoder
// Size Formatter Tests

#include "../../include/core/size_format.hpp"
#include <catch2/catch_all.hpp>

using namespace romscope;

TEST_CASE("Size Formatter - Bytes", "[core][format]") {
	REQUIRE(format_size(0) == "0 B");
	REQUIRE(format_size(1) == "1 B");
	REQUIRE(format_size(512) == "512 B");
	REQUIRE(format_size(1023) == "1023 B");
}

TEST_CASE("Size Formatter - Scaling at 1024", "[core][format]") {
	SECTION("Whole units print as integers") {
		REQUIRE(format_size(1024) == "1 KB");
		REQUIRE(format_size(8192) == "8 KB");
		REQUIRE(format_size(32768) == "32 KB");
		REQUIRE(format_size(1048576) == "1 MB");
		REQUIRE(format_size(1073741824ULL) == "1 GB");
	}

	SECTION("Fractional values get one decimal place") {
		REQUIRE(format_size(1536) == "1.5 KB");
		REQUIRE(format_size(1100) == "1.1 KB");
		REQUIRE(format_size(1572864) == "1.5 MB");
		REQUIRE(format_size(2684354560ULL) == "2.5 GB");
	}

	SECTION("Values that round up to 1024 move to the next unit") {
		REQUIRE(format_size(1048575) == "1.0 MB");
		REQUIRE(format_size(1048525) == "1.0 MB");
		REQUIRE(format_size(1073741823ULL) == "1.0 GB");
		REQUIRE(format_size(1048500) == "1023.9 KB");
	}

	SECTION("GB is the largest unit") {
		REQUIRE(format_size(2048ULL * 1073741824ULL) == "2048 GB");
		REQUIRE(format_size(2048ULL * 1073741824ULL - 1) == "2048.0 GB");
	}
}

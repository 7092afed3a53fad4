#include "cli/command_line.hpp"
#include "cartridge/cartridge.hpp"
#include "cartridge/rom_info.hpp"
#include "cartridge/rom_loader.hpp"
#include "core/size_format.hpp"

namespace romscope {

namespace {

void print_header(std::ostream &out, const InesHeader &header) {
	for (const auto &line : summary_lines(header)) {
		out << "  " << line << "\n";
	}
}

void print_cartridge(std::ostream &out, const Cartridge &cartridge) {
	print_header(out, cartridge.header());
	if (cartridge.has_trainer()) {
		out << "  Trainer data: " << format_size(cartridge.trainer()->size()) << "\n";
	}
	out << "  Data loaded: PRG " << format_size(cartridge.prg_rom().size()) << ", CHR "
		<< format_size(cartridge.chr_rom().size()) << "\n";
}

bool inspect_file(const std::filesystem::path &filepath, const Options &options, std::ostream &out) {
	if (options.header_only) {
		auto header = RomLoader::load_header(filepath);
		if (!header) {
			return false;
		}
		if (!options.quiet) {
			out << filepath.string() << "\n";
			print_header(out, *header);
		}
		return true;
	}

	auto cartridge = RomLoader::load_rom(filepath);
	if (!cartridge) {
		return false;
	}
	if (!options.quiet) {
		out << filepath.string() << "\n";
		print_cartridge(out, *cartridge);
	}
	return true;
}

} // namespace

ParseResult parse_options(const std::vector<std::string> &args) {
	ParseResult result;

	for (const auto &arg : args) {
		if (arg == "-h" || arg == "--help") {
			result.status = ParseStatus::Help;
			return result;
		} else if (arg == "-q" || arg == "--quiet") {
			result.options.quiet = true;
		} else if (arg == "--header-only") {
			result.options.header_only = true;
		} else if (arg.size() > 1 && arg[0] == '-') {
			result.status = ParseStatus::UsageError;
			result.error = "Unknown option: " + arg;
			return result;
		} else {
			result.options.files.emplace_back(arg);
		}
	}

	if (result.options.files.empty()) {
		result.status = ParseStatus::UsageError;
		result.error = "No ROM files given";
	}
	return result;
}

int exit_code(ParseStatus status) {
	switch (status) {
	case ParseStatus::Help:
	case ParseStatus::Run:
		return EXIT_ALL_LOADED;
	case ParseStatus::UsageError:
		return EXIT_USAGE_ERROR;
	}
	return EXIT_USAGE_ERROR;
}

void print_usage(std::ostream &out, std::string_view program) {
	out << "Usage: " << program << " [options] <rom.nes>...\n"
		<< "Decode iNES / NES 2.0 cartridge headers.\n\n"
		<< "Options:\n"
		<< "  -h, --help       Show this help\n"
		<< "  -q, --quiet      Only report errors\n"
		<< "  --header-only    Decode the header without checking ROM data length\n";
}

int inspect_files(const Options &options, std::ostream &out) {
	bool all_loaded = true;
	for (std::size_t i = 0; i < options.files.size(); ++i) {
		if (i > 0 && !options.quiet) {
			out << "\n";
		}
		if (!inspect_file(options.files[i], options, out)) {
			all_loaded = false;
		}
	}
	return all_loaded ? EXIT_ALL_LOADED : EXIT_LOAD_FAILED;
}

} // namespace romscope

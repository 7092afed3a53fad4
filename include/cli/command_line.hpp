#pragma once

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace romscope {

// Process exit codes
constexpr int EXIT_ALL_LOADED = 0;
constexpr int EXIT_LOAD_FAILED = 1;
constexpr int EXIT_USAGE_ERROR = 2;

struct Options {
	bool quiet = false;
	bool header_only = false;
	std::vector<std::filesystem::path> files;
};

enum class ParseStatus {
	Run,		// Options are complete, inspect the files
	Help,		// -h / --help was given
	UsageError, // Unknown option or no files
};

struct ParseResult {
	ParseStatus status = ParseStatus::Run;
	Options options;
	std::string error; // Set for UsageError
};

/**
 * Parse command-line arguments, program name excluded
 * Parsing stops at the first -h/--help or unknown option. A lone "-" is
 * taken as a file name.
 */
[[nodiscard]] ParseResult parse_options(const std::vector<std::string> &args);

// Exit code for a parse that does not go on to inspect files
[[nodiscard]] int exit_code(ParseStatus status);

void print_usage(std::ostream &out, std::string_view program);

/**
 * Inspect every file in options.files, printing summaries to out
 * Load failures are logged to std::cerr by RomLoader.
 * @return EXIT_ALL_LOADED if every file loaded, EXIT_LOAD_FAILED otherwise
 */
int inspect_files(const Options &options, std::ostream &out);

} // namespace romscope

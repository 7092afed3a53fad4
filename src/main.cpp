#include "cli/command_line.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace romscope;

int main(int argc, char *argv[]) {
	const std::vector<std::string> args(argv + 1, argv + argc);
	const auto parsed = parse_options(args);

	switch (parsed.status) {
	case ParseStatus::Help:
		print_usage(std::cout, argv[0]);
		return exit_code(parsed.status);
	case ParseStatus::UsageError:
		std::cerr << parsed.error << std::endl;
		print_usage(std::cout, argv[0]);
		return exit_code(parsed.status);
	case ParseStatus::Run:
		break;
	}

	return inspect_files(parsed.options, std::cout);
}

#pragma once
#include <string>

#include "compressor.hpp"

/*
Command-line front-end. main() only forwards to run_cli, so the parsing and
the exit-code contract can be exercised without spawning a process.

Exit codes: 0 success, 1 runtime error (I/O, bad image, no GPU), 2 usage error.
*/

struct CliConfig {
	std::string in_path, out_path;
	float strength = 0.5f;
	int jpeg_quality = 100;
	bool use_gpu = false;
	bool verbose = false;
	CompressOptions options;
};

// Returns false on a malformed command line, including numeric values with
// trailing garbage or out of range.
bool parse_args(int argc, const char* const* argv, CliConfig& cfg);

void print_usage(const char* argv0);

int run_cli(int argc, const char* const* argv);

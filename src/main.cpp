// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice,
//    this list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
// ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
// LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
// CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
// SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
// CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
// ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
// POSSIBILITY OF SUCH DAMAGE.

/**
 * @file main.cpp
 * @brief Load tester entry point
 *
 * Parses the command line, layers option overrides on top of the
 * configuration file and runs one load test.
 */

#include <kcenon/database_load_tester/core/load_test_config.h>
#include <kcenon/database_load_tester/load_test_app.h>

#include <cstring>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace
{

using database_load_tester::core::seconds_to_milliseconds;

constexpr const char* VERSION = "0.1.0";
constexpr const char* DEFAULT_CONFIG = "load_test.conf";

void print_usage(const char* program_name)
{
	std::cout << "Database Load Tester v" << VERSION << "\n\n";
	std::cout << "Usage: " << program_name << " [options]\n\n";
	std::cout << "Options:\n";
	std::cout << "  -c, --config <file>    Path to configuration file (default: " << DEFAULT_CONFIG
			  << ")\n";
	std::cout << "  --mode <mode>          full, insert-only, select-only, update-only,\n";
	std::cout << "                         delete-only or mixed\n";
	std::cout << "  --workers <n>          Number of concurrent workers\n";
	std::cout << "  --duration <seconds>   Measured test duration\n";
	std::cout << "  --warmup <seconds>     Unmeasured warm-up period\n";
	std::cout << "  --ramp-up <seconds>    Window over which workers start\n";
	std::cout << "  --target-tps <rate>    Transaction rate limit (0 = unlimited)\n";
	std::cout << "  --min-pool <n>         Minimum pool size\n";
	std::cout << "  --max-pool <n>         Maximum pool size\n";
	std::cout << "  --batch-size <n>       Rows per insert transaction (default: 1)\n";
	std::cout << "  --log-level <level>    debug, info, warn, warning or error\n";
	std::cout << "  --set <key=value>      Set any configuration key\n";
	std::cout << "  -h, --help             Show this help message\n";
	std::cout << "  -v, --version          Show version information\n";
	std::cout << "\n";
	std::cout << "Configuration file format (key=value):\n";
	std::cout << "  workload.mode=mixed\n";
	std::cout << "  workload.worker_count=32\n";
	std::cout << "  workload.duration_ms=60000\n";
	std::cout << "  pool.min_connections=16\n";
	std::cout << "  pool.max_connections=32\n";
	std::cout << "  adapter.type=simulated\n";
	std::cout << "  logging.level=info\n";
}

void print_version()
{
	std::cout << "Database Load Tester v" << VERSION << "\n";
	std::cout << "Part of the kcenon unified system\n";
}

} // namespace

int main(int argc, char* argv[])
{
	std::string config_path = DEFAULT_CONFIG;
	bool config_given = false;
	std::vector<std::pair<std::string, std::string>> overrides;

	// Parse command-line arguments
	for (int i = 1; i < argc; ++i)
	{
		if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0)
		{
			print_usage(argv[0]);
			return 0;
		}

		if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0)
		{
			print_version();
			return 0;
		}

		if (i + 1 >= argc)
		{
			std::cerr << "Missing value or unknown option: " << argv[i] << "\n";
			std::cerr << "Use --help for usage information.\n";
			return 1;
		}

		const char* option = argv[i];
		std::string value = argv[++i];

		if (std::strcmp(option, "-c") == 0 || std::strcmp(option, "--config") == 0)
		{
			config_path = value;
			config_given = true;
		}
		else if (std::strcmp(option, "--mode") == 0)
		{
			overrides.emplace_back("workload.mode", value);
		}
		else if (std::strcmp(option, "--workers") == 0)
		{
			overrides.emplace_back("workload.worker_count", value);
		}
		else if (std::strcmp(option, "--duration") == 0)
		{
			overrides.emplace_back("workload.duration_ms", seconds_to_milliseconds(value));
		}
		else if (std::strcmp(option, "--warmup") == 0)
		{
			overrides.emplace_back("workload.warm_up_ms", seconds_to_milliseconds(value));
		}
		else if (std::strcmp(option, "--ramp-up") == 0)
		{
			overrides.emplace_back("workload.ramp_up_ms", seconds_to_milliseconds(value));
		}
		else if (std::strcmp(option, "--target-tps") == 0)
		{
			overrides.emplace_back("workload.target_tps", value);
		}
		else if (std::strcmp(option, "--min-pool") == 0)
		{
			overrides.emplace_back("pool.min_connections", value);
		}
		else if (std::strcmp(option, "--max-pool") == 0)
		{
			overrides.emplace_back("pool.max_connections", value);
		}
		else if (std::strcmp(option, "--batch-size") == 0)
		{
			overrides.emplace_back("workload.batch_size", value);
		}
		else if (std::strcmp(option, "--log-level") == 0)
		{
			overrides.emplace_back("logging.level", value);
		}
		else if (std::strcmp(option, "--set") == 0)
		{
			auto delimiter_pos = value.find('=');
			if (delimiter_pos == std::string::npos)
			{
				std::cerr << "--set expects key=value, got: " << value << "\n";
				return 1;
			}
			overrides.emplace_back(value.substr(0, delimiter_pos), value.substr(delimiter_pos + 1));
		}
		else
		{
			std::cerr << "Unknown option: " << option << "\n";
			std::cerr << "Use --help for usage information.\n";
			return 1;
		}
	}

	// Try to load config file, fall back to defaults if the default file is absent
	database_load_tester::core::load_test_config config;
	auto loaded = database_load_tester::core::load_test_config::load_from_file(config_path);
	if (loaded.is_ok())
	{
		config = loaded.value();
	}
	else if (config_given)
	{
		std::cerr << loaded.error().message << "\n";
		return 1;
	}
	else
	{
		std::cout << "Using default configuration\n";
		config = database_load_tester::core::load_test_config::default_config();
	}

	for (const auto& [key, value] : overrides)
	{
		auto applied = config.apply_override(key, value);
		if (applied.is_err())
		{
			std::cerr << applied.error().message << "\n";
			return 1;
		}
	}

	database_load_tester::load_test_app app;
	auto init_result = app.initialize(config);
	if (init_result.is_err())
	{
		std::cerr << "Failed to initialize load tester: " << init_result.error().message << "\n";
		return 1;
	}

	return app.run();
}

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

#include <kcenon/database_load_tester/core/load_test_config.h>

#include <kcenon/database_load_tester/logging/console_logger.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>

namespace database_load_tester::core
{

namespace
{

constexpr int unknown_key_code = -711;
constexpr int invalid_value_code = -712;

void trim(std::string& s)
{
	s.erase(0, s.find_first_not_of(" \t\r\n"));
	s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

kcenon::common::error_info invalid_value(const std::string& key, const std::string& value)
{
	return kcenon::common::error_info{invalid_value_code,
									  "Invalid value for " + key + ": '" + value + "'",
									  "load_test_config"};
}

// Whole-string numeric parse; std::sto* accept trailing garbage on their own
template <typename T, typename Parser>
bool parse_number(const std::string& value, T& out, Parser parser)
{
	try
	{
		size_t consumed = 0;
		auto parsed = parser(value, &consumed);
		if (consumed != value.size())
		{
			return false;
		}
		out = static_cast<T>(parsed);
		return true;
	}
	catch (const std::exception&)
	{
		return false;
	}
}

bool parse_unsigned(const std::string& value, uint64_t& out)
{
	if (value.empty() || value[0] == '-')
	{
		return false;
	}
	return parse_number(value, out,
						[](const std::string& s, size_t* pos) { return std::stoull(s, pos); });
}

bool parse_unsigned_at_most(const std::string& value, uint64_t limit, uint64_t& out)
{
	return parse_unsigned(value, out) && out <= limit;
}

bool parse_signed(const std::string& value, int64_t& out)
{
	return parse_number(value, out,
						[](const std::string& s, size_t* pos) { return std::stoll(s, pos); });
}

bool parse_double(const std::string& value, double& out)
{
	return parse_number(value, out,
						[](const std::string& s, size_t* pos) { return std::stod(s, pos); });
}

bool parse_bool(const std::string& value, bool& out)
{
	if (value == "true" || value == "1" || value == "yes")
	{
		out = true;
		return true;
	}
	if (value == "false" || value == "0" || value == "no")
	{
		out = false;
		return true;
	}
	return false;
}

} // namespace

kcenon::common::Result<load_test_config> load_test_config::load_from_file(const std::string& path)
{
	if (!std::filesystem::exists(path))
	{
		return kcenon::common::error_info{-1, "Configuration file not found: " + path,
										  "load_test_config"};
	}

	std::ifstream file(path);
	if (!file.is_open())
	{
		return kcenon::common::error_info{-1, "Cannot open configuration file: " + path,
										  "load_test_config"};
	}

	load_test_config config = default_config();

	std::string line;
	size_t line_number = 0;
	while (std::getline(file, line))
	{
		++line_number;
		trim(line);

		// Skip comments and empty lines
		if (line.empty() || line[0] == '#')
		{
			continue;
		}

		auto delimiter_pos = line.find('=');
		if (delimiter_pos == std::string::npos)
		{
			continue;
		}

		std::string key = line.substr(0, delimiter_pos);
		std::string value = line.substr(delimiter_pos + 1);
		trim(key);
		trim(value);

		auto applied = config.apply_override(key, value);
		if (applied.is_err() && applied.error().code != unknown_key_code)
		{
			return kcenon::common::error_info{applied.error().code,
											  path + ":" + std::to_string(line_number) + ": "
												  + applied.error().message,
											  "load_test_config"};
		}
	}

	return config;
}

load_test_config load_test_config::default_config()
{
	load_test_config config;
	// All defaults are set in the struct definitions
	return config;
}

kcenon::common::VoidResult load_test_config::apply_override(const std::string& key,
															const std::string& value)
{
	uint64_t u = 0;
	int64_t i = 0;
	double d = 0.0;
	bool b = false;

	constexpr auto max_ms
		= static_cast<uint64_t>(std::numeric_limits<std::chrono::milliseconds::rep>::max());
	constexpr auto max_u32 = static_cast<uint64_t>(std::numeric_limits<uint32_t>::max());

	auto as_ms = [&](std::chrono::milliseconds& target) -> bool
	{
		if (!parse_unsigned_at_most(value, max_ms, u))
		{
			return false;
		}
		target = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(u));
		return true;
	};

	bool ok = true;

	if (key == "name")
	{
		name = value;
	}
	// Adapter
	else if (key == "adapter.type")
	{
		adapter.type = value;
	}
	else if (key == "adapter.table_name")
	{
		adapter.table_name = value;
	}
	else if (key == "adapter.latency_us")
	{
		ok = parse_unsigned_at_most(value, max_u32, u);
		if (ok)
		{
			adapter.latency_us = static_cast<uint32_t>(u);
		}
	}
	else if (key == "adapter.latency_jitter_us")
	{
		ok = parse_unsigned_at_most(value, max_u32, u);
		if (ok)
		{
			adapter.latency_jitter_us = static_cast<uint32_t>(u);
		}
	}
	else if (key == "adapter.failure_rate")
	{
		ok = parse_double(value, d);
		if (ok)
		{
			adapter.failure_rate = d;
		}
	}
	// Pool
	else if (key == "pool.min_connections")
	{
		ok = parse_unsigned(value, u);
		if (ok)
		{
			pool.min_connections = static_cast<size_t>(u);
		}
	}
	else if (key == "pool.max_connections")
	{
		ok = parse_unsigned(value, u);
		if (ok)
		{
			pool.max_connections = static_cast<size_t>(u);
		}
	}
	else if (key == "pool.max_lifetime_ms")
	{
		ok = as_ms(pool.max_lifetime);
	}
	else if (key == "pool.idle_timeout_ms")
	{
		ok = as_ms(pool.idle_timeout);
	}
	else if (key == "pool.keepalive_time_ms")
	{
		ok = as_ms(pool.keepalive_time);
	}
	else if (key == "pool.leak_detection_threshold_ms")
	{
		ok = as_ms(pool.leak_detection_threshold);
	}
	else if (key == "pool.health_check_interval_ms")
	{
		ok = as_ms(pool.health_check_interval);
	}
	else if (key == "pool.acquire_wait_ms")
	{
		ok = as_ms(pool.acquire_wait);
	}
	else if (key == "pool.validate_idle")
	{
		ok = parse_bool(value, pool.validate_idle);
	}
	else if (key == "pool.enable_health_checks")
	{
		ok = parse_bool(value, pool.enable_health_checks);
	}
	else if (key == "pool.abort_on_empty_warm_up")
	{
		ok = parse_bool(value, workload.abort_on_empty_warm_up);
	}
	// Workload
	else if (key == "workload.mode")
	{
		auto parsed = ::database_load_tester::workload::parse_operation_mode(value);
		ok = parsed.has_value();
		if (ok)
		{
			workload.mode = *parsed;
		}
	}
	else if (key == "workload.worker_count")
	{
		ok = parse_unsigned(value, u);
		if (ok)
		{
			workload.worker_count = static_cast<size_t>(u);
		}
	}
	else if (key == "workload.duration_ms")
	{
		ok = as_ms(workload.duration);
	}
	else if (key == "workload.warm_up_ms")
	{
		ok = as_ms(workload.warm_up);
	}
	else if (key == "workload.ramp_up_ms")
	{
		ok = as_ms(workload.ramp_up);
	}
	else if (key == "workload.target_tps")
	{
		ok = parse_double(value, d);
		if (ok)
		{
			workload.target_tps = d;
		}
	}
	else if (key == "workload.payload_size")
	{
		ok = parse_unsigned(value, u);
		if (ok)
		{
			workload.payload_size = static_cast<size_t>(u);
		}
	}
	else if (key == "workload.batch_size")
	{
		ok = parse_unsigned(value, u);
		if (ok)
		{
			workload.batch_size = static_cast<size_t>(u);
		}
	}
	else if (key == "workload.existing_rows")
	{
		ok = parse_signed(value, i);
		if (ok)
		{
			workload.existing_rows = i;
		}
	}
	else if (key == "workload.backoff_floor_ms")
	{
		ok = as_ms(workload.backoff.floor);
	}
	else if (key == "workload.backoff_ceiling_ms")
	{
		ok = as_ms(workload.backoff.ceiling);
	}
	else if (key == "workload.first_failure_pause_ms")
	{
		ok = as_ms(workload.backoff.first_failure_pause);
	}
	else if (key == "workload.error_log_interval_ms")
	{
		ok = as_ms(workload.error_log_interval);
	}
	// Monitor
	else if (key == "monitor.enabled")
	{
		ok = parse_bool(value, monitor.enabled);
	}
	else if (key == "monitor.interval_ms")
	{
		ok = as_ms(monitor.interval);
	}
	else if (key == "monitor.realtime_window_ms")
	{
		ok = as_ms(monitor.realtime_window);
	}
	else if (key == "monitor.latency_samples")
	{
		ok = parse_unsigned(value, u);
		if (ok)
		{
			monitor.latency_samples = static_cast<size_t>(u);
		}
	}
	// Logging
	else if (key == "logging.level")
	{
		logging.level = value;
	}
	else if (key == "logging.log_file")
	{
		logging.log_file = value;
	}
	else if (key == "logging.enable_console")
	{
		ok = parse_bool(value, b);
		if (ok)
		{
			logging.enable_console = b;
		}
	}
	else
	{
		return kcenon::common::error_info{unknown_key_code, "Unknown configuration key: " + key,
										  "load_test_config"};
	}

	if (!ok)
	{
		return invalid_value(key, value);
	}

	return kcenon::common::ok();
}

bool load_test_config::validate() const
{
	return validation_errors().empty();
}

std::vector<std::string> load_test_config::validation_errors() const
{
	std::vector<std::string> errors;

	if (name.empty())
	{
		errors.push_back("Run name cannot be empty");
	}

	// Validate adapter configuration
	if (adapter.type != "simulated" && adapter.type != "backend")
	{
		errors.push_back("Invalid adapter type: " + adapter.type + " (valid: simulated, backend)");
	}

	if (adapter.failure_rate < 0.0 || adapter.failure_rate > 1.0)
	{
		errors.push_back("Adapter failure rate must be between 0 and 1");
	}

	if (adapter.type == "backend" && adapter.table_name.empty())
	{
		errors.push_back("Adapter table name cannot be empty");
	}

	// Validate pool configuration
	if (pool.max_connections == 0)
	{
		errors.push_back("Pool maximum connections must be greater than 0");
	}

	if (pool.min_connections > pool.max_connections)
	{
		errors.push_back("Pool minimum connections cannot exceed maximum connections");
	}

	if (pool.enable_health_checks && pool.health_check_interval.count() == 0)
	{
		errors.push_back("Pool health check interval must be greater than 0");
	}

	if (pool.acquire_attempts == 0 || pool.create_attempts == 0)
	{
		errors.push_back("Pool retry attempts must be greater than 0");
	}

	// Validate workload configuration
	if (workload.worker_count == 0)
	{
		errors.push_back("Worker count must be greater than 0");
	}

	if (workload.duration.count() == 0)
	{
		errors.push_back("Test duration must be greater than 0");
	}

	if (workload.target_tps < 0.0)
	{
		errors.push_back("Target TPS cannot be negative");
	}

	if (workload.backoff.floor.count() <= 0 || workload.backoff.floor > workload.backoff.ceiling)
	{
		errors.push_back("Worker backoff floor must be positive and not exceed the ceiling");
	}

	if (workload.batch_size == 0)
	{
		errors.push_back("Batch size must be greater than 0");
	}

	if (workload.mode == ::database_load_tester::workload::operation_mode::full && workload.payload_size == 0)
	{
		errors.push_back("Full mode requires a non-empty payload");
	}

	// Validate monitor configuration
	if (monitor.enabled && monitor.interval.count() == 0)
	{
		errors.push_back("Monitor interval must be greater than 0");
	}

	if (monitor.latency_samples == 0)
	{
		errors.push_back("Latency sample capacity must be greater than 0");
	}

	// Validate logging configuration
	if (!::database_load_tester::logging::parse_log_level(logging.level))
	{
		errors.push_back("Invalid log level: " + logging.level
						 + " (valid: debug, info, warn, warning, error)");
	}

	return errors;
}

std::string seconds_to_milliseconds(const std::string& seconds)
{
	// Seconds beyond this overflow the millisecond count
	constexpr double max_seconds
		= static_cast<double>(std::numeric_limits<std::chrono::milliseconds::rep>::max()) / 1000.0;

	try
	{
		size_t consumed = 0;
		double parsed = std::stod(seconds, &consumed);
		if (consumed != seconds.size() || !std::isfinite(parsed) || parsed < 0.0
			|| parsed >= max_seconds)
		{
			return seconds;
		}
		return std::to_string(static_cast<long long>(parsed * 1000.0));
	}
	catch (const std::exception&)
	{
		return seconds;
	}
}

} // namespace database_load_tester::core

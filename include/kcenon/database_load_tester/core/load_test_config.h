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
 * @file load_test_config.h
 * @brief Load test configuration structures
 *
 * Configuration is read from a key=value file with dotted section keys and
 * may be overridden key by key (the driver maps its command-line options
 * onto apply_override()).
 *
 * ## Thread Safety
 * Plain data. Populate before the test starts, then treat as read-only.
 *
 * @code
 * using namespace database_load_tester::core;
 *
 * auto loaded = load_test_config::load_from_file("load_test.conf");
 * if (loaded.is_err()) {
 *     std::cerr << loaded.error().message << std::endl;
 * }
 *
 * auto cfg = load_test_config::default_config();
 * cfg.apply_override("workload.worker_count", "64");
 * for (const auto& err : cfg.validation_errors()) {
 *     std::cerr << "Config error: " << err << std::endl;
 * }
 * @endcode
 *
 * File format:
 * @code
 * # comment
 * workload.mode=mixed
 * workload.worker_count=32
 * workload.duration_ms=60000
 * pool.min_connections=16
 * pool.max_connections=32
 * pool.idle_timeout_ms=30000
 * workload.batch_size=100
 * logging.level=info
 * @endcode
 */

#pragma once

#include <kcenon/database_load_tester/pooling/connection_types.h>
#include <kcenon/database_load_tester/workload/operation_mode.h>
#include <kcenon/database_load_tester/workload/retry_backoff.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <kcenon/common/patterns/result.h>

namespace database_load_tester::core
{

/**
 * @struct adapter_config
 * @brief Backend selection and simulated backend behaviour
 */
struct adapter_config
{
	std::string type = "simulated";    ///< simulated | backend
	std::string table_name = "load_test"; ///< Target table for the backend adapter
	uint32_t latency_us = 200;         ///< Simulated per-operation latency
	uint32_t latency_jitter_us = 0;    ///< Simulated latency jitter
	double failure_rate = 0.0;         ///< Simulated operation failure probability
};

/**
 * @struct workload_config
 * @brief Worker count, timing and transaction shape
 */
struct workload_config
{
	workload::operation_mode mode = workload::operation_mode::full;
	size_t worker_count = 10;                           ///< Concurrent workers
	std::chrono::milliseconds duration{60000};          ///< Measured run time after warm-up
	std::chrono::milliseconds warm_up{0};               ///< Unmeasured lead-in
	std::chrono::milliseconds ramp_up{0};               ///< Window over which workers are admitted
	double target_tps = 0.0;                            ///< Rate limit; 0 = unlimited
	size_t payload_size = 500;                          ///< Characters per row
	size_t batch_size = 1;                              ///< Rows per insert transaction (insert-only, mixed)
	int64_t existing_rows = 0;                          ///< Rows present before the test
	workload::backoff_config backoff;                   ///< Worker backoff
	std::chrono::milliseconds error_log_interval{10000}; ///< Worker error-log throttle
	bool abort_on_empty_warm_up = true;                 ///< Abort if warm-up creates nothing
};

/**
 * @struct monitor_config
 * @brief Periodic progress reporting
 */
struct monitor_config
{
	bool enabled = true;                              ///< Run the progress reporter
	std::chrono::milliseconds interval{5000};         ///< Time between samples
	std::chrono::milliseconds realtime_window{1000};  ///< Span of real-time TPS
	size_t latency_samples = 10000;                   ///< Retained latency samples
};

/**
 * @struct logging_config
 * @brief Logging configuration
 */
struct logging_config
{
	std::string level = "info";   ///< Log level (debug, info, warn, error)
	std::string log_file;         ///< Mirror file path (empty for none)
	bool enable_console = true;   ///< Enable console output
};

/**
 * @struct load_test_config
 * @brief Complete configuration of one load test run
 */
struct load_test_config
{
	std::string name = "load_test";  ///< Run name used in reports
	adapter_config adapter;
	pooling::pool_config pool;
	workload_config workload;
	monitor_config monitor;
	logging_config logging;

	/**
	 * @brief Load configuration from a key=value file
	 * @param path Path to the configuration file
	 * @return Loaded configuration, or an error naming the file or bad key
	 */
	static kcenon::common::Result<load_test_config> load_from_file(const std::string& path);

	/**
	 * @brief Create a default configuration
	 */
	static load_test_config default_config();

	/**
	 * @brief Set one key to a textual value
	 * @return Error for an unknown key or an unparsable value
	 */
	kcenon::common::VoidResult apply_override(const std::string& key, const std::string& value);

	/**
	 * @brief Validate the configuration
	 * @return true if configuration is valid
	 */
	bool validate() const;

	/**
	 * @brief Get validation error messages
	 * @return Vector of validation error messages
	 */
	std::vector<std::string> validation_errors() const;
};

/**
 * @brief Convert a seconds option value to a millisecond config value
 *
 * Fractions are allowed ("1.5" -> "1500"). Anything that is not a finite,
 * non-negative number in range comes back unchanged, so the millisecond
 * key then rejects it as an invalid value.
 */
std::string seconds_to_milliseconds(const std::string& seconds);

} // namespace database_load_tester::core

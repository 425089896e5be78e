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
 * @file load_worker.h
 * @brief One concurrency slot of the load test
 *
 * A worker loops until the shutdown signal fires:
 * 1. Wait for a rate limiter token (when limiting is enabled)
 * 2. Acquire a connection from the pool, backing off on recoverable errors
 * 3. Run one transaction of the configured mode through the adapter
 * 4. Release the connection (validated if the transaction failed)
 * 5. Record the outcome in the shared statistics
 */

#pragma once

#include "operation_mode.h"
#include "payload_generator.h"
#include "rate_limiter.h"
#include "retry_backoff.h"

#include <kcenon/database_load_tester/core/shutdown_signal.h>
#include <kcenon/database_load_tester/metrics/stats_aggregator.h>
#include <kcenon/database_load_tester/pooling/connection_pool.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <kcenon/common/interfaces/logger_interface.h>

namespace database_load_tester::workload
{

/**
 * @enum worker_state
 * @brief Lifecycle of a worker
 */
enum class worker_state
{
	waiting_to_start, ///< Created, not yet admitted by ramp-up
	running,          ///< Issuing transactions
	stopping,         ///< Signal observed, finishing the current transaction
	stopped           ///< Loop has exited
};

constexpr const char* to_string(worker_state state) noexcept
{
	switch (state)
	{
	case worker_state::waiting_to_start:
		return "waiting_to_start";
	case worker_state::running:
		return "running";
	case worker_state::stopping:
		return "stopping";
	case worker_state::stopped:
		return "stopped";
	}
	return "unknown";
}

/**
 * @struct worker_config
 * @brief Per-worker settings
 */
struct worker_config
{
	std::string name;                                  ///< Holder identity, e.g. Worker-0001
	operation_mode mode = operation_mode::full;
	std::chrono::milliseconds acquire_wait{5000};      ///< Pool wait per acquire attempt
	size_t batch_size = 1;                             ///< Rows per insert transaction
	backoff_config backoff;
	std::chrono::milliseconds error_log_interval{10000}; ///< Minimum gap between error warnings
};

/**
 * @struct worker_counters
 * @brief What one worker has done so far
 */
struct worker_counters
{
	uint64_t transactions = 0;
	uint64_t errors = 0;
	uint64_t verification_failures = 0;
	uint64_t acquire_failures = 0;
};

/**
 * @class load_worker
 * @brief Transaction loop bound to one thread
 *
 * run() blocks on the calling thread. state() and counters() may be read
 * from other threads while it runs.
 */
class load_worker
{
public:
	load_worker(worker_config config,
				std::shared_ptr<pooling::connection_pool> pool,
				std::shared_ptr<adapters::database_adapter> adapter,
				std::shared_ptr<metrics::stats_aggregator> stats,
				std::shared_ptr<payload_generator> generator,
				std::shared_ptr<core::shutdown_signal> signal,
				std::shared_ptr<rate_limiter> limiter = nullptr);

	load_worker(const load_worker&) = delete;
	load_worker& operator=(const load_worker&) = delete;

	/**
	 * @brief Run the transaction loop until the shutdown signal fires
	 */
	void run();

	[[nodiscard]] worker_state state() const noexcept { return state_.load(); }
	[[nodiscard]] const std::string& name() const noexcept { return config_.name; }
	[[nodiscard]] worker_counters counters() const noexcept;

	/**
	 * @brief Backoff state; only meaningful once run() has returned
	 */
	[[nodiscard]] const retry_backoff& backoff() const noexcept { return backoff_; }

	void set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

	/**
	 * @brief Worker name for a 1-based index: Worker-0001
	 */
	static std::string make_name(size_t index);

private:
	enum class outcome
	{
		success,
		verification_failed,
		error
	};

	outcome execute_transaction(pooling::pooled_connection& connection);
	outcome execute_full(pooling::pooled_connection& connection);
	outcome execute_single(pooling::pooled_connection& connection);
	outcome execute_batch(pooling::pooled_connection& connection);
	outcome fail(const std::string& message);
	void report_error(const std::string& message);
	void log(kcenon::common::interfaces::log_level level, const std::string& message) const;

	worker_config config_;
	std::shared_ptr<pooling::connection_pool> pool_;
	std::shared_ptr<adapters::database_adapter> adapter_;
	std::shared_ptr<metrics::stats_aggregator> stats_;
	std::shared_ptr<payload_generator> generator_;
	std::shared_ptr<core::shutdown_signal> signal_;
	std::shared_ptr<rate_limiter> limiter_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;

	std::atomic<worker_state> state_{worker_state::waiting_to_start};
	retry_backoff backoff_;

	std::atomic<uint64_t> transactions_{0};
	std::atomic<uint64_t> errors_{0};
	std::atomic<uint64_t> verification_failures_{0};
	std::atomic<uint64_t> acquire_failures_{0};

	std::optional<std::chrono::steady_clock::time_point> last_error_log_;
	uint64_t suppressed_errors_ = 0;
};

} // namespace database_load_tester::workload

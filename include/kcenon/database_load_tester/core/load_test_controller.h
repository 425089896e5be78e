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
 * @file load_test_controller.h
 * @brief Orchestration of one load test run
 *
 * The controller owns everything a run needs: the connection pool, the
 * shared statistics, the rate limiter, the progress reporter and the worker
 * threads. A run goes through these phases:
 *
 * 1. Warm the pool up to its minimum size
 * 2. Start pool health checks and progress reporting
 * 3. Admit workers linearly across the ramp-up window
 * 4. Reset statistics once when the warm-up period ends
 * 5. Stop at warm-up + duration, or earlier on request_stop(), which also
 *    cuts step 1 short
 * 6. Drain workers, take the final snapshot, shut the pool down
 *
 * @code
 * auto adapter = std::make_shared<adapters::simulated_adapter>();
 * core::load_test_controller controller(config, adapter);
 * controller.set_logger(logger);
 *
 * auto result = controller.run();
 * if (result.is_ok()) {
 *     std::cout << core::format_report(config.name, result.value());
 * }
 * @endcode
 */

#pragma once

#include "load_test_config.h"
#include "progress_reporter.h"
#include "shutdown_signal.h"

#include <kcenon/database_load_tester/adapters/database_adapter.h>
#include <kcenon/database_load_tester/metrics/stats_aggregator.h>
#include <kcenon/database_load_tester/pooling/connection_pool.h>
#include <kcenon/database_load_tester/workload/load_worker.h>
#include <kcenon/database_load_tester/workload/rate_limiter.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>

namespace database_load_tester::core
{

/**
 * @enum controller_error
 * @brief Error kinds returned by load_test_controller::run()
 */
enum class controller_error : int
{
	invalid_configuration = -701,
	warm_up_failed = -702,
	already_running = -703
};

inline kcenon::common::error_info make_controller_error(controller_error error,
														 const std::string& message)
{
	return kcenon::common::error_info{static_cast<int>(error), message, "load_test_controller"};
}

/**
 * @enum test_state
 * @brief Lifecycle of a controller
 */
enum class test_state
{
	idle,        ///< Not started
	warming_up,  ///< Filling the pool
	running,     ///< Workers admitted or being admitted
	stopping,    ///< Draining workers
	completed,   ///< run() returned a summary
	failed       ///< run() returned an error
};

constexpr const char* to_string(test_state state) noexcept
{
	switch (state)
	{
	case test_state::idle:
		return "idle";
	case test_state::warming_up:
		return "warming_up";
	case test_state::running:
		return "running";
	case test_state::stopping:
		return "stopping";
	case test_state::completed:
		return "completed";
	case test_state::failed:
		return "failed";
	}
	return "unknown";
}

/**
 * @struct load_test_summary
 * @brief Result of a completed run
 */
struct load_test_summary
{
	metrics::stats_snapshot stats;             ///< Final snapshot
	pooling::pool_stats pool;                  ///< Pool counters at shutdown
	pooling::warm_up_report warm_up;
	size_t workers_started = 0;
	bool interrupted = false;                  ///< Ended by request_stop()
	std::chrono::milliseconds wall_time{0};    ///< Whole run including warm-up
	std::vector<workload::worker_counters> workers;
};

/**
 * @brief Multi-line final report
 */
std::string format_report(const std::string& name, const load_test_summary& summary);

/**
 * @class load_test_controller
 * @brief Runs one load test to completion
 *
 * run() blocks the calling thread and may be called once. request_stop()
 * only stores an atomic flag, so it may be called from a signal handler.
 */
class load_test_controller
{
public:
	using clock = std::chrono::steady_clock;

	load_test_controller(load_test_config config,
						 std::shared_ptr<adapters::database_adapter> adapter);
	~load_test_controller();

	load_test_controller(const load_test_controller&) = delete;
	load_test_controller& operator=(const load_test_controller&) = delete;

	kcenon::common::Result<load_test_summary> run();

	/**
	 * @brief Ask a running test to stop early
	 *
	 * The controller notices within 100ms, during warm-up as well as during
	 * the run, and propagates the request through the shutdown signal.
	 */
	void request_stop() noexcept;

	[[nodiscard]] test_state state() const noexcept { return state_.load(); }
	[[nodiscard]] const load_test_config& config() const noexcept { return config_; }

	/**
	 * @brief Shared statistics; valid once run() has started
	 */
	[[nodiscard]] std::shared_ptr<metrics::stats_aggregator> stats() const;

	/**
	 * @brief The run's pool; valid once run() has started
	 */
	[[nodiscard]] std::shared_ptr<pooling::connection_pool> pool() const;

	/**
	 * @brief Progress samples gathered so far (empty when monitoring is off)
	 */
	[[nodiscard]] std::vector<progress_sample> progress_samples() const;

	/**
	 * @brief Live counters of each admitted worker, in admission order
	 */
	[[nodiscard]] std::vector<workload::worker_counters> worker_counters() const;

	void set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger);
	void set_sample_sink(sample_sink sink);

private:
	void setup_components();
	pooling::warm_up_report warm_up_pool();
	void admit_worker(size_t index);
	void drain_workers();
	load_test_summary finish(const pooling::warm_up_report& warm_up, clock::time_point started);
	void log(kcenon::common::interfaces::log_level level, const std::string& message) const;

	load_test_config config_;
	std::shared_ptr<adapters::database_adapter> adapter_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
	sample_sink sink_;

	std::atomic<test_state> state_{test_state::idle};
	std::atomic<bool> stop_requested_{false};
	bool interrupted_ = false;

	mutable std::mutex components_mutex_;
	std::shared_ptr<shutdown_signal> signal_;
	std::shared_ptr<metrics::stats_aggregator> stats_;
	std::shared_ptr<pooling::connection_pool> pool_;
	std::shared_ptr<workload::rate_limiter> limiter_;
	std::shared_ptr<workload::payload_generator> generator_;
	std::unique_ptr<progress_reporter> reporter_;

	std::vector<std::unique_ptr<workload::load_worker>> workers_;
	std::vector<std::thread> threads_;
};

} // namespace database_load_tester::core

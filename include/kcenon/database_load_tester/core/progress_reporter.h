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
 * @file progress_reporter.h
 * @brief Periodic sampling of load test statistics
 *
 * The reporter wakes on a fixed interval, takes a stats snapshot and the
 * pool occupancy, computes what changed since the previous sample, logs one
 * progress line and keeps the sample as part of an in-memory time series.
 *
 * Samples taken before the warm-up boundary are tagged [WARMUP], the rest
 * [RUNNING]. The warm-up reset zeroes the lifetime counters, so deltas are
 * measured against zero for the first sample after it.
 */

#pragma once

#include "shutdown_signal.h"

#include <kcenon/database_load_tester/metrics/stats_aggregator.h>
#include <kcenon/database_load_tester/pooling/connection_pool.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <kcenon/common/interfaces/logger_interface.h>

namespace database_load_tester::core
{

/**
 * @struct progress_sample
 * @brief One point of the progress time series
 */
struct progress_sample
{
	std::chrono::milliseconds offset{0};   ///< Since the reporter was created
	bool warming_up = false;               ///< Taken before measurement began
	metrics::stats_snapshot stats;
	pooling::pool_stats pool;

	uint64_t interval_transactions = 0;
	uint64_t interval_inserts = 0;
	uint64_t interval_selects = 0;
	uint64_t interval_updates = 0;
	uint64_t interval_deletes = 0;
	uint64_t interval_errors = 0;
	double interval_seconds = 0.0;
	double interval_tps = 0.0;
};

using sample_sink = std::function<void(const progress_sample&)>;

/**
 * @class progress_reporter
 * @brief Background thread producing progress samples
 *
 * sample_once() may also be called directly, which is how the tests drive
 * it without a thread.
 */
class progress_reporter
{
public:
	using clock = std::chrono::steady_clock;

	progress_reporter(std::chrono::milliseconds interval,
					  std::shared_ptr<metrics::stats_aggregator> stats,
					  std::shared_ptr<pooling::connection_pool> pool = nullptr,
					  std::shared_ptr<shutdown_signal> signal = nullptr);
	~progress_reporter();

	progress_reporter(const progress_reporter&) = delete;
	progress_reporter& operator=(const progress_reporter&) = delete;

	void start();

	/**
	 * @brief Stop the sampling thread; safe to call more than once
	 */
	void stop();

	[[nodiscard]] bool is_running() const;

	/**
	 * @brief Take, log and store one sample now
	 */
	progress_sample sample_once();

	[[nodiscard]] std::vector<progress_sample> samples() const;
	[[nodiscard]] std::chrono::milliseconds interval() const noexcept { return interval_; }

	/**
	 * @brief Callback invoked with every sample after it is stored
	 */
	void set_sink(sample_sink sink);
	void set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

	/**
	 * @brief One-line rendering used for the progress log
	 */
	static std::string format(const progress_sample& sample);

private:
	void report_loop();

	std::chrono::milliseconds interval_;
	std::shared_ptr<metrics::stats_aggregator> stats_;
	std::shared_ptr<pooling::connection_pool> pool_;
	std::shared_ptr<shutdown_signal> signal_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
	sample_sink sink_;

	clock::time_point created_at_;

	mutable std::mutex samples_mutex_;
	std::vector<progress_sample> samples_;
	std::optional<clock::time_point> previous_at_;

	mutable std::mutex thread_mutex_;
	std::condition_variable thread_condition_;
	std::thread thread_;
	bool stop_requested_ = false;
};

} // namespace database_load_tester::core

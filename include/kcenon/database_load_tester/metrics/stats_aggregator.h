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
 * @file stats_aggregator.h
 * @brief Thread-safe transaction statistics for a running load test
 *
 * Every worker records into one stats_aggregator. Counters are relaxed
 * atomics; latency samples and the rolling throughput window sit behind
 * their own short critical sections. Recorders and snapshots hold a shared
 * lock that only the one-time warm-up reset takes exclusively, so the reset
 * is atomic with respect to every record call. Readers take snapshots,
 * which never modify state.
 */

#pragma once

#include "latency_reservoir.h"
#include "rolling_tps_window.h"

#include <kcenon/database_load_tester/adapters/database_adapter.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <shared_mutex>

namespace database_load_tester::metrics
{

/**
 * @struct stats_config
 * @brief Sizing of the sample buffer and the rolling window
 */
struct stats_config
{
	size_t latency_capacity = latency_reservoir::default_capacity; ///< Retained latency samples
	std::chrono::milliseconds bucket_width{100};                  ///< Rolling window granularity
	size_t bucket_count = 50;                                     ///< Rolling window length
	std::chrono::milliseconds realtime_span{1000};                ///< Span of the real-time TPS
};

/**
 * @struct latency_summary
 * @brief Latency figures in milliseconds
 */
struct latency_summary
{
	size_t sample_count = 0;  ///< Samples retained for percentiles
	double average_ms = 0.0;  ///< Over every recorded transaction
	double min_ms = 0.0;
	double max_ms = 0.0;
	double p50_ms = 0.0;
	double p95_ms = 0.0;
	double p99_ms = 0.0;
};

/**
 * @struct stats_snapshot
 * @brief Read-only view of the aggregator at one instant
 */
struct stats_snapshot
{
	uint64_t transactions = 0;
	uint64_t inserts = 0;
	uint64_t selects = 0;
	uint64_t updates = 0;
	uint64_t deletes = 0;
	uint64_t errors = 0;
	uint64_t verification_failures = 0;

	double elapsed_seconds = 0.0;  ///< Since construction or begin_measurement()
	double average_tps = 0.0;      ///< transactions / elapsed_seconds
	double realtime_tps = 0.0;     ///< Over the configured real-time span
	bool measuring = false;        ///< begin_measurement() has happened

	latency_summary latency;

	/**
	 * @brief Share of attempts that succeeded, in percent
	 */
	[[nodiscard]] double success_rate() const noexcept;
};

/**
 * @class stats_aggregator
 * @brief Counters, latency samples and rolling TPS
 *
 * Counters only grow, except for the single reset performed by
 * begin_measurement() at the end of warm-up.
 *
 * Usage:
 * @code
 *   stats_aggregator stats;
 *   stats.record_transaction(operation_kind::insert, std::chrono::microseconds(850));
 *   stats.record_error();
 *
 *   auto view = stats.snapshot();
 *   std::cout << view.transactions << " txn, p99 " << view.latency.p99_ms << "ms\n";
 * @endcode
 */
class stats_aggregator
{
public:
	using clock = std::chrono::steady_clock;

	explicit stats_aggregator(stats_config config = stats_config{});

	stats_aggregator(const stats_aggregator&) = delete;
	stats_aggregator& operator=(const stats_aggregator&) = delete;

	/**
	 * @brief Record one successful single-operation transaction
	 * @param kind Operation that ran
	 * @param latency Wall time of operation plus commit
	 */
	void record_transaction(adapters::operation_kind kind, std::chrono::microseconds latency);

	/**
	 * @brief Record one successful insert, commit, select-back cycle
	 */
	void record_full_cycle(std::chrono::microseconds latency);

	/**
	 * @brief Record one committed multi-row insert as a single transaction
	 * @param rows Rows inserted by the batch
	 */
	void record_batch_insert(uint64_t rows, std::chrono::microseconds latency);

	void record_error();
	void record_verification_failure();

	/**
	 * @brief Zero the lifetime counters at the warm-up boundary
	 *
	 * Only the first call has any effect. The rolling window is left alone.
	 *
	 * @return true if this call performed the reset
	 */
	bool begin_measurement();

	[[nodiscard]] bool measurement_started() const noexcept
	{
		return measurement_started_.load(std::memory_order_acquire);
	}

	[[nodiscard]] stats_snapshot snapshot() const;

	/**
	 * @brief Throughput over the most recent @p span
	 */
	[[nodiscard]] double realtime_tps(std::chrono::milliseconds span) const;

	[[nodiscard]] const stats_config& config() const noexcept { return config_; }

private:
	void record_latency(std::chrono::microseconds latency);

	stats_config config_;

	mutable std::shared_mutex reset_mutex_;

	std::atomic<uint64_t> transactions_{0};
	std::atomic<uint64_t> inserts_{0};
	std::atomic<uint64_t> selects_{0};
	std::atomic<uint64_t> updates_{0};
	std::atomic<uint64_t> deletes_{0};
	std::atomic<uint64_t> errors_{0};
	std::atomic<uint64_t> verification_failures_{0};

	std::atomic<uint64_t> latency_total_us_{0};
	std::atomic<uint64_t> latency_count_{0};
	std::atomic<uint64_t> latency_min_us_;
	std::atomic<uint64_t> latency_max_us_{0};

	std::atomic<bool> measurement_started_{false};
	std::atomic<clock::rep> started_at_;

	latency_reservoir reservoir_;
	rolling_tps_window window_;
};

} // namespace database_load_tester::metrics

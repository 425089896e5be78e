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
 * @file connection_pool.h
 * @brief Self-healing connection pool with leak detection
 *
 * The pool is the single owner of every backend connection. Workers borrow
 * connections with acquire() and hand them back with release(); a
 * background health-check loop recycles old connections, drops dead ones,
 * shrinks the pool back toward its minimum after idle periods and reports
 * connections that have been checked out for too long.
 *
 * Failure handling is layered:
 * - Creation: bounded retries with doubling backoff inside the pool
 * - Acquisition: bounded waits when at capacity, then pool_exhausted
 * - Workers: open-ended backoff on recoverable pool errors
 */

#pragma once

#include "connection_types.h"
#include "pool_errors.h"

#include <kcenon/database_load_tester/core/shutdown_signal.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>

namespace database_load_tester::pooling
{

/**
 * @class connection_pool
 * @brief Bounded pool of adapter connections
 *
 * Invariants:
 * - idle + active + pending never exceeds max_connections
 * - A connection id is never in the idle and active sets at once
 * - Backend I/O (open, liveness check, close) never runs under the pool mutex
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - Blocking calls return promptly once the shutdown signal fires
 *
 * Usage Example:
 * @code
 *   pool_config config;
 *   config.min_connections = 5;
 *   config.max_connections = 10;
 *
 *   auto pool = std::make_shared<connection_pool>(config, adapter, signal);
 *   auto report = pool->warm_up();
 *   pool->start_health_checks();
 *
 *   auto conn = pool->acquire("Worker-0001");
 *   if (conn.is_ok())
 *   {
 *       adapter->execute(conn.value()->handle(), operation_kind::select, payload);
 *       pool->release(conn.value());
 *   }
 *
 *   auto final_stats = pool->shutdown();
 * @endcode
 */
class connection_pool
{
public:
	using clock = std::chrono::steady_clock;

	/**
	 * @brief Construct pool
	 * @param config Sizing and retry settings
	 * @param adapter Backend adapter used to open, check and close connections
	 * @param signal Shared shutdown signal; the pool creates its own when null
	 */
	connection_pool(pool_config config,
					std::shared_ptr<adapters::database_adapter> adapter,
					std::shared_ptr<core::shutdown_signal> signal = nullptr);

	/**
	 * @brief Destructor - shuts the pool down if still running
	 */
	~connection_pool();

	connection_pool(const connection_pool&) = delete;
	connection_pool& operator=(const connection_pool&) = delete;
	connection_pool(connection_pool&&) = delete;
	connection_pool& operator=(connection_pool&&) = delete;

	/**
	 * @brief Create min_connections connections synchronously
	 * @return How many of the requested connections were created
	 */
	warm_up_report warm_up();

	/**
	 * @brief Create @p count connections synchronously
	 *
	 * Creations that exhaust their retries are logged and skipped. The pool
	 * never grows beyond max_connections.
	 */
	warm_up_report warm_up(size_t count);

	/**
	 * @brief Borrow a connection using the configured per-attempt wait
	 * @param holder Identity recorded for leak reports
	 */
	kcenon::common::Result<std::shared_ptr<pooled_connection>> acquire(const std::string& holder);

	/**
	 * @brief Borrow a connection
	 * @param holder Identity recorded for leak reports
	 * @param wait_per_attempt How long each wait attempt may block at capacity
	 * @return Connection, or pool_exhausted / connection_creation_failed /
	 *         pool_shut_down / acquire_cancelled
	 */
	kcenon::common::Result<std::shared_ptr<pooled_connection>> acquire(
		const std::string& holder, std::chrono::milliseconds wait_per_attempt);

	/**
	 * @brief Return a borrowed connection
	 * @param connection Connection obtained from acquire()
	 * @param mode reuse, or validate to check liveness before reuse
	 * @return invalid_release if the connection is not currently checked out
	 */
	kcenon::common::VoidResult release(const std::shared_ptr<pooled_connection>& connection,
									   release_mode mode = release_mode::reuse);

	/**
	 * @brief Run one health-check cycle on the calling thread
	 */
	health_check_report run_health_check();

	/**
	 * @brief Start the background health-check loop
	 */
	void start_health_checks();

	/**
	 * @brief Stop the background health-check loop and wait for it
	 */
	void stop_health_checks();

	/**
	 * @brief Close every connection and refuse further acquisitions
	 * @return Final pool statistics
	 */
	pool_stats shutdown();

	[[nodiscard]] pool_stats get_stats() const;
	[[nodiscard]] bool is_shut_down() const;
	[[nodiscard]] const pool_config& config() const noexcept { return config_; }

	void set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger);
	[[nodiscard]] std::shared_ptr<kcenon::common::interfaces::ILogger> get_logger() const;

private:
	using connection_ptr = std::shared_ptr<pooled_connection>;

	kcenon::common::Result<connection_ptr> create_connection();
	kcenon::common::Result<connection_ptr> grow_locked(std::unique_lock<std::mutex>& lock,
													   const std::string& holder);
	connection_ptr take_idle_locked(const std::string& holder);
	void check_out_locked(const connection_ptr& connection, const std::string& holder);
	[[nodiscard]] bool has_capacity_locked() const;
	[[nodiscard]] bool keepalive_due(const pooled_connection& connection,
									 clock::time_point now) const;

	template <typename Predicate>
	bool wait_locked(std::unique_lock<std::mutex>& lock, clock::time_point deadline,
					 Predicate ready);

	bool check_alive(const connection_ptr& connection);
	void close_connection(const connection_ptr& connection);
	void health_check_loop();
	void log(kcenon::common::interfaces::log_level level, const std::string& message) const;

	pool_config config_;
	std::shared_ptr<adapters::database_adapter> adapter_;
	std::shared_ptr<core::shutdown_signal> signal_;
	bool owns_signal_;

	mutable std::mutex mutex_;
	std::condition_variable condition_;
	std::deque<connection_ptr> idle_;
	std::unordered_map<uint64_t, connection_ptr> active_;
	size_t pending_ = 0;
	bool shutting_down_ = false;

	std::atomic<uint64_t> next_id_{1};
	std::atomic<uint64_t> total_created_{0};
	std::atomic<uint64_t> total_recycled_{0};
	std::atomic<uint64_t> total_removed_{0};
	std::atomic<uint64_t> total_shrunk_{0};
	std::atomic<uint64_t> failed_creations_{0};
	std::atomic<uint64_t> exhausted_acquires_{0};
	std::atomic<uint64_t> leak_warnings_{0};
	std::atomic<uint64_t> health_check_cycles_{0};

	std::mutex health_mutex_;
	std::condition_variable health_condition_;
	std::thread health_thread_;
	bool stop_health_ = false;

	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
};

} // namespace database_load_tester::pooling

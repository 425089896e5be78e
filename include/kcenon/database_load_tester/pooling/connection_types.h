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
 * @file connection_types.h
 * @brief Connection pool configuration, connection record and statistics
 */

#pragma once

#include <kcenon/database_load_tester/adapters/database_adapter.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace database_load_tester::pooling
{

/**
 * @struct pool_config
 * @brief Sizing, health-check and retry settings of the pool
 */
struct pool_config
{
	size_t min_connections = 10;                                ///< Connections created by warm-up
	size_t max_connections = 20;                                ///< Hard upper bound on live connections
	std::chrono::milliseconds max_lifetime{1800000};            ///< Idle connections older than this are recycled
	std::chrono::milliseconds idle_timeout{30000};              ///< Unused this long above min_connections: dropped; 0 = never
	std::chrono::milliseconds keepalive_time{30000};            ///< Unused and unchecked this long: checked; 0 = never
	std::chrono::milliseconds leak_detection_threshold{60000};  ///< Checkout age that triggers a leak warning
	std::chrono::milliseconds health_check_interval{30000};     ///< Period of the health-check loop
	std::chrono::milliseconds acquire_wait{5000};               ///< Wait per acquire attempt when at capacity
	bool validate_idle = true;                                  ///< Check idle connections during health checks
	bool enable_health_checks = true;                           ///< Run the background health-check loop

	uint32_t create_attempts = 3;                               ///< open() attempts per creation
	std::chrono::milliseconds create_backoff_initial{100};      ///< Pause after the first failed open()
	std::chrono::milliseconds create_backoff_max{2000};         ///< Upper bound of creation backoff

	uint32_t acquire_attempts = 3;                              ///< Wait attempts when at capacity
	std::chrono::milliseconds acquire_backoff_initial{100};     ///< Pause after the first empty wait
	std::chrono::milliseconds acquire_backoff_max{5000};        ///< Upper bound of acquire backoff
};

/**
 * @enum release_mode
 * @brief How a returned connection is handled
 */
enum class release_mode
{
	reuse,    ///< Return straight to the idle set
	validate  ///< Check liveness first; destroy if dead
};

/**
 * @class pooled_connection
 * @brief One backend connection and its bookkeeping
 *
 * The pool owns every pooled_connection. A worker borrows one between
 * acquire() and release(); only the pool mutates the bookkeeping fields.
 */
class pooled_connection
{
public:
	using clock = std::chrono::steady_clock;

	pooled_connection(uint64_t id, std::shared_ptr<adapters::adapter_connection> handle)
		: id_(id)
		, handle_(std::move(handle))
		, created_at_(clock::now())
		, last_used_at_(created_at_)
		, last_validated_at_(created_at_)
	{
	}

	pooled_connection(const pooled_connection&) = delete;
	pooled_connection& operator=(const pooled_connection&) = delete;

	[[nodiscard]] uint64_t id() const noexcept { return id_; }
	[[nodiscard]] adapters::adapter_connection& handle() noexcept { return *handle_; }
	[[nodiscard]] clock::time_point created_at() const noexcept { return created_at_; }
	[[nodiscard]] clock::time_point last_used_at() const noexcept { return last_used_at_; }
	[[nodiscard]] clock::time_point last_validated_at() const noexcept { return last_validated_at_; }
	[[nodiscard]] std::optional<clock::time_point> checked_out_at() const noexcept
	{
		return checked_out_at_;
	}
	[[nodiscard]] const std::string& holder() const noexcept { return holder_; }
	[[nodiscard]] uint64_t use_count() const noexcept { return use_count_; }

	[[nodiscard]] std::chrono::milliseconds age(clock::time_point now) const
	{
		return std::chrono::duration_cast<std::chrono::milliseconds>(now - created_at_);
	}

	[[nodiscard]] std::chrono::milliseconds idle_for(clock::time_point now) const
	{
		return std::chrono::duration_cast<std::chrono::milliseconds>(now - last_used_at_);
	}

private:
	friend class connection_pool;

	uint64_t id_;
	std::shared_ptr<adapters::adapter_connection> handle_;
	clock::time_point created_at_;
	clock::time_point last_used_at_;
	clock::time_point last_validated_at_;
	std::optional<clock::time_point> checked_out_at_;
	std::string holder_;
	uint64_t use_count_ = 0;
};

/**
 * @struct warm_up_report
 * @brief Outcome of warm_up()
 */
struct warm_up_report
{
	size_t requested = 0;
	size_t created = 0;
	std::chrono::milliseconds elapsed{0};

	[[nodiscard]] bool complete() const noexcept { return created == requested; }
};

/**
 * @struct health_check_report
 * @brief Outcome of one health-check cycle
 */
struct health_check_report
{
	size_t checked = 0;        ///< Idle connections examined
	size_t removed = 0;        ///< Idle connections that failed validation
	size_t recycled = 0;       ///< Idle connections past max lifetime
	size_t shrunk = 0;         ///< Idle connections above the minimum past idle_timeout
	size_t leak_warnings = 0;  ///< Active connections over the leak threshold
	size_t idle_after = 0;
	size_t active_after = 0;
};

/**
 * @struct pool_stats
 * @brief Point-in-time pool occupancy and lifetime counters
 */
struct pool_stats
{
	size_t total = 0;               ///< idle + active
	size_t idle = 0;
	size_t active = 0;
	size_t pending = 0;             ///< Being created or validated outside the lock
	size_t min_connections = 0;
	size_t max_connections = 0;

	uint64_t total_created = 0;
	uint64_t total_recycled = 0;    ///< Destroyed for exceeding max lifetime
	uint64_t total_removed = 0;     ///< Destroyed for failing validation
	uint64_t total_shrunk = 0;      ///< Destroyed for idling above the minimum
	uint64_t failed_creations = 0;  ///< Creations that exhausted their retries
	uint64_t exhausted_acquires = 0;
	uint64_t leak_warnings = 0;
	uint64_t health_check_cycles = 0;
};

} // namespace database_load_tester::pooling

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
 * @file simulated_adapter.h
 * @brief In-memory backend with latency and outage injection
 *
 * Stands in for a real database when exercising the harness itself: the
 * driver uses it for dry runs and the tests use it to reproduce backend
 * restarts. An outage behaves like a server restart, so every connection
 * opened before the outage is dead once it is over.
 */

#pragma once

#include "database_adapter.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace database_load_tester::adapters
{

/**
 * @struct simulated_config
 * @brief Behaviour knobs of the simulated backend
 */
struct simulated_config
{
	std::chrono::microseconds operation_latency{200};  ///< Base time per operation
	std::chrono::microseconds latency_jitter{0};       ///< Uniform extra time [0, jitter]
	std::chrono::microseconds open_latency{0};         ///< Time spent in open()
	double failure_rate = 0.0;                         ///< Probability an operation fails
};

/**
 * @class simulated_adapter
 * @brief database_adapter backed by a process-local table
 *
 * Thread Safety:
 * - All methods are thread-safe
 * - Outage control may be driven from any thread while workers run
 */
class simulated_adapter : public database_adapter
{
public:
	explicit simulated_adapter(simulated_config config = simulated_config{});
	~simulated_adapter() override = default;

	simulated_adapter(const simulated_adapter&) = delete;
	simulated_adapter& operator=(const simulated_adapter&) = delete;

	kcenon::common::Result<std::shared_ptr<adapter_connection>> open() override;
	bool is_alive(adapter_connection& connection) override;
	kcenon::common::Result<operation_result> execute(adapter_connection& connection,
													 operation_kind kind,
													 const transaction_payload& payload) override;
	kcenon::common::Result<operation_result> execute_batch(
		adapter_connection& connection, const std::vector<transaction_payload>& rows) override;
	void close(adapter_connection& connection) override;
	[[nodiscard]] std::string name() const override { return "simulated"; }

	/**
	 * @brief Take the backend down until end_outage()
	 *
	 * Every connection opened so far is invalidated.
	 */
	void begin_outage();

	/**
	 * @brief Bring the backend back up
	 */
	void end_outage();

	/**
	 * @brief Take the backend down for a fixed duration
	 */
	void fail_for(std::chrono::milliseconds duration);

	/**
	 * @brief Make select return data that differs from what was written
	 */
	void set_corrupt_reads(bool enabled) noexcept { corrupt_reads_.store(enabled); }

	[[nodiscard]] bool is_available() const;
	[[nodiscard]] uint64_t open_connections() const noexcept { return open_connections_.load(); }
	[[nodiscard]] uint64_t total_opened() const noexcept { return total_opened_.load(); }
	[[nodiscard]] uint64_t total_executed() const noexcept { return total_executed_.load(); }
	[[nodiscard]] size_t row_count() const;

private:
	struct simulated_connection : adapter_connection
	{
		uint64_t generation = 0;
		std::atomic<bool> closed{false};
	};

	void simulate_latency(std::chrono::microseconds base) const;
	[[nodiscard]] bool connection_usable(const simulated_connection& connection) const;

	simulated_config config_;

	mutable std::mutex outage_mutex_;
	mutable bool in_outage_ = false;
	std::chrono::steady_clock::time_point outage_until_ = std::chrono::steady_clock::time_point::max();
	std::atomic<uint64_t> generation_{0};
	std::atomic<bool> corrupt_reads_{false};

	mutable std::mutex rows_mutex_;
	std::unordered_map<int64_t, std::string> rows_;

	std::atomic<uint64_t> open_connections_{0};
	std::atomic<uint64_t> total_opened_{0};
	std::atomic<uint64_t> total_executed_{0};
};

} // namespace database_load_tester::adapters

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
 * @file payload_generator.h
 * @brief Produces row ids and row content for worker operations
 */

#pragma once

#include <kcenon/database_load_tester/adapters/database_adapter.h>

#include <atomic>
#include <cstdint>
#include <random>
#include <string>

namespace database_load_tester::workload
{

/**
 * @struct payload_config
 * @brief Shape of generated rows
 */
struct payload_config
{
	size_t data_length = 500;   ///< Characters of random alphanumeric data per row
	int64_t existing_rows = 0;  ///< Rows assumed present before the test (ids 1..N)
};

/**
 * @class payload_generator
 * @brief Thread-safe source of transaction payloads
 *
 * Insert ids continue after existing_rows and are unique across all
 * workers. Reads, updates and deletes target a uniformly random id among
 * the ids known so far; the row may already be gone, which is a valid
 * zero-row outcome rather than an error.
 */
class payload_generator
{
public:
	explicit payload_generator(payload_config config = payload_config{});

	payload_generator(const payload_generator&) = delete;
	payload_generator& operator=(const payload_generator&) = delete;

	/**
	 * @brief Payload for a new row
	 */
	adapters::transaction_payload next_insert(const std::string& worker_name);

	/**
	 * @brief Payload addressing a row that was (probably) written before
	 *
	 * Carries fresh data so it can drive an update as well.
	 */
	adapters::transaction_payload next_existing(const std::string& worker_name);

	/**
	 * @brief Payload for @p kind
	 */
	adapters::transaction_payload next(adapters::operation_kind kind,
									   const std::string& worker_name);

	/**
	 * @brief Highest id handed out for inserts, including existing_rows
	 */
	[[nodiscard]] int64_t max_known_id() const noexcept { return next_id_.load() - 1; }

	[[nodiscard]] const payload_config& config() const noexcept { return config_; }

	/**
	 * @brief Random engine private to the calling thread
	 */
	static std::mt19937_64& thread_engine();

private:
	[[nodiscard]] std::string random_data() const;

	payload_config config_;
	std::atomic<int64_t> next_id_;
};

} // namespace database_load_tester::workload

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
 * @file retry_backoff.h
 * @brief Per-worker consecutive-failure backoff state machine
 *
 * Governs how often a worker goes back to the pool after acquisition
 * failures. The pool's own retries are short and bounded; this state
 * machine is open-ended but drops back to its floor after one success, so
 * throughput returns as soon as the backend does.
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace database_load_tester::workload
{

/**
 * @struct backoff_config
 * @brief Worker backoff parameters
 */
struct backoff_config
{
	std::chrono::milliseconds floor{100};               ///< First escalated pause
	std::chrono::milliseconds ceiling{5000};            ///< Longest pause
	std::chrono::milliseconds first_failure_pause{1000}; ///< Pause below the escalation threshold
	uint32_t escalation_threshold = 2;                  ///< Failures before pauses start doubling
	double multiplier = 2.0;                            ///< Growth per additional failure
};

/**
 * @class retry_backoff
 * @brief Failure count and current backoff of one worker
 *
 * Transitions:
 * - on_failure(): count + 1; below the threshold pause first_failure_pause
 *   with the backoff untouched; at or above it pause the current backoff,
 *   then grow it by multiplier up to ceiling
 * - on_success(): count = 0, backoff = floor
 *
 * Not thread-safe; each worker owns one instance.
 *
 * @code
 *   retry_backoff backoff;
 *   backoff.on_failure(); // 1000ms
 *   backoff.on_failure(); // 100ms
 *   backoff.on_failure(); // 200ms
 *   backoff.on_success(); // back to 100ms, count 0
 * @endcode
 */
class retry_backoff
{
public:
	explicit retry_backoff(backoff_config config = backoff_config{});

	/**
	 * @brief Register a failure
	 * @return How long the worker should pause before retrying
	 */
	std::chrono::milliseconds on_failure();

	/**
	 * @brief Register a success and return to the initial state
	 */
	void on_success() noexcept;

	[[nodiscard]] uint32_t consecutive_failures() const noexcept { return consecutive_failures_; }
	[[nodiscard]] std::chrono::milliseconds current_backoff() const noexcept { return current_; }
	[[nodiscard]] const backoff_config& config() const noexcept { return config_; }

private:
	backoff_config config_;
	uint32_t consecutive_failures_ = 0;
	std::chrono::milliseconds current_;
};

} // namespace database_load_tester::workload

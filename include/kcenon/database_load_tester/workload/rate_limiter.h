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
 * @file rate_limiter.h
 * @brief Token bucket that paces transaction admission
 *
 * Tokens accumulate continuously (fractional refill on every call) at the
 * target rate up to a capacity of max(rate, 1). Workers take one token per
 * transaction and sleep until one is due when the bucket is empty.
 */

#pragma once

#include <kcenon/database_load_tester/core/shutdown_signal.h>

#include <chrono>
#include <cstdint>
#include <mutex>

namespace database_load_tester::workload
{

/**
 * @struct rate_limit_config
 * @brief Configuration for the token bucket
 */
struct rate_limit_config
{
	double transactions_per_second = 0.0;  ///< Target rate; 0 disables limiting
	double initial_tokens = 1.0;           ///< Tokens available at construction
};

/**
 * @class rate_limiter
 * @brief Shared token bucket
 *
 * Thread Safety:
 * - All methods are thread-safe; one instance is shared by every worker
 *
 * Usage:
 * @code
 *   rate_limiter limiter({500.0});
 *   while (limiter.acquire(*signal))
 *   {
 *       run_transaction();
 *   }
 * @endcode
 */
class rate_limiter
{
public:
	using clock = std::chrono::steady_clock;

	explicit rate_limiter(const rate_limit_config& config);

	/**
	 * @brief Block until a token is available
	 * @param signal Stop signal that ends the wait early
	 * @return true if a token was taken, false if the signal fired
	 */
	bool acquire(core::shutdown_signal& signal);

	/**
	 * @brief Take a token if one is available right now
	 */
	bool try_acquire();

	[[nodiscard]] bool enabled() const noexcept { return rate_ > 0.0; }
	[[nodiscard]] double rate() const noexcept { return rate_; }
	[[nodiscard]] double capacity() const noexcept { return capacity_; }

	/**
	 * @brief Tokens currently in the bucket after refill
	 */
	[[nodiscard]] double available_tokens();

	/**
	 * @brief Tokens handed out since construction
	 */
	[[nodiscard]] uint64_t granted() const;

private:
	void refill_locked(clock::time_point now);

	double rate_;
	double capacity_;

	mutable std::mutex mutex_;
	double tokens_;
	clock::time_point last_refill_;
	uint64_t granted_ = 0;
};

} // namespace database_load_tester::workload

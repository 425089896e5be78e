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
 * @file rolling_tps_window.h
 * @brief Fixed-width time buckets for short-horizon throughput
 *
 * Each bucket covers bucket_width of wall time and holds the number of
 * transactions completed in it. The window is a ring: a bucket is reused
 * once its slot comes around again, so old counts expire on their own and
 * never need an explicit reset.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <vector>

namespace database_load_tester::metrics
{

/**
 * @class rolling_tps_window
 * @brief Ring of per-bucket transaction counts
 *
 * Rates are computed over completed buckets only; the bucket currently
 * filling is excluded so a partially elapsed bucket does not drag the rate
 * down.
 */
class rolling_tps_window
{
public:
	using clock = std::chrono::steady_clock;

	/**
	 * @param bucket_width Time span of one bucket (100 ms by default)
	 * @param bucket_count Number of buckets retained (horizon = width * count)
	 */
	explicit rolling_tps_window(std::chrono::milliseconds bucket_width = std::chrono::milliseconds(100),
								size_t bucket_count = 50);

	void record(uint64_t count = 1);
	void record_at(clock::time_point when, uint64_t count = 1);

	/**
	 * @brief Transactions per second over the most recent @p span
	 *
	 * @p span is rounded down to whole buckets and capped at the horizon
	 * minus the filling bucket.
	 */
	[[nodiscard]] double rate(std::chrono::milliseconds span) const;
	[[nodiscard]] double rate_at(clock::time_point now, std::chrono::milliseconds span) const;

	[[nodiscard]] clock::time_point origin() const noexcept { return origin_; }
	[[nodiscard]] std::chrono::milliseconds bucket_width() const noexcept { return bucket_width_; }
	[[nodiscard]] std::chrono::milliseconds horizon() const noexcept
	{
		return bucket_width_ * static_cast<int64_t>(buckets_.size());
	}

private:
	struct bucket
	{
		int64_t index = -1;   ///< Absolute bucket number; its end is (index + 1) * width
		uint64_t count = 0;
	};

	[[nodiscard]] int64_t bucket_index(clock::time_point when) const;

	std::chrono::milliseconds bucket_width_;
	clock::time_point origin_;
	mutable std::mutex mutex_;
	std::vector<bucket> buckets_;
};

} // namespace database_load_tester::metrics

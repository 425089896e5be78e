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
 * @file metrics_base.h
 * @brief Lock-free helpers shared by the statistics types
 *
 * Counters are updated with relaxed atomics from every worker thread. The
 * helpers here keep the compare-and-swap loops and the divide-by-zero
 * guards in one place.
 *
 * @code
 * std::atomic<uint64_t> min_us{metrics_utils::empty_min};
 * std::atomic<uint64_t> max_us{0};
 * metrics_utils::update_min_max(min_us, max_us, 1500);
 *
 * double tps = metrics_utils::per_second(transactions, elapsed);
 * @endcode
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>

namespace database_load_tester::metrics
{

/**
 * @struct metrics_utils
 * @brief Static helpers for atomic statistics
 */
struct metrics_utils
{
	/// Sentinel stored in a minimum tracker that has seen no sample
	static constexpr uint64_t empty_min = std::numeric_limits<uint64_t>::max();

	/**
	 * @brief Lower @p min_value to @p sample if smaller (CAS loop)
	 */
	static void update_min(std::atomic<uint64_t>& min_value, uint64_t sample) noexcept
	{
		uint64_t current = min_value.load(std::memory_order_relaxed);
		while (sample < current
			   && !min_value.compare_exchange_weak(current, sample, std::memory_order_relaxed))
		{
		}
	}

	/**
	 * @brief Raise @p max_value to @p sample if larger (CAS loop)
	 */
	static void update_max(std::atomic<uint64_t>& max_value, uint64_t sample) noexcept
	{
		uint64_t current = max_value.load(std::memory_order_relaxed);
		while (sample > current
			   && !max_value.compare_exchange_weak(current, sample, std::memory_order_relaxed))
		{
		}
	}

	static void update_min_max(std::atomic<uint64_t>& min_value, std::atomic<uint64_t>& max_value,
							   uint64_t sample) noexcept
	{
		update_min(min_value, sample);
		update_max(max_value, sample);
	}

	/**
	 * @brief Zero a counter and return the value it held
	 *
	 * Increments racing with the exchange land either in the returned value
	 * or in the fresh count, never in neither.
	 */
	static uint64_t take(std::atomic<uint64_t>& counter) noexcept
	{
		return counter.exchange(0, std::memory_order_acq_rel);
	}

	/**
	 * @brief Events per second over an elapsed duration
	 * @return 0.0 when no time has elapsed
	 */
	template <typename Rep, typename Period>
	[[nodiscard]] static double per_second(uint64_t events,
										   std::chrono::duration<Rep, Period> elapsed) noexcept
	{
		double seconds = std::chrono::duration<double>(elapsed).count();
		if (seconds <= 0.0)
		{
			return 0.0;
		}
		return static_cast<double>(events) / seconds;
	}

	/**
	 * @brief Average of accumulated microseconds in milliseconds
	 */
	[[nodiscard]] static double average_us_to_ms(uint64_t total_us, uint64_t count) noexcept
	{
		if (count == 0)
		{
			return 0.0;
		}
		return static_cast<double>(total_us) / static_cast<double>(count) / 1000.0;
	}

	/**
	 * @brief Percentage of @p part in @p whole, 100.0 when @p whole is zero
	 */
	[[nodiscard]] static double percentage(uint64_t part, uint64_t whole) noexcept
	{
		if (whole == 0)
		{
			return 100.0;
		}
		return static_cast<double>(part) * 100.0 / static_cast<double>(whole);
	}
};

} // namespace database_load_tester::metrics

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
 * @file latency_reservoir.h
 * @brief Bounded buffer of recent latency samples for percentile estimation
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <vector>

namespace database_load_tester::metrics
{

/**
 * @struct latency_percentiles
 * @brief Order statistics over the retained samples, in milliseconds
 */
struct latency_percentiles
{
	size_t sample_count = 0;
	double p50_ms = 0.0;
	double p95_ms = 0.0;
	double p99_ms = 0.0;
};

/**
 * @class latency_reservoir
 * @brief Ring buffer keeping the most recent latency samples
 *
 * Once full, each new sample overwrites the oldest one, so memory stays
 * bounded during long tests and percentiles track recent behaviour.
 * Reading never evicts.
 */
class latency_reservoir
{
public:
	static constexpr size_t default_capacity = 10000;

	explicit latency_reservoir(size_t capacity = default_capacity);

	void add(std::chrono::microseconds latency);

	/**
	 * @brief Compute p50/p95/p99 over a sorted copy of the buffer
	 */
	[[nodiscard]] latency_percentiles percentiles() const;

	/**
	 * @brief Copy of the retained samples in microseconds, unordered
	 */
	[[nodiscard]] std::vector<uint64_t> samples() const;

	[[nodiscard]] size_t size() const;
	[[nodiscard]] size_t capacity() const noexcept { return capacity_; }

	void clear();

	/**
	 * @brief Nearest-rank percentile of an ascending sample set
	 * @param sorted Samples sorted ascending
	 * @param fraction Percentile as a fraction (0.95 for p95)
	 * @return Sample at rank ceil(fraction * n), or 0 for an empty set
	 */
	[[nodiscard]] static uint64_t nearest_rank(const std::vector<uint64_t>& sorted,
											   double fraction);

private:
	size_t capacity_;
	mutable std::mutex mutex_;
	std::vector<uint64_t> buffer_;
	size_t next_ = 0;
};

} // namespace database_load_tester::metrics

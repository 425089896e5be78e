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

#include <kcenon/database_load_tester/metrics/latency_reservoir.h>

#include <algorithm>
#include <cmath>

namespace database_load_tester::metrics
{

latency_reservoir::latency_reservoir(size_t capacity) : capacity_(std::max<size_t>(capacity, 1))
{
	buffer_.reserve(capacity_);
}

void latency_reservoir::add(std::chrono::microseconds latency)
{
	auto sample = static_cast<uint64_t>(std::max<int64_t>(latency.count(), 0));

	std::lock_guard<std::mutex> lock(mutex_);
	if (buffer_.size() < capacity_)
	{
		buffer_.push_back(sample);
		return;
	}

	buffer_[next_] = sample;
	next_ = (next_ + 1) % capacity_;
}

latency_percentiles latency_reservoir::percentiles() const
{
	auto sorted = samples();
	std::sort(sorted.begin(), sorted.end());

	latency_percentiles result;
	result.sample_count = sorted.size();
	result.p50_ms = static_cast<double>(nearest_rank(sorted, 0.50)) / 1000.0;
	result.p95_ms = static_cast<double>(nearest_rank(sorted, 0.95)) / 1000.0;
	result.p99_ms = static_cast<double>(nearest_rank(sorted, 0.99)) / 1000.0;
	return result;
}

std::vector<uint64_t> latency_reservoir::samples() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return buffer_;
}

size_t latency_reservoir::size() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return buffer_.size();
}

void latency_reservoir::clear()
{
	std::lock_guard<std::mutex> lock(mutex_);
	buffer_.clear();
	next_ = 0;
}

uint64_t latency_reservoir::nearest_rank(const std::vector<uint64_t>& sorted, double fraction)
{
	if (sorted.empty())
	{
		return 0;
	}

	// Tolerance keeps 0.95 * 100 from rounding up to rank 96
	auto rank = static_cast<size_t>(std::ceil(fraction * static_cast<double>(sorted.size()) - 1e-9));
	rank = std::clamp<size_t>(rank, 1, sorted.size());
	return sorted[rank - 1];
}

} // namespace database_load_tester::metrics

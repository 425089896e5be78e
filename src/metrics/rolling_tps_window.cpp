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

#include <kcenon/database_load_tester/metrics/rolling_tps_window.h>

#include <algorithm>

namespace database_load_tester::metrics
{

rolling_tps_window::rolling_tps_window(std::chrono::milliseconds bucket_width, size_t bucket_count)
	: bucket_width_(std::max(bucket_width, std::chrono::milliseconds(1)))
	, origin_(clock::now())
	, buckets_(std::max<size_t>(bucket_count, 2))
{
}

void rolling_tps_window::record(uint64_t count)
{
	record_at(clock::now(), count);
}

void rolling_tps_window::record_at(clock::time_point when, uint64_t count)
{
	auto index = bucket_index(when);
	if (index < 0)
	{
		return;
	}

	std::lock_guard<std::mutex> lock(mutex_);
	auto& slot = buckets_[static_cast<size_t>(index) % buckets_.size()];
	if (slot.index != index)
	{
		if (slot.index > index)
		{
			// Sample older than the slot's current bucket; already expired
			return;
		}
		slot.index = index;
		slot.count = 0;
	}
	slot.count += count;
}

double rolling_tps_window::rate(std::chrono::milliseconds span) const
{
	return rate_at(clock::now(), span);
}

double rolling_tps_window::rate_at(clock::time_point now, std::chrono::milliseconds span) const
{
	auto current = bucket_index(now);
	auto wanted = static_cast<int64_t>(span / bucket_width_);
	auto available = std::min<int64_t>(current, static_cast<int64_t>(buckets_.size()) - 1);
	auto used = std::min(wanted, available);
	if (used <= 0)
	{
		return 0.0;
	}

	uint64_t total = 0;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		for (const auto& slot : buckets_)
		{
			if (slot.index >= current - used && slot.index < current)
			{
				total += slot.count;
			}
		}
	}

	double seconds = std::chrono::duration<double>(bucket_width_ * used).count();
	return static_cast<double>(total) / seconds;
}

int64_t rolling_tps_window::bucket_index(clock::time_point when) const
{
	if (when < origin_)
	{
		return -1;
	}
	return static_cast<int64_t>((when - origin_) / bucket_width_);
}

} // namespace database_load_tester::metrics

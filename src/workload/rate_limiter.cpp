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

#include <kcenon/database_load_tester/workload/rate_limiter.h>

#include <algorithm>

namespace database_load_tester::workload
{

rate_limiter::rate_limiter(const rate_limit_config& config)
	: rate_(std::max(config.transactions_per_second, 0.0))
	, capacity_(std::max(rate_, 1.0))
	, tokens_(std::clamp(config.initial_tokens, 0.0, capacity_))
	, last_refill_(clock::now())
{
}

bool rate_limiter::acquire(core::shutdown_signal& signal)
{
	if (!enabled())
	{
		return !signal.is_cancelled();
	}

	while (!signal.is_cancelled())
	{
		std::chrono::duration<double> wait{0.0};
		{
			std::lock_guard<std::mutex> lock(mutex_);
			refill_locked(clock::now());
			if (tokens_ >= 1.0)
			{
				tokens_ -= 1.0;
				++granted_;
				return true;
			}
			wait = std::chrono::duration<double>((1.0 - tokens_) / rate_);
		}

		if (signal.wait_for(std::chrono::duration_cast<clock::duration>(wait)))
		{
			return false;
		}
	}

	return false;
}

bool rate_limiter::try_acquire()
{
	if (!enabled())
	{
		return true;
	}

	std::lock_guard<std::mutex> lock(mutex_);
	refill_locked(clock::now());
	if (tokens_ < 1.0)
	{
		return false;
	}

	tokens_ -= 1.0;
	++granted_;
	return true;
}

double rate_limiter::available_tokens()
{
	std::lock_guard<std::mutex> lock(mutex_);
	refill_locked(clock::now());
	return tokens_;
}

uint64_t rate_limiter::granted() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return granted_;
}

void rate_limiter::refill_locked(clock::time_point now)
{
	if (now <= last_refill_)
	{
		return;
	}

	double elapsed = std::chrono::duration<double>(now - last_refill_).count();
	tokens_ = std::min(capacity_, tokens_ + elapsed * rate_);
	last_refill_ = now;
}

} // namespace database_load_tester::workload

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

#include <kcenon/database_load_tester/core/shutdown_signal.h>

namespace database_load_tester::core
{

shutdown_signal::shutdown_signal() : token_(kcenon::thread::cancellation_token::create())
{
}

void shutdown_signal::cancel()
{
	{
		std::lock_guard<std::mutex> lock(mutex_);
		token_.cancel();
	}
	condition_.notify_all();
}

bool shutdown_signal::is_cancelled() const
{
	return token_.is_cancelled();
}

bool shutdown_signal::wait_for(std::chrono::steady_clock::duration duration)
{
	return wait_until(std::chrono::steady_clock::now() + duration);
}

bool shutdown_signal::wait_until(std::chrono::steady_clock::time_point deadline)
{
	std::unique_lock<std::mutex> lock(mutex_);
	return condition_.wait_until(lock, deadline, [this]() { return token_.is_cancelled(); });
}

} // namespace database_load_tester::core

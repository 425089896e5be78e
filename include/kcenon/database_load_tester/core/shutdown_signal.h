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
 * @file shutdown_signal.h
 * @brief Process-wide stop signal shared by every load test component
 *
 * A single shutdown_signal instance is created by the controller and handed
 * to the pool, the workers, the rate limiter and the reporter. Cancelling it
 * wakes every thread blocked in wait_for() so that shutdown completes in
 * bounded time.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

#include <kcenon/thread/core/cancellation_token.h>

namespace database_load_tester::core
{

/**
 * @class shutdown_signal
 * @brief Cancellation token with interruptible timed waits
 *
 * Thread Safety:
 * - cancel(), is_cancelled() and wait_for() may be called from any thread
 * - cancel() is idempotent
 *
 * Usage:
 * @code
 *   auto signal = std::make_shared<shutdown_signal>();
 *   while (!signal->is_cancelled())
 *   {
 *       do_work();
 *       if (signal->wait_for(std::chrono::milliseconds(100)))
 *       {
 *           break; // cancelled while sleeping
 *       }
 *   }
 * @endcode
 */
class shutdown_signal
{
public:
	shutdown_signal();
	~shutdown_signal() = default;

	shutdown_signal(const shutdown_signal&) = delete;
	shutdown_signal& operator=(const shutdown_signal&) = delete;
	shutdown_signal(shutdown_signal&&) = delete;
	shutdown_signal& operator=(shutdown_signal&&) = delete;

	/**
	 * @brief Fire the signal and wake all waiters
	 */
	void cancel();

	/**
	 * @brief Check whether the signal has fired
	 */
	[[nodiscard]] bool is_cancelled() const;

	/**
	 * @brief Sleep for up to @p duration
	 * @param duration Maximum time to wait
	 * @return true if the signal fired before or during the wait
	 */
	bool wait_for(std::chrono::steady_clock::duration duration);

	/**
	 * @brief Sleep until @p deadline
	 * @return true if the signal fired before or during the wait
	 */
	bool wait_until(std::chrono::steady_clock::time_point deadline);

private:
	kcenon::thread::cancellation_token token_;
	mutable std::mutex mutex_;
	std::condition_variable condition_;
};

} // namespace database_load_tester::core

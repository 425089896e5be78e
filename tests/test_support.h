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
 * @file test_support.h
 * @brief In-process fakes shared by the unit and integration tests
 */

#pragma once

#include <kcenon/database_load_tester/adapters/database_adapter.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <kcenon/common/interfaces/logger_interface.h>

namespace database_load_tester::test_support
{

/**
 * @class capture_logger
 * @brief ILogger that keeps every message for inspection
 */
class capture_logger : public kcenon::common::interfaces::ILogger
{
public:
	struct entry
	{
		kcenon::common::interfaces::log_level level;
		std::string message;
	};

	kcenon::common::VoidResult log(kcenon::common::interfaces::log_level level,
								   const std::string& message) override
	{
		std::lock_guard<std::mutex> lock(mutex_);
		entries_.push_back({level, message});
		return kcenon::common::ok();
	}

	kcenon::common::VoidResult log(kcenon::common::interfaces::log_level level,
								   std::string_view message,
								   const kcenon::common::source_location& /*loc*/
								   = kcenon::common::source_location::current()) override
	{
		return log(level, std::string(message));
	}

	kcenon::common::VoidResult log(const kcenon::common::interfaces::log_entry& entry) override
	{
		return log(entry.level, entry.message);
	}

	bool is_enabled(kcenon::common::interfaces::log_level /*level*/) const override
	{
		return true;
	}

	kcenon::common::VoidResult set_level(kcenon::common::interfaces::log_level level) override
	{
		level_ = level;
		return kcenon::common::ok();
	}

	kcenon::common::interfaces::log_level get_level() const override { return level_; }

	kcenon::common::VoidResult flush() override { return kcenon::common::ok(); }

	std::vector<entry> entries() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return entries_;
	}

	size_t count(kcenon::common::interfaces::log_level level, const std::string& fragment) const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return static_cast<size_t>(
			std::count_if(entries_.begin(), entries_.end(),
						  [&](const entry& e)
						  { return e.level == level && e.message.find(fragment) != std::string::npos; }));
	}

	void clear()
	{
		std::lock_guard<std::mutex> lock(mutex_);
		entries_.clear();
	}

private:
	mutable std::mutex mutex_;
	std::vector<entry> entries_;
	kcenon::common::interfaces::log_level level_ = kcenon::common::interfaces::log_level::debug;
};

/**
 * @class scripted_adapter
 * @brief Adapter whose open/liveness/execute outcomes are set by the test
 *
 * kill_connections() marks every connection opened so far as dead, which
 * is what a backend restart looks like from the pool's side.
 */
class scripted_adapter : public adapters::database_adapter
{
public:
	struct connection : adapters::adapter_connection
	{
		uint64_t generation = 0;
		std::atomic<bool> closed{false};
	};

	kcenon::common::Result<std::shared_ptr<adapters::adapter_connection>> open() override
	{
		open_calls.fetch_add(1);
		if (fail_opens.load())
		{
			return kcenon::common::error_info{-1, "open refused", "scripted_adapter"};
		}
		if (failures_before_open.load() > 0)
		{
			failures_before_open.fetch_sub(1);
			return kcenon::common::error_info{-1, "transient open failure", "scripted_adapter"};
		}

		auto opened = std::make_shared<connection>();
		opened->generation = generation.load();
		live.fetch_add(1);
		return std::shared_ptr<adapters::adapter_connection>(std::move(opened));
	}

	bool is_alive(adapters::adapter_connection& handle) override
	{
		liveness_checks.fetch_add(1);
		auto& conn = static_cast<connection&>(handle);
		return !conn.closed && conn.generation == generation.load();
	}

	kcenon::common::Result<adapters::operation_result> execute(
		adapters::adapter_connection& handle,
		adapters::operation_kind /*kind*/,
		const adapters::transaction_payload& payload) override
	{
		executed.fetch_add(1);
		if (!is_alive(handle) || fail_executes.load())
		{
			return kcenon::common::error_info{-1, "execute failed", "scripted_adapter"};
		}

		adapters::operation_result result;
		result.affected_rows = 1;
		result.data = payload.data;
		return result;
	}

	kcenon::common::Result<adapters::operation_result> execute_batch(
		adapters::adapter_connection& handle,
		const std::vector<adapters::transaction_payload>& rows) override
	{
		executed.fetch_add(1);
		batches.fetch_add(1);
		if (!is_alive(handle) || fail_executes.load())
		{
			return kcenon::common::error_info{-1, "batch failed", "scripted_adapter"};
		}

		adapters::operation_result result;
		result.affected_rows = rows.size();
		return result;
	}

	void close(adapters::adapter_connection& handle) override
	{
		auto& conn = static_cast<connection&>(handle);
		if (!conn.closed.exchange(true))
		{
			closes.fetch_add(1);
			live.fetch_sub(1);
		}
	}

	std::string name() const override { return "scripted"; }

	void kill_connections() { generation.fetch_add(1); }

	std::atomic<bool> fail_opens{false};
	std::atomic<bool> fail_executes{false};
	std::atomic<int> failures_before_open{0};
	std::atomic<uint64_t> generation{0};

	std::atomic<int> open_calls{0};
	std::atomic<int> liveness_checks{0};
	std::atomic<int> executed{0};
	std::atomic<int> batches{0};
	std::atomic<int> closes{0};
	std::atomic<int> live{0};
};

} // namespace database_load_tester::test_support

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

#include <kcenon/database_load_tester/adapters/simulated_adapter.h>

#include <random>
#include <thread>
#include <unordered_set>

namespace database_load_tester::adapters
{

namespace
{

std::mt19937_64& local_engine()
{
	thread_local std::mt19937_64 engine{std::random_device{}()};
	return engine;
}

kcenon::common::error_info simulated_error(const std::string& message)
{
	return kcenon::common::error_info{-1, message, "simulated_adapter"};
}

} // namespace

simulated_adapter::simulated_adapter(simulated_config config) : config_(config)
{
}

kcenon::common::Result<std::shared_ptr<adapter_connection>> simulated_adapter::open()
{
	simulate_latency(config_.open_latency);

	if (!is_available())
	{
		return simulated_error("Backend unavailable");
	}

	auto connection = std::make_shared<simulated_connection>();
	connection->generation = generation_.load();
	open_connections_.fetch_add(1);
	total_opened_.fetch_add(1);

	return std::shared_ptr<adapter_connection>(std::move(connection));
}

bool simulated_adapter::is_alive(adapter_connection& connection)
{
	auto& simulated = static_cast<simulated_connection&>(connection);
	return connection_usable(simulated);
}

kcenon::common::Result<operation_result> simulated_adapter::execute(
	adapter_connection& connection, operation_kind kind, const transaction_payload& payload)
{
	auto& simulated = static_cast<simulated_connection&>(connection);

	simulate_latency(config_.operation_latency);

	if (!connection_usable(simulated))
	{
		return simulated_error("Connection lost");
	}

	if (config_.failure_rate > 0.0)
	{
		std::uniform_real_distribution<double> dist(0.0, 1.0);
		if (dist(local_engine()) < config_.failure_rate)
		{
			return simulated_error("Injected operation failure");
		}
	}

	total_executed_.fetch_add(1);

	operation_result result;
	std::lock_guard<std::mutex> lock(rows_mutex_);

	switch (kind)
	{
	case operation_kind::insert:
	{
		auto [it, inserted] = rows_.emplace(payload.record_id, payload.data);
		if (!inserted)
		{
			return simulated_error("Duplicate key " + std::to_string(payload.record_id));
		}
		result.affected_rows = 1;
		break;
	}
	case operation_kind::select:
	{
		auto it = rows_.find(payload.record_id);
		if (it != rows_.end())
		{
			result.affected_rows = 1;
			result.data = corrupt_reads_.load() ? it->second + "#" : it->second;
		}
		break;
	}
	case operation_kind::update:
	{
		auto it = rows_.find(payload.record_id);
		if (it != rows_.end())
		{
			it->second = payload.data;
			result.affected_rows = 1;
		}
		break;
	}
	case operation_kind::remove:
		result.affected_rows = rows_.erase(payload.record_id);
		break;
	}

	return result;
}

kcenon::common::Result<operation_result> simulated_adapter::execute_batch(
	adapter_connection& connection, const std::vector<transaction_payload>& rows)
{
	auto& simulated = static_cast<simulated_connection&>(connection);

	simulate_latency(config_.operation_latency);

	if (!connection_usable(simulated))
	{
		return simulated_error("Connection lost");
	}

	if (config_.failure_rate > 0.0)
	{
		std::uniform_real_distribution<double> dist(0.0, 1.0);
		if (dist(local_engine()) < config_.failure_rate)
		{
			return simulated_error("Injected operation failure");
		}
	}

	std::lock_guard<std::mutex> lock(rows_mutex_);

	// All or nothing: reject the batch before touching the table
	std::unordered_set<int64_t> batch_ids;
	for (const auto& row : rows)
	{
		if (rows_.count(row.record_id) > 0 || !batch_ids.insert(row.record_id).second)
		{
			return simulated_error("Duplicate key " + std::to_string(row.record_id));
		}
	}

	for (const auto& row : rows)
	{
		rows_.emplace(row.record_id, row.data);
	}
	total_executed_.fetch_add(rows.size());

	operation_result result;
	result.affected_rows = rows.size();
	return result;
}

void simulated_adapter::close(adapter_connection& connection)
{
	auto& simulated = static_cast<simulated_connection&>(connection);
	if (simulated.closed.exchange(true))
	{
		return;
	}

	open_connections_.fetch_sub(1);
}

void simulated_adapter::begin_outage()
{
	std::lock_guard<std::mutex> lock(outage_mutex_);
	in_outage_ = true;
	outage_until_ = std::chrono::steady_clock::time_point::max();
	generation_.fetch_add(1);
}

void simulated_adapter::end_outage()
{
	std::lock_guard<std::mutex> lock(outage_mutex_);
	in_outage_ = false;
}

void simulated_adapter::fail_for(std::chrono::milliseconds duration)
{
	std::lock_guard<std::mutex> lock(outage_mutex_);
	in_outage_ = true;
	outage_until_ = std::chrono::steady_clock::now() + duration;
	generation_.fetch_add(1);
}

bool simulated_adapter::is_available() const
{
	std::lock_guard<std::mutex> lock(outage_mutex_);
	if (in_outage_ && std::chrono::steady_clock::now() >= outage_until_)
	{
		in_outage_ = false;
	}
	return !in_outage_;
}

size_t simulated_adapter::row_count() const
{
	std::lock_guard<std::mutex> lock(rows_mutex_);
	return rows_.size();
}

void simulated_adapter::simulate_latency(std::chrono::microseconds base) const
{
	auto delay = base;
	if (config_.latency_jitter.count() > 0)
	{
		std::uniform_int_distribution<int64_t> dist(0, config_.latency_jitter.count());
		delay += std::chrono::microseconds(dist(local_engine()));
	}

	if (delay.count() > 0)
	{
		std::this_thread::sleep_for(delay);
	}
}

bool simulated_adapter::connection_usable(const simulated_connection& connection) const
{
	return !connection.closed && connection.generation == generation_.load() && is_available();
}

} // namespace database_load_tester::adapters

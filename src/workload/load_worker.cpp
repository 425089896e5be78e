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

#include <kcenon/database_load_tester/workload/load_worker.h>

#include <iomanip>
#include <sstream>
#include <vector>

namespace database_load_tester::workload
{

namespace
{

using kcenon::common::interfaces::log_level;
using clock_type = std::chrono::steady_clock;

std::chrono::microseconds elapsed_since(clock_type::time_point started)
{
	return std::chrono::duration_cast<std::chrono::microseconds>(clock_type::now() - started);
}

} // namespace

load_worker::load_worker(worker_config config,
						 std::shared_ptr<pooling::connection_pool> pool,
						 std::shared_ptr<adapters::database_adapter> adapter,
						 std::shared_ptr<metrics::stats_aggregator> stats,
						 std::shared_ptr<payload_generator> generator,
						 std::shared_ptr<core::shutdown_signal> signal,
						 std::shared_ptr<rate_limiter> limiter)
	: config_(std::move(config))
	, pool_(std::move(pool))
	, adapter_(std::move(adapter))
	, stats_(std::move(stats))
	, generator_(std::move(generator))
	, signal_(std::move(signal))
	, limiter_(std::move(limiter))
	, backoff_(config_.backoff)
{
}

void load_worker::run()
{
	state_ = worker_state::running;
	log(log_level::debug, config_.name + " started");

	while (!signal_->is_cancelled())
	{
		if (limiter_ && !limiter_->acquire(*signal_))
		{
			break;
		}

		auto acquired = pool_->acquire(config_.name, config_.acquire_wait);
		if (acquired.is_err())
		{
			const auto& error = acquired.error();
			if (!pooling::is_recoverable(error))
			{
				break;
			}

			acquire_failures_.fetch_add(1, std::memory_order_relaxed);
			auto pause = backoff_.on_failure();

			std::ostringstream oss;
			oss << "Connection acquire failed (" << backoff_.consecutive_failures()
				<< " consecutive): " << error.message << "; retrying in " << pause.count() << "ms";
			report_error(oss.str());

			if (signal_->wait_for(pause))
			{
				break;
			}
			continue;
		}

		backoff_.on_success();
		auto connection = acquired.value();

		auto result = execute_transaction(*connection);

		auto mode = result == outcome::error ? pooling::release_mode::validate
											 : pooling::release_mode::reuse;
		auto released = pool_->release(connection, mode);
		if (released.is_err())
		{
			log(log_level::warning, config_.name + ": " + released.error().message);
		}
	}

	state_ = worker_state::stopping;
	log(log_level::debug, config_.name + " stopping after " + std::to_string(transactions_.load())
							  + " transactions");
	state_ = worker_state::stopped;
}

worker_counters load_worker::counters() const noexcept
{
	worker_counters snapshot;
	snapshot.transactions = transactions_.load(std::memory_order_relaxed);
	snapshot.errors = errors_.load(std::memory_order_relaxed);
	snapshot.verification_failures = verification_failures_.load(std::memory_order_relaxed);
	snapshot.acquire_failures = acquire_failures_.load(std::memory_order_relaxed);
	return snapshot;
}

void load_worker::set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
{
	logger_ = std::move(logger);
}

std::string load_worker::make_name(size_t index)
{
	std::ostringstream oss;
	oss << "Worker-" << std::setw(4) << std::setfill('0') << index;
	return oss.str();
}

load_worker::outcome load_worker::execute_transaction(pooling::pooled_connection& connection)
{
	try
	{
		if (config_.mode == operation_mode::full)
		{
			return execute_full(connection);
		}
		return execute_single(connection);
	}
	catch (const std::exception& e)
	{
		return fail(std::string("Transaction threw: ") + e.what());
	}
}

load_worker::outcome load_worker::execute_full(pooling::pooled_connection& connection)
{
	auto payload = generator_->next_insert(config_.name);
	auto started = clock_type::now();

	auto inserted = adapter_->execute(connection.handle(), adapters::operation_kind::insert, payload);
	if (inserted.is_err())
	{
		return fail("Insert of id " + std::to_string(payload.record_id)
					+ " failed: " + inserted.error().message);
	}

	auto read = adapter_->execute(connection.handle(), adapters::operation_kind::select, payload);
	if (read.is_err())
	{
		return fail("Select of id " + std::to_string(payload.record_id)
					+ " failed: " + read.error().message);
	}

	const auto& row = read.value();
	if (!row.data || *row.data != payload.data)
	{
		stats_->record_verification_failure();
		verification_failures_.fetch_add(1, std::memory_order_relaxed);
		report_error("Verification failed for id " + std::to_string(payload.record_id)
					 + (row.data ? ": data mismatch" : ": row not found"));
		return outcome::verification_failed;
	}

	stats_->record_full_cycle(elapsed_since(started));
	transactions_.fetch_add(1, std::memory_order_relaxed);
	return outcome::success;
}

load_worker::outcome load_worker::execute_single(pooling::pooled_connection& connection)
{
	auto kind = pick_operation(config_.mode, payload_generator::thread_engine());
	if (kind == adapters::operation_kind::insert && config_.batch_size > 1)
	{
		return execute_batch(connection);
	}

	auto payload = generator_->next(kind, config_.name);

	auto started = clock_type::now();
	auto result = adapter_->execute(connection.handle(), kind, payload);
	if (result.is_err())
	{
		return fail(std::string(adapters::to_string(kind)) + " of id "
					+ std::to_string(payload.record_id) + " failed: " + result.error().message);
	}

	stats_->record_transaction(kind, elapsed_since(started));
	transactions_.fetch_add(1, std::memory_order_relaxed);
	return outcome::success;
}

load_worker::outcome load_worker::execute_batch(pooling::pooled_connection& connection)
{
	std::vector<adapters::transaction_payload> rows;
	rows.reserve(config_.batch_size);
	for (size_t i = 0; i < config_.batch_size; ++i)
	{
		rows.push_back(generator_->next_insert(config_.name));
	}

	auto started = clock_type::now();
	auto result = adapter_->execute_batch(connection.handle(), rows);
	if (result.is_err())
	{
		return fail("Batch insert of " + std::to_string(rows.size()) + " rows from id "
					+ std::to_string(rows.front().record_id) + " failed: " + result.error().message);
	}

	stats_->record_batch_insert(rows.size(), elapsed_since(started));
	transactions_.fetch_add(1, std::memory_order_relaxed);
	return outcome::success;
}

load_worker::outcome load_worker::fail(const std::string& message)
{
	stats_->record_error();
	errors_.fetch_add(1, std::memory_order_relaxed);
	report_error(message);
	return outcome::error;
}

void load_worker::report_error(const std::string& message)
{
	auto now = clock_type::now();
	if (last_error_log_ && now - *last_error_log_ < config_.error_log_interval)
	{
		++suppressed_errors_;
		log(log_level::debug, config_.name + ": " + message);
		return;
	}

	std::string line = config_.name + ": " + message;
	if (suppressed_errors_ > 0)
	{
		line += " (suppressed " + std::to_string(suppressed_errors_) + " similar errors)";
	}
	log(log_level::warning, line);

	last_error_log_ = now;
	suppressed_errors_ = 0;
}

void load_worker::log(kcenon::common::interfaces::log_level level,
					  const std::string& message) const
{
	if (logger_)
	{
		logger_->log(level, message);
	}
}

} // namespace database_load_tester::workload

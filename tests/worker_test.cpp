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
 * @file worker_test.cpp
 * @brief Unit tests for the workload components
 *
 * Tests cover:
 * - retry_backoff escalation and reset-on-success
 * - operation_mode parsing and the mixed-mode weights
 * - payload_generator id allocation
 * - load_worker transaction accounting, error throttling and recovery
 */

#include <gtest/gtest.h>

#include "test_support.h"

#include <kcenon/database_load_tester/adapters/simulated_adapter.h>
#include <kcenon/database_load_tester/workload/load_worker.h>

#include <atomic>
#include <cctype>
#include <chrono>
#include <map>
#include <set>
#include <thread>
#include <vector>

using namespace database_load_tester;
using namespace database_load_tester::workload;
using database_load_tester::test_support::capture_logger;
using database_load_tester::test_support::scripted_adapter;
using kcenon::common::interfaces::log_level;

namespace
{

template <typename Predicate>
bool wait_until(Predicate predicate, std::chrono::milliseconds timeout)
{
	auto deadline = std::chrono::steady_clock::now() + timeout;
	while (std::chrono::steady_clock::now() < deadline)
	{
		if (predicate())
		{
			return true;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(5));
	}
	return predicate();
}

} // namespace

// ============================================================================
// Retry Backoff Tests
// ============================================================================

TEST(RetryBackoffTest, FirstFailurePausesWithoutEscalating)
{
	retry_backoff backoff;

	EXPECT_EQ(backoff.on_failure(), std::chrono::milliseconds(1000));
	EXPECT_EQ(backoff.consecutive_failures(), 1u);
	EXPECT_EQ(backoff.current_backoff(), std::chrono::milliseconds(100));
}

TEST(RetryBackoffTest, RepeatedFailuresDoubleUpToCeiling)
{
	retry_backoff backoff;

	backoff.on_failure();
	EXPECT_EQ(backoff.on_failure(), std::chrono::milliseconds(100));
	EXPECT_EQ(backoff.on_failure(), std::chrono::milliseconds(200));
	EXPECT_EQ(backoff.on_failure(), std::chrono::milliseconds(400));
	EXPECT_EQ(backoff.on_failure(), std::chrono::milliseconds(800));
	EXPECT_EQ(backoff.on_failure(), std::chrono::milliseconds(1600));
	EXPECT_EQ(backoff.on_failure(), std::chrono::milliseconds(3200));
	EXPECT_EQ(backoff.on_failure(), std::chrono::milliseconds(5000));
	EXPECT_EQ(backoff.on_failure(), std::chrono::milliseconds(5000));
}

TEST(RetryBackoffTest, SingleSuccessResetsAfterAnyNumberOfFailures)
{
	for (uint32_t failures = 1; failures <= 40; ++failures)
	{
		retry_backoff backoff;
		for (uint32_t i = 0; i < failures; ++i)
		{
			backoff.on_failure();
		}

		backoff.on_success();

		EXPECT_EQ(backoff.consecutive_failures(), 0u) << "after " << failures << " failures";
		EXPECT_EQ(backoff.current_backoff(), backoff.config().floor)
			<< "after " << failures << " failures";
		EXPECT_EQ(backoff.on_failure(), backoff.config().first_failure_pause);
	}
}

TEST(RetryBackoffTest, CustomConfiguration)
{
	backoff_config config;
	config.floor = std::chrono::milliseconds(10);
	config.ceiling = std::chrono::milliseconds(25);
	config.first_failure_pause = std::chrono::milliseconds(5);
	config.escalation_threshold = 1;

	retry_backoff backoff(config);
	EXPECT_EQ(backoff.on_failure(), std::chrono::milliseconds(10));
	EXPECT_EQ(backoff.on_failure(), std::chrono::milliseconds(20));
	EXPECT_EQ(backoff.on_failure(), std::chrono::milliseconds(25));
}

// ============================================================================
// Operation Mode Tests
// ============================================================================

TEST(OperationModeTest, ParsesEveryModeName)
{
	for (auto mode : {operation_mode::full, operation_mode::insert_only,
					  operation_mode::select_only, operation_mode::update_only,
					  operation_mode::delete_only, operation_mode::mixed})
	{
		auto parsed = parse_operation_mode(to_string(mode));
		ASSERT_TRUE(parsed.has_value()) << to_string(mode);
		EXPECT_EQ(*parsed, mode);
	}

	EXPECT_FALSE(parse_operation_mode("insert").has_value());
	EXPECT_FALSE(parse_operation_mode("").has_value());
}

TEST(OperationModeTest, SingleOperationModesPickTheirKind)
{
	auto& engine = payload_generator::thread_engine();

	EXPECT_EQ(pick_operation(operation_mode::insert_only, engine), adapters::operation_kind::insert);
	EXPECT_EQ(pick_operation(operation_mode::select_only, engine), adapters::operation_kind::select);
	EXPECT_EQ(pick_operation(operation_mode::update_only, engine), adapters::operation_kind::update);
	EXPECT_EQ(pick_operation(operation_mode::delete_only, engine), adapters::operation_kind::remove);
	EXPECT_TRUE(needs_existing_rows(operation_mode::mixed));
	EXPECT_FALSE(needs_existing_rows(operation_mode::full));
}

TEST(OperationModeTest, MixedModeFollowsSixThreeOneWeights)
{
	std::mt19937_64 engine(42);
	std::map<adapters::operation_kind, int> counts;

	constexpr int draws = 100000;
	for (int i = 0; i < draws; ++i)
	{
		counts[pick_operation(operation_mode::mixed, engine)]++;
	}

	EXPECT_EQ(counts[adapters::operation_kind::select], 0);
	EXPECT_NEAR(counts[adapters::operation_kind::insert] / double(draws), 0.6, 0.02);
	EXPECT_NEAR(counts[adapters::operation_kind::update] / double(draws), 0.3, 0.02);
	EXPECT_NEAR(counts[adapters::operation_kind::remove] / double(draws), 0.1, 0.02);
}

// ============================================================================
// Payload Generator Tests
// ============================================================================

TEST(PayloadGeneratorTest, InsertIdsAreUniqueAcrossThreads)
{
	payload_config config;
	config.data_length = 8;
	payload_generator generator(config);

	std::vector<std::vector<int64_t>> per_thread(8);
	std::vector<std::thread> threads;
	for (size_t t = 0; t < per_thread.size(); ++t)
	{
		threads.emplace_back(
			[&, t]()
			{
				for (int i = 0; i < 1000; ++i)
				{
					per_thread[t].push_back(generator.next_insert("w").record_id);
				}
			});
	}
	for (auto& thread : threads)
	{
		thread.join();
	}

	std::set<int64_t> ids;
	for (const auto& list : per_thread)
	{
		ids.insert(list.begin(), list.end());
	}
	EXPECT_EQ(ids.size(), 8000u);
	EXPECT_EQ(*ids.begin(), 1);
	EXPECT_EQ(generator.max_known_id(), 8000);
}

TEST(PayloadGeneratorTest, ExistingIdsStayWithinKnownRange)
{
	payload_config config;
	config.existing_rows = 50;
	payload_generator generator(config);

	EXPECT_EQ(generator.next_insert("w").record_id, 51);

	for (int i = 0; i < 1000; ++i)
	{
		auto payload = generator.next(adapters::operation_kind::update, "Worker-0001");
		EXPECT_GE(payload.record_id, 1);
		EXPECT_LE(payload.record_id, 51);
		EXPECT_EQ(payload.thread_id, "Worker-0001");
	}
}

TEST(PayloadGeneratorTest, DataIsAlphanumericOfConfiguredLength)
{
	payload_generator generator;
	auto payload = generator.next_insert("w");

	ASSERT_EQ(payload.data.size(), 500u);
	for (char c : payload.data)
	{
		EXPECT_TRUE(std::isalnum(static_cast<unsigned char>(c)));
	}
}

// ============================================================================
// Load Worker Tests
// ============================================================================

class LoadWorkerTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		pool_cfg_.min_connections = 1;
		pool_cfg_.max_connections = 2;
		pool_cfg_.acquire_wait = std::chrono::milliseconds(20);
		pool_cfg_.acquire_attempts = 1;
		pool_cfg_.create_attempts = 1;
		pool_cfg_.enable_health_checks = false;

		worker_cfg_.name = load_worker::make_name(1);
		worker_cfg_.acquire_wait = std::chrono::milliseconds(20);
		worker_cfg_.backoff.floor = std::chrono::milliseconds(10);
		worker_cfg_.backoff.ceiling = std::chrono::milliseconds(50);
		worker_cfg_.backoff.first_failure_pause = std::chrono::milliseconds(20);

		signal_ = std::make_shared<core::shutdown_signal>();
		stats_ = std::make_shared<metrics::stats_aggregator>();
		payload_config payload;
		payload.data_length = 32;
		generator_ = std::make_shared<payload_generator>(payload);
	}

	std::shared_ptr<pooling::connection_pool> make_pool(
		std::shared_ptr<adapters::database_adapter> adapter)
	{
		auto pool = std::make_shared<pooling::connection_pool>(pool_cfg_, adapter, signal_);
		pool->warm_up();
		return pool;
	}

	pooling::pool_config pool_cfg_;
	worker_config worker_cfg_;
	std::shared_ptr<core::shutdown_signal> signal_;
	std::shared_ptr<metrics::stats_aggregator> stats_;
	std::shared_ptr<payload_generator> generator_;
};

TEST_F(LoadWorkerTest, NamesAreZeroPadded)
{
	EXPECT_EQ(load_worker::make_name(1), "Worker-0001");
	EXPECT_EQ(load_worker::make_name(42), "Worker-0042");
	EXPECT_EQ(load_worker::make_name(12345), "Worker-12345");
}

TEST_F(LoadWorkerTest, FullModeInsertsSelectsAndVerifies)
{
	adapters::simulated_config sim;
	sim.operation_latency = std::chrono::microseconds(0);
	auto adapter = std::make_shared<adapters::simulated_adapter>(sim);
	auto pool = make_pool(adapter);

	load_worker worker(worker_cfg_, pool, adapter, stats_, generator_, signal_);
	EXPECT_EQ(worker.state(), worker_state::waiting_to_start);

	std::thread runner([&]() { worker.run(); });
	ASSERT_TRUE(wait_until([&]() { return stats_->snapshot().transactions >= 50; },
						   std::chrono::seconds(5)));
	EXPECT_EQ(worker.state(), worker_state::running);
	signal_->cancel();
	runner.join();

	EXPECT_EQ(worker.state(), worker_state::stopped);

	auto snapshot = stats_->snapshot();
	EXPECT_EQ(snapshot.inserts, snapshot.transactions);
	EXPECT_EQ(snapshot.selects, snapshot.transactions);
	EXPECT_EQ(snapshot.errors, 0u);
	EXPECT_EQ(snapshot.verification_failures, 0u);
	EXPECT_EQ(adapter->row_count(), snapshot.transactions);
	EXPECT_EQ(worker.counters().transactions, snapshot.transactions);

	// Connection is back in the pool
	EXPECT_EQ(pool->get_stats().active, 0u);
}

TEST_F(LoadWorkerTest, VerificationMismatchIsNotAnError)
{
	adapters::simulated_config sim;
	sim.operation_latency = std::chrono::microseconds(0);
	auto adapter = std::make_shared<adapters::simulated_adapter>(sim);
	adapter->set_corrupt_reads(true);
	auto pool = make_pool(adapter);

	load_worker worker(worker_cfg_, pool, adapter, stats_, generator_, signal_);
	std::thread runner([&]() { worker.run(); });
	ASSERT_TRUE(wait_until([&]() { return stats_->snapshot().verification_failures >= 10; },
						   std::chrono::seconds(5)));
	signal_->cancel();
	runner.join();

	auto snapshot = stats_->snapshot();
	EXPECT_EQ(snapshot.transactions, 0u);
	EXPECT_EQ(snapshot.errors, 0u);
	EXPECT_EQ(snapshot.latency.sample_count, 0u);
	EXPECT_EQ(worker.counters().verification_failures, snapshot.verification_failures);
}

TEST_F(LoadWorkerTest, SingleOperationModeRecordsItsKind)
{
	adapters::simulated_config sim;
	sim.operation_latency = std::chrono::microseconds(0);
	auto adapter = std::make_shared<adapters::simulated_adapter>(sim);
	auto pool = make_pool(adapter);

	worker_cfg_.mode = operation_mode::insert_only;
	load_worker worker(worker_cfg_, pool, adapter, stats_, generator_, signal_);
	std::thread runner([&]() { worker.run(); });
	ASSERT_TRUE(wait_until([&]() { return stats_->snapshot().transactions >= 20; },
						   std::chrono::seconds(5)));
	signal_->cancel();
	runner.join();

	auto snapshot = stats_->snapshot();
	EXPECT_EQ(snapshot.inserts, snapshot.transactions);
	EXPECT_EQ(snapshot.selects, 0u);
	EXPECT_EQ(snapshot.updates, 0u);
	EXPECT_EQ(snapshot.deletes, 0u);
}

TEST_F(LoadWorkerTest, BatchInsertCommitsManyRowsPerTransaction)
{
	adapters::simulated_config sim;
	sim.operation_latency = std::chrono::microseconds(0);
	auto adapter = std::make_shared<adapters::simulated_adapter>(sim);
	auto pool = make_pool(adapter);

	worker_cfg_.mode = operation_mode::insert_only;
	worker_cfg_.batch_size = 25;
	load_worker worker(worker_cfg_, pool, adapter, stats_, generator_, signal_);
	std::thread runner([&]() { worker.run(); });
	ASSERT_TRUE(wait_until([&]() { return stats_->snapshot().transactions >= 4; },
						   std::chrono::seconds(5)));
	signal_->cancel();
	runner.join();

	auto snapshot = stats_->snapshot();
	EXPECT_EQ(snapshot.inserts, snapshot.transactions * 25);
	EXPECT_EQ(snapshot.latency.sample_count, snapshot.transactions);
	EXPECT_EQ(adapter->row_count(), snapshot.inserts);
	EXPECT_EQ(worker.counters().transactions, snapshot.transactions);
}

TEST_F(LoadWorkerTest, FailedBatchIsOneError)
{
	auto adapter = std::make_shared<scripted_adapter>();
	adapter->fail_executes = true;
	auto pool = make_pool(adapter);

	worker_cfg_.mode = operation_mode::insert_only;
	worker_cfg_.batch_size = 10;
	load_worker worker(worker_cfg_, pool, adapter, stats_, generator_, signal_);
	std::thread runner([&]() { worker.run(); });
	ASSERT_TRUE(wait_until([&]() { return stats_->snapshot().errors >= 3; },
						   std::chrono::seconds(5)));
	signal_->cancel();
	runner.join();

	auto snapshot = stats_->snapshot();
	EXPECT_EQ(snapshot.inserts, 0u);
	EXPECT_EQ(snapshot.transactions, 0u);
	EXPECT_EQ(static_cast<uint64_t>(adapter->batches.load()), snapshot.errors);
}

TEST_F(LoadWorkerTest, OperationErrorsAreCountedAndLogThrottled)
{
	auto adapter = std::make_shared<scripted_adapter>();
	adapter->fail_executes = true;
	auto pool = make_pool(adapter);
	auto logger = std::make_shared<capture_logger>();

	load_worker worker(worker_cfg_, pool, adapter, stats_, generator_, signal_);
	worker.set_logger(logger);

	std::thread runner([&]() { worker.run(); });
	ASSERT_TRUE(wait_until([&]() { return stats_->snapshot().errors >= 20; },
						   std::chrono::seconds(5)));
	signal_->cancel();
	runner.join();

	auto snapshot = stats_->snapshot();
	EXPECT_EQ(snapshot.transactions, 0u);
	EXPECT_EQ(snapshot.latency.sample_count, 0u);
	EXPECT_EQ(worker.counters().errors, snapshot.errors);

	// One warning per 10s interval; the rest go to debug
	EXPECT_EQ(logger->count(log_level::warning, "execute failed"), 1u);
	EXPECT_GE(logger->count(log_level::debug, "execute failed"), 19u);
}

TEST_F(LoadWorkerTest, RateLimiterThrottlesWorker)
{
	adapters::simulated_config sim;
	sim.operation_latency = std::chrono::microseconds(0);
	auto adapter = std::make_shared<adapters::simulated_adapter>(sim);
	auto pool = make_pool(adapter);

	rate_limit_config limit;
	limit.transactions_per_second = 50.0;
	auto limiter = std::make_shared<rate_limiter>(limit);

	load_worker worker(worker_cfg_, pool, adapter, stats_, generator_, signal_, limiter);
	std::thread runner([&]() { worker.run(); });
	std::this_thread::sleep_for(std::chrono::seconds(1));
	signal_->cancel();
	runner.join();

	auto transactions = stats_->snapshot().transactions;
	EXPECT_GE(transactions, 40u);
	EXPECT_LE(transactions, 60u);
}

TEST_F(LoadWorkerTest, ResumesAfterBackendOutage)
{
	adapters::simulated_config sim;
	sim.operation_latency = std::chrono::microseconds(50);
	auto adapter = std::make_shared<adapters::simulated_adapter>(sim);
	auto pool = make_pool(adapter);

	load_worker worker(worker_cfg_, pool, adapter, stats_, generator_, signal_);
	std::thread runner([&]() { worker.run(); });

	ASSERT_TRUE(wait_until([&]() { return stats_->snapshot().transactions >= 10; },
						   std::chrono::seconds(5)));

	adapter->fail_for(std::chrono::milliseconds(300));
	ASSERT_TRUE(wait_until([&]() { return worker.counters().acquire_failures > 0; },
						   std::chrono::seconds(5)));
	ASSERT_TRUE(wait_until([&]() { return adapter->is_available(); }, std::chrono::seconds(5)));

	auto at_recovery = stats_->snapshot().transactions;
	EXPECT_TRUE(wait_until([&]() { return stats_->snapshot().transactions >= at_recovery + 10; },
						   std::chrono::seconds(5)));

	signal_->cancel();
	runner.join();

	EXPECT_GT(stats_->snapshot().errors, 0u);
	EXPECT_EQ(worker.backoff().consecutive_failures(), 0u);
	EXPECT_EQ(worker.backoff().current_backoff(), worker_cfg_.backoff.floor);
}

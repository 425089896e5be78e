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
 * @file connection_pool_test.cpp
 * @brief Unit tests for connection_pool
 *
 * Tests cover:
 * - Warm-up and creation retries
 * - Acquire/release bookkeeping and double-release rejection
 * - Size bound under concurrent acquire/release
 * - Health checks: lifetime recycling, liveness, leak warnings
 * - Shutdown and cancellation of blocked callers
 */

#include <gtest/gtest.h>

#include "test_support.h"

#include <kcenon/database_load_tester/pooling/connection_pool.h>

#include <atomic>
#include <chrono>
#include <future>
#include <random>
#include <thread>
#include <vector>

using namespace database_load_tester;
using namespace database_load_tester::pooling;
using database_load_tester::test_support::capture_logger;
using database_load_tester::test_support::scripted_adapter;
using kcenon::common::interfaces::log_level;

namespace
{

pool_config fast_config()
{
	pool_config config;
	config.min_connections = 3;
	config.max_connections = 5;
	config.acquire_wait = std::chrono::milliseconds(50);
	config.create_backoff_initial = std::chrono::milliseconds(1);
	config.create_backoff_max = std::chrono::milliseconds(4);
	config.acquire_backoff_initial = std::chrono::milliseconds(5);
	config.acquire_backoff_max = std::chrono::milliseconds(20);
	config.enable_health_checks = false;
	return config;
}

} // namespace

// ============================================================================
// Configuration Tests
// ============================================================================

TEST(ConnectionPoolConfigTest, DefaultConfiguration)
{
	pool_config config;

	EXPECT_EQ(config.min_connections, 10u);
	EXPECT_EQ(config.max_connections, 20u);
	EXPECT_EQ(config.max_lifetime, std::chrono::milliseconds(1800000));
	EXPECT_EQ(config.leak_detection_threshold, std::chrono::milliseconds(60000));
	EXPECT_EQ(config.create_attempts, 3u);
	EXPECT_EQ(config.create_backoff_initial, std::chrono::milliseconds(100));
	EXPECT_EQ(config.create_backoff_max, std::chrono::milliseconds(2000));
	EXPECT_EQ(config.acquire_attempts, 3u);
	EXPECT_EQ(config.acquire_backoff_max, std::chrono::milliseconds(5000));
	EXPECT_EQ(config.idle_timeout, std::chrono::milliseconds(30000));
	EXPECT_EQ(config.keepalive_time, std::chrono::milliseconds(30000));
}

// ============================================================================
// Warm-up Tests
// ============================================================================

class ConnectionPoolWarmUpTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		config_ = fast_config();
		adapter_ = std::make_shared<scripted_adapter>();
	}

	pool_config config_;
	std::shared_ptr<scripted_adapter> adapter_;
};

TEST_F(ConnectionPoolWarmUpTest, CreatesExactlyMinimumIdleConnections)
{
	connection_pool pool(config_, adapter_);

	auto report = pool.warm_up();

	EXPECT_EQ(report.requested, 3u);
	EXPECT_EQ(report.created, 3u);
	EXPECT_TRUE(report.complete());

	auto stats = pool.get_stats();
	EXPECT_EQ(stats.idle, 3u);
	EXPECT_EQ(stats.active, 0u);
	EXPECT_EQ(stats.total_created, 3u);
}

TEST_F(ConnectionPoolWarmUpTest, SkipsConnectionsThatExhaustRetries)
{
	config_.create_attempts = 1;
	adapter_->failures_before_open = 2;
	auto logger = std::make_shared<capture_logger>();

	connection_pool pool(config_, adapter_);
	pool.set_logger(logger);
	auto report = pool.warm_up();

	EXPECT_EQ(report.requested, 3u);
	EXPECT_EQ(report.created, 1u);
	EXPECT_FALSE(report.complete());
	EXPECT_EQ(pool.get_stats().failed_creations, 2u);
	EXPECT_EQ(logger->count(log_level::warning, "Pool warm-up created 1/3"), 1u);
}

TEST_F(ConnectionPoolWarmUpTest, CreationRetriesBeforeGivingUp)
{
	config_.create_attempts = 3;
	adapter_->failures_before_open = 2;

	connection_pool pool(config_, adapter_);
	auto report = pool.warm_up(1);

	EXPECT_EQ(report.created, 1u);
	EXPECT_EQ(adapter_->open_calls.load(), 3);
	EXPECT_EQ(pool.get_stats().failed_creations, 0u);
}

TEST_F(ConnectionPoolWarmUpTest, NeverExceedsMaximum)
{
	config_.max_connections = 2;

	connection_pool pool(config_, adapter_);
	auto report = pool.warm_up(4);

	EXPECT_EQ(report.created, 2u);
	EXPECT_EQ(pool.get_stats().total, 2u);
}

// ============================================================================
// Acquire / Release Tests
// ============================================================================

class ConnectionPoolAcquireTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		config_ = fast_config();
		adapter_ = std::make_shared<scripted_adapter>();
	}

	pool_config config_;
	std::shared_ptr<scripted_adapter> adapter_;
};

TEST_F(ConnectionPoolAcquireTest, AcquireTakesIdleConnectionFirst)
{
	connection_pool pool(config_, adapter_);
	pool.warm_up(2);

	auto acquired = pool.acquire("Worker-0001");
	ASSERT_TRUE(acquired.is_ok());

	auto connection = acquired.value();
	EXPECT_EQ(connection->holder(), "Worker-0001");
	EXPECT_TRUE(connection->checked_out_at().has_value());

	auto stats = pool.get_stats();
	EXPECT_EQ(stats.active, 1u);
	EXPECT_EQ(stats.idle, 1u);
	EXPECT_EQ(stats.total_created, 2u);
}

TEST_F(ConnectionPoolAcquireTest, AcquireGrowsLazilyUpToMaximum)
{
	config_.max_connections = 2;
	config_.acquire_attempts = 2;
	connection_pool pool(config_, adapter_);

	auto first = pool.acquire("a");
	auto second = pool.acquire("b");
	ASSERT_TRUE(first.is_ok());
	ASSERT_TRUE(second.is_ok());

	auto third = pool.acquire("c", std::chrono::milliseconds(20));
	ASSERT_TRUE(third.is_err());
	EXPECT_TRUE(is_pool_error(third.error(), pool_error::pool_exhausted));
	EXPECT_TRUE(is_recoverable(third.error()));

	auto stats = pool.get_stats();
	EXPECT_EQ(stats.total, 2u);
	EXPECT_EQ(stats.exhausted_acquires, 1u);
}

TEST_F(ConnectionPoolAcquireTest, AcquireSucceedsWhenConnectionIsReleased)
{
	config_.max_connections = 1;
	connection_pool pool(config_, adapter_);

	auto held = pool.acquire("holder");
	ASSERT_TRUE(held.is_ok());
	auto connection = held.value();

	auto releaser = std::async(std::launch::async,
							   [&]()
							   {
								   std::this_thread::sleep_for(std::chrono::milliseconds(30));
								   return pool.release(connection);
							   });

	auto waited = pool.acquire("waiter", std::chrono::milliseconds(500));
	EXPECT_TRUE(releaser.get().is_ok());
	ASSERT_TRUE(waited.is_ok());
	EXPECT_EQ(waited.value()->id(), connection->id());
	EXPECT_EQ(waited.value()->holder(), "waiter");
}

TEST_F(ConnectionPoolAcquireTest, ReleaseReturnsConnectionToIdle)
{
	connection_pool pool(config_, adapter_);

	auto acquired = pool.acquire("Worker-0001");
	ASSERT_TRUE(acquired.is_ok());
	auto connection = acquired.value();

	EXPECT_TRUE(pool.release(connection).is_ok());

	EXPECT_FALSE(connection->checked_out_at().has_value());
	EXPECT_EQ(connection->use_count(), 1u);
	auto stats = pool.get_stats();
	EXPECT_EQ(stats.idle, 1u);
	EXPECT_EQ(stats.active, 0u);
}

TEST_F(ConnectionPoolAcquireTest, DoubleReleaseIsRejected)
{
	auto logger = std::make_shared<capture_logger>();
	connection_pool pool(config_, adapter_);
	pool.set_logger(logger);

	auto acquired = pool.acquire("Worker-0001");
	ASSERT_TRUE(acquired.is_ok());
	auto connection = acquired.value();

	ASSERT_TRUE(pool.release(connection).is_ok());
	auto again = pool.release(connection);

	ASSERT_TRUE(again.is_err());
	EXPECT_TRUE(is_pool_error(again.error(), pool_error::invalid_release));
	EXPECT_EQ(logger->count(log_level::warning, "Rejected release"), 1u);

	auto stats = pool.get_stats();
	EXPECT_EQ(stats.idle, 1u);
	EXPECT_EQ(stats.active, 0u);
	EXPECT_EQ(connection->use_count(), 1u);
}

TEST_F(ConnectionPoolAcquireTest, ReleaseOfForeignConnectionIsRejected)
{
	connection_pool pool(config_, adapter_);
	pool.warm_up(1);

	auto opened = adapter_->open();
	ASSERT_TRUE(opened.is_ok());
	auto stranger = std::make_shared<pooled_connection>(1, opened.value());

	auto result = pool.release(stranger);
	ASSERT_TRUE(result.is_err());
	EXPECT_TRUE(is_pool_error(result.error(), pool_error::invalid_release));
	EXPECT_EQ(pool.get_stats().idle, 1u);

	EXPECT_TRUE(pool.release(nullptr).is_err());
}

TEST_F(ConnectionPoolAcquireTest, ValidatingReleaseDestroysDeadConnection)
{
	connection_pool pool(config_, adapter_);

	auto acquired = pool.acquire("Worker-0001");
	ASSERT_TRUE(acquired.is_ok());

	adapter_->kill_connections();
	EXPECT_TRUE(pool.release(acquired.value(), release_mode::validate).is_ok());

	auto stats = pool.get_stats();
	EXPECT_EQ(stats.idle, 0u);
	EXPECT_EQ(stats.active, 0u);
	EXPECT_EQ(stats.total_removed, 1u);
	EXPECT_EQ(adapter_->closes.load(), 1);
}

TEST_F(ConnectionPoolAcquireTest, ValidatingReleaseKeepsLiveConnection)
{
	connection_pool pool(config_, adapter_);

	auto acquired = pool.acquire("Worker-0001");
	ASSERT_TRUE(acquired.is_ok());

	EXPECT_TRUE(pool.release(acquired.value(), release_mode::validate).is_ok());

	auto stats = pool.get_stats();
	EXPECT_EQ(stats.idle, 1u);
	EXPECT_EQ(stats.total_removed, 0u);
	EXPECT_GE(adapter_->liveness_checks.load(), 1);
}

TEST_F(ConnectionPoolAcquireTest, CreationFailureIsRecoverable)
{
	config_.min_connections = 0;
	config_.create_attempts = 2;
	config_.acquire_attempts = 1;
	adapter_->fail_opens = true;

	connection_pool pool(config_, adapter_);
	auto acquired = pool.acquire("Worker-0001", std::chrono::milliseconds(10));

	ASSERT_TRUE(acquired.is_err());
	EXPECT_TRUE(is_recoverable(acquired.error()));
	EXPECT_GE(pool.get_stats().failed_creations, 1u);
	EXPECT_EQ(pool.get_stats().total, 0u);

	adapter_->fail_opens = false;
	EXPECT_TRUE(pool.acquire("Worker-0001").is_ok());
}

TEST_F(ConnectionPoolAcquireTest, AcquireDuringOutageCreatesAtMostOnce)
{
	config_.min_connections = 0;
	config_.max_connections = 4;
	config_.create_attempts = 3;
	config_.acquire_attempts = 3;
	adapter_->fail_opens = true;

	connection_pool pool(config_, adapter_);
	auto acquired = pool.acquire("Worker-0001", std::chrono::milliseconds(20));

	ASSERT_TRUE(acquired.is_err());
	EXPECT_TRUE(is_pool_error(acquired.error(), pool_error::pool_exhausted));
	EXPECT_EQ(adapter_->open_calls.load(), 3);

	auto stats = pool.get_stats();
	EXPECT_EQ(stats.failed_creations, 1u);
	EXPECT_EQ(stats.exhausted_acquires, 1u);
	EXPECT_EQ(stats.pending, 0u);
}

TEST_F(ConnectionPoolAcquireTest, WaiterAfterFailedCreationTakesReleasedConnection)
{
	config_.min_connections = 0;
	config_.max_connections = 2;
	config_.create_attempts = 1;
	connection_pool pool(config_, adapter_);

	auto held = pool.acquire("holder");
	ASSERT_TRUE(held.is_ok());
	auto connection = held.value();
	adapter_->fail_opens = true;

	auto releaser = std::async(std::launch::async,
							   [&]()
							   {
								   std::this_thread::sleep_for(std::chrono::milliseconds(30));
								   return pool.release(connection);
							   });

	auto waited = pool.acquire("waiter", std::chrono::milliseconds(500));
	EXPECT_TRUE(releaser.get().is_ok());
	ASSERT_TRUE(waited.is_ok());
	EXPECT_EQ(waited.value()->id(), connection->id());
	EXPECT_EQ(adapter_->open_calls.load(), 2);
}

// ============================================================================
// Concurrency Tests
// ============================================================================

TEST(ConnectionPoolConcurrencyTest, SizeBoundHoldsUnderRandomInterleavings)
{
	auto config = fast_config();
	config.min_connections = 2;
	config.max_connections = 6;
	config.acquire_wait = std::chrono::milliseconds(20);

	auto adapter = std::make_shared<scripted_adapter>();
	connection_pool pool(config, adapter);
	pool.warm_up();

	std::atomic<bool> done{false};
	std::atomic<bool> violated{false};
	std::atomic<int> duplicate_checkouts{0};

	std::thread observer(
		[&]()
		{
			while (!done.load())
			{
				auto stats = pool.get_stats();
				if (stats.idle + stats.active + stats.pending > config.max_connections)
				{
					violated = true;
				}
			}
		});

	std::vector<std::atomic<int>> holders(64);
	std::vector<std::thread> threads;
	for (int t = 0; t < 12; ++t)
	{
		threads.emplace_back(
			[&, t]()
			{
				std::mt19937 engine(static_cast<unsigned>(t));
				std::uniform_int_distribution<int> hold_us(0, 300);
				for (int i = 0; i < 150; ++i)
				{
					auto acquired = pool.acquire("Worker-" + std::to_string(t));
					if (acquired.is_err())
					{
						continue;
					}
					auto connection = acquired.value();
					auto slot = connection->id() % holders.size();
					if (holders[slot].fetch_add(1) != 0)
					{
						duplicate_checkouts.fetch_add(1);
					}
					std::this_thread::sleep_for(std::chrono::microseconds(hold_us(engine)));
					holders[slot].fetch_sub(1);
					auto mode = (i % 7 == 0) ? release_mode::validate : release_mode::reuse;
					EXPECT_TRUE(pool.release(connection, mode).is_ok());
				}
			});
	}

	for (auto& thread : threads)
	{
		thread.join();
	}
	done = true;
	observer.join();

	EXPECT_FALSE(violated.load());
	EXPECT_EQ(duplicate_checkouts.load(), 0);

	auto stats = pool.get_stats();
	EXPECT_EQ(stats.active, 0u);
	EXPECT_LE(stats.total, config.max_connections);
	EXPECT_EQ(adapter->live.load(), static_cast<int>(stats.total));
}

// ============================================================================
// Health Check Tests
// ============================================================================

class ConnectionPoolHealthCheckTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		config_ = fast_config();
		adapter_ = std::make_shared<scripted_adapter>();
		logger_ = std::make_shared<capture_logger>();
	}

	pool_config config_;
	std::shared_ptr<scripted_adapter> adapter_;
	std::shared_ptr<capture_logger> logger_;
};

TEST_F(ConnectionPoolHealthCheckTest, LeakWarningRepeatsOncePerCycle)
{
	config_.leak_detection_threshold = std::chrono::milliseconds(20);
	connection_pool pool(config_, adapter_);
	pool.set_logger(logger_);

	auto acquired = pool.acquire("Worker-0007");
	ASSERT_TRUE(acquired.is_ok());
	auto connection = acquired.value();

	std::this_thread::sleep_for(std::chrono::milliseconds(40));

	auto first = pool.run_health_check();
	EXPECT_EQ(first.leak_warnings, 1u);
	EXPECT_EQ(logger_->count(log_level::warning, "Possible connection leak"), 1u);
	EXPECT_EQ(logger_->count(log_level::warning, "held by Worker-0007"), 1u);

	auto second = pool.run_health_check();
	EXPECT_EQ(second.leak_warnings, 1u);
	EXPECT_EQ(logger_->count(log_level::warning, "Possible connection leak"), 2u);
	EXPECT_EQ(pool.get_stats().leak_warnings, 2u);

	// Diagnostic only: the connection stays checked out and usable
	EXPECT_EQ(second.active_after, 1u);
	adapters::transaction_payload payload{1, "Worker-0007", "data"};
	EXPECT_TRUE(adapter_->execute(connection->handle(), adapters::operation_kind::insert, payload)
					.is_ok());
	EXPECT_TRUE(pool.release(connection).is_ok());

	auto third = pool.run_health_check();
	EXPECT_EQ(third.leak_warnings, 0u);
	EXPECT_EQ(logger_->count(log_level::warning, "Possible connection leak"), 2u);
}

TEST_F(ConnectionPoolHealthCheckTest, ConnectionBelowThresholdIsNotReported)
{
	config_.leak_detection_threshold = std::chrono::milliseconds(60000);
	connection_pool pool(config_, adapter_);
	pool.set_logger(logger_);

	auto acquired = pool.acquire("Worker-0001");
	ASSERT_TRUE(acquired.is_ok());

	auto report = pool.run_health_check();
	EXPECT_EQ(report.leak_warnings, 0u);
	EXPECT_EQ(logger_->count(log_level::warning, "Possible connection leak"), 0u);
}

TEST_F(ConnectionPoolHealthCheckTest, ExpiredIdleConnectionsAreRecycled)
{
	config_.max_lifetime = std::chrono::milliseconds(20);
	connection_pool pool(config_, adapter_);
	pool.warm_up();

	std::this_thread::sleep_for(std::chrono::milliseconds(40));
	auto report = pool.run_health_check();

	EXPECT_EQ(report.checked, 3u);
	EXPECT_EQ(report.recycled, 3u);
	EXPECT_EQ(report.idle_after, 0u);
	EXPECT_EQ(adapter_->live.load(), 0);

	// Not recreated eagerly; the next acquire creates lazily
	ASSERT_TRUE(pool.acquire("Worker-0001").is_ok());
	EXPECT_EQ(pool.get_stats().total_created, 4u);
	EXPECT_EQ(pool.get_stats().total_recycled, 3u);
}

TEST_F(ConnectionPoolHealthCheckTest, DeadIdleConnectionsAreRemoved)
{
	connection_pool pool(config_, adapter_);
	pool.warm_up();

	adapter_->kill_connections();
	auto report = pool.run_health_check();

	EXPECT_EQ(report.removed, 3u);
	EXPECT_EQ(report.idle_after, 0u);
	EXPECT_EQ(pool.get_stats().total_removed, 3u);
	EXPECT_EQ(adapter_->live.load(), 0);
}

TEST_F(ConnectionPoolHealthCheckTest, LiveIdleConnectionsSurvive)
{
	connection_pool pool(config_, adapter_);
	pool.warm_up();

	auto report = pool.run_health_check();

	EXPECT_EQ(report.checked, 3u);
	EXPECT_EQ(report.removed, 0u);
	EXPECT_EQ(report.idle_after, 3u);
}

TEST_F(ConnectionPoolHealthCheckTest, BackgroundLoopRunsOnInterval)
{
	config_.enable_health_checks = true;
	config_.health_check_interval = std::chrono::milliseconds(20);
	connection_pool pool(config_, adapter_);
	pool.warm_up();

	pool.start_health_checks();
	std::this_thread::sleep_for(std::chrono::milliseconds(200));
	pool.stop_health_checks();

	auto cycles = pool.get_stats().health_check_cycles;
	EXPECT_GE(cycles, 2u);

	std::this_thread::sleep_for(std::chrono::milliseconds(60));
	EXPECT_EQ(pool.get_stats().health_check_cycles, cycles);
}

TEST_F(ConnectionPoolHealthCheckTest, IdleTimeoutShrinksPoolToMinimum)
{
	config_.min_connections = 1;
	config_.idle_timeout = std::chrono::milliseconds(20);
	config_.keepalive_time = std::chrono::milliseconds(0);
	config_.validate_idle = false;
	connection_pool pool(config_, adapter_);
	pool.warm_up(4);

	auto fresh = pool.run_health_check();
	EXPECT_EQ(fresh.shrunk, 0u);
	EXPECT_EQ(fresh.idle_after, 4u);

	std::this_thread::sleep_for(std::chrono::milliseconds(40));
	auto report = pool.run_health_check();

	EXPECT_EQ(report.shrunk, 3u);
	EXPECT_EQ(report.removed, 0u);
	EXPECT_EQ(report.idle_after, 1u);
	EXPECT_EQ(pool.get_stats().total_shrunk, 3u);
	EXPECT_EQ(adapter_->live.load(), 1);
}

TEST_F(ConnectionPoolHealthCheckTest, IdleTimeoutCountsCheckedOutConnections)
{
	config_.min_connections = 2;
	config_.idle_timeout = std::chrono::milliseconds(20);
	config_.validate_idle = false;
	connection_pool pool(config_, adapter_);
	pool.warm_up(4);

	auto held = pool.acquire("Worker-0001");
	ASSERT_TRUE(held.is_ok());

	std::this_thread::sleep_for(std::chrono::milliseconds(40));
	auto report = pool.run_health_check();

	// Four live connections, one checked out: two idle ones go
	EXPECT_EQ(report.shrunk, 2u);
	EXPECT_EQ(report.idle_after, 1u);
	EXPECT_EQ(report.active_after, 1u);
}

TEST_F(ConnectionPoolHealthCheckTest, KeepaliveChecksOnlyLongIdleConnections)
{
	config_.validate_idle = false;
	config_.idle_timeout = std::chrono::milliseconds(0);
	config_.keepalive_time = std::chrono::milliseconds(20);
	connection_pool pool(config_, adapter_);
	pool.warm_up();

	pool.run_health_check();
	EXPECT_EQ(adapter_->liveness_checks.load(), 0);

	std::this_thread::sleep_for(std::chrono::milliseconds(40));
	auto checked = pool.run_health_check();
	EXPECT_EQ(adapter_->liveness_checks.load(), 3);
	EXPECT_EQ(checked.removed, 0u);

	// Just validated, so a dead backend goes unnoticed until keepalive lapses
	adapter_->kill_connections();
	auto quiet = pool.run_health_check();
	EXPECT_EQ(quiet.removed, 0u);
	EXPECT_EQ(adapter_->liveness_checks.load(), 3);

	std::this_thread::sleep_for(std::chrono::milliseconds(40));
	auto report = pool.run_health_check();
	EXPECT_EQ(report.removed, 3u);
	EXPECT_EQ(report.idle_after, 0u);
}

// ============================================================================
// Shutdown Tests
// ============================================================================

TEST(ConnectionPoolShutdownTest, ShutdownClosesIdleAndActiveConnections)
{
	auto adapter = std::make_shared<scripted_adapter>();
	connection_pool pool(fast_config(), adapter);
	pool.warm_up();

	auto held = pool.acquire("Worker-0001");
	ASSERT_TRUE(held.is_ok());

	auto stats = pool.shutdown();
	EXPECT_EQ(stats.idle, 0u);
	EXPECT_EQ(stats.active, 0u);
	EXPECT_EQ(stats.total_created, 3u);
	EXPECT_EQ(adapter->live.load(), 0);
	EXPECT_TRUE(pool.is_shut_down());

	auto after = pool.acquire("Worker-0001");
	ASSERT_TRUE(after.is_err());
	EXPECT_TRUE(is_pool_error(after.error(), pool_error::pool_shut_down));
	EXPECT_FALSE(is_recoverable(after.error()));

	// Release after shutdown is rejected, not a crash
	EXPECT_TRUE(pool.release(held.value()).is_err());

	// Idempotent
	pool.shutdown();
	EXPECT_EQ(adapter->closes.load(), 3);
}

TEST(ConnectionPoolShutdownTest, SignalCancelsBlockedAcquire)
{
	auto config = fast_config();
	config.max_connections = 1;
	auto adapter = std::make_shared<scripted_adapter>();
	auto signal = std::make_shared<core::shutdown_signal>();
	connection_pool pool(config, adapter, signal);

	auto held = pool.acquire("holder");
	ASSERT_TRUE(held.is_ok());

	auto started = std::chrono::steady_clock::now();
	auto waiter = std::async(std::launch::async,
							 [&]() { return pool.acquire("waiter", std::chrono::seconds(5)); });

	std::this_thread::sleep_for(std::chrono::milliseconds(50));
	signal->cancel();

	auto result = waiter.get();
	auto waited = std::chrono::steady_clock::now() - started;

	ASSERT_TRUE(result.is_err());
	EXPECT_TRUE(is_pool_error(result.error(), pool_error::acquire_cancelled));
	EXPECT_LT(waited, std::chrono::seconds(1));
}

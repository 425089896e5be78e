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
 * @file stats_aggregator_test.cpp
 * @brief Unit tests for the statistics aggregator
 *
 * Tests cover:
 * - Nearest-rank percentiles over the latency reservoir
 * - Ring-buffer replacement once the reservoir is full
 * - Rolling window rates over completed buckets
 * - Measurement reset after warm-up
 * - Counter accuracy under concurrent recording
 */

#include <gtest/gtest.h>

#include <kcenon/database_load_tester/metrics/stats_aggregator.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace database_load_tester;
using namespace database_load_tester::metrics;
using adapters::operation_kind;
using std::chrono::microseconds;
using std::chrono::milliseconds;

// ============================================================================
// Latency Reservoir Tests
// ============================================================================

TEST(LatencyReservoirTest, EmptyReservoirReportsZero)
{
	latency_reservoir reservoir(16);

	auto p = reservoir.percentiles();
	EXPECT_EQ(p.sample_count, 0u);
	EXPECT_DOUBLE_EQ(p.p50_ms, 0.0);
	EXPECT_DOUBLE_EQ(p.p99_ms, 0.0);
}

TEST(LatencyReservoirTest, NearestRankOverOneToHundred)
{
	std::vector<uint64_t> sorted;
	for (uint64_t i = 1; i <= 100; ++i)
	{
		sorted.push_back(i);
	}

	EXPECT_EQ(latency_reservoir::nearest_rank(sorted, 0.50), 50u);
	EXPECT_EQ(latency_reservoir::nearest_rank(sorted, 0.95), 95u);
	EXPECT_EQ(latency_reservoir::nearest_rank(sorted, 0.99), 99u);
	EXPECT_EQ(latency_reservoir::nearest_rank(sorted, 1.0), 100u);
}

TEST(LatencyReservoirTest, NearestRankSingleSample)
{
	std::vector<uint64_t> sorted{42};

	EXPECT_EQ(latency_reservoir::nearest_rank(sorted, 0.50), 42u);
	EXPECT_EQ(latency_reservoir::nearest_rank(sorted, 0.99), 42u);
}

TEST(LatencyReservoirTest, ReplacesOldestWhenFull)
{
	latency_reservoir reservoir(5);
	for (int i = 1; i <= 10; ++i)
	{
		reservoir.add(microseconds(i));
	}

	EXPECT_EQ(reservoir.size(), 5u);

	auto kept = reservoir.samples();
	std::sort(kept.begin(), kept.end());
	EXPECT_EQ(kept, (std::vector<uint64_t>{6, 7, 8, 9, 10}));
}

TEST(LatencyReservoirTest, ClearDropsSamples)
{
	latency_reservoir reservoir(8);
	reservoir.add(microseconds(100));
	reservoir.add(microseconds(200));

	reservoir.clear();

	EXPECT_EQ(reservoir.size(), 0u);
	EXPECT_EQ(reservoir.percentiles().sample_count, 0u);
}

// ============================================================================
// Rolling Window Tests
// ============================================================================

TEST(RollingTpsWindowTest, CountsOnlyCompletedBuckets)
{
	rolling_tps_window window(milliseconds(100), 50);
	auto origin = window.origin();

	window.record_at(origin + milliseconds(50), 10);
	window.record_at(origin + milliseconds(150), 20);
	window.record_at(origin + milliseconds(250), 30);

	// Bucket 2 is still filling at 250ms
	EXPECT_DOUBLE_EQ(window.rate_at(origin + milliseconds(250), milliseconds(200)), 150.0);

	// All three complete by 300ms; the span is clamped to what has elapsed
	EXPECT_DOUBLE_EQ(window.rate_at(origin + milliseconds(300), milliseconds(1000)), 200.0);
}

TEST(RollingTpsWindowTest, NoRateBeforeFirstBucketCompletes)
{
	rolling_tps_window window(milliseconds(100), 50);
	auto origin = window.origin();

	window.record_at(origin + milliseconds(10), 100);

	EXPECT_DOUBLE_EQ(window.rate_at(origin + milliseconds(90), milliseconds(1000)), 0.0);
}

TEST(RollingTpsWindowTest, OldBucketsExpire)
{
	rolling_tps_window window(milliseconds(100), 50);
	auto origin = window.origin();

	window.record_at(origin + milliseconds(50), 500);

	EXPECT_DOUBLE_EQ(window.rate_at(origin + milliseconds(10000), milliseconds(1000)), 0.0);
}

TEST(RollingTpsWindowTest, WrappedSlotIsReused)
{
	rolling_tps_window window(milliseconds(100), 10);
	auto origin = window.origin();

	window.record_at(origin + milliseconds(50), 7);
	// Same slot one full horizon later
	window.record_at(origin + milliseconds(1050), 3);
	// A late sample for the expired bucket is dropped
	window.record_at(origin + milliseconds(60), 100);

	EXPECT_DOUBLE_EQ(window.rate_at(origin + milliseconds(1100), milliseconds(100)), 30.0);
}

TEST(RollingTpsWindowTest, HorizonIsWidthTimesCount)
{
	rolling_tps_window window(milliseconds(100), 50);
	EXPECT_EQ(window.horizon(), milliseconds(5000));
	EXPECT_EQ(window.bucket_width(), milliseconds(100));
}

// ============================================================================
// Stats Aggregator Tests
// ============================================================================

class StatsAggregatorTest : public ::testing::Test
{
protected:
	stats_aggregator stats_;
};

TEST_F(StatsAggregatorTest, EmptySnapshot)
{
	auto view = stats_.snapshot();

	EXPECT_EQ(view.transactions, 0u);
	EXPECT_EQ(view.errors, 0u);
	EXPECT_FALSE(view.measuring);
	EXPECT_DOUBLE_EQ(view.latency.min_ms, 0.0);
	EXPECT_DOUBLE_EQ(view.latency.max_ms, 0.0);
	EXPECT_DOUBLE_EQ(view.latency.average_ms, 0.0);
	EXPECT_DOUBLE_EQ(view.success_rate(), 100.0);
}

TEST_F(StatsAggregatorTest, PercentilesOverOneToHundredMilliseconds)
{
	for (int i = 1; i <= 100; ++i)
	{
		stats_.record_transaction(operation_kind::insert, milliseconds(i));
	}

	auto view = stats_.snapshot();
	EXPECT_EQ(view.transactions, 100u);
	EXPECT_EQ(view.inserts, 100u);
	EXPECT_EQ(view.latency.sample_count, 100u);
	EXPECT_DOUBLE_EQ(view.latency.p50_ms, 50.0);
	EXPECT_DOUBLE_EQ(view.latency.p95_ms, 95.0);
	EXPECT_DOUBLE_EQ(view.latency.p99_ms, 99.0);
	EXPECT_DOUBLE_EQ(view.latency.min_ms, 1.0);
	EXPECT_DOUBLE_EQ(view.latency.max_ms, 100.0);
	EXPECT_DOUBLE_EQ(view.latency.average_ms, 50.5);
}

TEST_F(StatsAggregatorTest, CountsPerOperationKind)
{
	stats_.record_transaction(operation_kind::insert, microseconds(10));
	stats_.record_transaction(operation_kind::select, microseconds(10));
	stats_.record_transaction(operation_kind::select, microseconds(10));
	stats_.record_transaction(operation_kind::update, microseconds(10));
	stats_.record_transaction(operation_kind::remove, microseconds(10));

	auto view = stats_.snapshot();
	EXPECT_EQ(view.transactions, 5u);
	EXPECT_EQ(view.inserts, 1u);
	EXPECT_EQ(view.selects, 2u);
	EXPECT_EQ(view.updates, 1u);
	EXPECT_EQ(view.deletes, 1u);
}

TEST_F(StatsAggregatorTest, FullCycleCountsInsertAndSelect)
{
	stats_.record_full_cycle(microseconds(500));
	stats_.record_full_cycle(microseconds(700));

	auto view = stats_.snapshot();
	EXPECT_EQ(view.transactions, 2u);
	EXPECT_EQ(view.inserts, 2u);
	EXPECT_EQ(view.selects, 2u);
	EXPECT_EQ(view.latency.sample_count, 2u);
	EXPECT_DOUBLE_EQ(view.latency.average_ms, 0.6);
}

TEST_F(StatsAggregatorTest, ErrorsAndVerificationFailuresAreSeparate)
{
	for (int i = 0; i < 9; ++i)
	{
		stats_.record_transaction(operation_kind::select, microseconds(50));
	}
	stats_.record_error();
	stats_.record_verification_failure();

	auto view = stats_.snapshot();
	EXPECT_EQ(view.transactions, 9u);
	EXPECT_EQ(view.errors, 1u);
	EXPECT_EQ(view.verification_failures, 1u);
	EXPECT_DOUBLE_EQ(view.success_rate(), 90.0);
}

TEST_F(StatsAggregatorTest, SnapshotDoesNotConsumeCounters)
{
	stats_.record_transaction(operation_kind::insert, microseconds(100));
	stats_.record_error();

	auto first = stats_.snapshot();
	auto second = stats_.snapshot();

	EXPECT_EQ(first.transactions, second.transactions);
	EXPECT_EQ(first.errors, second.errors);
	EXPECT_EQ(first.latency.sample_count, second.latency.sample_count);
	EXPECT_DOUBLE_EQ(first.latency.p50_ms, second.latency.p50_ms);
}

TEST_F(StatsAggregatorTest, BeginMeasurementResetsOnce)
{
	for (int i = 0; i < 5; ++i)
	{
		stats_.record_transaction(operation_kind::insert, milliseconds(20));
	}
	stats_.record_error();

	EXPECT_TRUE(stats_.begin_measurement());
	EXPECT_TRUE(stats_.measurement_started());

	auto reset = stats_.snapshot();
	EXPECT_TRUE(reset.measuring);
	EXPECT_EQ(reset.transactions, 0u);
	EXPECT_EQ(reset.errors, 0u);
	EXPECT_EQ(reset.latency.sample_count, 0u);
	EXPECT_DOUBLE_EQ(reset.latency.max_ms, 0.0);

	for (int i = 0; i < 3; ++i)
	{
		stats_.record_transaction(operation_kind::select, milliseconds(1));
	}

	EXPECT_FALSE(stats_.begin_measurement());

	auto measured = stats_.snapshot();
	EXPECT_EQ(measured.transactions, 3u);
	EXPECT_EQ(measured.selects, 3u);
	EXPECT_DOUBLE_EQ(measured.latency.max_ms, 1.0);
}

TEST_F(StatsAggregatorTest, BatchInsertIsOneTransactionOfManyRows)
{
	stats_.record_batch_insert(50, milliseconds(4));
	stats_.record_batch_insert(50, milliseconds(6));

	auto view = stats_.snapshot();
	EXPECT_EQ(view.transactions, 2u);
	EXPECT_EQ(view.inserts, 100u);
	EXPECT_EQ(view.selects, 0u);
	EXPECT_EQ(view.latency.sample_count, 2u);
	EXPECT_DOUBLE_EQ(view.latency.average_ms, 5.0);
}

TEST_F(StatsAggregatorTest, ElapsedAndAverageTps)
{
	std::this_thread::sleep_for(milliseconds(50));
	for (int i = 0; i < 10; ++i)
	{
		stats_.record_transaction(operation_kind::insert, microseconds(10));
	}

	auto view = stats_.snapshot();
	EXPECT_GE(view.elapsed_seconds, 0.05);
	EXPECT_GT(view.average_tps, 0.0);
	EXPECT_LE(view.average_tps, 10.0 / 0.05);
}

TEST(StatsAggregatorConfigTest, ReservoirCapacityFromConfig)
{
	stats_config config;
	config.latency_capacity = 10;
	stats_aggregator stats(config);

	for (int i = 1; i <= 100; ++i)
	{
		stats.record_transaction(operation_kind::insert, milliseconds(i));
	}

	auto view = stats.snapshot();
	EXPECT_EQ(view.transactions, 100u);
	EXPECT_EQ(view.latency.sample_count, 10u);
	// Percentiles cover the retained tail, min/max/average cover everything
	EXPECT_DOUBLE_EQ(view.latency.p50_ms, 95.0);
	EXPECT_DOUBLE_EQ(view.latency.min_ms, 1.0);
	EXPECT_DOUBLE_EQ(view.latency.average_ms, 50.5);
}

TEST(StatsAggregatorConfigTest, RealtimeTpsFromRecentTraffic)
{
	stats_config config;
	config.bucket_width = milliseconds(50);
	config.bucket_count = 40;
	stats_aggregator stats(config);

	for (int i = 0; i < 100; ++i)
	{
		stats.record_transaction(operation_kind::select, microseconds(5));
	}
	std::this_thread::sleep_for(milliseconds(120));

	EXPECT_GT(stats.realtime_tps(milliseconds(1000)), 0.0);
}

// ============================================================================
// Concurrency Tests
// ============================================================================

TEST(StatsAggregatorConcurrencyTest, ConcurrentRecordingIsExact)
{
	stats_aggregator stats;
	constexpr int thread_count = 8;
	constexpr int per_thread = 10000;

	std::vector<std::thread> threads;
	for (int t = 0; t < thread_count; ++t)
	{
		threads.emplace_back(
			[&stats, t]()
			{
				for (int i = 0; i < per_thread; ++i)
				{
					stats.record_transaction(operation_kind::insert, microseconds(1 + (i + t) % 100));
					if (i % 100 == 0)
					{
						stats.record_error();
					}
				}
			});
	}
	for (auto& thread : threads)
	{
		thread.join();
	}

	auto view = stats.snapshot();
	EXPECT_EQ(view.transactions, static_cast<uint64_t>(thread_count * per_thread));
	EXPECT_EQ(view.inserts, static_cast<uint64_t>(thread_count * per_thread));
	EXPECT_EQ(view.errors, static_cast<uint64_t>(thread_count * per_thread / 100));
	EXPECT_EQ(view.latency.sample_count, latency_reservoir::default_capacity);
	EXPECT_DOUBLE_EQ(view.latency.min_ms, 0.001);
	EXPECT_DOUBLE_EQ(view.latency.max_ms, 0.1);
}

TEST(StatsAggregatorConcurrencyTest, OnlyOneCallerBeginsMeasurement)
{
	stats_aggregator stats;
	std::atomic<int> winners{0};

	std::vector<std::thread> threads;
	for (int t = 0; t < 8; ++t)
	{
		threads.emplace_back(
			[&]()
			{
				if (stats.begin_measurement())
				{
					winners.fetch_add(1);
				}
			});
	}
	for (auto& thread : threads)
	{
		thread.join();
	}

	EXPECT_EQ(winners.load(), 1);
}

TEST(StatsAggregatorConcurrencyTest, ResetDuringRecordingKeepsCountersConsistent)
{
	constexpr int trials = 300;
	constexpr int thread_count = 4;
	constexpr int per_thread = 400;

	for (int trial = 0; trial < trials; ++trial)
	{
		stats_aggregator stats;
		std::atomic<int> ready{0};
		std::atomic<bool> go{false};

		std::vector<std::thread> threads;
		for (int t = 0; t < thread_count; ++t)
		{
			threads.emplace_back(
				[&, t]()
				{
					ready.fetch_add(1);
					while (!go.load())
					{
						std::this_thread::yield();
					}
					for (int i = 0; i < per_thread; ++i)
					{
						auto kind = static_cast<operation_kind>((i + t) % 4);
						stats.record_transaction(kind, microseconds(10));
					}
				});
		}

		while (ready.load() < thread_count)
		{
			std::this_thread::yield();
		}
		go.store(true);
		std::this_thread::sleep_for(microseconds(trial % 50));
		ASSERT_TRUE(stats.begin_measurement());

		for (auto& thread : threads)
		{
			thread.join();
		}

		auto view = stats.snapshot();
		ASSERT_EQ(view.transactions, view.inserts + view.selects + view.updates + view.deletes)
			<< "trial " << trial;
		ASSERT_EQ(view.latency.sample_count, view.transactions) << "trial " << trial;
		ASSERT_LE(view.transactions, static_cast<uint64_t>(thread_count * per_thread));
	}
}

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
 * @file load_tester_benchmarks.cpp
 * @brief Overhead of the harness itself on the transaction hot path
 *
 * Benchmarks cover:
 * - Statistics recording, single and contended
 * - Snapshot cost with a full latency reservoir
 * - Rate limiter token checks
 * - Pool acquire/release round trip against an instant backend
 * - Payload generation
 */

#include <benchmark/benchmark.h>

#include <chrono>
#include <memory>
#include <string>

#include <kcenon/database_load_tester/adapters/simulated_adapter.h>
#include <kcenon/database_load_tester/metrics/stats_aggregator.h>
#include <kcenon/database_load_tester/pooling/connection_pool.h>
#include <kcenon/database_load_tester/workload/payload_generator.h>
#include <kcenon/database_load_tester/workload/rate_limiter.h>

using namespace database_load_tester;

// ============================================================================
// Statistics Benchmarks
// ============================================================================

static void BM_RecordTransaction(benchmark::State& state)
{
	static metrics::stats_aggregator stats;
	int64_t latency = 1;

	for (auto _ : state)
	{
		stats.record_transaction(adapters::operation_kind::insert,
								 std::chrono::microseconds(latency));
		latency = latency % 5000 + 1;
	}

	state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_RecordTransaction)->Threads(1)->Threads(4)->Threads(16)->UseRealTime();

static void BM_Snapshot(benchmark::State& state)
{
	metrics::stats_config config;
	config.latency_capacity = static_cast<size_t>(state.range(0));
	metrics::stats_aggregator stats(config);

	for (int64_t i = 0; i < state.range(0); ++i)
	{
		stats.record_transaction(adapters::operation_kind::select,
								 std::chrono::microseconds(i % 10000 + 1));
	}

	for (auto _ : state)
	{
		auto view = stats.snapshot();
		benchmark::DoNotOptimize(view);
	}
}
BENCHMARK(BM_Snapshot)->Arg(1000)->Arg(10000)->Arg(100000)->Unit(benchmark::kMicrosecond);

// ============================================================================
// Rate Limiter Benchmarks
// ============================================================================

static void BM_RateLimiterTryAcquire(benchmark::State& state)
{
	workload::rate_limit_config config;
	config.transactions_per_second = 1e9;
	static workload::rate_limiter limiter(config);

	for (auto _ : state)
	{
		benchmark::DoNotOptimize(limiter.try_acquire());
	}

	state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_RateLimiterTryAcquire)->Threads(1)->Threads(8)->UseRealTime();

// ============================================================================
// Pool Benchmarks
// ============================================================================

static void BM_PoolAcquireRelease(benchmark::State& state)
{
	adapters::simulated_config backend;
	backend.operation_latency = std::chrono::microseconds(0);
	auto adapter = std::make_shared<adapters::simulated_adapter>(backend);

	pooling::pool_config config;
	config.min_connections = 8;
	config.max_connections = 8;
	config.enable_health_checks = false;
	auto pool = std::make_shared<pooling::connection_pool>(config, adapter);
	auto warmed = pool->warm_up();
	if (!warmed.complete())
	{
		state.SkipWithError("pool warm-up incomplete");
		return;
	}

	for (auto _ : state)
	{
		auto acquired = pool->acquire("bench");
		if (acquired.is_err())
		{
			state.SkipWithError(acquired.error().message.c_str());
			break;
		}
		auto released = pool->release(acquired.value());
		benchmark::DoNotOptimize(released);
	}

	pool->shutdown();
	state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_PoolAcquireRelease);

// ============================================================================
// Payload Benchmarks
// ============================================================================

static void BM_PayloadGeneration(benchmark::State& state)
{
	workload::payload_config config;
	config.data_length = static_cast<size_t>(state.range(0));
	workload::payload_generator generator(config);
	const std::string worker = "Worker-0001";

	for (auto _ : state)
	{
		auto payload = generator.next_insert(worker);
		benchmark::DoNotOptimize(payload);
	}

	state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_PayloadGeneration)->Arg(100)->Arg(500)->Arg(4000);

BENCHMARK_MAIN();

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

#include <kcenon/database_load_tester/metrics/stats_aggregator.h>

#include <kcenon/database_load_tester/metrics/metrics_base.h>

#include <algorithm>
#include <mutex>

namespace database_load_tester::metrics
{

double stats_snapshot::success_rate() const noexcept
{
	return metrics_utils::percentage(transactions, transactions + errors);
}

stats_aggregator::stats_aggregator(stats_config config)
	: config_(config)
	, latency_min_us_(metrics_utils::empty_min)
	, started_at_(clock::now().time_since_epoch().count())
	, reservoir_(config.latency_capacity)
	, window_(config.bucket_width, config.bucket_count)
{
}

void stats_aggregator::record_transaction(adapters::operation_kind kind,
										  std::chrono::microseconds latency)
{
	std::shared_lock<std::shared_mutex> guard(reset_mutex_);

	switch (kind)
	{
	case adapters::operation_kind::insert:
		inserts_.fetch_add(1, std::memory_order_relaxed);
		break;
	case adapters::operation_kind::select:
		selects_.fetch_add(1, std::memory_order_relaxed);
		break;
	case adapters::operation_kind::update:
		updates_.fetch_add(1, std::memory_order_relaxed);
		break;
	case adapters::operation_kind::remove:
		deletes_.fetch_add(1, std::memory_order_relaxed);
		break;
	}

	transactions_.fetch_add(1, std::memory_order_relaxed);
	record_latency(latency);
}

void stats_aggregator::record_full_cycle(std::chrono::microseconds latency)
{
	std::shared_lock<std::shared_mutex> guard(reset_mutex_);
	inserts_.fetch_add(1, std::memory_order_relaxed);
	selects_.fetch_add(1, std::memory_order_relaxed);
	transactions_.fetch_add(1, std::memory_order_relaxed);
	record_latency(latency);
}

void stats_aggregator::record_batch_insert(uint64_t rows, std::chrono::microseconds latency)
{
	std::shared_lock<std::shared_mutex> guard(reset_mutex_);
	inserts_.fetch_add(rows, std::memory_order_relaxed);
	transactions_.fetch_add(1, std::memory_order_relaxed);
	record_latency(latency);
}

void stats_aggregator::record_error()
{
	std::shared_lock<std::shared_mutex> guard(reset_mutex_);
	errors_.fetch_add(1, std::memory_order_relaxed);
}

void stats_aggregator::record_verification_failure()
{
	std::shared_lock<std::shared_mutex> guard(reset_mutex_);
	verification_failures_.fetch_add(1, std::memory_order_relaxed);
}

bool stats_aggregator::begin_measurement()
{
	if (measurement_started_.exchange(true, std::memory_order_acq_rel))
	{
		return false;
	}

	// Recorders hold the shared side; no increment can fall between the takes
	std::unique_lock<std::shared_mutex> guard(reset_mutex_);

	started_at_.store(clock::now().time_since_epoch().count(), std::memory_order_release);

	metrics_utils::take(transactions_);
	metrics_utils::take(inserts_);
	metrics_utils::take(selects_);
	metrics_utils::take(updates_);
	metrics_utils::take(deletes_);
	metrics_utils::take(errors_);
	metrics_utils::take(verification_failures_);
	metrics_utils::take(latency_total_us_);
	metrics_utils::take(latency_count_);
	latency_min_us_.store(metrics_utils::empty_min, std::memory_order_relaxed);
	latency_max_us_.store(0, std::memory_order_relaxed);
	reservoir_.clear();

	return true;
}

stats_snapshot stats_aggregator::snapshot() const
{
	stats_snapshot view;
	std::shared_lock<std::shared_mutex> guard(reset_mutex_);

	view.transactions = transactions_.load(std::memory_order_relaxed);
	view.inserts = inserts_.load(std::memory_order_relaxed);
	view.selects = selects_.load(std::memory_order_relaxed);
	view.updates = updates_.load(std::memory_order_relaxed);
	view.deletes = deletes_.load(std::memory_order_relaxed);
	view.errors = errors_.load(std::memory_order_relaxed);
	view.verification_failures = verification_failures_.load(std::memory_order_relaxed);
	view.measuring = measurement_started();

	auto started = clock::time_point(clock::duration(started_at_.load(std::memory_order_acquire)));
	auto elapsed = clock::now() - started;
	view.elapsed_seconds = std::chrono::duration<double>(elapsed).count();
	view.average_tps = metrics_utils::per_second(view.transactions, elapsed);
	view.realtime_tps = window_.rate(config_.realtime_span);

	auto count = latency_count_.load(std::memory_order_relaxed);
	view.latency.average_ms
		= metrics_utils::average_us_to_ms(latency_total_us_.load(std::memory_order_relaxed), count);

	auto min_us = latency_min_us_.load(std::memory_order_relaxed);
	view.latency.min_ms = min_us == metrics_utils::empty_min ? 0.0
															 : static_cast<double>(min_us) / 1000.0;
	view.latency.max_ms
		= static_cast<double>(latency_max_us_.load(std::memory_order_relaxed)) / 1000.0;

	auto percentiles = reservoir_.percentiles();
	view.latency.sample_count = percentiles.sample_count;
	view.latency.p50_ms = percentiles.p50_ms;
	view.latency.p95_ms = percentiles.p95_ms;
	view.latency.p99_ms = percentiles.p99_ms;

	return view;
}

double stats_aggregator::realtime_tps(std::chrono::milliseconds span) const
{
	return window_.rate(span);
}

void stats_aggregator::record_latency(std::chrono::microseconds latency)
{
	auto sample = static_cast<uint64_t>(std::max<int64_t>(latency.count(), 0));

	latency_total_us_.fetch_add(sample, std::memory_order_relaxed);
	latency_count_.fetch_add(1, std::memory_order_relaxed);
	metrics_utils::update_min_max(latency_min_us_, latency_max_us_, sample);

	reservoir_.add(latency);
	window_.record();
}

} // namespace database_load_tester::metrics

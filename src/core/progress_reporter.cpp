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

#include <kcenon/database_load_tester/core/progress_reporter.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace database_load_tester::core
{

namespace
{

using kcenon::common::interfaces::log_level;

// Counters restart from zero at the warm-up boundary
uint64_t delta(uint64_t current, uint64_t previous)
{
	return current >= previous ? current - previous : current;
}

} // namespace

progress_reporter::progress_reporter(std::chrono::milliseconds interval,
									 std::shared_ptr<metrics::stats_aggregator> stats,
									 std::shared_ptr<pooling::connection_pool> pool,
									 std::shared_ptr<shutdown_signal> signal)
	: interval_(interval)
	, stats_(std::move(stats))
	, pool_(std::move(pool))
	, signal_(std::move(signal))
	, created_at_(clock::now())
{
}

progress_reporter::~progress_reporter()
{
	stop();
}

void progress_reporter::start()
{
	std::lock_guard<std::mutex> lock(thread_mutex_);
	if (thread_.joinable())
	{
		return;
	}

	stop_requested_ = false;
	thread_ = std::thread(&progress_reporter::report_loop, this);
}

void progress_reporter::stop()
{
	std::thread worker;
	{
		std::lock_guard<std::mutex> lock(thread_mutex_);
		stop_requested_ = true;
		worker = std::move(thread_);
	}
	thread_condition_.notify_all();

	if (worker.joinable())
	{
		worker.join();
	}
}

bool progress_reporter::is_running() const
{
	std::lock_guard<std::mutex> lock(thread_mutex_);
	return thread_.joinable() && !stop_requested_;
}

progress_sample progress_reporter::sample_once()
{
	auto now = clock::now();

	progress_sample sample;
	sample.offset = std::chrono::duration_cast<std::chrono::milliseconds>(now - created_at_);
	sample.stats = stats_->snapshot();
	sample.warming_up = !sample.stats.measuring;
	if (pool_)
	{
		sample.pool = pool_->get_stats();
	}

	{
		std::lock_guard<std::mutex> lock(samples_mutex_);

		metrics::stats_snapshot previous;
		if (!samples_.empty() && samples_.back().warming_up == sample.warming_up)
		{
			previous = samples_.back().stats;
		}

		sample.interval_transactions = delta(sample.stats.transactions, previous.transactions);
		sample.interval_inserts = delta(sample.stats.inserts, previous.inserts);
		sample.interval_selects = delta(sample.stats.selects, previous.selects);
		sample.interval_updates = delta(sample.stats.updates, previous.updates);
		sample.interval_deletes = delta(sample.stats.deletes, previous.deletes);
		sample.interval_errors = delta(sample.stats.errors, previous.errors);

		auto since = previous_at_.value_or(created_at_);
		sample.interval_seconds = std::chrono::duration<double>(now - since).count();
		if (sample.interval_seconds > 0.0)
		{
			sample.interval_tps
				= static_cast<double>(sample.interval_transactions) / sample.interval_seconds;
		}

		previous_at_ = now;
		samples_.push_back(sample);
	}

	if (logger_)
	{
		logger_->log(log_level::info, format(sample));
	}

	if (sink_)
	{
		sink_(sample);
	}

	return sample;
}

std::vector<progress_sample> progress_reporter::samples() const
{
	std::lock_guard<std::mutex> lock(samples_mutex_);
	return samples_;
}

void progress_reporter::set_sink(sample_sink sink)
{
	sink_ = std::move(sink);
}

void progress_reporter::set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
{
	logger_ = std::move(logger);
}

std::string progress_reporter::format(const progress_sample& sample)
{
	const auto& stats = sample.stats;

	std::ostringstream oss;
	oss << std::fixed << std::setprecision(1);
	oss << (sample.warming_up ? "[WARMUP] " : "[RUNNING] ");
	oss << static_cast<double>(sample.offset.count()) / 1000.0 << "s";
	oss << " | TPS " << sample.interval_tps << " (avg " << stats.average_tps << ", real-time "
		<< stats.realtime_tps << ")";
	oss << " | tx " << stats.transactions << " (+" << sample.interval_transactions << ")";
	oss << " | errors " << stats.errors;
	if (stats.verification_failures > 0)
	{
		oss << " | verify failures " << stats.verification_failures;
	}
	oss << std::setprecision(2);
	oss << " | p50 " << stats.latency.p50_ms << "ms p95 " << stats.latency.p95_ms << "ms p99 "
		<< stats.latency.p99_ms << "ms";
	oss << " | pool " << sample.pool.active << " active / " << sample.pool.idle << " idle";
	return oss.str();
}

void progress_reporter::report_loop()
{
	std::unique_lock<std::mutex> lock(thread_mutex_);

	while (!stop_requested_)
	{
		auto deadline = clock::now() + interval_;

		while (!stop_requested_ && !(signal_ && signal_->is_cancelled()) && clock::now() < deadline)
		{
			thread_condition_.wait_until(
				lock, std::min(deadline, clock::now() + std::chrono::milliseconds(100)));
		}

		if (stop_requested_ || (signal_ && signal_->is_cancelled()))
		{
			break;
		}

		lock.unlock();
		sample_once();
		lock.lock();
	}
}

} // namespace database_load_tester::core

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

#include <kcenon/database_load_tester/core/load_test_controller.h>

#include <algorithm>
#include <future>
#include <iomanip>
#include <sstream>

namespace database_load_tester::core
{

namespace
{

using kcenon::common::interfaces::log_level;

constexpr std::chrono::milliseconds stop_poll_interval{100};

std::string seconds(std::chrono::milliseconds value)
{
	std::ostringstream oss;
	oss << std::fixed << std::setprecision(1) << static_cast<double>(value.count()) / 1000.0 << "s";
	return oss.str();
}

std::string rate(double value)
{
	std::ostringstream oss;
	oss << std::fixed << std::setprecision(1) << value;
	return oss.str();
}

} // namespace

std::string format_report(const std::string& name, const load_test_summary& summary)
{
	const auto& stats = summary.stats;
	const auto& latency = stats.latency;
	const auto& pool = summary.pool;

	std::ostringstream oss;
	oss << std::fixed << std::setprecision(2);
	oss << "==== Load test '" << name << "' "
		<< (summary.interrupted ? "interrupted" : "completed") << " ====\n";
	oss << "Workers:      " << summary.workers_started << " started\n";
	oss << "Time:         " << seconds(summary.wall_time) << " wall, " << stats.elapsed_seconds
		<< "s measured" << (stats.measuring ? "" : " (warm-up never finished)") << "\n";
	oss << "Transactions: " << stats.transactions << " (inserts " << stats.inserts << ", selects "
		<< stats.selects << ", updates " << stats.updates << ", deletes " << stats.deletes << ")\n";
	oss << "Errors:       " << stats.errors << ", verification failures "
		<< stats.verification_failures << ", success rate " << stats.success_rate() << "%\n";
	oss << "Throughput:   " << stats.average_tps << " tps average, " << stats.realtime_tps
		<< " tps real-time\n";
	oss << "Latency:      avg " << latency.average_ms << "ms, min " << latency.min_ms << "ms, max "
		<< latency.max_ms << "ms, p50 " << latency.p50_ms << "ms, p95 " << latency.p95_ms
		<< "ms, p99 " << latency.p99_ms << "ms (" << latency.sample_count << " samples)\n";
	oss << "Pool:         warm-up " << summary.warm_up.created << "/" << summary.warm_up.requested
		<< ", created " << pool.total_created << ", recycled " << pool.total_recycled
		<< ", removed " << pool.total_removed << ", failed creations " << pool.failed_creations
		<< ", exhausted " << pool.exhausted_acquires << ", leak warnings " << pool.leak_warnings
		<< "\n";
	return oss.str();
}

load_test_controller::load_test_controller(load_test_config config,
										   std::shared_ptr<adapters::database_adapter> adapter)
	: config_(std::move(config)), adapter_(std::move(adapter))
{
}

load_test_controller::~load_test_controller()
{
	if (signal_)
	{
		signal_->cancel();
	}
	drain_workers();
	if (reporter_)
	{
		reporter_->stop();
	}
	if (pool_)
	{
		pool_->shutdown();
	}
}

kcenon::common::Result<load_test_summary> load_test_controller::run()
{
	auto expected = test_state::idle;
	if (!state_.compare_exchange_strong(expected, test_state::warming_up))
	{
		return make_controller_error(controller_error::already_running,
									 "Load test has already been started");
	}

	auto errors = config_.validation_errors();
	if (!adapter_)
	{
		errors.push_back("No database adapter configured");
	}
	if (!errors.empty())
	{
		std::string message = "Invalid load test configuration:";
		for (const auto& error : errors)
		{
			message += " " + error + ";";
		}
		state_ = test_state::failed;
		return make_controller_error(controller_error::invalid_configuration, message);
	}

	const auto started = clock::now();
	setup_components();

	const auto& plan = config_.workload;
	log(log_level::info,
		"Starting load test '" + config_.name + "': " + std::to_string(plan.worker_count)
			+ " workers, mode " + workload::to_string(plan.mode) + ", adapter "
			+ adapter_->name() + ", duration " + seconds(plan.duration) + ", warm-up "
			+ seconds(plan.warm_up) + ", ramp-up " + seconds(plan.ramp_up)
			+ (limiter_->enabled() ? ", target " + rate(plan.target_tps) + " tps"
								   : ", unthrottled"));

	auto warm_up = warm_up_pool();
	if (stop_requested_.load() || signal_->is_cancelled())
	{
		interrupted_ = true;
		log(log_level::info, "Stop requested during warm-up, shutting down");
		state_ = test_state::stopping;
		signal_->cancel();

		auto summary = finish(warm_up, started);
		state_ = test_state::completed;
		return summary;
	}

	if (warm_up.requested > 0 && warm_up.created == 0 && plan.abort_on_empty_warm_up)
	{
		pool_->shutdown();
		state_ = test_state::failed;
		log(log_level::error, "Aborting: warm-up could not create a single connection");
		return make_controller_error(controller_error::warm_up_failed,
									 "Warm-up created none of the "
										 + std::to_string(warm_up.requested)
										 + " requested connections");
	}

	pool_->start_health_checks();
	if (reporter_)
	{
		reporter_->start();
	}
	state_ = test_state::running;

	const auto load_started = clock::now();
	const auto warm_up_end = load_started + plan.warm_up;
	const auto end = warm_up_end + plan.duration;
	const size_t worker_count = plan.worker_count;

	// Worker i is admitted at i * ramp_up / worker_count
	auto admit_time = [&](size_t index)
	{
		return load_started
			   + std::chrono::milliseconds(plan.ramp_up.count() * static_cast<int64_t>(index)
										   / static_cast<int64_t>(worker_count));
	};

	bool measuring = false;
	if (plan.warm_up.count() == 0)
	{
		stats_->begin_measurement();
		measuring = true;
	}

	size_t admitted = 0;
	while (true)
	{
		if (stop_requested_.load() || signal_->is_cancelled())
		{
			interrupted_ = true;
			log(log_level::info, "Stop requested, shutting down");
			break;
		}

		auto now = clock::now();
		while (admitted < worker_count && now >= admit_time(admitted))
		{
			admit_worker(admitted);
			++admitted;
		}

		if (!measuring && now >= warm_up_end)
		{
			measuring = true;
			if (stats_->begin_measurement())
			{
				log(log_level::info, "Warm-up completed; statistics reset, measuring for "
										 + seconds(plan.duration));
			}
		}

		if (now >= end)
		{
			break;
		}

		auto wake = std::min(end, now + stop_poll_interval);
		if (admitted < worker_count)
		{
			wake = std::min(wake, admit_time(admitted));
		}
		if (!measuring)
		{
			wake = std::min(wake, warm_up_end);
		}
		signal_->wait_until(wake);
	}

	state_ = test_state::stopping;
	signal_->cancel();
	drain_workers();

	auto summary = finish(warm_up, started);
	summary.workers_started = admitted;

	state_ = test_state::completed;
	return summary;
}

void load_test_controller::request_stop() noexcept
{
	stop_requested_.store(true);
}

std::shared_ptr<metrics::stats_aggregator> load_test_controller::stats() const
{
	std::lock_guard<std::mutex> lock(components_mutex_);
	return stats_;
}

std::shared_ptr<pooling::connection_pool> load_test_controller::pool() const
{
	std::lock_guard<std::mutex> lock(components_mutex_);
	return pool_;
}

std::vector<progress_sample> load_test_controller::progress_samples() const
{
	std::lock_guard<std::mutex> lock(components_mutex_);
	return reporter_ ? reporter_->samples() : std::vector<progress_sample>{};
}

std::vector<workload::worker_counters> load_test_controller::worker_counters() const
{
	std::lock_guard<std::mutex> lock(components_mutex_);
	std::vector<workload::worker_counters> counters;
	counters.reserve(workers_.size());
	for (const auto& worker : workers_)
	{
		counters.push_back(worker->counters());
	}
	return counters;
}

void load_test_controller::set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
{
	logger_ = std::move(logger);
}

void load_test_controller::set_sample_sink(sample_sink sink)
{
	sink_ = std::move(sink);
}

void load_test_controller::setup_components()
{
	const auto& plan = config_.workload;

	metrics::stats_config stats_cfg;
	stats_cfg.latency_capacity = config_.monitor.latency_samples;
	stats_cfg.realtime_span = config_.monitor.realtime_window;

	workload::rate_limit_config limit_cfg;
	limit_cfg.transactions_per_second = plan.target_tps;

	workload::payload_config payload_cfg;
	payload_cfg.data_length = plan.payload_size;
	payload_cfg.existing_rows = plan.existing_rows;

	std::lock_guard<std::mutex> lock(components_mutex_);

	signal_ = std::make_shared<shutdown_signal>();
	stats_ = std::make_shared<metrics::stats_aggregator>(stats_cfg);
	pool_ = std::make_shared<pooling::connection_pool>(config_.pool, adapter_, signal_);
	pool_->set_logger(logger_);
	limiter_ = std::make_shared<workload::rate_limiter>(limit_cfg);
	generator_ = std::make_shared<workload::payload_generator>(payload_cfg);

	if (config_.monitor.enabled)
	{
		reporter_ = std::make_unique<progress_reporter>(config_.monitor.interval, stats_, pool_,
														signal_);
		reporter_->set_logger(logger_);
		reporter_->set_sink(sink_);
	}
}

pooling::warm_up_report load_test_controller::warm_up_pool()
{
	// Warm-up blocks on backend opens; keep watching for a stop request
	// so it can be cut short through the shutdown signal
	auto pending = std::async(std::launch::async, [pool = pool_]() { return pool->warm_up(); });

	do
	{
		if (stop_requested_.load() && !signal_->is_cancelled())
		{
			signal_->cancel();
		}
	} while (pending.wait_for(stop_poll_interval) != std::future_status::ready);

	return pending.get();
}

void load_test_controller::admit_worker(size_t index)
{
	workload::worker_config worker_cfg;
	worker_cfg.name = workload::load_worker::make_name(index + 1);
	worker_cfg.mode = config_.workload.mode;
	worker_cfg.acquire_wait = config_.pool.acquire_wait;
	worker_cfg.batch_size = config_.workload.batch_size;
	worker_cfg.backoff = config_.workload.backoff;
	worker_cfg.error_log_interval = config_.workload.error_log_interval;

	auto worker = std::make_unique<workload::load_worker>(
		worker_cfg, pool_, adapter_, stats_, generator_, signal_,
		limiter_->enabled() ? limiter_ : nullptr);
	worker->set_logger(logger_);

	auto* runner = worker.get();
	{
		std::lock_guard<std::mutex> lock(components_mutex_);
		workers_.push_back(std::move(worker));
	}
	threads_.emplace_back([runner]() { runner->run(); });

	log(log_level::debug, runner->name() + " admitted");
}

void load_test_controller::drain_workers()
{
	for (auto& thread : threads_)
	{
		if (thread.joinable())
		{
			thread.join();
		}
	}
	threads_.clear();
}

load_test_summary load_test_controller::finish(const pooling::warm_up_report& warm_up,
											   clock::time_point started)
{
	if (reporter_)
	{
		reporter_->stop();
	}

	load_test_summary summary;
	summary.stats = stats_->snapshot();
	summary.pool = pool_->shutdown();
	summary.warm_up = warm_up;
	summary.interrupted = interrupted_;
	summary.wall_time
		= std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - started);

	for (const auto& worker : workers_)
	{
		summary.workers.push_back(worker->counters());
	}

	if (!summary.stats.measuring)
	{
		log(log_level::warning, "Stopped before warm-up completed; statistics include warm-up traffic");
	}

	std::istringstream report(format_report(config_.name, summary));
	std::string line;
	while (std::getline(report, line))
	{
		log(log_level::info, line);
	}

	return summary;
}

void load_test_controller::log(kcenon::common::interfaces::log_level level,
							   const std::string& message) const
{
	if (logger_)
	{
		logger_->log(level, message);
	}
}

} // namespace database_load_tester::core

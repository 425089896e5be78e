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

#include <kcenon/database_load_tester/pooling/connection_pool.h>

#include <algorithm>
#include <sstream>

namespace database_load_tester::pooling
{

namespace
{

using kcenon::common::interfaces::log_level;

// Upper bound on how long a blocked call can miss a fired shutdown signal
constexpr std::chrono::milliseconds signal_poll_interval{50};

template <typename Duration>
long long to_ms(Duration duration)
{
	return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

} // namespace

connection_pool::connection_pool(pool_config config,
								 std::shared_ptr<adapters::database_adapter> adapter,
								 std::shared_ptr<core::shutdown_signal> signal)
	: config_(std::move(config))
	, adapter_(std::move(adapter))
	, signal_(std::move(signal))
	, owns_signal_(signal_ == nullptr)
{
	if (!signal_)
	{
		signal_ = std::make_shared<core::shutdown_signal>();
	}
}

connection_pool::~connection_pool()
{
	shutdown();
}

warm_up_report connection_pool::warm_up()
{
	return warm_up(config_.min_connections);
}

warm_up_report connection_pool::warm_up(size_t count)
{
	warm_up_report report;
	report.requested = count;
	auto started = clock::now();

	for (size_t i = 0; i < count && !signal_->is_cancelled(); ++i)
	{
		{
			std::lock_guard<std::mutex> lock(mutex_);
			if (shutting_down_ || !has_capacity_locked())
			{
				break;
			}
			++pending_;
		}

		auto created = create_connection();

		{
			std::lock_guard<std::mutex> lock(mutex_);
			--pending_;
			if (created.is_ok() && !shutting_down_)
			{
				idle_.push_back(created.value());
				++report.created;
				continue;
			}
		}

		if (created.is_ok())
		{
			close_connection(created.value());
			break;
		}

		log(log_level::warning, "Warm-up connection " + std::to_string(i + 1) + " skipped: "
									+ created.error().message);
	}

	condition_.notify_all();
	report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - started);

	std::ostringstream oss;
	oss << "Pool warm-up created " << report.created << "/" << report.requested
		<< " connections in " << report.elapsed.count() << "ms";
	log(report.complete() ? log_level::info : log_level::warning, oss.str());

	return report;
}

kcenon::common::Result<std::shared_ptr<pooled_connection>> connection_pool::acquire(
	const std::string& holder)
{
	return acquire(holder, config_.acquire_wait);
}

kcenon::common::Result<std::shared_ptr<pooled_connection>> connection_pool::acquire(
	const std::string& holder, std::chrono::milliseconds wait_per_attempt)
{
	std::unique_lock<std::mutex> lock(mutex_);

	if (shutting_down_)
	{
		return make_pool_error(pool_error::pool_shut_down, "Pool is shut down");
	}

	if (auto connection = take_idle_locked(holder))
	{
		return connection;
	}

	// One creation per acquire at most; a failed one is not retried by the
	// wait loop, which only waits for released connections
	bool grew = false;
	if (has_capacity_locked())
	{
		grew = true;
		auto grown = grow_locked(lock, holder);
		if (grown.is_ok() || !is_recoverable(grown.error()))
		{
			return grown;
		}
	}

	auto backoff = config_.acquire_backoff_initial;
	for (uint32_t attempt = 1; attempt <= config_.acquire_attempts; ++attempt)
	{
		wait_locked(lock, clock::now() + wait_per_attempt,
					[this, &grew]()
					{ return shutting_down_ || !idle_.empty() || (!grew && has_capacity_locked()); });

		if (shutting_down_)
		{
			return make_pool_error(pool_error::pool_shut_down, "Pool is shut down");
		}
		if (signal_->is_cancelled())
		{
			return make_pool_error(pool_error::acquire_cancelled, "Acquire cancelled by shutdown");
		}

		if (auto connection = take_idle_locked(holder))
		{
			return connection;
		}

		if (!grew && has_capacity_locked())
		{
			grew = true;
			auto grown = grow_locked(lock, holder);
			if (grown.is_ok() || !is_recoverable(grown.error()))
			{
				return grown;
			}
		}

		if (attempt < config_.acquire_attempts)
		{
			// A connection released during the pause ends it early
			wait_locked(lock, clock::now() + backoff,
						[this]() { return shutting_down_ || !idle_.empty(); });
			backoff = std::min(backoff * 2, config_.acquire_backoff_max);
		}
	}

	exhausted_acquires_.fetch_add(1, std::memory_order_relaxed);
	return make_pool_error(pool_error::pool_exhausted,
						   "No connection available after "
							   + std::to_string(config_.acquire_attempts) + " attempts");
}

kcenon::common::VoidResult connection_pool::release(
	const std::shared_ptr<pooled_connection>& connection, release_mode mode)
{
	if (!connection)
	{
		return make_pool_error(pool_error::invalid_release, "Released connection is null");
	}

	std::unique_lock<std::mutex> lock(mutex_);

	auto it = active_.find(connection->id());
	if (it == active_.end() || it->second != connection)
	{
		lock.unlock();
		log(log_level::warning, "Rejected release of connection #" + std::to_string(connection->id())
									+ ": not checked out");
		return make_pool_error(pool_error::invalid_release,
							   "Connection #" + std::to_string(connection->id())
								   + " is not checked out");
	}

	active_.erase(it);
	connection->checked_out_at_.reset();
	connection->holder_.clear();
	connection->use_count_++;
	connection->last_used_at_ = clock::now();

	if (mode == release_mode::reuse)
	{
		idle_.push_back(connection);
		lock.unlock();
		condition_.notify_one();
		return kcenon::common::ok();
	}

	++pending_;
	lock.unlock();

	bool alive = check_alive(connection);

	lock.lock();
	--pending_;
	if (alive && !shutting_down_)
	{
		idle_.push_back(connection);
		lock.unlock();
		condition_.notify_one();
		return kcenon::common::ok();
	}
	lock.unlock();

	if (!alive)
	{
		total_removed_.fetch_add(1, std::memory_order_relaxed);
		log(log_level::debug,
			"Connection #" + std::to_string(connection->id()) + " failed validation on release");
	}
	close_connection(connection);
	condition_.notify_one();

	return kcenon::common::ok();
}

health_check_report connection_pool::run_health_check()
{
	struct leak_notice
	{
		uint64_t id;
		std::string holder;
		std::chrono::milliseconds held;
	};

	health_check_report report;
	std::vector<connection_ptr> expired;
	std::vector<connection_ptr> surplus;
	std::vector<connection_ptr> to_validate;
	std::vector<leak_notice> leaks;

	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (shutting_down_)
		{
			return report;
		}

		auto now = clock::now();
		report.checked = idle_.size();
		size_t live = idle_.size() + active_.size() + pending_;

		std::deque<connection_ptr> kept;
		for (auto& connection : idle_)
		{
			if (connection->age(now) > config_.max_lifetime)
			{
				expired.push_back(std::move(connection));
				--live;
			}
			else if (config_.idle_timeout.count() > 0 && live > config_.min_connections
					 && connection->idle_for(now) > config_.idle_timeout)
			{
				surplus.push_back(std::move(connection));
				--live;
			}
			else if (config_.validate_idle || keepalive_due(*connection, now))
			{
				to_validate.push_back(std::move(connection));
			}
			else
			{
				kept.push_back(std::move(connection));
			}
		}
		idle_.swap(kept);
		pending_ += to_validate.size();

		for (const auto& [id, connection] : active_)
		{
			if (!connection->checked_out_at_)
			{
				continue;
			}

			auto held = std::chrono::duration_cast<std::chrono::milliseconds>(
				now - *connection->checked_out_at_);
			if (held > config_.leak_detection_threshold)
			{
				leaks.push_back({id, connection->holder_, held});
			}
		}
	}

	report.recycled = expired.size();
	report.shrunk = surplus.size();
	report.leak_warnings = leaks.size();
	total_recycled_.fetch_add(expired.size(), std::memory_order_relaxed);
	total_shrunk_.fetch_add(surplus.size(), std::memory_order_relaxed);
	leak_warnings_.fetch_add(leaks.size(), std::memory_order_relaxed);

	for (const auto& leak : leaks)
	{
		std::ostringstream oss;
		oss << "Possible connection leak: connection #" << leak.id << " held by " << leak.holder
			<< " for " << leak.held.count() << "ms (threshold "
			<< config_.leak_detection_threshold.count() << "ms)";
		log(log_level::warning, oss.str());
	}

	for (const auto& connection : expired)
	{
		close_connection(connection);
	}
	for (const auto& connection : surplus)
	{
		close_connection(connection);
	}

	std::vector<connection_ptr> alive;
	std::vector<connection_ptr> dead;
	for (auto& connection : to_validate)
	{
		if (check_alive(connection))
		{
			alive.push_back(std::move(connection));
		}
		else
		{
			dead.push_back(std::move(connection));
		}
	}
	report.removed = dead.size();
	total_removed_.fetch_add(dead.size(), std::memory_order_relaxed);

	{
		std::lock_guard<std::mutex> lock(mutex_);
		pending_ -= alive.size() + dead.size();
		auto validated_at = clock::now();
		for (auto& connection : alive)
		{
			if (shutting_down_)
			{
				dead.push_back(std::move(connection));
			}
			else
			{
				connection->last_validated_at_ = validated_at;
				idle_.push_back(std::move(connection));
			}
		}
		report.idle_after = idle_.size();
		report.active_after = active_.size();
	}
	condition_.notify_all();

	for (const auto& connection : dead)
	{
		close_connection(connection);
	}

	health_check_cycles_.fetch_add(1, std::memory_order_relaxed);

	std::ostringstream oss;
	oss << "Health check: checked=" << report.checked << " removed=" << report.removed
		<< " recycled=" << report.recycled << " shrunk=" << report.shrunk << " leaks=" << report.leak_warnings
		<< " idle=" << report.idle_after << " active=" << report.active_after;
	bool changed = report.removed > 0 || report.recycled > 0 || report.shrunk > 0
				   || report.leak_warnings > 0;
	log(changed ? log_level::info : log_level::debug, oss.str());

	return report;
}

void connection_pool::start_health_checks()
{
	if (!config_.enable_health_checks)
	{
		return;
	}

	std::lock_guard<std::mutex> lock(health_mutex_);
	if (health_thread_.joinable())
	{
		return;
	}

	stop_health_ = false;
	health_thread_ = std::thread(&connection_pool::health_check_loop, this);
}

void connection_pool::stop_health_checks()
{
	std::thread worker;
	{
		std::lock_guard<std::mutex> lock(health_mutex_);
		stop_health_ = true;
		worker = std::move(health_thread_);
	}
	health_condition_.notify_all();

	if (worker.joinable())
	{
		worker.join();
	}
}

pool_stats connection_pool::shutdown()
{
	stop_health_checks();

	std::vector<connection_ptr> doomed;
	bool first_call = false;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (!shutting_down_)
		{
			shutting_down_ = true;
			first_call = true;
			doomed.assign(idle_.begin(), idle_.end());
			for (auto& [id, connection] : active_)
			{
				doomed.push_back(connection);
			}
			idle_.clear();
			active_.clear();
		}
	}
	condition_.notify_all();

	if (owns_signal_)
	{
		signal_->cancel();
	}

	for (const auto& connection : doomed)
	{
		close_connection(connection);
	}

	auto stats = get_stats();
	if (first_call)
	{
		std::ostringstream oss;
		oss << "Connection pool shut down: closed " << doomed.size() << " connections (created "
			<< stats.total_created << ", recycled " << stats.total_recycled << ", removed "
			<< stats.total_removed << ", leak warnings " << stats.leak_warnings << ")";
		log(log_level::info, oss.str());
	}

	return stats;
}

pool_stats connection_pool::get_stats() const
{
	pool_stats stats;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		stats.idle = idle_.size();
		stats.active = active_.size();
		stats.pending = pending_;
	}
	stats.total = stats.idle + stats.active;
	stats.min_connections = config_.min_connections;
	stats.max_connections = config_.max_connections;
	stats.total_created = total_created_.load(std::memory_order_relaxed);
	stats.total_recycled = total_recycled_.load(std::memory_order_relaxed);
	stats.total_removed = total_removed_.load(std::memory_order_relaxed);
	stats.total_shrunk = total_shrunk_.load(std::memory_order_relaxed);
	stats.failed_creations = failed_creations_.load(std::memory_order_relaxed);
	stats.exhausted_acquires = exhausted_acquires_.load(std::memory_order_relaxed);
	stats.leak_warnings = leak_warnings_.load(std::memory_order_relaxed);
	stats.health_check_cycles = health_check_cycles_.load(std::memory_order_relaxed);
	return stats;
}

bool connection_pool::is_shut_down() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return shutting_down_;
}

void connection_pool::set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
{
	logger_ = std::move(logger);
}

std::shared_ptr<kcenon::common::interfaces::ILogger> connection_pool::get_logger() const
{
	return logger_;
}

kcenon::common::Result<std::shared_ptr<pooled_connection>> connection_pool::create_connection()
{
	auto backoff = config_.create_backoff_initial;
	std::string last_error = "no attempt made";
	uint32_t attempts = std::max<uint32_t>(config_.create_attempts, 1);

	for (uint32_t attempt = 1; attempt <= attempts; ++attempt)
	{
		try
		{
			auto opened = adapter_->open();
			if (opened.is_ok())
			{
				total_created_.fetch_add(1, std::memory_order_relaxed);
				return std::make_shared<pooled_connection>(next_id_.fetch_add(1), opened.value());
			}
			last_error = opened.error().message;
		}
		catch (const std::exception& e)
		{
			last_error = e.what();
		}

		log(log_level::debug, "Connection attempt " + std::to_string(attempt) + "/"
								  + std::to_string(attempts) + " failed: " + last_error);

		if (attempt < attempts)
		{
			if (signal_->wait_for(backoff))
			{
				break;
			}
			backoff = std::min(backoff * 2, config_.create_backoff_max);
		}
	}

	failed_creations_.fetch_add(1, std::memory_order_relaxed);
	return make_pool_error(pool_error::connection_creation_failed,
						   "Failed to create connection: " + last_error);
}

kcenon::common::Result<std::shared_ptr<pooled_connection>> connection_pool::grow_locked(
	std::unique_lock<std::mutex>& lock, const std::string& holder)
{
	++pending_;
	lock.unlock();
	auto created = create_connection();
	lock.lock();
	--pending_;

	if (created.is_err())
	{
		return created;
	}

	auto connection = created.value();
	if (shutting_down_)
	{
		lock.unlock();
		close_connection(connection);
		lock.lock();
		return make_pool_error(pool_error::pool_shut_down, "Pool is shut down");
	}

	check_out_locked(connection, holder);
	return connection;
}

std::shared_ptr<pooled_connection> connection_pool::take_idle_locked(const std::string& holder)
{
	if (idle_.empty())
	{
		return nullptr;
	}

	auto connection = std::move(idle_.front());
	idle_.pop_front();
	check_out_locked(connection, holder);
	return connection;
}

void connection_pool::check_out_locked(const connection_ptr& connection, const std::string& holder)
{
	auto now = clock::now();
	connection->checked_out_at_ = now;
	connection->last_used_at_ = now;
	connection->holder_ = holder;
	active_.emplace(connection->id(), connection);
}

bool connection_pool::has_capacity_locked() const
{
	return idle_.size() + active_.size() + pending_ < config_.max_connections;
}

template <typename Predicate>
bool connection_pool::wait_locked(std::unique_lock<std::mutex>& lock, clock::time_point deadline,
								  Predicate ready)
{
	while (!ready())
	{
		if (signal_->is_cancelled())
		{
			return false;
		}

		auto now = clock::now();
		if (now >= deadline)
		{
			return false;
		}

		condition_.wait_until(lock, std::min(deadline, now + signal_poll_interval));
	}
	return true;
}

bool connection_pool::keepalive_due(const pooled_connection& connection,
									clock::time_point now) const
{
	if (config_.keepalive_time.count() <= 0)
	{
		return false;
	}

	auto last_seen = std::max(connection.last_used_at_, connection.last_validated_at_);
	return now - last_seen > config_.keepalive_time;
}

bool connection_pool::check_alive(const connection_ptr& connection)
{
	try
	{
		return adapter_->is_alive(connection->handle());
	}
	catch (const std::exception& e)
	{
		log(log_level::debug, "Liveness check threw: " + std::string(e.what()));
		return false;
	}
}

void connection_pool::close_connection(const connection_ptr& connection)
{
	try
	{
		adapter_->close(connection->handle());
	}
	catch (const std::exception& e)
	{
		log(log_level::warning, "Closing connection #" + std::to_string(connection->id())
									+ " failed: " + e.what());
	}
}

void connection_pool::health_check_loop()
{
	std::unique_lock<std::mutex> lock(health_mutex_);

	while (!stop_health_)
	{
		auto deadline = clock::now() + config_.health_check_interval;

		// Sleep in short slices so the shared shutdown signal is noticed
		while (!stop_health_ && !signal_->is_cancelled() && clock::now() < deadline)
		{
			health_condition_.wait_until(
				lock, std::min(deadline, clock::now() + std::chrono::milliseconds(100)));
		}

		if (stop_health_ || signal_->is_cancelled())
		{
			break;
		}

		lock.unlock();
		run_health_check();
		lock.lock();
	}
}

void connection_pool::log(kcenon::common::interfaces::log_level level,
						  const std::string& message) const
{
	if (logger_)
	{
		logger_->log(level, message);
	}
}

} // namespace database_load_tester::pooling

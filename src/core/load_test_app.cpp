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

#include <kcenon/database_load_tester/load_test_app.h>

#include <kcenon/database_load_tester/adapters/simulated_adapter.h>
#include <kcenon/database_load_tester/logging/console_logger.h>

#include <csignal>
#include <iostream>

namespace database_load_tester
{

using kcenon::common::interfaces::log_level;

// Static member initialization
load_test_app* load_test_app::instance_ = nullptr;

load_test_app::load_test_app() = default;

load_test_app::~load_test_app()
{
	if (instance_ == this)
	{
		instance_ = nullptr;
	}
}

kcenon::common::VoidResult load_test_app::initialize(const std::string& config_path)
{
	auto loaded = core::load_test_config::load_from_file(config_path);
	if (loaded.is_err())
	{
		std::cerr << "Failed to load configuration: " << loaded.error().message << std::endl;
		return loaded.error();
	}

	return initialize(loaded.value());
}

kcenon::common::VoidResult load_test_app::initialize(const core::load_test_config& config)
{
	if (controller_)
	{
		return kcenon::common::error_info{-1, "Application already initialized", "load_test_app"};
	}

	config_ = config;

	if (!config_.validate())
	{
		std::cerr << "Configuration validation failed:" << std::endl;
		for (const auto& error : config_.validation_errors())
		{
			std::cerr << "  - " << error << std::endl;
		}
		return kcenon::common::error_info{
			static_cast<int>(core::controller_error::invalid_configuration),
			"Configuration validation failed", "load_test_app"};
	}

	if (!logger_)
	{
		logging::logger_options options;
		options.min_level = logging::parse_log_level(config_.logging.level).value_or(log_level::info);
		options.log_file = config_.logging.log_file;
		options.enable_console = config_.logging.enable_console;
		logger_ = logging::create_console_logger(options);
	}

	auto adapter = create_adapter();
	if (adapter.is_err())
	{
		log(log_level::error, "Adapter setup failed: " + adapter.error().message);
		return adapter;
	}

	controller_ = std::make_unique<core::load_test_controller>(config_, adapter_);
	controller_->set_logger(logger_);

	setup_signal_handlers();

	log(log_level::info, "Load test '" + config_.name + "' initialized with the " + adapter_->name()
							 + " adapter");
	return kcenon::common::ok();
}

int load_test_app::run()
{
	if (!controller_)
	{
		std::cerr << "Application not initialized" << std::endl;
		return static_cast<int>(exit_code::initialization_failed);
	}

	if (stop_requested_.load())
	{
		controller_->request_stop();
	}

	auto result = controller_->run();
	if (result.is_err())
	{
		log(log_level::error, "Load test failed: " + result.error().message);
		if (!logger_ || !logger_->is_enabled(log_level::error))
		{
			std::cerr << "Load test failed: " << result.error().message << std::endl;
		}
		return static_cast<int>(exit_code::run_failed);
	}

	summary_ = result.value();

	// The controller already logged the report where info is visible
	if (!logger_ || !logger_->is_enabled(log_level::info))
	{
		std::cout << core::format_report(config_.name, *summary_);
	}

	if (logger_)
	{
		(void)logger_->flush();
	}

	if (summary_->stats.verification_failures > 0)
	{
		return static_cast<int>(exit_code::verification_failed);
	}
	return static_cast<int>(exit_code::success);
}

void load_test_app::stop() noexcept
{
	stop_requested_.store(true);
	if (controller_)
	{
		controller_->request_stop();
	}
}

void load_test_app::set_backend_factory(adapters::backend_factory factory,
										database::core::connection_config connection)
{
	backend_factory_ = std::move(factory);
	backend_connection_ = std::move(connection);
}

void load_test_app::set_adapter(std::shared_ptr<adapters::database_adapter> adapter)
{
	adapter_ = std::move(adapter);
}

void load_test_app::set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
{
	logger_ = std::move(logger);
}

const core::load_test_config& load_test_app::config() const
{
	return config_;
}

kcenon::common::VoidResult load_test_app::create_adapter()
{
	if (adapter_)
	{
		return kcenon::common::ok();
	}

	if (config_.adapter.type == "simulated")
	{
		adapters::simulated_config simulated;
		simulated.operation_latency = std::chrono::microseconds(config_.adapter.latency_us);
		simulated.latency_jitter = std::chrono::microseconds(config_.adapter.latency_jitter_us);
		simulated.failure_rate = config_.adapter.failure_rate;
		adapter_ = std::make_shared<adapters::simulated_adapter>(simulated);
		return kcenon::common::ok();
	}

	if (config_.adapter.type == "backend")
	{
		if (!backend_factory_)
		{
			return kcenon::common::error_info{
				-1, "adapter.type=backend requires a registered backend factory", "load_test_app"};
		}

		adapters::backend_adapter_config backend;
		backend.table_name = config_.adapter.table_name;
		backend.connection = backend_connection_;
		adapter_ = std::make_shared<adapters::backend_adapter>(backend_factory_, backend);
		return kcenon::common::ok();
	}

	return kcenon::common::error_info{-1, "Unknown adapter type: " + config_.adapter.type,
									  "load_test_app"};
}

void load_test_app::setup_signal_handlers()
{
	instance_ = this;

#ifdef _WIN32
	std::signal(SIGINT, signal_handler);
	std::signal(SIGTERM, signal_handler);
#else
	struct sigaction sa;
	sa.sa_handler = signal_handler;
	sigemptyset(&sa.sa_mask);
	sa.sa_flags = 0;

	sigaction(SIGINT, &sa, nullptr);
	sigaction(SIGTERM, &sa, nullptr);
#endif
}

void load_test_app::signal_handler(int /*signal*/)
{
	// Only atomic stores here; the run loop does the logging
	if (instance_ != nullptr)
	{
		instance_->stop();
	}
}

void load_test_app::log(log_level level, const std::string& message) const
{
	if (logger_)
	{
		logger_->log(level, message);
	}
}

} // namespace database_load_tester

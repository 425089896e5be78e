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
 * @file load_test_app.h
 * @brief Load tester application interface
 *
 * Wraps one load test run for a driver program:
 * - Configuration loading and validation
 * - Logger construction from the logging section
 * - Adapter selection (built-in simulated backend, or a database_system
 *   backend supplied by the embedding program)
 * - Signal handling for graceful early stop
 * - Exit codes
 */

#pragma once

#include "core/load_test_config.h"
#include "core/load_test_controller.h"

#include <kcenon/database_load_tester/adapters/backend_adapter.h>

#include <atomic>
#include <memory>
#include <optional>
#include <string>

#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>

namespace database_load_tester
{

/**
 * @enum exit_code
 * @brief Process exit codes returned by run()
 */
enum class exit_code : int
{
	success = 0,             ///< Test ran to completion or was stopped by a signal
	initialization_failed = 1, ///< Bad configuration or adapter setup
	run_failed = 2,          ///< Controller aborted (e.g. empty warm-up)
	verification_failed = 3  ///< Completed, but full-mode reads did not match writes
};

/**
 * @class load_test_app
 * @brief Main load tester application
 *
 * Usage Example:
 * @code
 *   database_load_tester::load_test_app app;
 *   auto init = app.initialize("load_test.conf");
 *   if (init.is_err()) {
 *       return 1;
 *   }
 *   return app.run();
 * @endcode
 *
 * To test a real database, register a backend factory before initialize()
 * and set adapter.type=backend.
 */
class load_test_app
{
public:
	load_test_app();
	~load_test_app();

	load_test_app(const load_test_app&) = delete;
	load_test_app& operator=(const load_test_app&) = delete;
	load_test_app(load_test_app&&) = delete;
	load_test_app& operator=(load_test_app&&) = delete;

	/**
	 * @brief Initialize from a configuration file
	 */
	kcenon::common::VoidResult initialize(const std::string& config_path);

	/**
	 * @brief Initialize from a configuration object
	 */
	kcenon::common::VoidResult initialize(const core::load_test_config& config);

	/**
	 * @brief Run the test to completion
	 * @return Process exit code (see exit_code)
	 */
	int run();

	/**
	 * @brief Request an early, graceful stop
	 *
	 * Only stores an atomic flag; safe from a signal handler.
	 */
	void stop() noexcept;

	/**
	 * @brief Register the database_system backend used for adapter.type=backend
	 */
	void set_backend_factory(adapters::backend_factory factory,
							 database::core::connection_config connection = {});

	/**
	 * @brief Use a caller-provided adapter instead of the configured one
	 */
	void set_adapter(std::shared_ptr<adapters::database_adapter> adapter);

	/**
	 * @brief Replace the logger built from configuration
	 */
	void set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

	[[nodiscard]] const core::load_test_config& config() const;
	[[nodiscard]] bool is_initialized() const noexcept { return controller_ != nullptr; }

	/**
	 * @brief Summary of the last completed run
	 */
	[[nodiscard]] const std::optional<core::load_test_summary>& summary() const noexcept
	{
		return summary_;
	}

private:
	void setup_signal_handlers();
	kcenon::common::VoidResult create_adapter();
	void log(kcenon::common::interfaces::log_level level, const std::string& message) const;

	core::load_test_config config_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
	std::shared_ptr<adapters::database_adapter> adapter_;
	adapters::backend_factory backend_factory_;
	database::core::connection_config backend_connection_;
	std::unique_ptr<core::load_test_controller> controller_;
	std::optional<core::load_test_summary> summary_;
	std::atomic<bool> stop_requested_{false};

	// Signal handling
	static load_test_app* instance_;
	static void signal_handler(int signal);
};

} // namespace database_load_tester

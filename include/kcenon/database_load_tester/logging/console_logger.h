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
 * @file console_logger.h
 * @brief Console logger for load test runs
 *
 * ILogger implementation that writes timestamped lines to stdout/stderr and
 * optionally mirrors every line into a log file, so a long run leaves a
 * record next to its final report.
 *
 * Usage:
 * @code
 *   logger_options options;
 *   options.min_level = kcenon::common::interfaces::log_level::debug;
 *   options.log_file = "load_test.log";
 *   auto logger = database_load_tester::logging::create_console_logger(options);
 *   logger->log(kcenon::common::interfaces::log_level::info, std::string("Run started"));
 * @endcode
 */

#pragma once

#include <kcenon/common/interfaces/logger_interface.h>

#include <atomic>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace database_load_tester::logging
{

/**
 * @struct logger_options
 * @brief Output selection for console_logger
 */
struct logger_options
{
	kcenon::common::interfaces::log_level min_level
		= kcenon::common::interfaces::log_level::info;
	std::string log_file;        ///< Mirror file, appended to; empty for none
	bool enable_console = true;  ///< Write to stdout/stderr
};

/**
 * @brief Parse a level name (debug, info, warn, warning, error)
 * @return Level, or std::nullopt for an unknown name
 */
std::optional<kcenon::common::interfaces::log_level> parse_log_level(std::string_view name);

/**
 * @class console_logger
 * @brief Thread-safe console logger with an optional file mirror
 *
 * Messages at warning and above go to stderr, the rest to stdout. When a
 * log file is configured every enabled line is also appended there.
 */
class console_logger : public kcenon::common::interfaces::ILogger
{
public:
	explicit console_logger(logger_options options = {});
	~console_logger() override;

	console_logger(const console_logger&) = delete;
	console_logger& operator=(const console_logger&) = delete;

	kcenon::common::VoidResult log(kcenon::common::interfaces::log_level level,
								   const std::string& message) override;

	kcenon::common::VoidResult log(
		kcenon::common::interfaces::log_level level,
		std::string_view message,
		const kcenon::common::source_location& loc
		= kcenon::common::source_location::current()) override;

	kcenon::common::VoidResult log(
		const kcenon::common::interfaces::log_entry& entry) override;

	bool is_enabled(kcenon::common::interfaces::log_level level) const override;

	kcenon::common::VoidResult set_level(
		kcenon::common::interfaces::log_level level) override;

	kcenon::common::interfaces::log_level get_level() const override;

	kcenon::common::VoidResult flush() override;

	/**
	 * @brief Whether the mirror file was opened successfully
	 */
	bool has_log_file() const;

	/**
	 * @brief Number of lines written since construction
	 */
	uint64_t lines_written() const noexcept { return lines_written_.load(); }

private:
	void write_message(kcenon::common::interfaces::log_level level,
					   const std::string& message,
					   const std::string& file = "",
					   int line = 0);

	std::string get_timestamp() const;

	std::atomic<kcenon::common::interfaces::log_level> min_level_;
	bool enable_console_;
	std::ofstream file_;
	std::atomic<uint64_t> lines_written_{0};
	mutable std::mutex output_mutex_;
};

/**
 * @brief Factory function to create a console logger
 * @param options Level and output selection
 * @return Shared pointer to ILogger
 */
std::shared_ptr<kcenon::common::interfaces::ILogger> create_console_logger(
	logger_options options = {});

} // namespace database_load_tester::logging

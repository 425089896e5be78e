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
 * @file backend_adapter.h
 * @brief database_adapter over database_system backends
 *
 * Bridges the load generation core to any database::core::database_backend.
 * Backends are produced by a caller-supplied factory so the harness does not
 * depend on a particular driver. Each connection owns one initialized
 * backend instance.
 */

#pragma once

#include "database_adapter.h"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <database/core/database_backend.h>

namespace database_load_tester::adapters
{

/**
 * @brief Factory producing a fresh, uninitialized backend instance
 */
using backend_factory = std::function<std::unique_ptr<database::core::database_backend>()>;

/**
 * @struct backend_adapter_config
 * @brief Target table and connection parameters
 */
struct backend_adapter_config
{
	std::string table_name = "load_test";              ///< Table with id, thread_id, data
	database::core::connection_config connection;      ///< Passed to backend initialize()
	std::string liveness_query = "SELECT 1";           ///< No-op liveness statement
};

/**
 * @class backend_adapter
 * @brief Runs load test operations through database_system
 *
 * Statements are plain ANSI SQL against a single table:
 * @code
 *   CREATE TABLE load_test (id BIGINT PRIMARY KEY, thread_id VARCHAR(64), data TEXT)
 * @endcode
 * Each write runs inside begin/commit and is rolled back if the statement
 * fails. Schema management is left to the operator.
 *
 * close() may race with an operation on the same connection when the pool
 * shuts down mid-run. The backend is shared with the running operation and
 * shut down by whichever side lets go of it last.
 */
class backend_adapter : public database_adapter
{
public:
	/**
	 * @brief Construct adapter
	 * @param factory Creates one backend per connection
	 * @param config Table and connection settings
	 */
	backend_adapter(backend_factory factory, backend_adapter_config config);
	~backend_adapter() override = default;

	kcenon::common::Result<std::shared_ptr<adapter_connection>> open() override;
	bool is_alive(adapter_connection& connection) override;
	kcenon::common::Result<operation_result> execute(adapter_connection& connection,
													 operation_kind kind,
													 const transaction_payload& payload) override;
	kcenon::common::Result<operation_result> execute_batch(
		adapter_connection& connection, const std::vector<transaction_payload>& rows) override;
	void close(adapter_connection& connection) override;
	[[nodiscard]] std::string name() const override { return "backend"; }

	/**
	 * @brief Build the statement text for an operation
	 */
	[[nodiscard]] std::string build_statement(operation_kind kind,
											  const transaction_payload& payload) const;

private:
	using shared_backend = std::shared_ptr<database::core::database_backend>;

	struct backend_connection : adapter_connection
	{
		std::mutex mutex;
		shared_backend backend;
	};

	static shared_backend backend_of(adapter_connection& connection);

	kcenon::common::Result<operation_result> run_write(database::core::database_backend& backend,
													   operation_kind kind,
													   const std::string& statement);
	kcenon::common::Result<operation_result> run_select(database::core::database_backend& backend,
														const std::string& statement);

	backend_factory factory_;
	backend_adapter_config config_;
};

} // namespace database_load_tester::adapters

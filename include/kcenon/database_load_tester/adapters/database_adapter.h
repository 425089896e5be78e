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
 * @file database_adapter.h
 * @brief Backend-neutral interface consumed by the pool and the workers
 *
 * The load generation core never talks to a database driver directly. It
 * opens, checks, uses and closes connections through a database_adapter.
 * Each backend is one implementation of this interface, selected by
 * configuration.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <kcenon/common/patterns/result.h>

namespace database_load_tester::adapters
{

/**
 * @enum operation_kind
 * @brief Single-statement operations a worker can submit
 */
enum class operation_kind
{
	insert,
	select,
	update,
	remove
};

/**
 * @brief Convert operation kind to string
 */
constexpr const char* to_string(operation_kind kind) noexcept
{
	switch (kind)
	{
	case operation_kind::insert:
		return "insert";
	case operation_kind::select:
		return "select";
	case operation_kind::update:
		return "update";
	case operation_kind::remove:
		return "delete";
	}
	return "unknown";
}

/**
 * @struct transaction_payload
 * @brief Opaque input of one operation
 */
struct transaction_payload
{
	int64_t record_id = 0;  ///< Target row id (new id for inserts)
	std::string thread_id;  ///< Name of the issuing worker
	std::string data;       ///< Row content written by insert/update
};

/**
 * @struct operation_result
 * @brief Outcome of one successful operation
 */
struct operation_result
{
	uint64_t affected_rows = 0;       ///< Rows inserted/updated/deleted/read
	std::optional<std::string> data;  ///< Row content read back by select
};

/**
 * @class adapter_connection
 * @brief Opaque raw connection handle produced by an adapter
 *
 * Only the adapter that opened a connection knows its concrete type. The
 * pool owns every handle and passes it back to the adapter for each call.
 */
class adapter_connection
{
public:
	virtual ~adapter_connection() = default;
};

/**
 * @class database_adapter
 * @brief Abstract backend adapter
 *
 * Every operation may block and may fail. Implementations must be safe
 * to call concurrently on different connections; a single connection is
 * never used by two threads at once.
 */
class database_adapter
{
public:
	virtual ~database_adapter() = default;

	/**
	 * @brief Open a new raw connection
	 * @return Connection handle or error
	 */
	virtual kcenon::common::Result<std::shared_ptr<adapter_connection>> open() = 0;

	/**
	 * @brief Check a connection with a cheap no-op statement
	 * @return true if the connection is usable
	 */
	virtual bool is_alive(adapter_connection& connection) = 0;

	/**
	 * @brief Execute one operation and commit it
	 * @param connection Connection obtained from open()
	 * @param kind Operation to run
	 * @param payload Operation input
	 * @return Operation outcome or error
	 */
	virtual kcenon::common::Result<operation_result> execute(adapter_connection& connection,
															 operation_kind kind,
															 const transaction_payload& payload)
		= 0;

	/**
	 * @brief Insert several rows in one transaction
	 *
	 * Either every row is committed or none is.
	 *
	 * @param connection Connection obtained from open()
	 * @param rows One payload per row
	 * @return affected_rows is the number of rows inserted
	 */
	virtual kcenon::common::Result<operation_result> execute_batch(
		adapter_connection& connection, const std::vector<transaction_payload>& rows)
		= 0;

	/**
	 * @brief Close a connection; errors are not reported
	 */
	virtual void close(adapter_connection& connection) = 0;

	/**
	 * @brief Short adapter name used in logs
	 */
	[[nodiscard]] virtual std::string name() const = 0;
};

} // namespace database_load_tester::adapters

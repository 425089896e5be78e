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

#include <kcenon/database_load_tester/adapters/backend_adapter.h>

#include <sstream>
#include <variant>

namespace database_load_tester::adapters
{

namespace
{

std::string quote(const std::string& value)
{
	std::string quoted;
	quoted.reserve(value.size() + 2);
	quoted.push_back('\'');
	for (char c : value)
	{
		if (c == '\'')
		{
			quoted.push_back('\'');
		}
		quoted.push_back(c);
	}
	quoted.push_back('\'');
	return quoted;
}

void shut_down_and_delete(database::core::database_backend* backend)
{
	// Close errors cannot be acted upon; the backend is dropped either way
	auto result = backend->shutdown();
	(void)result;
	delete backend;
}

} // namespace

backend_adapter::backend_adapter(backend_factory factory, backend_adapter_config config)
	: factory_(std::move(factory)), config_(std::move(config))
{
}

kcenon::common::Result<std::shared_ptr<adapter_connection>> backend_adapter::open()
{
	if (!factory_)
	{
		return kcenon::common::error_info{-1, "No backend factory configured", "backend_adapter"};
	}

	auto backend = factory_();
	if (!backend)
	{
		return kcenon::common::error_info{-1, "Backend factory returned null", "backend_adapter"};
	}

	auto init = backend->initialize(config_.connection);
	if (init.is_err())
	{
		return kcenon::common::error_info{init.error().code, init.error().message,
										  "backend_adapter"};
	}

	auto connection = std::make_shared<backend_connection>();
	connection->backend = shared_backend(backend.release(), shut_down_and_delete);
	return std::shared_ptr<adapter_connection>(std::move(connection));
}

bool backend_adapter::is_alive(adapter_connection& connection)
{
	auto backend = backend_of(connection);
	if (!backend || !backend->is_initialized())
	{
		return false;
	}

	return backend->select_query(config_.liveness_query).is_ok();
}

kcenon::common::Result<operation_result> backend_adapter::execute(
	adapter_connection& connection, operation_kind kind, const transaction_payload& payload)
{
	auto backend = backend_of(connection);
	if (!backend)
	{
		return kcenon::common::error_info{-1, "Connection is closed", "backend_adapter"};
	}

	auto statement = build_statement(kind, payload);
	if (kind == operation_kind::select)
	{
		return run_select(*backend, statement);
	}

	return run_write(*backend, kind, statement);
}

kcenon::common::Result<operation_result> backend_adapter::execute_batch(
	adapter_connection& connection, const std::vector<transaction_payload>& rows)
{
	auto backend = backend_of(connection);
	if (!backend)
	{
		return kcenon::common::error_info{-1, "Connection is closed", "backend_adapter"};
	}

	auto begin = backend->begin_transaction();
	if (begin.is_err())
	{
		return begin.error();
	}

	operation_result result;
	for (const auto& row : rows)
	{
		auto inserted = backend->insert_query(build_statement(operation_kind::insert, row));
		if (inserted.is_err())
		{
			auto error = inserted.error();
			auto rollback = backend->rollback_transaction();
			(void)rollback;
			return error;
		}
		result.affected_rows += inserted.value();
	}

	auto commit = backend->commit_transaction();
	if (commit.is_err())
	{
		return commit.error();
	}

	return result;
}

void backend_adapter::close(adapter_connection& connection)
{
	auto& wrapped = static_cast<backend_connection&>(connection);

	shared_backend released;
	{
		std::lock_guard<std::mutex> lock(wrapped.mutex);
		released = std::move(wrapped.backend);
	}
	// An operation still running elsewhere holds its own reference; the
	// backend is shut down when the last reference goes
}

backend_adapter::shared_backend backend_adapter::backend_of(adapter_connection& connection)
{
	auto& wrapped = static_cast<backend_connection&>(connection);
	std::lock_guard<std::mutex> lock(wrapped.mutex);
	return wrapped.backend;
}

std::string backend_adapter::build_statement(operation_kind kind,
											 const transaction_payload& payload) const
{
	std::ostringstream sql;

	switch (kind)
	{
	case operation_kind::insert:
		sql << "INSERT INTO " << config_.table_name << " (id, thread_id, data) VALUES ("
			<< payload.record_id << ", " << quote(payload.thread_id) << ", "
			<< quote(payload.data) << ")";
		break;
	case operation_kind::select:
		sql << "SELECT id, thread_id, data FROM " << config_.table_name
			<< " WHERE id = " << payload.record_id;
		break;
	case operation_kind::update:
		sql << "UPDATE " << config_.table_name << " SET data = " << quote(payload.data)
			<< " WHERE id = " << payload.record_id;
		break;
	case operation_kind::remove:
		sql << "DELETE FROM " << config_.table_name << " WHERE id = " << payload.record_id;
		break;
	}

	return sql.str();
}

kcenon::common::Result<operation_result> backend_adapter::run_write(
	database::core::database_backend& backend, operation_kind kind, const std::string& statement)
{
	auto begin = backend.begin_transaction();
	if (begin.is_err())
	{
		return begin.error();
	}

	kcenon::common::Result<uint64_t> rows = kcenon::common::error_info{-1, "Not executed",
																	   "backend_adapter"};
	switch (kind)
	{
	case operation_kind::insert:
		rows = backend.insert_query(statement);
		break;
	case operation_kind::update:
		rows = backend.update_query(statement);
		break;
	case operation_kind::remove:
		rows = backend.delete_query(statement);
		break;
	case operation_kind::select:
		break;
	}

	if (rows.is_err())
	{
		auto error = rows.error();
		auto rollback = backend.rollback_transaction();
		(void)rollback;
		return error;
	}

	auto commit = backend.commit_transaction();
	if (commit.is_err())
	{
		return commit.error();
	}

	operation_result result;
	result.affected_rows = rows.value();
	return result;
}

kcenon::common::Result<operation_result> backend_adapter::run_select(
	database::core::database_backend& backend, const std::string& statement)
{
	auto rows = backend.select_query(statement);
	if (rows.is_err())
	{
		return rows.error();
	}

	operation_result result;
	const auto& table = rows.value();
	result.affected_rows = table.size();

	if (!table.empty())
	{
		auto column = table.front().find("data");
		if (column != table.front().end())
		{
			if (const auto* text = std::get_if<std::string>(&column->second))
			{
				result.data = *text;
			}
		}
	}

	return result;
}

} // namespace database_load_tester::adapters

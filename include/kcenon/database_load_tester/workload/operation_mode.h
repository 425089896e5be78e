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
 * @file operation_mode.h
 * @brief Transaction shapes a worker can generate
 */

#pragma once

#include <kcenon/database_load_tester/adapters/database_adapter.h>

#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace database_load_tester::workload
{

/**
 * @enum operation_mode
 * @brief Which operations each transaction runs
 */
enum class operation_mode
{
	full,         ///< insert, select back, verify
	insert_only,
	select_only,
	update_only,
	delete_only,
	mixed         ///< weighted insert/update/delete (6:3:1)
};

/**
 * @brief Convert mode to its configuration name
 */
constexpr const char* to_string(operation_mode mode) noexcept
{
	switch (mode)
	{
	case operation_mode::full:
		return "full";
	case operation_mode::insert_only:
		return "insert-only";
	case operation_mode::select_only:
		return "select-only";
	case operation_mode::update_only:
		return "update-only";
	case operation_mode::delete_only:
		return "delete-only";
	case operation_mode::mixed:
		return "mixed";
	}
	return "unknown";
}

/**
 * @brief Parse a configuration name ("full", "insert-only", ...)
 * @return Mode, or std::nullopt for an unknown name
 */
std::optional<operation_mode> parse_operation_mode(std::string_view name);

/**
 * @brief Check whether a mode reads or modifies rows written earlier
 */
constexpr bool needs_existing_rows(operation_mode mode) noexcept
{
	return mode == operation_mode::select_only || mode == operation_mode::update_only
		   || mode == operation_mode::delete_only || mode == operation_mode::mixed;
}

/**
 * @brief Operation run by a single-operation mode
 *
 * For mixed mode the kind is drawn with weights insert 6, update 3,
 * delete 1 from @p engine. Must not be called for full mode.
 */
adapters::operation_kind pick_operation(operation_mode mode, std::mt19937_64& engine);

} // namespace database_load_tester::workload

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

#include <kcenon/database_load_tester/workload/operation_mode.h>

#include <array>

namespace database_load_tester::workload
{

std::optional<operation_mode> parse_operation_mode(std::string_view name)
{
	constexpr std::array<operation_mode, 6> modes = {
		operation_mode::full,        operation_mode::insert_only, operation_mode::select_only,
		operation_mode::update_only, operation_mode::delete_only, operation_mode::mixed};

	for (auto mode : modes)
	{
		if (name == to_string(mode))
		{
			return mode;
		}
	}
	return std::nullopt;
}

adapters::operation_kind pick_operation(operation_mode mode, std::mt19937_64& engine)
{
	switch (mode)
	{
	case operation_mode::insert_only:
		return adapters::operation_kind::insert;
	case operation_mode::select_only:
		return adapters::operation_kind::select;
	case operation_mode::update_only:
		return adapters::operation_kind::update;
	case operation_mode::delete_only:
		return adapters::operation_kind::remove;
	case operation_mode::mixed:
	{
		std::discrete_distribution<int> weights{6, 3, 1};
		switch (weights(engine))
		{
		case 0:
			return adapters::operation_kind::insert;
		case 1:
			return adapters::operation_kind::update;
		default:
			return adapters::operation_kind::remove;
		}
	}
	case operation_mode::full:
		break;
	}
	return adapters::operation_kind::insert;
}

} // namespace database_load_tester::workload

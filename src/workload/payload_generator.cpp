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

#include <kcenon/database_load_tester/workload/payload_generator.h>

#include <algorithm>

namespace database_load_tester::workload
{

namespace
{

constexpr char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

} // namespace

payload_generator::payload_generator(payload_config config)
	: config_(config), next_id_(std::max<int64_t>(config.existing_rows, 0) + 1)
{
}

adapters::transaction_payload payload_generator::next_insert(const std::string& worker_name)
{
	adapters::transaction_payload payload;
	payload.record_id = next_id_.fetch_add(1);
	payload.thread_id = worker_name;
	payload.data = random_data();
	return payload;
}

adapters::transaction_payload payload_generator::next_existing(const std::string& worker_name)
{
	adapters::transaction_payload payload;
	auto upper = std::max<int64_t>(max_known_id(), 1);
	std::uniform_int_distribution<int64_t> ids(1, upper);
	payload.record_id = ids(thread_engine());
	payload.thread_id = worker_name;
	payload.data = random_data();
	return payload;
}

adapters::transaction_payload payload_generator::next(adapters::operation_kind kind,
													  const std::string& worker_name)
{
	if (kind == adapters::operation_kind::insert)
	{
		return next_insert(worker_name);
	}
	return next_existing(worker_name);
}

std::mt19937_64& payload_generator::thread_engine()
{
	thread_local std::mt19937_64 engine{std::random_device{}()};
	return engine;
}

std::string payload_generator::random_data() const
{
	std::uniform_int_distribution<size_t> pick(0, sizeof(alphabet) - 2);
	auto& engine = thread_engine();

	std::string data(config_.data_length, ' ');
	for (auto& c : data)
	{
		c = alphabet[pick(engine)];
	}
	return data;
}

} // namespace database_load_tester::workload

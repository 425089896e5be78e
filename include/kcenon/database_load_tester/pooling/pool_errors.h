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
 * @file pool_errors.h
 * @brief Typed error codes reported by the connection pool
 */

#pragma once

#include <string>

#include <kcenon/common/patterns/result.h>

namespace database_load_tester::pooling
{

/**
 * @enum pool_error
 * @brief Error kinds carried in error_info::code
 *
 * connection_creation_failed and pool_exhausted are recoverable: callers
 * back off and try again. The remaining kinds report misuse or shutdown.
 */
enum class pool_error : int
{
	connection_creation_failed = -601, ///< open() failed after all retries
	pool_exhausted = -602,             ///< No connection became available in time
	invalid_release = -603,            ///< Released connection is not checked out
	pool_shut_down = -604,             ///< Pool no longer hands out connections
	acquire_cancelled = -605           ///< Shutdown signal fired while waiting
};

constexpr const char* to_string(pool_error error) noexcept
{
	switch (error)
	{
	case pool_error::connection_creation_failed:
		return "connection_creation_failed";
	case pool_error::pool_exhausted:
		return "pool_exhausted";
	case pool_error::invalid_release:
		return "invalid_release";
	case pool_error::pool_shut_down:
		return "pool_shut_down";
	case pool_error::acquire_cancelled:
		return "acquire_cancelled";
	}
	return "unknown";
}

inline kcenon::common::error_info make_pool_error(pool_error error, const std::string& message)
{
	return kcenon::common::error_info{static_cast<int>(error), message, "connection_pool"};
}

inline bool is_pool_error(const kcenon::common::error_info& info, pool_error error) noexcept
{
	return info.code == static_cast<int>(error);
}

/**
 * @brief Check whether a caller should back off and retry
 */
inline bool is_recoverable(const kcenon::common::error_info& info) noexcept
{
	return is_pool_error(info, pool_error::connection_creation_failed)
		   || is_pool_error(info, pool_error::pool_exhausted);
}

} // namespace database_load_tester::pooling

// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_API_ERROR_HXX
#define MILO_API_ERROR_HXX

#include <exception>
#include <stdexcept>
#include <string>

/**
 * The one error type reported by the request client.
 */
class ApiError : public std::runtime_error {
public:
	enum class Kind {
		/**
		 * The URL could not be built (bad host or
		 * identifier).
		 */
		INVALID_TARGET,

		/**
		 * Connection failure, timeout or non-2xx status.
		 */
		TRANSPORT,

		/**
		 * The response body could not be parsed.
		 */
		MALFORMED_RESPONSE,
	};

private:
	Kind kind;

public:
	ApiError(Kind _kind, const char *_msg) noexcept
		:std::runtime_error(_msg), kind(_kind) {}

	ApiError(Kind _kind, const std::string &_msg) noexcept
		:std::runtime_error(_msg), kind(_kind) {}

	Kind GetKind() const noexcept {
		return kind;
	}
};

[[gnu::const]]
const char *
ToString(ApiError::Kind kind) noexcept;

/**
 * Convert an exception thrown by the HTTP or JSON layer to an
 * #ApiError with the original exception nested inside.  An
 * #ApiError is returned as-is.
 */
std::exception_ptr
ToApiError(std::exception_ptr ep) noexcept;

/**
 * Determine the #ApiError::Kind of the given exception (which should
 * have been returned by ToApiError()).  Returns TRANSPORT if there
 * is no #ApiError in the chain.
 */
[[gnu::pure]]
ApiError::Kind
GetApiErrorKind(std::exception_ptr ep) noexcept;

#endif

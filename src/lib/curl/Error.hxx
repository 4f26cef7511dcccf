// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <curl/curl.h>

#include <stdexcept>

/**
 * A libcurl error, either from the easy or the multi interface.
 */
class CurlError : public std::runtime_error {
	CURLcode code;

public:
	CurlError(CURLcode _code, const char *msg) noexcept
		:std::runtime_error(msg), code(_code) {}

	explicit CurlError(CURLcode _code) noexcept
		:CurlError(_code, curl_easy_strerror(_code)) {}

	CURLcode GetCode() const noexcept {
		return code;
	}

	bool IsTimeout() const noexcept {
		return code == CURLE_OPERATION_TIMEDOUT;
	}
};

/**
 * The server responded with an unexpected HTTP status.
 */
class HttpStatusError : public std::runtime_error {
	unsigned status;

public:
	template<typename M>
	HttpStatusError(unsigned _status, M &&_msg) noexcept
		:std::runtime_error(std::forward<M>(_msg)), status(_status) {}

	unsigned GetStatus() const noexcept {
		return status;
	}
};

// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "Handler.hxx"

#include <string>
#include <utility>

struct StringCurlResponse {
	unsigned status;
	Curl::Headers headers;
	std::string body;
};

/**
 * A #CurlResponseHandler implementation which stores the whole
 * response body in a std::string.  The subclass implements OnEnd()
 * and OnError().
 */
class StringCurlResponseHandler : public CurlResponseHandler {
	StringCurlResponse response;

public:
	StringCurlResponse &GetResponse() & noexcept {
		return response;
	}

	StringCurlResponse &&GetResponse() && noexcept {
		return std::move(response);
	}

	/* virtual methods from CurlResponseHandler */
	void OnHeaders(unsigned status, Curl::Headers &&headers) override;
	void OnData(std::span<const std::byte> data) override;
};

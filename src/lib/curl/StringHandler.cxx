// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "StringHandler.hxx"

void
StringCurlResponseHandler::OnHeaders(unsigned status,
				     Curl::Headers &&headers)
{
	response.status = status;
	response.headers = std::move(headers);
}

void
StringCurlResponseHandler::OnData(std::span<const std::byte> data)
{
	response.body.append((const char *)data.data(), data.size());
}

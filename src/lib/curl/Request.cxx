// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Request.hxx"
#include "Global.hxx"
#include "Handler.hxx"
#include "util/ASCII.hxx"
#include "util/StringStrip.hxx"
#include "Version.h"

#include <cassert>

CurlRequest::CurlRequest(CurlGlobal &_global,
			 CurlResponseHandler &_handler)
	:global(_global), handler(_handler)
{
	error_buffer[0] = 0;

	easy.SetPrivate((void *)this);
	easy.SetUserAgent(MILO_PACKAGE "/" MILO_VERSION);
	easy.SetHeaderFunction(_HeaderFunction, this);
	easy.SetWriteFunction(WriteFunction, this);
	easy.SetNoSignal();
	easy.SetErrorBuffer(error_buffer);
}

CurlRequest::~CurlRequest() noexcept
{
	Stop();
}

void
CurlRequest::Start()
{
	assert(!registered);

	global.Add(*this);
	registered = true;
}

void
CurlRequest::Stop() noexcept
{
	if (!registered)
		return;

	global.Remove(*this);
	registered = false;
}

void
CurlRequest::FinishHeaders()
{
	if (state != State::HEADERS)
		return;

	state = State::BODY;

	handler.OnHeaders(easy.GetResponseCode(), std::move(headers));
}

void
CurlRequest::FinishBody()
{
	FinishHeaders();

	if (state != State::BODY)
		return;

	state = State::CLOSED;
	handler.OnEnd();
}

void
CurlRequest::Done(CURLcode result) noexcept
{
	if (!keep_registered || result != CURLE_OK || postponed_error)
		Stop();

	try {
		if (postponed_error) {
			state = State::CLOSED;
			std::rethrow_exception(postponed_error);
		}

		if (result != CURLE_OK) {
			state = State::CLOSED;

			const char *msg = error_buffer;
			if (*msg == 0)
				msg = curl_easy_strerror(result);

			throw CurlError(result, msg);
		}

		FinishBody();
	} catch (...) {
		state = State::CLOSED;
		handler.OnError(std::current_exception());
	}
}

[[gnu::pure]]
static bool
IsResponseBoundaryHeader(std::string_view s) noexcept
{
	return s.size() > 5 && s.starts_with("HTTP/");
}

inline void
CurlRequest::HeaderFunction(std::string_view s) noexcept
{
	if (state > State::HEADERS)
		return;

	if (IsResponseBoundaryHeader(s)) {
		/* this is the boundary to a new response, for
		   example after a redirect */
		headers.clear();
		return;
	}

	const auto colon = s.find(':');
	if (colon == s.npos)
		return;

	const auto name = Strip(s.substr(0, colon));
	const auto value = Strip(s.substr(colon + 1));

	headers.emplace(ToLowerASCII(name), std::string{value});
}

size_t
CurlRequest::_HeaderFunction(char *ptr, size_t size, size_t nmemb,
			     void *stream) noexcept
{
	CurlRequest &c = *(CurlRequest *)stream;

	size *= nmemb;

	c.HeaderFunction({ptr, size});
	return size;
}

inline size_t
CurlRequest::DataReceived(const void *ptr, size_t received_size) noexcept
{
	assert(received_size > 0);

	try {
		FinishHeaders();
		handler.OnData({(const std::byte *)ptr, received_size});
		return received_size;
	} catch (...) {
		state = State::CLOSED;
		postponed_error = std::current_exception();
		/* returning 0 aborts the transfer */
		return 0;
	}
}

size_t
CurlRequest::WriteFunction(char *ptr, size_t size, size_t nmemb,
			   void *stream) noexcept
{
	CurlRequest &c = *(CurlRequest *)stream;

	size *= nmemb;
	if (size == 0)
		return 0;

	return c.DataReceived(ptr, size);
}

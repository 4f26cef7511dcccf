// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "Error.hxx"

#include <curl/curl.h>

#include <chrono>
#include <cstddef>
#include <span>
#include <string_view>
#include <utility>

/**
 * An OO wrapper for a "CURL*" (a libCURL "easy" handle).
 */
class CurlEasy {
	CURL *handle = nullptr;

public:
	/**
	 * Allocate a new CURL*.
	 *
	 * Throws on error.
	 */
	CurlEasy()
		:handle(curl_easy_init())
	{
		if (handle == nullptr)
			throw std::runtime_error("curl_easy_init() failed");
	}

	CurlEasy(CurlEasy &&src) noexcept
		:handle(std::exchange(src.handle, nullptr)) {}

	~CurlEasy() noexcept {
		if (handle != nullptr)
			curl_easy_cleanup(handle);
	}

	CurlEasy &operator=(CurlEasy &&src) noexcept {
		std::swap(handle, src.handle);
		return *this;
	}

	CURL *Get() noexcept {
		return handle;
	}

	template<typename T>
	void SetOption(CURLoption option, T value) {
		CURLcode code = curl_easy_setopt(handle, option, value);
		if (code != CURLE_OK)
			throw CurlError(code);
	}

	void SetPrivate(void *pointer) {
		SetOption(CURLOPT_PRIVATE, pointer);
	}

	void SetErrorBuffer(char *buf) {
		SetOption(CURLOPT_ERRORBUFFER, buf);
	}

	void SetURL(const char *value) {
		SetOption(CURLOPT_URL, value);
	}

	void SetUserAgent(const char *value) {
		SetOption(CURLOPT_USERAGENT, value);
	}

	void SetRequestHeaders(struct curl_slist *headers) {
		SetOption(CURLOPT_HTTPHEADER, headers);
	}

	void SetHeaderFunction(size_t (*function)(char *buffer, size_t size,
						  size_t nitems,
						  void *userdata) noexcept,
			       void *userdata) {
		SetOption(CURLOPT_HEADERFUNCTION, function);
		SetOption(CURLOPT_HEADERDATA, userdata);
	}

	void SetWriteFunction(size_t (*function)(char *ptr, size_t size,
						 size_t nmemb,
						 void *userdata) noexcept,
			      void *userdata) {
		SetOption(CURLOPT_WRITEFUNCTION, function);
		SetOption(CURLOPT_WRITEDATA, userdata);
	}

	void SetNoSignal(bool value=true) {
		SetOption(CURLOPT_NOSIGNAL, (long)value);
	}

	/**
	 * @param value 1 to stop after connecting, 2 to stop after
	 * the WebSocket upgrade of a "ws://" URL
	 */
	void SetConnectOnly(long value=1) {
		SetOption(CURLOPT_CONNECT_ONLY, value);
	}

	void SetIPv4Only() {
		SetOption(CURLOPT_IPRESOLVE, (long)CURL_IPRESOLVE_V4);
	}

	void SetConnectTimeout(std::chrono::milliseconds timeout) {
		SetOption(CURLOPT_CONNECTTIMEOUT_MS, (long)timeout.count());
	}

	void SetTimeout(std::chrono::milliseconds timeout) {
		SetOption(CURLOPT_TIMEOUT_MS, (long)timeout.count());
	}

	void SetPost(bool value=true) {
		SetOption(CURLOPT_POST, (long)value);
	}

	/**
	 * Set the request body; libcurl copies it.
	 */
	void SetRequestBody(std::string_view s) {
		SetOption(CURLOPT_POSTFIELDSIZE, (long)s.size());
		SetOption(CURLOPT_COPYPOSTFIELDS, s.data());
	}

	unsigned GetResponseCode() noexcept {
		long code = 0;
		if (curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &code) != CURLE_OK)
			return 0;
		return code;
	}

	/**
	 * Returns the socket of a CURLOPT_CONNECT_ONLY connection or
	 * CURL_SOCKET_BAD.
	 */
	curl_socket_t GetActiveSocket() noexcept {
		curl_socket_t s = CURL_SOCKET_BAD;
		if (curl_easy_getinfo(handle, CURLINFO_ACTIVESOCKET, &s) != CURLE_OK)
			return CURL_SOCKET_BAD;
		return s;
	}

	/**
	 * Receive (a part of) a WebSocket frame.
	 *
	 * Throws #CurlError on error.
	 *
	 * @return the frame's metadata or nullptr if no data is
	 * available right now
	 */
	const struct curl_ws_frame *WebSocketReceive(std::span<std::byte> buffer,
						     std::size_t &nbytes) {
		const struct curl_ws_frame *meta = nullptr;
		nbytes = 0;
		const CURLcode code = curl_ws_recv(handle, buffer.data(),
						   buffer.size(), &nbytes, &meta);
		if (code == CURLE_AGAIN)
			return nullptr;
		if (code != CURLE_OK)
			throw CurlError(code);
		return meta;
	}

	/**
	 * Send one complete WebSocket frame.
	 *
	 * Throws #CurlError on error.
	 *
	 * @param flags one of the CURLWS_* frame types
	 */
	void WebSocketSend(std::span<const std::byte> payload, unsigned flags) {
		std::size_t sent;
		const CURLcode code = curl_ws_send(handle, payload.data(),
						   payload.size(), &sent, 0,
						   flags);
		if (code != CURLE_OK)
			throw CurlError(code);
	}
};

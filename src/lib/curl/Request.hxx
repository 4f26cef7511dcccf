// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "Easy.hxx"
#include "Headers.hxx"

#include <cstddef>
#include <exception>

class CurlGlobal;
class CurlResponseHandler;

/**
 * A non-blocking HTTP request integrated via #CurlGlobal into the
 * #EventLoop.
 *
 * To start sending the request, call Start().
 */
class CurlRequest final {
	CurlGlobal &global;

	CurlResponseHandler &handler;

	/** the curl handle */
	CurlEasy easy;

	enum class State {
		HEADERS,
		BODY,
		CLOSED,
	} state = State::HEADERS;

	Curl::Headers headers;

	/**
	 * An exception caught from within the WriteFunction() which
	 * will later be handled by Done().
	 */
	std::exception_ptr postponed_error;

	/** error message provided by libcurl */
	char error_buffer[CURL_ERROR_SIZE];

	bool registered = false;

	/**
	 * Stay registered after a successful transfer; see
	 * KeepRegistered().
	 */
	bool keep_registered = false;

public:
	/**
	 * To start sending the request, call Start().
	 *
	 * Throws on error.
	 */
	CurlRequest(CurlGlobal &_global, CurlResponseHandler &_handler);

	CurlRequest(CurlGlobal &_global, const char *url,
		    CurlResponseHandler &_handler)
		:CurlRequest(_global, _handler) {
		SetUrl(url);
	}

	~CurlRequest() noexcept;

	CurlRequest(const CurlRequest &) = delete;
	CurlRequest &operator=(const CurlRequest &) = delete;

	/**
	 * Register this request via CurlGlobal::Add(), which starts
	 * the request.
	 *
	 * This method must be called in the event loop thread.
	 *
	 * Throws on error.
	 */
	void Start();

	/**
	 * Unregister this request via CurlGlobal::Remove().  No
	 * handler method will be invoked after this.
	 */
	void Stop() noexcept;

	CURL *Get() noexcept {
		return easy.Get();
	}

	CurlEasy &GetEasy() noexcept {
		return easy;
	}

	void SetUrl(const char *url) {
		easy.SetURL(url);
	}

	void SetRequestHeaders(struct curl_slist *request_headers) {
		easy.SetRequestHeaders(request_headers);
	}

	/**
	 * Do not unregister the easy handle after the transfer has
	 * finished successfully.  This is needed for
	 * CURLOPT_CONNECT_ONLY: libcurl closes such a connection when
	 * the handle is removed from its multi handle, and the
	 * connection can only be found while it is still there.
	 */
	void KeepRegistered() noexcept {
		keep_registered = true;
	}

	/**
	 * CurlGlobal calls this method when the transfer
	 * has finished.  It invokes the #CurlResponseHandler; after
	 * that, this object may have been deleted.
	 */
	void Done(CURLcode result) noexcept;

private:
	void FinishHeaders();
	void FinishBody();

	size_t DataReceived(const void *ptr, size_t size) noexcept;

	void HeaderFunction(std::string_view s) noexcept;

	/** called by curl when new data is available */
	static size_t _HeaderFunction(char *ptr, size_t size, size_t nmemb,
				      void *stream) noexcept;

	/** called by curl when new data is available */
	static size_t WriteFunction(char *ptr, size_t size, size_t nmemb,
				    void *stream) noexcept;
};

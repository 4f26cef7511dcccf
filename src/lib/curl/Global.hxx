// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_LIB_CURL_GLOBAL_HXX
#define MILO_LIB_CURL_GLOBAL_HXX

#include "event/FineTimerEvent.hxx"
#include "event/DeferEvent.hxx"

#include <curl/curl.h>

class CurlRequest;

/**
 * Owns the CURLM handle and drives it from the #EventLoop: libcurl
 * tells us which sockets to watch and when to time out, and we call
 * curl_multi_socket_action() when something happens.
 */
class CurlGlobal final {
	class Watch;

	CURLM *const multi;

	/**
	 * Collects finished transfers after curl_multi_socket_action()
	 * has returned, so request handlers never run inside libcurl.
	 */
	DeferEvent collect_event;

	FineTimerEvent timeout_event;

public:
	/**
	 * Throws on error.
	 */
	explicit CurlGlobal(EventLoop &loop);
	~CurlGlobal() noexcept;

	CurlGlobal(const CurlGlobal &) = delete;
	CurlGlobal &operator=(const CurlGlobal &) = delete;

	EventLoop &GetEventLoop() const noexcept {
		return timeout_event.GetEventLoop();
	}

	/**
	 * Start a transfer.  Throws on error.
	 */
	void Add(CurlRequest &request);

	void Remove(CurlRequest &request) noexcept;

private:
	void Drive(curl_socket_t s, int ev_bitmask) noexcept;

	void CollectFinished() noexcept;

	void OnTimeout() noexcept {
		Drive(CURL_SOCKET_TIMEOUT, 0);
	}

	void UpdateSocket(curl_socket_t s, int what, Watch *watch) noexcept;
	void UpdateTimer(long timeout_ms) noexcept;

	static int OnSocketCallback(CURL *easy, curl_socket_t s, int what,
				    void *userp, void *socketp) noexcept;
	static int OnTimerCallback(CURLM *multi, long timeout_ms,
				   void *userp) noexcept;
};

#endif

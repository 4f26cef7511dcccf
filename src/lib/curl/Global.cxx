// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Global.hxx"
#include "Request.hxx"
#include "event/Loop.hxx"
#include "event/SocketEvent.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <algorithm>
#include <stdexcept>

static constexpr Domain curl_domain("curl");

/**
 * A socket which libcurl has asked us to watch.  It is attached to
 * the socket with curl_multi_assign() and lives until libcurl sends
 * CURL_POLL_REMOVE.
 */
class CurlGlobal::Watch final {
	CurlGlobal &global;
	SocketEvent event;

public:
	Watch(CurlGlobal &_global, curl_socket_t s) noexcept
		:global(_global),
		 event(global.GetEventLoop(), BIND_THIS_METHOD(OnReady),
		       SocketDescriptor{s}) {}

	/* libcurl owns the socket and closes it itself */
	~Watch() noexcept {
		event.ReleaseSocket();
	}

	Watch(const Watch &) = delete;
	Watch &operator=(const Watch &) = delete;

	void Update(int what) noexcept {
		unsigned flags = 0;
		if (what == CURL_POLL_IN || what == CURL_POLL_INOUT)
			flags |= SocketEvent::READ;
		if (what == CURL_POLL_OUT || what == CURL_POLL_INOUT)
			flags |= SocketEvent::WRITE;

		event.Schedule(flags);
	}

private:
	void OnReady(unsigned flags) noexcept {
		int ev_bitmask = 0;
		if (flags & SocketEvent::READ)
			ev_bitmask |= CURL_CSELECT_IN;
		if (flags & SocketEvent::WRITE)
			ev_bitmask |= CURL_CSELECT_OUT;
		if (flags & SocketEvent::DEAD_MASK)
			ev_bitmask |= CURL_CSELECT_ERR;

		global.Drive(event.GetSocket().Get(), ev_bitmask);
	}
};

CurlGlobal::CurlGlobal(EventLoop &loop)
	:multi(curl_multi_init()),
	 collect_event(loop, BIND_THIS_METHOD(CollectFinished)),
	 timeout_event(loop, BIND_THIS_METHOD(OnTimeout))
{
	if (multi == nullptr)
		throw std::runtime_error("curl_multi_init() failed");

	curl_multi_setopt(multi, CURLMOPT_SOCKETFUNCTION, OnSocketCallback);
	curl_multi_setopt(multi, CURLMOPT_SOCKETDATA, this);
	curl_multi_setopt(multi, CURLMOPT_TIMERFUNCTION, OnTimerCallback);
	curl_multi_setopt(multi, CURLMOPT_TIMERDATA, this);
}

CurlGlobal::~CurlGlobal() noexcept
{
	curl_multi_cleanup(multi);
}

void
CurlGlobal::Add(CurlRequest &request)
{
	const CURLMcode code = curl_multi_add_handle(multi, request.Get());
	if (code != CURLM_OK)
		throw std::runtime_error(curl_multi_strerror(code));

	/* kick libcurl so it opens the connection */
	Drive(CURL_SOCKET_TIMEOUT, 0);
}

void
CurlGlobal::Remove(CurlRequest &request) noexcept
{
	curl_multi_remove_handle(multi, request.Get());
}

void
CurlGlobal::Drive(curl_socket_t s, int ev_bitmask) noexcept
{
	int running;
	const CURLMcode code = curl_multi_socket_action(multi, s, ev_bitmask,
							&running);
	if (code != CURLM_OK)
		FmtError(curl_domain, "curl_multi_socket_action() failed: {}",
			 curl_multi_strerror(code));

	collect_event.Schedule();
}

void
CurlGlobal::CollectFinished() noexcept
{
	int remaining;
	while (const CURLMsg *msg = curl_multi_info_read(multi, &remaining)) {
		if (msg->msg != CURLMSG_DONE)
			continue;

		void *p = nullptr;
		if (curl_easy_getinfo(msg->easy_handle, CURLINFO_PRIVATE,
				      &p) != CURLE_OK || p == nullptr)
			continue;

		/* the handler may destroy the request */
		static_cast<CurlRequest *>(p)->Done(msg->data.result);
	}
}

inline void
CurlGlobal::UpdateSocket(curl_socket_t s, int what, Watch *watch) noexcept
{
	if (what == CURL_POLL_REMOVE) {
		delete watch;
		return;
	}

	if (watch == nullptr) {
		watch = new Watch(*this, s);
		curl_multi_assign(multi, s, watch);
	}

	watch->Update(what);
}

inline void
CurlGlobal::UpdateTimer(long timeout_ms) noexcept
{
	if (timeout_ms < 0) {
		timeout_event.Cancel();
		return;
	}

	/* a zero timeout would make the loop spin while the threaded
	   resolver works */
	timeout_event.Schedule(std::chrono::milliseconds(std::max(timeout_ms, 1L)));
}

int
CurlGlobal::OnSocketCallback(CURL *, curl_socket_t s, int what,
			     void *userp, void *socketp) noexcept
{
	static_cast<CurlGlobal *>(userp)->UpdateSocket(s, what,
						       static_cast<Watch *>(socketp));
	return 0;
}

int
CurlGlobal::OnTimerCallback(CURLM *, long timeout_ms, void *userp) noexcept
{
	static_cast<CurlGlobal *>(userp)->UpdateTimer(timeout_ms);
	return 0;
}

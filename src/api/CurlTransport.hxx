// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_API_CURL_TRANSPORT_HXX
#define MILO_API_CURL_TRANSPORT_HXX

#include "Transport.hxx"
#include "event/Chrono.hxx"
#include "event/DeferEvent.hxx"
#include "lib/curl/Init.hxx"

#include <boost/intrusive/list.hpp>

#include <memory>

class CurlGlobal;

/**
 * An #ApiTransport implementation based on libcurl.
 */
class CurlTransport final : public ApiTransport {
	class Request;

	EventLoop &loop;

	const ScopeCurlInit curl_init;

	std::unique_ptr<CurlGlobal> global;

	using RequestList =
		boost::intrusive::list<Request,
				       boost::intrusive::base_hook<boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>>>,
				       boost::intrusive::constant_time_size<false>>;

	RequestList requests;

	/**
	 * Reset() is deferred to the next loop iteration, because it
	 * may be called from within a libcurl callback, where
	 * destroying the #CurlGlobal is not allowed.
	 */
	DeferEvent defer_reset;

public:
	static constexpr Event::Duration CONNECT_TIMEOUT = std::chrono::seconds(3);
	static constexpr Event::Duration TOTAL_TIMEOUT = std::chrono::seconds(5);

	/**
	 * Throws on error.
	 */
	explicit CurlTransport(EventLoop &_loop);
	~CurlTransport() noexcept override;

	/* virtual methods from ApiTransport */
	EventLoop &GetEventLoop() const noexcept override {
		return loop;
	}

	std::unique_ptr<ApiRequest> Send(const ApiCall &call,
					 ApiResponseHandler &handler) override;
	void Reset() noexcept override;

private:
	void AbortAll() noexcept;

	void OnDeferredReset() noexcept;
};

#endif

// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_TEST_FAKE_TRANSPORT_HXX
#define MILO_TEST_FAKE_TRANSPORT_HXX

#include "api/Transport.hxx"
#include "api/Error.hxx"

#include <list>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * An #ApiTransport which records requests; the test completes them
 * explicitly with Respond() or Fail().
 */
class FakeTransport final : public ApiTransport {
	EventLoop &loop;

	class Request final : public ApiRequest {
		FakeTransport &transport;

	public:
		const ApiCall call;
		ApiResponseHandler &handler;

		bool completed = false;

		Request(FakeTransport &_transport, const ApiCall &_call,
			ApiResponseHandler &_handler) noexcept
			:transport(_transport), call(_call), handler(_handler) {}

		~Request() noexcept override {
			if (!completed) {
				transport.pending.remove(this);
				++transport.n_canceled;
			}
		}
	};

	std::list<Request *> pending;

public:
	/**
	 * All calls passed to Send(), in order.
	 */
	std::vector<ApiCall> sent;

	/**
	 * Number of requests destroyed before completion.
	 */
	unsigned n_canceled = 0;

	unsigned n_resets = 0;

	/**
	 * If set, Send() throws.
	 */
	bool fail_send = false;

	explicit FakeTransport(EventLoop &_loop) noexcept
		:loop(_loop) {}

	std::size_t GetPendingCount() const noexcept {
		return pending.size();
	}

	bool HasPending() const noexcept {
		return !pending.empty();
	}

	const ApiCall &GetPendingCall() const noexcept {
		return pending.front()->call;
	}

	/**
	 * Complete the oldest pending request successfully.
	 */
	void Respond(std::string body, unsigned status=200) noexcept {
		auto &handler = Pop();
		handler.OnApiResponse({status, std::move(body)});
	}

	/**
	 * Fail the oldest pending request.
	 */
	void Fail(ApiError::Kind kind=ApiError::Kind::TRANSPORT,
		  const char *msg="Connection refused") noexcept {
		auto &handler = Pop();
		handler.OnApiError(std::make_exception_ptr(ApiError(kind, msg)));
	}

	/* virtual methods from ApiTransport */
	EventLoop &GetEventLoop() const noexcept override {
		return loop;
	}

	std::unique_ptr<ApiRequest> Send(const ApiCall &call,
					 ApiResponseHandler &handler) override {
		if (fail_send)
			throw std::runtime_error("Send failed");

		sent.push_back(call);
		auto request = std::make_unique<Request>(*this, call, handler);
		pending.push_back(request.get());
		return request;
	}

	void Reset() noexcept override {
		++n_resets;
		while (!pending.empty())
			Fail(ApiError::Kind::TRANSPORT, "Request aborted");
	}

private:
	/**
	 * Remove the oldest request from the list (but don't destroy
	 * it; that's the owner's job) and return its handler.
	 */
	ApiResponseHandler &Pop() noexcept {
		auto *request = pending.front();
		pending.pop_front();
		request->completed = true;
		return request->handler;
	}
};

#endif

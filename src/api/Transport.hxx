// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_API_TRANSPORT_HXX
#define MILO_API_TRANSPORT_HXX

#include <exception>
#include <memory>
#include <string>

class EventLoop;

enum class HttpMethod {
	GET,
	POST,
};

/**
 * A request to be sent by an #ApiTransport.
 */
struct ApiCall {
	HttpMethod method;

	std::string url;

	/**
	 * The JSON request body; empty if there is none.
	 */
	std::string body;
};

struct ApiResponse {
	unsigned status;
	std::string body;
};

class ApiResponseHandler {
public:
	/**
	 * A 2xx response was received.
	 */
	virtual void OnApiResponse(ApiResponse &&response) noexcept = 0;

	/**
	 * The request has failed.  The exception contains an
	 * #ApiError.
	 */
	virtual void OnApiError(std::exception_ptr error) noexcept = 0;
};

/**
 * A request in flight.  Destroying this object cancels the request;
 * after that, no handler method will be invoked.
 */
class ApiRequest {
public:
	virtual ~ApiRequest() noexcept = default;
};

/**
 * The HTTP layer below #DeviceClient.  Handler methods are never
 * invoked from within Send().
 */
class ApiTransport {
public:
	virtual ~ApiTransport() noexcept = default;

	virtual EventLoop &GetEventLoop() const noexcept = 0;

	/**
	 * Throws on error.
	 */
	virtual std::unique_ptr<ApiRequest> Send(const ApiCall &call,
						 ApiResponseHandler &handler) = 0;

	/**
	 * Abort all requests in flight (their handlers receive a
	 * TRANSPORT error) and discard all pooled connections.
	 */
	virtual void Reset() noexcept = 0;
};

#endif

// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "CurlTransport.hxx"
#include "Error.hxx"
#include "lib/curl/Global.hxx"
#include "lib/curl/Request.hxx"
#include "lib/curl/Slist.hxx"
#include "lib/curl/StringHandler.hxx"
#include "lib/curl/Error.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <fmt/format.h>

#include <chrono>

static constexpr Domain api_domain("api");

class CurlTransport::Request final
	: public ApiRequest, StringCurlResponseHandler,
	  public boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>>
{
	ApiResponseHandler &handler;

	CurlSlist request_headers;

	CurlRequest request;

public:
	Request(CurlGlobal &global, const ApiCall &call,
		ApiResponseHandler &_handler)
		:handler(_handler),
		 request(global, call.url.c_str(), *this)
	{
		using std::chrono::duration_cast;
		using std::chrono::milliseconds;

		auto &easy = request.GetEasy();
		easy.SetConnectTimeout(duration_cast<milliseconds>(CONNECT_TIMEOUT));
		easy.SetTimeout(duration_cast<milliseconds>(TOTAL_TIMEOUT));

		request_headers.Append("Accept: application/json");

		if (call.method == HttpMethod::POST) {
			easy.SetPost();
			request_headers.Append("Content-Type: application/json");
			easy.SetRequestBody(call.body);
		}

		request.SetRequestHeaders(request_headers.Get());

		FmtDebug(api_domain, "{} {}",
			 call.method == HttpMethod::POST ? "POST" : "GET",
			 call.url);

		request.Start();
	}

	/**
	 * Cancel the transfer and report a TRANSPORT error to the
	 * handler.  The handler may destroy this object.
	 */
	void Abort() noexcept {
		request.Stop();
		handler.OnApiError(std::make_exception_ptr(ApiError(ApiError::Kind::TRANSPORT,
								    "Request aborted")));
	}

private:
	/* virtual methods from CurlResponseHandler */
	void OnEnd() override {
		auto &response = GetResponse();
		if (response.status < 200 || response.status >= 300)
			throw HttpStatusError(response.status,
					      fmt::format("Unexpected HTTP status {}",
							  response.status));

		unlink();
		handler.OnApiResponse({response.status, std::move(response.body)});
	}

	void OnError(std::exception_ptr e) noexcept override {
		unlink();
		handler.OnApiError(ToApiError(std::move(e)));
	}
};

CurlTransport::CurlTransport(EventLoop &_loop)
	:loop(_loop),
	 global(std::make_unique<CurlGlobal>(loop)),
	 defer_reset(loop, BIND_THIS_METHOD(OnDeferredReset))
{
}

CurlTransport::~CurlTransport() noexcept
{
	/* the owners of the remaining requests must not outlive
	   us; just detach them */
	requests.clear();
}

std::unique_ptr<ApiRequest>
CurlTransport::Send(const ApiCall &call, ApiResponseHandler &handler)
{
	auto request = std::make_unique<Request>(*global, call, handler);
	requests.push_back(*request);
	return request;
}

void
CurlTransport::Reset() noexcept
{
	defer_reset.Schedule();
}

void
CurlTransport::AbortAll() noexcept
{
	while (!requests.empty()) {
		auto &r = requests.front();
		requests.pop_front();
		r.Abort();
	}
}

void
CurlTransport::OnDeferredReset() noexcept
{
	LogInfo(api_domain, "Resetting the HTTP connection pool");

	AbortAll();

	try {
		global = std::make_unique<CurlGlobal>(loop);
	} catch (...) {
		LogError(api_domain, std::current_exception(),
			 "Failed to recreate the HTTP client");
	}
}

// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "WebSocketChannel.hxx"
#include "lib/curl/Global.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <fmt/core.h>

#include <array>
#include <span>
#include <stdexcept>
#include <utility>

static constexpr Domain websocket_domain("websocket");

/**
 * The close code reported when the close frame carries none.
 */
static constexpr unsigned CLOSE_NO_STATUS = 1005;

WebSocketChannel::WebSocketChannel(CurlGlobal &global, const char *url,
				   StreamChannelHandler &_handler)
	:handler(_handler),
	 request(global, url, *this),
	 defer_start(global.GetEventLoop(), BIND_THIS_METHOD(OnDeferredStart)),
	 socket_event(global.GetEventLoop(), BIND_THIS_METHOD(OnSocketReady)),
	 open_timeout(global.GetEventLoop(), BIND_THIS_METHOD(OnOpenTimeout))
{
	auto &easy = request.GetEasy();
	easy.SetConnectOnly(2);
	easy.SetIPv4Only();
	request.KeepRegistered();
}

WebSocketChannel::~WebSocketChannel() noexcept
{
	/* libcurl owns the socket */
	socket_event.ReleaseSocket();
}

void
WebSocketChannel::OnDeferredStart() noexcept
{
	open_timeout.Schedule(OPEN_TIMEOUT);

	try {
		request.Start();
	} catch (...) {
		Fail(std::current_exception());
	}
}

void
WebSocketChannel::Fail(std::exception_ptr error) noexcept
{
	defer_start.Cancel();
	open_timeout.Cancel();
	socket_event.ReleaseSocket();
	open = false;

	/* removing the easy handle closes the connection */
	request.Stop();

	handler.OnChannelClosed(std::move(error));
}

void
WebSocketChannel::SendPing()
{
	if (!open)
		throw std::runtime_error("WebSocket is not open");

	request.GetEasy().WebSocketSend({}, CURLWS_PING);
}

void
WebSocketChannel::OnHeaders(unsigned, Curl::Headers &&)
{
}

void
WebSocketChannel::OnData(std::span<const std::byte>)
{
	/* there is no response body after the upgrade */
}

void
WebSocketChannel::OnEnd()
{
	const auto status = request.GetEasy().GetResponseCode();
	if (status != 101)
		throw FmtRuntimeError("WebSocket upgrade refused with status {}",
				      status);

	const auto s = request.GetEasy().GetActiveSocket();
	if (s == CURL_SOCKET_BAD)
		throw std::runtime_error("No WebSocket connection");

	open = true;
	open_timeout.Cancel();
	socket_event.Open(SocketDescriptor{s});
	socket_event.ScheduleRead();

	LogDebug(websocket_domain, "WebSocket open");

	if (!handler.OnChannelOpen())
		return;

	/* libcurl may already have read frames which arrived
	   together with the upgrade response */
	ReceiveAvailable();
}

void
WebSocketChannel::OnError(std::exception_ptr e) noexcept
{
	Fail(std::move(e));
}

void
WebSocketChannel::OnSocketReady(unsigned) noexcept
{
	ReceiveAvailable();
}

bool
WebSocketChannel::ReceiveAvailable() noexcept
{
	std::array<std::byte, 4096> buffer;

	while (true) {
		std::size_t nbytes;
		const struct curl_ws_frame *meta;

		try {
			meta = request.GetEasy().WebSocketReceive(buffer, nbytes);
		} catch (const CurlError &e) {
			if (e.GetCode() == CURLE_GOT_NOTHING) {
				Fail(std::make_exception_ptr(std::runtime_error("Connection closed by peer")));
				return false;
			}

			Fail(std::current_exception());
			return false;
		}

		if (meta == nullptr)
			return true;

		const std::string_view chunk{reinterpret_cast<const char *>(buffer.data()), nbytes};
		const bool complete = meta->bytesleft == 0;

		if (meta->flags & CURLWS_CLOSE) {
			close_payload.append(chunk);
			if (complete) {
				OnClose();
				return false;
			}

			continue;
		}

		if (meta->flags & (CURLWS_PING|CURLWS_PONG)) {
			/* libcurl answers pings itself */
			if (complete && !handler.OnChannelActivity())
				return false;

			continue;
		}

		if (message.size() + chunk.size() > MAX_MESSAGE_SIZE) {
			Fail(std::make_exception_ptr(std::runtime_error("WebSocket message too large")));
			return false;
		}

		message.append(chunk);

		if (!complete || (meta->flags & CURLWS_CONT))
			/* more fragments follow */
			continue;

		if (!handler.OnChannelMessage(std::exchange(message, {})))
			return false;
	}
}

void
WebSocketChannel::OnClose() noexcept
{
	unsigned code = CLOSE_NO_STATUS;
	if (close_payload.size() >= 2)
		code = (static_cast<unsigned char>(close_payload[0]) << 8) |
			static_cast<unsigned char>(close_payload[1]);

	try {
		/* echo the close code */
		const std::string_view echo = std::string_view{close_payload}.substr(0, 2);
		request.GetEasy().WebSocketSend(std::as_bytes(std::span{echo}),
						CURLWS_CLOSE);
	} catch (...) {
		FmtDebug(websocket_domain, "Failed to send close frame: {}",
			 std::current_exception());
	}

	Fail(std::make_exception_ptr(FmtRuntimeError("Connection closed by peer (code {})",
						     code)));
}

void
WebSocketChannel::OnOpenTimeout() noexcept
{
	Fail(std::make_exception_ptr(std::runtime_error("Timeout opening the WebSocket")));
}

WebSocketConnector::WebSocketConnector(EventLoop &loop)
	:global(std::make_unique<CurlGlobal>(loop))
{
	if (!CurlHasProtocol("ws"))
		LogWarning(websocket_domain,
			   "libcurl was built without WebSocket support");
}

WebSocketConnector::~WebSocketConnector() noexcept = default;

std::unique_ptr<StreamChannel>
WebSocketConnector::Connect(const std::string &host, unsigned port,
			    StreamChannelHandler &handler)
{
	const auto url = fmt::format("ws://{}:{}/ws", host, port);
	auto channel = std::make_unique<WebSocketChannel>(*global, url.c_str(),
							  handler);
	channel->Start();
	return channel;
}

// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_STREAM_WEBSOCKET_CHANNEL_HXX
#define MILO_STREAM_WEBSOCKET_CHANNEL_HXX

#include "Channel.hxx"
#include "lib/curl/Handler.hxx"
#include "lib/curl/Init.hxx"
#include "lib/curl/Request.hxx"
#include "event/Chrono.hxx"
#include "event/DeferEvent.hxx"
#include "event/FineTimerEvent.hxx"
#include "event/SocketEvent.hxx"

#include <memory>
#include <string>

class CurlGlobal;

/**
 * A WebSocket client connection.  libcurl performs name resolution,
 * connect and the upgrade handshake (CURLOPT_CONNECT_ONLY=2); after
 * that, we watch its socket and exchange frames with curl_ws_recv()
 * and curl_ws_send().
 */
class WebSocketChannel final : public StreamChannel, CurlResponseHandler {
	StreamChannelHandler &handler;

	CurlRequest request;

	DeferEvent defer_start;

	/**
	 * Watches the socket owned by libcurl after the upgrade.
	 */
	SocketEvent socket_event;

	/**
	 * Limits the time until the channel is open (name
	 * resolution, connect and handshake).
	 */
	FineTimerEvent open_timeout;

	bool open = false;

	/**
	 * The payload of the message being assembled.
	 */
	std::string message;

	std::string close_payload;

public:
	static constexpr Event::Duration OPEN_TIMEOUT = std::chrono::seconds(10);

	/**
	 * Messages larger than this are a protocol error.
	 */
	static constexpr std::size_t MAX_MESSAGE_SIZE = 1024 * 1024;

	/**
	 * Throws on error.
	 */
	WebSocketChannel(CurlGlobal &global, const char *url,
			 StreamChannelHandler &_handler);
	~WebSocketChannel() noexcept override;

	/**
	 * Start connecting in the next loop iteration.
	 */
	void Start() noexcept {
		defer_start.Schedule();
	}

	/* virtual methods from StreamChannel */
	void SendPing() override;

private:
	/**
	 * Close the connection and report the error to the handler
	 * (which may destroy this object).
	 */
	void Fail(std::exception_ptr error) noexcept;

	/**
	 * Receive all frames libcurl can give us right now.
	 *
	 * @return false if this object has been destroyed
	 */
	bool ReceiveAvailable() noexcept;

	/**
	 * The peer has sent a close frame.  Echo it and fail.
	 */
	void OnClose() noexcept;

	void OnDeferredStart() noexcept;
	void OnSocketReady(unsigned events) noexcept;
	void OnOpenTimeout() noexcept;

	/* virtual methods from CurlResponseHandler */
	void OnHeaders(unsigned status, Curl::Headers &&headers) override;
	void OnData(std::span<const std::byte> data) override;
	void OnEnd() override;
	void OnError(std::exception_ptr e) noexcept override;
};

/**
 * A #StreamConnector which creates #WebSocketChannel instances for
 * "ws://HOST:PORT/ws".
 */
class WebSocketConnector final : public StreamConnector {
	const ScopeCurlInit curl_init;

	std::unique_ptr<CurlGlobal> global;

public:
	/**
	 * Throws on error.
	 */
	explicit WebSocketConnector(EventLoop &loop);
	~WebSocketConnector() noexcept override;

	/* virtual methods from StreamConnector */
	std::unique_ptr<StreamChannel> Connect(const std::string &host,
					       unsigned port,
					       StreamChannelHandler &handler) override;
};

#endif

// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_STREAM_CHANNEL_HXX
#define MILO_STREAM_CHANNEL_HXX

#include <exception>
#include <memory>
#include <string>
#include <string_view>

/**
 * Receives events from a #StreamChannel.  All methods are invoked in
 * the #EventLoop thread.  The handler may destroy the channel from
 * within any of these methods.
 */
class StreamChannelHandler {
public:
	/**
	 * The channel is open and ready to send and receive.
	 *
	 * @return false if the channel has been destroyed
	 */
	virtual bool OnChannelOpen() noexcept = 0;

	/**
	 * A data message was received.
	 *
	 * @return false if the channel has been destroyed
	 */
	virtual bool OnChannelMessage(std::string_view text) noexcept = 0;

	/**
	 * A control frame (ping or pong) was received.
	 *
	 * @return false if the channel has been destroyed
	 */
	virtual bool OnChannelActivity() noexcept = 0;

	/**
	 * The channel has failed or was closed by the peer.  No
	 * further methods will be invoked.
	 */
	virtual void OnChannelClosed(std::exception_ptr error) noexcept = 0;
};

/**
 * A message channel to the appliance.  Destroying it closes the
 * connection without notifying the handler.
 */
class StreamChannel {
public:
	virtual ~StreamChannel() noexcept = default;

	/**
	 * Send a keepalive ping.
	 *
	 * Throws on error.
	 */
	virtual void SendPing() = 0;
};

/**
 * Creates #StreamChannel instances.
 */
class StreamConnector {
public:
	virtual ~StreamConnector() noexcept = default;

	/**
	 * Start connecting.  The handler is never invoked from
	 * within this method.
	 *
	 * Throws on error.
	 */
	virtual std::unique_ptr<StreamChannel> Connect(const std::string &host,
						       unsigned port,
						       StreamChannelHandler &handler) = 0;
};

#endif

// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_STREAM_CONTROL_STREAM_HXX
#define MILO_STREAM_CONTROL_STREAM_HXX

#include "Channel.hxx"
#include "ReconnectPolicy.hxx"
#include "event/Chrono.hxx"
#include "event/FineTimerEvent.hxx"

#include <memory>
#include <optional>
#include <string>

class EventLoop;
struct DeviceState;
struct VolumeUpdate;

class ControlStreamHandler {
public:
	virtual void OnStreamConnected() noexcept = 0;

	/**
	 * The stream has failed and a reconnect has been scheduled.
	 */
	virtual void OnStreamDisconnected(std::exception_ptr error) noexcept = 0;

	/**
	 * The reconnect timer has fired and a new connection attempt
	 * is about to start.
	 */
	virtual void OnStreamReconnecting() noexcept = 0;

	/**
	 * The stream has failed too often; no more reconnect
	 * attempts will be made until Start() is called (which
	 * begins with a fresh attempt counter).
	 */
	virtual void OnStreamGaveUp() noexcept = 0;

	virtual void OnStreamState(DeviceState &&state) noexcept = 0;
	virtual void OnStreamVolume(const VolumeUpdate &update) noexcept = 0;
};

struct ControlStreamConfig {
	Event::Duration ping_interval = std::chrono::seconds(30);

	ReconnectConfig reconnect;
};

/**
 * The persistent push connection to the appliance.  It decodes
 * events, keeps the connection alive with pings and reconnects with
 * a growing delay after failures.
 */
class ControlStream final : StreamChannelHandler {
	StreamConnector &connector;
	ControlStreamHandler &handler;

	const ControlStreamConfig config;

	ReconnectPolicy policy;

	std::unique_ptr<StreamChannel> channel;

	/**
	 * Incremented each time #channel is replaced or destroyed;
	 * used to detect whether a handler method has done that.
	 */
	unsigned channel_serial = 0;

	FineTimerEvent reconnect_timer;
	FineTimerEvent ping_timer;

	/**
	 * Fires when the connection has lasted long enough to reset
	 * the attempt counter.
	 */
	FineTimerEvent stable_timer;

	std::string host;
	unsigned port = 0;

	/**
	 * The start time of the last connection attempt.
	 */
	std::optional<Event::TimePoint> last_attempt;

	/**
	 * The earliest time for the next attempt after a failure.
	 * It survives Stop(), so a restarted stream still backs
	 * off.
	 */
	std::optional<Event::TimePoint> next_attempt;

	/**
	 * The delay which was chosen after the last failure.
	 */
	Event::Duration last_delay = Event::Duration::zero();

	/**
	 * Has any frame arrived since the last ping?
	 */
	bool received_since_ping;

	bool running = false;
	bool connected = false;

public:
	ControlStream(EventLoop &loop, StreamConnector &_connector,
		      ControlStreamHandler &_handler,
		      const ControlStreamConfig &_config={}) noexcept;
	~ControlStream() noexcept;

	ControlStream(const ControlStream &) = delete;
	ControlStream &operator=(const ControlStream &) = delete;

	bool IsRunning() const noexcept {
		return running;
	}

	bool IsConnected() const noexcept {
		return connected;
	}

	/**
	 * Is a connection attempt in progress?
	 */
	bool IsConnecting() const noexcept {
		return channel != nullptr && !connected;
	}

	bool IsReconnectPending() const noexcept {
		return reconnect_timer.IsPending();
	}

	const ReconnectPolicy &GetPolicy() const noexcept {
		return policy;
	}

	Event::Duration GetLastDelay() const noexcept {
		return last_delay;
	}

	/**
	 * Connect to the given host.  Previous failures are not
	 * forgotten: the attempt is postponed until the backoff delay
	 * of the last failure (and the minimum interval between
	 * attempts) has elapsed.  After the policy has given up, the
	 * attempt counter starts from zero.
	 */
	void Start(std::string_view _host, unsigned _port) noexcept;

	/**
	 * Close the connection and cancel all timers.  The attempt
	 * counter is kept.  Idempotent.
	 */
	void Stop() noexcept;

	/**
	 * Forget all previous failures.
	 */
	void ResetPolicy() noexcept {
		policy.Reset();
		next_attempt.reset();
		last_delay = Event::Duration::zero();
	}

	/**
	 * Drop the current connection and reconnect now, lowering the
	 * attempt counter.  Ignored while an attempt is in progress.
	 */
	void ForceReconnect() noexcept;

private:
	EventLoop &GetEventLoop() const noexcept {
		return ping_timer.GetEventLoop();
	}

	void ResetChannel() noexcept {
		channel.reset();
		++channel_serial;
	}

	/**
	 * Start a connection attempt, unless one is already in
	 * progress or the previous one was too recent.
	 */
	void Connect() noexcept;

	void OnFailure(std::exception_ptr error) noexcept;

	void OnReconnectTimer() noexcept;
	void OnPingTimer() noexcept;
	void OnStableTimer() noexcept;

	/* virtual methods from StreamChannelHandler */
	bool OnChannelOpen() noexcept override;
	bool OnChannelMessage(std::string_view text) noexcept override;
	bool OnChannelActivity() noexcept override;
	void OnChannelClosed(std::exception_ptr error) noexcept override;
};

#endif

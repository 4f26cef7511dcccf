// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_SESSION_READINESS_PROBER_HXX
#define MILO_SESSION_READINESS_PROBER_HXX

#include "api/Client.hxx"
#include "event/Chrono.hxx"
#include "event/FineTimerEvent.hxx"

#include <memory>

class ReadinessProberHandler {
public:
	/**
	 * The appliance has answered.
	 */
	virtual void OnProbeReady() noexcept = 0;

	/**
	 * All attempts have failed.
	 */
	virtual void OnProbeExhausted() noexcept = 0;
};

/**
 * Polls the appliance's state resource at a fixed interval until it
 * answers or the configured number of attempts has failed.  The
 * first attempt is made immediately.
 */
class ReadinessProber final : DeviceStateHandler {
	DeviceClient &client;
	ReadinessProberHandler &handler;

	const Event::Duration interval;
	const unsigned max_attempts;

	FineTimerEvent timer;

	std::unique_ptr<ApiRequest> request;

	unsigned attempts = 0;

	bool running = false;

public:
	static constexpr Event::Duration DEFAULT_INTERVAL = std::chrono::seconds(2);
	static constexpr unsigned DEFAULT_MAX_ATTEMPTS = 20;

	ReadinessProber(DeviceClient &_client,
			ReadinessProberHandler &_handler,
			Event::Duration _interval=DEFAULT_INTERVAL,
			unsigned _max_attempts=DEFAULT_MAX_ATTEMPTS) noexcept;

	bool IsRunning() const noexcept {
		return running;
	}

	unsigned GetAttempts() const noexcept {
		return attempts;
	}

	/**
	 * @return false if the prober is already running (the call
	 * is ignored)
	 */
	bool Start() noexcept;

	/**
	 * Cancel the timer and the request in flight, and reset the
	 * attempt counter.  Idempotent.
	 */
	void Stop() noexcept;

private:
	void Attempt() noexcept;

	void OnTimer() noexcept;

	/* virtual methods from DeviceStateHandler */
	void OnDeviceState(DeviceState &&state) noexcept override;
	void OnDeviceStateError(std::exception_ptr error) noexcept override;
};

#endif

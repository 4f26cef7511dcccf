// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_SESSION_STATE_REFRESHER_HXX
#define MILO_SESSION_STATE_REFRESHER_HXX

#include "api/Client.hxx"
#include "event/Chrono.hxx"
#include "event/FineTimerEvent.hxx"

#include <memory>

class StateRefresherHandler {
public:
	virtual void OnRefreshedState(DeviceState &&state) noexcept = 0;
};

/**
 * While connected, polls the appliance's state in the background to
 * catch changes the control stream may have missed.  After several
 * consecutive failures, the HTTP connection pool is reset.
 */
class StateRefresher final : DeviceStateHandler {
	DeviceClient &client;
	StateRefresherHandler &handler;

	const Event::Duration interval;

	FineTimerEvent timer;

	std::unique_ptr<ApiRequest> request;

	unsigned failures = 0;

public:
	static constexpr Event::Duration DEFAULT_INTERVAL = std::chrono::seconds(3);
	static constexpr unsigned MAX_FAILURES = 3;

	/**
	 * @param _interval the polling interval; zero disables the
	 * refresher
	 */
	StateRefresher(DeviceClient &_client, StateRefresherHandler &_handler,
		       Event::Duration _interval=DEFAULT_INTERVAL) noexcept;

	bool IsRunning() const noexcept {
		return timer.IsPending() || request != nullptr;
	}

	unsigned GetFailures() const noexcept {
		return failures;
	}

	void Start() noexcept;

	/**
	 * Idempotent.
	 */
	void Stop() noexcept;

private:
	void OnTimer() noexcept;

	/* virtual methods from DeviceStateHandler */
	void OnDeviceState(DeviceState &&state) noexcept override;
	void OnDeviceStateError(std::exception_ptr error) noexcept override;
};

#endif

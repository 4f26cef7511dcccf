// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_API_VOLUME_SENDER_HXX
#define MILO_API_VOLUME_SENDER_HXX

#include "Client.hxx"
#include "event/Chrono.hxx"
#include "event/FineTimerEvent.hxx"

#include <memory>
#include <optional>

/**
 * Coalesces rapid absolute volume changes (e.g. from a slider) into
 * few "set volume" requests.  A value is sent immediately if the
 * previous request is old enough; otherwise it is debounced.  Only
 * one request is in flight at a time, and only the newest value is
 * sent.
 */
class VolumeSender final : ApiCommandHandler {
	DeviceClient &client;

	FineTimerEvent debounce_timer;

	std::unique_ptr<ApiRequest> request;

	VolumeState limits;

	/**
	 * The value which has not yet been sent successfully.
	 */
	std::optional<double> pending;

	/**
	 * The value of the request in flight.
	 */
	double sending;

	Event::TimePoint last_send{};

public:
	static constexpr Event::Duration MIN_INTERVAL = std::chrono::milliseconds(100);
	static constexpr Event::Duration DEBOUNCE = std::chrono::milliseconds(30);

	explicit VolumeSender(DeviceClient &_client) noexcept;
	~VolumeSender() noexcept;

	VolumeSender(const VolumeSender &) = delete;
	VolumeSender &operator=(const VolumeSender &) = delete;

	/**
	 * Update the limits used for clamping.
	 */
	void SetLimits(const VolumeState &_limits) noexcept {
		limits = _limits;
	}

	std::optional<double> GetPending() const noexcept {
		return pending;
	}

	bool IsBusy() const noexcept {
		return request != nullptr;
	}

	/**
	 * Request a new absolute volume.
	 */
	void Set(double volume_db) noexcept;

	/**
	 * Cancel the request in flight and discard the pending value.
	 */
	void Cancel() noexcept;

private:
	void SendNow() noexcept;

	void OnDebounceTimer() noexcept;

	/* virtual methods from ApiCommandHandler */
	void OnApiCommandDone() noexcept override;
	void OnApiCommandError(std::exception_ptr error) noexcept override;
};

#endif

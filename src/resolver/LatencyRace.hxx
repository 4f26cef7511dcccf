// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_RESOLVER_LATENCY_RACE_HXX
#define MILO_RESOLVER_LATENCY_RACE_HXX

#include "Selection.hxx"
#include "event/Chrono.hxx"
#include "event/DeferEvent.hxx"
#include "event/FineTimerEvent.hxx"

#include <list>
#include <string>
#include <vector>

class LatencyRaceHandler {
public:
	/**
	 * The race is over.  The results are in the order of the
	 * addresses passed to LatencyRace::Start().
	 */
	virtual void OnLatencyRaceDone(std::vector<AddressLatency> &&results) noexcept = 0;
};

/**
 * Measure the TCP connect latency of several addresses concurrently.
 * Each probe is a non-blocking connect() bounded by a timeout; the
 * race as a whole is bounded by a grace period, after which the
 * results in hand are reported.
 */
class LatencyRace final {
	class Probe;

	EventLoop &loop;
	LatencyRaceHandler &handler;

	const unsigned port;
	const Event::Duration probe_timeout;

	FineTimerEvent grace_timer;

	/**
	 * Reports the result in the next iteration if all probes have
	 * completed.
	 */
	DeferEvent defer_finish;

	std::list<Probe> probes;

	std::vector<AddressLatency> results;

	const Event::Duration grace_period;

public:
	static constexpr Event::Duration DEFAULT_PROBE_TIMEOUT = std::chrono::milliseconds(500);
	static constexpr Event::Duration DEFAULT_GRACE_PERIOD = std::chrono::seconds(2);

	LatencyRace(EventLoop &_loop, unsigned _port,
		    LatencyRaceHandler &_handler,
		    Event::Duration _probe_timeout=DEFAULT_PROBE_TIMEOUT,
		    Event::Duration _grace_period=DEFAULT_GRACE_PERIOD) noexcept;
	~LatencyRace() noexcept;

	LatencyRace(const LatencyRace &) = delete;
	LatencyRace &operator=(const LatencyRace &) = delete;

	bool IsRunning() const noexcept {
		return !results.empty() || defer_finish.IsPending();
	}

	/**
	 * Start probing the given (numeric IPv4) addresses.  A race
	 * which is already running is canceled.
	 */
	void Start(const std::vector<std::string> &addresses) noexcept;

	/**
	 * Idempotent.
	 */
	void Cancel() noexcept;

private:
	void OnProbeDone(Probe &probe, std::optional<Event::Duration> latency) noexcept;
	void Finish() noexcept;

	void OnGraceTimer() noexcept;
	void OnDeferredFinish() noexcept;
};

#endif

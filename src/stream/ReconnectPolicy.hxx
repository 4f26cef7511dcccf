// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_STREAM_RECONNECT_POLICY_HXX
#define MILO_STREAM_RECONNECT_POLICY_HXX

#include "event/Chrono.hxx"

#include <algorithm>
#include <optional>

struct ReconnectConfig {
	/**
	 * A connection which lasted less than this counts as two
	 * failed attempts.  A connection which lasts longer resets
	 * the attempt counter.
	 */
	Event::Duration short_connection = std::chrono::seconds(3);

	/**
	 * Connection attempts are at least this far apart.
	 */
	Event::Duration min_attempt_interval = std::chrono::seconds(2);

	unsigned max_attempts = 15;

	Event::Duration delay_base = std::chrono::seconds(5);
	Event::Duration delay_step = std::chrono::seconds(5);
	Event::Duration max_delay = std::chrono::seconds(30);

	/**
	 * The delay before the next attempt after #attempts
	 * failures: min(base + step * attempts, max).
	 */
	constexpr Event::Duration GetDelay(unsigned attempts) const noexcept {
		return std::min<Event::Duration>(delay_base + delay_step * attempts,
						 max_delay);
	}
};

/**
 * Decides when (and whether) the control stream reconnects after a
 * failure.  This class does not schedule anything; it only does the
 * bookkeeping.
 */
class ReconnectPolicy {
	ReconnectConfig config;

	unsigned attempts = 0;

	bool gave_up = false;

public:
	ReconnectPolicy() = default;

	explicit ReconnectPolicy(const ReconnectConfig &_config) noexcept
		:config(_config) {}

	const ReconnectConfig &GetConfig() const noexcept {
		return config;
	}

	unsigned GetAttempts() const noexcept {
		return attempts;
	}

	bool HasGivenUp() const noexcept {
		return gave_up;
	}

	void Reset() noexcept {
		attempts = 0;
		gave_up = false;
	}

	/**
	 * The connection (or the attempt) has failed.
	 *
	 * @param uptime the time since the attempt was started
	 * @return the delay until the next attempt, or std::nullopt
	 * if the policy gives up
	 */
	std::optional<Event::Duration> OnFailure(Event::Duration uptime) noexcept {
		attempts += uptime < config.short_connection ? 2 : 1;

		if (attempts >= config.max_attempts) {
			gave_up = true;
			return std::nullopt;
		}

		return config.GetDelay(attempts);
	}

	/**
	 * A reconnect was requested explicitly: bias towards faster
	 * recovery.
	 */
	void OnForceReconnect() noexcept {
		attempts = attempts >= 2 ? attempts - 2 : 0;
		gave_up = false;
	}

	/**
	 * How long must the next attempt be postponed to honor the
	 * minimum interval between attempts?
	 *
	 * @param last_attempt the start of the previous attempt (if
	 * any)
	 */
	[[gnu::pure]]
	Event::Duration GetThrottleDelay(std::optional<Event::TimePoint> last_attempt,
					 Event::TimePoint now) const noexcept {
		if (!last_attempt)
			return Event::Duration::zero();

		const auto elapsed = now - *last_attempt;
		if (elapsed >= config.min_attempt_interval)
			return Event::Duration::zero();

		return config.min_attempt_interval - elapsed;
	}
};

#endif

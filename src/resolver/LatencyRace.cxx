// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "LatencyRace.hxx"
#include "event/SocketEvent.hxx"
#include "net/IPv4Address.hxx"
#include "net/SocketError.hxx"
#include "net/UniqueSocketDescriptor.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <algorithm>

#include <sys/socket.h>

static constexpr Domain resolver_domain("resolver");

/**
 * One non-blocking TCP connect.
 */
class LatencyRace::Probe final {
	LatencyRace &race;

	const std::size_t index;

	SocketEvent socket_event;

	FineTimerEvent timeout_event;

	Event::Clock::time_point start_time;

public:
	Probe(LatencyRace &_race, std::size_t _index) noexcept
		:race(_race), index(_index),
		 socket_event(race.loop, BIND_THIS_METHOD(OnSocketReady)),
		 timeout_event(race.loop, BIND_THIS_METHOD(OnTimeout)) {}

	~Probe() noexcept {
		socket_event.Close();
	}

	Probe(const Probe &) = delete;
	Probe &operator=(const Probe &) = delete;

	std::size_t GetIndex() const noexcept {
		return index;
	}

	/**
	 * Start connecting.
	 *
	 * @return false if the probe has failed (or completed)
	 * immediately; OnProbeDone() has not been called then
	 */
	bool Start(const std::string &address, unsigned port,
		   std::optional<Event::Duration> &latency_r) noexcept {
		const auto a = IPv4Address::Parse(address.c_str(), port);
		if (!a)
			return false;

		UniqueSocketDescriptor fd;
		if (!fd.CreateNonBlock(AF_INET, SOCK_STREAM, 0)) {
			FmtDebug(resolver_domain, "Failed to create socket: {}",
				 GetSocketError());
			return false;
		}

		start_time = Event::Clock::now();

		if (fd.Connect(*a)) {
			latency_r = Event::Clock::now() - start_time;
			return false;
		}

		const auto e = GetSocketError();
		if (!IsSocketErrorConnectWouldBlock(e))
			return false;

		socket_event.Open(fd.Release());
		socket_event.ScheduleWrite();
		timeout_event.Schedule(race.probe_timeout);
		return true;
	}

private:
	void OnSocketReady([[maybe_unused]] unsigned events) noexcept {
		const auto now = Event::Clock::now();

		timeout_event.Cancel();

		std::optional<Event::Duration> latency;
		if (socket_event.GetSocket().GetError() == 0)
			latency = now - start_time;

		socket_event.Close();
		race.OnProbeDone(*this, latency);
	}

	void OnTimeout() noexcept {
		socket_event.Close();
		race.OnProbeDone(*this, std::nullopt);
	}
};

LatencyRace::LatencyRace(EventLoop &_loop, unsigned _port,
			 LatencyRaceHandler &_handler,
			 Event::Duration _probe_timeout,
			 Event::Duration _grace_period) noexcept
	:loop(_loop), handler(_handler),
	 port(_port), probe_timeout(_probe_timeout),
	 grace_timer(loop, BIND_THIS_METHOD(OnGraceTimer)),
	 defer_finish(loop, BIND_THIS_METHOD(OnDeferredFinish)),
	 grace_period(_grace_period)
{
}

LatencyRace::~LatencyRace() noexcept = default;

void
LatencyRace::Start(const std::vector<std::string> &addresses) noexcept
{
	Cancel();

	if (addresses.empty()) {
		defer_finish.Schedule();
		return;
	}

	results.reserve(addresses.size());
	for (const auto &i : addresses)
		results.push_back({i, std::nullopt});

	for (std::size_t i = 0; i < addresses.size(); ++i) {
		auto &probe = probes.emplace_back(*this, i);
		if (!probe.Start(addresses[i], port, results[i].latency))
			probes.pop_back();
	}

	FmtDebug(resolver_domain, "Racing {} addresses", addresses.size());

	if (probes.empty())
		defer_finish.Schedule();
	else
		grace_timer.Schedule(grace_period);
}

void
LatencyRace::Cancel() noexcept
{
	grace_timer.Cancel();
	defer_finish.Cancel();
	probes.clear();
	results.clear();
}

void
LatencyRace::OnProbeDone(Probe &probe,
			 std::optional<Event::Duration> latency) noexcept
{
	const auto index = probe.GetIndex();
	results[index].latency = latency;

	if (latency)
		FmtDebug(resolver_domain, "{}: {} ms", results[index].address,
			 std::chrono::duration_cast<std::chrono::milliseconds>(*latency).count());
	else
		FmtDebug(resolver_domain, "{}: unreachable",
			 results[index].address);

	/* this destroys the caller; must be the last access */
	probes.remove_if([&probe](const Probe &p){ return &p == &probe; });

	if (probes.empty())
		Finish();
}

void
LatencyRace::Finish() noexcept
{
	grace_timer.Cancel();
	defer_finish.Cancel();
	probes.clear();

	auto r = std::move(results);
	results.clear();
	handler.OnLatencyRaceDone(std::move(r));
}

void
LatencyRace::OnGraceTimer() noexcept
{
	LogDebug(resolver_domain, "Latency race grace period expired");
	Finish();
}

void
LatencyRace::OnDeferredFinish() noexcept
{
	Finish();
}

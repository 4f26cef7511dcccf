// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "SignalMonitor.hxx"
#include "SocketEvent.hxx"
#include "WakeFD.hxx"
#include "net/SocketError.hxx"

#include <array>
#include <atomic>
#include <memory>
#include <optional>
#include <stdexcept>

#include <signal.h>

namespace {

struct SignalSlot {
	SignalHandler handler;

	/**
	 * The disposition which was replaced by
	 * SignalMonitorRegister(), restored by
	 * SignalMonitorFinish().
	 */
	std::optional<struct sigaction> previous;

	/**
	 * Set by the signal handler, cleared by the #EventLoop.
	 */
	std::atomic_bool pending{false};
};

std::array<SignalSlot, 65> slots;

/**
 * Forwards signals from signal context into the #EventLoop through a
 * self-pipe.
 */
class SignalMonitor final {
	WakeFD pipe;
	SocketEvent event;

public:
	explicit SignalMonitor(EventLoop &loop)
		:event(loop, BIND_THIS_METHOD(OnPipeReadable),
		       pipe.GetSocket()) {
		event.ScheduleRead();
	}

	/**
	 * Async-signal-safe.
	 */
	void Notify() noexcept {
		pipe.Write();
	}

private:
	void OnPipeReadable(unsigned) noexcept {
		pipe.Read();

		for (auto &slot : slots)
			if (slot.pending.exchange(false) && slot.handler)
				slot.handler();
	}
};

/* accessed from signal context */
std::atomic<SignalMonitor *> active_monitor{nullptr};

std::unique_ptr<SignalMonitor> monitor;

void
OnSignal(int signo) noexcept
{
	if (signo <= 0 || std::size_t(signo) >= slots.size())
		return;

	slots[signo].pending = true;

	if (auto *m = active_monitor.load())
		m->Notify();
}

} // anonymous namespace

void
SignalMonitorInit(EventLoop &loop)
{
	monitor = std::make_unique<SignalMonitor>(loop);
	active_monitor = monitor.get();
}

void
SignalMonitorFinish() noexcept
{
	for (std::size_t signo = 1; signo < slots.size(); ++signo) {
		auto &slot = slots[signo];
		if (slot.previous) {
			sigaction(int(signo), &*slot.previous, nullptr);
			slot.previous.reset();
		}

		slot.handler = {};
		slot.pending = false;
	}

	active_monitor = nullptr;
	monitor.reset();
}

void
SignalMonitorRegister(int signo, SignalHandler handler)
{
	if (signo <= 0 || std::size_t(signo) >= slots.size())
		throw std::invalid_argument("Invalid signal number");

	auto &slot = slots[signo];

	struct sigaction sa{};
	sa.sa_handler = OnSignal;
	sa.sa_flags = SA_RESTART;
	sigemptyset(&sa.sa_mask);

	struct sigaction old;
	if (sigaction(signo, &sa, &old) < 0)
		throw MakeSocketError("sigaction() failed");

	if (!slot.previous)
		slot.previous = old;

	slot.handler = handler;
}

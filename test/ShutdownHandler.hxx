// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_TEST_SHUTDOWN_HANDLER_HXX
#define MILO_TEST_SHUTDOWN_HANDLER_HXX

class EventLoop;

/**
 * Lets the debugging tools exit cleanly: SIGINT and SIGTERM break
 * the #EventLoop.
 */
class ShutdownHandler {
	EventLoop &loop;

public:
	explicit ShutdownHandler(EventLoop &_loop);
	~ShutdownHandler() noexcept;

	ShutdownHandler(const ShutdownHandler &) = delete;
	ShutdownHandler &operator=(const ShutdownHandler &) = delete;

private:
	void OnSignal() noexcept;
};

#endif

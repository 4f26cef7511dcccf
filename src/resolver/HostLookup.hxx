// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_RESOLVER_HOST_LOOKUP_HXX
#define MILO_RESOLVER_HOST_LOOKUP_HXX

#include "event/InjectEvent.hxx"

#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>

class HostLookupHandler {
public:
	virtual void OnHostLookupSuccess(std::vector<std::string> &&addresses) noexcept = 0;
	virtual void OnHostLookupError(std::exception_ptr error) noexcept = 0;
};

/**
 * Resolves a host name in a worker thread, because getaddrinfo() is
 * blocking.  The result is delivered to the handler in the
 * #EventLoop thread.
 */
class HostLookup final {
public:
	/**
	 * A blocking function which returns the numeric addresses
	 * of the given host.  It is called in a worker thread.
	 */
	using Function = std::function<std::vector<std::string>(const std::string &host)>;

private:
	struct Job;

	HostLookupHandler &handler;

	const Function function;

	InjectEvent inject_event;

	/**
	 * The job currently running in a worker thread.
	 */
	std::shared_ptr<Job> job;

public:
	HostLookup(EventLoop &loop, HostLookupHandler &_handler,
		   Function _function=SystemLookup) noexcept;

	~HostLookup() noexcept {
		Cancel();
	}

	HostLookup(const HostLookup &) = delete;
	HostLookup &operator=(const HostLookup &) = delete;

	bool IsBusy() const noexcept {
		return job != nullptr;
	}

	/**
	 * Start resolving.  A lookup which is already running is
	 * canceled.
	 *
	 * Throws on error (if the thread cannot be created).
	 */
	void Start(const std::string &host);

	/**
	 * Forget the running lookup (the worker thread finishes in
	 * the background).  Idempotent.
	 */
	void Cancel() noexcept;

	/**
	 * The default implementation: getaddrinfo() with AF_INET.
	 */
	static std::vector<std::string> SystemLookup(const std::string &host);

private:
	void OnInject() noexcept;
};

#endif

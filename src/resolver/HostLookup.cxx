// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "HostLookup.hxx"
#include "net/Resolver.hxx"

#include <mutex>
#include <thread>

#include <sys/socket.h>

struct HostLookup::Job {
	std::mutex mutex;

	/**
	 * The owner which gets notified; nullptr if the job was
	 * canceled.  Protected by #mutex.
	 */
	InjectEvent *inject_event;

	bool done = false;
	std::vector<std::string> addresses;
	std::exception_ptr error;

	explicit Job(InjectEvent &_inject_event) noexcept
		:inject_event(&_inject_event) {}

	void Run(const Function &function, const std::string &host) noexcept {
		std::vector<std::string> result;
		std::exception_ptr e;

		try {
			result = function(host);
		} catch (...) {
			e = std::current_exception();
		}

		const std::scoped_lock lock{mutex};
		addresses = std::move(result);
		error = std::move(e);
		done = true;

		if (inject_event != nullptr)
			inject_event->Schedule();
	}
};

HostLookup::HostLookup(EventLoop &loop, HostLookupHandler &_handler,
		       Function _function) noexcept
	:handler(_handler), function(std::move(_function)),
	 inject_event(loop, BIND_THIS_METHOD(OnInject))
{
}

void
HostLookup::Start(const std::string &host)
{
	Cancel();

	auto new_job = std::make_shared<Job>(inject_event);
	std::thread([new_job, f=function, host]{
		new_job->Run(f, host);
	}).detach();

	job = std::move(new_job);
}

void
HostLookup::Cancel() noexcept
{
	if (!job)
		return;

	{
		const std::scoped_lock lock{job->mutex};
		job->inject_event = nullptr;
	}

	inject_event.Cancel();
	job.reset();
}

void
HostLookup::OnInject() noexcept
{
	if (!job)
		return;

	std::vector<std::string> addresses;
	std::exception_ptr error;

	{
		const std::scoped_lock lock{job->mutex};
		if (!job->done)
			return;

		job->inject_event = nullptr;
		addresses = std::move(job->addresses);
		error = std::move(job->error);
	}

	job.reset();

	if (error)
		handler.OnHostLookupError(std::move(error));
	else
		handler.OnHostLookupSuccess(std::move(addresses));
}

std::vector<std::string>
HostLookup::SystemLookup(const std::string &host)
{
	return ResolveHostAddresses(host.c_str(), AF_INET);
}

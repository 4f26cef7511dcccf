// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Init.hxx"
#include "Error.hxx"

#include <mutex>

#include <string.h>

static std::mutex curl_init_mutex;
static unsigned curl_init_ref;

ScopeCurlInit::ScopeCurlInit()
{
	const std::scoped_lock lock{curl_init_mutex};

	if (curl_init_ref == 0) {
		CURLcode code = curl_global_init(CURL_GLOBAL_ALL);
		if (code != CURLE_OK)
			throw CurlError(code, "curl_global_init() failed");
	}

	++curl_init_ref;
}

ScopeCurlInit::~ScopeCurlInit() noexcept
{
	const std::scoped_lock lock{curl_init_mutex};

	if (--curl_init_ref == 0)
		curl_global_cleanup();
}

bool
CurlHasProtocol(const char *scheme) noexcept
{
	const auto *info = curl_version_info(CURLVERSION_NOW);
	if (info == nullptr || info->protocols == nullptr)
		return false;

	for (auto i = info->protocols; *i != nullptr; ++i)
		if (strcasecmp(*i, scheme) == 0)
			return true;

	return false;
}

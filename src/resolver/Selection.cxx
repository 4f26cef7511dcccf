// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Selection.hxx"

#include <algorithm>

std::vector<std::string>
FilterIPv4Addresses(const std::vector<std::string> &addresses)
{
	std::vector<std::string> result;

	for (const auto &i : addresses) {
		if (i.empty() || i.find(':') != i.npos)
			continue;

		if (std::find(result.begin(), result.end(), i) != result.end())
			continue;

		result.push_back(i);
	}

	return result;
}

std::optional<std::string>
SelectBestAddress(const std::vector<AddressLatency> &results) noexcept
{
	if (results.empty())
		return std::nullopt;

	const AddressLatency *best = nullptr;
	for (const auto &i : results) {
		if (!i.latency)
			continue;

		/* on a tie, the earlier address wins */
		if (best == nullptr || *i.latency < *best->latency)
			best = &i;
	}

	if (best == nullptr)
		best = &results.front();

	return best->address;
}

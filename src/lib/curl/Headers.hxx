// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <map>
#include <string>

namespace Curl {

/**
 * Response headers; the names are lower case.
 */
using Headers = std::multimap<std::string, std::string, std::less<>>;

} // namespace Curl

// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_API_ENDPOINT_HXX
#define MILO_API_ENDPOINT_HXX

#include <string>
#include <string_view>

/**
 * Where the appliance can be reached.  The resolved IPv4 address is
 * preferred; until one is known, the configured host name is used.
 */
class DeviceEndpoint {
	std::string hostname;

	/**
	 * The resolved numeric IPv4 address; empty if none.
	 */
	std::string address;

	unsigned http_port;
	unsigned stream_port;

public:
	DeviceEndpoint(std::string_view _hostname,
		       unsigned _http_port, unsigned _stream_port) noexcept
		:hostname(_hostname),
		 http_port(_http_port), stream_port(_stream_port) {}

	const std::string &GetHostname() const noexcept {
		return hostname;
	}

	const std::string &GetHost() const noexcept {
		return address.empty() ? hostname : address;
	}

	bool HasAddress() const noexcept {
		return !address.empty();
	}

	void SetAddress(std::string_view _address) noexcept {
		address = _address;
	}

	void ClearAddress() noexcept {
		address.clear();
	}

	unsigned GetHttpPort() const noexcept {
		return http_port;
	}

	unsigned GetStreamPort() const noexcept {
		return stream_port;
	}

	/**
	 * Build the URL of an API resource.
	 *
	 * Throws #ApiError (INVALID_TARGET) if the host name is not
	 * usable.
	 */
	std::string MakeHttpUrl(std::string_view path) const;

	/**
	 * Throws #ApiError (INVALID_TARGET) if the host name is not
	 * usable.
	 */
	std::string MakeStreamUrl() const;
};

/**
 * Is this a valid host name or numeric IPv4 address for use in a
 * URL?
 */
[[gnu::pure]]
bool
IsValidHost(std::string_view host) noexcept;

/**
 * Is this a valid path segment identifier (source or station id)?
 * Only letters, digits, '-', '_' and '.' are allowed.
 */
[[gnu::pure]]
bool
IsValidIdentifier(std::string_view id) noexcept;

#endif

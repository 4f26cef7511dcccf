// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_NET_SOCKET_ERROR_HXX
#define MILO_NET_SOCKET_ERROR_HXX

#include <system_error> // IWYU pragma: export

#include <errno.h>

/**
 * The error code of the last failed socket call.
 */
inline int
GetSocketError() noexcept
{
	return errno;
}

/**
 * A non-blocking connect() has been started and will complete
 * asynchronously.
 */
constexpr bool
IsSocketErrorConnectWouldBlock(int code) noexcept
{
	return code == EINPROGRESS;
}

constexpr bool
IsSocketErrorReceiveWouldBlock(int code) noexcept
{
	return code == EAGAIN || code == EWOULDBLOCK;
}

constexpr bool
IsSocketErrorSendWouldBlock(int code) noexcept
{
	return IsSocketErrorReceiveWouldBlock(code);
}

inline std::system_error
MakeSocketError(int code, const char *msg) noexcept
{
	return {code, std::system_category(), msg};
}

inline std::system_error
MakeSocketError(const char *msg) noexcept
{
	return MakeSocketError(GetSocketError(), msg);
}

#endif

// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_LOG_HXX
#define MILO_LOG_HXX

#include "LogLevel.hxx"

#include <fmt/core.h>

#include <exception>
#include <string_view>
#include <utility>

class Domain;

/**
 * Emit one message through the configured #LogBackend (if the level
 * passes the threshold).
 */
void
Log(LogLevel level, const Domain &domain, std::string_view msg) noexcept;

void
LogVFmt(LogLevel level, const Domain &domain,
	fmt::string_view format_str, fmt::format_args args) noexcept;

/**
 * Log an exception with its nested message chain, prefixed with
 * the given context message.
 */
void
Log(LogLevel level, const Domain &domain,
    std::exception_ptr ep, std::string_view msg) noexcept;

template<typename... Args>
void
LogFmt(LogLevel level, const Domain &domain,
       fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	LogVFmt(level, domain, format_str, fmt::make_format_args(args...));
}

template<typename... Args>
void
FmtDebug(const Domain &domain,
	 fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	LogVFmt(LogLevel::DEBUG, domain, format_str,
		fmt::make_format_args(args...));
}

template<typename... Args>
void
FmtInfo(const Domain &domain,
	fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	LogVFmt(LogLevel::INFO, domain, format_str,
		fmt::make_format_args(args...));
}

template<typename... Args>
void
FmtNotice(const Domain &domain,
	  fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	LogVFmt(LogLevel::NOTICE, domain, format_str,
		fmt::make_format_args(args...));
}

template<typename... Args>
void
FmtWarning(const Domain &domain,
	   fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	LogVFmt(LogLevel::WARNING, domain, format_str,
		fmt::make_format_args(args...));
}

template<typename... Args>
void
FmtError(const Domain &domain,
	 fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	LogVFmt(LogLevel::ERROR, domain, format_str,
		fmt::make_format_args(args...));
}

inline void
LogDebug(const Domain &domain, std::string_view msg) noexcept
{
	Log(LogLevel::DEBUG, domain, msg);
}

inline void
LogInfo(const Domain &domain, std::string_view msg) noexcept
{
	Log(LogLevel::INFO, domain, msg);
}

inline void
LogNotice(const Domain &domain, std::string_view msg) noexcept
{
	Log(LogLevel::NOTICE, domain, msg);
}

inline void
LogWarning(const Domain &domain, std::string_view msg) noexcept
{
	Log(LogLevel::WARNING, domain, msg);
}

inline void
LogError(const Domain &domain, std::string_view msg) noexcept
{
	Log(LogLevel::ERROR, domain, msg);
}

inline void
LogWarning(const Domain &domain, std::exception_ptr ep,
	   std::string_view msg) noexcept
{
	Log(LogLevel::WARNING, domain, std::move(ep), msg);
}

inline void
LogError(const Domain &domain, std::exception_ptr ep,
	 std::string_view msg) noexcept
{
	Log(LogLevel::ERROR, domain, std::move(ep), msg);
}

#endif

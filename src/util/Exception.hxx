// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_UTIL_EXCEPTION_HXX
#define MILO_UTIL_EXCEPTION_HXX

#include <exception>
#include <string>
#include <utility>

/**
 * Wrap #ep inside the new exception #t, so that #t becomes the outer
 * exception of the chain.
 */
template<typename T>
std::exception_ptr
NestException(std::exception_ptr ep, T &&t) noexcept
{
	try {
		std::rethrow_exception(std::move(ep));
	} catch (...) {
		try {
			std::throw_with_nested(std::forward<T>(t));
		} catch (...) {
			return std::current_exception();
		}
	}
}

/**
 * Find an instance of #T in the nested exception chain.
 *
 * @return a pointer into the exception object (valid as long as
 * #ep is), or nullptr if there is none
 */
template<typename T>
[[gnu::pure]]
inline const T *
FindNested(std::exception_ptr ep) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const T &t) {
		return &t;
	} catch (const std::nested_exception &ne) {
		return FindNested<T>(ne.nested_ptr());
	} catch (...) {
	}

	return nullptr;
}

/**
 * Concatenate the messages of an exception and all exceptions nested
 * inside it, outermost first, separated by "; ".  Line breaks are
 * collapsed so the result fits in one log line.
 */
std::string
GetFullMessage(std::exception_ptr ep) noexcept;

/**
 * Print GetFullMessage() to stderr.  Used for errors which occur
 * before logging has been set up.
 */
void
PrintException(std::exception_ptr ep) noexcept;

#endif

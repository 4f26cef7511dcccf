// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Error.hxx"
#include "lib/curl/Error.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

const char *
ToString(ApiError::Kind kind) noexcept
{
	switch (kind) {
	case ApiError::Kind::INVALID_TARGET:
		return "invalid target";

	case ApiError::Kind::TRANSPORT:
		return "transport failure";

	case ApiError::Kind::MALFORMED_RESPONSE:
		return "malformed response";
	}

	return "?";
}

static ApiError
MakeApiError(ApiError::Kind kind) noexcept
{
	return ApiError(kind, fmt::format("Request failed ({})", ToString(kind)));
}

std::exception_ptr
ToApiError(std::exception_ptr ep) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const ApiError &) {
		return ep;
	} catch (const CurlError &e) {
		return NestException(ep,
				     MakeApiError(e.GetCode() == CURLE_URL_MALFORMAT
						  ? ApiError::Kind::INVALID_TARGET
						  : ApiError::Kind::TRANSPORT));
	} catch (const nlohmann::json::exception &) {
		return NestException(ep, MakeApiError(ApiError::Kind::MALFORMED_RESPONSE));
	} catch (const std::invalid_argument &) {
		return NestException(ep, MakeApiError(ApiError::Kind::INVALID_TARGET));
	} catch (...) {
		return NestException(ep, MakeApiError(ApiError::Kind::TRANSPORT));
	}
}

ApiError::Kind
GetApiErrorKind(std::exception_ptr ep) noexcept
{
	const auto *e = FindNested<ApiError>(ep);
	return e != nullptr
		? e->GetKind()
		: ApiError::Kind::TRANSPORT;
}

// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Client.hxx"
#include "Endpoint.hxx"
#include "Error.hxx"
#include "device/Json.hxx"
#include "event/DeferEvent.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

using std::string_view_literals::operator""sv;

/**
 * Glue between #ApiTransport and the typed handler interfaces.
 * Failures before the request could be sent are postponed to the
 * next loop iteration.
 */
class DeviceClient::Operation : public ApiRequest, protected ApiResponseHandler {
	DeferEvent defer_error;

	std::exception_ptr postponed_error;

	std::unique_ptr<ApiRequest> request;

public:
	explicit Operation(EventLoop &loop) noexcept
		:defer_error(loop, BIND_THIS_METHOD(OnDeferredError)) {}

	void Start(ApiTransport &transport, const ApiCall &call) noexcept {
		try {
			request = transport.Send(call, *this);
		} catch (...) {
			Postpone(ToApiError(std::current_exception()));
		}
	}

	void Postpone(std::exception_ptr error) noexcept {
		postponed_error = std::move(error);
		defer_error.Schedule();
	}

protected:
	/**
	 * Parse the response body and invoke the handler.  May throw
	 * if the body is malformed.
	 */
	virtual void OnBody(std::string &&body) = 0;

	virtual void OnFailure(std::exception_ptr error) noexcept = 0;

private:
	void OnDeferredError() noexcept {
		OnFailure(std::move(postponed_error));
	}

	/* virtual methods from ApiResponseHandler */
	void OnApiResponse(ApiResponse &&response) noexcept override {
		std::exception_ptr error;

		try {
			OnBody(std::move(response.body));
			return;
		} catch (...) {
			error = NestException(std::current_exception(),
					      ApiError(ApiError::Kind::MALFORMED_RESPONSE,
						       "Malformed response"));
		}

		OnFailure(std::move(error));
	}

	void OnApiError(std::exception_ptr error) noexcept override {
		OnFailure(std::move(error));
	}
};

class DeviceClient::StateOperation final : public Operation {
	DeviceStateHandler &handler;

public:
	StateOperation(EventLoop &loop, DeviceStateHandler &_handler) noexcept
		:Operation(loop), handler(_handler) {}

protected:
	void OnBody(std::string &&body) override {
		handler.OnDeviceState(ParseDeviceState(body));
	}

	void OnFailure(std::exception_ptr error) noexcept override {
		handler.OnDeviceStateError(std::move(error));
	}
};

class DeviceClient::VolumeOperation final : public Operation {
	VolumeStatusHandler &handler;

public:
	VolumeOperation(EventLoop &loop, VolumeStatusHandler &_handler) noexcept
		:Operation(loop), handler(_handler) {}

protected:
	void OnBody(std::string &&body) override {
		handler.OnVolumeStatus(ParseVolumeStatus(body));
	}

	void OnFailure(std::exception_ptr error) noexcept override {
		handler.OnVolumeStatusError(std::move(error));
	}
};

class DeviceClient::StationsOperation final : public Operation {
	StationListHandler &handler;

public:
	StationsOperation(EventLoop &loop, StationListHandler &_handler) noexcept
		:Operation(loop), handler(_handler) {}

protected:
	void OnBody(std::string &&body) override {
		handler.OnStationList(ParseStationList(body));
	}

	void OnFailure(std::exception_ptr error) noexcept override {
		handler.OnStationListError(std::move(error));
	}
};

class DeviceClient::CommandOperation final : public Operation {
	ApiCommandHandler &handler;

public:
	CommandOperation(EventLoop &loop, ApiCommandHandler &_handler) noexcept
		:Operation(loop), handler(_handler) {}

protected:
	void OnBody(std::string &&) override {
		handler.OnApiCommandDone();
	}

	void OnFailure(std::exception_ptr error) noexcept override {
		handler.OnApiCommandError(std::move(error));
	}
};

template<typename O, typename H>
std::unique_ptr<ApiRequest>
DeviceClient::Start(H &handler, HttpMethod method, std::string_view path,
		    std::string &&body) noexcept
{
	auto operation = std::make_unique<O>(GetEventLoop(), handler);

	try {
		operation->Start(transport,
				 {method, endpoint.MakeHttpUrl(path), std::move(body)});
	} catch (...) {
		operation->Postpone(ToApiError(std::current_exception()));
	}

	return operation;
}

std::unique_ptr<ApiRequest>
DeviceClient::Fail(ApiCommandHandler &handler, ApiError &&error) noexcept
{
	auto operation = std::make_unique<CommandOperation>(GetEventLoop(), handler);
	operation->Postpone(std::make_exception_ptr(std::move(error)));
	return operation;
}

std::unique_ptr<ApiRequest>
DeviceClient::FetchState(DeviceStateHandler &handler) noexcept
{
	return Start<StateOperation>(handler, HttpMethod::GET,
				     "/api/audio/state"sv);
}

std::unique_ptr<ApiRequest>
DeviceClient::ChangeSource(std::string_view source_id,
			   ApiCommandHandler &handler) noexcept
{
	if (!IsValidIdentifier(source_id)) {
		return Fail(handler,
			    ApiError(ApiError::Kind::INVALID_TARGET,
				     fmt::format("Invalid source id \"{}\"",
						 source_id)));
	}

	return Start<CommandOperation>(handler, HttpMethod::POST,
				       fmt::format("/api/audio/source/{}",
						   source_id));
}

std::unique_ptr<ApiRequest>
DeviceClient::SetMultiroom(bool enabled, ApiCommandHandler &handler) noexcept
{
	return Start<CommandOperation>(handler, HttpMethod::POST,
				       enabled
				       ? "/api/routing/multiroom/true"sv
				       : "/api/routing/multiroom/false"sv);
}

std::unique_ptr<ApiRequest>
DeviceClient::SetEqualizer(bool enabled, ApiCommandHandler &handler) noexcept
{
	return Start<CommandOperation>(handler, HttpMethod::POST,
				       enabled
				       ? "/api/routing/equalizer/true"sv
				       : "/api/routing/equalizer/false"sv);
}

std::unique_ptr<ApiRequest>
DeviceClient::FetchVolume(VolumeStatusHandler &handler) noexcept
{
	return Start<VolumeOperation>(handler, HttpMethod::GET,
				      "/api/volume/status"sv);
}

std::unique_ptr<ApiRequest>
DeviceClient::SetVolume(double volume_db, ApiCommandHandler &handler) noexcept
{
	const nlohmann::json body{
		{"volume_db", volume_db},
		{"show_bar", false},
	};

	return Start<CommandOperation>(handler, HttpMethod::POST,
				       "/api/volume/set"sv, body.dump());
}

std::unique_ptr<ApiRequest>
DeviceClient::AdjustVolume(double delta_db, ApiCommandHandler &handler) noexcept
{
	const nlohmann::json body{
		{"delta_db", delta_db},
		{"show_bar", false},
	};

	return Start<CommandOperation>(handler, HttpMethod::POST,
				       "/api/volume/adjust"sv, body.dump());
}

std::unique_ptr<ApiRequest>
DeviceClient::FetchFavoriteStations(StationListHandler &handler) noexcept
{
	return Start<StationsOperation>(handler, HttpMethod::GET,
					"/api/radio/stations?favorites_only=true"sv);
}

std::unique_ptr<ApiRequest>
DeviceClient::PlayStation(std::string_view station_id,
			  ApiCommandHandler &handler) noexcept
{
	if (station_id.empty()) {
		return Fail(handler,
			    ApiError(ApiError::Kind::INVALID_TARGET,
				     "Empty station id"));
	}

	const nlohmann::json body{
		{"station_id", station_id},
	};

	return Start<CommandOperation>(handler, HttpMethod::POST,
				       "/api/radio/play"sv, body.dump());
}

std::unique_ptr<ApiRequest>
DeviceClient::StopRadio(ApiCommandHandler &handler) noexcept
{
	return Start<CommandOperation>(handler, HttpMethod::POST,
				       "/api/radio/stop"sv);
}

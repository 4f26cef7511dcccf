// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_API_CLIENT_HXX
#define MILO_API_CLIENT_HXX

#include "Transport.hxx"
#include "device/State.hxx"
#include "device/Volume.hxx"
#include "device/Station.hxx"

#include <exception>
#include <memory>
#include <string_view>

class ApiError;
class DeviceEndpoint;

class DeviceStateHandler {
public:
	virtual void OnDeviceState(DeviceState &&state) noexcept = 0;
	virtual void OnDeviceStateError(std::exception_ptr error) noexcept = 0;
};

class VolumeStatusHandler {
public:
	virtual void OnVolumeStatus(const VolumeState &volume) noexcept = 0;
	virtual void OnVolumeStatusError(std::exception_ptr error) noexcept = 0;
};

class StationListHandler {
public:
	virtual void OnStationList(RadioStationList &&stations) noexcept = 0;
	virtual void OnStationListError(std::exception_ptr error) noexcept = 0;
};

/**
 * Handler for requests which have no response body of interest.
 */
class ApiCommandHandler {
public:
	virtual void OnApiCommandDone() noexcept = 0;
	virtual void OnApiCommandError(std::exception_ptr error) noexcept = 0;
};

/**
 * Typed access to the appliance's HTTP API.  Each method returns the
 * pending operation; destroying it cancels the request.  Failures
 * (even those detected before anything was sent) are always
 * delivered asynchronously to the handler as an #ApiError.
 *
 * There are no retries.
 */
class DeviceClient {
	ApiTransport &transport;
	const DeviceEndpoint &endpoint;

public:
	DeviceClient(ApiTransport &_transport,
		     const DeviceEndpoint &_endpoint) noexcept
		:transport(_transport), endpoint(_endpoint) {}

	DeviceClient(const DeviceClient &) = delete;
	DeviceClient &operator=(const DeviceClient &) = delete;

	EventLoop &GetEventLoop() const noexcept {
		return transport.GetEventLoop();
	}

	const DeviceEndpoint &GetEndpoint() const noexcept {
		return endpoint;
	}

	/**
	 * Abort all requests and discard pooled connections.
	 */
	void Reset() noexcept {
		transport.Reset();
	}

	std::unique_ptr<ApiRequest> FetchState(DeviceStateHandler &handler) noexcept;

	std::unique_ptr<ApiRequest> ChangeSource(std::string_view source_id,
						 ApiCommandHandler &handler) noexcept;

	std::unique_ptr<ApiRequest> SetMultiroom(bool enabled,
						 ApiCommandHandler &handler) noexcept;

	std::unique_ptr<ApiRequest> SetEqualizer(bool enabled,
						 ApiCommandHandler &handler) noexcept;

	std::unique_ptr<ApiRequest> FetchVolume(VolumeStatusHandler &handler) noexcept;

	std::unique_ptr<ApiRequest> SetVolume(double volume_db,
					       ApiCommandHandler &handler) noexcept;

	std::unique_ptr<ApiRequest> AdjustVolume(double delta_db,
						 ApiCommandHandler &handler) noexcept;

	std::unique_ptr<ApiRequest> FetchFavoriteStations(StationListHandler &handler) noexcept;

	std::unique_ptr<ApiRequest> PlayStation(std::string_view station_id,
						ApiCommandHandler &handler) noexcept;

	std::unique_ptr<ApiRequest> StopRadio(ApiCommandHandler &handler) noexcept;

private:
	class Operation;
	class StateOperation;
	class VolumeOperation;
	class StationsOperation;
	class CommandOperation;

	template<typename O, typename H>
	std::unique_ptr<ApiRequest> Start(H &handler, HttpMethod method,
					  std::string_view path,
					  std::string &&body={}) noexcept;

	std::unique_ptr<ApiRequest> Fail(ApiCommandHandler &handler,
					 ApiError &&error) noexcept;
};

#endif

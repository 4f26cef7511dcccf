// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

/*
 * Send one request to the appliance's HTTP API and print the result.
 */

#include "ShutdownHandler.hxx"
#include "api/Client.hxx"
#include "api/CurlTransport.hxx"
#include "api/Endpoint.hxx"
#include "config/Parser.hxx"
#include "event/Loop.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

#include <cstdlib>
#include <memory>
#include <string_view>

using std::string_view_literals::operator""sv;

class PrintHandler final
	: public DeviceStateHandler, public VolumeStatusHandler,
	  public StationListHandler, public ApiCommandHandler
{
	EventLoop &event_loop;

	std::exception_ptr error;

public:
	explicit PrintHandler(EventLoop &_event_loop) noexcept
		:event_loop(_event_loop) {}

	void Finish() {
		if (error)
			std::rethrow_exception(error);
	}

private:
	void Done(std::exception_ptr e=nullptr) noexcept {
		error = std::move(e);
		event_loop.Break();
	}

	/* virtual methods from DeviceStateHandler */
	void OnDeviceState(DeviceState &&state) noexcept override {
		fmt::print("active_source: {}\n"
			   "plugin_state: {}\n"
			   "target_source: {}\n"
			   "multiroom: {}\n"
			   "equalizer: {}\n"
			   "metadata: {}\n",
			   state.active_source, state.plugin_state,
			   state.target_source.value_or("-"),
			   state.multiroom_enabled, state.equalizer_enabled,
			   state.metadata.dump());
		Done();
	}

	void OnDeviceStateError(std::exception_ptr e) noexcept override {
		Done(std::move(e));
	}

	/* virtual methods from VolumeStatusHandler */
	void OnVolumeStatus(const VolumeState &volume) noexcept override {
		fmt::print("volume: {} dB (limits {}..{}, step {})\n"
			   "multiroom: {}\n",
			   volume.volume_db,
			   volume.limit_min_db, volume.limit_max_db,
			   volume.step_db, volume.multiroom_enabled);
		Done();
	}

	void OnVolumeStatusError(std::exception_ptr e) noexcept override {
		Done(std::move(e));
	}

	/* virtual methods from StationListHandler */
	void OnStationList(RadioStationList &&stations) noexcept override {
		for (const auto &i : stations)
			fmt::print("{}\t{}\n", i.id, i.name);
		Done();
	}

	void OnStationListError(std::exception_ptr e) noexcept override {
		Done(std::move(e));
	}

	/* virtual methods from ApiCommandHandler */
	void OnApiCommandDone() noexcept override {
		fmt::print("ok\n");
		Done();
	}

	void OnApiCommandError(std::exception_ptr e) noexcept override {
		Done(std::move(e));
	}
};

static std::unique_ptr<ApiRequest>
StartCommand(DeviceClient &client, PrintHandler &handler,
	     std::string_view command, const char *arg)
{
	if (command == "state"sv)
		return client.FetchState(handler);
	else if (command == "volume"sv)
		return client.FetchVolume(handler);
	else if (command == "stations"sv)
		return client.FetchFavoriteStations(handler);
	else if (command == "stop-radio"sv)
		return client.StopRadio(handler);

	if (arg == nullptr)
		throw std::runtime_error("Argument missing");

	if (command == "source"sv)
		return client.ChangeSource(arg, handler);
	else if (command == "multiroom"sv)
		return client.SetMultiroom(ParseBool(arg), handler);
	else if (command == "equalizer"sv)
		return client.SetEqualizer(ParseBool(arg), handler);
	else if (command == "set-volume"sv)
		return client.SetVolume(std::strtod(arg, nullptr), handler);
	else if (command == "adjust-volume"sv)
		return client.AdjustVolume(std::strtod(arg, nullptr), handler);
	else if (command == "play"sv)
		return client.PlayStation(arg, handler);
	else
		throw std::runtime_error("Unknown command");
}

int
main(int argc, char **argv) noexcept
try {
	if (argc < 3 || argc > 4) {
		fmt::print(stderr, "Usage: RunDeviceApi HOST COMMAND [ARG]\n"
			   "\n"
			   "Commands: state volume stations stop-radio\n"
			   "          source ID, multiroom BOOL, equalizer BOOL,\n"
			   "          set-volume DB, adjust-volume DB, play ID\n");
		return EXIT_FAILURE;
	}

	EventLoop event_loop;
	const ShutdownHandler shutdown_handler(event_loop);

	CurlTransport transport(event_loop);
	const DeviceEndpoint endpoint(argv[1], 80, 8000);
	DeviceClient client(transport, endpoint);

	PrintHandler handler(event_loop);
	auto request = StartCommand(client, handler, argv[2],
				    argc > 3 ? argv[3] : nullptr);

	event_loop.Run();

	request.reset();
	handler.Finish();

	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}

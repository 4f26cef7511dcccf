// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "FakeTransport.hxx"
#include "LoopRunner.hxx"
#include "api/Client.hxx"
#include "api/Endpoint.hxx"
#include "event/Loop.hxx"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <optional>

namespace {

struct RecordingHandler final
	: DeviceStateHandler, VolumeStatusHandler,
	  StationListHandler, ApiCommandHandler
{
	std::optional<DeviceState> state;
	std::optional<VolumeState> volume;
	std::optional<RadioStationList> stations;
	unsigned n_done = 0;
	std::exception_ptr error;

	void OnDeviceState(DeviceState &&_state) noexcept override {
		state = std::move(_state);
	}

	void OnDeviceStateError(std::exception_ptr e) noexcept override {
		error = std::move(e);
	}

	void OnVolumeStatus(const VolumeState &_volume) noexcept override {
		volume = _volume;
	}

	void OnVolumeStatusError(std::exception_ptr e) noexcept override {
		error = std::move(e);
	}

	void OnStationList(RadioStationList &&_stations) noexcept override {
		stations = std::move(_stations);
	}

	void OnStationListError(std::exception_ptr e) noexcept override {
		error = std::move(e);
	}

	void OnApiCommandDone() noexcept override {
		++n_done;
	}

	void OnApiCommandError(std::exception_ptr e) noexcept override {
		error = std::move(e);
	}
};

class DeviceClientTest : public ::testing::Test {
protected:
	EventLoop loop;
	FakeTransport transport{loop};
	DeviceEndpoint endpoint{"milo.local", 80, 8000};
	DeviceClient client{transport, endpoint};
	RecordingHandler handler;
};

} // anonymous namespace

TEST_F(DeviceClientTest, FetchState)
{
	auto request = client.FetchState(handler);
	ASSERT_EQ(transport.sent.size(), 1u);
	EXPECT_EQ(transport.sent[0].method, HttpMethod::GET);
	EXPECT_EQ(transport.sent[0].url, "http://milo.local:80/api/audio/state");
	EXPECT_TRUE(transport.sent[0].body.empty());

	transport.Respond(R"({"active_source":"spotify","plugin_state":"ready",)"
			  R"("transitioning":false,"multiroom_enabled":true,)"
			  R"("equalizer_enabled":false,"metadata":{"title":"x"}})");

	ASSERT_TRUE(handler.state);
	EXPECT_EQ(handler.state->active_source, "spotify");
	EXPECT_EQ(handler.state->plugin_state, "ready");
	EXPECT_FALSE(handler.state->IsTransitioning());
	EXPECT_TRUE(handler.state->multiroom_enabled);
	EXPECT_EQ(handler.state->metadata["title"], "x");
	EXPECT_FALSE(handler.error);
}

TEST_F(DeviceClientTest, UsesResolvedAddress)
{
	endpoint.SetAddress("10.0.0.7");
	auto request = client.StopRadio(handler);
	ASSERT_EQ(transport.sent.size(), 1u);
	EXPECT_EQ(transport.sent[0].method, HttpMethod::POST);
	EXPECT_EQ(transport.sent[0].url, "http://10.0.0.7:80/api/radio/stop");
}

TEST_F(DeviceClientTest, Commands)
{
	std::unique_ptr<ApiRequest> requests[] = {
		client.ChangeSource("bluetooth", handler),
		client.SetMultiroom(true, handler),
		client.SetEqualizer(false, handler),
		client.SetVolume(-30.5, handler),
		client.AdjustVolume(3, handler),
		client.PlayStation("s42", handler),
	};

	ASSERT_EQ(transport.sent.size(), 6u);
	EXPECT_EQ(transport.sent[0].url, "http://milo.local:80/api/audio/source/bluetooth");
	EXPECT_EQ(transport.sent[1].url, "http://milo.local:80/api/routing/multiroom/true");
	EXPECT_EQ(transport.sent[2].url, "http://milo.local:80/api/routing/equalizer/false");
	EXPECT_EQ(transport.sent[3].url, "http://milo.local:80/api/volume/set");
	EXPECT_EQ(transport.sent[4].url, "http://milo.local:80/api/volume/adjust");
	EXPECT_EQ(transport.sent[5].url, "http://milo.local:80/api/radio/play");

	for (const auto &i : transport.sent)
		EXPECT_EQ(i.method, HttpMethod::POST);

	const auto set = nlohmann::json::parse(transport.sent[3].body);
	EXPECT_EQ(set["volume_db"], -30.5);
	EXPECT_EQ(set["show_bar"], false);

	const auto adjust = nlohmann::json::parse(transport.sent[4].body);
	EXPECT_EQ(adjust["delta_db"], 3.0);
	EXPECT_EQ(adjust["show_bar"], false);

	const auto play = nlohmann::json::parse(transport.sent[5].body);
	EXPECT_EQ(play["station_id"], "s42");

	while (transport.HasPending())
		transport.Respond("{}");

	EXPECT_EQ(handler.n_done, 6u);
	EXPECT_FALSE(handler.error);
}

TEST_F(DeviceClientTest, FetchVolume)
{
	auto request = client.FetchVolume(handler);
	EXPECT_EQ(transport.GetPendingCall().url, "http://milo.local:80/api/volume/status");

	transport.Respond(R"({"data":{"volume_db":-42.5,"multiroom_enabled":true,)"
			  R"("dsp_available":false,"config":{"limit_min_db":-70,)"
			  R"("limit_max_db":-10,"step_mobile_db":2}}})");

	ASSERT_TRUE(handler.volume);
	EXPECT_DOUBLE_EQ(handler.volume->volume_db, -42.5);
	EXPECT_TRUE(handler.volume->multiroom_enabled);
	EXPECT_FALSE(handler.volume->dsp_available);
	EXPECT_DOUBLE_EQ(handler.volume->limit_min_db, -70);
	EXPECT_DOUBLE_EQ(handler.volume->limit_max_db, -10);
	EXPECT_DOUBLE_EQ(handler.volume->step_db, 2);
}

TEST_F(DeviceClientTest, FetchFavoriteStations)
{
	auto request = client.FetchFavoriteStations(handler);
	EXPECT_EQ(transport.GetPendingCall().url,
		  "http://milo.local:80/api/radio/stations?favorites_only=true");

	transport.Respond(R"({"stations":[{"id":"a1","name":"FIP","country":"FR"},)"
			  R"({"id":7,"name":"Nova"}]})");

	ASSERT_TRUE(handler.stations);
	ASSERT_EQ(handler.stations->size(), 2u);
	EXPECT_EQ((*handler.stations)[0].id, "a1");
	EXPECT_EQ((*handler.stations)[0].name, "FIP");
	EXPECT_EQ((*handler.stations)[0].extra["country"], "FR");
	EXPECT_EQ((*handler.stations)[1].id, "7");
}

TEST_F(DeviceClientTest, MalformedResponse)
{
	auto request = client.FetchState(handler);
	transport.Respond("not json");

	EXPECT_FALSE(handler.state);
	ASSERT_TRUE(handler.error);
	EXPECT_EQ(GetApiErrorKind(handler.error), ApiError::Kind::MALFORMED_RESPONSE);
}

TEST_F(DeviceClientTest, TransportError)
{
	auto request = client.FetchVolume(handler);
	transport.Fail();

	ASSERT_TRUE(handler.error);
	EXPECT_EQ(GetApiErrorKind(handler.error), ApiError::Kind::TRANSPORT);
}

TEST_F(DeviceClientTest, InvalidSourceIsReportedAsynchronously)
{
	auto request = client.ChangeSource("../etc", handler);

	/* nothing was sent, and the handler was not invoked yet */
	EXPECT_TRUE(transport.sent.empty());
	EXPECT_FALSE(handler.error);

	LoopRunner runner(loop);
	ASSERT_TRUE(runner.RunUntil([this]{ return handler.error != nullptr; }));
	EXPECT_EQ(GetApiErrorKind(handler.error), ApiError::Kind::INVALID_TARGET);
	EXPECT_EQ(handler.n_done, 0u);
}

TEST_F(DeviceClientTest, EmptyStationId)
{
	auto request = client.PlayStation("", handler);
	EXPECT_TRUE(transport.sent.empty());

	LoopRunner runner(loop);
	ASSERT_TRUE(runner.RunUntil([this]{ return handler.error != nullptr; }));
	EXPECT_EQ(GetApiErrorKind(handler.error), ApiError::Kind::INVALID_TARGET);
}

TEST_F(DeviceClientTest, InvalidHost)
{
	endpoint.SetAddress("not a host");
	auto request = client.FetchState(handler);
	EXPECT_TRUE(transport.sent.empty());

	LoopRunner runner(loop);
	ASSERT_TRUE(runner.RunUntil([this]{ return handler.error != nullptr; }));
	EXPECT_EQ(GetApiErrorKind(handler.error), ApiError::Kind::INVALID_TARGET);
}

TEST_F(DeviceClientTest, SendFailure)
{
	transport.fail_send = true;
	auto request = client.FetchState(handler);

	LoopRunner runner(loop);
	ASSERT_TRUE(runner.RunUntil([this]{ return handler.error != nullptr; }));
	EXPECT_EQ(GetApiErrorKind(handler.error), ApiError::Kind::TRANSPORT);
}

TEST_F(DeviceClientTest, Cancel)
{
	auto request = client.FetchState(handler);
	EXPECT_EQ(transport.GetPendingCount(), 1u);

	request.reset();
	EXPECT_EQ(transport.GetPendingCount(), 0u);
	EXPECT_EQ(transport.n_canceled, 1u);
	EXPECT_FALSE(handler.state);
	EXPECT_FALSE(handler.error);
}

TEST_F(DeviceClientTest, Reset)
{
	auto a = client.FetchState(handler);
	auto b = client.FetchVolume(handler);

	client.Reset();
	EXPECT_EQ(transport.n_resets, 1u);
	EXPECT_EQ(transport.GetPendingCount(), 0u);
	ASSERT_TRUE(handler.error);
	EXPECT_EQ(GetApiErrorKind(handler.error), ApiError::Kind::TRANSPORT);
}

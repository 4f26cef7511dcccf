// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "FakeConnector.hxx"
#include "stream/ControlStream.hxx"
#include "device/State.hxx"
#include "device/Volume.hxx"
#include "event/Loop.hxx"
#include "LoopRunner.hxx"

#include <gtest/gtest.h>

#include <vector>

using std::chrono_literals::operator""ms;
using std::chrono_literals::operator""s;

namespace {

struct RecordingStreamHandler final : ControlStreamHandler {
	unsigned n_connected = 0, n_disconnected = 0;
	unsigned n_reconnecting = 0, n_gave_up = 0;

	std::vector<DeviceState> states;
	std::vector<VolumeUpdate> volumes;

	/**
	 * If set, Stop() is called from OnStreamConnected().
	 */
	ControlStream *stop_on_connect = nullptr;

	void OnStreamConnected() noexcept override {
		++n_connected;

		if (stop_on_connect != nullptr)
			stop_on_connect->Stop();
	}

	void OnStreamDisconnected(std::exception_ptr) noexcept override {
		++n_disconnected;
	}

	void OnStreamReconnecting() noexcept override {
		++n_reconnecting;
	}

	void OnStreamGaveUp() noexcept override {
		++n_gave_up;
	}

	void OnStreamState(DeviceState &&state) noexcept override {
		states.emplace_back(std::move(state));
	}

	void OnStreamVolume(const VolumeUpdate &update) noexcept override {
		volumes.push_back(update);
	}
};

ControlStreamConfig
MakeTestConfig() noexcept
{
	ControlStreamConfig config;
	config.ping_interval = 100ms;
	config.reconnect.short_connection = 50ms;
	config.reconnect.min_attempt_interval = Event::Duration::zero();
	config.reconnect.delay_base = 10ms;
	config.reconnect.delay_step = 10ms;
	config.reconnect.max_delay = 50ms;
	return config;
}

class ControlStreamTest : public ::testing::Test {
protected:
	EventLoop loop;
	FakeConnector connector;
	RecordingStreamHandler handler;
	LoopRunner runner{loop};
};

} // anonymous namespace

static constexpr const char *state_frame =
	R"({"category":"plugin","type":"state_changed",)"
	R"("data":{"full_state":{"active_source":"librespot",)"
	R"("plugin_state":"connected","metadata":{"title":"Song"}}}})";

static constexpr const char *volume_frame =
	R"({"category":"volume","type":"volume_changed",)"
	R"("data":{"volume_db":-40,"multiroom_enabled":false,"step_mobile_db":3}})";

TEST_F(ControlStreamTest, Open)
{
	ControlStream stream(loop, connector, handler, MakeTestConfig());

	stream.Start("192.168.1.20", 8000);
	EXPECT_TRUE(stream.IsRunning());
	EXPECT_TRUE(stream.IsConnecting());
	EXPECT_FALSE(stream.IsConnected());
	EXPECT_EQ(connector.n_connects, 1U);
	EXPECT_EQ(connector.host, "192.168.1.20");
	EXPECT_EQ(connector.port, 8000U);
	ASSERT_NE(connector.channel, nullptr);

	EXPECT_TRUE(connector.channel->Open());
	EXPECT_EQ(handler.n_connected, 1U);
	EXPECT_TRUE(stream.IsConnected());
	EXPECT_FALSE(stream.IsConnecting());
	EXPECT_EQ(stream.GetPolicy().GetAttempts(), 0U);
}

TEST_F(ControlStreamTest, Messages)
{
	ControlStream stream(loop, connector, handler, MakeTestConfig());
	stream.Start("192.168.1.20", 8000);
	ASSERT_NE(connector.channel, nullptr);

	/* not open yet: dropped */
	EXPECT_TRUE(connector.channel->Message(state_frame));
	EXPECT_TRUE(handler.states.empty());

	connector.channel->Open();

	EXPECT_TRUE(connector.channel->Message(state_frame));
	ASSERT_EQ(handler.states.size(), 1U);
	EXPECT_EQ(handler.states.front().active_source, "librespot");
	EXPECT_EQ(handler.states.front().plugin_state, "connected");
	EXPECT_EQ(handler.states.front().metadata["title"], "Song");

	EXPECT_TRUE(connector.channel->Message(volume_frame));
	ASSERT_EQ(handler.volumes.size(), 1U);
	EXPECT_EQ(handler.volumes.front().volume_db, -40);
	EXPECT_EQ(handler.volumes.front().step_db, 3);

	/* keepalive, unknown and malformed frames are ignored */
	EXPECT_TRUE(connector.channel->Message(R"({"category":"system","type":"ping","data":{}})"));
	EXPECT_TRUE(connector.channel->Message(R"({"category":"foo","type":"bar","data":{}})"));
	EXPECT_TRUE(connector.channel->Message("{not json"));
	EXPECT_EQ(handler.states.size(), 1U);
	EXPECT_EQ(handler.volumes.size(), 1U);
	EXPECT_TRUE(stream.IsConnected());
}

TEST_F(ControlStreamTest, FailureSchedulesReconnect)
{
	ControlStream stream(loop, connector, handler, MakeTestConfig());
	stream.Start("192.168.1.20", 8000);
	connector.channel->Open();

	/* closed immediately after opening: counts twice */
	connector.channel->Close();
	EXPECT_EQ(connector.channel, nullptr);
	EXPECT_EQ(handler.n_disconnected, 1U);
	EXPECT_FALSE(stream.IsConnected());
	EXPECT_TRUE(stream.IsRunning());
	EXPECT_TRUE(stream.IsReconnectPending());
	EXPECT_EQ(stream.GetPolicy().GetAttempts(), 2U);

	ASSERT_TRUE(runner.RunUntil([this]{ return connector.n_connects == 2; }));
	EXPECT_EQ(handler.n_reconnecting, 1U);
	EXPECT_EQ(connector.host, "192.168.1.20");

	ASSERT_NE(connector.channel, nullptr);
	connector.channel->Open();
	EXPECT_EQ(handler.n_connected, 2U);

	/* the counter is reset only after the connection has
	   survived the short connection window */
	EXPECT_EQ(stream.GetPolicy().GetAttempts(), 2U);
	ASSERT_TRUE(runner.RunUntil([&stream]{ return stream.GetPolicy().GetAttempts() == 0; }));
	EXPECT_TRUE(stream.IsConnected());
}

TEST_F(ControlStreamTest, FlappingGivesUp)
{
	ControlStream stream(loop, connector, handler, MakeTestConfig());
	stream.Start("192.168.1.20", 8000);

	for (unsigned i = 0; i < 16 && handler.n_gave_up == 0; ++i) {
		ASSERT_TRUE(runner.RunUntil([this]{ return connector.channel != nullptr; }));
		connector.channel->Open();
		connector.channel->Close();
	}

	/* each short-lived connection counts twice: the 8th one
	   reaches the limit of 15 */
	EXPECT_EQ(handler.n_gave_up, 1U);
	EXPECT_EQ(handler.n_connected, 8U);
	EXPECT_EQ(handler.n_disconnected, 7U);
	EXPECT_EQ(stream.GetPolicy().GetAttempts(), 16U);
	EXPECT_FALSE(stream.IsRunning());
	EXPECT_FALSE(stream.IsReconnectPending());
}

TEST_F(ControlStreamTest, RestartKeepsBackoff)
{
	ControlStream stream(loop, connector, handler, MakeTestConfig());
	stream.Start("192.168.1.20", 8000);

	const auto failed = loop.SteadyNow();
	connector.channel->Close();
	EXPECT_EQ(stream.GetPolicy().GetAttempts(), 2U);
	EXPECT_EQ(stream.GetLastDelay(), 30ms);

	stream.Stop();
	EXPECT_FALSE(stream.IsReconnectPending());

	/* the restarted stream waits for the rest of the delay */
	stream.Start("192.168.1.20", 8000);
	EXPECT_EQ(connector.n_connects, 1U);
	EXPECT_TRUE(stream.IsReconnectPending());
	EXPECT_EQ(stream.GetPolicy().GetAttempts(), 2U);

	ASSERT_TRUE(runner.RunUntil([this]{ return connector.n_connects == 2; }));
	EXPECT_GE(Event::Clock::now() - failed, 30ms);

	/* ResetPolicy() forgets the backoff */
	connector.channel->Close();
	stream.Stop();
	stream.ResetPolicy();
	stream.Start("192.168.1.20", 8000);
	EXPECT_EQ(connector.n_connects, 3U);
	EXPECT_EQ(stream.GetPolicy().GetAttempts(), 0U);
}

TEST_F(ControlStreamTest, ConnectFailure)
{
	ControlStream stream(loop, connector, handler, MakeTestConfig());

	connector.fail_connect = true;
	stream.Start("192.168.1.20", 8000);

	EXPECT_EQ(handler.n_disconnected, 1U);
	EXPECT_TRUE(stream.IsReconnectPending());
	EXPECT_FALSE(stream.IsConnecting());

	connector.fail_connect = false;
	ASSERT_TRUE(runner.RunUntil([this]{ return connector.channel != nullptr; }));
	EXPECT_EQ(connector.n_connects, 2U);
}

TEST_F(ControlStreamTest, GiveUp)
{
	auto config = MakeTestConfig();
	config.reconnect.max_attempts = 4;
	ControlStream stream(loop, connector, handler, config);

	connector.fail_connect = true;
	stream.Start("192.168.1.20", 8000);
	EXPECT_EQ(stream.GetPolicy().GetAttempts(), 2U);

	ASSERT_TRUE(runner.RunUntil([this]{ return handler.n_gave_up > 0; }));
	EXPECT_EQ(handler.n_gave_up, 1U);
	EXPECT_EQ(handler.n_disconnected, 1U);
	EXPECT_EQ(connector.n_connects, 2U);
	EXPECT_FALSE(stream.IsRunning());
	EXPECT_FALSE(stream.IsReconnectPending());
	EXPECT_TRUE(stream.GetPolicy().HasGivenUp());

	/* nothing happens after giving up */
	runner.RunFor(100ms);
	EXPECT_EQ(connector.n_connects, 2U);

	/* a fresh start resets the counter */
	connector.fail_connect = false;
	stream.Start("192.168.1.21", 8000);
	EXPECT_EQ(connector.n_connects, 3U);
	EXPECT_FALSE(stream.GetPolicy().HasGivenUp());
	EXPECT_EQ(stream.GetPolicy().GetAttempts(), 0U);
}

TEST_F(ControlStreamTest, ForceReconnect)
{
	ControlStream stream(loop, connector, handler, MakeTestConfig());

	/* ignored when not running */
	stream.ForceReconnect();
	EXPECT_EQ(connector.n_connects, 0U);

	stream.Start("192.168.1.20", 8000);

	/* ignored while connecting */
	stream.ForceReconnect();
	EXPECT_EQ(connector.n_connects, 1U);

	connector.channel->Close();
	EXPECT_EQ(stream.GetPolicy().GetAttempts(), 2U);

	/* reconnect now instead of waiting for the timer */
	stream.ForceReconnect();
	EXPECT_EQ(connector.n_connects, 2U);
	EXPECT_FALSE(stream.IsReconnectPending());
	EXPECT_EQ(stream.GetPolicy().GetAttempts(), 0U);

	connector.channel->Open();
	ASSERT_TRUE(stream.IsConnected());

	const unsigned destroyed = connector.n_destroyed;
	stream.ForceReconnect();
	EXPECT_EQ(connector.n_destroyed, destroyed + 1);
	EXPECT_EQ(connector.n_connects, 3U);
	EXPECT_TRUE(stream.IsConnecting());

	/* a forced reconnect does not report a failure */
	EXPECT_EQ(handler.n_disconnected, 1U);
}

TEST_F(ControlStreamTest, Throttle)
{
	auto config = MakeTestConfig();
	config.reconnect.min_attempt_interval = 200ms;
	ControlStream stream(loop, connector, handler, config);

	const auto start = Event::Clock::now();
	stream.Start("192.168.1.20", 8000);
	connector.channel->Close();

	ASSERT_TRUE(runner.RunUntil([this]{ return connector.n_connects == 2; }));

	/* the reconnect delay is 30 ms, but the throttle wins */
	EXPECT_GE(Event::Clock::now() - start, 150ms);
}

TEST_F(ControlStreamTest, Ping)
{
	auto config = MakeTestConfig();
	config.reconnect.delay_base = 10s;
	config.reconnect.max_delay = 10s;
	ControlStream stream(loop, connector, handler, config);
	stream.Start("192.168.1.20", 8000);
	connector.channel->Open();

	ASSERT_TRUE(runner.RunUntil([this]{ return connector.channel->n_pings == 1; }));

	/* the pong keeps the connection alive */
	EXPECT_TRUE(connector.channel->Pong());
	ASSERT_TRUE(runner.RunUntil([this]{ return connector.channel->n_pings == 2; }));
	EXPECT_EQ(handler.n_disconnected, 0U);

	/* no reply to the second ping */
	ASSERT_TRUE(runner.RunUntil([this]{ return handler.n_disconnected == 1; }));
	EXPECT_FALSE(stream.IsConnected());
	EXPECT_TRUE(stream.IsReconnectPending());
}

TEST_F(ControlStreamTest, PingFailure)
{
	auto config = MakeTestConfig();
	config.reconnect.delay_base = 10s;
	config.reconnect.max_delay = 10s;
	ControlStream stream(loop, connector, handler, config);
	stream.Start("192.168.1.20", 8000);
	connector.channel->Open();
	connector.channel->fail_ping = true;

	ASSERT_TRUE(runner.RunUntil([this]{ return handler.n_disconnected == 1; }));
	EXPECT_EQ(connector.channel, nullptr);
}

TEST_F(ControlStreamTest, Stop)
{
	ControlStream stream(loop, connector, handler, MakeTestConfig());
	stream.Start("192.168.1.20", 8000);
	connector.channel->Open();

	stream.Stop();
	EXPECT_EQ(connector.channel, nullptr);
	EXPECT_FALSE(stream.IsRunning());
	EXPECT_FALSE(stream.IsConnected());

	stream.Stop();

	runner.RunFor(200ms);
	EXPECT_EQ(connector.n_connects, 1U);
	EXPECT_EQ(handler.n_disconnected, 0U);
}

TEST_F(ControlStreamTest, StopFromHandler)
{
	ControlStream stream(loop, connector, handler, MakeTestConfig());
	handler.stop_on_connect = &stream;

	stream.Start("192.168.1.20", 8000);

	/* the channel has been destroyed by the handler */
	EXPECT_FALSE(connector.channel->Open());
	EXPECT_EQ(connector.channel, nullptr);
	EXPECT_FALSE(stream.IsRunning());
}

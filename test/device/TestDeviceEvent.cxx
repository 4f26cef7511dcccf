// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "device/Event.hxx"

#include <gtest/gtest.h>

TEST(DeviceEvent, StateChanged)
{
	const auto event = ParseDeviceEvent(R"({"category":"system","type":"state_changed",)"
					    R"("data":{"full_state":{"active_source":"librespot",)"
					    R"("plugin_state":"connected","multiroom_enabled":true}}})");

	const auto *state = std::get_if<DeviceState>(&event);
	ASSERT_NE(state, nullptr);
	EXPECT_EQ(state->active_source, "librespot");
	EXPECT_EQ(state->plugin_state, "connected");
	EXPECT_TRUE(state->multiroom_enabled);
	EXPECT_FALSE(state->IsTransitioning());
}

TEST(DeviceEvent, PluginStateDefaultsToReady)
{
	const auto event = ParseDeviceEvent(R"({"category":"plugin","type":"state_changed",)"
					    R"("data":{"full_state":{"active_source":"bluetooth"}}})");

	const auto *state = std::get_if<DeviceState>(&event);
	ASSERT_NE(state, nullptr);
	EXPECT_EQ(state->plugin_state, "ready");
}

TEST(DeviceEvent, Transition)
{
	auto event = ParseDeviceEvent(R"({"category":"system","type":"transition_start",)"
				      R"("data":{"full_state":{"active_source":"none",)"
				      R"("transitioning":true,"target_source":"roc"}}})");
	auto *state = std::get_if<DeviceState>(&event);
	ASSERT_NE(state, nullptr);
	EXPECT_TRUE(state->IsSourceLoading("roc"));

	event = ParseDeviceEvent(R"({"category":"system","type":"transition_complete",)"
				 R"("data":{"full_state":{"active_source":"roc",)"
				 R"("transitioning":true,"target_source":null}}})");
	state = std::get_if<DeviceState>(&event);
	ASSERT_NE(state, nullptr);
	EXPECT_EQ(state->active_source, "roc");
	EXPECT_FALSE(state->IsTransitioning());
}

TEST(DeviceEvent, VolumeChanged)
{
	const auto event = ParseDeviceEvent(R"({"category":"volume","type":"volume_changed",)"
					    R"("data":{"volume_db":-28.5,"multiroom_enabled":true,)"
					    R"("step_mobile_db":2}})");

	const auto *volume = std::get_if<VolumeUpdate>(&event);
	ASSERT_NE(volume, nullptr);
	EXPECT_EQ(volume->volume_db, -28.5);
	EXPECT_EQ(volume->multiroom_enabled, true);
	EXPECT_EQ(volume->step_db, 2);
}

TEST(DeviceEvent, VolumeChangedPartial)
{
	const auto event = ParseDeviceEvent(R"({"category":"volume","type":"volume_changed",)"
					    R"("data":{"volume_db":-40}})");

	const auto *volume = std::get_if<VolumeUpdate>(&event);
	ASSERT_NE(volume, nullptr);
	EXPECT_EQ(volume->volume_db, -40);
	EXPECT_FALSE(volume->multiroom_enabled.has_value());
	EXPECT_FALSE(volume->step_db.has_value());
}

TEST(DeviceEvent, Ignored)
{
	/* keepalive */
	EXPECT_TRUE(std::holds_alternative<std::monostate>(ParseDeviceEvent(R"({"category":"system","type":"ping","data":{}})")));

	/* unknown category or type */
	EXPECT_TRUE(std::holds_alternative<std::monostate>(ParseDeviceEvent(R"({"category":"radio","type":"state_changed","data":{}})")));
	EXPECT_TRUE(std::holds_alternative<std::monostate>(ParseDeviceEvent(R"({"category":"volume","type":"foo","data":{}})")));

	/* state event without snapshot */
	EXPECT_TRUE(std::holds_alternative<std::monostate>(ParseDeviceEvent(R"({"category":"system","type":"state_changed","data":{}})")));

	/* malformed */
	EXPECT_TRUE(std::holds_alternative<std::monostate>(ParseDeviceEvent("")));
	EXPECT_TRUE(std::holds_alternative<std::monostate>(ParseDeviceEvent("{")));
	EXPECT_TRUE(std::holds_alternative<std::monostate>(ParseDeviceEvent("[1,2]")));
	EXPECT_TRUE(std::holds_alternative<std::monostate>(ParseDeviceEvent(R"({"category":"system","type":"state_changed"})")));
	EXPECT_TRUE(std::holds_alternative<std::monostate>(ParseDeviceEvent(R"({"category":"system","type":"state_changed","data":{"full_state":7}})")));
	EXPECT_TRUE(std::holds_alternative<std::monostate>(ParseDeviceEvent(R"({"category":1,"type":"state_changed","data":{}})")));
}

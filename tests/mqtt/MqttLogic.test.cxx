// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include "bridge/EntityRegistry.hxx"
#include "mqtt/MQTTClient.hxx"
#include "mqtt/MQTTCommandProcess.hxx"

using namespace zenseMQTT;

namespace {
    const TopicLayout TOPICS{"zense", "homeassistant", "zb_"};

    struct HandlerFixture {
        EntityRegistry registry;
        MQTTCommandHandler handler{TOPICS, registry, true};

        HandlerFixture() { registry.loadStatic(R"({"1":"Hall","2":"Kitchen","A3":"Desk"})"); }
    };
}

static void test_mqtt_client_rejects_publish_before_init() {
    auto& client = MQTTClient::getInstance();
    TEST_ASSERT_TRUE(MqttStatus::DISCONNECTED == client.getStatus());
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, client.publish("zense/availability", "online", 1, true));
}

static void test_normalize_brightness() {
    TEST_ASSERT_EQUAL_UINT8(0, MQTTCommandHandler::normalizeBrightness("0").value());
    TEST_ASSERT_EQUAL_UINT8(40, MQTTCommandHandler::normalizeBrightness("40").value());
    TEST_ASSERT_EQUAL_UINT8(100, MQTTCommandHandler::normalizeBrightness("100").value());
    TEST_ASSERT_EQUAL_UINT8(51, MQTTCommandHandler::normalizeBrightness(" 50.6 ").value());
    // above 100 the value is taken as 0..255
    TEST_ASSERT_EQUAL_UINT8(50, MQTTCommandHandler::normalizeBrightness("128").value());
    TEST_ASSERT_EQUAL_UINT8(100, MQTTCommandHandler::normalizeBrightness("255").value());
    TEST_ASSERT_EQUAL_UINT8(100, MQTTCommandHandler::normalizeBrightness("1000").value());
    TEST_ASSERT_EQUAL_UINT8(0, MQTTCommandHandler::normalizeBrightness("-5").value());
    TEST_ASSERT_FALSE(MQTTCommandHandler::normalizeBrightness("bright").has_value());
    TEST_ASSERT_FALSE(MQTTCommandHandler::normalizeBrightness("").has_value());
}

static void test_handler_parses_commands() {
    HandlerFixture f;
    BridgeCommand cmd;

    TEST_ASSERT_TRUE(MQTTCommandHandler::Result::COMMAND == f.handler.parse({"zense/zb_1/set", "on"}, cmd));
    TEST_ASSERT_TRUE(cmd == BridgeCommand::on("1"));

    TEST_ASSERT_TRUE(MQTTCommandHandler::Result::COMMAND == f.handler.parse({"zense/zb_A3/set", " OFF "}, cmd));
    TEST_ASSERT_TRUE(cmd == BridgeCommand::off("A3"));

    TEST_ASSERT_TRUE(MQTTCommandHandler::Result::COMMAND == f.handler.parse({"zense/zb_2/brightness/set", "255"}, cmd));
    TEST_ASSERT_TRUE(cmd == BridgeCommand::brightness("2", 100));
}

static void test_handler_ignores_invalid_messages() {
    HandlerFixture f;
    BridgeCommand cmd;

    TEST_ASSERT_TRUE(MQTTCommandHandler::Result::IGNORED == f.handler.parse({"zense/zb_99/set", "ON"}, cmd));
    TEST_ASSERT_TRUE(MQTTCommandHandler::Result::IGNORED == f.handler.parse({"zense/zb_1/set", "TOGGLE"}, cmd));
    TEST_ASSERT_TRUE(MQTTCommandHandler::Result::IGNORED == f.handler.parse({"zense/zb_1/brightness/set", "abc"}, cmd));
    TEST_ASSERT_TRUE(MQTTCommandHandler::Result::IGNORED == f.handler.parse({"zense/zb_1/state", "ON"}, cmd));
    TEST_ASSERT_TRUE(MQTTCommandHandler::Result::IGNORED == f.handler.parse({"other/zb_1/set", "ON"}, cmd));
}

static void test_handler_home_assistant_status() {
    HandlerFixture f;
    BridgeCommand cmd;

    TEST_ASSERT_TRUE(MQTTCommandHandler::Result::HOME_ASSISTANT_ONLINE == f.handler.parse({"homeassistant/status", "online"}, cmd));
    TEST_ASSERT_TRUE(MQTTCommandHandler::Result::IGNORED == f.handler.parse({"homeassistant/status", "offline"}, cmd));
}

static void test_batch_off_cancels_on_and_level() {
    CommandBatch batch;
    batch.add(BridgeCommand::on("1"));
    batch.add(BridgeCommand::brightness("1", 40));
    batch.add(BridgeCommand::off("1"));

    const auto out = batch.take();
    TEST_ASSERT_EQUAL(1, out.size());
    TEST_ASSERT_TRUE(out[0] == BridgeCommand::off("1"));
    TEST_ASSERT_TRUE(batch.empty());
}

static void test_batch_level_wins_over_on_in_any_order() {
    CommandBatch batch;
    batch.add(BridgeCommand::brightness("1", 40));
    batch.add(BridgeCommand::on("1"));
    batch.add(BridgeCommand::on("2"));
    batch.add(BridgeCommand::brightness("2", 70));

    const auto out = batch.take();
    TEST_ASSERT_EQUAL(2, out.size());
    TEST_ASSERT_TRUE(out[0] == BridgeCommand::brightness("1", 40));
    TEST_ASSERT_TRUE(out[1] == BridgeCommand::brightness("2", 70));
}

static void test_batch_level_after_off_and_zero_level() {
    CommandBatch batch;
    batch.add(BridgeCommand::off("1"));
    batch.add(BridgeCommand::brightness("1", 30));
    batch.add(BridgeCommand::brightness("2", 30));
    batch.add(BridgeCommand::brightness("2", 0));
    batch.add(BridgeCommand::off("3"));
    batch.add(BridgeCommand::on("3"));

    const auto out = batch.take();
    TEST_ASSERT_EQUAL(3, out.size());
    TEST_ASSERT_TRUE(out[0] == BridgeCommand::brightness("1", 30));
    TEST_ASSERT_TRUE(out[1] == BridgeCommand::off("2"));
    TEST_ASSERT_TRUE(out[2] == BridgeCommand::off("3"));
}

static void test_batch_keeps_first_arrival_order() {
    CommandBatch batch;
    batch.add(BridgeCommand::on("A3"));
    batch.add(BridgeCommand::on("1"));
    batch.add(BridgeCommand::off("A3"));

    const auto out = batch.take();
    TEST_ASSERT_EQUAL(2, out.size());
    TEST_ASSERT_EQUAL_STRING("A3", out[0].device_id.c_str());
    TEST_ASSERT_EQUAL_STRING("1", out[1].device_id.c_str());
}

static void test_process_batch_dispatches_coalesced_commands() {
    HandlerFixture f;
    MQTTCommandProcess processor(f.handler, 0);

    std::vector<BridgeCommand> seen;
    int ha_online = 0;
    processor.onCommand = [&](const BridgeCommand& cmd) { seen.push_back(cmd); };
    processor.onHomeAssistantOnline = [&]() { ++ha_online; };

    processor.processBatch({
        {"zense/zb_1/brightness/set", "40"},
        {"zense/zb_1/set", "ON"},
        {"homeassistant/status", "online"},
        {"zense/zb_99/set", "ON"},
        {"zense/zb_2/set", "OFF"},
    });

    TEST_ASSERT_EQUAL(1, ha_online);
    TEST_ASSERT_EQUAL(2, seen.size());
    TEST_ASSERT_TRUE(seen[0] == BridgeCommand::brightness("1", 40));
    TEST_ASSERT_TRUE(seen[1] == BridgeCommand::off("2"));
}

static void test_command_processor_task_debounces_queue() {
    HandlerFixture f;
    MQTTCommandProcess processor(f.handler, 50);

    std::mutex mutex;
    std::vector<BridgeCommand> seen;
    processor.onCommand = [&](const BridgeCommand& cmd) {
        std::lock_guard lock(mutex);
        seen.push_back(cmd);
    };

    // queue is not created yet
    TEST_ASSERT_FALSE(processor.enqueueMqttMessage("zense/zb_1/set", "ON"));

    TEST_ASSERT_EQUAL(ESP_OK, processor.init());
    TEST_ASSERT_TRUE(processor.enqueueMqttMessage("zense/zb_1/brightness/set", "25"));
    TEST_ASSERT_TRUE(processor.enqueueMqttMessage("zense/zb_1/set", "ON"));

    for (int i = 0; i < 100; ++i) {
        {
            std::lock_guard lock(mutex);
            if (!seen.empty()) break;
        }
        vTaskDelay(pdMS_TO_TICKS(10));
    }
    processor.stop();

    std::lock_guard lock(mutex);
    TEST_ASSERT_EQUAL(1, seen.size());
    TEST_ASSERT_TRUE(seen[0] == BridgeCommand::brightness("1", 25));
}

void run_mqtt_logic_tests() {
    RUN_TEST(test_mqtt_client_rejects_publish_before_init);
    RUN_TEST(test_normalize_brightness);
    RUN_TEST(test_handler_parses_commands);
    RUN_TEST(test_handler_ignores_invalid_messages);
    RUN_TEST(test_handler_home_assistant_status);
    RUN_TEST(test_batch_off_cancels_on_and_level);
    RUN_TEST(test_batch_level_wins_over_on_in_any_order);
    RUN_TEST(test_batch_level_after_off_and_zero_level);
    RUN_TEST(test_batch_keeps_first_arrival_order);
    RUN_TEST(test_process_batch_dispatches_coalesced_commands);
    RUN_TEST(test_command_processor_task_debounces_queue);
}

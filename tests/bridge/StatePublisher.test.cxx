// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include "bridge/StatePublisher.hxx"
#include "fakes/RecordingPublisher.hxx"
#include <freertos/semphr.h>

using namespace zenseMQTT;
using namespace zenseMQTT::testing;

namespace {
    TopicLayout testTopics() {
        return TopicLayout{"homeassistant/zense_bridge", "homeassistant", "zensebridge_"};
    }

    std::string jsonString(const cJSON* root, const char* key) {
        const cJSON* item = cJSON_GetObjectItem(root, key);
        return cJSON_IsString(item) ? item->valuestring : "";
    }
}

static void test_topic_layout_names() {
    const auto t = testTopics();
    TEST_ASSERT_EQUAL_STRING("zensebridge_12", t.uid("12").c_str());
    TEST_ASSERT_EQUAL_STRING("homeassistant/zense_bridge/zensebridge_12/set", t.commandTopic("12").c_str());
    TEST_ASSERT_EQUAL_STRING("homeassistant/zense_bridge/zensebridge_12/brightness/set", t.brightnessCommandTopic("12").c_str());
    TEST_ASSERT_EQUAL_STRING("homeassistant/zense_bridge/zensebridge_12/state", t.stateTopic("12").c_str());
    TEST_ASSERT_EQUAL_STRING("homeassistant/zense_bridge/zensebridge_12/brightness/state", t.brightnessStateTopic("12").c_str());
    TEST_ASSERT_EQUAL_STRING("homeassistant/light/zensebridge_12/config", t.discoveryTopic("12").c_str());
    TEST_ASSERT_EQUAL_STRING("homeassistant/zense_bridge/availability", t.availabilityTopic().c_str());
    TEST_ASSERT_EQUAL_STRING("homeassistant/status", t.homeAssistantStatusTopic().c_str());
    TEST_ASSERT_EQUAL_STRING("homeassistant/zense_bridge/+/set", t.commandSubscription().c_str());
    TEST_ASSERT_EQUAL_STRING("homeassistant/zense_bridge/+/brightness/set", t.brightnessSubscription().c_str());
}

static void test_topic_layout_parse_command_topics() {
    const auto t = testTopics();

    const auto sw = t.parseCommandTopic("homeassistant/zense_bridge/zensebridge_A3/set");
    TEST_ASSERT_TRUE(sw.has_value());
    TEST_ASSERT_EQUAL_STRING("A3", sw->first.c_str());
    TEST_ASSERT_TRUE(sw->second == TopicLayout::CommandTopic::SWITCH);

    const auto br = t.parseCommandTopic("homeassistant/zense_bridge/zensebridge_7/brightness/set");
    TEST_ASSERT_TRUE(br.has_value());
    TEST_ASSERT_EQUAL_STRING("7", br->first.c_str());
    TEST_ASSERT_TRUE(br->second == TopicLayout::CommandTopic::BRIGHTNESS);

    TEST_ASSERT_FALSE(t.parseCommandTopic("homeassistant/zense_bridge/zensebridge_7/state").has_value());
    TEST_ASSERT_FALSE(t.parseCommandTopic("homeassistant/zense_bridgeX/zensebridge_7/set").has_value());
    TEST_ASSERT_FALSE(t.parseCommandTopic("homeassistant/zense_bridge/other_7/set").has_value());
    TEST_ASSERT_FALSE(t.parseCommandTopic("homeassistant/zense_bridge/zensebridge_/set").has_value());
    TEST_ASSERT_FALSE(t.parseCommandTopic("homeassistant/zense_bridge/zensebridge_7/x/set").has_value());
}

static void test_registry_load_static_devices() {
    EntityRegistry registry;
    TEST_ASSERT_EQUAL(ESP_OK, registry.loadStatic(R"({"12":"Hall","A3":""})"));
    TEST_ASSERT_EQUAL(2, registry.size());
    TEST_ASSERT_EQUAL_STRING("Hall", registry.find("12")->name.c_str());
    TEST_ASSERT_EQUAL_STRING("Device_A3", registry.find("A3")->name.c_str());
    TEST_ASSERT_FALSE(registry.find("12")->isOn().has_value());

    EntityRegistry empty;
    TEST_ASSERT_EQUAL(ESP_OK, empty.loadStatic("{}"));
    TEST_ASSERT_TRUE(empty.empty());

    EntityRegistry bad;
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, bad.loadStatic("[1,2]"));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, bad.loadStatic(R"({"a/b":"x"})"));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, bad.loadStatic("{"));
    TEST_ASSERT_TRUE(bad.empty());
}

static void test_discovery_payload_fields() {
    RecordingPublisher mqtt;
    EntityRegistry registry;
    registry.loadStatic(R"({"12":"Hall"})");
    StatePublisher publisher(mqtt, testTopics(), registry);

    publisher.publishDiscovery();

    const auto msg = mqtt.last("homeassistant/light/zensebridge_12/config");
    TEST_ASSERT_TRUE(msg.has_value());
    TEST_ASSERT_TRUE(msg->retain);
    TEST_ASSERT_EQUAL(0, msg->qos);

    cJSON* root = cJSON_Parse(msg->payload.c_str());
    TEST_ASSERT_NOT_NULL(root);
    TEST_ASSERT_EQUAL_STRING("Hall (Zense)", jsonString(root, "name").c_str());
    TEST_ASSERT_EQUAL_STRING("zensebridge_12", jsonString(root, "unique_id").c_str());
    TEST_ASSERT_EQUAL_STRING("homeassistant/zense_bridge/zensebridge_12/set", jsonString(root, "command_topic").c_str());
    TEST_ASSERT_EQUAL_STRING("homeassistant/zense_bridge/zensebridge_12/state", jsonString(root, "state_topic").c_str());
    TEST_ASSERT_EQUAL_STRING("homeassistant/zense_bridge/zensebridge_12/brightness/set", jsonString(root, "brightness_command_topic").c_str());
    TEST_ASSERT_EQUAL_STRING("homeassistant/zense_bridge/zensebridge_12/brightness/state", jsonString(root, "brightness_state_topic").c_str());
    TEST_ASSERT_EQUAL_STRING("homeassistant/zense_bridge/availability", jsonString(root, "availability_topic").c_str());
    TEST_ASSERT_EQUAL_STRING("online", jsonString(root, "payload_available").c_str());
    TEST_ASSERT_EQUAL_STRING("offline", jsonString(root, "payload_not_available").c_str());
    TEST_ASSERT_EQUAL_STRING("ON", jsonString(root, "payload_on").c_str());
    TEST_ASSERT_EQUAL_STRING("OFF", jsonString(root, "payload_off").c_str());
    TEST_ASSERT_EQUAL(100, cJSON_GetObjectItem(root, "brightness_scale")->valueint);
    TEST_ASSERT_TRUE(cJSON_IsFalse(cJSON_GetObjectItem(root, "optimistic")));
    cJSON_Delete(root);
}

static void test_state_publish_is_deduplicated() {
    RecordingPublisher mqtt;
    EntityRegistry registry;
    registry.loadStatic(R"({"12":"Hall"})");
    StatePublisher publisher(mqtt, testTopics(), registry);
    const std::string state = "homeassistant/zense_bridge/zensebridge_12/state";
    const std::string level = "homeassistant/zense_bridge/zensebridge_12/brightness/state";

    TEST_ASSERT_TRUE(publisher.publishState("12", 60));
    TEST_ASSERT_FALSE(publisher.publishState("12", 60));
    TEST_ASSERT_EQUAL(1, mqtt.count(state));
    TEST_ASSERT_EQUAL_STRING("ON", mqtt.last(state)->payload.c_str());
    TEST_ASSERT_EQUAL_STRING("60", mqtt.last(level)->payload.c_str());

    TEST_ASSERT_TRUE(publisher.publishState("12", 0));
    TEST_ASSERT_EQUAL_STRING("OFF", mqtt.last(state)->payload.c_str());
    TEST_ASSERT_EQUAL_STRING("0", mqtt.last(level)->payload.c_str());
    TEST_ASSERT_FALSE(registry.find("12")->isOn().value_or(true));

    // new broker session: the same level goes out again
    publisher.resetCache();
    TEST_ASSERT_TRUE(publisher.publishState("12", 0));
    TEST_ASSERT_EQUAL(3, mqtt.count(state));
}

static void test_state_not_cached_when_publish_fails() {
    RecordingPublisher mqtt;
    EntityRegistry registry;
    registry.loadStatic(R"({"12":"Hall"})");
    StatePublisher publisher(mqtt, testTopics(), registry);

    mqtt.connected = false;
    TEST_ASSERT_FALSE(publisher.publishState("12", 80));
    TEST_ASSERT_EQUAL_UINT8(80, registry.find("12")->level.value_or(0));

    mqtt.connected = true;
    TEST_ASSERT_TRUE(publisher.publishState("12", 80));
    TEST_ASSERT_EQUAL(1, mqtt.count("homeassistant/zense_bridge/zensebridge_12/state"));
}

static void test_state_level_is_clamped() {
    RecordingPublisher mqtt;
    EntityRegistry registry;
    registry.loadStatic(R"({"12":"Hall"})");
    StatePublisher publisher(mqtt, testTopics(), registry);

    publisher.publishState("12", 250);
    TEST_ASSERT_EQUAL_STRING("100", mqtt.last("homeassistant/zense_bridge/zensebridge_12/brightness/state")->payload.c_str());
}

static void test_availability_is_retained_qos1() {
    RecordingPublisher mqtt;
    EntityRegistry registry;
    StatePublisher publisher(mqtt, testTopics(), registry);

    publisher.publishAvailability(true);
    publisher.publishAvailability(false);

    const auto msg = mqtt.last("homeassistant/zense_bridge/availability");
    TEST_ASSERT_TRUE(msg.has_value());
    TEST_ASSERT_EQUAL_STRING("offline", msg->payload.c_str());
    TEST_ASSERT_EQUAL(1, msg->qos);
    TEST_ASSERT_TRUE(msg->retain);
    TEST_ASSERT_EQUAL(2, mqtt.count("homeassistant/zense_bridge/availability"));
}

static void test_polled_state_older_than_command_is_dropped() {
    RecordingPublisher mqtt;
    EntityRegistry registry;
    registry.loadStatic(R"({"12":"Hall","13":"Porch"})");
    StatePublisher publisher(mqtt, testTopics(), registry);
    const std::string level = "homeassistant/zense_bridge/zensebridge_12/brightness/state";

    const uint32_t before = publisher.stateRevision("12");
    TEST_ASSERT_TRUE(publisher.publishState("12", 40));
    TEST_ASSERT_FALSE(publisher.publishPolledState("12", 100, before));
    TEST_ASSERT_EQUAL_STRING("40", mqtt.last(level)->payload.c_str());
    TEST_ASSERT_EQUAL_UINT8(40, registry.find("12")->level.value_or(0));

    TEST_ASSERT_TRUE(publisher.publishPolledState("12", 100, publisher.stateRevision("12")));
    TEST_ASSERT_EQUAL_STRING("100", mqtt.last(level)->payload.c_str());

    // commands on another light do not invalidate this one
    const uint32_t porch = publisher.stateRevision("13");
    TEST_ASSERT_TRUE(publisher.publishState("12", 10));
    TEST_ASSERT_TRUE(publisher.publishPolledState("13", 55, porch));
}

static void test_concurrent_publishers_keep_cache_and_broker_in_step() {
    RecordingPublisher mqtt;
    EntityRegistry registry;
    registry.loadStatic(R"({"12":"Hall"})");
    StatePublisher publisher(mqtt, testTopics(), registry);
    const std::string level = "homeassistant/zense_bridge/zensebridge_12/brightness/state";

    struct Ctx {
        StatePublisher* publisher;
        uint8_t first;
        uint8_t second;
        SemaphoreHandle_t done;
    };
    const SemaphoreHandle_t done = xSemaphoreCreateCounting(2, 0);
    Ctx a{&publisher, 40, 100, done};
    Ctx b{&publisher, 100, 40, done};

    auto worker = [](void* arg) {
        const auto* c = static_cast<Ctx*>(arg);
        for (int i = 0; i < 200; ++i) {
            c->publisher->publishState("12", (i % 2) ? c->second : c->first);
            if (i % 16 == 0) vTaskDelay(1);
        }
        xSemaphoreGive(c->done);
        vTaskDelete(nullptr);
    };
    xTaskCreate(worker, "state_a", 4096, &a, 5, nullptr);
    xTaskCreate(worker, "state_b", 4096, &b, 5, nullptr);
    TEST_ASSERT_EQUAL(pdTRUE, xSemaphoreTake(done, pdMS_TO_TICKS(5000)));
    TEST_ASSERT_EQUAL(pdTRUE, xSemaphoreTake(done, pdMS_TO_TICKS(5000)));
    vSemaphoreDelete(done);

    // whatever the broker retained is what the de-dup cache believes
    const std::string retained = mqtt.last(level)->payload;
    const uint8_t retained_level = static_cast<uint8_t>(std::stoi(retained));
    TEST_ASSERT_EQUAL_UINT8(retained_level, registry.find("12")->level.value_or(0));
    TEST_ASSERT_FALSE(publisher.publishState("12", retained_level));
    TEST_ASSERT_TRUE(publisher.publishState("12", retained_level == 40 ? 100 : 40));
}

void run_state_publisher_tests() {
    RUN_TEST(test_topic_layout_names);
    RUN_TEST(test_topic_layout_parse_command_topics);
    RUN_TEST(test_registry_load_static_devices);
    RUN_TEST(test_discovery_payload_fields);
    RUN_TEST(test_state_publish_is_deduplicated);
    RUN_TEST(test_state_not_cached_when_publish_fails);
    RUN_TEST(test_state_level_is_clamped);
    RUN_TEST(test_availability_is_retained_qos1);
    RUN_TEST(test_polled_state_older_than_command_is_dropped);
    RUN_TEST(test_concurrent_publishers_keep_cache_and_broker_in_step);
}

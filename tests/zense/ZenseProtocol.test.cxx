// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include "zense/ZenseProtocol.hxx"

using namespace zenseMQTT;

static void test_protocol_builds_framed_commands() {
    TEST_ASSERT_EQUAL_STRING(">>Login 16713<<", ZenseProtocol::login("16713").c_str());
    TEST_ASSERT_EQUAL_STRING(">>Set 12 100<<", ZenseProtocol::set("12", 100).c_str());
    TEST_ASSERT_EQUAL_STRING(">>Set A3 0<<", ZenseProtocol::set("A3", 0).c_str());
    TEST_ASSERT_EQUAL_STRING(">>Fade A3 40<<", ZenseProtocol::fade("A3", 40).c_str());
    TEST_ASSERT_EQUAL_STRING(">>Get 7<<", ZenseProtocol::get("7").c_str());
    TEST_ASSERT_EQUAL_STRING(">>Get Devices<<", ZenseProtocol::getDevices().c_str());
    TEST_ASSERT_EQUAL_STRING(">>Get Name 7<<", ZenseProtocol::getName("7").c_str());
}

static void test_protocol_clamps_levels_to_100() {
    TEST_ASSERT_EQUAL_STRING(">>Fade 1 100<<", ZenseProtocol::fade("1", 180).c_str());
    TEST_ASSERT_EQUAL_STRING(">>Set 1 100<<", ZenseProtocol::set("1", 255).c_str());
}

static void test_protocol_extracts_frames() {
    TEST_ASSERT_FALSE(ZenseProtocol::extractFrame(">>Get 4").has_value());
    TEST_ASSERT_FALSE(ZenseProtocol::extractFrame("").has_value());

    const auto body = ZenseProtocol::extractFrame("noise>>Get 40<<trailing");
    TEST_ASSERT_TRUE(body.has_value());
    TEST_ASSERT_EQUAL_STRING("Get 40", std::string(*body).c_str());
}

static void test_protocol_login_response() {
    TEST_ASSERT_TRUE(ZenseProtocol::isLoginOk(">>Login Ok<<"));
    TEST_ASSERT_TRUE(ZenseProtocol::isLoginOk(">>Login Ok<<\r\n"));
    TEST_ASSERT_FALSE(ZenseProtocol::isLoginOk(">>Login Failed<<"));
    TEST_ASSERT_FALSE(ZenseProtocol::isLoginOk(">>Login Ok"));
    TEST_ASSERT_FALSE(ZenseProtocol::isLoginOk(""));
}

static void test_protocol_parses_levels() {
    TEST_ASSERT_EQUAL_UINT8(40, ZenseProtocol::parseLevel(">>Get 40<<").value_or(255));
    TEST_ASSERT_EQUAL_UINT8(0, ZenseProtocol::parseLevel(">>Get 0<<").value_or(255));
    TEST_ASSERT_EQUAL_UINT8(100, ZenseProtocol::parseLevel(">>Get  100 <<").value_or(255));

    TEST_ASSERT_FALSE(ZenseProtocol::parseLevel(">>Get 101<<").has_value());
    TEST_ASSERT_FALSE(ZenseProtocol::parseLevel(">>Get -1<<").has_value());
    TEST_ASSERT_FALSE(ZenseProtocol::parseLevel(">>Get Timeout<<").has_value());
    TEST_ASSERT_FALSE(ZenseProtocol::parseLevel(">>Getter 4<<").has_value());
    TEST_ASSERT_FALSE(ZenseProtocol::parseLevel(">>Set 4 40<<").has_value());
}

static void test_protocol_parses_device_list() {
    const auto ids = ZenseProtocol::parseDeviceList(">>Get Devices 1, 2,x,33<<");
    TEST_ASSERT_TRUE(ids.has_value());
    TEST_ASSERT_EQUAL(3, ids->size());
    TEST_ASSERT_EQUAL_STRING("1", (*ids)[0].c_str());
    TEST_ASSERT_EQUAL_STRING("2", (*ids)[1].c_str());
    TEST_ASSERT_EQUAL_STRING("33", (*ids)[2].c_str());

    TEST_ASSERT_FALSE(ZenseProtocol::parseDeviceList(">>Get 40<<").has_value());
}

static void test_protocol_parses_names() {
    TEST_ASSERT_EQUAL_STRING("Kitchen", ZenseProtocol::parseName(">>Get Name 'Kitchen'<<").value_or("").c_str());
    TEST_ASSERT_EQUAL_STRING("Living room", ZenseProtocol::parseName(">>Get Name 'Living room'<<").value_or("").c_str());
    TEST_ASSERT_FALSE(ZenseProtocol::parseName(">>Get Name Timeout<<").has_value());
    TEST_ASSERT_FALSE(ZenseProtocol::parseName(">>Get Name ''<<").has_value());
}

static void test_protocol_validates_device_ids() {
    TEST_ASSERT_TRUE(ZenseProtocol::isValidDeviceId("12"));
    TEST_ASSERT_TRUE(ZenseProtocol::isValidDeviceId("A3"));
    TEST_ASSERT_FALSE(ZenseProtocol::isValidDeviceId(""));
    TEST_ASSERT_FALSE(ZenseProtocol::isValidDeviceId("1 2"));
    TEST_ASSERT_FALSE(ZenseProtocol::isValidDeviceId("a/b"));
    TEST_ASSERT_FALSE(ZenseProtocol::isValidDeviceId("<<"));
}

void run_zense_protocol_tests() {
    RUN_TEST(test_protocol_builds_framed_commands);
    RUN_TEST(test_protocol_clamps_levels_to_100);
    RUN_TEST(test_protocol_extracts_frames);
    RUN_TEST(test_protocol_login_response);
    RUN_TEST(test_protocol_parses_levels);
    RUN_TEST(test_protocol_parses_device_list);
    RUN_TEST(test_protocol_parses_names);
    RUN_TEST(test_protocol_validates_device_ids);
}

// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include "light/LightController.hxx"
#include "protocol/Protocol.hxx"
#include "../serial/PtyPair.hxx"

using namespace neewerLink;

static LightController& controller() {
    auto& light = LightController::Instance();
    TEST_ASSERT_EQUAL(ESP_OK, light.init(8, "ttyUSB"));
    return light;
}

static void drainEvents() {
    xQueueReset(LightController::Instance().getEventQueue());
}

static void test_init_creates_event_queue() {
    auto& light = controller();
    TEST_ASSERT_TRUE(light.isInitialized());
    TEST_ASSERT_NOT_NULL(light.getEventQueue());

    // Second init keeps the same queue
    const QueueHandle_t queue = light.getEventQueue();
    TEST_ASSERT_EQUAL(ESP_OK, light.init(32, "other"));
    TEST_ASSERT_EQUAL_PTR(queue, light.getEventQueue());
}

static void test_commands_rejected_while_disconnected() {
    auto& light = controller();
    light.disconnect();
    TEST_ASSERT_FALSE(light.isConnected());
    TEST_ASSERT_EQUAL(NEEWERLINK_ERR_NOT_CONNECTED, light.setLight(50, 4950));
    TEST_ASSERT_EQUAL(NEEWERLINK_ERR_NOT_CONNECTED, light.turnOn());
    TEST_ASSERT_EQUAL(NEEWERLINK_ERR_NOT_CONNECTED, light.turnOff());
}

static void test_set_light_sends_quantized_command() {
    PtyPair panel;
    TEST_ASSERT_TRUE(panel.isOpen());
    auto& light = controller();
    drainEvents();
    TEST_ASSERT_EQUAL(ESP_OK, light.connect(panel.slaveName()));

    TEST_ASSERT_EQUAL(ESP_OK, light.setLight(250, 3000));
    const auto expected = Protocol::buildCommandPacket(std::array<uint8_t, 6>{0x3A, 0x02, 0x03, 0x01, 100, 0});
    const auto received = panel.receive(expected.size(), 2000);
    TEST_ASSERT_EQUAL_size_t(expected.size(), received.size());
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected.data(), received.data(), expected.size());

    light.disconnect();
    vTaskDelay(pdMS_TO_TICKS(300));
}

static void test_turn_on_and_off() {
    PtyPair panel;
    TEST_ASSERT_TRUE(panel.isOpen());
    auto& light = controller();
    drainEvents();
    TEST_ASSERT_EQUAL(ESP_OK, light.connect(panel.slaveName()));

    TEST_ASSERT_EQUAL(ESP_OK, light.turnOn());
    auto received = panel.receive(Protocol::FRAME_SIZE, 2000);
    TEST_ASSERT_EQUAL_size_t(Protocol::FRAME_SIZE, received.size());
    TEST_ASSERT_EQUAL_UINT8(100, received[4]);
    TEST_ASSERT_EQUAL_UINT8(9, received[5]);

    TEST_ASSERT_EQUAL(ESP_OK, light.turnOff());
    received = panel.receive(Protocol::FRAME_SIZE, 2000);
    TEST_ASSERT_EQUAL_size_t(Protocol::FRAME_SIZE, received.size());
    TEST_ASSERT_EQUAL_UINT8(0, received[4]);
    TEST_ASSERT_EQUAL_UINT8(9, received[5]);

    light.disconnect();
    vTaskDelay(pdMS_TO_TICKS(300));
}

static void test_status_report_on_controller_queue() {
    PtyPair panel;
    TEST_ASSERT_TRUE(panel.isOpen());
    auto& light = controller();
    drainEvents();
    TEST_ASSERT_EQUAL(ESP_OK, light.connect(panel.slaveName()));

    TEST_ASSERT_TRUE(panel.send(Protocol::encodeCctCommand(64, 2900)));
    LightEvent event{};
    TEST_ASSERT_EQUAL(pdPASS, xQueueReceive(light.getEventQueue(), &event, pdMS_TO_TICKS(2000)));
    TEST_ASSERT_EQUAL(LightEventType::StatusChanged, event.type);
    TEST_ASSERT_EQUAL_UINT8(64, event.status.brightness);
    TEST_ASSERT_EQUAL_UINT32(2900, event.status.kelvin);

    light.disconnect();
    vTaskDelay(pdMS_TO_TICKS(300));
    drainEvents();
}

static void test_find_port_uses_filter() {
    char dir_template[] = "/tmp/neewerlink-light-XXXXXX";
    const char* dir = mkdtemp(dir_template);
    TEST_ASSERT_NOT_NULL(dir);
    const std::string path = std::string(dir) + "/ttyUSB3";
    FILE* f = fopen(path.c_str(), "w");
    TEST_ASSERT_NOT_NULL(f);
    fclose(f);

    auto& light = controller();
    light.setDevDirectory(dir);
    const auto found = light.findPort();
    TEST_ASSERT_TRUE(found.has_value());
    TEST_ASSERT_EQUAL_STRING(path.c_str(), found->c_str());
    TEST_ASSERT_EQUAL_size_t(1, light.listPorts().size());

    light.setDevDirectory("/dev");
    unlink(path.c_str());
    rmdir(dir);
}

void run_light_controller_tests() {
    RUN_TEST(test_init_creates_event_queue);
    RUN_TEST(test_commands_rejected_while_disconnected);
    RUN_TEST(test_set_light_sends_quantized_command);
    RUN_TEST(test_turn_on_and_off);
    RUN_TEST(test_status_report_on_controller_queue);
    RUN_TEST(test_find_port_uses_filter);
}

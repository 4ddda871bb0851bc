// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "mqtt/MQTTCommandProcess.hxx"

namespace zenseMQTT {
    static constexpr char TAG[] = "MQTTCommandProcess";

    static constexpr UBaseType_t QUEUE_LENGTH = 64;
    static constexpr EventBits_t TASK_EXITED_BIT = BIT0;
    static constexpr uint32_t STOP_WARN_MS = 5000;

    void CommandBatch::add(const BridgeCommand& command) {
        auto [it, inserted] = m_pending.try_emplace(command.device_id);
        if (inserted) {
            m_order.push_back(command.device_id);
        }
        Pending& p = it->second;

        const bool is_off = (command.kind == CommandKind::ON_OFF && command.value == 0)
                         || (command.kind == CommandKind::BRIGHTNESS && command.value == 0);
        if (is_off) {
            p.off = true;
            p.on = false;
            p.level.reset();
        } else if (command.kind == CommandKind::BRIGHTNESS) {
            p.level = command.value;
            p.on = false;
            p.off = false;
        } else if (!p.off && !p.level.has_value()) {
            p.on = true;
        }
    }

    std::vector<BridgeCommand> CommandBatch::take() {
        std::vector<BridgeCommand> out;
        out.reserve(m_order.size());
        for (const auto& id : m_order) {
            const Pending& p = m_pending.at(id);
            if (p.off) {
                out.push_back(BridgeCommand::off(id));
            } else if (p.level.has_value()) {
                out.push_back(BridgeCommand::brightness(id, *p.level));
            } else if (p.on) {
                out.push_back(BridgeCommand::on(id));
            }
        }
        m_order.clear();
        m_pending.clear();
        return out;
    }

    MQTTCommandProcess::MQTTCommandProcess(const MQTTCommandHandler& handler, const uint32_t debounce_ms)
        : m_handler(handler), m_debounce_ms(debounce_ms) {}

    MQTTCommandProcess::~MQTTCommandProcess() {
        stop();
        if (m_queue) {
            MqttMessage* msg = nullptr;
            while (xQueueReceive(m_queue, &msg, 0) == pdPASS) {
                delete msg;
            }
            vQueueDelete(m_queue);
            m_queue = nullptr;
        }
        if (m_events) {
            vEventGroupDelete(m_events);
            m_events = nullptr;
        }
    }

    esp_err_t MQTTCommandProcess::init() {
        if (m_task) return ESP_OK;
        if (!m_queue) {
            m_queue = xQueueCreate(QUEUE_LENGTH, sizeof(MqttMessage*));
        }
        if (!m_events) {
            m_events = xEventGroupCreate();
        }
        if (!m_queue || !m_events) {
            ESP_LOGE(TAG, "Failed to create command queue");
            return ESP_ERR_NO_MEM;
        }
        xEventGroupClearBits(m_events, TASK_EXITED_BIT);
        if (xTaskCreate(CommandProcessTask, "mqtt_cmd_task", 4096, this, 5, &m_task) != pdPASS) {
            ESP_LOGE(TAG, "Failed to create command task");
            m_task = nullptr;
            return ESP_ERR_NO_MEM;
        }
        ESP_LOGI(TAG, "Command processor started (debounce %lu ms)", static_cast<unsigned long>(m_debounce_ms));
        return ESP_OK;
    }

    void MQTTCommandProcess::stop() {
        if (!m_task) return;
        // nullptr wakes the task and ends it; the queue and event group must
        // outlive the task, so both waits are unbounded after the warning
        MqttMessage* sentinel = nullptr;
        if (xQueueSendToFront(m_queue, &sentinel, pdMS_TO_TICKS(STOP_WARN_MS)) != pdPASS) {
            ESP_LOGW(TAG, "Command queue still full, waiting to signal the command task");
            xQueueSendToFront(m_queue, &sentinel, portMAX_DELAY);
        }
        const EventBits_t bits = xEventGroupWaitBits(m_events, TASK_EXITED_BIT, pdFALSE, pdFALSE, pdMS_TO_TICKS(STOP_WARN_MS));
        if (!(bits & TASK_EXITED_BIT)) {
            ESP_LOGW(TAG, "Command task still busy, waiting for it to exit");
            xEventGroupWaitBits(m_events, TASK_EXITED_BIT, pdFALSE, pdFALSE, portMAX_DELAY);
        }
        m_task = nullptr;
    }

    bool MQTTCommandProcess::enqueueMqttMessage(const char* topic, const int topic_len, const char* data, const int data_len) const {
        if (!m_queue) return false;

        auto* msg = new MqttMessage;
        msg->topic.assign(topic, topic_len);
        msg->payload.assign(data, data_len);

        if (xQueueSend(m_queue, &msg, 0) != pdPASS) {
            ESP_LOGE(TAG, "Queue full, dropping message: %s", msg->topic.c_str());
            delete msg;
            return false;
        }
        return true;
    }

    bool MQTTCommandProcess::enqueueMqttMessage(const std::string& topic, const std::string& data) const {
        return enqueueMqttMessage(topic.data(), static_cast<int>(topic.size()), data.data(), static_cast<int>(data.size()));
    }

    void MQTTCommandProcess::processBatch(const std::vector<MqttMessage>& messages) const {
        CommandBatch batch;
        bool ha_online = false;

        for (const auto& msg : messages) {
            BridgeCommand command;
            switch (m_handler.parse(msg, command)) {
                case MQTTCommandHandler::Result::COMMAND:
                    batch.add(command);
                    break;
                case MQTTCommandHandler::Result::HOME_ASSISTANT_ONLINE:
                    ha_online = true;
                    break;
                case MQTTCommandHandler::Result::IGNORED:
                    break;
            }
        }

        if (ha_online && onHomeAssistantOnline) {
            onHomeAssistantOnline();
        }

        if (!onCommand) return;
        for (const auto& command : batch.take()) {
            onCommand(command);
        }
    }

    void MQTTCommandProcess::CommandProcessTask(void* arg) {
        const auto* self = static_cast<MQTTCommandProcess*>(arg);
        self->run();
        xEventGroupSetBits(self->m_events, TASK_EXITED_BIT);
        vTaskDelete(nullptr);
    }

    void MQTTCommandProcess::run() const {
        std::vector<MqttMessage> batch;
        MqttMessage* msg = nullptr;

        while (true) {
            if (xQueueReceive(m_queue, &msg, portMAX_DELAY) != pdPASS) continue;
            if (!msg) break;

            batch.push_back(std::move(*msg));
            delete msg;

            // HA sends brightness and ON as separate messages, give the pair time to arrive
            if (m_debounce_ms > 0) {
                vTaskDelay(pdMS_TO_TICKS(m_debounce_ms));
            }

            bool stop_requested = false;
            while (xQueueReceive(m_queue, &msg, 0) == pdPASS) {
                if (!msg) {
                    stop_requested = true;
                    break;
                }
                batch.push_back(std::move(*msg));
                delete msg;
            }

            if (stop_requested) break;
            processBatch(batch);
            batch.clear();
        }
        ESP_LOGI(TAG, "Command processor stopped.");
    }
} // zenseMQTT

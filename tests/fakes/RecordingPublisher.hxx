// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef ZENSEMQTT_TESTS_RECORDINGPUBLISHER_HXX
#define ZENSEMQTT_TESTS_RECORDINGPUBLISHER_HXX

#include "bridge/MqttPublisher.hxx"

namespace zenseMQTT::testing
{
    class RecordingPublisher final : public MqttPublisher {
    public:
        struct Message {
            std::string topic;
            std::string payload;
            int qos;
            bool retain;
        };

        esp_err_t publish(const std::string& topic, const std::string& payload, const int qos, const bool retain) override {
            std::lock_guard lock(mutex);
            if (!connected) return ESP_ERR_INVALID_STATE;
            messages.push_back({topic, payload, qos, retain});
            return ESP_OK;
        }

        esp_err_t subscribe(const std::string& topic, int) override {
            std::lock_guard lock(mutex);
            subscriptions.push_back(topic);
            return ESP_OK;
        }

        esp_err_t unsubscribe(const std::string& topic) override {
            std::lock_guard lock(mutex);
            std::erase(subscriptions, topic);
            return ESP_OK;
        }

        size_t count(const std::string& topic) {
            std::lock_guard lock(mutex);
            return static_cast<size_t>(std::ranges::count_if(messages, [&](const Message& m) { return m.topic == topic; }));
        }

        std::optional<Message> last(const std::string& topic) {
            std::lock_guard lock(mutex);
            for (auto it = messages.rbegin(); it != messages.rend(); ++it) {
                if (it->topic == topic) return *it;
            }
            return std::nullopt;
        }

        void clear() {
            std::lock_guard lock(mutex);
            messages.clear();
        }

        std::mutex mutex;
        bool connected{true};
        std::vector<Message> messages;
        std::vector<std::string> subscriptions;
    };
} // zenseMQTT::testing

#endif //ZENSEMQTT_TESTS_RECORDINGPUBLISHER_HXX

// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef ZENSEMQTT_MQTTPUBLISHER_HXX
#define ZENSEMQTT_MQTTPUBLISHER_HXX

namespace zenseMQTT
{
    /**
     * @brief Publish/subscribe side of the message bus as seen by the bridge.
     */
    class MqttPublisher {
    public:
        virtual ~MqttPublisher() = default;

        /**
         * @return ESP_OK when the message was handed to the client,
         *         ESP_ERR_INVALID_STATE when not connected, ESP_FAIL otherwise
         */
        virtual esp_err_t publish(const std::string& topic, const std::string& payload, int qos = 0, bool retain = false) = 0;
        virtual esp_err_t subscribe(const std::string& topic, int qos = 0) = 0;
        virtual esp_err_t unsubscribe(const std::string& topic) = 0;
    };
} // zenseMQTT

#endif //ZENSEMQTT_MQTTPUBLISHER_HXX

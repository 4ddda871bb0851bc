// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef ZENSEMQTT_MQTTCOMMANDPROCESS_HXX
#define ZENSEMQTT_MQTTCOMMANDPROCESS_HXX

#include "mqtt/MQTTCommandHandler.hxx"

namespace zenseMQTT {

    /**
     * @brief Collapses the commands of one debounce batch to at most one per device.
     *
     * OFF cancels ON and level, a level cancels ON and OFF (level 0 counts as
     * OFF), ON is dropped when OFF or a level is already pending. Devices come
     * out in the order they first appeared in the batch.
     */
    class CommandBatch {
    public:
        void add(const BridgeCommand& command);
        [[nodiscard]] std::vector<BridgeCommand> take();
        [[nodiscard]] bool empty() const { return m_order.empty(); }

    private:
        struct Pending {
            bool off{false};
            bool on{false};
            std::optional<uint8_t> level;
        };

        std::vector<ZenseDeviceId> m_order;
        std::map<ZenseDeviceId, Pending> m_pending;
    };

    class MQTTCommandProcess {
        public:
            MQTTCommandProcess(const MQTTCommandHandler& handler, uint32_t debounce_ms);
            ~MQTTCommandProcess();

            MQTTCommandProcess(const MQTTCommandProcess&) = delete;
            MQTTCommandProcess& operator=(const MQTTCommandProcess&) = delete;

            esp_err_t init();
            void stop();

            bool enqueueMqttMessage(const char* topic, int topic_len, const char* data, int data_len) const;
            bool enqueueMqttMessage(const std::string& topic, const std::string& data) const;

            /**
             * @brief Decodes, coalesces and dispatches one batch of messages.
             */
            void processBatch(const std::vector<MqttMessage>& messages) const;

            std::function<void(const BridgeCommand&)> onCommand;
            std::function<void()> onHomeAssistantOnline;

        private:
            static void CommandProcessTask(void* arg);
            void run() const;

            const MQTTCommandHandler& m_handler;
            const uint32_t m_debounce_ms;

            QueueHandle_t m_queue{nullptr};
            EventGroupHandle_t m_events{nullptr};
            TaskHandle_t m_task{nullptr};
    };
} // zenseMQTT

#endif //ZENSEMQTT_MQTTCOMMANDPROCESS_HXX

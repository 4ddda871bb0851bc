// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef ZENSEMQTT_ENTITYREGISTRY_HXX
#define ZENSEMQTT_ENTITYREGISTRY_HXX

#include "zense/ZenseTypes.hxx"

namespace zenseMQTT
{
    class ZenseLink;

    /**
     * @brief The lights known to the bridge for this session.
     *
     * Filled once, either from the configured device list or by asking the
     * gateway, and never shrinks afterwards. Only the last known level of an
     * entity changes at runtime.
     */
    class EntityRegistry {
    public:
        EntityRegistry() = default;
        EntityRegistry(const EntityRegistry&) = delete;
        EntityRegistry& operator=(const EntityRegistry&) = delete;

        /**
         * @brief Loads {"<id>": "<name>", ...}. An empty object leaves the registry empty.
         * @return ESP_ERR_INVALID_ARG on malformed JSON or device ids
         */
        esp_err_t loadStatic(const std::string& devices_json);

        /**
         * @brief Asks the gateway for its device list and names.
         * @return ESP_OK when at least one device was registered
         */
        esp_err_t discover(ZenseLink& link);

        [[nodiscard]] bool empty() const;
        [[nodiscard]] size_t size() const;
        [[nodiscard]] bool contains(const ZenseDeviceId& id) const;

        // Снимок в порядке регистрации
        [[nodiscard]] std::vector<ZenseEntity> entities() const;
        [[nodiscard]] std::optional<ZenseEntity> find(const ZenseDeviceId& id) const;

        void updateLevel(const ZenseDeviceId& id, uint8_t level);

        static std::string fallbackName(const ZenseDeviceId& id);

    private:
        void addLocked(ZenseDeviceId id, std::string name);

        mutable std::mutex m_mutex;
        std::vector<ZenseEntity> m_entities;
        std::map<ZenseDeviceId, size_t> m_index;
    };
} // zenseMQTT

#endif //ZENSEMQTT_ENTITYREGISTRY_HXX

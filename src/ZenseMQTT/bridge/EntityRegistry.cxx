// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "bridge/EntityRegistry.hxx"
#include "zense/ZenseErrors.hxx"
#include "zense/ZenseLink.hxx"
#include "zense/ZenseProtocol.hxx"

namespace zenseMQTT
{
    static constexpr char TAG[] = "EntityRegistry";

    esp_err_t EntityRegistry::loadStatic(const std::string& devices_json) {
        if (devices_json.empty()) return ESP_OK;

        cJSON* root = cJSON_Parse(devices_json.c_str());
        if (!cJSON_IsObject(root)) {
            ESP_LOGE(TAG, "Device list is not a JSON object");
            cJSON_Delete(root);
            return ESP_ERR_INVALID_ARG;
        }

        std::vector<std::pair<ZenseDeviceId, std::string>> parsed;
        const cJSON* item = nullptr;
        cJSON_ArrayForEach(item, root) {
            const std::string_view id = item->string ? item->string : "";
            if (!ZenseProtocol::isValidDeviceId(id)) {
                ESP_LOGE(TAG, "Invalid device id '%.*s' in device list", static_cast<int>(id.size()), id.data());
                cJSON_Delete(root);
                return ESP_ERR_INVALID_ARG;
            }
            std::string name;
            if (cJSON_IsString(item) && item->valuestring != nullptr) {
                name = item->valuestring;
            }
            parsed.emplace_back(ZenseDeviceId(id), name.empty() ? fallbackName(ZenseDeviceId(id)) : name);
        }
        cJSON_Delete(root);

        std::lock_guard lock(m_mutex);
        for (auto& [id, name] : parsed) {
            addLocked(std::move(id), std::move(name));
        }
        if (!m_entities.empty()) {
            ESP_LOGI(TAG, "Loaded %zu devices from configuration", m_entities.size());
        }
        return ESP_OK;
    }

    esp_err_t EntityRegistry::discover(ZenseLink& link) {
        std::vector<ZenseDeviceId> ids;
        if (const esp_err_t err = link.getDevices(ids); err != ESP_OK) {
            ESP_LOGW(TAG, "Device discovery failed: %s", zenseErrToName(err));
            return err;
        }
        if (ids.empty()) {
            ESP_LOGW(TAG, "Gateway reported no devices");
            return ESP_ERR_NOT_FOUND;
        }

        std::vector<std::pair<ZenseDeviceId, std::string>> found;
        for (const auto& id : ids) {
            std::optional<std::string> name;
            if (const esp_err_t err = link.getName(id, name); err != ESP_OK) {
                if (err == ZENSE_ERR_SHUTDOWN) return err;
                ESP_LOGW(TAG, "Reading name of device %s failed: %s", id.c_str(), zenseErrToName(err));
            }
            found.emplace_back(id, name.value_or(fallbackName(id)));
        }

        std::lock_guard lock(m_mutex);
        for (auto& [id, name] : found) {
            addLocked(std::move(id), std::move(name));
        }
        ESP_LOGI(TAG, "Discovered %zu devices on the gateway", found.size());
        return ESP_OK;
    }

    bool EntityRegistry::empty() const {
        std::lock_guard lock(m_mutex);
        return m_entities.empty();
    }

    size_t EntityRegistry::size() const {
        std::lock_guard lock(m_mutex);
        return m_entities.size();
    }

    bool EntityRegistry::contains(const ZenseDeviceId& id) const {
        std::lock_guard lock(m_mutex);
        return m_index.contains(id);
    }

    std::vector<ZenseEntity> EntityRegistry::entities() const {
        std::lock_guard lock(m_mutex);
        return m_entities;
    }

    std::optional<ZenseEntity> EntityRegistry::find(const ZenseDeviceId& id) const {
        std::lock_guard lock(m_mutex);
        const auto it = m_index.find(id);
        if (it == m_index.end()) return std::nullopt;
        return m_entities[it->second];
    }

    void EntityRegistry::updateLevel(const ZenseDeviceId& id, const uint8_t level) {
        std::lock_guard lock(m_mutex);
        if (const auto it = m_index.find(id); it != m_index.end()) {
            m_entities[it->second].level = std::min(level, ZENSE_LEVEL_MAX);
        }
    }

    std::string EntityRegistry::fallbackName(const ZenseDeviceId& id) {
        return std::format("Device_{}", id);
    }

    void EntityRegistry::addLocked(ZenseDeviceId id, std::string name) {
        if (m_index.contains(id)) return;
        m_index.emplace(id, m_entities.size());
        m_entities.push_back(ZenseEntity{std::move(id), std::move(name), std::nullopt});
    }
} // zenseMQTT

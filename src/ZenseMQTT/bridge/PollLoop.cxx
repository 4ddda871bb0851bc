// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "bridge/PollLoop.hxx"
#include "bridge/EntityRegistry.hxx"
#include "bridge/StatePublisher.hxx"
#include "config/ConfigDefaults.hxx"
#include "zense/ZenseErrors.hxx"
#include "zense/ZenseLink.hxx"

namespace zenseMQTT
{
    static constexpr char TAG[] = "PollLoop";

    static constexpr EventBits_t STOP_BIT        = BIT0;
    static constexpr EventBits_t REFRESH_BIT     = BIT1;
    static constexpr EventBits_t TASK_EXITED_BIT = BIT2;

    // Retry period for device discovery while the registry is empty
    static constexpr uint32_t DISCOVERY_RETRY_MS = 5000;
    static constexpr uint32_t STOP_WARN_MS = 5000;

    PollLoop::PollLoop(ZenseLink& link, StatePublisher& publisher, EntityRegistry& registry, const int32_t interval_sec)
        : m_link(link), m_publisher(publisher), m_registry(registry), m_interval_sec(effectiveInterval(interval_sec)) {
        m_events = xEventGroupCreate();
        if (!m_events) {
            ESP_LOGE(TAG, "Failed to create event group");
        }
    }

    PollLoop::~PollLoop() {
        stop();
        if (m_events) {
            vEventGroupDelete(m_events);
            m_events = nullptr;
        }
    }

    int32_t PollLoop::effectiveInterval(const int32_t configured_sec) {
        if (configured_sec <= 0) return 0;
        return std::max(configured_sec, defaults::STATE_POLL_MIN_SEC);
    }

    esp_err_t PollLoop::start() {
        if (!m_events) return ESP_ERR_NO_MEM;
        if (m_task) return ESP_OK;

        xEventGroupClearBits(m_events, STOP_BIT | TASK_EXITED_BIT);
        if (xTaskCreate(pollTask, "zense_poll", 4096, this, 4, &m_task) != pdPASS) {
            ESP_LOGE(TAG, "Failed to create poll task");
            m_task = nullptr;
            return ESP_ERR_NO_MEM;
        }
        if (timerEnabled()) {
            ESP_LOGI(TAG, "State polling every %ld s", static_cast<long>(m_interval_sec));
        } else {
            ESP_LOGI(TAG, "State polling disabled, levels are not read back from the gateway");
        }
        return ESP_OK;
    }

    void PollLoop::stop() {
        if (!m_events || !m_task) return;
        xEventGroupSetBits(m_events, STOP_BIT);
        // a gateway read in flight is bounded by the socket timeout
        const EventBits_t bits = xEventGroupWaitBits(m_events, TASK_EXITED_BIT, pdFALSE, pdFALSE, pdMS_TO_TICKS(STOP_WARN_MS));
        if (!(bits & TASK_EXITED_BIT)) {
            ESP_LOGW(TAG, "Poll task still busy, waiting for it to exit");
            xEventGroupWaitBits(m_events, TASK_EXITED_BIT, pdFALSE, pdFALSE, portMAX_DELAY);
        }
        m_task = nullptr;
    }

    void PollLoop::requestRefresh() {
        if (m_events) {
            xEventGroupSetBits(m_events, REFRESH_BIT);
        }
    }

    bool PollLoop::stopping() const {
        return (m_events && (xEventGroupGetBits(m_events) & STOP_BIT)) || m_link.isShuttingDown();
    }

    bool PollLoop::ensureEntities() {
        if (!m_registry.empty()) return true;
        if (m_link.getState() != LinkState::AUTHENTICATED) return false;

        if (m_registry.discover(m_link) != ESP_OK) return false;
        m_publisher.publishDiscovery();
        return true;
    }

    size_t PollLoop::pollOnce() {
        if (!timerEnabled()) return 0;

        size_t updated = 0;
        for (const auto& entity : m_registry.entities()) {
            if (stopping()) break;

            // a command applied while the Get is in flight wins over its answer
            const uint32_t revision = m_publisher.stateRevision(entity.id);
            uint8_t level = 0;
            const esp_err_t err = m_link.getLevel(entity.id, level);
            if (err == ZENSE_ERR_SHUTDOWN) break;
            if (err != ESP_OK) {
                ESP_LOGW(TAG, "Get %s failed: %s", entity.id.c_str(), zenseErrToName(err));
                continue;
            }
            m_publisher.publishPolledState(entity.id, level, revision);
            ++updated;
        }
        ESP_LOGD(TAG, "Poll pass finished, %zu lights read", updated);
        return updated;
    }

    void PollLoop::pollTask(void* arg) {
        auto* self = static_cast<PollLoop*>(arg);
        self->run();
        xEventGroupSetBits(self->m_events, TASK_EXITED_BIT);
        vTaskDelete(nullptr);
    }

    void PollLoop::run() {
        while (true) {
            const bool have_entities = ensureEntities();

            TickType_t wait = portMAX_DELAY;
            if (!have_entities) {
                wait = pdMS_TO_TICKS(DISCOVERY_RETRY_MS);
            } else if (timerEnabled()) {
                wait = pdMS_TO_TICKS(static_cast<uint32_t>(m_interval_sec) * 1000);
            }

            const EventBits_t bits = xEventGroupWaitBits(m_events, STOP_BIT | REFRESH_BIT, pdFALSE, pdFALSE, wait);
            if (bits & STOP_BIT) break;
            xEventGroupClearBits(m_events, REFRESH_BIT);

            const bool timed_out = !(bits & REFRESH_BIT);
            if (timed_out && !have_entities) continue;
            if (!ensureEntities()) continue;

            pollOnce();
        }
        ESP_LOGI(TAG, "Poll loop stopped.");
    }
} // zenseMQTT

// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef ZENSEMQTT_NVSHANDLE_HXX
#define ZENSEMQTT_NVSHANDLE_HXX
#include <esp_log.h>
#include <nvs.h>

namespace zenseMQTT::utils {

    // RAII wrapper for NVS handle
    class NvsHandle {
    public:
        NvsHandle(const char* ns, const nvs_open_mode_t mode) {
            const esp_err_t err = nvs_open(ns, mode, &m_handle);
            if (err == ESP_ERR_NVS_NOT_FOUND && mode == NVS_READONLY) {
                // namespace is created on first write
                ESP_LOGD(TAG, "NVS namespace '%s' does not exist yet", ns);
                m_handle = 0;
            } else if (err != ESP_OK) {
                ESP_LOGE(TAG, "Error (%s) opening NVS namespace '%s'", esp_err_to_name(err), ns);
                m_handle = 0;
            }
        }

        ~NvsHandle() {
            if (m_handle) {
                nvs_close(m_handle);
            }
        }

        NvsHandle(const NvsHandle&) = delete;
        NvsHandle& operator=(const NvsHandle&) = delete;

        [[nodiscard]] nvs_handle_t get() const { return m_handle; }
        explicit operator bool() const { return m_handle != 0; }

        esp_err_t commit() const {
            if (!m_handle) return ESP_ERR_INVALID_STATE;
            return nvs_commit(m_handle);
        }

    private:
        static constexpr char TAG[] = "NvsHandle";
        nvs_handle_t m_handle{0};
    };

} // namespace zenseMQTT::utils

#endif //ZENSEMQTT_NVSHANDLE_HXX

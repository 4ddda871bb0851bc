// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "config/SyslogConfig.hxx"
#include "utils/StringUtils.hxx"
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>

namespace zenseMQTT {

    static constexpr char TAG[] = "SyslogService";
    static constexpr uint16_t SYSLOG_DEFAULT_PORT = 514;
    static constexpr size_t MESSAGE_BUFFER_SIZE = 4096;
    static constexpr size_t MAX_LOG_MSG_SIZE = 256;
    // <14> = facility user, severity info
    static constexpr char SYSLOG_HEADER[] = "<14>zense2mqtt: ";

    static SyslogConfig* g_syslog_instance = nullptr;

    esp_err_t SyslogConfig::init(const std::string& server_addr) {
        #if CONFIG_LOG_DEFAULT_LEVEL > 3
            ESP_LOGW(TAG, "IDF log level is set to DEBUG or VERBOSE. Syslog is disabled to prevent instability.");
            return ESP_ERR_NOT_SUPPORTED;
        #endif

        if (m_initialized) {
            return setServer(server_addr);
        }

        if (!g_syslog_instance) {
            g_syslog_instance = this;
        }

        m_log_buffer = xMessageBufferCreate(MESSAGE_BUFFER_SIZE);
        if (!m_log_buffer) {
            ESP_LOGE(TAG, "Failed to create message buffer. Syslog disabled.");
            return ESP_ERR_NO_MEM;
        }

        if (xTaskCreate(syslogTaskEntry, "syslog_task", 4096, this, 3, &m_task_handle) != pdPASS) {
            ESP_LOGE(TAG, "Failed to create syslog task. Syslog disabled.");
            vMessageBufferDelete(m_log_buffer);
            m_log_buffer = nullptr;
            return ESP_ERR_NO_MEM;
        }

        const esp_err_t err = setServer(server_addr);
        m_original_logger = esp_log_set_vprintf(syslogVprintf);
        m_initialized = true;
        ESP_LOGI(TAG, "Syslog forwarding to %s", server_addr.c_str());
        return err;
    }

    esp_err_t SyslogConfig::setServer(const std::string& server_addr) {
        std::lock_guard lock(m_sock_mutex);

        if (m_sock >= 0) {
            ::close(m_sock);
            m_sock = -1;
        }
        m_server_addr = server_addr;

        if (m_server_addr.empty()) {
            ESP_LOGI(TAG, "Syslog server address is empty, remote logging is paused.");
            return ESP_OK;
        }

        std::string host = m_server_addr;
        uint16_t port = SYSLOG_DEFAULT_PORT;
        if (const auto colon = m_server_addr.rfind(':'); colon != std::string::npos) {
            const auto parsed = utils::parseInt<uint16_t>(std::string_view(m_server_addr).substr(colon + 1));
            if (!parsed || *parsed == 0) {
                ESP_LOGE(TAG, "Invalid syslog port in '%s'", m_server_addr.c_str());
                return ESP_ERR_INVALID_ARG;
            }
            host = m_server_addr.substr(0, colon);
            port = *parsed;
        }

        addrinfo hints = {};
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_DGRAM;
        addrinfo* res = nullptr;

        const int err = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
        if (err != 0 || res == nullptr) {
            ESP_LOGE(TAG, "DNS lookup failed for '%s': err=%d", host.c_str(), err);
            return ESP_ERR_NOT_FOUND;
        }

        m_sock = socket(res->ai_family, res->ai_socktype, 0);
        if (m_sock < 0) {
            ESP_LOGE(TAG, "Failed to create socket.");
        } else if (::connect(m_sock, res->ai_addr, res->ai_addrlen) != 0) {
            ESP_LOGE(TAG, "Failed to connect socket.");
            ::close(m_sock);
            m_sock = -1;
        }

        freeaddrinfo(res);
        return m_sock >= 0 ? ESP_OK : ESP_FAIL;
    }

    int SyslogConfig::syslogVprintf(const char *format, va_list args) {
        int ret = 0;
        if (g_syslog_instance && g_syslog_instance->m_original_logger) {
            va_list args_copy;
            va_copy(args_copy, args);
            ret = g_syslog_instance->m_original_logger(format, args_copy);
            va_end(args_copy);
        }

        if (!g_syslog_instance || !g_syslog_instance->m_log_buffer) {
            return ret;
        }
    #if !CONFIG_IDF_TARGET_LINUX
        if (xPortInIsrContext()) {
            return ret;
        }
    #endif
        if (xTaskGetCurrentTaskHandle() == g_syslog_instance->m_task_handle) {
            return ret;
        }

        std::array<char, 192> msg_buffer{};
        const int len = vsnprintf(msg_buffer.data(), msg_buffer.size(), format, args);
        if (len > 0) {
            const size_t actual_len = std::min(static_cast<size_t>(len), msg_buffer.size() - 1);
            xMessageBufferSend(g_syslog_instance->m_log_buffer, msg_buffer.data(), actual_len, 0);
        }
        return ret;
    }

    void SyslogConfig::syslogTaskEntry(void* arg) {
        static_cast<SyslogConfig*>(arg)->syslogTaskRunner();
    }

    void SyslogConfig::syslogTaskRunner() {
        std::array<char, MAX_LOG_MSG_SIZE + 1> recv_buffer{};

        while (true) {
            const size_t received_bytes = xMessageBufferReceive(
                m_log_buffer,
                recv_buffer.data(),
                recv_buffer.size() - 1,
                portMAX_DELAY
            );

            if (received_bytes > 0) {
                recv_buffer[received_bytes] = '\0';
                sendLogUdp(recv_buffer.data(), received_bytes);
            }
        }
    }

    void SyslogConfig::sendLogUdp(const char* message, size_t msg_len) {
        std::lock_guard lock(m_sock_mutex);

        if (m_sock < 0 || m_server_addr.empty()) {
            return;
        }

        while (msg_len > 0 && (message[msg_len - 1] == '\n' || message[msg_len - 1] == '\r')) {
            msg_len--;
        }
        if (msg_len == 0) return;

        std::array<char, MAX_LOG_MSG_SIZE + sizeof(SYSLOG_HEADER)> packet_buf{};
        constexpr size_t header_len = sizeof(SYSLOG_HEADER) - 1;
        memcpy(packet_buf.data(), SYSLOG_HEADER, header_len);

        const size_t copy_len = std::min(msg_len, packet_buf.size() - header_len - 1);
        memcpy(packet_buf.data() + header_len, message, copy_len);

        send(m_sock, packet_buf.data(), header_len + copy_len, 0);
    }

} // zenseMQTT

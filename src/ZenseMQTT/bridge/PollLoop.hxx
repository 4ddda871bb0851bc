// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef ZENSEMQTT_POLLLOOP_HXX
#define ZENSEMQTT_POLLLOOP_HXX

namespace zenseMQTT
{
    class ZenseLink;
    class StatePublisher;
    class EntityRegistry;

    /**
     * @brief Reads the level of every known light on a timer and publishes it.
     *
     * Picks up changes made at wall switches, which the gateway never reports
     * on its own. A refresh can also be requested out of band (gateway session
     * came up, Home Assistant restarted). With polling disabled no level is
     * ever read, the task only runs device discovery. While the registry is
     * still empty the loop first tries to discover devices on the gateway.
     */
    class PollLoop {
    public:
        PollLoop(ZenseLink& link, StatePublisher& publisher, EntityRegistry& registry, int32_t interval_sec);
        ~PollLoop();

        PollLoop(const PollLoop&) = delete;
        PollLoop& operator=(const PollLoop&) = delete;

        esp_err_t start();
        void stop();

        /**
         * @brief One pass over all entities, failures are logged and skipped.
         * @return number of entities whose level was read, 0 when polling is disabled
         */
        size_t pollOnce();

        // Wakes the loop for discovery and, when polling is enabled, an immediate pass
        void requestRefresh();

        /**
         * @brief Registers gateway devices when none are configured.
         * @return true when the registry holds at least one entity afterwards
         */
        bool ensureEntities();

        [[nodiscard]] bool timerEnabled() const { return m_interval_sec > 0; }

        // <= 0 disables the timer, anything else is raised to the minimum
        static int32_t effectiveInterval(int32_t configured_sec);

    private:
        static void pollTask(void* arg);
        void run();
        [[nodiscard]] bool stopping() const;

        ZenseLink& m_link;
        StatePublisher& m_publisher;
        EntityRegistry& m_registry;
        const int32_t m_interval_sec;

        EventGroupHandle_t m_events{nullptr};
        TaskHandle_t m_task{nullptr};
    };
} // zenseMQTT

#endif //ZENSEMQTT_POLLLOOP_HXX

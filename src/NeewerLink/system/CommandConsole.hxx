// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef NEEWERLINK_COMMANDCONSOLE_HXX
#define NEEWERLINK_COMMANDCONSOLE_HXX

#include "protocol/Protocol.hxx"

namespace neewerLink
{
    struct ConsoleCommand {
        enum class Kind : uint8_t {
            Help,
            On,
            Off,
            Status,
            Ports,
            Connect,
            Disconnect,
            SetLight,
            ShowConfig,
            UpdateConfig
        };

        Kind kind{Kind::Help};
        uint8_t brightness{0};
        uint32_t kelvin{Protocol::DEFAULT_TEMP_K};
        std::string argument{};     // port for Connect, JSON text for UpdateConfig
    };

    /**
     * @brief Line-oriented operator commands read from stdin.
     *
     *   <brightness> [kelvin]   set brightness 0..100 and color temperature
     *   on | off                full brightness / dark, at the default temperature
     *   status                  connection and last reported light state
     *   ports                   serial ports matching the configured filter
     *   connect [port]          connect to port, or to the configured / discovered one
     *   disconnect
     *   config [json]           show the configuration, or merge json into it
     */
    class CommandConsole {
    public:
        CommandConsole(const CommandConsole&) = delete;
        CommandConsole& operator=(const CommandConsole&) = delete;

        static CommandConsole& Instance() {
            static CommandConsole instance;
            return instance;
        }

        esp_err_t start();

        // nullopt for blank lines and anything that is not a command
        [[nodiscard]] static std::optional<ConsoleCommand> parse(std::string_view line);

        esp_err_t execute(const ConsoleCommand& command);

    private:
        CommandConsole() = default;

        static void consoleTask(void* pvParameters);
        void handleLine(std::string_view line);

        TaskHandle_t m_task_handle{nullptr};
        std::atomic<bool> m_started{false};
    };
}

#endif //NEEWERLINK_COMMANDCONSOLE_HXX

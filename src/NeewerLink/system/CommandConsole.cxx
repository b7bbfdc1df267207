// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "system/CommandConsole.hxx"
#include "system/AppController.hxx"
#include "light/LightController.hxx"
#include <poll.h>
#include <unistd.h>

namespace neewerLink
{
    static constexpr char TAG[] = "Console";
    static constexpr size_t MAX_LINE_LENGTH = 1024;
    static constexpr int STDIN_POLL_MS = 100;

    static std::string_view trim(std::string_view text) {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
        return text;
    }

    // Splits off the first word; rest keeps the trimmed remainder
    static std::string_view nextToken(std::string_view& rest) {
        size_t end = 0;
        while (end < rest.size() && !std::isspace(static_cast<unsigned char>(rest[end]))) ++end;
        const std::string_view token = rest.substr(0, end);
        rest = trim(rest.substr(end));
        return token;
    }

    static bool equalsIgnoreCase(const std::string_view a, const std::string_view b) {
        return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](const char x, const char y) {
            return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
        });
    }

    template <typename T>
    static std::optional<T> parseNumber(const std::string_view token) {
        T value{};
        const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
        if (ec != std::errc{} || ptr != token.data() + token.size()) {
            return std::nullopt;
        }
        return value;
    }

    std::optional<ConsoleCommand> CommandConsole::parse(const std::string_view line) {
        std::string_view rest = trim(line);
        if (rest.empty()) return std::nullopt;

        const std::string_view word = nextToken(rest);
        ConsoleCommand command;

        // Commands that take no arguments
        static constexpr std::pair<const char*, ConsoleCommand::Kind> simple[] = {
            {"help", ConsoleCommand::Kind::Help},
            {"on", ConsoleCommand::Kind::On},
            {"off", ConsoleCommand::Kind::Off},
            {"status", ConsoleCommand::Kind::Status},
            {"ports", ConsoleCommand::Kind::Ports},
            {"disconnect", ConsoleCommand::Kind::Disconnect},
        };
        for (const auto& [name, kind] : simple) {
            if (equalsIgnoreCase(word, name)) {
                if (!rest.empty()) return std::nullopt;
                command.kind = kind;
                return command;
            }
        }

        if (equalsIgnoreCase(word, "connect")) {
            command.kind = ConsoleCommand::Kind::Connect;
            command.argument = std::string(rest);
            return command;
        }

        if (equalsIgnoreCase(word, "config")) {
            command.kind = rest.empty() ? ConsoleCommand::Kind::ShowConfig : ConsoleCommand::Kind::UpdateConfig;
            command.argument = std::string(rest);
            return command;
        }

        const auto brightness = parseNumber<long>(word);
        if (!brightness) return std::nullopt;
        command.kind = ConsoleCommand::Kind::SetLight;
        command.brightness = static_cast<uint8_t>(std::clamp<long>(*brightness, 0, Protocol::BRIGHTNESS_MAX));

        if (!rest.empty()) {
            const auto kelvin = parseNumber<uint32_t>(nextToken(rest));
            if (!kelvin || !rest.empty()) return std::nullopt;
            command.kelvin = *kelvin;
        }
        return command;
    }

    esp_err_t CommandConsole::execute(const ConsoleCommand& command) {
        auto& light = LightController::Instance();

        switch (command.kind) {
            case ConsoleCommand::Kind::Help:
                ESP_LOGI(TAG, "Commands:");
                ESP_LOGI(TAG, "  <brightness> [kelvin]  brightness 0..100, temperature %lu..%luK (default %luK)",
                         static_cast<unsigned long>(Protocol::TEMP_MIN_K),
                         static_cast<unsigned long>(Protocol::TEMP_MAX_K),
                         static_cast<unsigned long>(Protocol::DEFAULT_TEMP_K));
                ESP_LOGI(TAG, "  on | off | status | ports | connect [port] | disconnect");
                ESP_LOGI(TAG, "  config [json]          show or update the configuration");
                return ESP_OK;

            case ConsoleCommand::Kind::On:
                return light.turnOn();

            case ConsoleCommand::Kind::Off:
                return light.turnOff();

            case ConsoleCommand::Kind::SetLight:
                return light.setLight(command.brightness, command.kelvin);

            case ConsoleCommand::Kind::Status: {
                if (!light.isConnected()) {
                    ESP_LOGI(TAG, "Not connected.");
                    return ESP_OK;
                }
                const std::string port = light.portName();
                if (const auto status = AppController::Instance().lastStatus()) {
                    ESP_LOGI(TAG, "Connected to %s: brightness=%u%% temp=%luK", port.c_str(),
                             status->brightness, static_cast<unsigned long>(status->kelvin));
                } else {
                    ESP_LOGI(TAG, "Connected to %s, no status report yet. Turn the knob on the light to trigger one.",
                             port.c_str());
                }
                return ESP_OK;
            }

            case ConsoleCommand::Kind::Ports: {
                const auto ports = light.listPorts();
                if (ports.empty()) {
                    ESP_LOGW(TAG, "No serial ports match the configured filter.");
                    return ESP_ERR_NOT_FOUND;
                }
                for (const auto& port : ports) {
                    ESP_LOGI(TAG, "  %s", port.c_str());
                }
                return ESP_OK;
            }

            case ConsoleCommand::Kind::Connect:
                if (command.argument.empty()) {
                    return AppController::Instance().connectConfiguredPort();
                }
                return light.connect(command.argument);

            case ConsoleCommand::Kind::Disconnect:
                light.disconnect();
                return ESP_OK;

            case ConsoleCommand::Kind::ShowConfig: {
                auto& config = ConfigManager::Instance();
                cJSON* root = config.getSerializedConfig();
                char* text = cJSON_PrintUnformatted(root);
                cJSON_Delete(root);
                if (text == nullptr) {
                    return ESP_ERR_NO_MEM;
                }
                ESP_LOGI(TAG, "%s: %s", config.getPath().c_str(), text);
                cJSON_free(text);
                return ESP_OK;
            }

            case ConsoleCommand::Kind::UpdateConfig: {
                const auto result = ConfigManager::Instance().updateConfigFromJson(command.argument.c_str());
                if (result == ConfigUpdateResult::NoUpdate) {
                    ESP_LOGW(TAG, "Configuration not changed.");
                    return ESP_ERR_INVALID_ARG;
                }
                AppController::Instance().applyConfigUpdate(result);
                return ESP_OK;
            }
        }
        return ESP_ERR_NOT_SUPPORTED;
    }

    void CommandConsole::handleLine(const std::string_view line) {
        const auto command = parse(line);
        if (!command) {
            if (const auto text = trim(line); !text.empty()) {
                ESP_LOGW(TAG, "Unknown command '%.*s'. Type 'help' for usage.", static_cast<int>(text.size()), text.data());
            }
            return;
        }
        if (const esp_err_t err = execute(*command); err != ESP_OK) {
            ESP_LOGW(TAG, "Command failed: %s", errorToName(err));
        }
    }

    esp_err_t CommandConsole::start() {
        if (m_started) return ESP_OK;

        if (xTaskCreate(consoleTask, "console", 8192, this, 3, &m_task_handle) != pdPASS) {
            ESP_LOGE(TAG, "Failed to create console task");
            return ESP_ERR_NO_MEM;
        }
        m_started = true;
        ESP_LOGI(TAG, "Command console ready. Type 'help' for usage.");
        return ESP_OK;
    }

    void CommandConsole::consoleTask(void* pvParameters) {
        auto* self = static_cast<CommandConsole*>(pvParameters);
        std::string pending;
        std::array<char, 128> chunk{};

        while (true) {
            pollfd pfd{ .fd = STDIN_FILENO, .events = POLLIN, .revents = 0 };
            const int ready = poll(&pfd, 1, STDIN_POLL_MS);
            if (ready == 0 || (ready < 0 && errno == EINTR)) {
                continue;
            }
            if (ready < 0) {
                ESP_LOGE(TAG, "poll(stdin) failed: %s", strerror(errno));
                break;
            }

            const ssize_t n = ::read(STDIN_FILENO, chunk.data(), chunk.size());
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                ESP_LOGE(TAG, "read(stdin) failed: %s", strerror(errno));
                break;
            }
            if (n == 0) {
                ESP_LOGI(TAG, "stdin closed, console stopped.");
                break;
            }

            pending.append(chunk.data(), static_cast<size_t>(n));
            size_t eol;
            while ((eol = pending.find('\n')) != std::string::npos) {
                self->handleLine(std::string_view(pending).substr(0, eol));
                pending.erase(0, eol + 1);
            }
            if (pending.size() > MAX_LINE_LENGTH) {
                ESP_LOGW(TAG, "Discarding over-long input line");
                pending.clear();
            }
        }

        self->m_started = false;
        vTaskDelete(nullptr);
    }
}

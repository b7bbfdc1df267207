// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef NEEWERLINK_SERIALPORT_HXX
#define NEEWERLINK_SERIALPORT_HXX

#include "serial/SerialErrors.hxx"

namespace neewerLink
{
    // Fixed line settings of the panel: 115200 8-N-1, 100 ms read timeout
    inline constexpr uint32_t SERIAL_BAUD_RATE = 115200;
    inline constexpr int SERIAL_READ_TIMEOUT_MS = 100;

    // RAII owner of a tty file descriptor
    class SerialPort {
    public:
        SerialPort() = default;
        ~SerialPort();

        SerialPort(SerialPort&& other) noexcept;
        SerialPort& operator=(SerialPort&& other) noexcept;

        SerialPort(const SerialPort&) = delete;
        SerialPort& operator=(const SerialPort&) = delete;

        /**
         * @brief Opens the device in raw mode with the fixed line settings.
         * @return ESP_OK or NEEWERLINK_ERR_PORT_OPEN_FAILED.
         */
        esp_err_t open(const std::string& path);

        /**
         * @brief Duplicates the descriptor; both refer to the same device session.
         * @return ESP_OK or NEEWERLINK_ERR_PORT_CLONE_FAILED.
         */
        esp_err_t duplicate(SerialPort& out) const;

        /**
         * @brief Waits up to timeout_ms for input and reads what is available.
         * @return ESP_OK with out_len > 0, ESP_ERR_TIMEOUT when nothing arrived,
         *         NEEWERLINK_ERR_READ_FAILED on I/O error or hang-up.
         */
        esp_err_t read(uint8_t* buffer, size_t capacity, size_t& out_len, int timeout_ms) const;

        // Writes every byte; short writes are continued, errors are not retried.
        esp_err_t writeAll(std::span<const uint8_t> data) const;

        // Blocks until the output queue has been transmitted.
        esp_err_t flush() const;

        void close();

        [[nodiscard]] bool isOpen() const { return m_fd >= 0; }
        [[nodiscard]] const std::string& path() const { return m_path; }

    private:
        esp_err_t configure() const;

        int m_fd{-1};
        std::string m_path{};
    };
}

#endif //NEEWERLINK_SERIALPORT_HXX

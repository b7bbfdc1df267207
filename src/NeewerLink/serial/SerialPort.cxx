// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "serial/SerialPort.hxx"
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace neewerLink
{
    static constexpr char TAG[] = "SerialPort";

    SerialPort::~SerialPort() {
        close();
    }

    SerialPort::SerialPort(SerialPort&& other) noexcept
        : m_fd(std::exchange(other.m_fd, -1)), m_path(std::move(other.m_path)) {
    }

    SerialPort& SerialPort::operator=(SerialPort&& other) noexcept {
        if (this != &other) {
            close();
            m_fd = std::exchange(other.m_fd, -1);
            m_path = std::move(other.m_path);
        }
        return *this;
    }

    esp_err_t SerialPort::open(const std::string& path) {
        close();

        // O_NONBLOCK only so that open() does not wait for carrier detect
        const int fd = ::open(path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
        if (fd < 0) {
            ESP_LOGE(TAG, "Failed to open %s: %s", path.c_str(), strerror(errno));
            return NEEWERLINK_ERR_PORT_OPEN_FAILED;
        }
        m_fd = fd;
        m_path = path;

        if (configure() != ESP_OK) {
            close();
            return NEEWERLINK_ERR_PORT_OPEN_FAILED;
        }

        ESP_LOGI(TAG, "Opened %s at %lu baud, 8N1", path.c_str(), static_cast<unsigned long>(SERIAL_BAUD_RATE));
        return ESP_OK;
    }

    esp_err_t SerialPort::configure() const {
        termios tty{};
        if (tcgetattr(m_fd, &tty) != 0) {
            ESP_LOGE(TAG, "tcgetattr(%s) failed: %s", m_path.c_str(), strerror(errno));
            return ESP_FAIL;
        }

        cfmakeraw(&tty);
        cfsetispeed(&tty, B115200);
        cfsetospeed(&tty, B115200);

        tty.c_cflag &= ~(PARENB | CSTOPB | CSIZE | CRTSCTS);
        tty.c_cflag |= CS8 | CLOCAL | CREAD;

        // Reads are bounded by poll(); read() itself never blocks
        tty.c_cc[VMIN] = 0;
        tty.c_cc[VTIME] = 0;

        if (tcsetattr(m_fd, TCSANOW, &tty) != 0) {
            ESP_LOGE(TAG, "tcsetattr(%s) failed: %s", m_path.c_str(), strerror(errno));
            return ESP_FAIL;
        }

        // Back to blocking mode for writes
        const int flags = fcntl(m_fd, F_GETFL);
        if (flags < 0 || fcntl(m_fd, F_SETFL, flags & ~O_NONBLOCK) != 0) {
            ESP_LOGE(TAG, "fcntl(%s) failed: %s", m_path.c_str(), strerror(errno));
            return ESP_FAIL;
        }

        tcflush(m_fd, TCIOFLUSH);
        return ESP_OK;
    }

    esp_err_t SerialPort::duplicate(SerialPort& out) const {
        if (m_fd < 0) {
            return NEEWERLINK_ERR_PORT_CLONE_FAILED;
        }
        const int fd = ::dup(m_fd);
        if (fd < 0) {
            ESP_LOGE(TAG, "Failed to clone %s: %s", m_path.c_str(), strerror(errno));
            return NEEWERLINK_ERR_PORT_CLONE_FAILED;
        }
        out.close();
        out.m_fd = fd;
        out.m_path = m_path;
        return ESP_OK;
    }

    esp_err_t SerialPort::read(uint8_t* buffer, const size_t capacity, size_t& out_len, const int timeout_ms) const {
        out_len = 0;
        if (m_fd < 0) {
            return NEEWERLINK_ERR_READ_FAILED;
        }

        pollfd pfd{ .fd = m_fd, .events = POLLIN, .revents = 0 };
        const int ready = poll(&pfd, 1, timeout_ms);
        if (ready == 0) {
            return ESP_ERR_TIMEOUT;
        }
        if (ready < 0) {
            // Scheduler signals interrupt the wait; treat like an expired timeout
            if (errno == EINTR) return ESP_ERR_TIMEOUT;
            ESP_LOGE(TAG, "poll(%s) failed: %s", m_path.c_str(), strerror(errno));
            return NEEWERLINK_ERR_READ_FAILED;
        }

        if (pfd.revents & POLLIN) {
            const ssize_t n = ::read(m_fd, buffer, capacity);
            if (n > 0) {
                out_len = static_cast<size_t>(n);
                return ESP_OK;
            }
            if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
                return ESP_ERR_TIMEOUT;
            }
            if (n == 0) {
                ESP_LOGW(TAG, "%s: end of stream", m_path.c_str());
            } else {
                ESP_LOGE(TAG, "read(%s) failed: %s", m_path.c_str(), strerror(errno));
            }
            return NEEWERLINK_ERR_READ_FAILED;
        }

        ESP_LOGW(TAG, "%s: device hung up (revents=0x%x)", m_path.c_str(), pfd.revents);
        return NEEWERLINK_ERR_READ_FAILED;
    }

    esp_err_t SerialPort::writeAll(const std::span<const uint8_t> data) const {
        if (m_fd < 0) {
            return NEEWERLINK_ERR_NOT_CONNECTED;
        }
        size_t written = 0;
        while (written < data.size()) {
            const ssize_t n = ::write(m_fd, data.data() + written, data.size() - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                ESP_LOGE(TAG, "write(%s) failed: %s", m_path.c_str(), strerror(errno));
                return NEEWERLINK_ERR_WRITE_FAILED;
            }
            if (n == 0) {
                ESP_LOGE(TAG, "write(%s) made no progress (%zu of %zu bytes)", m_path.c_str(), written, data.size());
                return NEEWERLINK_ERR_WRITE_FAILED;
            }
            written += static_cast<size_t>(n);
        }
        return ESP_OK;
    }

    esp_err_t SerialPort::flush() const {
        if (m_fd < 0) {
            return NEEWERLINK_ERR_NOT_CONNECTED;
        }
        int rc;
        do {
            rc = tcdrain(m_fd);
        } while (rc != 0 && errno == EINTR);

        if (rc != 0) {
            ESP_LOGE(TAG, "tcdrain(%s) failed: %s", m_path.c_str(), strerror(errno));
            return NEEWERLINK_ERR_FLUSH_FAILED;
        }
        return ESP_OK;
    }

    void SerialPort::close() {
        if (m_fd >= 0) {
            ::close(m_fd);
            m_fd = -1;
        }
    }
}

// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "serial/FrameAssembler.hxx"
#include "protocol/Protocol.hxx"

namespace neewerLink
{
    static constexpr char TAG[] = "FrameAssembler";

    void FrameAssembler::append(const uint8_t* data, const size_t len) {
        if (data == nullptr || len == 0) return;
        m_buffer.insert(m_buffer.end(), data, data + len);
    }

    void FrameAssembler::extract(const StatusHandler& handler) {
        while (!m_buffer.empty()) {
            const auto start = std::find(m_buffer.begin(), m_buffer.end(), Protocol::SENTINEL);
            if (start == m_buffer.end()) {
                ESP_LOGD(TAG, "No sentinel in %zu buffered bytes, dropping them", m_buffer.size());
                m_bytes_discarded += static_cast<uint32_t>(m_buffer.size());
                m_buffer.clear();
                return;
            }
            if (start != m_buffer.begin()) {
                const auto skipped = static_cast<size_t>(std::distance(m_buffer.begin(), start));
                ESP_LOGD(TAG, "Resync: skipped %zu bytes before sentinel", skipped);
                m_bytes_discarded += static_cast<uint32_t>(skipped);
                m_buffer.erase(m_buffer.begin(), start);
            }
            if (m_buffer.size() < Protocol::FRAME_SIZE) {
                return;
            }

            const std::span<const uint8_t> window(m_buffer.data(), Protocol::FRAME_SIZE);
            if (const auto frame = Protocol::parseStatusFrame(window)) {
                ++m_frames_decoded;
                if (handler) {
                    handler(Protocol::decodeStatus(*frame));
                }
            } else {
                ++m_frames_rejected;
                ESP_LOGD(TAG, "Dropping invalid frame: %s", Protocol::formatBytes(window).c_str());
            }
            m_buffer.erase(m_buffer.begin(), m_buffer.begin() + Protocol::FRAME_SIZE);
        }
    }

    std::vector<LightStatus> FrameAssembler::feed(const uint8_t* data, const size_t len) {
        std::vector<LightStatus> decoded;
        append(data, len);
        extract([&decoded](const LightStatus& status) { decoded.push_back(status); });
        return decoded;
    }

    void FrameAssembler::reset() {
        m_buffer.clear();
        m_frames_decoded = 0;
        m_frames_rejected = 0;
        m_bytes_discarded = 0;
    }
}

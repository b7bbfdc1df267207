// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef NEEWERLINK_FRAMEASSEMBLER_HXX
#define NEEWERLINK_FRAMEASSEMBLER_HXX

#include "light/LightTypes.hxx"

namespace neewerLink
{
    /**
     * @brief Accumulates raw serial bytes and cuts them into 8-byte status frames.
     *
     * The stream has no delimiter besides the 0x3A sentinel and the fixed frame length.
     * Bytes ahead of the first sentinel are dropped. An 8-byte window that fails the
     * header or checksum check is dropped as a whole, scanning resumes after it.
     */
    class FrameAssembler {
    public:
        using StatusHandler = std::function<void(const LightStatus&)>;

        void append(const uint8_t* data, size_t len);

        // Extracts every complete frame currently buffered; valid ones go to handler.
        void extract(const StatusHandler& handler);

        // append() followed by extract(), collecting the results
        [[nodiscard]] std::vector<LightStatus> feed(const uint8_t* data, size_t len);

        void reset();

        [[nodiscard]] size_t buffered() const { return m_buffer.size(); }
        [[nodiscard]] uint32_t framesDecoded() const { return m_frames_decoded; }
        [[nodiscard]] uint32_t framesRejected() const { return m_frames_rejected; }
        [[nodiscard]] uint32_t bytesDiscarded() const { return m_bytes_discarded; }

    private:
        std::vector<uint8_t> m_buffer{};
        uint32_t m_frames_decoded{0};
        uint32_t m_frames_rejected{0};
        uint32_t m_bytes_discarded{0};
    };
}

#endif //NEEWERLINK_FRAMEASSEMBLER_HXX

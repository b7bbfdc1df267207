// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "protocol/Protocol.hxx"

namespace neewerLink::Protocol {

    Packet buildCommandPacket(const std::span<const uint8_t> payload) {
        const auto cs = checksum(payload);
        Packet packet;
        packet.reserve(payload.size() + cs.size());
        packet.insert(packet.end(), payload.begin(), payload.end());
        packet.insert(packet.end(), cs.begin(), cs.end());
        return packet;
    }

    Packet encodeCctCommand(const uint8_t brightness, const uint32_t kelvin) {
        const std::array<uint8_t, 6> payload = {
            SENTINEL,
            TAG_CCT,
            CCT_PAYLOAD_LENGTH,
            CCT_MODE,
            std::min(brightness, BRIGHTNESS_MAX),
            kelvinToByte(kelvin)
        };
        return buildCommandPacket(payload);
    }

    std::optional<StatusFrame> parseStatusFrame(const std::span<const uint8_t> data) {
        if (data.size() < FRAME_SIZE || data[0] != SENTINEL || data[1] != TAG_CCT) {
            return std::nullopt;
        }
        const auto expected = checksum(data.first(6));
        if (data[6] != expected[0] || data[7] != expected[1]) {
            return std::nullopt;
        }
        return StatusFrame{ .brightness = data[4], .temp_step = data[5] };
    }

    LightStatus decodeStatus(const StatusFrame& frame) {
        return LightStatus{ .brightness = frame.brightness, .kelvin = byteToKelvin(frame.temp_step) };
    }

    std::string formatBytes(const std::span<const uint8_t> data) {
        std::string out;
        out.reserve(data.size() * 3);
        char hex[4];
        for (size_t i = 0; i < data.size(); ++i) {
            snprintf(hex, sizeof(hex), i == 0 ? "%02X" : " %02X", data[i]);
            out += hex;
        }
        return out;
    }
}

// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef NEEWERLINK_PROTOCOL_HXX
#define NEEWERLINK_PROTOCOL_HXX

#include "light/LightTypes.hxx"

// Neewer PL81-Pro USB serial protocol.
//
// Command: 3A <tag> <len> <payload...> <cs_hi> <cs_lo>
// CCT:     3A 02 03 01 <brightness 0-100> <temp step 0-18> <cs_hi> <cs_lo>
// Status:  3A 02 xx xx <brightness> <temp step> <cs_hi> <cs_lo>
// Checksum is the 16-bit big-endian sum of all preceding bytes.
namespace neewerLink::Protocol {

    inline constexpr uint8_t SENTINEL           = 0x3A;
    inline constexpr uint8_t TAG_CCT            = 0x02;
    inline constexpr uint8_t CCT_PAYLOAD_LENGTH = 0x03;
    inline constexpr uint8_t CCT_MODE           = 0x01;
    inline constexpr size_t  FRAME_SIZE         = 8;

    inline constexpr uint8_t  BRIGHTNESS_MAX = 100;
    inline constexpr uint32_t TEMP_MIN_K     = 2900;
    inline constexpr uint32_t TEMP_MAX_K     = 7000;
    inline constexpr uint32_t TEMP_STEPS     = 18;   // 0x00 = 2900K, 0x12 = 7000K
    inline constexpr uint32_t DEFAULT_TEMP_K = 4950; // midpoint, step 9

    using Packet = std::vector<uint8_t>;

    struct StatusFrame {
        uint8_t brightness{0};
        uint8_t temp_step{0};
        auto operator<=>(const StatusFrame&) const = default;
    };

    [[nodiscard]] constexpr std::array<uint8_t, 2> checksum(std::span<const uint8_t> data) {
        uint16_t sum = 0;
        for (const uint8_t b : data) {
            sum = static_cast<uint16_t>(sum + b);
        }
        return { static_cast<uint8_t>(sum >> 8), static_cast<uint8_t>(sum & 0xFF) };
    }

    /**
     * @brief Kelvin to protocol temperature step, rounding half up.
     */
    [[nodiscard]] constexpr uint8_t kelvinToByte(uint32_t kelvin) {
        const uint32_t k = std::clamp(kelvin, TEMP_MIN_K, TEMP_MAX_K);
        constexpr uint32_t range = TEMP_MAX_K - TEMP_MIN_K;
        const uint32_t step = ((k - TEMP_MIN_K) * TEMP_STEPS * 2 + range) / (range * 2);
        return static_cast<uint8_t>(std::min(step, TEMP_STEPS));
    }

    /**
     * @brief Protocol temperature step to Kelvin. Lossy inverse of kelvinToByte().
     */
    [[nodiscard]] constexpr uint32_t byteToKelvin(uint8_t step) {
        const uint32_t b = std::min<uint32_t>(step, TEMP_STEPS);
        return TEMP_MIN_K + (b * (TEMP_MAX_K - TEMP_MIN_K) + TEMP_STEPS / 2) / TEMP_STEPS;
    }

    /**
     * @brief Appends the checksum to a payload that already starts with sentinel, tag and length.
     */
    [[nodiscard]] Packet buildCommandPacket(std::span<const uint8_t> payload);

    /**
     * @brief Builds the 8-byte CCT command. Brightness above 100 is capped.
     */
    [[nodiscard]] Packet encodeCctCommand(uint8_t brightness, uint32_t kelvin);

    /**
     * @brief Validates header and checksum of an 8-byte status frame.
     * @return brightness and temperature step, or std::nullopt if the bytes are not a valid frame.
     */
    [[nodiscard]] std::optional<StatusFrame> parseStatusFrame(std::span<const uint8_t> data);

    [[nodiscard]] LightStatus decodeStatus(const StatusFrame& frame);

    // "3A 02 03 ..." for logging
    [[nodiscard]] std::string formatBytes(std::span<const uint8_t> data);
}

#endif //NEEWERLINK_PROTOCOL_HXX

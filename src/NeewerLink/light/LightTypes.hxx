// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef NEEWERLINK_LIGHTTYPES_HXX
#define NEEWERLINK_LIGHTTYPES_HXX

namespace neewerLink
{
    // Decoded state reported by the panel
    struct LightStatus {
        uint8_t brightness{0};   // 0..100 %
        uint32_t kelvin{0};      // 2900..7000 K
        auto operator<=>(const LightStatus&) const = default;
    };

    enum class LightEventType : uint8_t {
        StatusChanged,
        Disconnected
    };

    // Item type of the session event queue. Copied by value into the queue.
    struct LightEvent {
        LightEventType type{LightEventType::StatusChanged};
        LightStatus status{};
    };
}

#endif //NEEWERLINK_LIGHTTYPES_HXX

// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef NEEWERLINK_SERIALERRORS_HXX
#define NEEWERLINK_SERIALERRORS_HXX

// Project error codes, kept clear of the ESP-IDF component ranges.
#define NEEWERLINK_ERR_BASE              0xA000
#define NEEWERLINK_ERR_PORT_OPEN_FAILED  (NEEWERLINK_ERR_BASE + 1)
#define NEEWERLINK_ERR_PORT_CLONE_FAILED (NEEWERLINK_ERR_BASE + 2)
#define NEEWERLINK_ERR_NOT_CONNECTED     (NEEWERLINK_ERR_BASE + 3)
#define NEEWERLINK_ERR_WRITE_FAILED      (NEEWERLINK_ERR_BASE + 4)
#define NEEWERLINK_ERR_FLUSH_FAILED      (NEEWERLINK_ERR_BASE + 5)
#define NEEWERLINK_ERR_READ_FAILED       (NEEWERLINK_ERR_BASE + 6)

namespace neewerLink
{
    /**
     * @brief Name of a project error code; falls back to esp_err_to_name() for ESP-IDF codes.
     */
    [[nodiscard]] const char* errorToName(esp_err_t code);
}

#endif //NEEWERLINK_SERIALERRORS_HXX

// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "serial/SerialErrors.hxx"

namespace neewerLink
{
    const char* errorToName(const esp_err_t code) {
        switch (code) {
            case NEEWERLINK_ERR_PORT_OPEN_FAILED:  return "PORT_OPEN_FAILED";
            case NEEWERLINK_ERR_PORT_CLONE_FAILED: return "PORT_CLONE_FAILED";
            case NEEWERLINK_ERR_NOT_CONNECTED:     return "PORT_NOT_OPEN";
            case NEEWERLINK_ERR_WRITE_FAILED:      return "WRITE_FAILED";
            case NEEWERLINK_ERR_FLUSH_FAILED:      return "FLUSH_FAILED";
            case NEEWERLINK_ERR_READ_FAILED:       return "READ_FAILED";
            default:                               return esp_err_to_name(code);
        }
    }
}

// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef NEEWERLINK_FILEHANDLE_HXX
#define NEEWERLINK_FILEHANDLE_HXX
#include <cstdio>

// RAII wrapper for FILE handle
class FileHandle {
public:
    explicit FileHandle(const char* path, const char* mode) {
        m_file = fopen(path, mode);
    }

    ~FileHandle() {
        if (m_file) {
            fclose(m_file);
        }
    }

    [[nodiscard]] FILE* get() const { return m_file; }
    explicit operator bool() const { return m_file != nullptr; }

    // Whole remaining content, empty on read error
    [[nodiscard]] std::string readAll() const {
        std::string content;
        if (!m_file) return content;
        char buf[512];
        size_t n;
        while ((n = fread(buf, 1, sizeof(buf), m_file)) > 0) {
            content.append(buf, n);
        }
        if (ferror(m_file)) content.clear();
        return content;
    }

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;
private:
    FILE* m_file{nullptr};
};
#endif //NEEWERLINK_FILEHANDLE_HXX

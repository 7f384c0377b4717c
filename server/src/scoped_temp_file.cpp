/**
 * @file scoped_temp_file.cpp
 * @brief Request-scoped temporary file removed on destruction
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "c2pasign/server/scoped_temp_file.h"
#include "c2pasign/common/error.h"
#include <glog/logging.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <unistd.h>

namespace c2pasign {
namespace server {

ScopedTempFile::ScopedTempFile(const std::string& directory, const std::string& suffix) {
    std::string name = directory;
    if (name.empty()) {
        name = "/tmp";
    }
    if (name.back() != '/') {
        name += '/';
    }
    name += "c2pasign-XXXXXX" + suffix;

    std::vector<char> buffer(name.begin(), name.end());
    buffer.push_back('\0');

    int fd = mkstemps(buffer.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        throw EngineError("Failed to create temporary file in " + directory + ": " +
                          std::strerror(errno));
    }
    close(fd);

    path_ = buffer.data();
}

ScopedTempFile::~ScopedTempFile() {
    Remove();
}

ScopedTempFile::ScopedTempFile(ScopedTempFile&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScopedTempFile& ScopedTempFile::operator=(ScopedTempFile&& other) noexcept {
    if (this != &other) {
        Remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void ScopedTempFile::Remove() noexcept {
    if (path_.empty()) {
        return;
    }
    if (unlink(path_.c_str()) != 0 && errno != ENOENT) {
        LOG(WARNING) << "Failed to remove temporary file " << path_ << ": " << std::strerror(errno);
    }
    path_.clear();
}

void ScopedTempFile::Write(const std::vector<uint8_t>& data) const {
    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw EngineError("Failed to open temporary file for writing: " + path_);
    }

    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) {
        throw EngineError("Failed to write temporary file: " + path_);
    }
}

std::vector<uint8_t> ScopedTempFile::ReadAll() const {
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        throw EngineError("Failed to open temporary file for reading: " + path_);
    }

    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw EngineError("Failed to read temporary file: " + path_);
    }
    return data;
}

std::string SuffixForFormat(const std::string& format) {
    static const std::pair<const char*, const char*> kSuffixes[] = {
        {"image/jpeg", ".jpg"},
        {"image/jpg", ".jpg"},
        {"image/png", ".png"},
        {"image/gif", ".gif"},
        {"image/webp", ".webp"},
        {"image/tiff", ".tiff"},
        {"image/heic", ".heic"},
        {"image/heif", ".heif"},
        {"image/avif", ".avif"},
        {"image/svg+xml", ".svg"},
        {"video/mp4", ".mp4"},
        {"video/quicktime", ".mov"},
        {"audio/mpeg", ".mp3"},
        {"audio/wav", ".wav"},
        {"application/pdf", ".pdf"},
    };

    for (const auto& entry : kSuffixes) {
        if (format == entry.first) {
            return entry.second;
        }
    }
    return "";
}

} // namespace server
} // namespace c2pasign

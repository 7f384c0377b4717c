/**
 * @file scoped_temp_file.h
 * @brief Request-scoped temporary file removed on destruction
 *
 * Copyright 2025 c2pasign contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef C2PASIGN_SERVER_SCOPED_TEMP_FILE_H
#define C2PASIGN_SERVER_SCOPED_TEMP_FILE_H

#include <cstdint>
#include <string>
#include <vector>

namespace c2pasign {
namespace server {

/**
 * @brief Uniquely named file in a directory, unlinked when the object dies
 *
 * Move-only. The file is created empty with mode 0600.
 */
class ScopedTempFile {
public:
    /**
     * @brief Create a new file
     * @param directory Parent directory
     * @param suffix Appended to the random name (e.g. ".jpg")
     * @throws EngineError if the file cannot be created
     */
    ScopedTempFile(const std::string& directory, const std::string& suffix);
    ~ScopedTempFile();

    ScopedTempFile(ScopedTempFile&& other) noexcept;
    ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    const std::string& Path() const { return path_; }

    /**
     * @brief Replace the file contents
     * @throws EngineError on I/O failure
     */
    void Write(const std::vector<uint8_t>& data) const;

    /**
     * @brief Read the whole file
     * @throws EngineError on I/O failure
     */
    std::vector<uint8_t> ReadAll() const;

private:
    void Remove() noexcept;

    std::string path_;
};

/**
 * @brief File name suffix for an asset MIME type ("image/jpeg" -> ".jpg")
 *
 * Unknown types yield an empty suffix.
 */
std::string SuffixForFormat(const std::string& format);

} // namespace server
} // namespace c2pasign

#endif // C2PASIGN_SERVER_SCOPED_TEMP_FILE_H

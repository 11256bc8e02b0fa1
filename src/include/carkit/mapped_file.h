#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

/**
 * \file mapped_file.h
 * \brief Read-only mapping of a catalog file.
 */

namespace carkit {

enum class MappedFileStatus : uint8_t {
    Ok,
    OpenFailed,
    StatFailed,
    /// The file is larger than the configured cap.
    TooLarge,
    MapFailed,
};

/**
 * \brief Whole-file, read-only memory mapping.
 *
 * The mapping is the container buffer that a \ref CatalogModel borrows from;
 * keep the \ref MappedFile alive for as long as the model is used.
 */
class MappedFile final {
public:
    MappedFile() noexcept = default;
    ~MappedFile() noexcept;

    MappedFile(const MappedFile&)            = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    MappedFile(MappedFile&& other) noexcept;
    MappedFile& operator=(MappedFile&& other) noexcept;

    /// Maps \p path. \p max_file_bytes caps the file size (0 = unlimited).
    MappedFileStatus open(const char* path,
                          uint64_t max_file_bytes = 0) noexcept;
    void close() noexcept;

    bool is_open() const noexcept { return fd_ >= 0; }
    uint64_t size() const noexcept { return size_; }
    /// Modification time in seconds since the Unix epoch (0 if unknown).
    uint32_t mtime() const noexcept { return mtime_; }
    std::span<const std::byte> bytes() const noexcept;

private:
    void take(MappedFile* other) noexcept;

    int fd_                = -1;
    const std::byte* data_ = nullptr;
    uint64_t size_         = 0;
    uint32_t mtime_        = 0;
};

std::string_view
mapped_file_status_name(MappedFileStatus status) noexcept;

}  // namespace carkit

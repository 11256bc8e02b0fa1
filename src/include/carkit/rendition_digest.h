#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file rendition_digest.h
 * \brief SHA-256 digests of rendition records (the `SHA1Digest` field of
 * `assetutil --info`, which holds a SHA-256 value).
 */

namespace carkit {

enum class DigestStatus : uint8_t {
    Ok,
    /// Built without OpenSSL.
    Unsupported,
    /// The hashing backend reported an error.
    Failed,
};

static constexpr size_t kRenditionDigestSize = 32;

using RenditionDigest = std::array<uint8_t, kRenditionDigestSize>;

/// Hashes \p record (a whole CSI record as stored in the container).
DigestStatus
compute_rendition_digest(std::span<const std::byte> record,
                         RenditionDigest* out) noexcept;

/// True when the library was built with OpenSSL.
bool
digest_available() noexcept;

}  // namespace carkit

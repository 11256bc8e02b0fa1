#pragma once

#include "carkit/car_catalog.h"

#include <cstdint>
#include <string>

/**
 * \file assetutil_json.h
 * \brief `assetutil --info` compatible JSON rendering of a catalog.
 */

namespace carkit {

struct AssetutilJsonOptions final {
    /// Used as `Timestamp` when the catalog header stores 0.
    uint32_t file_mtime = 0;
    /// Emit `SHA1Digest` (SHA-256 of each CSI record).
    bool include_digests = true;
};

enum class AssetutilJsonStatus : uint8_t {
    Ok,
    /// carkit was built without a JSON backend; nothing was written.
    JsonUnavailable,
    /// Digests were requested but no hashing backend is available; the
    /// `SHA1Digest` keys are omitted.
    DigestUnavailable,
    /// A digest computation failed; that entry omits `SHA1Digest`.
    DigestFailed,
};

struct AssetutilJsonResult final {
    AssetutilJsonStatus status = AssetutilJsonStatus::Ok;
    /// Rendition objects written (excluding the header object).
    uint32_t entries = 0;
};

/**
 * \brief Appends the catalog as a pretty-printed JSON array to \p out.
 *
 * The first element describes the catalog header; one object per rendition
 * follows, sorted by (`AssetType`, `Name`, `RenditionName`) with absent
 * values first. Object keys are sorted bytewise. Invalid UTF-8 in names is
 * replaced with U+FFFD.
 */
AssetutilJsonResult
format_assetutil_json(const CatalogModel& model, std::string* out,
                      const AssetutilJsonOptions& options
                      = AssetutilJsonOptions {}) noexcept;

}  // namespace carkit

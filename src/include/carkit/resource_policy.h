#pragma once

#include "carkit/bom_store.h"
#include "carkit/bom_tree.h"
#include "carkit/car_catalog.h"
#include "carkit/rendition_decode.h"

#include <cstdint>

/**
 * \file resource_policy.h
 * \brief Resource budgets for reading untrusted catalogs.
 */

namespace carkit {

/**
 * \brief All read and decode budgets in one place.
 *
 * Tools fill this from the command line and push it into the per-call
 * options with \ref apply_resource_policy.
 */
struct CarResourcePolicy final {
    /// File mapping cap (0 = unlimited).
    uint64_t max_file_bytes = 0;

    BomParseLimits bom_limits;
    TreeWalkLimits tree_limits;
    CatalogDecodeLimits catalog_limits;
    RenditionDecodeLimits decode_limits;
};

inline void
apply_resource_policy(const CarResourcePolicy& policy,
                      CatalogDecodeOptions* catalog) noexcept
{
    if (catalog) {
        catalog->bom.limits  = policy.bom_limits;
        catalog->tree_limits = policy.tree_limits;
        catalog->limits      = policy.catalog_limits;
    }
}

inline void
apply_resource_policy(const CarResourcePolicy& policy,
                      RenditionDecodeOptions* decode) noexcept
{
    if (decode) {
        decode->limits = policy.decode_limits;
    }
}

}  // namespace carkit

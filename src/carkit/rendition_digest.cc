#include "carkit/rendition_digest.h"

#if defined(CARKIT_HAS_OPENSSL) && CARKIT_HAS_OPENSSL
#    include <openssl/evp.h>
#endif

namespace carkit {

bool
digest_available() noexcept
{
#if defined(CARKIT_HAS_OPENSSL) && CARKIT_HAS_OPENSSL
    return true;
#else
    return false;
#endif
}


DigestStatus
compute_rendition_digest(std::span<const std::byte> record,
                         RenditionDigest* out) noexcept
{
    if (!out) {
        return DigestStatus::Failed;
    }
#if defined(CARKIT_HAS_OPENSSL) && CARKIT_HAS_OPENSSL
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return DigestStatus::Failed;
    }
    RenditionDigest digest {};
    unsigned int len = 0;
    const bool ok
        = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1
          && (record.empty()
              || EVP_DigestUpdate(ctx, record.data(), record.size()) == 1)
          && EVP_DigestFinal_ex(ctx, digest.data(), &len) == 1
          && len == kRenditionDigestSize;
    EVP_MD_CTX_free(ctx);
    if (!ok) {
        return DigestStatus::Failed;
    }
    *out = digest;
    return DigestStatus::Ok;
#else
    (void)record;
    return DigestStatus::Unsupported;
#endif
}

}  // namespace carkit

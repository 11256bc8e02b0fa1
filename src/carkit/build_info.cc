#include "carkit/build_info.h"

#include "carkit/build_info_generated.h"

namespace carkit {
namespace {

#if defined(CARKIT_HAS_ZLIB) && CARKIT_HAS_ZLIB
    static constexpr bool kHasZlib = true;
#else
    static constexpr bool kHasZlib = false;
#endif

#if defined(CARKIT_HAS_OPENSSL) && CARKIT_HAS_OPENSSL
    static constexpr bool kHasOpenssl = true;
#else
    static constexpr bool kHasOpenssl = false;
#endif

#if defined(CARKIT_HAS_STB) && CARKIT_HAS_STB
    static constexpr bool kHasStb = true;
#else
    static constexpr bool kHasStb = false;
#endif

#if defined(CARKIT_HAS_LZFSE) && CARKIT_HAS_LZFSE
    static constexpr bool kHasLzfse = true;
#else
    static constexpr bool kHasLzfse = false;
#endif

#if defined(CARKIT_HAS_NLOHMANN_JSON) && CARKIT_HAS_NLOHMANN_JSON
    static constexpr bool kHasJson = true;
#else
    static constexpr bool kHasJson = false;
#endif

    static constexpr BuildInfo kBuildInfo = {
        /*version=*/CARKIT_BUILDINFO_VERSION,
        /*build_timestamp_utc=*/CARKIT_BUILDINFO_BUILD_TIMESTAMP_UTC,
        /*build_type=*/CARKIT_BUILDINFO_BUILD_TYPE,
        /*system_name=*/CARKIT_BUILDINFO_SYSTEM_NAME,
        /*system_processor=*/CARKIT_BUILDINFO_SYSTEM_PROCESSOR,
        /*cxx_compiler_id=*/CARKIT_BUILDINFO_CXX_COMPILER_ID,
        /*cxx_compiler_version=*/CARKIT_BUILDINFO_CXX_COMPILER_VERSION,
        /*option_with_zlib=*/static_cast<bool>(CARKIT_BUILDINFO_WITH_ZLIB),
        /*option_with_openssl=*/
        static_cast<bool>(CARKIT_BUILDINFO_WITH_OPENSSL),
        /*option_with_stb=*/static_cast<bool>(CARKIT_BUILDINFO_WITH_STB),
        /*option_with_lzfse=*/static_cast<bool>(CARKIT_BUILDINFO_WITH_LZFSE),
        /*option_with_json=*/
        static_cast<bool>(CARKIT_BUILDINFO_WITH_NLOHMANN_JSON),
        /*has_zlib=*/kHasZlib,
        /*has_openssl=*/kHasOpenssl,
        /*has_stb=*/kHasStb,
        /*has_lzfse=*/kHasLzfse,
        /*has_json=*/kHasJson,
    };


    static void append_feature(bool enabled, std::string_view name,
                               bool* first, std::string* out)
    {
        if (!enabled) {
            return;
        }
        if (!*first) {
            out->push_back(',');
        }
        out->append(name);
        *first = false;
    }

}  // namespace


const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


void
format_build_info_lines(const BuildInfo& bi, std::string* line1,
                        std::string* line2) noexcept
{
    if (line1) {
        line1->clear();
        line1->append("carkit v");
        line1->append(bi.version);
        line1->push_back(' ');
        line1->append(bi.build_type);
        line1->append(" [");
        bool first = true;
        append_feature(bi.has_zlib, "zlib", &first, line1);
        append_feature(bi.has_openssl, "openssl", &first, line1);
        append_feature(bi.has_stb, "stb", &first, line1);
        append_feature(bi.has_lzfse, "lzfse", &first, line1);
        append_feature(bi.has_json, "json", &first, line1);
        line1->push_back(']');
    }
    if (line2) {
        line2->clear();
        line2->append("built with ");
        line2->append(bi.cxx_compiler_id);
        line2->push_back('-');
        line2->append(bi.cxx_compiler_version);
        line2->append(" for ");
        line2->append(bi.system_name);
        line2->push_back('/');
        line2->append(bi.system_processor);
        if (!bi.build_timestamp_utc.empty()) {
            line2->append(" (");
            line2->append(bi.build_timestamp_utc);
            line2->push_back(')');
        }
    }
}


void
format_build_info_lines(std::string* line1, std::string* line2) noexcept
{
    format_build_info_lines(build_info(), line1, line2);
}

}  // namespace carkit

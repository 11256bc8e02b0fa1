#pragma once

#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief How the linked carkit library was configured and compiled.
 */

namespace carkit {

/// Values are compiled in from the configured build header.
struct BuildInfo final {
    /// carkit version string (e.g. "0.1.0").
    std::string_view version;
    /// Build timestamp in UTC (ISO-8601), or empty if not recorded.
    std::string_view build_timestamp_utc;
    std::string_view build_type;
    std::string_view system_name;
    std::string_view system_processor;
    std::string_view cxx_compiler_id;
    std::string_view cxx_compiler_version;

    /// Options requested at configure time.
    bool option_with_zlib    = false;
    bool option_with_openssl = false;
    bool option_with_stb     = false;
    bool option_with_lzfse   = false;
    bool option_with_json    = false;

    /// Backends actually compiled in.
    bool has_zlib    = false;
    bool has_openssl = false;
    bool has_stb     = false;
    bool has_lzfse   = false;
    bool has_json    = false;
};

const BuildInfo&
build_info() noexcept;

/**
 * \brief Formats the two-line build header printed by the tools.
 *
 * - `carkit vX.Y.Z <build_type> [features]`
 * - `built with <compiler> for <system>/<arch> (<timestamp>)`
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2) noexcept;

void
format_build_info_lines(std::string* line1, std::string* line2) noexcept;

}  // namespace carkit

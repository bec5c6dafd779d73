#pragma once

#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Runtime information about how PngMeta was built.
 */

namespace pngmeta {

/**
 * \brief PngMeta build information.
 *
 * Values are compiled into the binary at build time.
 */
struct BuildInfo final {
    /// PngMeta version string (e.g. "0.1.0").
    std::string_view version;

    /// Build type string (e.g. "Release", "Debug", "multi-config").
    std::string_view build_type;

    /// CMake generator used to configure the build (e.g. "Ninja").
    std::string_view cmake_generator;

    /// Target platform (e.g. "Linux", "Darwin", "Windows").
    std::string_view system_name;

    /// Target CPU architecture (e.g. "x86_64", "arm64").
    std::string_view system_processor;

    /// Compiler ID (e.g. "Clang", "GNU", "MSVC").
    std::string_view cxx_compiler_id;

    /// Compiler version string.
    std::string_view cxx_compiler_version;

    /// zlib version the library was compiled against.
    std::string_view zlib_version;

    /// True if this binary was built from the static library target.
    bool linkage_static = false;
    /// True if this binary was built from the shared library target.
    bool linkage_shared = false;
};

/// Returns build information for the linked PngMeta library.
const BuildInfo&
build_info() noexcept;

/**
 * \brief Formats a stable, human-readable build info header (2 lines).
 *
 * Output format:
 * - `PngMeta vX.Y.Z <build_type> <linkage>`
 * - `built with <compiler> for <system>/<arch> (zlib <compiled>/<runtime>)`
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2);

/// Convenience overload for the linked PngMeta library build.
void
format_build_info_lines(std::string* line1, std::string* line2);

}  // namespace pngmeta

#include "pngmeta/build_info.h"

#include "pngmeta/build_info_generated.h"

#include <string>

#include <zlib.h>

// zlib.h defines a legacy `zlib_version` macro that clobbers BuildInfo::zlib_version.
#undef zlib_version

namespace pngmeta {
namespace {

    static constexpr bool linkage_static() noexcept
    {
#if defined(PNGMETA_BUILD_LINKAGE_STATIC) && PNGMETA_BUILD_LINKAGE_STATIC
        return true;
#else
        return false;
#endif
    }

    static constexpr bool linkage_shared() noexcept
    {
#if defined(PNGMETA_BUILD_LINKAGE_SHARED) && PNGMETA_BUILD_LINKAGE_SHARED
        return true;
#else
        return false;
#endif
    }

    static constexpr BuildInfo kBuildInfo = {
        /*version=*/PNGMETA_BUILDINFO_VERSION,
        /*build_type=*/PNGMETA_BUILDINFO_BUILD_TYPE,
        /*cmake_generator=*/PNGMETA_BUILDINFO_CMAKE_GENERATOR,
        /*system_name=*/PNGMETA_BUILDINFO_SYSTEM_NAME,
        /*system_processor=*/PNGMETA_BUILDINFO_SYSTEM_PROCESSOR,
        /*cxx_compiler_id=*/PNGMETA_BUILDINFO_CXX_COMPILER_ID,
        /*cxx_compiler_version=*/PNGMETA_BUILDINFO_CXX_COMPILER_VERSION,
        /*zlib_version=*/ZLIB_VERSION,
        /*linkage_static=*/linkage_static(),
        /*linkage_shared=*/linkage_shared(),
    };

    static const char* linkage_string(const BuildInfo& bi) noexcept
    {
        if (bi.linkage_static) {
            return "static";
        }
        if (bi.linkage_shared) {
            return "shared";
        }
        return "unknown";
    }

}  // namespace

const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


void
format_build_info_lines(const BuildInfo& bi, std::string* line1,
                        std::string* line2)
{
    if (line1) {
        line1->clear();
        line1->append("PngMeta v");
        line1->append(bi.version);
        line1->append(" ");
        line1->append(bi.build_type);
        line1->append(" ");
        line1->append(linkage_string(bi));
    }

    if (line2) {
        line2->clear();
        line2->append("built with ");
        line2->append(bi.cxx_compiler_id);
        line2->append("-");
        line2->append(bi.cxx_compiler_version);
        line2->append(" for ");
        line2->append(bi.system_name);
        line2->append("/");
        line2->append(bi.system_processor);
        line2->append(" (zlib ");
        line2->append(bi.zlib_version);
        line2->append("/");
        line2->append(zlibVersion());
        line2->append(")");
    }
}


void
format_build_info_lines(std::string* line1, std::string* line2)
{
    format_build_info_lines(build_info(), line1, line2);
}

}  // namespace pngmeta

#pragma once

#include "pngmeta/deflate.h"
#include "pngmeta/png_chunks.h"
#include "pngmeta/text_chunk.h"

#include <cstdint>

/**
 * \file resource_policy.h
 * \brief Resource budget for reading and editing untrusted PNG input.
 */

namespace pngmeta {

/**
 * \brief Storage-agnostic resource limits for untrusted PNG input.
 *
 * Tools fill one policy and copy it into the per-call option structs with
 * \ref apply_resource_policy.
 */
struct ResourcePolicy final {
    /// File read cap used by tools (0 = unlimited).
    uint64_t max_file_bytes = 512ULL * 1024ULL * 1024ULL;

    /// Container parse budgets.
    ParseLimits parse_limits;

    /// Decompression budget for `zTXt` / compressed `iTXt`.
    InflateLimits inflate_limits;
};

inline void
apply_resource_policy(const ResourcePolicy& policy, ParseOptions* parse,
                      TextCodecOptions* text) noexcept
{
    if (parse) {
        parse->limits = policy.parse_limits;
    }
    if (text) {
        text->inflate.limits = policy.inflate_limits;
    }
}

}  // namespace pngmeta

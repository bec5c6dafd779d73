#include "pngmeta/png_status.h"

#include "pngmeta/chunk.h"

#include <cstdio>

namespace pngmeta {

const char*
png_status_name(PngStatus status) noexcept
{
    switch (status) {
    case PngStatus::Ok: return "ok";
    case PngStatus::InvalidHeader: return "invalid_header";
    case PngStatus::TruncatedData: return "truncated_data";
    case PngStatus::IntegrityError: return "integrity_error";
    case PngStatus::MissingTerminator: return "missing_terminator";
    case PngStatus::InvalidChunkType: return "invalid_chunk_type";
    case PngStatus::InvalidKeyword: return "invalid_keyword";
    case PngStatus::InvalidCharset: return "invalid_charset";
    case PngStatus::MissingSeparator: return "missing_separator";
    case PngStatus::UnsupportedMethod: return "unsupported_method";
    case PngStatus::MalformedStream: return "malformed_stream";
    case PngStatus::InvalidLength: return "invalid_length";
    case PngStatus::InvalidOperation: return "invalid_operation";
    case PngStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}


std::string
format_result_message(const PngResult& result)
{
    std::string out = png_status_name(result.status);
    if (result.chunk_type == 0U && result.chunk_index == kNoChunkIndex
        && result.offset == 0U) {
        return out;
    }

    out.append(" [");
    bool first = true;
    if (result.chunk_type != 0U) {
        out.append("chunk=");
        out.append(chunk_type_name(result.chunk_type));
        first = false;
    }
    if (result.chunk_index != kNoChunkIndex) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%sindex=%u", first ? "" : " ",
                      static_cast<unsigned>(result.chunk_index));
        out.append(buf);
        first = false;
    }
    if (result.offset != 0U) {
        char buf[40];
        std::snprintf(buf, sizeof(buf), "%soffset=%llu", first ? "" : " ",
                      static_cast<unsigned long long>(result.offset));
        out.append(buf);
    }
    out.push_back(']');
    return out;
}

}  // namespace pngmeta

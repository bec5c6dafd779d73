#include "pngmeta/deflate.h"

#include <array>

#include <zlib.h>

namespace pngmeta {
namespace {

    static constexpr size_t kMaxPiece = 0x40000000U;

    static int window_bits(DeflateFormat format) noexcept
    {
        return (format == DeflateFormat::Raw) ? -MAX_WBITS : MAX_WBITS;
    }

    static void feed_input(z_stream* strm, std::span<const std::byte> in,
                           size_t* in_off) noexcept
    {
        if (strm->avail_in != 0 || *in_off >= in.size()) {
            return;
        }
        const size_t remaining = in.size() - *in_off;
        const size_t n = (remaining < kMaxPiece) ? remaining : kMaxPiece;
        strm->next_in  = reinterpret_cast<Bytef*>(
            const_cast<std::byte*>(in.data() + *in_off));
        strm->avail_in = static_cast<uInt>(n);
        *in_off += n;
    }

    static PngResult status_result(PngStatus status) noexcept
    {
        PngResult res;
        res.status = status;
        return res;
    }

    // Z_MEM_ERROR is an allocation budget failure; anything else is `other`.
    static PngResult zlib_error(int ret, PngStatus other) noexcept
    {
        return status_result(ret == Z_MEM_ERROR ? PngStatus::LimitExceeded
                                                : other);
    }

}  // namespace

PngResult
deflate_compress(std::span<const std::byte> in, std::vector<std::byte>* out,
                 const DeflateOptions& options)
{
    if (options.level < Z_DEFAULT_COMPRESSION
        || options.level > Z_BEST_COMPRESSION) {
        return status_result(PngStatus::InvalidOperation);
    }

    z_stream strm {};
    strm.zalloc = Z_NULL;
    strm.zfree  = Z_NULL;
    strm.opaque = Z_NULL;

    int ret = deflateInit2(&strm, options.level, Z_DEFLATED,
                           window_bits(options.format), 8,
                           Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        return zlib_error(ret, PngStatus::InvalidOperation);
    }

    std::vector<std::byte> result;
    std::array<std::byte, 32768> buf {};
    size_t in_off = 0;

    for (;;) {
        feed_input(&strm, in, &in_off);
        const int flush = (in_off >= in.size()) ? Z_FINISH : Z_NO_FLUSH;

        strm.next_out  = reinterpret_cast<Bytef*>(buf.data());
        strm.avail_out = static_cast<uInt>(buf.size());
        ret            = deflate(&strm, flush);
        if (ret == Z_STREAM_ERROR) {
            (void)deflateEnd(&strm);
            return status_result(PngStatus::InvalidOperation);
        }
        const size_t produced = buf.size() - strm.avail_out;
        result.insert(result.end(), buf.begin(),
                      buf.begin() + static_cast<std::ptrdiff_t>(produced));
        if (ret == Z_STREAM_END) {
            break;
        }
    }

    (void)deflateEnd(&strm);
    out->swap(result);
    return PngResult {};
}


PngResult
deflate_decompress(std::span<const std::byte> in, std::vector<std::byte>* out,
                   const InflateOptions& options)
{
    z_stream strm {};
    strm.zalloc = Z_NULL;
    strm.zfree  = Z_NULL;
    strm.opaque = Z_NULL;

    int ret = inflateInit2(&strm, window_bits(options.format));
    if (ret != Z_OK) {
        return zlib_error(ret, PngStatus::MalformedStream);
    }

    std::vector<std::byte> result;
    std::array<std::byte, 32768> buf {};
    size_t in_off = 0;

    const uint64_t max_out = options.limits.max_output_bytes;

    for (;;) {
        feed_input(&strm, in, &in_off);

        strm.next_out  = reinterpret_cast<Bytef*>(buf.data());
        strm.avail_out = static_cast<uInt>(buf.size());
        ret            = inflate(&strm, Z_NO_FLUSH);
        const size_t produced = buf.size() - strm.avail_out;

        if (max_out != 0U
            && static_cast<uint64_t>(result.size()) + produced > max_out) {
            (void)inflateEnd(&strm);
            return status_result(PngStatus::LimitExceeded);
        }
        result.insert(result.end(), buf.begin(),
                      buf.begin() + static_cast<std::ptrdiff_t>(produced));

        if (ret == Z_STREAM_END) {
            break;
        }
        if (ret == Z_BUF_ERROR && strm.avail_in == 0
            && in_off >= in.size()) {
            // Input exhausted before the end of the stream.
            (void)inflateEnd(&strm);
            return status_result(PngStatus::MalformedStream);
        }
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            (void)inflateEnd(&strm);
            return zlib_error(ret, PngStatus::MalformedStream);
        }
    }

    (void)inflateEnd(&strm);
    out->swap(result);
    return PngResult {};
}

}  // namespace pngmeta

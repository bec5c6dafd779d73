#include "pngmeta/build_info.h"
#include "pngmeta/chunk.h"
#include "pngmeta/chunk_list.h"
#include "pngmeta/console_format.h"
#include "pngmeta/png_chunks.h"
#include "pngmeta/png_status.h"
#include "pngmeta/resource_policy.h"
#include "pngmeta/text_chunk.h"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pngmeta {
namespace {

    enum class ReadFileStatus : uint8_t {
        Ok,
        OpenFailed,
        IoFailed,
        TooLarge,
    };

    static ReadFileStatus read_file_bytes(const char* path,
                                          std::vector<std::byte>* out,
                                          uint64_t max_file_bytes,
                                          uint64_t* out_size)
    {
        out->clear();
        if (out_size) {
            *out_size = 0;
        }
        std::FILE* f = std::fopen(path, "rb");
        if (!f) {
            return ReadFileStatus::OpenFailed;
        }

        if (std::fseek(f, 0, SEEK_END) != 0) {
            std::fclose(f);
            return ReadFileStatus::IoFailed;
        }
        const long end = std::ftell(f);
        if (end < 0) {
            std::fclose(f);
            return ReadFileStatus::IoFailed;
        }
        if (std::fseek(f, 0, SEEK_SET) != 0) {
            std::fclose(f);
            return ReadFileStatus::IoFailed;
        }

        const uint64_t size_u64 = static_cast<uint64_t>(end);
        if (out_size) {
            *out_size = size_u64;
        }
        if (max_file_bytes != 0U && size_u64 > max_file_bytes) {
            std::fclose(f);
            return ReadFileStatus::TooLarge;
        }

        const size_t size = static_cast<size_t>(size_u64);
        out->resize(size);
        if (size != 0) {
            const size_t read = std::fread(out->data(), 1, size, f);
            if (read != size) {
                std::fclose(f);
                out->clear();
                return ReadFileStatus::IoFailed;
            }
        }
        std::fclose(f);
        return ReadFileStatus::Ok;
    }

    static bool write_file_bytes(const char* path,
                                 std::span<const std::byte> bytes)
    {
        std::FILE* f = std::fopen(path, "wb");
        if (!f) {
            return false;
        }
        const size_t written = bytes.empty()
                                   ? 0
                                   : std::fwrite(bytes.data(), 1,
                                                 bytes.size(), f);
        const bool closed = std::fclose(f) == 0;
        return written == bytes.size() && closed;
    }

    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }

    static bool parse_u32_arg(std::string_view s, uint32_t* out)
    {
        if (s.empty() || s.size() > 10) {
            return false;
        }
        uint64_t v = 0;
        for (char c : s) {
            if (c < '0' || c > '9') {
                return false;
            }
            v = v * 10U + static_cast<uint64_t>(c - '0');
        }
        if (v > 0xFFFFFFFFULL) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }

    // X,Y,UNIT where UNIT is "unknown", "meter" or a number.
    static bool parse_phys_arg(const char* s, PhysRecord* out)
    {
        const std::string_view arg(s ? s : "");
        const size_t c1 = arg.find(',');
        if (c1 == std::string_view::npos) {
            return false;
        }
        const size_t c2 = arg.find(',', c1 + 1);
        if (c2 == std::string_view::npos) {
            return false;
        }
        PhysRecord rec;
        if (!parse_u32_arg(arg.substr(0, c1), &rec.pixels_per_unit_x)
            || !parse_u32_arg(arg.substr(c1 + 1, c2 - c1 - 1),
                              &rec.pixels_per_unit_y)) {
            return false;
        }
        const std::string_view unit = arg.substr(c2 + 1);
        if (unit == "unknown") {
            rec.unit = PhysUnit::Unknown;
        } else if (unit == "meter") {
            rec.unit = PhysUnit::Meter;
        } else {
            uint32_t v = 0;
            if (!parse_u32_arg(unit, &v) || v > 0xFFU) {
                return false;
            }
            rec.unit = static_cast<PhysUnit>(v);
        }
        *out = rec;
        return true;
    }

    static bool parse_text_type(const char* s, ChunkKind* out)
    {
        const std::string_view v(s ? s : "");
        if (v == "tEXt") {
            *out = ChunkKind::Text;
        } else if (v == "zTXt") {
            *out = ChunkKind::Ztxt;
        } else if (v == "iTXt") {
            *out = ChunkKind::Itxt;
        } else {
            return false;
        }
        return true;
    }

    static void print_chunks(std::span<const Chunk> chunks,
                             const TextCodecOptions& text_options,
                             uint32_t max_text_bytes)
    {
        std::printf("chunks=%zu\n", chunks.size());
        for (size_t i = 0; i < chunks.size(); ++i) {
            const Chunk& c = chunks[i];
            std::string line;
            line.append(chunk_type_name(c.type));
            line.append(is_critical_chunk(c.type) ? " critical" : " ancillary");

            if (is_text_chunk(c.type)) {
                TextRecord record;
                const PngResult res = decode_text_chunk(c, &record,
                                                        text_options);
                if (res.status != PngStatus::Ok) {
                    line.append(" <");
                    line.append(png_status_name(res.status));
                    line.append(">");
                } else {
                    line.append(" \"");
                    append_console_escaped(record.keyword, max_text_bytes,
                                           &line);
                    line.append("\" = \"");
                    append_console_escaped(record.text, max_text_bytes, &line);
                    line.append("\"");
                }
            } else if (c.type == kChunkPhys) {
                PhysRecord phys;
                if (decode_phys(c.data, &phys).status == PngStatus::Ok) {
                    char buf[96];
                    std::snprintf(buf, sizeof(buf), " x=%u y=%u unit=%u",
                                  static_cast<unsigned>(phys.pixels_per_unit_x),
                                  static_cast<unsigned>(phys.pixels_per_unit_y),
                                  static_cast<unsigned>(phys.unit));
                    line.append(buf);
                    uint32_t dpi_x = 0;
                    uint32_t dpi_y = 0;
                    if (phys_dpi(phys, &dpi_x, &dpi_y)) {
                        std::snprintf(buf, sizeof(buf), " (%ux%u dpi)",
                                      static_cast<unsigned>(dpi_x),
                                      static_cast<unsigned>(dpi_y));
                        line.append(buf);
                    }
                } else {
                    line.append(" <invalid_length>");
                }
            } else if (chunk_kind(c.type) == ChunkKind::Unknown
                       && !c.data.empty()) {
                line.append(" ");
                append_hex_bytes(c.data, 16, &line);
            }
            std::printf("[%zu] size=%zu %s\n", i, c.data.size(), line.c_str());
        }
    }

    static void usage(const char* argv0)
    {
        std::printf("usage: %s [options] <file.png>\n", argv0);
        std::printf("options:\n");
        std::printf("  --version            print build info and exit\n");
        std::printf("  --set KEY=VALUE      add or update a text entry (repeatable)\n");
        std::printf("  --text-type TYPE     chunk type for --set: tEXt (default), zTXt, iTXt\n");
        std::printf("  --remove TYPE        remove all chunks of TYPE, e.g. tIME (repeatable)\n");
        std::printf("  --phys X,Y,UNIT      set pHYs (UNIT: unknown, meter or 0..255)\n");
        std::printf("  --dpi N              set pHYs to N dots per inch\n");
        std::printf("  -o PATH              write the edited file to PATH\n");
        std::printf(
            "  --max-text-bytes N   max bytes to print per text field (default: 256)\n");
        std::printf(
            "  --max-file-bytes N   refuse to read files larger than N bytes (default: 536870912; 0=unlimited)\n");
    }

    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n", line1.c_str());
        std::printf("%s\n", line2.c_str());
    }

}  // namespace
}  // namespace pngmeta

int
main(int argc, char** argv)
{
    using namespace pngmeta;

    ResourcePolicy policy;
    std::map<std::string, std::string> set_entries;
    std::vector<uint32_t> remove_types;
    ChunkKind text_kind     = ChunkKind::Text;
    bool have_phys          = false;
    PhysRecord phys;
    const char* out_path    = nullptr;
    const char* in_path     = nullptr;
    uint32_t max_text_bytes = 256;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        const bool has_value = i + 1 < argc;
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "--set") == 0 && has_value) {
            const std::string_view kv(argv[++i]);
            const size_t eq = kv.find('=');
            if (eq == std::string_view::npos || eq == 0) {
                std::fprintf(stderr,
                             "pngmeta: invalid --set value (expected KEY=VALUE)\n");
                return 2;
            }
            set_entries[std::string(kv.substr(0, eq))] = std::string(
                kv.substr(eq + 1));
            continue;
        }
        if (std::strcmp(arg, "--text-type") == 0 && has_value) {
            if (!parse_text_type(argv[++i], &text_kind)) {
                std::fprintf(stderr, "pngmeta: invalid --text-type value\n");
                return 2;
            }
            continue;
        }
        if (std::strcmp(arg, "--remove") == 0 && has_value) {
            const uint32_t type = chunk_type_from_name(argv[++i]);
            if (type == 0U) {
                std::fprintf(stderr, "pngmeta: invalid --remove chunk type\n");
                return 2;
            }
            remove_types.push_back(type);
            continue;
        }
        if (std::strcmp(arg, "--phys") == 0 && has_value) {
            if (!parse_phys_arg(argv[++i], &phys)) {
                std::fprintf(stderr,
                             "pngmeta: invalid --phys value (expected X,Y,UNIT)\n");
                return 2;
            }
            have_phys = true;
            continue;
        }
        if (std::strcmp(arg, "--dpi") == 0 && has_value) {
            uint32_t dpi = 0;
            if (!parse_u32_arg(argv[++i], &dpi) || dpi == 0U) {
                std::fprintf(stderr, "pngmeta: invalid --dpi value\n");
                return 2;
            }
            phys.pixels_per_unit_x = phys_from_dpi(dpi);
            phys.pixels_per_unit_y = phys.pixels_per_unit_x;
            phys.unit              = PhysUnit::Meter;
            have_phys              = true;
            continue;
        }
        if (std::strcmp(arg, "-o") == 0 && has_value) {
            out_path = argv[++i];
            continue;
        }
        if (std::strcmp(arg, "--max-text-bytes") == 0 && has_value) {
            if (!parse_u32_arg(argv[++i], &max_text_bytes)) {
                std::fprintf(stderr, "pngmeta: invalid --max-text-bytes value\n");
                return 2;
            }
            continue;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0 && has_value) {
            if (!parse_u64_arg(argv[++i], &policy.max_file_bytes)) {
                std::fprintf(stderr, "pngmeta: invalid --max-file-bytes value\n");
                return 2;
            }
            continue;
        }
        if (arg[0] == '-' || in_path) {
            usage(argv[0]);
            return 2;
        }
        in_path = arg;
    }

    if (!in_path) {
        usage(argv[0]);
        return 2;
    }

    ParseOptions parse_options;
    TextCodecOptions text_options;
    apply_resource_policy(policy, &parse_options, &text_options);

    std::vector<std::byte> bytes;
    uint64_t file_size      = 0;
    const ReadFileStatus st = read_file_bytes(in_path, &bytes,
                                              policy.max_file_bytes,
                                              &file_size);
    if (st != ReadFileStatus::Ok) {
        if (st == ReadFileStatus::TooLarge) {
            std::fprintf(
                stderr,
                "pngmeta: refusing to read `%s` (size=%llu > --max-file-bytes=%llu)\n",
                in_path, static_cast<unsigned long long>(file_size),
                static_cast<unsigned long long>(policy.max_file_bytes));
        } else if (st == ReadFileStatus::OpenFailed) {
            std::fprintf(stderr, "pngmeta: failed to open `%s`\n", in_path);
        } else {
            std::fprintf(stderr, "pngmeta: failed to read `%s`\n", in_path);
        }
        return 1;
    }

    ChunkList chunks;
    PngResult res = parse_png_chunks(bytes, &chunks, parse_options);
    if (res.status != PngStatus::Ok) {
        std::fprintf(stderr, "pngmeta: `%s`: %s\n", in_path,
                     format_result_message(res).c_str());
        return 1;
    }

    for (size_t i = 0; i < remove_types.size(); ++i) {
        (void)remove_chunks(&chunks, remove_types[i]);
    }
    if (have_phys) {
        res = insert_or_replace_chunk(&chunks, make_phys_chunk(phys));
        if (res.status != PngStatus::Ok) {
            std::fprintf(stderr, "pngmeta: pHYs: %s\n",
                         format_result_message(res).c_str());
            return 1;
        }
    }
    if (!set_entries.empty()) {
        res = add_or_update_text_chunks(&chunks, set_entries, text_kind,
                                        text_options);
        if (res.status != PngStatus::Ok) {
            std::fprintf(stderr, "pngmeta: --set: %s\n",
                         format_result_message(res).c_str());
            return 1;
        }
    }

    std::printf("== %s\n", in_path);
    std::printf("size=%zu\n", bytes.size());
    print_chunks(chunks, text_options, max_text_bytes);

    if (out_path) {
        std::vector<std::byte> out_bytes;
        res = serialize_png_chunks(chunks, &out_bytes);
        if (res.status != PngStatus::Ok) {
            std::fprintf(stderr, "pngmeta: %s\n",
                         format_result_message(res).c_str());
            return 1;
        }
        if (!write_file_bytes(out_path, out_bytes)) {
            std::fprintf(stderr, "pngmeta: failed to write `%s`\n", out_path);
            return 1;
        }
        std::printf("wrote %s (%zu bytes)\n", out_path, out_bytes.size());
    }
    return 0;
}

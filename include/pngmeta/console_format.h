#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace pngmeta {

// Appends a terminal-safe rendering of UTF-8 `text` into `out`.
//
// Behavior:
// - Valid multi-byte UTF-8 sequences are kept
// - Escapes `\n`, `\r`, `\t`, `\\` and `"`
// - Other control characters and invalid bytes become `\xNN`
// - Truncates to `max_bytes` input bytes (0 = unlimited) and appends "..."
//
// Returns true when any escaping or truncation occurred.
bool
append_console_escaped(std::string_view text, uint32_t max_bytes,
                       std::string* out) noexcept;

// Appends uppercase hex bytes into `out` (no "0x" prefix).
// Truncates to `max_bytes` (0 = unlimited) and appends "..." when truncated.
void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out) noexcept;

}  // namespace pngmeta

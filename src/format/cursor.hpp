#pragma once

#include "format/decode_error.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace mbdb::format {

// ── Primitive cursor reads ────────────────────────────────────────────────────
//
// Every read takes the buffer and a cursor offset. On success the value is
// stored and `offset` is advanced past the bytes consumed. On failure the
// offset and the value are left untouched and DecodeErrc::truncated_input is
// returned; the cursor never moves beyond data.size().
//
// Pure functions, no shared state.

// Two 0xFF bytes in place of a length prefix encode the empty string.
inline constexpr uint8_t kEmptyStringMarker = 0xFF;

// Read `byte_count` (1–8) bytes as a big-endian unsigned integer.
// Returns std::errc::invalid_argument for a byte_count outside 1–8.
[[nodiscard]] std::error_code read_uint(
    std::span<const uint8_t> data,
    std::size_t& offset,
    std::size_t byte_count,
    uint64_t& value) noexcept;

// Typed form: the width is sizeof(T), fixed at the call site.
template <typename T>
[[nodiscard]] std::error_code read_uint(
    std::span<const uint8_t> data, std::size_t& offset, T& value) noexcept
{
    static_assert(std::is_unsigned_v<T> && sizeof(T) <= sizeof(uint64_t),
                  "read_uint needs an unsigned integer of at most 8 bytes");
    uint64_t wide = 0;
    if (auto ec = read_uint(data, offset, sizeof(T), wide)) {
        return ec;
    }
    value = static_cast<T>(wide);
    return {};
}

// Read a string:
//   [0xFF 0xFF]                   → empty string, cursor advances by 2
//   [length: u16 BE][length bytes] → the raw bytes, one Latin-1 code point
//                                    per byte (no multi-byte decoding)
[[nodiscard]] std::error_code read_string(
    std::span<const uint8_t> data,
    std::size_t& offset,
    std::string& value);

// ── Text helpers ──────────────────────────────────────────────────────────────

// Re-encode Latin-1 bytes (as returned by read_string) as UTF-8.
[[nodiscard]] std::string latin1_to_utf8(std::string_view latin1);

} // namespace mbdb::format

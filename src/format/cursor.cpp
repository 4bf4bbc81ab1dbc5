#include "format/cursor.hpp"

namespace mbdb::format {

namespace {

// True when `count` bytes starting at `offset` lie inside `data`.
bool fits(std::span<const uint8_t> data, std::size_t offset,
          std::size_t count) noexcept {
    return offset <= data.size() && count <= data.size() - offset;
}

} // anonymous namespace

// ── read_uint ─────────────────────────────────────────────────────────────────

std::error_code read_uint(
    std::span<const uint8_t> data,
    std::size_t& offset,
    std::size_t byte_count,
    uint64_t& value) noexcept
{
    if (byte_count == 0 || byte_count > sizeof(uint64_t)) {
        return std::make_error_code(std::errc::invalid_argument);
    }
    if (!fits(data, offset, byte_count)) {
        return DecodeErrc::truncated_input;
    }

    uint64_t v = 0;
    for (std::size_t i = 0; i < byte_count; ++i) {
        v = (v << 8) | data[offset + i];
    }
    value = v;
    offset += byte_count;
    return {};
}

// ── read_string ───────────────────────────────────────────────────────────────

std::error_code read_string(
    std::span<const uint8_t> data,
    std::size_t& offset,
    std::string& value)
{
    if (!fits(data, offset, 2)) {
        return DecodeErrc::truncated_input;
    }

    if (data[offset] == kEmptyStringMarker &&
        data[offset + 1] == kEmptyStringMarker) {
        value.clear();
        offset += 2;
        return {};
    }

    std::size_t cursor = offset;
    uint16_t length = 0;
    if (auto ec = read_uint(data, cursor, length)) {
        return ec;
    }
    if (!fits(data, cursor, length)) {
        return DecodeErrc::truncated_input;
    }

    value.assign(reinterpret_cast<const char*>(data.data() + cursor), length);
    offset = cursor + length;
    return {};
}

// ── latin1_to_utf8 ────────────────────────────────────────────────────────────

std::string latin1_to_utf8(std::string_view latin1) {
    std::string out;
    out.reserve(latin1.size());
    for (char ch : latin1) {
        const auto c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return out;
}

} // namespace mbdb::format

#include "format/decoder.hpp"
#include "format/content_id.hpp"
#include "format/cursor.hpp"

#include <cstring>
#include <utility>
#include <vector>

namespace mbdb::format {

// ── decode_record ─────────────────────────────────────────────────────────────

std::error_code decode_record(
    std::span<const uint8_t> data,
    std::size_t& offset,
    Record& record)
{
    // Local cursor: a failed record leaves `offset` at the record start.
    std::size_t p = offset;
    Record r;
    r.start_offset = p;

    std::error_code ec;
    if ((ec = read_string(data, p, r.domain)))          return ec;
    if ((ec = read_string(data, p, r.relative_path)))   return ec;
    if ((ec = read_string(data, p, r.link_target)))     return ec;
    if ((ec = read_string(data, p, r.content_hash)))    return ec;
    if ((ec = read_string(data, p, r.unknown_field_1))) return ec;

    if ((ec = read_uint(data, p, r.posix_mode)))        return ec;
    if ((ec = read_uint(data, p, r.unknown_field_2)))   return ec;
    if ((ec = read_uint(data, p, r.unknown_field_3)))   return ec;
    if ((ec = read_uint(data, p, r.owner_uid)))         return ec;
    if ((ec = read_uint(data, p, r.group_gid)))         return ec;
    if ((ec = read_uint(data, p, r.mtime)))             return ec;
    if ((ec = read_uint(data, p, r.atime)))             return ec;
    if ((ec = read_uint(data, p, r.ctime)))             return ec;
    if ((ec = read_uint(data, p, r.size)))              return ec;
    if ((ec = read_uint(data, p, r.flag)))              return ec;

    uint8_t property_count = 0;
    if ((ec = read_uint(data, p, property_count)))      return ec;

    r.properties.reserve(property_count);
    for (uint8_t i = 0; i < property_count; ++i) {
        Property prop;
        if ((ec = read_string(data, p, prop.first)))    return ec;
        if ((ec = read_string(data, p, prop.second)))   return ec;
        r.properties.push_back(std::move(prop));
    }

    r.content_id = compute_content_id(r.domain, r.relative_path);

    record = std::move(r);
    offset = p;
    return {};
}

// ── decode ────────────────────────────────────────────────────────────────────

std::error_code decode(
    std::span<const uint8_t> data,
    Catalog& catalog,
    std::size_t* error_offset)
{
    auto fail = [error_offset](std::error_code ec, std::size_t at) {
        if (error_offset != nullptr) {
            *error_offset = at;
        }
        return ec;
    };

    // Validate magic.
    if (data.size() < kManifestMagicSize ||
        std::memcmp(data.data(), kManifestMagic, kManifestMagicSize) != 0) {
        return fail(DecodeErrc::invalid_signature, 0);
    }

    // Skip the two bytes after the magic.
    if (data.size() < kManifestHeaderSize) {
        return fail(DecodeErrc::truncated_input, kManifestMagicSize);
    }
    std::size_t offset = kManifestHeaderSize;

    std::vector<Record> records;
    while (offset < data.size()) {
        Record record;
        if (auto ec = decode_record(data, offset, record)) {
            return fail(ec, offset);
        }
        records.push_back(std::move(record));
    }

    catalog = Catalog{std::move(records)};
    return {};
}

} // namespace mbdb::format

#pragma once

#include "format/content_id.hpp"
#include "format/record.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

namespace mbdb::test {

// ── ManifestBuilder ───────────────────────────────────────────────────────────
// Assembles Manifest.mbdb images byte by byte for decoder tests.
// Starts with the standard header "mbdb" 05 00.

class ManifestBuilder {
public:
    ManifestBuilder() : buf_{'m', 'b', 'd', 'b', 0x05, 0x00} {}

    // Start from an arbitrary header (e.g. a bad signature).
    explicit ManifestBuilder(std::initializer_list<uint8_t> header) : buf_(header) {}

    ManifestBuilder& put_uint(uint64_t v, int bytes) {
        for (int i = bytes - 1; i >= 0; --i) {
            buf_.push_back(static_cast<uint8_t>(v >> (i * 8)));
        }
        return *this;
    }

    // Empty strings use the FF FF marker; others a u16 length prefix.
    ManifestBuilder& put_string(const std::string& s) {
        if (s.empty()) {
            return raw({0xFF, 0xFF});
        }
        put_uint(s.size(), 2);
        buf_.insert(buf_.end(), s.begin(), s.end());
        return *this;
    }

    ManifestBuilder& raw(std::initializer_list<uint8_t> bytes) {
        buf_.insert(buf_.end(), bytes);
        return *this;
    }

    // Append every wire field of `r` in decode order.
    ManifestBuilder& record(const format::Record& r) {
        put_string(r.domain);
        put_string(r.relative_path);
        put_string(r.link_target);
        put_string(r.content_hash);
        put_string(r.unknown_field_1);
        put_uint(r.posix_mode, 2);
        put_uint(r.unknown_field_2, 4);
        put_uint(r.unknown_field_3, 4);
        put_uint(r.owner_uid, 4);
        put_uint(r.group_gid, 4);
        put_uint(r.mtime, 4);
        put_uint(r.atime, 4);
        put_uint(r.ctime, 4);
        put_uint(r.size, 8);
        put_uint(r.flag, 1);
        put_uint(r.properties.size(), 1);
        for (const auto& [name, value] : r.properties) {
            put_string(name);
            put_string(value);
        }
        return *this;
    }

    [[nodiscard]] std::size_t size() const { return buf_.size(); }
    [[nodiscard]] const std::vector<uint8_t>& bytes() const { return buf_; }

private:
    std::vector<uint8_t> buf_;
};

// A regular file record with distinct, recognisable field values.
// start_offset is left 0; content_id is filled in.
inline format::Record make_record(const std::string& domain,
                                  const std::string& relative_path) {
    format::Record r;
    r.domain          = domain;
    r.relative_path   = relative_path;
    r.content_hash    = std::string("\x01\x02\x03\xFE", 4);
    r.posix_mode      = 0x81A4;          // regular, rw-r--r--
    r.unknown_field_2 = 0x11223344;
    r.unknown_field_3 = 0x55667788;
    r.owner_uid       = 501;
    r.group_gid       = 20;
    r.mtime           = 1'400'000'000;
    r.atime           = 1'400'000'100;
    r.ctime           = 1'400'000'200;
    r.size            = 1234;
    r.flag            = 4;
    r.content_id      = format::compute_content_id(domain, relative_path);
    return r;
}

} // namespace mbdb::test

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mbdb::format {

// ── Manifest header constants ─────────────────────────────────────────────────

static constexpr char kManifestMagic[] = "mbdb";         // 4 bytes (no NUL)
static constexpr std::size_t kManifestMagicSize = 4;
// Two bytes follow the magic (observed as 05 00). Skipped, never validated.
static constexpr std::size_t kManifestHeaderSize = kManifestMagicSize + 2;

// ── File type (high bits of the POSIX mode) ───────────────────────────────────

static constexpr uint16_t kModeTypeMask   = 0xE000;
static constexpr uint16_t kModeSymlink    = 0xA000;
static constexpr uint16_t kModeRegular    = 0x8000;
static constexpr uint16_t kModeDirectory  = 0x4000;
static constexpr uint16_t kModePermMask   = 0x0FFF;

enum class FileType : uint8_t {
    Regular,
    Directory,
    Symlink,
    Unknown,
};

// ── Property ──────────────────────────────────────────────────────────────────
// Arbitrary name/value pair attached to a record. Names are not a closed set.

using Property = std::pair<std::string, std::string>;

// ── Record ────────────────────────────────────────────────────────────────────
//
// One backed-up file, directory or symlink. Wire layout (all integers BE):
//
//   [domain: str][relative_path: str][link_target: str]
//   [content_hash: str][unknown_field_1: str]
//   [posix_mode: u16][unknown_field_2: u32][unknown_field_3: u32]
//   [owner_uid: u32][group_gid: u32][mtime: u32][atime: u32][ctime: u32]
//   [size: u64][flag: u8][property_count: u8]
//     [name: str][value: str]  × property_count
//
// There is no length field: the next record starts where this one's last
// field ends. Strings hold the raw Latin-1 bytes from the file.

struct Record {
    uint64_t    start_offset = 0;   // offset of the record in the manifest

    std::string domain;
    std::string relative_path;
    std::string link_target;        // empty unless symlink
    std::string content_hash;       // opaque
    std::string unknown_field_1;    // opaque

    uint16_t    posix_mode      = 0;
    uint32_t    unknown_field_2 = 0;
    uint32_t    unknown_field_3 = 0;
    uint32_t    owner_uid       = 0;
    uint32_t    group_gid       = 0;
    uint32_t    mtime           = 0;
    uint32_t    atime           = 0;
    uint32_t    ctime           = 0;
    uint64_t    size            = 0;
    uint8_t     flag            = 0;

    std::vector<Property> properties;   // file order

    std::string content_id;         // 40 hex chars, see compute_content_id()

    // domain + "::" + relative_path
    [[nodiscard]] std::string full_path() const;

    [[nodiscard]] FileType file_type() const noexcept;

    [[nodiscard]] uint16_t permissions() const noexcept {
        return static_cast<uint16_t>(posix_mode & kModePermMask);
    }

    bool operator==(const Record&) const = default;
};

// ── Catalog ───────────────────────────────────────────────────────────────────
//
// Immutable result of one decode pass: records in file order plus lookup
// indexes by start offset and by content id. The indexes are built once,
// after the sequential pass, from the finished record list.
//
// Several records may share a content id (a corrupt or hand-built manifest);
// find_by_content_id() returns the first one in file order.

class Catalog {
public:
    using const_iterator = std::vector<Record>::const_iterator;

    Catalog() = default;
    explicit Catalog(std::vector<Record> records);

    [[nodiscard]] std::size_t size()  const noexcept { return records_.size(); }
    [[nodiscard]] bool        empty() const noexcept { return records_.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return records_.begin(); }
    [[nodiscard]] const_iterator end()   const noexcept { return records_.end(); }

    [[nodiscard]] const std::vector<Record>& records() const noexcept { return records_; }

    // Returns nullptr when no record starts at `start_offset`.
    [[nodiscard]] const Record* find(uint64_t start_offset) const;

    // Returns nullptr when no record has this content id.
    [[nodiscard]] const Record* find_by_content_id(const std::string& content_id) const;

    bool operator==(const Catalog& other) const { return records_ == other.records_; }

private:
    std::vector<Record> records_;
    std::unordered_map<uint64_t, std::size_t> by_offset_;
    std::unordered_map<std::string, std::size_t> by_content_id_;
};

} // namespace mbdb::format

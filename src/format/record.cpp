#include "format/record.hpp"

namespace mbdb::format {

// ── Record ────────────────────────────────────────────────────────────────────

std::string Record::full_path() const {
    std::string path;
    path.reserve(domain.size() + 2 + relative_path.size());
    path.append(domain);
    path.append("::");
    path.append(relative_path);
    return path;
}

FileType Record::file_type() const noexcept {
    switch (posix_mode & kModeTypeMask) {
        case kModeSymlink:   return FileType::Symlink;
        case kModeRegular:   return FileType::Regular;
        case kModeDirectory: return FileType::Directory;
        default:             return FileType::Unknown;
    }
}

// ── Catalog ───────────────────────────────────────────────────────────────────

Catalog::Catalog(std::vector<Record> records)
    : records_(std::move(records))
{
    by_offset_.reserve(records_.size());
    by_content_id_.reserve(records_.size());
    for (std::size_t i = 0; i < records_.size(); ++i) {
        by_offset_.emplace(records_[i].start_offset, i);
        // emplace keeps the first occurrence of a duplicate id.
        by_content_id_.emplace(records_[i].content_id, i);
    }
}

const Record* Catalog::find(uint64_t start_offset) const {
    auto it = by_offset_.find(start_offset);
    if (it == by_offset_.end()) {
        return nullptr;
    }
    return &records_[it->second];
}

const Record* Catalog::find_by_content_id(const std::string& content_id) const {
    auto it = by_content_id_.find(content_id);
    if (it == by_content_id_.end()) {
        return nullptr;
    }
    return &records_[it->second];
}

} // namespace mbdb::format

#pragma once

#include "format/record.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace mbdb::listing {

// Field a listing is ordered by.
enum class SortKey : uint8_t {
    FullPath,
    Mtime,
    Atime,
    Ctime,
    Size,
};

// Lower-case name of `key` for log lines ("path", "mtime", ...).
[[nodiscard]] std::string_view to_string(SortKey key) noexcept;

// Direction the listing tool uses when -r is not given: paths read
// A→Z, times and sizes newest/largest first.
[[nodiscard]] constexpr bool default_descending(SortKey key) noexcept {
    return key != SortKey::FullPath;
}

// Order the records of `catalog` by `key`.
//
// Stable in both directions: records with equal keys keep file order.
// Paths compare byte-wise as unsigned values (code-point order for Latin-1);
// times and sizes compare numerically.
//
// The returned pointers refer into `catalog` and are valid while it lives.
[[nodiscard]] std::vector<const format::Record*> sort_records(
    const format::Catalog& catalog, SortKey key, bool descending);

} // namespace mbdb::listing

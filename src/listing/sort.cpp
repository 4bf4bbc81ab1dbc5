#include "listing/sort.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace mbdb::listing {

namespace {

template <typename Proj>
void stable_order(std::vector<const format::Record*>& out, Proj proj,
                  bool descending) {
    if (descending) {
        std::stable_sort(out.begin(), out.end(),
            [&](const format::Record* a, const format::Record* b) {
                return proj(*b) < proj(*a);
            });
    } else {
        std::stable_sort(out.begin(), out.end(),
            [&](const format::Record* a, const format::Record* b) {
                return proj(*a) < proj(*b);
            });
    }
}

} // anonymous namespace

std::string_view to_string(SortKey key) noexcept {
    switch (key) {
        case SortKey::FullPath: return "path";
        case SortKey::Mtime:    return "mtime";
        case SortKey::Atime:    return "atime";
        case SortKey::Ctime:    return "ctime";
        case SortKey::Size:     return "size";
    }
    return "unknown";
}

std::vector<const format::Record*> sort_records(
    const format::Catalog& catalog, SortKey key, bool descending)
{
    std::vector<const format::Record*> out;
    out.reserve(catalog.size());
    for (const auto& record : catalog) {
        out.push_back(&record);
    }

    switch (key) {
        case SortKey::FullPath: {
            // Compute each full path once rather than per comparison.
            std::vector<std::pair<std::string, const format::Record*>> keyed;
            keyed.reserve(out.size());
            for (const auto* r : out) {
                keyed.emplace_back(r->full_path(), r);
            }
            auto less = [](const auto& a, const auto& b) {
                return a.first < b.first;
            };
            if (descending) {
                std::stable_sort(keyed.begin(), keyed.end(),
                    [&](const auto& a, const auto& b) { return less(b, a); });
            } else {
                std::stable_sort(keyed.begin(), keyed.end(), less);
            }
            for (std::size_t i = 0; i < keyed.size(); ++i) {
                out[i] = keyed[i].second;
            }
            break;
        }
        case SortKey::Mtime:
            stable_order(out, [](const format::Record& r) { return r.mtime; }, descending);
            break;
        case SortKey::Atime:
            stable_order(out, [](const format::Record& r) { return r.atime; }, descending);
            break;
        case SortKey::Ctime:
            stable_order(out, [](const format::Record& r) { return r.ctime; }, descending);
            break;
        case SortKey::Size:
            stable_order(out, [](const format::Record& r) { return r.size; }, descending);
            break;
    }
    return out;
}

} // namespace mbdb::listing

#include "listing/formatter.hpp"
#include "format/cursor.hpp"  // latin1_to_utf8()

#include <ctime>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace mbdb::listing {

namespace {

// Latin-1 characters a Python str considers printable.
bool is_printable(unsigned char c) noexcept {
    if (c >= 0x20 && c < 0x7F) return true;
    if (c <= 0xA0) return false;   // C0, DEL, C1 controls, NBSP
    return c != 0xAD;              // soft hyphen
}

std::string utf8(std::string_view latin1) {
    return format::latin1_to_utf8(latin1);
}

} // anonymous namespace

// ── Column helpers ────────────────────────────────────────────────────────────

char file_type_char(format::FileType type) noexcept {
    switch (type) {
        case format::FileType::Symlink:   return 'l';
        case format::FileType::Regular:   return '-';
        case format::FileType::Directory: return 'd';
        case format::FileType::Unknown:   break;
    }
    return '?';
}

std::string permission_string(uint16_t permissions) {
    std::string out(9, '-');
    static constexpr char kBits[] = "rwx";
    for (int i = 0; i < 9; ++i) {
        if (permissions & (1u << (8 - i))) {
            out[i] = kBits[i % 3];
        }
    }
    return out;
}

std::string format_time(uint32_t seconds, TimeFormat format) {
    if (format == TimeFormat::Epoch) {
        return fmt::format("{:10}", seconds);
    }

    const std::time_t t = static_cast<std::time_t>(seconds);
    std::tm tm{};
    const bool ok = (format == TimeFormat::Utc)
        ? ::gmtime_r(&t, &tm) != nullptr
        : ::localtime_r(&t, &tm) != nullptr;
    if (!ok) {
        return fmt::format("{:10}", seconds);
    }

    char buf[32];
    const auto n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf, n);
}

std::string quote_value(std::string_view latin1) {
    const bool has_single = latin1.find('\'') != std::string_view::npos;
    const bool has_double = latin1.find('"') != std::string_view::npos;
    const char quote = (has_single && !has_double) ? '"' : '\'';

    std::string out;
    out.reserve(latin1.size() + 2);
    out.push_back(quote);
    for (char ch : latin1) {
        const auto c = static_cast<unsigned char>(ch);
        if (ch == quote || ch == '\\') {
            out.push_back('\\');
            out.push_back(ch);
        } else if (ch == '\t') {
            out += "\\t";
        } else if (ch == '\n') {
            out += "\\n";
        } else if (ch == '\r') {
            out += "\\r";
        } else if (!is_printable(c)) {
            out += fmt::format("\\x{:02x}", c);
        } else {
            out += utf8(std::string_view(&ch, 1));
        }
    }
    out.push_back(quote);
    return out;
}

// ── format_record ─────────────────────────────────────────────────────────────

std::string format_record(const format::Record& record,
                          const FormatOptions& options)
{
    if (options.mode == OutputMode::PathOnly) {
        return utf8(record.full_path());
    }
    if (options.mode == OutputMode::IdAndPath) {
        return fmt::format("{} {}", record.content_id, utf8(record.full_path()));
    }

    const auto type = record.file_type();
    if (type == format::FileType::Unknown) {
        spdlog::warn("Unknown file type {:04x} for {} {}", record.posix_mode,
                     record.content_id, utf8(record.full_path()));
    }

    const std::string mode = fmt::format("{}{}", file_type_char(type),
                                         permission_string(record.permissions()));
    const auto mtime = format_time(record.mtime, options.time_format);
    const auto atime = format_time(record.atime, options.time_format);
    const auto ctime = format_time(record.ctime, options.time_format);

    std::string line;
    char sep;
    if (options.tab_delimited) {
        sep = '\t';
        line = fmt::format("{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}",
                           mode, record.owner_uid, record.group_gid, record.size,
                           mtime, atime, ctime, record.content_id,
                           utf8(record.domain), utf8(record.relative_path));
    } else {
        sep = ' ';
        line = fmt::format("{} {:5} {:5} {:7} {}  {}  {}  {} {}::{}",
                           mode, record.owner_uid, record.group_gid, record.size,
                           mtime, atime, ctime, record.content_id,
                           utf8(record.domain), utf8(record.relative_path));
    }

    if (type == format::FileType::Symlink) {
        line += " -> ";
        line += utf8(record.link_target);
    }
    for (const auto& [name, value] : record.properties) {
        line.push_back(sep);
        line += utf8(name);
        line.push_back('=');
        line += quote_value(value);
    }
    return line;
}

} // namespace mbdb::listing

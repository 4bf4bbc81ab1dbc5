#pragma once

#include "format/record.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace mbdb::listing {

enum class OutputMode : uint8_t {
    IdAndPath,   // "<content_id> <domain>::<path>"
    PathOnly,    // "<domain>::<path>"
    Detailed,    // ls -l style line
};

enum class TimeFormat : uint8_t {
    Local,       // YYYY-MM-DD HH:MM:SS in the local zone
    Utc,         // YYYY-MM-DD HH:MM:SS in UTC
    Epoch,       // seconds, right-aligned in 10 columns
};

struct FormatOptions {
    OutputMode mode          = OutputMode::IdAndPath;
    TimeFormat time_format   = TimeFormat::Local;
    bool       tab_delimited = false;   // Detailed mode only
};

// Render one record as a single output line (no trailing newline).
//
// Detailed, aligned:
//   -rw-r--r--   501   501    1234 <mtime>  <atime>  <ctime>  <id> <domain>::<path>
// Detailed, tab-delimited: the same columns joined by '\t', with domain and
// path in separate columns.
//
// Symlinks get " -> <target>"; each property appends "<sep>name=<repr(value)>".
// Text is emitted as UTF-8. Records of unknown file type are rendered with
// '?' and logged as a warning.
[[nodiscard]] std::string format_record(const format::Record& record,
                                        const FormatOptions& options);

// ── Column helpers ────────────────────────────────────────────────────────────

// 'l', '-', 'd' or '?'.
[[nodiscard]] char file_type_char(format::FileType type) noexcept;

// "rwxr-x---" for the low nine permission bits.
[[nodiscard]] std::string permission_string(uint16_t permissions);

[[nodiscard]] std::string format_time(uint32_t seconds, TimeFormat format);

// Quote a Latin-1 value as a Python string literal would print: single
// quotes unless the value holds a ' and no ", backslash escapes for
// \\ \t \n \r and the quote, \xNN for other non-printable characters.
[[nodiscard]] std::string quote_value(std::string_view latin1);

} // namespace mbdb::listing

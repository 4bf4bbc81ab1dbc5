#pragma once

#include "format/record.hpp"

#include <cstdint>
#include <filesystem>
#include <system_error>
#include <vector>

namespace mbdb::format {

// Conventional file name inside an iTunes / iOS backup directory.
static constexpr const char* kManifestFilename = "Manifest.mbdb";

// Read the whole file at `path` into `bytes`, up to EOF. Works for pipes,
// FIFOs and /dev/stdin as well as regular files.
// Returns the system error on open/read failure.
[[nodiscard]] std::error_code read_file(
    const std::filesystem::path& path,
    std::vector<uint8_t>& bytes);

// Read and decode the manifest at `path`.
//
// Returns {} and replaces `catalog` on success. Otherwise returns the system
// error from reading, or a DecodeErrc from decode(); `catalog` is unchanged.
// The returned error is the caller's to report. Failures are only logged at
// debug level, with the path and the record offset for decode errors.
[[nodiscard]] std::error_code load_manifest(
    const std::filesystem::path& path,
    Catalog& catalog);

} // namespace mbdb::format

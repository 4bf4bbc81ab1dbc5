#pragma once

#include "format/decode_error.hpp"
#include "format/record.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>

namespace mbdb::format {

// Decode a complete Manifest.mbdb image.
//
//   ["mbdb" (4B)][2 bytes, skipped][Record]…  until end of data
//
// Records are decoded strictly in sequence; each one starts exactly where
// the previous one ended and the last one must end exactly at data.size().
//
// Returns:
//   {}                              catalog replaced with the decoded records
//   DecodeErrc::invalid_signature   data does not start with "mbdb"
//   DecodeErrc::truncated_input     a field runs past the end of data
//
// On failure `catalog` is left unchanged and, when `error_offset` is non-null,
// it receives the start offset of the record that could not be decoded
// (0 for a bad signature, 4 for a header cut short).
//
// Pure function of `data`: no logging, no shared state.
[[nodiscard]] std::error_code decode(
    std::span<const uint8_t> data,
    Catalog& catalog,
    std::size_t* error_offset = nullptr);

// Decode a single record starting at `offset`, advancing `offset` past it.
// On failure neither `offset` nor `record` is modified.
[[nodiscard]] std::error_code decode_record(
    std::span<const uint8_t> data,
    std::size_t& offset,
    Record& record);

} // namespace mbdb::format

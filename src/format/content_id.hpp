#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace mbdb::format {

// Length of a content identifier: SHA-1 (20 bytes) as lowercase hex.
inline constexpr std::size_t kContentIdLength = 40;

// Compute the content identifier of a backed-up item.
//
// SHA-1 over the UTF-8 encoding of `domain + "-" + relative_path`, where the
// inputs are Latin-1 bytes as decoded from the manifest. This matches the
// file names used inside the backup directory and the identifiers emitted
// by existing tooling.
//
// Throws std::runtime_error if the digest cannot be computed.
[[nodiscard]] std::string compute_content_id(std::string_view domain,
                                             std::string_view relative_path);

} // namespace mbdb::format

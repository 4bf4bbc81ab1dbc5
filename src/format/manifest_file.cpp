#include "format/manifest_file.hpp"
#include "format/decoder.hpp"

#include <cerrno>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace mbdb::format {

namespace {

// Read from fd until EOF, appending to `buf`. Returns error_code on failure.
[[nodiscard]] std::error_code read_to_eof(int fd, std::vector<uint8_t>& buf) {
    constexpr std::size_t kChunkSize = 64 * 1024;
    std::size_t total = buf.size();
    while (true) {
        buf.resize(total + kChunkSize);
        auto n = ::read(fd, buf.data() + total, kChunkSize);
        if (n < 0) {
            if (errno == EINTR) continue;
            return {errno, std::system_category()};
        }
        if (n == 0) {
            break;
        }
        total += static_cast<std::size_t>(n);
    }
    buf.resize(total);
    return {};
}

}  // namespace

// ── read_file ────────────────────────────────────────────────────────────────

std::error_code read_file(
    const std::filesystem::path& path,
    std::vector<uint8_t>& bytes) {

    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return {errno, std::system_category()};
    }

    struct stat st {};
    if (::fstat(fd, &st) < 0) {
        auto ec = std::error_code{errno, std::system_category()};
        ::close(fd);
        return ec;
    }
    if (S_ISDIR(st.st_mode)) {
        ::close(fd);
        return std::make_error_code(std::errc::is_a_directory);
    }

    // st_size is only a hint: pipes and FIFOs report 0.
    std::vector<uint8_t> buf;
    if (S_ISREG(st.st_mode)) {
        buf.reserve(static_cast<std::size_t>(st.st_size) + 1);
    }
    auto ec = read_to_eof(fd, buf);
    ::close(fd);
    if (ec) {
        return ec;
    }

    bytes = std::move(buf);
    return {};
}

// ── load_manifest ────────────────────────────────────────────────────────────

std::error_code load_manifest(
    const std::filesystem::path& path,
    Catalog& catalog) {

    std::vector<uint8_t> bytes;
    if (auto ec = read_file(path, bytes)) {
        spdlog::debug("Manifest: failed to read {}: {}", path.string(),
                      ec.message());
        return ec;
    }
    spdlog::debug("Manifest: read {} bytes from {}", bytes.size(),
                  path.string());

    std::size_t error_offset = 0;
    if (auto ec = decode(bytes, catalog, &error_offset)) {
        spdlog::debug("Manifest: {} is not decodable at offset {}: {}",
                      path.string(), error_offset, ec.message());
        return ec;
    }

    spdlog::debug("Manifest: decoded {} records from {}", catalog.size(),
                  path.string());
    return {};
}

} // namespace mbdb::format

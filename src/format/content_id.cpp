#include "format/content_id.hpp"
#include "format/cursor.hpp"  // latin1_to_utf8()

#include <array>
#include <stdexcept>

#include <openssl/evp.h>

namespace mbdb::format {

std::string compute_content_id(std::string_view domain,
                               std::string_view relative_path)
{
    std::string input;
    input.reserve(domain.size() + 1 + relative_path.size());
    input.append(domain);
    input.push_back('-');
    input.append(relative_path);
    const std::string utf8 = latin1_to_utf8(input);

    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int md_len = 0;
    if (EVP_Digest(utf8.data(), utf8.size(), md.data(), &md_len,
                   EVP_sha1(), nullptr) != 1 ||
        md_len * 2 != kContentIdLength) {
        throw std::runtime_error("SHA-1 digest failed");
    }

    static constexpr char kHex[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(kContentIdLength);
    for (unsigned int i = 0; i < md_len; ++i) {
        hex.push_back(kHex[md[i] >> 4]);
        hex.push_back(kHex[md[i] & 0x0F]);
    }
    return hex;
}

} // namespace mbdb::format

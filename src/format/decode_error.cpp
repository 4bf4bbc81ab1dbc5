#include "format/decode_error.hpp"

#include <string>

namespace mbdb::format {

namespace {

class DecodeCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "mbdb"; }

    std::string message(int ev) const override {
        switch (static_cast<DecodeErrc>(ev)) {
            case DecodeErrc::invalid_signature:
                return "This does not look like an MBDB file";
            case DecodeErrc::truncated_input:
                return "Truncated MBDB file: record runs past end of data";
        }
        return "unknown mbdb error " + std::to_string(ev);
    }
};

} // anonymous namespace

const std::error_category& decode_category() noexcept {
    static const DecodeCategory category;
    return category;
}

std::error_code make_error_code(DecodeErrc e) noexcept {
    return {static_cast<int>(e), decode_category()};
}

} // namespace mbdb::format

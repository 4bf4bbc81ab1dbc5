#pragma once

#include "listing/formatter.hpp"
#include "listing/sort.hpp"

#include <string>

#include <boost/program_options.hpp>

namespace mbdb {

inline constexpr const char* kVersion = "1.0.0";

// ── ListConfig ────────────────────────────────────────────────────────────────
// Resolved options for one mbdbls run.
// Populated by parse_config() from CLI arguments.

struct ListConfig {
    std::string file;                        // Manifest.mbdb to read
    listing::FormatOptions format;           // output mode, time format, tabs
    listing::SortKey sort_key = listing::SortKey::FullPath;
    bool        descending = false;          // resolved direction (after -r)
    std::string log_level = "warn";          // spdlog level string

    bool        show_help    = false;        // --help given; help_text is set
    bool        show_version = false;        // --version given
    std::string help_text;
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a ListConfig.
//
// On success: returns a fully validated ListConfig. With --help or --version
//             the remaining options are not validated.
// On error  : throws std::runtime_error with a human-readable message.
//
// Validates:
//   - --file is present
//   - -l and -s are not combined
//   - -t and -S are not combined
//   - -t is one of m|a|c, --time-fmt is one of l|e|u
//
// --tab implies -l and cancels -s. Without -r, paths sort ascending and
// times/sizes descending; -r flips that.

[[nodiscard]] ListConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with mbdbls options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace mbdb

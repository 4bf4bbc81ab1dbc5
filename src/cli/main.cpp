#include "common/list_config.hpp"
#include "common/logger.hpp"
#include "format/manifest_file.hpp"
#include "listing/formatter.hpp"
#include "listing/sort.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <exception>
#include <stdexcept>
#include <string>

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    mbdb::ListConfig cfg;
    try {
        cfg = mbdb::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    if (cfg.show_help) {
        fprintf(stdout, "Parse Manifest.mbdb files from iTunes backup directories\n\n%s\n",
                cfg.help_text.c_str());
        return 0;
    }
    if (cfg.show_version) {
        fprintf(stdout, "mbdbls %s\n", mbdb::kVersion);
        return 0;
    }

    mbdb::init_default_logger(mbdb::parse_log_level(cfg.log_level));

    spdlog::debug("mbdbls reading {} (sort key {}, {})", cfg.file,
                  mbdb::listing::to_string(cfg.sort_key),
                  cfg.descending ? "descending" : "ascending");

    try {
        mbdb::format::Catalog catalog;
        if (auto ec = mbdb::format::load_manifest(cfg.file, catalog)) {
            fprintf(stdout, "[!] Error: %s\n", ec.message().c_str());
            return 1;
        }

        for (const auto* record :
             mbdb::listing::sort_records(catalog, cfg.sort_key, cfg.descending)) {
            // fwrite: decoded names may contain NUL bytes.
            const auto line = mbdb::listing::format_record(*record, cfg.format);
            fwrite(line.data(), 1, line.size(), stdout);
            fputc('\n', stdout);
        }
    } catch (const std::exception& ex) {
        spdlog::error("mbdbls: exception: {}", ex.what());
        return 1;
    }

    return 0;
}

#include "common/list_config.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>
#include <fmt/format.h>

namespace po = boost::program_options;

namespace mbdb {

namespace {

// ── Helpers ───────────────────────────────────────────────────────────────────

[[nodiscard]] listing::SortKey parse_time_sort(const std::string& s) {
    if (s == "m") return listing::SortKey::Mtime;
    if (s == "a") return listing::SortKey::Atime;
    if (s == "c") return listing::SortKey::Ctime;
    throw std::runtime_error(
        fmt::format("-t must be one of m, a, c; got '{}'", s));
}

[[nodiscard]] listing::TimeFormat parse_time_format(const std::string& s) {
    if (s == "l") return listing::TimeFormat::Local;
    if (s == "u") return listing::TimeFormat::Utc;
    if (s == "e") return listing::TimeFormat::Epoch;
    throw std::runtime_error(
        fmt::format("--time-fmt must be one of l, e, u; got '{}'", s));
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("version,v",
            "Show the program version and exit")
        ("file,f",
            po::value<std::string>(),
            "Manifest.mbdb file to parse (required)")
        ("tab",
            po::bool_switch(),
            "Tab-delimited output (implies -l)")
        ("time-fmt,T",
            po::value<std::string>()->default_value("l"),
            "Timestamps as (l)ocaltime, (u)tc or (e)poch")
        ("long,l",
            po::bool_switch(),
            "Detailed listing")
        ("paths,s",
            po::bool_switch(),
            "Display file paths only")
        ("time,t",
            po::value<std::string>(),
            "Sort by (m)odify, (a)ccess or (c)hange time")
        ("size,S",
            po::bool_switch(),
            "Sort by file size")
        ("reverse,r",
            po::bool_switch(),
            "Reverse sort order")
        ("log-level",
            po::value<std::string>()->default_value("warn"),
            "Log level: trace|debug|info|warn|error|critical");
}

// ── parse_config ──────────────────────────────────────────────────────────────

ListConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("mbdbls options");
    add_options(desc);

    ListConfig cfg;
    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    if (vm.count("help")) {
        std::ostringstream oss;
        oss << desc;
        cfg.show_help = true;
        cfg.help_text = oss.str();
        return cfg;
    }
    if (vm.count("version")) {
        cfg.show_version = true;
        return cfg;
    }

    if (!vm.count("file")) {
        throw std::runtime_error("Argument error: --file is required");
    }
    cfg.file      = vm["file"].as<std::string>();
    cfg.log_level = vm["log-level"].as<std::string>();

    bool detailed   = vm["long"].as<bool>();
    bool paths_only = vm["paths"].as<bool>();
    const bool tab  = vm["tab"].as<bool>();
    const bool by_size = vm["size"].as<bool>();

    if (detailed && paths_only) {
        throw std::runtime_error("Argument error: -l and -s are mutually exclusive");
    }
    if (by_size && vm.count("time")) {
        throw std::runtime_error("Argument error: -t and -S are mutually exclusive");
    }

    if (tab) {
        detailed   = true;
        paths_only = false;
    }

    if (paths_only) {
        cfg.format.mode = listing::OutputMode::PathOnly;
    } else if (detailed) {
        cfg.format.mode = listing::OutputMode::Detailed;
    } else {
        cfg.format.mode = listing::OutputMode::IdAndPath;
    }
    cfg.format.tab_delimited = tab;
    cfg.format.time_format   = parse_time_format(vm["time-fmt"].as<std::string>());

    if (by_size) {
        cfg.sort_key = listing::SortKey::Size;
    } else if (vm.count("time")) {
        cfg.sort_key = parse_time_sort(vm["time"].as<std::string>());
    } else {
        cfg.sort_key = listing::SortKey::FullPath;
    }
    cfg.descending = listing::default_descending(cfg.sort_key) != vm["reverse"].as<bool>();

    return cfg;
}

} // namespace mbdb

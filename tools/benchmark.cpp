// Decode throughput benchmark.
//
// Builds a synthetic Manifest.mbdb image in memory (N records, each with a
// handful of properties and a mix of empty and length-prefixed strings),
// then decodes it repeatedly.
//
// Prints: records per decode, image size, records/sec, MB/sec and latency
// percentiles (p50, p90, p99) per full decode.
//
// Usage: mbdb-bench [records] [iterations] [properties-per-record]

#include "format/decoder.hpp"
#include "format/record.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <numeric>
#include <string>
#include <vector>

namespace {

using steady = std::chrono::steady_clock;
using ns    = std::chrono::nanoseconds;

// ── Synthetic manifest writer ────────────────────────────────────────────────

void put_uint(std::vector<uint8_t>& buf, uint64_t v, int bytes) {
    for (int i = bytes - 1; i >= 0; --i) {
        buf.push_back(static_cast<uint8_t>(v >> (i * 8)));
    }
}

void put_string(std::vector<uint8_t>& buf, const std::string& s) {
    if (s.empty()) {
        buf.push_back(0xFF);
        buf.push_back(0xFF);
        return;
    }
    put_uint(buf, s.size(), 2);
    buf.insert(buf.end(), s.begin(), s.end());
}

std::vector<uint8_t> build_manifest(std::size_t records, std::size_t properties) {
    std::vector<uint8_t> buf{'m', 'b', 'd', 'b', 0x05, 0x00};
    buf.reserve(records * 160);

    for (std::size_t i = 0; i < records; ++i) {
        put_string(buf, "AppDomain-com.example.app" + std::to_string(i % 37));
        put_string(buf, "Library/Caches/item-" + std::to_string(i) + ".plist");
        put_string(buf, "");                                 // link target
        put_string(buf, std::string(20, static_cast<char>(i & 0x7F)));
        put_string(buf, "");                                 // unknown 1
        put_uint(buf, 0x81A4, 2);                            // -rw-r--r--
        put_uint(buf, 0, 4);
        put_uint(buf, 0, 4);
        put_uint(buf, 501, 4);
        put_uint(buf, 501, 4);
        put_uint(buf, 1'400'000'000 + i, 4);
        put_uint(buf, 1'400'000'100 + i, 4);
        put_uint(buf, 1'400'000'200 + i, 4);
        put_uint(buf, i * 4096, 8);
        put_uint(buf, 4, 1);                                 // flag
        put_uint(buf, properties, 1);
        for (std::size_t p = 0; p < properties; ++p) {
            put_string(buf, "prop" + std::to_string(p));
            put_string(buf, "value-" + std::to_string(i * 31 + p));
        }
    }
    return buf;
}

// ── Stats helpers ────────────────────────────────────────────────────────────

struct BenchResult {
    std::size_t iterations{};
    double elapsed_sec{};
    double records_per_sec{};
    double mb_per_sec{};
    double p50_ms{};
    double p90_ms{};
    double p99_ms{};
};

BenchResult compute_stats(std::vector<int64_t>& latencies_ns,
                          std::size_t records, std::size_t bytes) {
    BenchResult r;
    r.iterations = latencies_ns.size();

    if (latencies_ns.empty()) return r;

    std::sort(latencies_ns.begin(), latencies_ns.end());

    auto total_ns = std::accumulate(latencies_ns.begin(), latencies_ns.end(), int64_t{0});
    r.elapsed_sec     = static_cast<double>(total_ns) / 1e9;
    r.records_per_sec = static_cast<double>(records * r.iterations) / r.elapsed_sec;
    r.mb_per_sec      = static_cast<double>(bytes * r.iterations) / r.elapsed_sec / 1e6;

    auto percentile = [&](double p) -> double {
        auto idx = static_cast<std::size_t>(p * static_cast<double>(latencies_ns.size() - 1));
        return static_cast<double>(latencies_ns[idx]) / 1e6; // ns → ms
    };

    r.p50_ms = percentile(0.50);
    r.p90_ms = percentile(0.90);
    r.p99_ms = percentile(0.99);

    return r;
}

std::size_t arg_or(int argc, char* argv[], int idx, std::size_t fallback) {
    if (argc <= idx) return fallback;
    const auto v = std::strtoull(argv[idx], nullptr, 10);
    return v == 0 ? fallback : static_cast<std::size_t>(v);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);

    const std::size_t num_records = arg_or(argc, argv, 1, 100'000);
    const std::size_t iterations  = arg_or(argc, argv, 2, 20);
    const std::size_t properties  = std::min<std::size_t>(arg_or(argc, argv, 3, 2), 255);

    const auto image = build_manifest(num_records, properties);

    fprintf(stdout,
        "MBDB Decode Benchmark\n"
        "=====================\n"
        "Records:     %zu (%zu properties each)\n"
        "Image size:  %zu bytes\n"
        "Iterations:  %zu\n",
        num_records, properties, image.size(), iterations);

    // Warm up.
    {
        mbdb::format::Catalog catalog;
        if (auto ec = mbdb::format::decode(image, catalog)) {
            spdlog::error("mbdb-bench: synthetic image failed to decode: {}", ec.message());
            return 1;
        }
    }

    std::vector<int64_t> latencies;
    latencies.reserve(iterations);
    for (std::size_t i = 0; i < iterations; ++i) {
        mbdb::format::Catalog catalog;
        auto t0 = steady::now();
        auto ec = mbdb::format::decode(image, catalog);
        auto t1 = steady::now();
        if (ec || catalog.size() != num_records) {
            spdlog::error("mbdb-bench: decode {} failed", i);
            return 1;
        }
        latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
    }

    auto r = compute_stats(latencies, num_records, image.size());
    fprintf(stdout,
        "\n── Decode ──\n"
        "  Elapsed:      %.3f s\n"
        "  Throughput:   %.0f records/sec\n"
        "  Bandwidth:    %.1f MB/sec\n"
        "  p50:          %.2f ms\n"
        "  p90:          %.2f ms\n"
        "  p99:          %.2f ms\n\n",
        r.elapsed_sec, r.records_per_sec, r.mb_per_sec,
        r.p50_ms, r.p90_ms, r.p99_ms);

    return 0;
}

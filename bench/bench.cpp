/**
 * @file bench.cpp
 * @brief Decoding throughput benchmarks for flowtuple streams.
 *
 * Decodes synthetic streams (and optionally a real, uncompressed
 * flowtuple file) repeatedly from memory. Use for relative comparisons
 * during development only.
 *
 * Usage:
 *   ./build/flowtuple_bench                  # 100 iterations
 *   ./build/flowtuple_bench 1000 file.cors   # custom count, real file
 */

#include <flowtuple/flowtuple.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <vector>

using namespace flowtuple;

static constexpr int DEFAULT_ITERATIONS = 100;

static bool load_file(const char* path, std::vector<std::uint8_t>& data) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return false;
    }

    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);

    data.resize(static_cast<std::size_t>(size));
    if (!file.read(reinterpret_cast<char*>(data.data()), size)) {
        return false;
    }

    return true;
}

static void put_be(std::vector<std::uint8_t>& out, std::uint32_t value, int bytes) {
    for (int i = bytes - 1; i >= 0; --i) {
        out.push_back(static_cast<std::uint8_t>(value >> (8 * i)));
    }
}

/// Stream of `intervals` intervals, each with 3 classes of `records` records.
static std::vector<std::uint8_t> make_stream(int intervals, std::uint32_t records) {
    std::vector<std::uint8_t> out;
    out.reserve(static_cast<std::size_t>(intervals) * 3U * records * RECORD_SIZE + 1024U);

    std::uint32_t seed = 0x2545F491U;
    for (int i = 0; i < intervals; ++i) {
        put_be(out, OUTER_MAGIC, 4);
        put_be(out, INTERVAL_MAGIC, 4);
        put_be(out, static_cast<std::uint32_t>(i), 2);
        put_be(out, 1400000000U + 60U * static_cast<std::uint32_t>(i), 4);

        for (std::uint16_t c = 0; c < 3; ++c) {
            put_be(out, CLASS_MAGIC, 4);
            put_be(out, c, 2);
            put_be(out, records, 4);
            for (std::uint32_t r = 0; r < records; ++r) {
                seed ^= seed << 13;
                seed ^= seed >> 17;
                seed ^= seed << 5;
                put_be(out, seed, 4);            // src_ip
                put_be(out, seed >> 8, 3);       // dst_ip
                put_be(out, seed & 0xFFFFU, 2);  // src_port
                put_be(out, 80, 2);              // dst_port
                put_be(out, 6, 1);               // protocol
                put_be(out, 0x02, 1);            // tcp_flags
                put_be(out, seed & 0xFFU, 1);    // ttl
                put_be(out, 40 + (seed & 0x3FFU), 2);
                put_be(out, 1 + (seed & 0xFFU), 4);
            }
            put_be(out, CLASS_MAGIC, 4);
            put_be(out, c, 2);
        }

        put_be(out, OUTER_MAGIC, 4);
        put_be(out, INTERVAL_MAGIC, 4);
        put_be(out, static_cast<std::uint32_t>(i), 2);
        put_be(out, 1400000060U + 60U * static_cast<std::uint32_t>(i), 4);
    }
    put_be(out, END_OF_STREAM_MAGIC, 4);

    return out;
}

static void bench_decode(const char* name, const std::vector<std::uint8_t>& input,
                         int iterations) {
    std::uint64_t checksum = 0;
    auto visit = [&](const StreamDecoder&, const FlowRecord& rec) {
        checksum += rec.packet_count;
    };

    // Warmup run
    DecodeSummary summary;
    MemorySource warmup(input.data(), input.size());
    auto result = decode_stream(warmup, visit, nullptr, &summary);
    if (result != Error::Ok) {
        std::printf("%-20s FAIL (%s)\n", name, summary.error.message());
        return;
    }

    // Benchmark
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        MemorySource source(input.data(), input.size());
        result = decode_stream(source, visit);
        if (result != Error::Ok) {
            std::printf("%-20s FAIL (%s)\n", name, error_string(result));
            return;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    std::size_t records = summary.records > 0 ? summary.records : 1;
    double per_record_ns = per_iter_us * 1000.0 / static_cast<double>(records);
    double throughput_mbps = static_cast<double>(input.size()) / per_iter_us;

    std::printf("%-20s %10.2f µs/iter  %6.2f ns/rec  %8.1f MB/s  (%zu recs, sum %llu)\n", name,
                per_iter_us, per_record_ns, throughput_mbps, summary.records,
                static_cast<unsigned long long>(checksum));
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("Flowtuple Decoding Benchmarks (v%s)\n", version());
    std::printf("===================================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Record size: %zu bytes\n\n", RECORD_SIZE);

    std::printf("%-20s %16s  %13s  %12s  %s\n", "Test", "Time", "Per-Record", "Throughput",
                "Records");
    std::printf("%-20s %16s  %13s  %12s  %s\n", "----", "----", "----------", "----------",
                "-------");

    bench_decode("small-classes", make_stream(1000, 10), iterations);
    bench_decode("one-interval", make_stream(1, 100000), iterations);
    bench_decode("hour-of-minutes", make_stream(60, 5000), iterations);

    if (argc >= 3) {
        std::vector<std::uint8_t> input;
        if (load_file(argv[2], input)) {
            bench_decode(argv[2], input, iterations);
        } else {
            std::printf("%-20s SKIP (file not found)\n", argv[2]);
        }
    }

    std::printf("\nUse these results for relative comparisons only.\n");

    return 0;
}

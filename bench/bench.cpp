/**
 * @file bench.cpp
 * @brief Performance benchmarks for eventwire decompression and formatting.
 *
 * Measures throughput on generated log payloads for regression testing
 * during development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/eventwire_bench              # Run with default 100 iterations
 *   ./build/eventwire_bench 1000         # Run with custom iteration count
 */

#include <eventwire/eventwire.hpp>

#include "fixtures.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

using namespace eventwire;

static constexpr int DEFAULT_ITERATIONS = 100;
static constexpr int PAYLOAD_LINES = 20000;
static constexpr int EVENT_COUNT = 5000;

static std::string make_payload() {
    std::string text;
    for (int i = 0; i < PAYLOAD_LINES; i++) {
        text += "2016-02-29T14:20:46.";
        text += std::to_string(i % 1000);
        text += " host=web-";
        text += std::to_string(i % 16);
        text += " user=admin action=login status=ok bytes=";
        text += std::to_string(i * 37 % 65536);
        text += '\n';
    }
    return text;
}

static std::vector<Event> make_events() {
    std::vector<Event> events;
    events.reserve(EVENT_COUNT);
    for (int i = 0; i < EVENT_COUNT; i++) {
        EventOptions options;
        options.index = "main";
        options.host = "web-" + std::to_string(i % 16);
        options.source = "/var/log/access.log";
        options.sourcetype = "access_combined";
        options.stanza = "monitor://access";
        events.emplace_back("GET /index.html?id=" + std::to_string(i) + " 200 <ok> & \"done\"",
                            1456755646.0 + i * 0.001, std::move(options));
    }
    return events;
}

static void report(const char* name, double total_us, int iterations, std::size_t bytes) {
    double per_iter_us = total_us / static_cast<double>(iterations);
    double throughput_mbps = static_cast<double>(bytes) / per_iter_us;

    std::printf("%-20s %10.2f µs/iter  %8.1f MB/s  (%zu bytes)\n", name, per_iter_us,
                throughput_mbps, bytes);
}

template <typename Fn>
static double time_us(int iterations, Fn&& fn) {
    // Warmup run
    fn();

    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; i++) {
        fn();
    }
    auto end = std::chrono::high_resolution_clock::now();
    return std::chrono::duration<double, std::micro>(end - start).count();
}

static void bench_gzip(const std::string& payload, int iterations) {
    auto compressed = fixtures::gzip(payload);
    std::vector<std::uint8_t> output;

    double total_us = time_us(iterations, [&]() {
        if (decompress_gzip(compressed.data(), compressed.size(), output) != Error::Ok) {
            std::printf("gzip decompression failed\n");
            std::exit(1);
        }
    });
    report("gzip", total_us, iterations, output.size());
}

static void bench_zip(const std::string& payload, int iterations) {
    auto archive = fixtures::build_zip({{"access.log", payload}});
    std::vector<std::uint8_t> output;

    double total_us = time_us(iterations, [&]() {
        if (decompress_zip(archive.data(), archive.size(), output) != Error::Ok) {
            std::printf("zip decompression failed\n");
            std::exit(1);
        }
    });
    report("zip", total_us, iterations, output.size());
}

static void bench_xml(const std::vector<Event>& events, int iterations) {
    std::size_t bytes = 0;
    double total_us = time_us(iterations, [&]() {
        bytes = 0;
        for (const auto& doc : format_xml_events(events)) {
            bytes += doc.size();
        }
    });
    report("xml stream", total_us, iterations, bytes);
}

static void bench_hec(const std::vector<Event>& events, int iterations) {
    std::size_t bytes = 0;
    double total_us = time_us(iterations, [&]() {
        bytes = 0;
        for (const auto& batch : format_hec_events(events)) {
            bytes += batch.size();
        }
    });
    report("hec json", total_us, iterations, bytes);
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("eventwire Benchmarks (version %s)\n", version());
    std::printf("==================================\n");
    std::printf("Iterations: %d\n\n", iterations);

    std::printf("%-20s %16s  %13s  %s\n", "Test", "Time", "Throughput", "Output");
    std::printf("%-20s %16s  %13s  %s\n", "----", "----", "----------", "------");

    const std::string payload = make_payload();
    const std::vector<Event> events = make_events();

    std::printf("\nDecompression (%d lines):\n", PAYLOAD_LINES);
    bench_gzip(payload, iterations);
    bench_zip(payload, iterations);

    std::printf("\nFormatting (%d events):\n", EVENT_COUNT);
    bench_xml(events, iterations);
    bench_hec(events, iterations);

    return 0;
}

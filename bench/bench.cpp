/**
 * @file bench.cpp
 * @brief Performance benchmarks for packdec literal encoding.
 *
 * Measures construct() throughput over a fixed literal mix for regression
 * testing during development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/packdec_bench            # Run with default 100000 iterations
 *   ./build/packdec_bench 1000000    # Run with custom iteration count
 */

#include <packdec/packdec.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>

using namespace packdec;

static constexpr int DEFAULT_ITERATIONS = 100000;

static void bench_construct(const char* name, const std::string& literal, int iterations) {
    std::size_t accepted = 0;
    std::size_t packed_bytes = 0;

    // Warmup run
    auto warmup = construct(literal);
    const bool expect_value = warmup.has_value();

    // Benchmark
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        auto value = construct(literal);
        if (value) {
            ++accepted;
            packed_bytes += value->packed_digits().size();
        }
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_ns = std::chrono::duration<double, std::nano>(end - start).count();
    double per_op_ns = total_ns / static_cast<double>(iterations);
    double throughput_mbps =
        (static_cast<double>(literal.size()) * static_cast<double>(iterations) * 1000.0) /
        total_ns;

    if (accepted != (expect_value ? static_cast<std::size_t>(iterations) : 0U)) {
        std::printf("%-20s FAIL (inconsistent results)\n", name);
        return;
    }

    std::printf("%-20s %10.1f ns/op  %8.1f MB/s  (%zu chars, %zu bytes out)\n", name, per_op_ns,
                throughput_mbps, literal.size(),
                accepted > 0 ? packed_bytes / accepted : std::size_t{0});
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("packdec Benchmarks\n");
    std::printf("==================\n");
    std::printf("Iterations: %d\n\n", iterations);

    std::printf("%-20s %16s  %13s  %s\n", "Test", "Time", "Throughput", "Sizes");
    std::printf("%-20s %16s  %13s  %s\n", "----", "----", "----------", "-----");

    std::string long_literal = "-";
    for (int i = 0; i < 64; ++i) {
        long_literal += static_cast<char>('0' + ((i + 1) % 10));
    }
    long_literal += '.';
    for (int i = 0; i < 63; ++i) {
        long_literal += static_cast<char>('0' + (i % 10));
    }

    bench_construct("short", "42", iterations);
    bench_construct("signed-fraction", "-99084.566", iterations);
    bench_construct("odd-length", "+1234.56789", iterations);
    bench_construct("zero-leading", "0.000125", iterations);
    bench_construct("long", long_literal, iterations);
    bench_construct("malformed", "-99084d54.566", iterations);

    return 0;
}

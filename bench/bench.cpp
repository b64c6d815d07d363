/**
 * @file bench.cpp
 * @brief Performance benchmarks for bitexpr decoding and evaluation.
 *
 * Builds a few synthetic packet trees with the encoder, then times
 * decode, evaluate and version summation for regression testing during
 * development.
 *
 * Usage:
 *   ./build/bitexpr_bench           # Run with default 100 iterations
 *   ./build/bitexpr_bench 1000      # Run with custom iteration count
 */

#include <bitexpr/bitexpr.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

using namespace bitexpr;

static constexpr int DEFAULT_ITERATIONS = 100;
static constexpr std::size_t WIDE_CHILDREN = 2000;
static constexpr std::size_t DEEP_LEVELS = 500;
static constexpr std::size_t BIG_LITERAL_BITS = 4096;

/**
 * @brief Sum over many small literals (sub-count framing).
 */
static bool build_wide(std::string& hex) {
    std::vector<Packet> children;
    children.reserve(WIDE_CHILDREN);
    for (std::size_t i = 0; i < WIDE_CHILDREN; ++i) {
        Packet literal;
        if (literal_packet(static_cast<std::uint8_t>(i & 7U), Value(i), literal) != Error::Ok) {
            return false;
        }
        children.push_back(std::move(literal));
    }

    Packet root;
    if (operator_packet(1, PacketKind::Sum, LengthMode::SubCount, std::move(children), root) !=
        Error::Ok) {
        return false;
    }
    return encode_hex(root, hex) == Error::Ok;
}

/**
 * @brief Chain of single-child maximum packets around one literal.
 */
static bool build_deep(std::string& hex) {
    Packet node;
    if (literal_packet(3, Value(42), node) != Error::Ok) {
        return false;
    }

    for (std::size_t i = 0; i < DEEP_LEVELS; ++i) {
        std::vector<Packet> children;
        children.push_back(std::move(node));
        Packet parent;
        if (operator_packet(static_cast<std::uint8_t>(i & 7U), PacketKind::Maximum,
                            LengthMode::SubCount, std::move(children), parent) != Error::Ok) {
            return false;
        }
        node = std::move(parent);
    }
    return encode_hex(node, hex) == Error::Ok;
}

/**
 * @brief Product of two literals that are each thousands of bits wide.
 */
static bool build_big(std::string& hex) {
    Value big = 1;
    big <<= static_cast<unsigned>(BIG_LITERAL_BITS - 1);
    big -= 1;

    std::vector<Packet> children(2);
    if (literal_packet(5, big, children[0]) != Error::Ok ||
        literal_packet(6, Value(big + 2), children[1]) != Error::Ok) {
        return false;
    }

    Packet root;
    if (operator_packet(7, PacketKind::Product, LengthMode::BitCount, std::move(children), root) !=
        Error::Ok) {
        return false;
    }
    return encode_hex(root, hex) == Error::Ok;
}

static void bench_tree(const char* name, const std::string& hex, int iterations) {
    Packet root;
    if (decode(hex, root) != Error::Ok) {
        std::printf("%-12s SKIP (decode failed)\n", name);
        return;
    }

    std::size_t num_packets = root.packet_count();

    // Decode
    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; i++) {
        Packet parsed;
        if (decode(hex, parsed) != Error::Ok) {
            std::printf("%-12s FAIL (decode)\n", name);
            return;
        }
    }
    auto end = std::chrono::high_resolution_clock::now();
    double decode_us =
        std::chrono::duration<double, std::micro>(end - start).count() / static_cast<double>(iterations);

    // Evaluate
    start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; i++) {
        Value value;
        if (evaluate(root, value) != Error::Ok) {
            std::printf("%-12s FAIL (evaluate)\n", name);
            return;
        }
    }
    end = std::chrono::high_resolution_clock::now();
    double eval_us =
        std::chrono::duration<double, std::micro>(end - start).count() / static_cast<double>(iterations);

    // Version sum
    std::uint64_t checksum = 0;
    start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; i++) {
        checksum += total_version(root);
    }
    end = std::chrono::high_resolution_clock::now();
    double version_us =
        std::chrono::duration<double, std::micro>(end - start).count() / static_cast<double>(iterations);

    double throughput_mbps = (static_cast<double>(hex.size()) * 4.0) / decode_us;

    std::printf("%-12s %9.2f µs  %9.2f µs  %9.2f µs  %8.1f Mbps  (%zu pkts, sum %llu)\n", name,
                decode_us, eval_us, version_us, throughput_mbps, num_packets,
                static_cast<unsigned long long>(checksum / static_cast<std::uint64_t>(iterations)));
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("bitexpr Benchmarks\n");
    std::printf("==================\n");
    std::printf("Iterations: %d\n\n", iterations);

    std::printf("%-12s %12s  %12s  %12s  %13s  %s\n", "Test", "Decode", "Evaluate", "Versions",
                "Throughput", "Packets");
    std::printf("%-12s %12s  %12s  %12s  %13s  %s\n", "----", "------", "--------", "--------",
                "----------", "-------");

    std::string wide;
    std::string deep;
    std::string big;
    if (!build_wide(wide) || !build_deep(deep) || !build_big(big)) {
        std::fprintf(stderr, "Error: Cannot build benchmark inputs\n");
        return 1;
    }

    bench_tree("wide", wide, iterations);
    bench_tree("deep", deep, iterations);
    bench_tree("big-literal", big, iterations);

    return 0;
}

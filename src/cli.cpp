/**
 * @file cli.cpp
 * @brief bitexpr command line interface.
 *
 * Decodes one hex-encoded packet and prints two lines: the sum of all
 * version fields, then the value of the root expression.
 */

#include <bitexpr/bitexpr.hpp>

#include <cstdio>
#include <cstring>
#include <sstream>
#include <string>

using namespace bitexpr;

static void print_version() {
    std::printf("bitexpr %s\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\nbitexpr %s - packet decoder and expression evaluator\n", version());
    std::printf("==================================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s <input>\n", prog_name);
    std::printf("  %s -x <hex>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -x             Read the packet from the command line\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Arguments:\n");
    std::printf("  input          File holding one line of hex digits\n");
    std::printf("  hex            Hex digits, e.g. D2FE28\n\n");
    std::printf("Output:\n");
    std::printf("  Line 1: sum of the version fields of every packet\n");
    std::printf("  Line 2: value of the outermost packet\n\n");
    std::printf("Examples:\n");
    std::printf("  %s input.txt\n", prog_name);
    std::printf("  %s -x 9C0141080250320F1802104A08\n\n", prog_name);
}

static void print_error(Error result) {
    std::fprintf(stderr, "Error: %s (code %d)\n", error_string(result), static_cast<int>(result));
}

static int do_run(const std::string& hex) {
    Packet root;
    auto result = decode(hex, root);
    if (result != Error::Ok) {
        print_error(result);
        return 1;
    }

    // Line 1 only needs a well-formed tree
    std::printf("%llu\n", static_cast<unsigned long long>(total_version(root)));
    std::fflush(stdout);

    Value value;
    result = evaluate(root, value);
    if (result != Error::Ok) {
        print_error(result);
        return 1;
    }

    // cpp_int has no printf conversion
    std::ostringstream text;
    text << value;
    std::printf("%s\n", text.str().c_str());
    return 0;
}

int main(int argc, char** argv) {
    // Check for help flag
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    // Check for version flag
    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    if (std::strcmp(argv[1], "-x") == 0) {
        if (argc != 3) {
            std::fprintf(stderr, "Error: -x requires one hex argument\n");
            std::fprintf(stderr, "Usage: %s -x <hex>\n", argv[0]);
            return 1;
        }
        return do_run(argv[2]);
    }

    if (argc != 2) {
        std::fprintf(stderr, "Error: Expected a single input file\n");
        std::fprintf(stderr, "Usage: %s <input>\n", argv[0]);
        return 1;
    }

    std::string hex;
    if (read_hex_file(argv[1], hex) != Error::Ok) {
        std::fprintf(stderr, "Error: Cannot read input file: %s\n", argv[1]);
        return 1;
    }
    if (hex.empty()) {
        std::fprintf(stderr, "Error: Input file is empty: %s\n", argv[1]);
        return 1;
    }

    return do_run(hex);
}

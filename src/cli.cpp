/**
 * @file cli.cpp
 * @brief packdec command line interface.
 *
 * Encodes decimal literals given on the command line, or read from a file,
 * and prints the sign, scale and packed digits of each one.
 */

#include <packdec/packdec.hpp>

#include <cstdio>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

using namespace packdec;

static void print_version() {
    std::printf("packdec %s\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\nPacked decimal encoder (v%s)\n", version());
    std::printf("============================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s [options] <literal>...\n", prog_name);
    std::printf("  %s [options] -f <file>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -f <file>      Read literals from file, one per line\n");
    std::printf("  -q, --quiet    Only report rejected literals\n");
    std::printf("  --             End of options (literals may start with '-')\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Literal grammar:\n");
    std::printf("  [+|-]digits[.digits]   e.g. 42, -99084.566, +1234.56789\n\n");
    std::printf("Output:\n");
    std::printf("  <literal>  sign=<Positive|Negative|Zero>  scale=<n>  packed=[..]\n");
    std::printf("  Packed bytes are hex, least-significant digit pair first.\n");
    std::printf("  Rejected literals get a caret under the first bad byte. Positions\n");
    std::printf("  count bytes, so the caret drifts right after multi-byte UTF-8.\n\n");
    std::printf("Examples:\n");
    std::printf("  %s +1234.56789          # packed=[89 67 45 23 01]\n", prog_name);
    std::printf("  %s -- -99084.566        # negative literal\n", prog_name);
    std::printf("  %s -q -f prices.txt     # check a file\n\n", prog_name);
}

static bool read_lines(const std::string& path, std::vector<std::string>& lines) {
    std::ifstream file(path);
    if (!file) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            lines.push_back(line);
        }
    }

    return !file.bad();
}

static void print_value(const std::string& literal, const DecimalValue& value) {
    std::printf("%s  sign=%s  scale=%u  packed=[", literal.c_str(), sign_name(value.sign()),
                static_cast<unsigned>(value.fractional_digit_count()));

    const auto& packed = value.packed_digits();
    for (std::size_t i = 0; i < packed.size(); ++i) {
        std::printf(i == 0 ? "%02X" : " %02X", static_cast<unsigned>(packed[i]));
    }
    std::printf("]\n");
}

static void print_rejection(const std::string& literal, Error error) {
    std::fprintf(stderr, "Error: %s\n", error_string(error));
    std::fprintf(stderr, "  %s\n", literal.c_str());

    // Point at the first offending byte
    std::size_t error_pos = 0;
    if (error == Error::Malformed && validate(literal, error_pos) == Error::Malformed) {
        std::fprintf(stderr, "  %*s^\n", static_cast<int>(error_pos), "");
    }
}

static int do_encode(const std::vector<std::string>& literals, bool quiet) {
    std::size_t rejected = 0;

    for (const auto& literal : literals) {
        DecimalValue value;
        auto result = parse(literal, value);
        if (result != Error::Ok) {
            print_rejection(literal, result);
            ++rejected;
            continue;
        }

        if (!quiet) {
            print_value(literal, value);
        }
    }

    if (rejected > 0) {
        std::fprintf(stderr, "Error: %zu of %zu literals rejected\n", rejected, literals.size());
        return 1;
    }

    return 0;
}

int main(int argc, char** argv) {
    bool quiet = false;
    bool end_of_options = false;
    std::vector<std::string> literals;

    if (argc < 2) {
        print_help(argv[0]);
        return 1;
    }

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (!end_of_options) {
            if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
                print_help(argv[0]);
                return 0;
            }
            if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--version") == 0) {
                print_version();
                return 0;
            }
            if (std::strcmp(arg, "-q") == 0 || std::strcmp(arg, "--quiet") == 0) {
                quiet = true;
                continue;
            }
            if (std::strcmp(arg, "--") == 0) {
                end_of_options = true;
                continue;
            }
            if (std::strcmp(arg, "-f") == 0) {
                if (i + 1 >= argc) {
                    std::fprintf(stderr, "Error: -f requires a file argument\n");
                    std::fprintf(stderr, "Usage: %s [options] -f <file>\n", argv[0]);
                    return 1;
                }
                const char* input_path = argv[++i];
                if (!read_lines(input_path, literals)) {
                    std::fprintf(stderr, "Error: Cannot read input file: %s\n", input_path);
                    return 1;
                }
                continue;
            }
        }

        literals.emplace_back(arg);
    }

    if (literals.empty()) {
        std::fprintf(stderr, "Error: No literals to encode\n");
        std::fprintf(stderr, "Usage: %s [options] <literal>...\n", argv[0]);
        return 1;
    }

    return do_encode(literals, quiet);
}

/**
 * @file cli.cpp
 * @brief flowtuple-dump command line interface.
 *
 * Prints the records of a flowtuple file, one per line, prefixed with
 * the interval number and class id they belong to. Compressed files must
 * be decompressed first, e.g. `zcat file.cors.gz | flowtuple-dump -`.
 */

#include <flowtuple/flowtuple.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>

using namespace flowtuple;

struct DumpOptions {
    const char* input_path = nullptr;
    const char* log_path = nullptr;
    bool summary_only = false;
    bool filter_class = false;
    std::uint16_t class_filter = 0;
};

static void print_version() {
    std::printf("flowtuple-dump %s\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\nCorsaro flowtuple file reader (v%s)\n", version());
    std::printf("===================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s [options] <input>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -s, --summary      Print totals only\n");
    std::printf("  -c, --class <id>   Only print records of this class id\n");
    std::printf("  -l, --log <file>   Write interval/class diagnostics to file\n");
    std::printf("  -h, --help         Show this help message\n");
    std::printf("  -v, --version      Show version information\n\n");
    std::printf("Arguments:\n");
    std::printf("  input              Uncompressed flowtuple file, or - for stdin\n\n");
    std::printf("Output:\n");
    std::printf("  interval|class|src|dst|sport|dport|proto|flags|ttl|len|count\n\n");
    std::printf("Examples:\n");
    std::printf("  %s data.flowtuple.cors              # dump all records\n", prog_name);
    std::printf("  zcat data.flowtuple.cors.gz | %s -s -   # totals only\n\n", prog_name);
}

static bool parse_class_id(const char* text, std::uint16_t& class_id) {
    char* end = nullptr;
    unsigned long value = std::strtoul(text, &end, 10);
    if (end == text || *end != '\0' || value > 0xFFFFUL) {
        return false;
    }
    class_id = static_cast<std::uint16_t>(value);
    return true;
}

static int do_dump(const DumpOptions& opts) {
    std::ifstream file;
    std::istream* in = &std::cin;
    if (std::strcmp(opts.input_path, "-") != 0) {
        file.open(opts.input_path, std::ios::binary);
        if (!file) {
            std::fprintf(stderr, "Error: Cannot read input file: %s\n", opts.input_path);
            return 1;
        }
        in = &file;
    }

    std::FILE* log_file = nullptr;
    if (opts.log_path != nullptr) {
        log_file = std::fopen(opts.log_path, "w");
        if (log_file == nullptr) {
            std::fprintf(stderr, "Error: Cannot write log file: %s\n", opts.log_path);
            return 1;
        }
    }
    FileSink sink(log_file);

    StreamSource source(*in);
    DecodeSummary summary;
    std::size_t printed = 0;

    auto result = decode_stream(
        source,
        [&](const StreamDecoder& decoder, const FlowRecord& record) {
            if (opts.filter_class && decoder.class_id() != opts.class_filter) {
                return;
            }
            ++printed;
            if (!opts.summary_only) {
                std::printf("%u|%u|%s\n", static_cast<unsigned>(decoder.interval_number()),
                            static_cast<unsigned>(decoder.class_id()),
                            to_string(record).c_str());
            }
        },
        log_file != nullptr ? &sink : nullptr, &summary);

    if (log_file != nullptr) {
        std::fclose(log_file);
    }

    if (result != Error::Ok) {
        std::fflush(stdout);
        std::fprintf(stderr, "Error: %s\n", summary.error.message());
        return 1;
    }

    if (opts.summary_only) {
        std::printf("Input:       %s (%zu bytes)\n", opts.input_path, summary.bytes);
        std::printf("Intervals:   %zu\n", summary.intervals);
        std::printf("Classes:     %zu\n", summary.classes);
        std::printf("Records:     %zu\n", summary.records);
        if (opts.filter_class) {
            std::printf("Matched:     %zu (class %u, %s)\n", printed,
                        static_cast<unsigned>(opts.class_filter), class_name(opts.class_filter));
        }
    }

    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_help(argv[0]);
        return 1;
    }

    DumpOptions opts;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--version") == 0) {
            print_version();
            return 0;
        }
        if (std::strcmp(arg, "-s") == 0 || std::strcmp(arg, "--summary") == 0) {
            opts.summary_only = true;
            continue;
        }
        if (std::strcmp(arg, "-c") == 0 || std::strcmp(arg, "--class") == 0) {
            if (i + 1 >= argc || !parse_class_id(argv[i + 1], opts.class_filter)) {
                std::fprintf(stderr, "Error: %s requires a class id (0-65535)\n", arg);
                return 1;
            }
            opts.filter_class = true;
            ++i;
            continue;
        }
        if (std::strcmp(arg, "-l") == 0 || std::strcmp(arg, "--log") == 0) {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "Error: %s requires a file name\n", arg);
                return 1;
            }
            opts.log_path = argv[++i];
            continue;
        }
        if (arg[0] == '-' && arg[1] != '\0') {
            std::fprintf(stderr, "Error: Unknown option: %s\n", arg);
            return 1;
        }
        if (opts.input_path != nullptr) {
            std::fprintf(stderr, "Error: Only one input file may be given\n");
            std::fprintf(stderr, "Usage: %s [options] <input>\n", argv[0]);
            return 1;
        }
        opts.input_path = arg;
    }

    if (opts.input_path == nullptr) {
        std::fprintf(stderr, "Error: No input file given\n");
        std::fprintf(stderr, "Usage: %s [options] <input>\n", argv[0]);
        return 1;
    }

    return do_dump(opts);
}

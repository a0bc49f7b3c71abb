/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * Decrypt, merge, and convert XCP files into LIVE packages
 */

#include "xcp360/converter.h"
#include "xcp360/feature_flags.h"
#include "core/log_buffer.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>

using namespace xcp360;

static void print_usage(const char* argv0) {
    printf("Usage: %s <input> [options]\n", argv0);
    printf("Decrypt, merge, and convert XCP files for the Xbox 360\n\n");
    printf("  -k, --key KEY        Key used to decrypt the XCP package (hex if even length)\n");
    printf("  --ignore             Ignore the file overwrite warning\n");
    printf("  --no-backup          Disable backups\n");
    printf("  --extractor PROG     cabextract-compatible program (default: cabextract)\n");
    printf("  --timeout SEC        Extraction timeout in seconds (default: 300)\n");
    printf("  --work-dir DIR       Scratch directory (default: system temp)\n");
    printf("  --keep-work          Keep the scratch directory\n");
    printf("  --log-file FILE      Write the session log to FILE (debug entries with -v)\n");
    printf("  --trace              Trace regions, file entries and merged members\n");
    printf("  -v, --verbose        Show debug messages\n");
    printf("  -h, --help           Show this help\n");
}

// Room for per-entry trace lines of a full 1000-file package
static constexpr u32 TRACE_LOG_CAPACITY = 16384;

static bool write_log(const std::string& path, LogSeverity level) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    file << LogBuffer::instance().export_text(level);
    return static_cast<bool>(file);
}

int main(int argc, char** argv) {
    ConverterConfig config;
    std::string input;
    std::string log_file;
    bool ignore = false;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                fprintf(stderr, "%s requires a value\n", name);
                exit(2);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-k" || arg == "--key") {
            config.key = next("--key");
        } else if (arg == "--ignore") {
            ignore = true;
        } else if (arg == "--no-backup") {
            config.backup = false;
        } else if (arg == "--extractor") {
            config.extractor_program = next("--extractor");
        } else if (arg == "--timeout") {
            const char* value = next("--timeout");
            char* end = nullptr;
            unsigned long seconds = strtoul(value, &end, 10);
            if (!end || *end != '\0' || seconds == 0 || seconds > 86400) {
                fprintf(stderr, "Invalid timeout: %s\n", value);
                return 2;
            }
            config.extractor_timeout_ms = static_cast<u32>(seconds * 1000);
        } else if (arg == "--work-dir") {
            config.work_dir = next("--work-dir");
        } else if (arg == "--keep-work") {
            config.keep_work_dir = true;
        } else if (arg == "--log-file") {
            log_file = next("--log-file");
        } else if (arg == "--trace") {
            FeatureFlags::trace_regions = true;
            FeatureFlags::trace_entries = true;
            FeatureFlags::trace_merge = true;
            verbose = true;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            fprintf(stderr, "Unknown option: %s\n", arg.c_str());
            print_usage(argv[0]);
            return 2;
        } else if (input.empty()) {
            input = arg;
        } else {
            fprintf(stderr, "Only one input file may be given\n");
            return 2;
        }
    }

    if (input.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    LogSeverity level = verbose ? LogSeverity::Debug : LogSeverity::Info;
    LogBuffer::instance().set_echo_level(level);
    if (FeatureFlags::trace_entries) {
        LogBuffer::instance().set_capacity(TRACE_LOG_CAPACITY);
    }

    XcpConverter converter;
    Status status = converter.initialize(config);
    if (status == Status::Ok) {
        if (!ignore) {
            printf("This will OVERWRITE and DELETE the original XCP file, press \"ENTER\" if you want to continue...");
            fflush(stdout);
            int c;
            while ((c = getchar()) != '\n' && c != EOF) {}
            if (c == EOF) {
                XCP360_LOG_W(LogComponent::Tool, "Aborted");
                return 1;
            }
        }

        ConversionResult result;
        status = converter.convert(input, result);
        if (status == Status::Ok) {
            printf("Converted %u file(s) from %u folder(s) into %s\n",
                   result.file_count, result.folder_count, result.output_path.c_str());
        }
    }

    if (status != Status::Ok) {
        XCP360_LOG_E(LogComponent::Tool, "Conversion failed: %s", status_to_string(status));
    }

    if (!log_file.empty() && !write_log(log_file, level)) {
        fprintf(stderr, "Failed to write log to %s\n", log_file.c_str());
    }

    return status == Status::Ok ? 0 : 1;
}

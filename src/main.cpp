#include "chunkio/chunk_reader.hpp"
#include "chunkio/record_scanner.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <memory>
#include <string>

namespace {

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config>] [-d <char>] [-m <bytes>] [-x] [-v] <input|->...\n"
        "\n"
        "Prints records, lines, bytes and compression for each input.\n"
        "Gzip input is decompressed whether or not it ends in .gz.\n"
        "\n"
        "Options:\n"
        "  -c, --config           JSON config file (default %s)\n"
        "  -d, --delimiter        Record delimiter character (default newline)\n"
        "  -m, --max-record       Report records longer than this many bytes. 0 disables\n"
        "  -x, --extract          Write the decoded input to stdout instead\n"
        "  -v, --verbose          Debug logging\n"
        "  -h, --help             Show this help\n",
        argv, chunkio::config::kDefaultConfigPath);
}

struct ToolOptions {
    chunkio::ScanOptions scan;
    bool extract = false;
};

// Returns false when the input could not be processed to the end.
bool ProcessInput(const std::string& name, const ToolOptions& opt) {
    std::unique_ptr<chunkio::ChunkReader> rd;
    chunkio::ReaderCleanup cleanup;
    if (auto r = chunkio::ChunkReader::Open(name, rd, cleanup); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return false;
    }

    bool ok = true;
    if (opt.extract) {
        if (auto r = chunkio::CopyDecoded(*rd, stdout); !r.ok) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            ok = false;
        }
    } else {
        chunkio::ScanStats stats;
        auto on_malformed = [&rd](const chunkio::ChunkReader::Position& at, std::uint64_t length) {
            std::fprintf(stderr,
                         "malformed record at %s:%" PRIu64 " (offset %" PRIu64 "): %" PRIu64 " bytes\n",
                         rd->Name().c_str(), at.line + 1, at.offset, length);
        };
        if (auto r = chunkio::ScanRecords(*rd, opt.scan, stats, on_malformed); !r.ok) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            ok = false;
        }
        std::printf("%s\t%" PRIu64 "\t%" PRIu64 "\t%" PRIu64 "\t%s\n",
                    rd->Name().c_str(), stats.records, rd->LineCount(), rd->Offset(),
                    rd->Compressed() ? "gzip" : "plain");
        if (stats.malformed > 0) {
            ok = false;
        }
    }

    cleanup();
    return ok;
}

} // namespace

int main(int argc, char **argv) {
    const char *config_cli = nullptr;
    const char *delim_cli = nullptr;
    const char *max_cli = nullptr;
    bool verbose = false;

    ToolOptions opt{};

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"delimiter", required_argument, nullptr, 'd'},
        {"max-record", required_argument, nullptr, 'm'},
        {"extract", no_argument, nullptr, 'x'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:d:m:xv", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                config_cli = optarg;
                break;

            case 'd':
                if (std::strlen(optarg) != 1) {
                    std::fprintf(stderr, "Invalid --delimiter: %s (need one character)\n", optarg);
                    return 2;
                }
                delim_cli = optarg;
                break;

            case 'm': {
                char *end = nullptr;
                errno = 0;
                unsigned long long v = std::strtoull(optarg, &end, 10);
                if (!end || *end != '\0' || errno == ERANGE || optarg[0] == '-') {
                    std::fprintf(stderr, "Invalid --max-record: %s\n", optarg);
                    return 2;
                }
                max_cli = optarg;
                opt.scan.max_record_bytes = static_cast<std::uint64_t>(v);
                break;
            }

            case 'x':
                opt.extract = true;
                break;

            case 'v':
                verbose = true;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind >= argc) {
        PrintUsage(argv[0]);
        return 2;
    }

    const std::string config_path = config_cli ? config_cli : chunkio::config::kDefaultConfigPath;
    chunkio::config::ChunkstatConfigFromFile cfg;
    if (auto r = cfg.LoadFile(config_path); !r.ok) {
        // Only the built-in default may be absent.
        if (config_cli || r.code != chunkio::Errc::OpenFailure) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return 1;
        }
    }

    if (cfg.log_level.has_value()) {
        chunkio::Logger::Instance().SetLevel(*cfg.log_level);
    }
    if (verbose) {
        chunkio::Logger::Instance().SetLevel(chunkio::LogLevel::Debug);
    }
    if (delim_cli) {
        opt.scan.delimiter = delim_cli[0];
    } else if (cfg.delimiter.has_value()) {
        opt.scan.delimiter = *cfg.delimiter;
    }
    if (!max_cli && cfg.max_record_bytes.has_value()) {
        opt.scan.max_record_bytes = *cfg.max_record_bytes;
    }

    LogDebug("config %s, delimiter 0x%02x, max record %" PRIu64,
             config_path.c_str(),
             static_cast<unsigned>(static_cast<unsigned char>(opt.scan.delimiter)),
             opt.scan.max_record_bytes);

    int rc = 0;
    for (int i = optind; i < argc; ++i) {
        if (!ProcessInput(argv[i], opt)) {
            rc = 1;
        }
    }
    return rc;
}

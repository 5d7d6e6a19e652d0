// mot_print.cpp – Dumps one raw MOT segment (preamble included) in
// human-readable form.
//
//   mot_print [-m h|d|b] [-p profile.xml] [-v] [file]
//
// Reads the segment from `file`, or from stdin when no file is given.

#include "MOTCodec/ContentType.hpp"
#include "MOTCodec/Directory.hpp"
#include "MOTCodec/Errors.hpp"
#include "MOTCodec/Log.hpp"
#include "MOTCodec/ParameterRegistry.hpp"
#include "MOTCodec/ProfileLoader.hpp"
#include "MOTCodec/Segment.hpp"

#include <fmt/format.h>

#include <getopt.h>

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

using namespace mot;

namespace {

enum class Mode { Header, Directory, Body };

void usage(const char* name) {
    fmt::print(stderr,
               "Usage: {} [options] [file]\n"
               "Prints a raw MOT segment read from file, or stdin.\n\n"
               "  -m, --mode h|d|b       segment kind: header (default), directory or body\n"
               "  -p, --profile FILE     load an XML extension profile first\n"
               "  -v, --verbose          log decoder activity to stderr\n"
               "  -h, --help             this text\n",
               name);
}

std::vector<uint8_t> readAll(std::istream& in) {
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in),
                                std::istreambuf_iterator<char>());
}

void printParameters(const std::vector<Parameter>& params, const char* indent) {
    for (const auto& p : params)
        fmt::print("{}[{:2}] {}\n", indent, paramIdOf(p), describe(p));
}

void printSkipped(const std::vector<uint8_t>& ids, const char* indent) {
    for (uint8_t id : ids)
        fmt::print("{}[{:2}] unknown parameter, skipped\n", indent, id);
}

void printCore(const CoreHeader& core, const ContentTypeCatalog& catalog, const char* indent) {
    fmt::print("{}body size:    {} bytes\n", indent, core.body_size);
    fmt::print("{}header size:  {} bytes\n", indent, core.header_size);
    fmt::print("{}content type: {} {}\n", indent, toString(core.content_type),
               catalog.describe(core.content_type));
}

void printHeader(std::span<const uint8_t> data, const ParameterRegistry& header_params,
                 const ContentTypeCatalog& catalog) {
    DecodedHeader header = decodeHeader(data, header_params);
    fmt::print("MOT header\n");
    printCore(header.core, catalog, "  ");
    printParameters(header.params, "  ");
    printSkipped(header.skipped_ids, "  ");
}

void printDirectory(std::span<const uint8_t> data, const ParameterRegistry& header_params,
                    const ParameterRegistry& directory_params,
                    const ContentTypeCatalog& catalog) {
    Directory dir = decodeDirectory(data, header_params, directory_params);
    fmt::print("MOT directory\n");
    fmt::print("  directory size:  {} bytes\n", dir.directory_size);
    fmt::print("  objects:         {}\n", dir.object_count);
    if (dir.carousel_period == 0)
        fmt::print("  carousel period: undefined\n");
    else
        fmt::print("  carousel period: {}.{} s\n", dir.carousel_period / 10, dir.carousel_period % 10);
    fmt::print("  segment size:    {} bytes\n", dir.segment_size);

    fmt::print("  extension:\n");
    printParameters(dir.extension, "    ");
    if (!dir.extension_valid)
        fmt::print("    ! {}\n", dir.extension_error);

    for (const auto& [tid, entry] : dir.entries) {
        fmt::print("  transport id {}\n", tid);
        printCore(entry.core, catalog, "    ");
        printParameters(entry.params, "    ");
        printSkipped(entry.skipped_ids, "    ");
        if (!entry.valid)
            fmt::print("    ! {}\n", entry.error);
    }
}

void printBody(std::span<const uint8_t> data) {
    fmt::print("MOT body segment, {} bytes\n", data.size());
    for (size_t i = 0; i < data.size(); i += 16) {
        fmt::print("  {:04x} ", i);
        for (size_t j = i; j < i + 16 && j < data.size(); ++j)
            fmt::print(" {:02x}", data[j]);
        fmt::print("\n");
    }
}

} // namespace

int main(int argc, char* argv[]) {
    Mode        mode = Mode::Header;
    std::string profile_path;

    const struct option longopts[] = {
        {"mode",    required_argument, nullptr, 'm'},
        {"profile", required_argument, nullptr, 'p'},
        {"verbose", no_argument,       nullptr, 'v'},
        {"help",    no_argument,       nullptr, 'h'},
        {nullptr,   0,                 nullptr, 0},
    };

    int ch;
    int index;
    while ((ch = getopt_long(argc, argv, "m:p:vh", longopts, &index)) != -1) {
        switch (ch) {
        case 'm':
            if (std::string(optarg) == "h")      mode = Mode::Header;
            else if (std::string(optarg) == "d") mode = Mode::Directory;
            else if (std::string(optarg) == "b") mode = Mode::Body;
            else {
                fmt::print(stderr, "Unknown mode '{}'\n", optarg);
                usage(argv[0]);
                return 2;
            }
            break;
        case 'p':
            profile_path = optarg;
            break;
        case 'v':
            setLogLevel(LogLevel::Debug);
            break;
        case 'h':
            usage(argv[0]);
            return 0;
        case '?':
        default:
            usage(argv[0]);
            return 2;
        }
    }

    if (argc - optind > 1) {
        usage(argv[0]);
        return 2;
    }

    std::vector<uint8_t> raw;
    if (optind < argc) {
        std::ifstream in(argv[optind], std::ios::binary);
        if (!in) {
            fmt::print(stderr, "Cannot open '{}'\n", argv[optind]);
            return 1;
        }
        raw = readAll(in);
    } else {
        raw = readAll(std::cin);
    }

    auto header_params    = ParameterRegistry::headerParameters();
    auto directory_params = ParameterRegistry::directoryParameters();
    auto catalog          = ContentTypeCatalog::wellKnown();

    try {
        if (!profile_path.empty())
            applyProfile(loadProfile(profile_path), header_params, directory_params, &catalog);

        Segment segment = splitSegment(raw);
        fmt::print("segment: repetition {}, {} bytes\n", segment.header.repetition,
                   segment.header.size);
        if (raw.size() > SegmentHeader::kSize + segment.header.size)
            fmt::print("  ({} trailing bytes ignored)\n",
                       raw.size() - SegmentHeader::kSize - segment.header.size);

        switch (mode) {
        case Mode::Header:    printHeader(segment.data, header_params, catalog); break;
        case Mode::Directory: printDirectory(segment.data, header_params, directory_params, catalog); break;
        case Mode::Body:      printBody(segment.data); break;
        }
    } catch (const MotError& e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return 1;
    }
    return 0;
}

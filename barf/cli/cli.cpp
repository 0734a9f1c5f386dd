#include <cstdlib>
#include <print>
#include <stdexcept>

#include "cli.h"
#include "formats.h"
#include "logging.h"

using namespace std::literals;

auto cli::root_help() -> void {
    std::println(stderr, "barf CLI v0.1.0\n");
    std::println(stderr, "Encodes values into bytes and prints them as hex\n");
    std::println(stderr, "USAGE");
    std::println(stderr, "  $ barf <FORMAT> <VALUE...>\n");
    std::println(stderr, "Formats:");
    std::println(stderr, "  byte                      - unsigned decimal 0-255");
    std::println(stderr, "  {{le,be,ne}}-{{u,i}}{{8,16,32,64}} - fixed-width integers");
    std::println(stderr, "  {{le,be,ne}}-f{{32,64}}         - IEEE 754 floats");
    std::println(stderr, "  char                      - codepoint in hex, e.g. U+00E9");
    std::println(stderr, "  text                      - UTF-8 text");
    std::println(stderr, "  uleb128, sleb128          - LEB128 varints");
    std::println(stderr, "  uvint64, svint64          - vint64 varints\n");
    std::println(stderr, "Flags:");
    std::println(stderr, "  -h, --help    print this message");
    std::println(stderr, "  -v, --verbose log progress to stderr");
}

auto cli::root_usage() -> void {
    std::println(stderr, "Usage:");
    std::println(stderr, "  barf (-h|--help)");
    std::println(stderr, "  barf [-v|--verbose] <FORMAT> <VALUE...>");
}

auto cli::run(std::span<const std::string_view> args) -> int {
    if (!args.empty() && (args[0] == "-h"sv || args[0] == "--help"sv)) {
        root_help();
        return EXIT_SUCCESS;
    }

    if (!args.empty() && (args[0] == "-v"sv || args[0] == "--verbose"sv)) {
        logging::set_threshold(logging::Level::Info);
        args = args.subspan(1);
    }

    if (args.empty()) {
        root_usage();
        return EXIT_FAILURE;
    }

    try {
        std::println("{}", formats::encode_values(args[0], args.subspan(1)));
    } catch (const std::runtime_error& e) {
        logging::error(e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

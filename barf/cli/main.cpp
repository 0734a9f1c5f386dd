#include <span>
#include <string_view>
#include <vector>

#include "cli.h"

auto main(int argc, char** argv) -> int {
    const auto raw = std::span<char*>{argv, static_cast<std::size_t>(argc)};
    const auto args = raw.empty()
        ? std::vector<std::string_view>{}
        : std::vector<std::string_view>(raw.begin() + 1, raw.end());

    return cli::run(args);
}

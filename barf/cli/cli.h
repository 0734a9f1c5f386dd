#ifndef CLI_H
#define CLI_H

#include <span>
#include <string_view>

namespace cli {

auto root_help() -> void;
auto root_usage() -> void;

// Runs the command line without the program name. Returns the exit status.
auto run(std::span<const std::string_view> args) -> int;

}

#endif // CLI_H

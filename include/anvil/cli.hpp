#pragma once

#include "config.hpp"

#include <optional>

namespace anvil::cli {

    // Fills `cfg` from argv. Returns an exit code when the process should stop here (help, --version,
    // --print-config, invalid input), std::nullopt when the server should start.
    std::optional<int> parse_cli(int argc, char** argv, server_config& cfg);

}  // namespace anvil::cli

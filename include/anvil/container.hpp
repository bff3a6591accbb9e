#pragma once

#include "config.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace anvil {

    struct execution_options {
        std::optional<int> timeout_ms{};
        std::optional<std::string> memory_limit{};
        std::optional<std::string> cpu_limit{};
    };

    struct execution_result {
        bool success{false};
        std::string stdout_text{};
        std::string stderr_text{};
        std::optional<int> exit_code{};
        bool timed_out{false};
        int64_t execution_time_ms{};
        std::optional<std::string> error{};
    };

    struct pull_result {
        bool success{false};
        std::string message{};
    };

    bool container_available(const server_config& cfg);
    bool image_available(const server_config& cfg);
    pull_result pull_image(const server_config& cfg);

    /*
     * Runs `go run main.go` on `code` inside a throwaway container with the source directory mounted
     * read-only. On timeout the container is killed by name. The host-side directory holding
     * main.go is removed before this returns.
     */
    execution_result execute_go(const server_config& cfg, std::string_view code, const execution_options& options);

}  // namespace anvil

#pragma once

#include "utils.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

namespace anvil {

    using namespace std::string_view_literals;

    inline constexpr auto version = "0.1.0"sv;

    /*
     * Anvil Startup Config Options
     *
     * Listener
     * - host: Address the HTTP listener binds to.
     * - port: TCP port; seeded from $PORT when it holds a valid port number.
     * - max_body_bytes: Largest accepted request body; larger bodies get 413.
     *
     * Analyzer
     * - runtime_path: Executable that hosts the analyzer (java).
     * - analyzer_path: Analyzer artifact passed to the runtime (ltsp.jar).
     * - scratch_dir: Directory receiving per-request specification files.
     * - analyzer_timeout_ms: Wall-time budget for one analyzer run.
     * - probe_timeout_ms: Wall-time budget for each health probe.
     * - default_process: Target process when a request omits one.
     *
     * Container execution
     * - container_runtime: Container CLI used to run generated Go code.
     * - container_image: Image providing the Go toolchain.
     * - container_timeout_ms: Default wall-time budget for a container run.
     * - container_memory: Default --memory limit.
     * - container_cpus: Default --cpus limit.
     * - pull_timeout_ms: Wall-time budget for an image pull.
     *
     * Output
     * - log: Verbosity of the [anvil] lines written to stderr.
     * - print_config: Print resolved startup config and exit.
     */

    enum class log_level { quiet, info, verbose };

    inline constexpr std::string_view to_string(log_level level) {
        switch (level) {
            case log_level::quiet:
                return "quiet"sv;
            case log_level::info:
                return "info"sv;
            case log_level::verbose:
                return "verbose"sv;
        }
        return "info"sv;
    }

    inline constexpr bool try_parse_log_level(std::string_view text, log_level& out) {
        if (utils::str_case_eq(text, "quiet"sv) || utils::str_case_eq(text, "error"sv)) {
            out = log_level::quiet;
            return true;
        }
        if (utils::str_case_eq(text, "info"sv)) {
            out = log_level::info;
            return true;
        }
        if (utils::str_case_eq(text, "verbose"sv) || utils::str_case_eq(text, "debug"sv)) {
            out = log_level::verbose;
            return true;
        }
        return false;
    }

    inline constexpr bool valid_port(int port) {
        return port > 0 && port <= 65535;
    }

    inline int default_port() {
        if (const char* env = std::getenv("PORT")) {
            if (auto port = utils::parse_arithmetic<int>(utils::trim_view(env)); port && valid_port(*port)) {
                return *port;
            }
        }
        return 8000;
    }

    struct server_config {
        std::string host{"0.0.0.0"};
        int port{default_port()};
        std::size_t max_body_bytes{1U << 20U};

        std::filesystem::path runtime_path{"java"};
        std::filesystem::path analyzer_path{"ltsp.jar"};
        std::filesystem::path scratch_dir{std::filesystem::temp_directory_path()};
        int analyzer_timeout_ms{30'000};
        int probe_timeout_ms{5'000};
        std::string default_process{"DEFAULT"};

        std::filesystem::path container_runtime{"docker"};
        std::string container_image{"golang:1.22-alpine"};
        int container_timeout_ms{30'000};
        std::string container_memory{"512m"};
        std::string container_cpus{"2"};
        int pull_timeout_ms{300'000};

        log_level log{log_level::info};
        bool print_config{false};
    };

    // Overlays the keys present in a JSON config file onto `cfg`. Throws std::runtime_error on
    // unreadable or malformed files.
    void load_config_file(const std::filesystem::path& path, server_config& cfg);

    void print_config(const server_config& cfg, std::ostream& os);

}  // namespace anvil

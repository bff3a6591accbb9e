#include "anvil/cli.hpp"

#include "anvil/format.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace anvil::literals;

namespace anvil::cli {

    namespace detail {

        static bool parse_timeout(std::string_view flag, const std::string& text, int& out) {
            auto value = utils::parse_arithmetic<int>(utils::trim_view(text));
            if (!value || *value <= 0) {
                std::cerr << "invalid " << flag << " value: " << text << " (expected a positive integer)\n";
                return false;
            }
            out = *value;
            return true;
        }

    }  // namespace detail

    std::optional<int> parse_cli(int argc, char** argv, server_config& cfg) {
        CLI::App app{"anvil: HTTP front end for the LTSA model checker"};

        bool show_version = false;
        bool quiet = false;
        bool verbose = false;
        std::string config_arg{};
        std::string host_arg{cfg.host};
        std::string port_arg{std::to_string(cfg.port)};
        std::string runtime_arg{cfg.runtime_path.string()};
        std::string analyzer_arg{cfg.analyzer_path.string()};
        std::string scratch_dir_arg{cfg.scratch_dir.string()};
        std::string timeout_arg{std::to_string(cfg.analyzer_timeout_ms)};
        std::string probe_timeout_arg{std::to_string(cfg.probe_timeout_ms)};
        std::string max_body_arg{std::to_string(cfg.max_body_bytes)};
        std::string default_process_arg{cfg.default_process};
        std::string container_runtime_arg{cfg.container_runtime.string()};
        std::string container_image_arg{cfg.container_image};
        std::string log_arg{std::string{to_string(cfg.log)}};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--config", config_arg, "JSON config file; command-line options take precedence");
        app.add_option("--host", host_arg, "Listen address");
        app.add_option("-p,--port", port_arg, "Listen port (default: $PORT or 8000)");
        app.add_option("--runtime", runtime_arg, "Analyzer runtime executable");
        app.add_option("--analyzer", analyzer_arg, "Analyzer jar path");
        app.add_option("--scratch-dir", scratch_dir_arg, "Directory for per-request specification files");
        app.add_option("--timeout-ms", timeout_arg, "Analyzer run timeout in milliseconds");
        app.add_option("--probe-timeout-ms", probe_timeout_arg, "Health probe timeout in milliseconds");
        app.add_option("--max-body-bytes", max_body_arg, "Largest accepted request body");
        app.add_option("--default-process", default_process_arg, "Process name used when a request omits one");
        app.add_option("--container-runtime", container_runtime_arg, "Container CLI used to run generated Go");
        app.add_option("--container-image", container_image_arg, "Image providing the Go toolchain");
        app.add_option("--log", log_arg, "Log level: quiet|info|verbose");
        app.add_flag("--quiet", quiet, "Log errors only");
        app.add_flag("--verbose", verbose, "Log analyzer command lines");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        auto given = [&app](const char* name) { return app.get_option(name)->count() > 0U; };

        if (quiet && verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }

        if (given("--config")) {
            try {
                load_config_file(config_arg, cfg);
            } catch (const std::runtime_error& e) {
                std::cerr << "invalid --config: " << e.what() << '\n';
                return std::optional<int>{2};
            }
        }

        if (given("--port")) {
            auto port = utils::parse_arithmetic<int>(utils::trim_view(port_arg));
            if (!port || !valid_port(*port)) {
                std::cerr << "invalid --port value: " << port_arg << " (expected 1..65535)\n";
                return std::optional<int>{2};
            }
            cfg.port = *port;
        }
        if (given("--timeout-ms") && !detail::parse_timeout("--timeout-ms", timeout_arg, cfg.analyzer_timeout_ms)) {
            return std::optional<int>{2};
        }
        if (given("--probe-timeout-ms") &&
            !detail::parse_timeout("--probe-timeout-ms", probe_timeout_arg, cfg.probe_timeout_ms)) {
            return std::optional<int>{2};
        }
        if (given("--max-body-bytes")) {
            auto bytes = utils::parse_arithmetic<std::size_t>(utils::trim_view(max_body_arg));
            if (!bytes || *bytes == 0U) {
                std::cerr << "invalid --max-body-bytes value: " << max_body_arg << " (expected a positive integer)\n";
                return std::optional<int>{2};
            }
            cfg.max_body_bytes = *bytes;
        }
        if (given("--log") && !try_parse_log_level(log_arg, cfg.log)) {
            std::cerr << "invalid --log value: " << log_arg << " (expected quiet|info|verbose)\n";
            return std::optional<int>{2};
        }
        if (quiet) {
            cfg.log = log_level::quiet;
        }
        if (verbose) {
            cfg.log = log_level::verbose;
        }

        if (given("--host")) {
            cfg.host = host_arg;
        }
        if (given("--runtime")) {
            cfg.runtime_path = runtime_arg;
        }
        if (given("--analyzer")) {
            cfg.analyzer_path = analyzer_arg;
        }
        if (given("--scratch-dir")) {
            cfg.scratch_dir = scratch_dir_arg;
        }
        if (given("--default-process")) {
            auto name = utils::trim_view(default_process_arg);
            if (name.empty()) {
                std::cerr << "invalid --default-process value: must not be empty\n";
                return std::optional<int>{2};
            }
            cfg.default_process = std::string{name};
        }
        if (given("--container-runtime")) {
            cfg.container_runtime = container_runtime_arg;
        }
        if (given("--container-image")) {
            cfg.container_image = container_image_arg;
        }

        if (show_version) {
            std::cout << "anvil {}\n"_format(version);
            return std::optional<int>{0};
        }

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

}  // namespace anvil::cli

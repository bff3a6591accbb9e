#include "anvil/container.hpp"

#include "anvil/format.hpp"
#include "anvil/log.hpp"
#include "anvil/process.hpp"
#include "anvil/scratch.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace anvil::literals;
namespace fs = std::filesystem;

namespace anvil {

    namespace detail {

        static constexpr auto source_name = "main.go"sv;
        static constexpr auto mount_point = "/app"sv;

        static void write_text_file(const fs::path& path, std::string_view text) {
            std::ofstream out{path};
            if (!out) {
                throw std::runtime_error("failed to open file for write: {}"_format(path.string()));
            }
            out << text;
            if (!out) {
                throw std::runtime_error("failed to write file: {}"_format(path.string()));
            }
        }

        static std::vector<std::string> build_run_command(
                const server_config& cfg,
                const fs::path& source_dir,
                std::string_view container_name,
                std::string_view memory,
                std::string_view cpus) {
            // values are bound with '=' so that a limit can never be read as a separate flag
            return {
                    cfg.container_runtime.string(),
                    "run",
                    "--rm",
                    "--name={}"_format(container_name),
                    "--memory={}"_format(memory),
                    "--cpus={}"_format(cpus),
                    "-e",
                    "GOCACHE=/tmp/go-cache",
                    "-e",
                    "HOME=/tmp",
                    "-v",
                    "{}:{}:ro"_format(source_dir.string(), mount_point),
                    "-w",
                    std::string{mount_point},
                    cfg.container_image,
                    "go",
                    "run",
                    std::string{source_name},
            };
        }

    }  // namespace detail

    bool container_available(const server_config& cfg) {
        return probe_process({cfg.container_runtime.string(), "info"}, cfg.probe_timeout_ms);
    }

    bool image_available(const server_config& cfg) {
        return probe_process(
                {cfg.container_runtime.string(), "image", "inspect", cfg.container_image}, cfg.probe_timeout_ms);
    }

    pull_result pull_image(const server_config& cfg) {
        log::info("pulling image ", cfg.container_image);

        auto proc = run_process({cfg.container_runtime.string(), "pull", cfg.container_image}, cfg.pull_timeout_ms);
        if (proc.launch_failed) {
            return {.success = false, .message = "Error pulling image: {}"_format(proc.launch_error)};
        }
        if (proc.timed_out) {
            return {.success = false, .message = "Image pull timed out"};
        }
        if (proc.exit_code != 0) {
            return {.success = false, .message = "Failed to pull image: {}{}"_format(proc.stdout_text, proc.stderr_text)};
        }
        return {.success = true, .message = "Successfully pulled {}"_format(cfg.container_image)};
    }

    execution_result execute_go(const server_config& cfg, std::string_view code, const execution_options& options) {
        auto timeout_ms = options.timeout_ms.value_or(cfg.container_timeout_ms);
        if (timeout_ms <= 0) {
            throw std::invalid_argument("timeoutMs must be positive");
        }
        const auto& memory = options.memory_limit ? *options.memory_limit : cfg.container_memory;
        const auto& cpus = options.cpu_limit ? *options.cpu_limit : cfg.container_cpus;

        auto workdir = scratch_dir::create(cfg.scratch_dir, "anvil-");
        detail::write_text_file(workdir.path() / detail::source_name, code);

        // the directory name is already unique, so it doubles as the container name
        auto container_name = workdir.path().filename().string();
        auto cmd = detail::build_run_command(cfg, workdir.path(), container_name, memory, cpus);

        log::info("running Go code in {} (timeout: {}ms, memory: {})"_format(container_name, timeout_ms, memory));
        log::verbose("executing: ", utils::join_with_separator(cmd, " "));

        auto proc = run_process(cmd, timeout_ms);

        execution_result result{};
        result.stdout_text = std::move(proc.stdout_text);
        result.stderr_text = std::move(proc.stderr_text);
        result.timed_out = proc.timed_out;
        result.execution_time_ms = proc.elapsed_ms;

        if (proc.launch_failed) {
            result.error = proc.launch_error;
            return result;
        }

        if (proc.timed_out) {
            // killing the CLI client does not stop the container itself
            if (!probe_process({cfg.container_runtime.string(), "kill", container_name}, cfg.probe_timeout_ms)) {
                log::warn("failed to kill container ", container_name);
            }
            return result;
        }

        result.exit_code = proc.exit_code;
        result.success = proc.exit_code == 0;
        return result;
    }

}  // namespace anvil

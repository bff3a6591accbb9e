#include "anvil/analyzer.hpp"

#include "anvil/format.hpp"
#include "anvil/log.hpp"
#include "anvil/process.hpp"
#include "anvil/scratch.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

using namespace anvil::literals;
namespace fs = std::filesystem;

namespace anvil {

    namespace detail {

        namespace arg_tokens {
            static constexpr auto jar = "-jar"sv;
            static constexpr auto build = "-b"sv;
            static constexpr auto check = "-c"sv;
            static constexpr auto process = "-p"sv;
            static constexpr auto ltl_property = "-l"sv;
            static constexpr auto runtime_version = "-version"sv;

            static constexpr auto build_parse = "parse"sv;
            static constexpr auto build_compile = "compile"sv;
            static constexpr auto build_compose = "compose"sv;
            static constexpr auto check_safety = "safety"sv;
            static constexpr auto check_progress = "progress"sv;
            static constexpr auto check_ltl = "ltl_property"sv;
        }  // namespace arg_tokens

        static constexpr auto scratch_prefix = "ltsp-"sv;
        static constexpr auto scratch_suffix = ".lts"sv;

        static void append_targeted(
                std::vector<std::string>& args,
                std::string_view action_flag,
                std::string_view action,
                std::string_view process) {
            args.emplace_back(action_flag);
            args.emplace_back(action);
            args.emplace_back(arg_tokens::process);
            args.emplace_back(process);
        }

        static std::vector<std::string> assemble_command(
                const server_config& cfg, const fs::path& spec_path, std::vector<std::string> mode_args) {
            std::vector<std::string> cmd{};
            cmd.reserve(mode_args.size() + 4U);
            cmd.push_back(cfg.runtime_path.string());
            cmd.emplace_back(arg_tokens::jar);
            cmd.push_back(cfg.analyzer_path.string());
            cmd.push_back(spec_path.string());
            cmd.insert(cmd.end(), std::make_move_iterator(mode_args.begin()), std::make_move_iterator(mode_args.end()));
            return cmd;
        }

        static bool is_regular_file(const fs::path& path) {
            std::error_code ec{};
            return fs::is_regular_file(path, ec);
        }

    }  // namespace detail

    std::vector<std::string> mode_arguments(
            analysis_mode mode, std::string_view process, const std::optional<std::string>& property) {
        std::vector<std::string> args{};
        switch (mode) {
            case analysis_mode::parse:
                args.emplace_back(detail::arg_tokens::build);
                args.emplace_back(detail::arg_tokens::build_parse);
                break;
            case analysis_mode::compile:
                detail::append_targeted(args, detail::arg_tokens::build, detail::arg_tokens::build_compile, process);
                break;
            case analysis_mode::compose:
                detail::append_targeted(args, detail::arg_tokens::build, detail::arg_tokens::build_compose, process);
                break;
            case analysis_mode::safety:
                detail::append_targeted(args, detail::arg_tokens::check, detail::arg_tokens::check_safety, process);
                break;
            case analysis_mode::progress:
                detail::append_targeted(args, detail::arg_tokens::check, detail::arg_tokens::check_progress, process);
                break;
            case analysis_mode::ltl:
                if (!property || property->empty()) {
                    throw std::invalid_argument("ltl check requires a property");
                }
                detail::append_targeted(args, detail::arg_tokens::check, detail::arg_tokens::check_ltl, process);
                args.emplace_back(detail::arg_tokens::ltl_property);
                args.push_back(*property);
                break;
        }
        return args;
    }

    std::vector<std::string> build_command(
            const server_config& cfg, const fs::path& spec_path, const analysis_request& request) {
        return detail::assemble_command(
                cfg, spec_path, mode_arguments(request.mode, request.process, request.property));
    }

    analysis_result run_analysis(const server_config& cfg, const analysis_request& request) {
        // validated before anything touches the disk
        auto mode_args = mode_arguments(request.mode, request.process, request.property);

        auto spec_file = scratch_file::create(
                cfg.scratch_dir, detail::scratch_prefix, detail::scratch_suffix, request.content);

        analysis_result result{};
        result.command = detail::assemble_command(cfg, spec_file.path(), std::move(mode_args));
        log::verbose("executing: ", utils::join_with_separator(result.command, " "));

        auto proc = run_process(result.command, cfg.analyzer_timeout_ms);
        result.elapsed_ms = proc.elapsed_ms;

        if (proc.launch_failed) {
            throw analysis_unavailable(
                    "{} or {} not found ({}). Ensure the runtime is installed and the analyzer exists at {}"_format(
                            cfg.runtime_path.string(),
                            cfg.analyzer_path.string(),
                            proc.launch_error,
                            cfg.analyzer_path.string()));
        }
        if (proc.timed_out) {
            throw analysis_timeout("{} timed out after {}ms"_format(request.mode, cfg.analyzer_timeout_ms));
        }

        result.exit_code = proc.exit_code;
        result.success = proc.exit_code == 0;
        result.output = std::move(proc.stdout_text);
        if (!proc.stderr_text.empty()) {
            result.error = std::move(proc.stderr_text);
        }

        log::info("{} {} exit={} {}ms"_format(
                request.mode, takes_process(request.mode) ? request.process : "-", result.exit_code, result.elapsed_ms));
        return result;
    }

    health_report probe_health(const server_config& cfg) {
        health_report report{};
        report.analyzer_path = cfg.analyzer_path;
        report.analyzer_exists = detail::is_regular_file(cfg.analyzer_path);
        report.runtime_available = probe_process(
                {cfg.runtime_path.string(), std::string{detail::arg_tokens::runtime_version}}, cfg.probe_timeout_ms);
        return report;
    }

}  // namespace anvil

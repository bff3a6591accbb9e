#pragma once

#include "config.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace anvil {

    enum class analysis_mode : uint8_t {
        parse,
        compile,
        compose,
        safety,
        progress,
        ltl,
    };

    inline constexpr std::array all_analysis_modes{
            analysis_mode::parse,
            analysis_mode::compile,
            analysis_mode::compose,
            analysis_mode::safety,
            analysis_mode::progress,
            analysis_mode::ltl,
    };

    inline constexpr std::string_view to_string(analysis_mode mode) {
        switch (mode) {
            case analysis_mode::parse:
                return "parse"sv;
            case analysis_mode::compile:
                return "compile"sv;
            case analysis_mode::compose:
                return "compose"sv;
            case analysis_mode::safety:
                return "safety"sv;
            case analysis_mode::progress:
                return "progress"sv;
            case analysis_mode::ltl:
                return "ltl"sv;
        }
        return "parse"sv;
    }

    inline constexpr std::string_view route_for(analysis_mode mode) {
        switch (mode) {
            case analysis_mode::parse:
                return "/parse"sv;
            case analysis_mode::compile:
                return "/compile"sv;
            case analysis_mode::compose:
                return "/compose"sv;
            case analysis_mode::safety:
                return "/check/safety"sv;
            case analysis_mode::progress:
                return "/check/progress"sv;
            case analysis_mode::ltl:
                return "/check/ltl"sv;
        }
        return "/parse"sv;
    }

    // parse ignores the target process; every other mode names one
    inline constexpr bool takes_process(analysis_mode mode) {
        return mode != analysis_mode::parse;
    }

    inline constexpr bool takes_property(analysis_mode mode) {
        return mode == analysis_mode::ltl;
    }

    struct analysis_request {
        analysis_mode mode{analysis_mode::parse};
        std::string content{};
        std::string process{"DEFAULT"};
        std::optional<std::string> property{};
    };

    struct analysis_result {
        bool success{false};
        int exit_code{-1};
        std::string output{};
        std::optional<std::string> error{};
        std::vector<std::string> command{};
        int64_t elapsed_ms{};
    };

    struct health_report {
        bool runtime_available{false};
        bool analyzer_exists{false};
        std::filesystem::path analyzer_path{};

        bool healthy() const { return runtime_available && analyzer_exists; }
    };

    // The analyzer did not finish within the configured budget.
    class analysis_timeout : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    // The analyzer runtime could not be launched at all.
    class analysis_unavailable : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    std::vector<std::string> mode_arguments(
            analysis_mode mode, std::string_view process, const std::optional<std::string>& property);

    std::vector<std::string> build_command(
            const server_config& cfg, const std::filesystem::path& spec_path, const analysis_request& request);

    /*
     * Writes the request's specification to a fresh scratch file, runs the analyzer against it and
     * relays the outcome. The scratch file is gone by the time this returns or throws.
     *
     * success mirrors the analyzer's exit status; stdout becomes `output`, non-empty stderr becomes
     * `error`. Throws analysis_timeout, analysis_unavailable, std::invalid_argument (ltl without a
     * property) and std::system_error (scratch file or spawn failures).
     */
    analysis_result run_analysis(const server_config& cfg, const analysis_request& request);

    health_report probe_health(const server_config& cfg);

}  // namespace anvil

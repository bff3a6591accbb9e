#pragma once

#include <glaze/glaze.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace anvil::internal {

    // ── Request bodies ──────────────────────────────────────────────

    struct analysis_body {
        std::optional<std::string> content{};
        std::optional<std::string> process{};
        std::optional<std::string> property{};
    };

    struct transpile_body {
        glz::raw_json spec{};
    };

    struct transpile_run_body {
        glz::raw_json spec{};
        std::optional<int> timeout_ms{};
        std::optional<std::string> memory_limit{};
        std::optional<std::string> cpu_limit{};
    };

    // ── Response bodies ─────────────────────────────────────────────

    struct error_body {
        std::string error{};
    };

    struct analysis_response {
        bool success{false};
        std::string output{};
        std::optional<std::string> error{};
    };

    struct ltsa_health {
        bool ltsp_jar_exists{false};
        std::string ltsp_jar_path{};
        bool java_available{false};
    };

    struct docker_health {
        bool available{false};
        bool go_image_available{false};
    };

    struct health_response {
        std::string status{};
        ltsa_health ltsa{};
        docker_health docker{};
    };

    struct root_response {
        std::string message{};
        std::string version{};
        std::string docs{};
        std::map<std::string, std::string> endpoints{};
    };

    struct transpile_response {
        bool success{true};
        std::string go_code{};
        uint64_t line_count{};
    };

    struct failure_response {
        bool success{false};
        std::string error{};
    };

    struct execution_payload {
        std::string stdout_text{};
        std::string stderr_text{};
        std::optional<int> exit_code{};
        bool timed_out{false};
        int64_t execution_time_ms{};
        std::optional<std::string> error{};
    };

    // goCode and execution stay null when the request fails before anything ran
    struct transpile_run_response {
        bool success{false};
        std::optional<std::string> error{};
        std::optional<std::string> go_code{};
        std::optional<execution_payload> execution{};
    };

    struct docker_status_response {
        bool available{false};
        bool go_image_available{false};
        std::string message{};
    };

    struct pull_response {
        bool success{false};
        std::string message{};
    };

}  // namespace anvil::internal

namespace glz {

    template <>
    struct meta<anvil::internal::analysis_body> {
        using T = anvil::internal::analysis_body;
        static constexpr auto value = object("content", &T::content, "process", &T::process, "property", &T::property);
    };

    template <>
    struct meta<anvil::internal::transpile_body> {
        using T = anvil::internal::transpile_body;
        static constexpr auto value = object("spec", &T::spec);
    };

    template <>
    struct meta<anvil::internal::transpile_run_body> {
        using T = anvil::internal::transpile_run_body;
        static constexpr auto value =
                object("spec",
                       &T::spec,
                       "timeoutMs",
                       &T::timeout_ms,
                       "memoryLimit",
                       &T::memory_limit,
                       "cpuLimit",
                       &T::cpu_limit);
    };

    template <>
    struct meta<anvil::internal::error_body> {
        using T = anvil::internal::error_body;
        static constexpr auto value = object("error", &T::error);
    };

    template <>
    struct meta<anvil::internal::analysis_response> {
        using T = anvil::internal::analysis_response;
        static constexpr auto value = object("success", &T::success, "output", &T::output, "error", &T::error);
    };

    template <>
    struct meta<anvil::internal::ltsa_health> {
        using T = anvil::internal::ltsa_health;
        static constexpr auto value =
                object("ltsp_jar_exists",
                       &T::ltsp_jar_exists,
                       "ltsp_jar_path",
                       &T::ltsp_jar_path,
                       "java_available",
                       &T::java_available);
    };

    template <>
    struct meta<anvil::internal::docker_health> {
        using T = anvil::internal::docker_health;
        static constexpr auto value = object("available", &T::available, "go_image_available", &T::go_image_available);
    };

    template <>
    struct meta<anvil::internal::health_response> {
        using T = anvil::internal::health_response;
        static constexpr auto value = object("status", &T::status, "ltsa", &T::ltsa, "docker", &T::docker);
    };

    template <>
    struct meta<anvil::internal::root_response> {
        using T = anvil::internal::root_response;
        static constexpr auto value =
                object("message", &T::message, "version", &T::version, "docs", &T::docs, "endpoints", &T::endpoints);
    };

    template <>
    struct meta<anvil::internal::transpile_response> {
        using T = anvil::internal::transpile_response;
        static constexpr auto value =
                object("success", &T::success, "goCode", &T::go_code, "lineCount", &T::line_count);
    };

    template <>
    struct meta<anvil::internal::failure_response> {
        using T = anvil::internal::failure_response;
        static constexpr auto value = object("success", &T::success, "error", &T::error);
    };

    template <>
    struct meta<anvil::internal::execution_payload> {
        using T = anvil::internal::execution_payload;
        static constexpr auto value =
                object("stdout",
                       &T::stdout_text,
                       "stderr",
                       &T::stderr_text,
                       "exitCode",
                       &T::exit_code,
                       "timedOut",
                       &T::timed_out,
                       "executionTimeMs",
                       &T::execution_time_ms,
                       "error",
                       &T::error);
    };

    template <>
    struct meta<anvil::internal::transpile_run_response> {
        using T = anvil::internal::transpile_run_response;
        static constexpr auto value =
                object("success", &T::success, "error", &T::error, "goCode", &T::go_code, "execution", &T::execution);
    };

    template <>
    struct meta<anvil::internal::docker_status_response> {
        using T = anvil::internal::docker_status_response;
        static constexpr auto value =
                object("available", &T::available, "go_image_available", &T::go_image_available, "message", &T::message);
    };

    template <>
    struct meta<anvil::internal::pull_response> {
        using T = anvil::internal::pull_response;
        static constexpr auto value = object("success", &T::success, "message", &T::message);
    };

}  // namespace glz

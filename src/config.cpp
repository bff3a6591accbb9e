#include "anvil/config.hpp"

#include "anvil/format.hpp"

#include <glaze/glaze.hpp>

#include <fstream>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace anvil::literals;

namespace anvil::detail {

    // mirrors server_config; absent keys leave the corresponding field untouched
    struct persisted_config {
        std::optional<std::string> host{};
        std::optional<int> port{};
        std::optional<std::size_t> max_body_bytes{};
        std::optional<std::string> runtime{};
        std::optional<std::string> analyzer{};
        std::optional<std::string> scratch_dir{};
        std::optional<int> analyzer_timeout_ms{};
        std::optional<int> probe_timeout_ms{};
        std::optional<std::string> default_process{};
        std::optional<std::string> container_runtime{};
        std::optional<std::string> container_image{};
        std::optional<int> container_timeout_ms{};
        std::optional<std::string> container_memory{};
        std::optional<std::string> container_cpus{};
        std::optional<int> pull_timeout_ms{};
        std::optional<std::string> log{};
    };

}  // namespace anvil::detail

namespace glz {
    template <>
    struct meta<anvil::detail::persisted_config> {
        using T = anvil::detail::persisted_config;
        static constexpr auto value = object(
                "host",
                &T::host,
                "port",
                &T::port,
                "max_body_bytes",
                &T::max_body_bytes,
                "runtime",
                &T::runtime,
                "analyzer",
                &T::analyzer,
                "scratch_dir",
                &T::scratch_dir,
                "analyzer_timeout_ms",
                &T::analyzer_timeout_ms,
                "probe_timeout_ms",
                &T::probe_timeout_ms,
                "default_process",
                &T::default_process,
                "container_runtime",
                &T::container_runtime,
                "container_image",
                &T::container_image,
                "container_timeout_ms",
                &T::container_timeout_ms,
                "container_memory",
                &T::container_memory,
                "container_cpus",
                &T::container_cpus,
                "pull_timeout_ms",
                &T::pull_timeout_ms,
                "log",
                &T::log);
    };
}  // namespace glz

namespace anvil {

    namespace detail {

        static std::string read_text_file(const std::filesystem::path& path) {
            std::ifstream in{path};
            if (!in) {
                throw std::runtime_error("failed to open config file: {}"_format(path.string()));
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            return ss.str();
        }

        template <typename T>
        static void assign_if(const std::optional<T>& value, T& out) {
            if (value) {
                out = *value;
            }
        }

        static void check_positive(
                const std::optional<int>& value, std::string_view key, const std::filesystem::path& path) {
            if (value && *value <= 0) {
                throw std::runtime_error("invalid {} in {}: must be positive"_format(key, path.string()));
            }
        }

    }  // namespace detail

    void load_config_file(const std::filesystem::path& path, server_config& cfg) {
        auto text = detail::read_text_file(path);

        detail::persisted_config file{};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(file, text);
        if (ec) {
            throw std::runtime_error(
                    "failed to parse config file {}: {}"_format(path.string(), glz::format_error(ec, text)));
        }

        // every check runs before the first assignment so a rejected file leaves cfg untouched
        if (file.port && !valid_port(*file.port)) {
            throw std::runtime_error("invalid port in {}: {}"_format(path.string(), *file.port));
        }
        if (file.max_body_bytes && *file.max_body_bytes == 0U) {
            throw std::runtime_error("invalid max_body_bytes in {}: must be positive"_format(path.string()));
        }
        if (file.default_process && utils::trim_view(*file.default_process).empty()) {
            throw std::runtime_error("invalid default_process in {}: must not be empty"_format(path.string()));
        }
        log_level level{cfg.log};
        if (file.log && !try_parse_log_level(*file.log, level)) {
            throw std::runtime_error("invalid log level in {}: {}"_format(path.string(), *file.log));
        }
        detail::check_positive(file.analyzer_timeout_ms, "analyzer_timeout_ms", path);
        detail::check_positive(file.probe_timeout_ms, "probe_timeout_ms", path);
        detail::check_positive(file.container_timeout_ms, "container_timeout_ms", path);
        detail::check_positive(file.pull_timeout_ms, "pull_timeout_ms", path);

        cfg.log = level;
        detail::assign_if(file.host, cfg.host);
        detail::assign_if(file.port, cfg.port);
        detail::assign_if(file.max_body_bytes, cfg.max_body_bytes);
        detail::assign_if(file.container_image, cfg.container_image);
        detail::assign_if(file.container_memory, cfg.container_memory);
        detail::assign_if(file.container_cpus, cfg.container_cpus);
        detail::assign_if(file.analyzer_timeout_ms, cfg.analyzer_timeout_ms);
        detail::assign_if(file.probe_timeout_ms, cfg.probe_timeout_ms);
        detail::assign_if(file.container_timeout_ms, cfg.container_timeout_ms);
        detail::assign_if(file.pull_timeout_ms, cfg.pull_timeout_ms);

        if (file.default_process) {
            cfg.default_process = std::string{utils::trim_view(*file.default_process)};
        }
        if (file.runtime) {
            cfg.runtime_path = *file.runtime;
        }
        if (file.analyzer) {
            cfg.analyzer_path = *file.analyzer;
        }
        if (file.scratch_dir) {
            cfg.scratch_dir = *file.scratch_dir;
        }
        if (file.container_runtime) {
            cfg.container_runtime = *file.container_runtime;
        }
    }

    void print_config(const server_config& cfg, std::ostream& os) {
        os << "host=" << cfg.host << '\n';
        os << "port=" << cfg.port << '\n';
        os << "max_body_bytes=" << cfg.max_body_bytes << '\n';
        os << "runtime=" << cfg.runtime_path.string() << '\n';
        os << "analyzer=" << cfg.analyzer_path.string() << '\n';
        os << "scratch_dir=" << cfg.scratch_dir.string() << '\n';
        os << "analyzer_timeout_ms=" << cfg.analyzer_timeout_ms << '\n';
        os << "probe_timeout_ms=" << cfg.probe_timeout_ms << '\n';
        os << "default_process=" << cfg.default_process << '\n';
        os << "container_runtime=" << cfg.container_runtime.string() << '\n';
        os << "container_image=" << cfg.container_image << '\n';
        os << "container_timeout_ms=" << cfg.container_timeout_ms << '\n';
        os << "container_memory=" << cfg.container_memory << '\n';
        os << "container_cpus=" << cfg.container_cpus << '\n';
        os << "pull_timeout_ms=" << cfg.pull_timeout_ms << '\n';
        os << "log=" << to_string(cfg.log) << '\n';
    }

}  // namespace anvil

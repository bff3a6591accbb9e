#include "anvil/http.hpp"

#include "anvil/analyzer.hpp"
#include "anvil/container.hpp"
#include "anvil/format.hpp"
#include "anvil/log.hpp"
#include "anvil/transpiler.hpp"

#include "internal/types.hpp"

#include <glaze/glaze.hpp>
#include <httplib.h>

extern "C" {
#include <pthread.h>
#include <signal.h>
#include <unistd.h>
}

#include <atomic>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

using namespace anvil::literals;
using namespace std::string_view_literals;

namespace anvil::http {

    namespace detail {

        static constexpr auto json_content_type = "application/json"sv;
        static constexpr auto timeout_message = "Command execution timed out"sv;
        static constexpr auto docker_missing_message =
                "Docker is not available. Please ensure Docker is installed and running."sv;

        template <typename T>
        static void send_json(httplib::Response& res, int status, const T& body) {
            std::string json{};
            (void)glz::write<glz::opts{.skip_null_members = false}>(body, json);
            res.status = status;
            res.set_content(json, std::string{json_content_type});
        }

        static void send_error(httplib::Response& res, int status, std::string message) {
            send_json(res, status, internal::error_body{.error = std::move(message)});
        }

        template <typename T>
        static std::optional<T> read_body(const httplib::Request& req, httplib::Response& res) {
            T body{};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(body, req.body);
            if (ec) {
                send_error(res, 400, "invalid JSON body: {}"_format(glz::format_error(ec, req.body)));
                return std::nullopt;
            }
            return body;
        }

        static bool present(const std::optional<std::string>& field) {
            return field && !field->empty();
        }

        // null, false, "" and numeric zero count as a missing value
        static bool present(const glz::raw_json& field) {
            auto text = utils::trim_view(field.str);
            if (text.empty() || text == "null"sv || text == "false"sv || text == "\"\""sv) {
                return false;
            }
            auto number = utils::parse_arithmetic<double>(text);
            return !(number && *number == 0.0);
        }

        static std::string_view describe_status(int status) {
            switch (status) {
                case 400:
                    return "bad request"sv;
                case 404:
                    return "not found"sv;
                case 405:
                    return "method not allowed"sv;
                case 413:
                    return "payload too large"sv;
                default:
                    return "request failed"sv;
            }
        }

        // ── Error mapping ──────────────────────────────────────────────

        static void handle_exception(const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            try {
                std::rethrow_exception(ep);
            } catch (const analysis_timeout& e) {
                log::warn(req.path, ": ", e.what());
                send_error(res, 408, std::string{timeout_message});
            } catch (const analysis_unavailable& e) {
                log::error(req.path, ": ", e.what());
                send_error(res, 500, e.what());
            } catch (const transpile_error& e) {
                send_json(res, 400, internal::failure_response{.error = e.what()});
            } catch (const std::invalid_argument& e) {
                send_error(res, 400, e.what());
            } catch (const std::exception& e) {
                log::error(req.path, ": ", e.what());
                send_error(res, 500, "Internal server error: {}"_format(e.what()));
            } catch (...) {
                log::error(req.path, ": non-standard exception");
                send_error(res, 500, "Internal server error: unknown exception");
            }
        }

        // ── Handlers ───────────────────────────────────────────────────

        static void handle_root(httplib::Response& res) {
            internal::root_response body{
                    .message = "LTSA REST API",
                    .version = std::string{version},
                    .docs = "/health for status",
            };
            for (auto mode : all_analysis_modes) {
                body.endpoints.emplace(std::string{to_string(mode)}, "POST {}"_format(route_for(mode)));
            }
            body.endpoints.emplace("transpile", "POST /transpile");
            body.endpoints.emplace("transpileAndRun", "POST /transpile-and-run");
            body.endpoints.emplace("dockerStatus", "GET /docker/status");
            body.endpoints.emplace("dockerPull", "POST /docker/pull");
            body.endpoints.emplace("health", "GET /health");
            send_json(res, 200, body);
        }

        static void handle_health(const server_config& cfg, httplib::Response& res) {
            auto report = probe_health(cfg);
            bool docker = container_available(cfg);
            bool image = docker && image_available(cfg);

            internal::health_response body{
                    .status = report.healthy() ? "healthy" : "unhealthy",
                    .ltsa =
                            {
                                    .ltsp_jar_exists = report.analyzer_exists,
                                    .ltsp_jar_path = report.analyzer_path.string(),
                                    .java_available = report.runtime_available,
                            },
                    .docker = {.available = docker, .go_image_available = image},
            };
            send_json(res, 200, body);
        }

        static void handle_analysis(
                const server_config& cfg, analysis_mode mode, const httplib::Request& req, httplib::Response& res) {
            auto body = read_body<internal::analysis_body>(req, res);
            if (!body) {
                return;
            }
            if (!present(body->content)) {
                send_error(res, 400, "content is required");
                return;
            }

            analysis_request request{};
            request.mode = mode;
            request.content = std::move(*body->content);
            request.process = present(body->process) ? std::move(*body->process) : cfg.default_process;
            if (takes_property(mode)) {
                if (!present(body->property)) {
                    send_error(res, 400, "property is required");
                    return;
                }
                request.property = std::move(body->property);
            }

            auto result = run_analysis(cfg, request);
            send_json(
                    res,
                    200,
                    internal::analysis_response{
                            .success = result.success,
                            .output = std::move(result.output),
                            .error = std::move(result.error),
                    });
        }

        static void handle_transpile(const httplib::Request& req, httplib::Response& res) {
            auto body = read_body<internal::transpile_body>(req, res);
            if (!body) {
                return;
            }
            if (!present(body->spec)) {
                send_error(res, 400, "spec is required");
                return;
            }

            auto code = transpile(parse_lts_json(body->spec.str));
            internal::transpile_response out{};
            out.line_count = utils::count_lines(code);
            out.go_code = std::move(code);
            send_json(res, 200, out);
        }

        static void handle_transpile_and_run(
                const server_config& cfg, const httplib::Request& req, httplib::Response& res) {
            auto body = read_body<internal::transpile_run_body>(req, res);
            if (!body) {
                return;
            }
            if (!present(body->spec)) {
                send_error(res, 400, "spec is required");
                return;
            }

            if (!container_available(cfg)) {
                send_json(res, 503, internal::transpile_run_response{.error = std::string{docker_missing_message}});
                return;
            }
            if (!image_available(cfg)) {
                send_json(
                        res,
                        503,
                        internal::transpile_run_response{
                                .error = "Go Docker image not available. POST to /docker/pull first to download "
                                         "the image."});
                return;
            }

            std::string code{};
            try {
                code = transpile(parse_lts_json(body->spec.str));
            } catch (const transpile_error& e) {
                send_json(res, 400, internal::transpile_run_response{.error = e.what()});
                return;
            }

            auto execution = execute_go(
                    cfg,
                    code,
                    execution_options{
                            .timeout_ms = body->timeout_ms,
                            .memory_limit = std::move(body->memory_limit),
                            .cpu_limit = std::move(body->cpu_limit),
                    });

            internal::transpile_run_response out{};
            out.success = execution.success;
            out.go_code = std::move(code);
            out.execution = internal::execution_payload{
                    .stdout_text = std::move(execution.stdout_text),
                    .stderr_text = std::move(execution.stderr_text),
                    .exit_code = execution.exit_code,
                    .timed_out = execution.timed_out,
                    .execution_time_ms = execution.execution_time_ms,
                    .error = std::move(execution.error),
            };
            send_json(res, 200, out);
        }

        static void handle_docker_status(const server_config& cfg, httplib::Response& res) {
            internal::docker_status_response body{};
            body.available = container_available(cfg);
            if (!body.available) {
                body.message = std::string{docker_missing_message};
                send_json(res, 200, body);
                return;
            }

            body.go_image_available = image_available(cfg);
            body.message = body.go_image_available ? "Docker and Go image are ready"
                                                   : "Docker available but Go image needs to be pulled. POST to "
                                                     "/docker/pull to download.";
            send_json(res, 200, body);
        }

        static void handle_docker_pull(const server_config& cfg, httplib::Response& res) {
            if (!container_available(cfg)) {
                send_json(res, 503, internal::failure_response{.error = std::string{docker_missing_message}});
                return;
            }

            auto pulled = pull_image(cfg);
            send_json(res, 200, internal::pull_response{.success = pulled.success, .message = std::move(pulled.message)});
        }

    }  // namespace detail

    service::service(server_config cfg) : _cfg{std::move(cfg)}, _server{std::make_unique<httplib::Server>()} {
        register_routes();
    }

    service::~service() = default;

    void service::register_routes() {
        auto& svr = *_server;
        const auto& cfg = _cfg;

        svr.set_payload_max_length(cfg.max_body_bytes);
        svr.set_default_headers({
                {"Access-Control-Allow-Origin", "*"},
                {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
                {"Access-Control-Allow-Headers", "*"},
        });
        svr.set_exception_handler(detail::handle_exception);
        svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
            if (res.body.empty()) {
                detail::send_error(res, res.status, std::string{detail::describe_status(res.status)});
            }
        });
        svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
            log::info(req.method, ' ', req.path, " -> ", res.status);
        });

        svr.Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) { res.status = 204; });

        svr.Get("/", [](const httplib::Request&, httplib::Response& res) { detail::handle_root(res); });
        svr.Get("/health", [&cfg](const httplib::Request&, httplib::Response& res) { detail::handle_health(cfg, res); });

        for (auto mode : all_analysis_modes) {
            svr.Post(std::string{route_for(mode)}, [&cfg, mode](const httplib::Request& req, httplib::Response& res) {
                detail::handle_analysis(cfg, mode, req, res);
            });
        }

        svr.Post("/transpile", [](const httplib::Request& req, httplib::Response& res) {
            detail::handle_transpile(req, res);
        });
        svr.Post("/transpile-and-run", [&cfg](const httplib::Request& req, httplib::Response& res) {
            detail::handle_transpile_and_run(cfg, req, res);
        });
        svr.Get("/docker/status", [&cfg](const httplib::Request&, httplib::Response& res) {
            detail::handle_docker_status(cfg, res);
        });
        svr.Post("/docker/pull", [&cfg](const httplib::Request&, httplib::Response& res) {
            detail::handle_docker_pull(cfg, res);
        });
    }

    int service::bind() {
        if (_cfg.port == 0) {
            auto port = _server->bind_to_any_port(_cfg.host);
            if (port < 0) {
                throw std::runtime_error("failed to bind {}:<any>"_format(_cfg.host));
            }
            return port;
        }
        if (!_server->bind_to_port(_cfg.host, _cfg.port)) {
            throw std::runtime_error("failed to bind {}:{}"_format(_cfg.host, _cfg.port));
        }
        return _cfg.port;
    }

    bool service::listen() {
        return _server->listen_after_bind();
    }

    void service::stop() {
        _server->stop();
    }

    void service::wait_until_ready() const {
        _server->wait_until_ready();
    }

    bool service::is_running() const {
        return _server->is_running();
    }

    int run_server(const server_config& cfg) {
        // handled synchronously below; worker threads inherit the blocked mask
        sigset_t signals{};
        ::sigemptyset(&signals);
        ::sigaddset(&signals, SIGINT);
        ::sigaddset(&signals, SIGTERM);
        ::pthread_sigmask(SIG_BLOCK, &signals, nullptr);
        ::signal(SIGPIPE, SIG_IGN);

        service svc{cfg};
        int port = 0;
        try {
            port = svc.bind();
        } catch (const std::runtime_error& e) {
            log::error(e.what());
            return 1;
        }

        log::info("LTSA REST API {} listening on http://{}:{}"_format(version, cfg.host, port));
        log::info("analyzer: {} -jar {}"_format(cfg.runtime_path.string(), cfg.analyzer_path.string()));
        for (auto mode : all_analysis_modes) {
            log::info("  POST {}"_format(route_for(mode)));
        }
        log::info("  POST /transpile, POST /transpile-and-run, GET /docker/status, POST /docker/pull, GET /health");

        std::atomic<bool> stopping{false};
        std::atomic<bool> listen_ok{true};
        std::thread listener{[&] {
            listen_ok = svc.listen();
            if (!stopping) {
                // wake the signal wait below
                ::kill(::getpid(), SIGTERM);
            }
        }};

        int sig = 0;
        ::sigwait(&signals, &sig);
        stopping = true;
        log::info("shutting down (signal {})"_format(sig));

        svc.stop();
        listener.join();
        return listen_ok ? 0 : 1;
    }

}  // namespace anvil::http

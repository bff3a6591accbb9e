#include "utils.hpp"

#include "internal/types.hpp"

#include <httplib.h>

#include <string>
#include <thread>
#include <vector>

namespace anvil::test {

    namespace detail {

        // Serves `cfg` on an ephemeral loopback port for the lifetime of the fixture.
        struct running_service {
            http::service svc;
            int port{};
            std::thread listener{};

            explicit running_service(server_config cfg) : svc{std::move(cfg)} {
                port = svc.bind();
                listener = std::thread{[this] { svc.listen(); }};
                svc.wait_until_ready();
            }

            ~running_service() {
                svc.stop();
                if (listener.joinable()) {
                    listener.join();
                }
            }

            httplib::Client client() const {
                httplib::Client cli{"127.0.0.1", port};
                cli.set_read_timeout(20, 0);
                return cli;
            }
        };

        template <typename T>
        static T parse_json(const std::string& text) {
            T value{};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(value, text);
            INFO(text);
            REQUIRE_FALSE(ec);
            return value;
        }

        static std::string error_of(const httplib::Result& res) {
            return parse_json<internal::error_body>(res->body).error;
        }

        static constexpr auto json = "application/json";

        static constexpr auto single_process_spec =
                R"({"spec": [{"process": "P", "fromState": "0", "toState": "1", "action": "go"}]})";

    }  // namespace detail

    TEST_CASE("008: root lists the endpoints", "[008][http]") {
        detail::temp_dir tmp{"anvil_008_root"};
        detail::running_service server{detail::make_test_config(tmp.path)};
        auto cli = server.client();

        auto res = cli.Get("/");
        REQUIRE(res);
        CHECK(res->status == 200);
        CHECK(res->get_header_value("Content-Type") == "application/json");
        CHECK(res->get_header_value("Access-Control-Allow-Origin") == "*");

        auto body = detail::parse_json<internal::root_response>(res->body);
        CHECK(body.version == "0.1.0");
        REQUIRE(body.endpoints.contains("ltl"));
        CHECK(body.endpoints.at("ltl") == "POST /check/ltl");
        CHECK(body.endpoints.contains("transpile"));
    }

    TEST_CASE("008: service stops on request", "[008][http]") {
        detail::temp_dir tmp{"anvil_008_stop"};
        http::service svc{detail::make_test_config(tmp.path)};

        auto port = svc.bind();
        CHECK(port > 0);

        bool listened = false;
        std::thread listener{[&] { listened = svc.listen(); }};
        svc.wait_until_ready();
        CHECK(svc.is_running());

        svc.stop();
        listener.join();
        CHECK(listened);
        CHECK_FALSE(svc.is_running());
    }

    TEST_CASE("008: health reports each check separately", "[008][http][health]") {
        detail::temp_dir tmp{"anvil_008_health"};
        auto cfg = detail::make_test_config(tmp.path);

        SECTION("healthy") {
            detail::running_service server{cfg};
            auto cli = server.client();

            auto res = cli.Get("/health");
            REQUIRE(res);
            CHECK(res->status == 200);

            auto body = detail::parse_json<internal::health_response>(res->body);
            CHECK(body.status == "healthy");
            CHECK(body.ltsa.ltsp_jar_exists);
            CHECK(body.ltsa.java_available);
            CHECK(body.ltsa.ltsp_jar_path == cfg.analyzer_path.string());
            CHECK_FALSE(body.docker.available);
            CHECK_FALSE(body.docker.go_image_available);
        }

        SECTION("analyzer missing") {
            cfg.analyzer_path = tmp.path / "absent.jar";
            detail::running_service server{cfg};
            auto cli = server.client();

            auto res = cli.Get("/health");
            REQUIRE(res);
            CHECK(res->status == 200);

            auto body = detail::parse_json<internal::health_response>(res->body);
            CHECK(body.status == "unhealthy");
            CHECK_FALSE(body.ltsa.ltsp_jar_exists);
            CHECK(body.ltsa.java_available);
        }
    }

    TEST_CASE("008: analysis endpoints relay the analyzer", "[008][http][analysis]") {
        detail::temp_dir tmp{"anvil_008_analysis"};
        auto cfg = detail::make_test_config(tmp.path);
        detail::running_service server{cfg};
        auto cli = server.client();

        SECTION("parse succeeds") {
            auto res = cli.Post("/parse", R"({"content": "P = (a -> P)."})", detail::json);
            REQUIRE(res);
            CHECK(res->status == 200);
            CHECK(res->body.find(R"("error":null)") != std::string::npos);

            auto body = detail::parse_json<internal::analysis_response>(res->body);
            CHECK(body.success);
            CHECK(body.output == "analysis ok\n");
            CHECK_FALSE(body.error);

            auto args = detail::read_lines(tmp.path / "args.txt");
            CHECK(detail::has_exact_arg(args, "parse"));
            CHECK_FALSE(detail::has_exact_arg(args, "-p"));
            CHECK(detail::read_text_file(tmp.path / "spec.txt") == "P = (a -> P).");
        }

        SECTION("missing process uses the default") {
            auto res = cli.Post("/compile", R"({"content": "P = STOP."})", detail::json);
            REQUIRE(res);
            CHECK(res->status == 200);

            auto args = detail::read_lines(tmp.path / "args.txt");
            CHECK(detail::has_exact_arg(args, "compile"));
            CHECK(detail::has_exact_arg(args, "DEFAULT"));
        }

        SECTION("explicit process and property") {
            auto res = cli.Post(
                    "/check/ltl", R"({"content": "P = STOP.", "process": "SYS", "property": "FAIR"})", detail::json);
            REQUIRE(res);
            CHECK(res->status == 200);

            auto args = detail::read_lines(tmp.path / "args.txt");
            CHECK(detail::has_exact_arg(args, "ltl_property"));
            CHECK(detail::has_exact_arg(args, "SYS"));
            CHECK(detail::has_exact_arg(args, "FAIR"));
        }

        SECTION("safety and progress map to check flags") {
            auto safety = cli.Post("/check/safety", R"({"content": "P = STOP."})", detail::json);
            REQUIRE(safety);
            CHECK(safety->status == 200);
            CHECK(detail::has_exact_arg(detail::read_lines(tmp.path / "args.txt"), "safety"));

            auto progress = cli.Post("/check/progress", R"({"content": "P = STOP."})", detail::json);
            REQUIRE(progress);
            CHECK(progress->status == 200);
            CHECK(detail::has_exact_arg(detail::read_lines(tmp.path / "args.txt"), "progress"));

            auto compose = cli.Post("/compose", R"({"content": "P = STOP."})", detail::json);
            REQUIRE(compose);
            CHECK(compose->status == 200);
            CHECK(detail::has_exact_arg(detail::read_lines(tmp.path / "args.txt"), "compose"));
        }

        SECTION("analyzer failure is not an HTTP error") {
            auto res = cli.Post("/check/safety", R"({"content": "FAIL = STOP."})", detail::json);
            REQUIRE(res);
            CHECK(res->status == 200);

            auto body = detail::parse_json<internal::analysis_response>(res->body);
            CHECK_FALSE(body.success);
            CHECK(body.output == "partial output\n");
            REQUIRE(body.error);
            CHECK(*body.error == "Error: deadlock detected\n");
        }

        // every path removes its specification file
        CHECK(detail::count_entries(cfg.scratch_dir) == 0U);
    }

    TEST_CASE("008: analysis request validation", "[008][http][validation]") {
        detail::temp_dir tmp{"anvil_008_validation"};
        detail::running_service server{detail::make_test_config(tmp.path)};
        auto cli = server.client();

        SECTION("missing content") {
            auto res = cli.Post("/parse", R"({"process": "P"})", detail::json);
            REQUIRE(res);
            CHECK(res->status == 400);
            CHECK(detail::error_of(res) == "content is required");
        }

        SECTION("empty content") {
            auto res = cli.Post("/check/safety", R"({"content": ""})", detail::json);
            REQUIRE(res);
            CHECK(res->status == 400);
            CHECK(detail::error_of(res) == "content is required");
        }

        SECTION("ltl without property") {
            auto res = cli.Post("/check/ltl", R"({"content": "P = STOP."})", detail::json);
            REQUIRE(res);
            CHECK(res->status == 400);
            CHECK(detail::error_of(res) == "property is required");
        }

        SECTION("malformed body") {
            auto res = cli.Post("/parse", "{not json", detail::json);
            REQUIRE(res);
            CHECK(res->status == 400);
            CHECK(detail::error_of(res).starts_with("invalid JSON body"));
        }

        CHECK_FALSE(std::filesystem::exists(tmp.path / "args.txt"));
    }

    TEST_CASE("008: analyzer timeout maps to 408", "[008][http][timeout]") {
        detail::temp_dir tmp{"anvil_008_timeout"};
        auto cfg = detail::make_test_config(tmp.path);
        cfg.analyzer_timeout_ms = 300;
        detail::running_service server{cfg};
        auto cli = server.client();

        auto res = cli.Post("/parse", R"({"content": "HANG = STOP."})", detail::json);
        REQUIRE(res);
        CHECK(res->status == 408);
        CHECK(detail::error_of(res) == "Command execution timed out");
        CHECK(detail::count_entries(cfg.scratch_dir) == 0U);
    }

    TEST_CASE("008: concurrent analyses stay isolated", "[008][http][timeout]") {
        detail::temp_dir tmp{"anvil_008_concurrent"};
        auto cfg = detail::make_test_config(tmp.path);
        cfg.analyzer_timeout_ms = 1'000;
        detail::running_service server{cfg};

        struct outcome {
            int status{};
            std::string body{};
        };

        // ECHO requests are told apart by their index; the analyzer log files are shared, so only bodies count
        std::vector<std::string> contents{
                "ECHO_0 = STOP.",
                "FAIL_1 = STOP.",
                "HANG_2 = STOP.",
                "ECHO_3 = STOP.",
                "FAIL_4 = STOP.",
                "HANG_5 = STOP.",
                "ECHO_6 = STOP.",
        };
        std::vector<outcome> outcomes(contents.size());

        std::vector<std::thread> clients{};
        for (size_t i = 0; i < contents.size(); ++i) {
            clients.emplace_back([&, i] {
                auto cli = server.client();
                std::string body{};
                (void)glz::write_json(internal::analysis_body{.content = contents[i]}, body);
                if (auto res = cli.Post("/parse", body, detail::json)) {
                    outcomes[i] = {.status = res->status, .body = res->body};
                }
            });
        }
        for (auto& t : clients) {
            t.join();
        }

        for (size_t i = 0; i < contents.size(); ++i) {
            INFO(contents[i]);
            const auto& got = outcomes[i];
            if (contents[i].starts_with("HANG")) {
                CHECK(got.status == 408);
                CHECK(detail::parse_json<internal::error_body>(got.body).error == "Command execution timed out");
                continue;
            }

            REQUIRE(got.status == 200);
            auto body = detail::parse_json<internal::analysis_response>(got.body);
            if (contents[i].starts_with("FAIL")) {
                CHECK_FALSE(body.success);
                CHECK(body.output == "partial output\n");
                REQUIRE(body.error);
                CHECK(*body.error == "Error: deadlock detected\n");
            }
            else {
                CHECK(body.success);
                CHECK(body.output.find(contents[i]) != std::string::npos);
                for (size_t j = 0; j < contents.size(); ++j) {
                    if (j != i) {
                        CHECK(body.output.find(contents[j]) == std::string::npos);
                    }
                }
            }
        }

        CHECK(detail::count_entries(cfg.scratch_dir) == 0U);
    }

    TEST_CASE("008: missing runtime maps to 500", "[008][http][unavailable]") {
        detail::temp_dir tmp{"anvil_008_unavailable"};
        auto cfg = detail::make_test_config(tmp.path);
        cfg.runtime_path = tmp.path / "no-such-java";
        detail::running_service server{cfg};
        auto cli = server.client();

        auto res = cli.Post("/parse", R"({"content": "P = STOP."})", detail::json);
        REQUIRE(res);
        CHECK(res->status == 500);
        auto error = detail::error_of(res);
        CHECK(error.find("no-such-java") != std::string::npos);
        CHECK(error.find("ltsp.jar") != std::string::npos);
    }

    TEST_CASE("008: protocol level errors", "[008][http]") {
        detail::temp_dir tmp{"anvil_008_protocol"};
        auto cfg = detail::make_test_config(tmp.path);
        cfg.max_body_bytes = 256;
        detail::running_service server{cfg};
        auto cli = server.client();

        SECTION("unknown route") {
            auto res = cli.Get("/nope");
            REQUIRE(res);
            CHECK(res->status == 404);
            CHECK(detail::error_of(res) == "not found");
        }

        SECTION("oversized body") {
            std::string body = R"({"content": ")" + std::string(1024, 'x') + R"("})";
            auto res = cli.Post("/parse", body, detail::json);
            REQUIRE(res);
            CHECK(res->status == 413);
        }

        SECTION("preflight") {
            auto res = cli.Options("/check/ltl");
            REQUIRE(res);
            CHECK(res->status == 204);
            CHECK(res->get_header_value("Access-Control-Allow-Origin") == "*");
            CHECK(res->get_header_value("Access-Control-Allow-Methods").find("POST") != std::string::npos);
        }
    }

    TEST_CASE("008: transpile endpoint", "[008][http][transpile]") {
        detail::temp_dir tmp{"anvil_008_transpile"};
        detail::running_service server{detail::make_test_config(tmp.path)};
        auto cli = server.client();

        SECTION("flat spec") {
            auto res = cli.Post("/transpile", detail::single_process_spec, detail::json);
            REQUIRE(res);
            CHECK(res->status == 200);

            auto body = detail::parse_json<internal::transpile_response>(res->body);
            CHECK(body.success);
            CHECK(body.go_code.starts_with("package main"));
            CHECK(body.go_code.find("func Process_P(wg *sync.WaitGroup)") != std::string::npos);
            CHECK(body.line_count == utils::count_lines(body.go_code));
        }

        SECTION("missing spec") {
            auto res = cli.Post("/transpile", R"({})", detail::json);
            REQUIRE(res);
            CHECK(res->status == 400);
            CHECK(detail::error_of(res) == "spec is required");
        }

        SECTION("falsy spec") {
            for (auto body : {R"({"spec": ""})", R"({"spec": false})", R"({"spec": 0})", R"({"spec": null})"}) {
                INFO(body);
                auto res = cli.Post("/transpile", body, detail::json);
                REQUIRE(res);
                CHECK(res->status == 400);
                CHECK(detail::error_of(res) == "spec is required");
            }
        }

        SECTION("unrecognised spec") {
            auto res = cli.Post("/transpile", R"({"spec": {"states": []}})", detail::json);
            REQUIRE(res);
            CHECK(res->status == 400);

            auto body = detail::parse_json<internal::failure_response>(res->body);
            CHECK_FALSE(body.success);
            CHECK(body.error.find("processes") != std::string::npos);
        }
    }

    TEST_CASE("008: docker endpoints", "[008][http][docker]") {
        detail::temp_dir tmp{"anvil_008_docker"};
        auto cfg = detail::make_test_config(tmp.path);

        SECTION("docker unavailable") {
            detail::running_service server{cfg};
            auto cli = server.client();

            auto status = cli.Get("/docker/status");
            REQUIRE(status);
            CHECK(status->status == 200);
            auto body = detail::parse_json<internal::docker_status_response>(status->body);
            CHECK_FALSE(body.available);
            CHECK_FALSE(body.go_image_available);

            auto pull = cli.Post("/docker/pull", "", detail::json);
            REQUIRE(pull);
            CHECK(pull->status == 503);

            auto run = cli.Post("/transpile-and-run", detail::single_process_spec, detail::json);
            REQUIRE(run);
            CHECK(run->status == 503);
            auto run_body = detail::parse_json<internal::transpile_run_response>(run->body);
            CHECK_FALSE(run_body.success);
            REQUIRE(run_body.error);
            CHECK(run_body.error->starts_with("Docker is not available"));
        }

        SECTION("image needs pulling") {
            cfg.container_runtime = detail::make_fake_container_runtime(tmp.path);
            detail::running_service server{cfg};
            auto cli = server.client();

            auto run = cli.Post("/transpile-and-run", detail::single_process_spec, detail::json);
            REQUIRE(run);
            CHECK(run->status == 503);

            auto before = detail::parse_json<internal::docker_status_response>(cli.Get("/docker/status")->body);
            CHECK(before.available);
            CHECK_FALSE(before.go_image_available);

            auto pull = cli.Post("/docker/pull", "", detail::json);
            REQUIRE(pull);
            CHECK(pull->status == 200);
            CHECK(detail::parse_json<internal::pull_response>(pull->body).success);

            auto after = detail::parse_json<internal::docker_status_response>(cli.Get("/docker/status")->body);
            CHECK(after.go_image_available);
        }

        SECTION("transpile and run") {
            cfg.container_runtime = detail::make_fake_container_runtime(tmp.path);
            detail::write_text_file(tmp.path / "image-present", "");
            detail::running_service server{cfg};
            auto cli = server.client();

            auto res = cli.Post(
                    "/transpile-and-run",
                    R"({"spec": [{"process": "P", "fromState": "0", "toState": "1", "action": "go"}],
                        "timeoutMs": 5000, "memoryLimit": "64m"})",
                    detail::json);
            REQUIRE(res);
            CHECK(res->status == 200);

            auto body = detail::parse_json<internal::transpile_run_response>(res->body);
            CHECK(body.success);
            REQUIRE(body.go_code);
            CHECK(body.go_code->starts_with("package main"));
            REQUIRE(body.execution);
            CHECK(body.execution->stdout_text == "hello from go\n");
            REQUIRE(body.execution->exit_code);
            CHECK(*body.execution->exit_code == 0);
            CHECK_FALSE(body.execution->timed_out);

            CHECK(detail::read_text_file(tmp.path / "main.go.seen") == *body.go_code);
            CHECK(detail::has_exact_arg(detail::read_lines(tmp.path / "run-args.txt"), "--memory=64m"));
        }

        SECTION("bad spec with docker ready") {
            cfg.container_runtime = detail::make_fake_container_runtime(tmp.path);
            detail::write_text_file(tmp.path / "image-present", "");
            detail::running_service server{cfg};
            auto cli = server.client();

            auto res = cli.Post("/transpile-and-run", R"({"spec": "text"})", detail::json);
            REQUIRE(res);
            CHECK(res->status == 400);
            CHECK_FALSE(std::filesystem::exists(tmp.path / "run-args.txt"));
        }
    }

}  // namespace anvil::test

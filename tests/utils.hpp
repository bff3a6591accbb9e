#pragma once

#include "anvil/anvil.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

extern "C" {
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace anvil::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    inline void write_text_file(const fs::path& path, std::string_view text) {
        std::ofstream out{path};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path};
        REQUIRE(in.good());
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline void make_executable_file(const fs::path& path, std::string_view content) {
        auto parent = path.parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }

        write_text_file(path, content);
        fs::permissions(
                path,
                fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec | fs::perms::group_read |
                        fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                fs::perm_options::replace);
    }

    inline std::vector<std::string> read_lines(const fs::path& path) {
        std::ifstream in{path};
        REQUIRE(in.good());

        std::vector<std::string> lines{};
        std::string line{};
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    inline bool has_exact_arg(const std::vector<std::string>& args, std::string_view token) {
        return std::find(args.begin(), args.end(), token) != args.end();
    }

    inline size_t count_entries(const fs::path& dir) {
        return static_cast<size_t>(std::distance(fs::directory_iterator{dir}, fs::directory_iterator{}));
    }

    /*
     * Stand-in for `java -jar ltsp.jar`: logs one argv entry per line to `<root>/args.txt`, copies
     * the specification file (argv[3]) to `<root>/spec.txt` and answers `-version` probes.
     * Behaviour is steered by the specification text so that each request picks its own outcome:
     *   FAIL   prints to both streams and exits 3
     *   HANG   sleeps past any test timeout
     *   ECHO   prints the specification back and exits 0
     *   otherwise prints "analysis ok" and exits 0
     */
    inline fs::path make_fake_runtime(const fs::path& root) {
        auto script = root / "fake-java";
        make_executable_file(
                script,
                "#!/bin/sh\n"
                "if [ \"$1\" = \"-version\" ]; then\n"
                "  echo 'fake runtime 1.0' >&2\n"
                "  exit 0\n"
                "fi\n"
                ": > \"" + (root / "args.txt").string() + "\"\n"
                "for arg in \"$@\"; do printf '%s\\n' \"$arg\" >> \"" + (root / "args.txt").string() + "\"; done\n"
                "cp \"$3\" \"" + (root / "spec.txt").string() + "\"\n"
                "if grep -q FAIL \"$3\"; then\n"
                "  echo 'partial output'\n"
                "  echo 'Error: deadlock detected' >&2\n"
                "  exit 3\n"
                "fi\n"
                "if grep -q HANG \"$3\"; then\n"
                "  exec sleep 30\n"
                "fi\n"
                "if grep -q ECHO \"$3\"; then\n"
                "  cat \"$3\"\n"
                "  exit 0\n"
                "fi\n"
                "echo 'analysis ok'\n"
                "exit 0\n");
        return script;
    }

    /*
     * Stand-in for the container CLI. `info` fails once `<root>/no-daemon` exists, `image inspect`
     * succeeds once `<root>/image-present` exists (and `pull` creates it), `kill` appends the
     * container name to `<root>/killed.txt`. `run` logs its argv to `<root>/run-args.txt`, copies
     * the mounted main.go to `<root>/main.go.seen`, and then reacts to markers in the source:
     *   SLEEP  hangs past any test timeout
     *   EXIT7  prints to stderr and exits 7
     */
    inline fs::path make_fake_container_runtime(const fs::path& root) {
        auto script = root / "fake-docker";
        make_executable_file(
                script,
                "#!/bin/sh\n"
                "ROOT='" + root.string() + "'\n"
                "cmd=\"$1\"\n"
                "shift\n"
                "case \"$cmd\" in\n"
                "  info)\n"
                "    [ -f \"$ROOT/no-daemon\" ] && exit 1\n"
                "    exit 0 ;;\n"
                "  image)\n"
                "    [ -f \"$ROOT/image-present\" ] && exit 0\n"
                "    echo 'Error: No such image' >&2\n"
                "    exit 1 ;;\n"
                "  pull)\n"
                "    touch \"$ROOT/image-present\"\n"
                "    echo \"pulled $1\"\n"
                "    exit 0 ;;\n"
                "  kill)\n"
                "    echo \"$1\" >> \"$ROOT/killed.txt\"\n"
                "    exit 0 ;;\n"
                "  run)\n"
                "    : > \"$ROOT/run-args.txt\"\n"
                "    src=''\n"
                "    prev=''\n"
                "    for arg in \"$@\"; do\n"
                "      printf '%s\\n' \"$arg\" >> \"$ROOT/run-args.txt\"\n"
                "      if [ \"$prev\" = '-v' ]; then src=\"${arg%%:*}\"; fi\n"
                "      prev=\"$arg\"\n"
                "    done\n"
                "    cp \"$src/main.go\" \"$ROOT/main.go.seen\"\n"
                "    if grep -q SLEEP \"$src/main.go\"; then exec sleep 30; fi\n"
                "    echo 'hello from go'\n"
                "    if grep -q EXIT7 \"$src/main.go\"; then echo 'panic: boom' >&2; exit 7; fi\n"
                "    exit 0 ;;\n"
                "esac\n"
                "exit 2\n");
        return script;
    }

    inline server_config make_test_config(const fs::path& root) {
        server_config cfg{};
        cfg.host = "127.0.0.1";
        cfg.port = 0;
        cfg.runtime_path = make_fake_runtime(root);
        cfg.analyzer_path = root / "ltsp.jar";
        write_text_file(cfg.analyzer_path, "jar");
        cfg.scratch_dir = root / "scratch";
        fs::create_directories(cfg.scratch_dir);
        cfg.analyzer_timeout_ms = 5'000;
        cfg.probe_timeout_ms = 2'000;
        cfg.container_runtime = root / "missing-docker";
        return cfg;
    }

}  // namespace anvil::test::detail

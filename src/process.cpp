#include "anvil/process.hpp"

#include "anvil/format.hpp"
#include "anvil/log.hpp"

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <cerrno>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>

using namespace anvil::literals;

namespace anvil {

    namespace detail {

        using clock = std::chrono::steady_clock;

        static void close_fd(int& fd) {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }

        // close-on-exec so that concurrently spawned children never inherit each other's pipe ends
        static void open_pipe(int (&fds)[2]) {
            if (::pipe2(fds, O_CLOEXEC) != 0) {
                throw std::system_error(errno, std::generic_category(), "pipe2 failed");
            }
        }

        static int remaining_ms(clock::time_point deadline) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
            return left > 0 ? static_cast<int>(left) : 0;
        }

        static int decode_wait_status(int status) {
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return 1;
        }

        static void kill_group(pid_t pid) {
            ::kill(-pid, SIGKILL);
            ::kill(pid, SIGKILL);
        }

        static int reap(pid_t pid) {
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR) {
                    return 1;
                }
            }
            return decode_wait_status(status);
        }

        // Runs in the forked child: only async-signal-safe calls from here on.
        [[noreturn]] static void exec_child(char* const* argv, int stdout_fd, int stderr_fd, int status_fd) {
            ::setpgid(0, 0);

            sigset_t none{};
            ::sigemptyset(&none);
            ::sigprocmask(SIG_SETMASK, &none, nullptr);
            ::signal(SIGPIPE, SIG_DFL);

            int null_fd = ::open("/dev/null", O_RDONLY);
            if (null_fd >= 0) {
                ::dup2(null_fd, STDIN_FILENO);
            }
            if (::dup2(stdout_fd, STDOUT_FILENO) < 0 || ::dup2(stderr_fd, STDERR_FILENO) < 0) {
                int err = errno;
                [[maybe_unused]] auto n = ::write(status_fd, &err, sizeof(err));
                _exit(127);
            }

            ::execvp(argv[0], argv);

            int err = errno;
            [[maybe_unused]] auto n = ::write(status_fd, &err, sizeof(err));
            _exit(127);
        }

        // Blocks until exec succeeded (EOF) or the child reported errno.
        static std::optional<int> read_exec_status(int fd) {
            int child_errno = 0;
            ssize_t n = 0;
            do {
                n = ::read(fd, &child_errno, sizeof(child_errno));
            } while (n < 0 && errno == EINTR);

            if (n == static_cast<ssize_t>(sizeof(child_errno))) {
                return child_errno;
            }
            return std::nullopt;
        }

    }  // namespace detail

    process_result run_process(const std::vector<std::string>& args, int timeout_ms) {
        if (args.empty()) {
            throw std::invalid_argument("run_process requires a program");
        }

        std::vector<char*> argv{};
        argv.reserve(args.size() + 1U);
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        auto started = detail::clock::now();
        auto deadline = started + std::chrono::milliseconds(timeout_ms);

        int stdout_pipe[2]{-1, -1};
        int stderr_pipe[2]{-1, -1};
        int status_pipe[2]{-1, -1};
        auto close_all = [&] {
            for (auto* fds : {stdout_pipe, stderr_pipe, status_pipe}) {
                detail::close_fd(fds[0]);
                detail::close_fd(fds[1]);
            }
        };

        try {
            detail::open_pipe(stdout_pipe);
            detail::open_pipe(stderr_pipe);
            detail::open_pipe(status_pipe);
        } catch (...) {
            close_all();
            throw;
        }

        auto pid = ::fork();
        if (pid < 0) {
            int err = errno;
            close_all();
            throw std::system_error(err, std::generic_category(), "fork failed");
        }

        if (pid == 0) {
            detail::exec_child(argv.data(), stdout_pipe[1], stderr_pipe[1], status_pipe[1]);
        }

        // parent
        ::setpgid(pid, pid);
        detail::close_fd(stdout_pipe[1]);
        detail::close_fd(stderr_pipe[1]);
        detail::close_fd(status_pipe[1]);

        process_result result{};

        if (auto child_errno = detail::read_exec_status(status_pipe[0])) {
            detail::close_fd(status_pipe[0]);
            close_all();
            result.exit_code = detail::reap(pid);
            result.launch_failed = true;
            result.launch_error = "{}: {}"_format(args.front(), std::generic_category().message(*child_errno));
            result.elapsed_ms =
                    std::chrono::duration_cast<std::chrono::milliseconds>(detail::clock::now() - started).count();
            return result;
        }
        detail::close_fd(status_pipe[0]);

        // poll both pipes until EOF or deadline
        pollfd fds[2]{};
        fds[0] = {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0};
        fds[1] = {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0};
        int fds_open = 2;
        int poll_errno = 0;

        while (fds_open > 0) {
            auto remaining = detail::remaining_ms(deadline);
            if (remaining <= 0) {
                result.timed_out = true;
                break;
            }

            int ret = ::poll(fds, 2, remaining);
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                poll_errno = errno;
                break;
            }
            if (ret == 0) {
                result.timed_out = true;
                break;
            }

            char chunk[4096]{};
            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0) {
                    continue;
                }
                if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                    auto n = ::read(fds[i].fd, chunk, sizeof(chunk));
                    if (n > 0) {
                        (i == 0 ? result.stdout_text : result.stderr_text).append(chunk, static_cast<size_t>(n));
                    }
                    else if (n == 0 || errno != EINTR) {
                        detail::close_fd(fds[i].fd);
                        --fds_open;
                    }
                }
            }
        }

        detail::close_fd(fds[0].fd);
        detail::close_fd(fds[1].fd);
        stdout_pipe[0] = -1;
        stderr_pipe[0] = -1;

        // output is closed, but the child may still be running
        if (!result.timed_out && poll_errno == 0) {
            int status = 0;
            for (;;) {
                auto reaped = ::waitpid(pid, &status, WNOHANG);
                if (reaped == pid) {
                    result.exit_code = detail::decode_wait_status(status);
                    break;
                }
                if (reaped < 0 && errno != EINTR) {
                    poll_errno = errno;
                    break;
                }
                if (detail::remaining_ms(deadline) <= 0) {
                    result.timed_out = true;
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            if (!result.timed_out && poll_errno == 0) {
                result.elapsed_ms =
                        std::chrono::duration_cast<std::chrono::milliseconds>(detail::clock::now() - started)
                                .count();
                return result;
            }
        }

        detail::kill_group(pid);
        result.exit_code = detail::reap(pid);
        result.elapsed_ms =
                std::chrono::duration_cast<std::chrono::milliseconds>(detail::clock::now() - started).count();

        if (poll_errno != 0) {
            throw std::system_error(poll_errno, std::generic_category(), "waiting on {} failed"_format(args.front()));
        }
        return result;
    }

    bool probe_process(const std::vector<std::string>& args, int timeout_ms) {
        try {
            return run_process(args, timeout_ms).success();
        } catch (const std::system_error& e) {
            log::warn("probe of ", args.front(), " failed: ", e.what());
            return false;
        }
    }

}  // namespace anvil

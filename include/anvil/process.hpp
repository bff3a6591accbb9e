#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace anvil {

    struct process_result {
        int exit_code{-1};
        std::string stdout_text{};
        std::string stderr_text{};
        bool timed_out{false};
        // exec itself failed (program missing, not executable); exit_code is meaningless then
        bool launch_failed{false};
        std::string launch_error{};
        int64_t elapsed_ms{};

        bool success() const { return !timed_out && !launch_failed && exit_code == 0; }
    };

    /*
     * Runs `args[0]` (resolved through PATH) with `args[1..]`, capturing stdout and stderr.
     * stdin is /dev/null. The child leads its own process group; when `timeout_ms` elapses the
     * whole group is killed and `timed_out` is set. Throws std::system_error when the pipes or
     * the fork cannot be set up, and std::invalid_argument for an empty argument list.
     */
    process_result run_process(const std::vector<std::string>& args, int timeout_ms);

    // True iff the program launched, finished within the timeout and exited 0.
    bool probe_process(const std::vector<std::string>& args, int timeout_ms);

}  // namespace anvil

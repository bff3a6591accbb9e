#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace anvil {

    struct lts_transition {
        std::string from_state{};
        std::string to_state{};
        std::string action{};
    };

    struct lts_process {
        std::string name{};
        std::string initial_state{};
        std::vector<lts_transition> transitions{};
    };

    struct lts_spec {
        std::vector<lts_process> processes{};
    };

    // One row of the flat input format: a transition tagged with its owning process.
    struct flat_transition {
        std::string process{};
        std::string from_state{};
        std::string to_state{};
        std::string action{};
    };

    class transpile_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    /*
     * Groups flat transitions by process in order of first appearance. The initial state of each
     * process is the first source state that is never a target, or that is named after the
     * process (`P`, `P0`) or `0`; failing that, the first source state.
     */
    lts_spec flat_to_spec(const std::vector<flat_transition>& transitions);

    // Accepts either a JSON array of flat transitions or an object with a "processes" array.
    lts_spec parse_lts_json(std::string_view json);

    // Maps anything outside [A-Za-z0-9_] to '_' and guards a leading digit with '_'.
    std::string sanitize_identifier(std::string_view name);

    // Renders `spec` as a Go program: one goroutine per process, one unbuffered channel per shared action.
    std::string transpile(const lts_spec& spec);

}  // namespace anvil

#include "anvil/transpiler.hpp"

#include "anvil/format.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <unordered_map>
#include <unordered_set>

using namespace anvil::literals;
using namespace std::string_view_literals;

namespace anvil::detail {

    struct structured_input {
        std::optional<std::vector<lts_process>> processes{};
    };

    struct action_usage {
        std::set<std::string> processes{};

        // alphabetically-first participant drives the handshake
        const std::string& sender() const { return *processes.begin(); }
        bool shared() const { return processes.size() > 1U; }
    };

}  // namespace anvil::detail

namespace glz {
    template <>
    struct meta<anvil::lts_transition> {
        using T = anvil::lts_transition;
        static constexpr auto value = object("fromState", &T::from_state, "toState", &T::to_state, "action", &T::action);
    };

    template <>
    struct meta<anvil::lts_process> {
        using T = anvil::lts_process;
        static constexpr auto value =
                object("name", &T::name, "initialState", &T::initial_state, "transitions", &T::transitions);
    };

    template <>
    struct meta<anvil::flat_transition> {
        using T = anvil::flat_transition;
        static constexpr auto value = object(
                "process", &T::process, "fromState", &T::from_state, "toState", &T::to_state, "action", &T::action);
    };

    template <>
    struct meta<anvil::detail::structured_input> {
        using T = anvil::detail::structured_input;
        static constexpr auto value = object("processes", &T::processes);
    };
}  // namespace glz

namespace anvil {

    namespace detail {

        static constexpr auto format_hint =
                "expected either an array of flat transitions or an object with a \"processes\" property"sv;

        static constexpr auto banner = "═══════════════════════════════════════════════════════════════"sv;

        static std::string derive_initial_state(std::string_view name, const std::vector<lts_transition>& transitions) {
            if (transitions.empty()) {
                return {};
            }

            std::unordered_set<std::string_view> targets{};
            for (const auto& t : transitions) {
                targets.insert(t.to_state);
            }

            auto numbered = "{}0"_format(name);
            for (const auto& t : transitions) {
                const auto& s = t.from_state;
                if (!targets.contains(s) || s == name || s == numbered || s == "0"sv) {
                    return s;
                }
            }
            return transitions.front().from_state;
        }

        static void validate(const lts_spec& spec) {
            if (spec.processes.empty()) {
                throw transpile_error("LTS specification must contain at least one process");
            }
            for (const auto& proc : spec.processes) {
                if (proc.name.empty()) {
                    throw transpile_error("every process needs a name");
                }
                for (const auto& t : proc.transitions) {
                    if (t.from_state.empty() || t.to_state.empty() || t.action.empty()) {
                        throw transpile_error(
                                "process {} has a transition without fromState, toState or action"_format(proc.name));
                    }
                }
            }
        }

        // Escapes text for use inside a Go interpreted string literal; `for_printf` additionally doubles '%'.
        static std::string go_escape(std::string_view text, bool for_printf = false) {
            std::string out{};
            out.reserve(text.size());
            for (char c : text) {
                switch (c) {
                    case '\\':
                        out += "\\\\";
                        break;
                    case '"':
                        out += "\\\"";
                        break;
                    case '\n':
                        out += "\\n";
                        break;
                    case '\t':
                        out += "\\t";
                        break;
                    case '\r':
                        out += "\\r";
                        break;
                    case '%':
                        out += for_printf ? "%%" : "%";
                        break;
                    default:
                        out += c;
                }
            }
            return out;
        }

        // Line comments end at the first line break, so names are flattened onto one line.
        static std::string go_comment(std::string_view text) {
            std::string out{text};
            std::ranges::replace(out, '\n', ' ');
            std::ranges::replace(out, '\r', ' ');
            return out;
        }

        static std::string channel_name(std::string_view action) {
            return "ch_{}"_format(sanitize_identifier(action));
        }

        static std::string func_name(std::string_view process) {
            return "Process_{}"_format(sanitize_identifier(process));
        }

        static std::string state_literal(std::string_view process, std::string_view state) {
            return "\"{}_{}\""_format(go_escape(process), go_escape(state));
        }

        static std::map<std::string, action_usage> analyze_action_usage(const lts_spec& spec) {
            std::map<std::string, action_usage> usage{};
            for (const auto& proc : spec.processes) {
                for (const auto& t : proc.transitions) {
                    usage[t.action].processes.insert(proc.name);
                }
            }
            return usage;
        }

        // Distinct names must stay distinct once mapped onto Go identifiers.
        static void check_identifiers(const lts_spec& spec, const std::map<std::string, action_usage>& usage) {
            std::map<std::string, std::string_view> functions{};
            for (const auto& proc : spec.processes) {
                auto [it, inserted] = functions.try_emplace(func_name(proc.name), proc.name);
                if (!inserted) {
                    throw transpile_error("processes {} and {} map to the same Go function {}"_format(
                            it->second, proc.name, it->first));
                }
            }

            std::map<std::string, std::string_view> channels{};
            for (const auto& [action, info] : usage) {
                if (!info.shared()) {
                    continue;
                }
                auto [it, inserted] = channels.try_emplace(channel_name(action), action);
                if (!inserted) {
                    throw transpile_error(
                            "actions {} and {} map to the same Go channel {}"_format(it->second, action, it->first));
                }
            }
        }

        static void write_header(std::ostringstream& out) {
            out << "package main\n\n";
            out << "import (\n";
            out << "\t\"fmt\"\n";
            out << "\t\"sync\"\n";
            out << ")\n\n";
        }

        static void write_channels(std::ostringstream& out, const std::map<std::string, action_usage>& usage) {
            bool any_shared = std::ranges::any_of(usage, [](const auto& entry) { return entry.second.shared(); });
            if (!any_shared) {
                return;
            }

            out << "// Channels for action synchronization (shared actions only)\n";
            out << "var (\n";
            for (const auto& [action, info] : usage) {
                if (info.shared()) {
                    out << '\t' << channel_name(action) << " = make(chan struct{}) // shared action: "
                        << go_comment(action) << '\n';
                }
            }
            out << ")\n\n";
        }

        static void write_step(
                std::ostringstream& out,
                std::string_view indent,
                const lts_process& proc,
                std::string_view state,
                const lts_transition& t) {
            out << indent << "fmt.Printf(\"[" << go_escape(proc.name, true) << "] action: " << go_escape(t.action, true)
                << " (" << go_escape(state, true) << " -> " << go_escape(t.to_state, true) << ")\\n\")\n";
            out << indent << "state = " << state_literal(proc.name, t.to_state) << '\n';
        }

        static void write_state_case(
                std::ostringstream& out,
                const lts_process& proc,
                const std::string& state,
                const std::vector<const lts_transition*>& outgoing,
                const std::map<std::string, action_usage>& usage) {
            out << "\t\tcase " << state_literal(proc.name, state) << ":\n";

            if (outgoing.empty() || state == "STOP"sv) {
                out << "\t\t\tfmt.Printf(\"[" << go_escape(proc.name, true)
                    << "] Reached terminal state: " << go_escape(state, true) << "\\n\")\n";
                out << "\t\t\treturn\n";
                return;
            }

            if (outgoing.size() == 1U) {
                const auto& t = *outgoing.front();
                const auto& info = usage.at(t.action);
                if (info.shared()) {
                    auto ch = channel_name(t.action);
                    if (info.sender() == proc.name) {
                        out << "\t\t\t" << ch << " <- struct{}{} // send: " << go_comment(t.action) << '\n';
                    }
                    else {
                        out << "\t\t\t<-" << ch << " // receive: " << go_comment(t.action) << '\n';
                    }
                }
                write_step(out, "\t\t\t"sv, proc, state, t);
                return;
            }

            bool any_shared = std::ranges::any_of(
                    outgoing, [&usage](const lts_transition* t) { return usage.at(t->action).shared(); });

            if (!any_shared) {
                // no partner to synchronise with: the first listed choice is taken
                std::vector<std::string> labels{};
                for (const auto* t : outgoing) {
                    labels.push_back(go_comment(t->action));
                }
                out << "\t\t\t// Non-deterministic choice (picking first option): "
                    << utils::join_with_separator(labels, " | ") << '\n';
                write_step(out, "\t\t\t"sv, proc, state, *outgoing.front());
                return;
            }

            // a select takes one default at most; further local choices are dropped like the all-local case
            bool has_default = false;
            out << "\t\t\tselect {\n";
            for (const auto* t : outgoing) {
                const auto& info = usage.at(t->action);
                auto ch = channel_name(t->action);
                if (!info.shared()) {
                    if (has_default) {
                        continue;
                    }
                    has_default = true;
                    out << "\t\t\tdefault: // non-shared action: " << go_comment(t->action) << '\n';
                }
                else if (info.sender() == proc.name) {
                    out << "\t\t\tcase " << ch << " <- struct{}{}: // send: " << go_comment(t->action) << '\n';
                }
                else {
                    out << "\t\t\tcase <-" << ch << ": // receive: " << go_comment(t->action) << '\n';
                }
                write_step(out, "\t\t\t\t"sv, proc, state, *t);
            }
            out << "\t\t\t}\n";
        }

        static void write_process(
                std::ostringstream& out, const lts_process& proc, const std::map<std::string, action_usage>& usage) {
            std::map<std::string, std::vector<const lts_transition*>> outgoing{};
            for (const auto& t : proc.transitions) {
                outgoing[t.from_state].push_back(&t);
                outgoing.try_emplace(t.to_state);
            }

            auto initial = proc.initial_state.empty() ? derive_initial_state(proc.name, proc.transitions)
                                                      : proc.initial_state;
            // a process without transitions stops in its initial state
            outgoing.try_emplace(initial);
            auto fn = func_name(proc.name);

            out << "// " << fn << " implements the " << go_comment(proc.name) << " process\n";
            out << "func " << fn << "(wg *sync.WaitGroup) {\n";
            out << "\tdefer wg.Done()\n";
            out << "\tfmt.Printf(\"[" << go_escape(proc.name, true) << "] Starting...\\n\")\n\n";
            out << "\tstate := " << state_literal(proc.name, initial) << "\n\n";
            out << "\tfor {\n";
            out << "\t\tswitch state {\n";

            for (const auto& [state, transitions] : outgoing) {
                write_state_case(out, proc, state, transitions, usage);
            }

            out << "\t\tdefault:\n";
            out << "\t\t\tfmt.Printf(\"[" << go_escape(proc.name, true) << "] Unknown state: %s\\n\", state)\n";
            out << "\t\t\treturn\n";
            out << "\t\t}\n";
            out << "\t}\n";
            out << "}\n\n";
        }

        static void write_main(std::ostringstream& out, const lts_spec& spec) {
            out << "func main() {\n";
            out << "\tfmt.Println(\"" << banner << "\")\n";
            out << "\tfmt.Println(\"  LTS Execution Started\")\n";
            out << "\tfmt.Println(\"" << banner << "\")\n";
            out << "\tfmt.Println()\n\n";
            out << "\tvar wg sync.WaitGroup\n\n";
            out << "\twg.Add(" << spec.processes.size() << ")\n\n";
            out << "\t// Launch process goroutines\n";
            for (const auto& proc : spec.processes) {
                out << "\tgo " << func_name(proc.name) << "(&wg)\n";
            }
            out << "\n\t// Wait for all processes to complete\n";
            out << "\twg.Wait()\n\n";
            out << "\tfmt.Println()\n";
            out << "\tfmt.Println(\"" << banner << "\")\n";
            out << "\tfmt.Println(\"  LTS Execution Complete\")\n";
            out << "\tfmt.Println(\"" << banner << "\")\n";
            out << "}\n";
        }

    }  // namespace detail

    lts_spec flat_to_spec(const std::vector<flat_transition>& transitions) {
        lts_spec spec{};
        std::unordered_map<std::string, size_t> index{};

        for (const auto& t : transitions) {
            auto [it, inserted] = index.try_emplace(t.process, spec.processes.size());
            if (inserted) {
                spec.processes.push_back(lts_process{.name = t.process});
            }
            spec.processes[it->second].transitions.push_back(
                    lts_transition{.from_state = t.from_state, .to_state = t.to_state, .action = t.action});
        }

        for (auto& proc : spec.processes) {
            proc.initial_state = detail::derive_initial_state(proc.name, proc.transitions);
        }
        return spec;
    }

    lts_spec parse_lts_json(std::string_view json) {
        std::string buffer{json};
        auto body = utils::trim_view(buffer);

        if (body.starts_with('[')) {
            std::vector<flat_transition> flat{};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(flat, buffer);
            if (ec) {
                throw transpile_error("invalid flat transition list: {}"_format(glz::format_error(ec, buffer)));
            }
            return flat_to_spec(flat);
        }

        if (body.starts_with('{')) {
            detail::structured_input input{};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(input, buffer);
            if (ec) {
                throw transpile_error("invalid LTS specification: {}"_format(glz::format_error(ec, buffer)));
            }
            if (!input.processes) {
                throw transpile_error("invalid spec format: {}"_format(detail::format_hint));
            }
            return lts_spec{.processes = std::move(*input.processes)};
        }

        throw transpile_error("invalid spec format: {}"_format(detail::format_hint));
    }

    std::string sanitize_identifier(std::string_view name) {
        std::string out{};
        out.reserve(name.size() + 1U);
        if (!name.empty() && name.front() >= '0' && name.front() <= '9') {
            out += '_';
        }
        for (char c : name) {
            bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
            out += keep ? c : '_';
        }
        return out;
    }

    std::string transpile(const lts_spec& spec) {
        detail::validate(spec);

        auto usage = detail::analyze_action_usage(spec);
        detail::check_identifiers(spec, usage);

        std::ostringstream out{};
        detail::write_header(out);
        detail::write_channels(out, usage);
        for (const auto& proc : spec.processes) {
            detail::write_process(out, proc, usage);
        }
        detail::write_main(out, spec);
        return out.str();
    }

}  // namespace anvil

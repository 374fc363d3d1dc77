#include "galley/cli.hpp"

#include "galley/format.hpp"
#include "galley/mcp.hpp"
#include "galley/process.hpp"

#include "editor.hpp"

#include <CLI/CLI.hpp>

#include <unistd.h>

#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace galley::literals;

namespace galley::cli { namespace detail {

    using namespace std::string_view_literals;

    struct code_balance_state {
        int paren_depth{0};
        int brace_depth{0};
        int bracket_depth{0};

        bool in_single_quote{false};
        bool in_double_quote{false};
        bool escape_next{false};
        bool in_line_comment{false};
        bool in_block_comment{false};
    };

}}  // namespace galley::cli::detail

namespace galley::cli {

    namespace detail {

        static constexpr void update_depth(int& depth, int delta) {
            depth += delta;
            if (depth < 0) {
                depth = 0;
            }
        }

        static constexpr bool consume_quoted(code_balance_state& state, bool& in_quote, char quote, char c) {
            if (state.escape_next) {
                state.escape_next = false;
                return true;
            }
            if (c == '\\') {
                state.escape_next = true;
                return true;
            }
            if (c == quote) {
                in_quote = false;
            }
            return true;
        }

        // Tracks brackets, quotes and comments across the lines of one REPL cell.
        static constexpr void update_code_balance_state(code_balance_state& state, std::string_view line) {
            std::size_t i = 0U;
            while (i < line.size()) {
                auto c = line[i];
                auto next = (i + 1U < line.size()) ? line[i + 1U] : '\0';

                if (state.in_block_comment) {
                    if (c == '*' && next == '/') {
                        state.in_block_comment = false;
                        i += 2U;
                        continue;
                    }
                    ++i;
                    continue;
                }
                if (state.in_single_quote) {
                    (void)consume_quoted(state, state.in_single_quote, '\'', c);
                    ++i;
                    continue;
                }
                if (state.in_double_quote) {
                    (void)consume_quoted(state, state.in_double_quote, '"', c);
                    ++i;
                    continue;
                }

                if (c == '/' && next == '/') {
                    break;
                }
                if (c == '/' && next == '*') {
                    state.in_block_comment = true;
                    i += 2U;
                    continue;
                }
                if (c == '\'') {
                    state.in_single_quote = true;
                }
                else if (c == '"') {
                    state.in_double_quote = true;
                }
                else if (c == '(' || c == ')') {
                    update_depth(state.paren_depth, c == '(' ? 1 : -1);
                }
                else if (c == '{' || c == '}') {
                    update_depth(state.brace_depth, c == '{' ? 1 : -1);
                }
                else if (c == '[' || c == ']') {
                    update_depth(state.bracket_depth, c == '[' ? 1 : -1);
                }
                ++i;
            }

            // a line continuation inside a quoted string ends with the backslash
            if (state.escape_next) {
                state.escape_next = false;
                return;
            }
            state.in_single_quote = false;
            state.in_double_quote = false;
        }

        static constexpr bool cell_is_complete(const code_balance_state& state) {
            return state.paren_depth == 0 && state.brace_depth == 0 && state.bracket_depth == 0 &&
                   !state.in_single_quote && !state.in_double_quote && !state.in_block_comment;
        }

        static bool use_color(const startup_config& cfg) {
            switch (cfg.color) {
                case color_mode::always:
                    return true;
                case color_mode::never:
                    return false;
                case color_mode::automatic:
                    break;
            }
            return ::isatty(STDERR_FILENO) == 1;
        }

        static void print_config(const startup_config& cfg, std::ostream& os) {
            os << "hosts=" << (cfg.host_endpoints.empty() ? "<none>" : utils::join_with_separator(cfg.host_endpoints, ","))
               << '\n';
            os << "require_document=" << (cfg.require_document ? "true" : "false") << '\n';
            os << "slow_call_ms=" << cfg.slow_call_ms << '\n';
            os << "undo_name=" << cfg.undo_name << '\n';
            os << "undo_mode=" << to_string(cfg.undo) << '\n';
            os << "history_file=" << cfg.history_file.string() << '\n';
            os << "history=" << (cfg.history_enabled ? "on" : "off") << '\n';
            os << "color=" << to_string(cfg.color) << '\n';
            os << "config_file=" << (cfg.config_file ? cfg.config_file->string() : "<none>") << '\n';
        }

        static void print_outcome(const execution_outcome& outcome, const startup_config& cfg) {
            if (outcome.ok()) {
                std::cout << *outcome.encoded_result << '\n';
                if (cfg.verbose) {
                    std::cout << "({}ms)\n"_format(outcome.elapsed.count());
                }
                return;
            }

            auto prefix = use_color(cfg) ? "\x1b[31merror\x1b[0m"sv : "error"sv;
            std::cerr << prefix << ": " << outcome.fault_name << ": " << outcome.fault_description.value_or("");
            if (outcome.fault_line >= 0) {
                std::cerr << " (line " << outcome.fault_line << ')';
            }
            std::cerr << '\n';
        }

        static bool apply_set_command(
                startup_config& cfg, envelope& env, std::string_view assignment, std::ostream& err) {
            auto eq = assignment.find('=');
            if (eq == std::string_view::npos) {
                err << "invalid :set, expected key=value\n";
                return false;
            }

            auto key = utils::trim_view(assignment.substr(0, eq));
            auto value = utils::trim_view(assignment.substr(eq + 1U));
            if (key.empty() || value.empty()) {
                err << "invalid :set, key and value must be non-empty\n";
                return false;
            }

            if (key == "undo_mode"sv || key == "undo"sv) {
                if (!try_parse_undo_mode(value, cfg.undo)) {
                    err << "invalid undo_mode: " << value << " (expected none|entire|fast_entire_script|script_request)\n";
                    return false;
                }
                return true;
            }

            if (key == "undo_name"sv) {
                cfg.undo_name = std::string(value);
                return true;
            }

            if (key == "slow_call_ms"sv) {
                auto ms = utils::parse_arithmetic<int>(value);
                if (!ms || *ms < 1) {
                    err << "invalid slow_call_ms: " << value << " (expected a positive integer)\n";
                    return false;
                }
                cfg.slow_call_ms = *ms;
                env.set_slow_call_ms(*ms);
                return true;
            }

            err << "unknown :set key: " << key << '\n';
            return false;
        }

        static void print_help(std::ostream& os) {
            static constexpr auto help_text = R"(commands:
  :help
  :show config
  :set <key>=<value>      keys: undo_mode, undo_name, slow_call_ms
  :eval <expression>      evaluate without creating an undo step
  :doc                    summarize the active document
  :selection [basic|full]
  :undo [n]               undo the n most recent undo steps (1..50)
  :status
  :disconnect
  :quit
anything else is sent to the host as a script once brackets and quotes balance;
assign to __result to see a value.
examples:
  app.activeDocument.pages.length
  __result = app.activeDocument.name;
  :set undo_mode=none
  :undo 2
)";
            os << help_text;
        }

        static bool matches_command(std::string_view cmd, std::string_view name) {
            if (!cmd.starts_with(name)) {
                return false;
            }
            if (cmd.size() == name.size()) {
                return true;
            }
            auto next = cmd[name.size()];
            return next == ' ' || next == '\t';
        }

        static std::optional<std::string_view> command_argument(std::string_view cmd, std::string_view name) {
            if (!matches_command(cmd, name)) {
                return std::nullopt;
            }
            return std::optional<std::string_view>{utils::trim_view(cmd.substr(name.size()))};
        }

        static void print_status(const startup_config& cfg, session& s) {
            std::cout << "endpoints: "
                      << (cfg.host_endpoints.empty() ? "<none>" : utils::join_with_separator(cfg.host_endpoints, ", "))
                      << '\n';
            if (!s.connected()) {
                std::cout << "connected: no\n";
                return;
            }
            try {
                auto name = s.application_name();
                std::cout << "connected: yes (" << name << ")\n";
            } catch (const std::runtime_error& e) {
                std::cout << "connected: no (" << e.what() << ")\n";
            }
        }

        static bool process_command(
                const std::string& line, startup_config& cfg, session& s, envelope& env, bool& should_quit) {
            auto cmd = utils::trim_view(line);
            if (cmd == ":quit"sv || cmd == ":q"sv) {
                should_quit = true;
                return true;
            }
            if (cmd == ":help"sv) {
                print_help(std::cout);
                return true;
            }
            if (auto show_arg = command_argument(cmd, ":show"sv)) {
                if (*show_arg == "config"sv) {
                    print_config(cfg, std::cout);
                }
                else {
                    std::cerr << "invalid :show, expected config\n";
                }
                return true;
            }
            if (auto assignment = command_argument(cmd, ":set"sv)) {
                if (apply_set_command(cfg, env, *assignment, std::cerr)) {
                    std::cout << "updated " << *assignment << '\n';
                }
                return true;
            }
            if (auto expr = command_argument(cmd, ":eval"sv)) {
                print_outcome(env.evaluate_expression(*expr), cfg);
                return true;
            }
            if (cmd == ":doc"sv) {
                print_outcome(env.document_info(), cfg);
                return true;
            }
            if (auto level_arg = command_argument(cmd, ":selection"sv)) {
                auto level = selection_detail::basic;
                if (!level_arg->empty() && !try_parse_selection_detail(*level_arg, level)) {
                    std::cerr << "invalid :selection, expected basic|full\n";
                    return true;
                }
                print_outcome(env.selection(level), cfg);
                return true;
            }
            if (auto steps_arg = command_argument(cmd, ":undo"sv)) {
                auto steps = steps_arg->empty() ? std::optional<int>{1} : utils::parse_arithmetic<int>(*steps_arg);
                if (!steps) {
                    std::cerr << "invalid :undo, expected a step count\n";
                    return true;
                }
                print_outcome(env.rollback(*steps), cfg);
                return true;
            }
            if (cmd == ":status"sv) {
                print_status(cfg, s);
                return true;
            }
            if (cmd == ":disconnect"sv) {
                s.disconnect();
                std::cout << "disconnected\n";
                return true;
            }
            if (cmd.starts_with(":"sv)) {
                std::cerr << "unknown command: " << cmd << '\n';
                return true;
            }
            return false;
        }

        static std::string read_all_stdin() {
            return std::string{std::istreambuf_iterator<char>{std::cin}, std::istreambuf_iterator<char>{}};
        }

    }  // namespace detail

    int run_once(envelope& env, std::string_view script, const startup_config& cfg) {
        auto outcome = env.submit(execution_request{.script = std::string{script}, .undo_name = cfg.undo_name, .mode = cfg.undo});
        std::cout << outcome.to_json() << '\n';
        return outcome.ok() ? 0 : 1;
    }

    void run_repl(startup_config& cfg, session& s, envelope& env) {
        line_editor editor{cfg};
        std::string line{};
        std::string pending_cell{};
        detail::code_balance_state balance{};
        bool should_quit = false;

        if (!cfg.quiet) {
            std::cout << "galley " << galley_version << '\n';
            std::cout << "type :help for commands\n";
        }

        while (!should_quit) {
            std::string_view prompt = pending_cell.empty() ? "galley> "sv : "...> "sv;
            auto next_line = editor.read_line(prompt);
            if (!next_line) {
                if (!pending_cell.empty()) {
                    std::cerr << "warning: discarding incomplete cell at EOF\n";
                }
                std::cout << '\n';
                break;
            }
            line = std::move(*next_line);

            if (line.empty()) {
                if (!pending_cell.empty()) {
                    pending_cell.push_back('\n');
                }
                continue;
            }

            editor.record_history(line);

            if (pending_cell.empty() && detail::process_command(line, cfg, s, env, should_quit)) {
                continue;
            }

            if (!pending_cell.empty()) {
                pending_cell.push_back('\n');
            }
            pending_cell += line;
            detail::update_code_balance_state(balance, line);

            if (!detail::cell_is_complete(balance)) {
                continue;
            }

            detail::print_outcome(
                    env.submit(execution_request{.script = pending_cell, .undo_name = cfg.undo_name, .mode = cfg.undo}),
                    cfg);
            pending_cell.clear();
            balance = detail::code_balance_state{};
        }
    }

    int run(startup_config& cfg) {
        session s{
                std::make_unique<process_connector>(cfg.host_endpoints),
                session_options{.require_document = cfg.require_document, .quiet = cfg.quiet}};
        envelope env{s, envelope_options{.slow_call_ms = cfg.slow_call_ms, .quiet = cfg.quiet}};

        if (cfg.mcp) {
            return mcp::run_mcp_server(env, cfg);
        }
        if (cfg.eval_script) {
            auto script = *cfg.eval_script == "-"sv ? detail::read_all_stdin() : *cfg.eval_script;
            return run_once(env, script, cfg);
        }

        run_repl(cfg, s, env);
        return 0;
    }

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"galley: undo-safe script execution for a desktop automation host"};

        bool show_version = false;
        bool no_history = false;
        bool allow_no_document = false;
        std::vector<std::string> host_args{};
        std::string config_arg{};
        std::string eval_arg{};
        std::string undo_name_arg{};
        std::string undo_mode_arg{};
        std::string color_arg{};
        std::string history_file_arg{};
        int slow_call_ms_arg{0};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--host", host_args, "Host endpoint: unix:<socket> or a host command (repeatable, tried in order)");
        app.add_option("--config", config_arg, "JSON config file applied before command line options");
        app.add_flag("--mcp", cfg.mcp, "Serve MCP tools over stdio");
        app.add_option("--eval", eval_arg, "Submit one script ('-' reads stdin), print the outcome and exit");
        app.add_option("--undo-name", undo_name_arg, "Label of the undo step for grouped scripts");
        app.add_option("--undo-mode", undo_mode_arg, "Undo grouping: entire|fast_entire_script|script_request|none");
        app.add_option("--slow-call-ms", slow_call_ms_arg, "Warn when one host call exceeds this many milliseconds");
        app.add_flag("--allow-no-document", allow_no_document, "Run scripts even when no document is open");
        app.add_option("--history-file", history_file_arg, "Persistent REPL history path");
        app.add_flag("--no-history", no_history, "Disable persistent REPL history");
        app.add_option("--color", color_arg, "Color mode: auto|always|never");
        app.add_flag("--no-color", "Force color mode to never");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress non-essential output");
        app.add_flag("--verbose", cfg.verbose, "Enable verbose output");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << "galley " << galley_version << '\n';
            return std::optional<int>{0};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }
        if (cfg.mcp && app.count("--eval") > 0U) {
            std::cerr << "--mcp and --eval are mutually exclusive\n";
            return std::optional<int>{2};
        }

        if (app.count("--config") > 0U) {
            cfg.config_file = config_arg;
            try {
                apply_config_file(*cfg.config_file, cfg);
            } catch (const std::runtime_error& e) {
                std::cerr << "invalid --config: " << e.what() << '\n';
                return std::optional<int>{2};
            }
        }
        apply_environment(cfg);

        if (!host_args.empty()) {
            cfg.host_endpoints = std::move(host_args);
        }
        if (app.count("--eval") > 0U) {
            cfg.eval_script = eval_arg;
        }
        if (app.count("--undo-name") > 0U) {
            if (utils::trim_view(undo_name_arg).empty()) {
                std::cerr << "invalid --undo-name: must be non-empty\n";
                return std::optional<int>{2};
            }
            cfg.undo_name = undo_name_arg;
        }
        if (app.count("--undo-mode") > 0U && !try_parse_undo_mode(undo_mode_arg, cfg.undo)) {
            std::cerr << "invalid --undo-mode value: " << undo_mode_arg
                      << " (expected entire|fast_entire_script|script_request|none)\n";
            return std::optional<int>{2};
        }
        if (app.count("--slow-call-ms") > 0U) {
            if (slow_call_ms_arg < 1) {
                std::cerr << "invalid --slow-call-ms value: " << slow_call_ms_arg << " (expected a positive integer)\n";
                return std::optional<int>{2};
            }
            cfg.slow_call_ms = slow_call_ms_arg;
        }
        if (allow_no_document) {
            cfg.require_document = false;
        }
        if (app.count("--history-file") > 0U) {
            cfg.history_file = history_file_arg;
        }
        if (no_history) {
            cfg.history_enabled = false;
        }
        if (app.count("--color") > 0U && !try_parse_color_mode(color_arg, cfg.color)) {
            std::cerr << "invalid --color value: " << color_arg << " (expected auto|always|never)\n";
            return std::optional<int>{2};
        }
        if (app.get_option("--no-color")->count() > 0U) {
            cfg.color = color_mode::never;
        }

        if (cfg.print_config) {
            detail::print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

}  // namespace galley::cli

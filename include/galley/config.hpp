#pragma once

#include "utils.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace galley {

    using namespace std::string_view_literals;

    /*
     * Galley Startup Config Options
     *
     * Host link
     * - host_endpoints: Ordered endpoints to reach the host. "unix:<path>" attaches to a
     *   running host over a UNIX socket; anything else is a command line launched as a
     *   persistent child speaking the host link protocol on stdin/stdout.
     * - require_document: Treat a host without an open document as unreachable.
     * - slow_call_ms: Warn when one host round trip exceeds this budget. Calls are never
     *   aborted; the host has no safe cancellation.
     *
     * Script defaults
     * - undo_name: Label of the undo step created for grouped submissions.
     * - undo: Grouping mode used when a submission does not name one.
     *
     * Session and UX
     * - history_file: Path to persisted interactive command history.
     * - history_enabled: Enable/disable persistent history writes.
     * - color_mode: ANSI color behavior for terminal output.
     * - quiet/verbose: Coarse output verbosity knobs for app logs.
     *
     * Entry points
     * - mcp: Serve the MCP tool surface over stdio instead of the REPL.
     * - eval_script: Submit one script, print the outcome and exit.
     * - config_file: Optional JSON file applied before command line overrides.
     * - print_config: Print resolved startup config and exit.
     */

    enum class undo_mode : uint8_t { none, entire, fast_entire_script, script_request };
    enum class color_mode { automatic, always, never };
    enum class selection_detail : uint8_t { basic, full };

    inline constexpr std::string_view to_string(undo_mode mode) {
        switch (mode) {
            case undo_mode::none:
                return "none"sv;
            case undo_mode::entire:
                return "entire"sv;
            case undo_mode::fast_entire_script:
                return "fast_entire_script"sv;
            case undo_mode::script_request:
                return "script_request"sv;
        }
        return "entire"sv;
    }

    inline constexpr bool try_parse_undo_mode(std::string_view text, undo_mode& out) {
        if (utils::str_case_eq(text, "none"sv)) {
            out = undo_mode::none;
            return true;
        }
        if (utils::str_case_eq(text, "entire"sv) || utils::str_case_eq(text, "entire_script"sv)) {
            out = undo_mode::entire;
            return true;
        }
        if (utils::str_case_eq(text, "fast_entire_script"sv) || utils::str_case_eq(text, "fast"sv)) {
            out = undo_mode::fast_entire_script;
            return true;
        }
        if (utils::str_case_eq(text, "script_request"sv) || utils::str_case_eq(text, "auto"sv)) {
            out = undo_mode::script_request;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view to_string(color_mode mode) {
        switch (mode) {
            case color_mode::automatic:
                return "auto"sv;
            case color_mode::always:
                return "always"sv;
            case color_mode::never:
                return "never"sv;
        }
        return "auto"sv;
    }

    inline constexpr bool try_parse_color_mode(std::string_view text, color_mode& out) {
        if (utils::str_case_eq(text, "auto"sv)) {
            out = color_mode::automatic;
            return true;
        }
        if (utils::str_case_eq(text, "always"sv)) {
            out = color_mode::always;
            return true;
        }
        if (utils::str_case_eq(text, "never"sv)) {
            out = color_mode::never;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view to_string(selection_detail detail) {
        switch (detail) {
            case selection_detail::basic:
                return "basic"sv;
            case selection_detail::full:
                return "full"sv;
        }
        return "basic"sv;
    }

    inline constexpr bool try_parse_selection_detail(std::string_view text, selection_detail& out) {
        if (utils::str_case_eq(text, "basic"sv)) {
            out = selection_detail::basic;
            return true;
        }
        if (utils::str_case_eq(text, "full"sv)) {
            out = selection_detail::full;
            return true;
        }
        return false;
    }

    inline constexpr auto galley_version = "0.1.0"sv;

    inline constexpr auto default_undo_name = "Agent Script"sv;
    inline constexpr int default_slow_call_ms = 30'000;

    struct startup_config {
        std::vector<std::string> host_endpoints{};
        bool require_document{true};
        int slow_call_ms{default_slow_call_ms};

        std::string undo_name{default_undo_name};
        undo_mode undo{undo_mode::entire};

        std::filesystem::path history_file{".galley/history"};
        bool history_enabled{true};
        color_mode color{color_mode::automatic};
        bool quiet{false};
        bool verbose{false};

        bool mcp{false};
        std::optional<std::string> eval_script{};
        std::optional<std::filesystem::path> config_file{};
        bool print_config{false};
    };

    // Applies a JSON config file (glaze) on top of cfg. Throws std::runtime_error when the
    // file cannot be read, does not parse, or carries an unsupported schema_version.
    void apply_config_file(const std::filesystem::path& path, startup_config& cfg);

    // GALLEY_SLOW_CALL_MS overrides the slow call budget when set to a positive integer.
    void apply_environment(startup_config& cfg);

}  // namespace galley

#include "editor.hpp"

extern "C" {
#include <isocline.h>
}

#include <filesystem>
#include <string_view>

namespace galley::cli { namespace detail {

    using namespace std::string_view_literals;

    static const char* command_completions[] = {
            ":help",
            ":show",
            ":set",
            ":eval",
            ":doc",
            ":selection",
            ":undo",
            ":status",
            ":disconnect",
            ":quit",
            ":q",
            nullptr};

    static const char* show_completions[] = {"config", nullptr};
    static const char* set_completions[] = {"undo_mode=", "undo_name=", "slow_call_ms=", nullptr};
    static const char* selection_completions[] = {"basic", "full", nullptr};

    static constexpr std::string_view trim_left(std::string_view value) {
        auto start = value.find_first_not_of(" \t\r\n");
        if (start == std::string_view::npos) {
            return {};
        }
        return value.substr(start);
    }

    static constexpr std::string_view first_token(std::string_view value) {
        auto end = value.find_first_of(" \t\r\n");
        if (end == std::string_view::npos) {
            return value;
        }
        return value.substr(0, end);
    }

    static bool is_command_char(const char* s, long len) {
        if (len == 1 && s[0] == ':') {
            return true;
        }
        return ic_char_is_idletter(s, len);
    }

    static void complete_commands(ic_completion_env_t* cenv, const char* prefix) {
        (void)ic_add_completions(cenv, prefix, command_completions);
    }

    static void complete_show_args(ic_completion_env_t* cenv, const char* prefix) {
        (void)ic_add_completions(cenv, prefix, show_completions);
    }

    static void complete_set_args(ic_completion_env_t* cenv, const char* prefix) {
        (void)ic_add_completions(cenv, prefix, set_completions);
    }

    static void complete_selection_args(ic_completion_env_t* cenv, const char* prefix) {
        (void)ic_add_completions(cenv, prefix, selection_completions);
    }

    // Only commands complete; script text is left alone.
    static void complete_repl(ic_completion_env_t* cenv, const char* prefix) {
        if (prefix == nullptr) {
            return;
        }

        auto trimmed = trim_left(std::string_view{prefix});
        if (trimmed.empty()) {
            ic_complete_word(cenv, prefix, complete_commands, is_command_char);
            return;
        }
        if (!trimmed.starts_with(':')) {
            return;
        }

        auto command = first_token(trimmed);
        if (command.size() == trimmed.size()) {
            ic_complete_word(cenv, prefix, complete_commands, is_command_char);
            return;
        }

        if (command == ":show"sv) {
            ic_complete_word(cenv, prefix, complete_show_args, nullptr);
        }
        else if (command == ":set"sv) {
            ic_complete_word(cenv, prefix, complete_set_args, nullptr);
        }
        else if (command == ":selection"sv) {
            ic_complete_word(cenv, prefix, complete_selection_args, nullptr);
        }
    }

}}  // namespace galley::cli::detail

namespace galley::cli {

    namespace fs = std::filesystem;

    line_editor::line_editor(const startup_config& cfg) : history_enabled_{cfg.history_enabled} {
        ic_enable_multiline(true);
        ic_enable_multiline_indent(true);
        ic_enable_history_duplicates(false);
        ic_enable_brace_matching(true);
        ic_set_prompt_marker("", "");
        ic_set_default_completer(detail::complete_repl, nullptr);

        switch (cfg.color) {
            case color_mode::automatic:
                break;
            case color_mode::always:
                ic_enable_color(true);
                break;
            case color_mode::never:
                ic_enable_color(false);
                break;
        }

        if (!history_enabled_) {
            ic_set_history(nullptr, 1000);
            return;
        }

        std::error_code ec{};
        auto history_parent = cfg.history_file.parent_path();
        if (!history_parent.empty()) {
            fs::create_directories(history_parent, ec);
            if (ec) {
                debug_log("history directory unavailable: ", ec.message());
            }
        }

        auto history_file = cfg.history_file.string();
        ic_set_history(history_file.c_str(), 1000);
    }

    std::optional<std::string> line_editor::read_line(std::string_view prompt) {
        auto prompt_text = std::string(prompt);
        auto* raw = ic_readline(prompt_text.c_str());
        if (raw == nullptr) {
            return std::nullopt;
        }

        std::string line{raw};
        ic_free(raw);
        return line;
    }

    void line_editor::record_history(std::string_view line) {
        if (!history_enabled_ || line.empty()) {
            return;
        }
        auto entry = std::string(line);
        ic_history_add(entry.c_str());
    }

}  // namespace galley::cli

#pragma once

#include "galley/config.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace galley::cli {

    // isocline front end: history, command completion, multi-line editing.
    class line_editor {
      public:
        explicit line_editor(const startup_config& cfg);

        std::optional<std::string> read_line(std::string_view prompt);
        void record_history(std::string_view line);

      private:
        bool history_enabled_{true};
    };

}  // namespace galley::cli

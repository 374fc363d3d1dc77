#pragma once

#include "value.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace galley::encoder {

    using namespace std::string_view_literals;

    inline constexpr int max_depth = 20;

    // Sentinel strings produced only by the encoder's safety paths
    namespace placeholder {
        inline constexpr auto circular = "[circular]"sv;
        inline constexpr auto max_depth = "[max depth]"sv;
        inline constexpr auto host_object = "[HOST object]"sv;
        inline constexpr auto host_prefix = "[HOST:"sv;
    }  // namespace placeholder

    // Per-call traversal state: nesting depth of the value being encoded and the containers on
    // the descent path above it.
    struct encoding_context {
        int depth{0};
        std::vector<const host_value*> visited{};
    };

    // JSON string literal for `text`, quotes included.
    std::string quote(std::string_view text);

    /*
     * Renders `value` as JSON text. Total: never throws and always terminates. Values it cannot
     * or should not reproduce degrade to placeholders:
     *   - nesting past max_depth          -> "[max depth]"
     *   - a value on its own ancestor path -> "[circular]"
     *   - host objects                     -> "[HOST:<type>:<specifier>]" or "[HOST object]"
     *   - NaN / infinities, opaque values  -> null
     * Functions are dropped: array slots become null, object members are omitted.
     */
    std::string encode(const host_value& value);

    // True when `text` is one of the encoder's placeholder strings (unquoted).
    bool is_placeholder(std::string_view text);

}  // namespace galley::encoder

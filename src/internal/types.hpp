#pragma once

#include <glaze/glaze.hpp>

#include <optional>
#include <string>
#include <vector>

namespace galley::internal {

    // On-disk shape of --config files. Absent keys keep the built-in default.
    struct persisted_config {
        int schema_version{1};
        std::vector<std::string> hosts{};
        std::optional<bool> require_document{};
        std::optional<int> slow_call_ms{};
        std::optional<std::string> undo_name{};
        std::optional<std::string> undo_mode{};
        std::optional<std::string> history_file{};
        std::optional<std::string> color{};
    };

}  // namespace galley::internal

namespace glz {

    template <>
    struct meta<galley::internal::persisted_config> {
        using T = galley::internal::persisted_config;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "hosts",
                       &T::hosts,
                       "require_document",
                       &T::require_document,
                       "slow_call_ms",
                       &T::slow_call_ms,
                       "undo_name",
                       &T::undo_name,
                       "undo_mode",
                       &T::undo_mode,
                       "history_file",
                       &T::history_file,
                       "color",
                       &T::color);
    };

}  // namespace glz

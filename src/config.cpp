#include "galley/config.hpp"

#include "galley/format.hpp"

#include "internal/types.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace galley::literals;

namespace galley {

    namespace fs = std::filesystem;

    namespace detail {

        static constexpr int supported_schema_version = 1;

        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path};
            if (!in) {
                throw std::runtime_error("failed to open " + path.string());
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (!in.good() && !in.eof()) {
                throw std::runtime_error("failed to read " + path.string());
            }
            return ss.str();
        }

        static int positive_ms(int value, std::string_view origin) {
            if (value < 1) {
                throw std::runtime_error("{}: slow_call_ms must be positive, got {}"_format(origin, value));
            }
            return value;
        }

    }  // namespace detail

    void apply_config_file(const fs::path& path, startup_config& cfg) {
        internal::persisted_config data{};
        auto json = detail::read_text_file(path);
        if (auto ec = glz::read_json(data, json); ec) {
            throw std::runtime_error(
                    "failed to parse config file {}: {}"_format(path.string(), glz::format_error(ec, json)));
        }

        if (data.schema_version < 1 || data.schema_version > detail::supported_schema_version) {
            throw std::runtime_error(
                    "unsupported schema_version in {}: {} (supported: {})"_format(
                            path.string(), data.schema_version, detail::supported_schema_version));
        }

        if (!data.hosts.empty()) {
            cfg.host_endpoints = std::move(data.hosts);
        }
        if (data.require_document) {
            cfg.require_document = *data.require_document;
        }
        if (data.slow_call_ms) {
            cfg.slow_call_ms = detail::positive_ms(*data.slow_call_ms, path.string());
        }
        if (data.undo_name) {
            if (utils::trim_view(*data.undo_name).empty()) {
                throw std::runtime_error("{}: undo_name must be non-empty"_format(path.string()));
            }
            cfg.undo_name = std::move(*data.undo_name);
        }
        if (data.undo_mode && !try_parse_undo_mode(*data.undo_mode, cfg.undo)) {
            throw std::runtime_error(
                    "{}: invalid undo_mode '{}' (expected none|entire|fast_entire_script|script_request)"_format(
                            path.string(), *data.undo_mode));
        }
        if (data.history_file) {
            cfg.history_file = *data.history_file;
        }
        if (data.color && !try_parse_color_mode(*data.color, cfg.color)) {
            throw std::runtime_error(
                    "{}: invalid color '{}' (expected auto|always|never)"_format(path.string(), *data.color));
        }
    }

    void apply_environment(startup_config& cfg) {
        auto* raw = std::getenv("GALLEY_SLOW_CALL_MS");
        if (raw == nullptr || *raw == '\0') {
            return;
        }

        auto parsed = utils::parse_arithmetic<int>(utils::trim_view(raw));
        if (!parsed || *parsed < 1) {
            std::cerr << "warning: ignoring GALLEY_SLOW_CALL_MS='" << raw << "', expected a positive integer\n";
            return;
        }
        cfg.slow_call_ms = *parsed;
    }

}  // namespace galley

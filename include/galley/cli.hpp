#pragma once

#include "config.hpp"
#include "envelope.hpp"
#include "session.hpp"

#include <optional>
#include <string_view>

namespace galley::cli {

    // Resolves cfg from defaults, then --config file, then GALLEY_* environment, then the
    // command line. Returns an exit code when the process should stop (--help, --version,
    // --print-config, bad options).
    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);

    // Connects the configured host endpoints and runs the selected entry point.
    int run(startup_config& cfg);

    // Submits one script, prints the outcome JSON to stdout. 0 on success, 1 on fault.
    int run_once(envelope& env, std::string_view script, const startup_config& cfg);

    void run_repl(startup_config& cfg, session& s, envelope& env);

}  // namespace galley::cli

#pragma once

#include "config.hpp"
#include "envelope.hpp"

#include <iostream>

namespace galley::mcp {

    inline constexpr auto protocol_version = "2024-11-05"sv;

    // Serves the MCP tool surface (JSON-RPC 2.0, one message per line) until `in` closes.
    // Every tool call goes through the envelope, so host faults come back as tool results with
    // isError set rather than as JSON-RPC errors.
    int run_mcp_server(envelope& env, const startup_config& cfg, std::istream& in = std::cin, std::ostream& out = std::cout);

}  // namespace galley::mcp

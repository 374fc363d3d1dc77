#pragma once

#include "session.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace galley {

    inline constexpr auto unix_endpoint_prefix = "unix:"sv;

    // Splits a host command line into argv. Whitespace separates words; single and double quotes
    // group, backslash escapes the next character outside single quotes. Throws invalid_request
    // on an unterminated quote.
    std::vector<std::string> split_command(std::string_view command);

    /*
     * Reaches the host over the host link protocol. Endpoints are tried in order:
     *  - "unix:<path>" attaches to a host already listening on a UNIX stream socket
     *  - anything else is launched as a persistent child talking over stdin/stdout
     *
     * The first endpoint that answers the application name probe wins. A launched child lives as
     * long as the returned connection and is terminated with it.
     */
    class process_connector final : public host_connector {
      public:
        explicit process_connector(std::vector<std::string> endpoints);

        std::unique_ptr<host_connection> connect() override;

        const std::vector<std::string>& endpoints() const noexcept { return endpoints_; }

      private:
        std::vector<std::string> endpoints_;
    };

}  // namespace galley

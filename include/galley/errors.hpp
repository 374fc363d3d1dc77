#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace galley {

    // Malformed request, rejected before the host is contacted.
    class invalid_request : public std::invalid_argument {
      public:
        using std::invalid_argument::invalid_argument;
    };

    // No host process or no open document, after the one re-acquisition attempt.
    class host_unreachable : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    // The link to the host broke (child exited, socket closed, garbled frame).
    class connection_lost : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    // The submitted script raised inside the host.
    class script_fault : public std::runtime_error {
      public:
        script_fault(std::string name, const std::string& message, int line = -1)
                : std::runtime_error{message}, name_{std::move(name)}, line_{line} {}

        const std::string& name() const noexcept { return name_; }
        int line() const noexcept { return line_; }

      private:
        std::string name_{};
        int line_{-1};
    };

    // One probe on a host value faulted. Only the encoder catches these.
    class host_fault : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

}  // namespace galley

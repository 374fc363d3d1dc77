#pragma once

#include "config.hpp"
#include "value.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace galley {

    inline constexpr auto result_slot = "__result"sv;
    inline constexpr int max_rollback_steps = 50;

    // One script submission as the host sees it.
    struct script_call {
        std::string script{};
        undo_mode mode{undo_mode::none};
        std::string undo_name{};
        std::string slot{result_slot};
    };

    struct rollback_report {
        int steps_undone{0};
        // most recent first
        std::vector<std::string> labels{};
    };

    /*
     * A live handle on the host process. Every method may throw connection_lost when the link
     * is gone; do_script additionally throws script_fault when the script raised.
     */
    class host_connection {
      public:
        virtual ~host_connection() = default;

        // Cheap liveness probe.
        virtual std::string application_name() = 0;
        virtual std::size_t document_count() = 0;

        // Runs the script with the requested undo grouping and returns the value left in the
        // call's result slot (undefined when the script never assigned it).
        virtual value_graph do_script(const script_call& call) = 0;

        // Undoes up to `steps` entries of the active document's undo history.
        virtual rollback_report undo(int steps) = 0;
    };

    class host_connector {
      public:
        virtual ~host_connector() = default;

        // Throws host_unreachable when no host answers.
        virtual std::unique_ptr<host_connection> connect() = 0;
    };

    struct session_options {
        bool require_document{true};
        bool quiet{false};
    };

    /*
     * Owns the single connection to the host. The connection is acquired lazily, reused across
     * calls and re-acquired once when found stale. Not thread-safe: exactly one call may be in
     * flight, mirroring the host's own single-threaded automation interface.
     */
    class session {
      public:
        explicit session(std::unique_ptr<host_connector> connector, session_options options = {});

        session(const session&) = delete;
        session& operator=(const session&) = delete;

        bool connected() const noexcept { return connection_ != nullptr; }
        void disconnect() noexcept;

        std::string application_name();

        // Throws host_unreachable, connection_lost or script_fault.
        value_graph evaluate(const script_call& call);

        // steps < 1 throws invalid_request; larger requests are clamped to max_rollback_steps.
        rollback_report rollback(int steps);

        const session_options& options() const noexcept { return options_; }

      private:
        host_connection& acquire();
        host_connection& acquire_document();

        std::unique_ptr<host_connector> connector_;
        std::unique_ptr<host_connection> connection_{};
        session_options options_{};
    };

}  // namespace galley

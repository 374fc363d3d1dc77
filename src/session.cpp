#include "galley/session.hpp"

#include "galley/errors.hpp"
#include "galley/format.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

using namespace galley::literals;

namespace galley {

    namespace detail {

        // A connection that reports itself lost is dropped so the next call reconnects. The
        // failing call itself is never replayed: scripts are not idempotent.
        template <typename F>
        static decltype(auto) guarded(std::unique_ptr<host_connection>& connection, F&& fn) {
            try {
                return std::forward<F>(fn)(*connection);
            } catch (const connection_lost&) {
                connection.reset();
                throw;
            }
        }

    }  // namespace detail

    session::session(std::unique_ptr<host_connector> connector, session_options options)
            : connector_{std::move(connector)}, options_{options} {
        if (!connector_) {
            throw std::invalid_argument{"session requires a host connector"};
        }
    }

    void session::disconnect() noexcept {
        connection_.reset();
    }

    host_connection& session::acquire() {
        if (connection_) {
            try {
                (void)connection_->application_name();
                return *connection_;
            } catch (const connection_lost& e) {
                if (!options_.quiet) {
                    std::cerr << "warning: connection to host lost (" << e.what() << "), reconnecting\n";
                }
                connection_.reset();
            }
        }

        auto fresh = connector_->connect();
        if (!fresh) {
            throw host_unreachable{"host connector produced no connection"};
        }
        connection_ = std::move(fresh);
        debug_log("host connection acquired");
        return *connection_;
    }

    host_connection& session::acquire_document() {
        auto& conn = acquire();
        if (!options_.require_document) {
            return conn;
        }

        auto count = detail::guarded(connection_, [](host_connection& c) { return c.document_count(); });
        if (count == 0U) {
            throw host_unreachable{"no document open in the host"};
        }
        return conn;
    }

    std::string session::application_name() {
        (void)acquire();
        return detail::guarded(connection_, [](host_connection& c) { return c.application_name(); });
    }

    value_graph session::evaluate(const script_call& call) {
        (void)acquire_document();
        return detail::guarded(connection_, [&call](host_connection& c) { return c.do_script(call); });
    }

    rollback_report session::rollback(int steps) {
        if (steps < 1) {
            throw invalid_request{"rollback needs at least one step, got {}"_format(steps)};
        }
        steps = std::min(steps, max_rollback_steps);

        (void)acquire_document();
        return detail::guarded(connection_, [steps](host_connection& c) { return c.undo(steps); });
    }

}  // namespace galley

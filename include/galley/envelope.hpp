#pragma once

#include "config.hpp"
#include "session.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace galley {

    enum class outcome_status : uint8_t { success, fault };
    enum class fault_kind : uint8_t { invalid_request, host_unreachable, script_error };

    inline constexpr std::string_view to_string(outcome_status status) {
        switch (status) {
            case outcome_status::success:
                return "success"sv;
            case outcome_status::fault:
                return "fault"sv;
        }
        return "fault"sv;
    }

    inline constexpr std::string_view to_string(fault_kind kind) {
        switch (kind) {
            case fault_kind::invalid_request:
                return "InvalidRequest"sv;
            case fault_kind::host_unreachable:
                return "HostUnreachable"sv;
            case fault_kind::script_error:
                return "ScriptError"sv;
        }
        return "ScriptError"sv;
    }

    struct execution_request {
        std::string script{};
        std::string undo_name{default_undo_name};
        undo_mode mode{undo_mode::entire};
    };

    /*
     * Result of one submission. Exactly one of encoded_result (success) and fault_description
     * (fault) is set. For script errors fault_name/fault_line carry what the host reported.
     */
    struct execution_outcome {
        outcome_status status{outcome_status::fault};
        std::optional<std::string> encoded_result{};
        std::optional<std::string> fault_description{};
        std::optional<fault_kind> fault{};
        std::string fault_name{};
        int fault_line{-1};
        std::chrono::milliseconds elapsed{0};

        bool ok() const noexcept { return status == outcome_status::success; }

        static execution_outcome success(std::string encoded, std::chrono::milliseconds elapsed = {});
        static execution_outcome failure(
                fault_kind kind, std::string description, std::string name = {}, int line = -1);

        // {"success":true,"result":<encoded>,"elapsed_ms":n} or
        // {"success":false,"error":"...","name":"...","line":n}
        std::string to_json() const;
    };

    struct envelope_options {
        int slow_call_ms{default_slow_call_ms};
        bool quiet{false};
    };

    /*
     * Runs agent submissions against the session: validates, asks the host to group the script's
     * effects into one undo step, captures faults and encodes the result. Every call yields
     * exactly one outcome; nothing thrown by the session escapes.
     */
    class envelope {
      public:
        explicit envelope(session& s, envelope_options options = {});

        execution_outcome submit(const execution_request& request);

        // Read-only evaluation of one expression; the result is its string conversion.
        execution_outcome evaluate_expression(std::string_view expression);

        execution_outcome document_info();
        execution_outcome selection(selection_detail detail = selection_detail::basic);

        // Undoes the `steps` most recent undo groups; the result lists the labels undone.
        execution_outcome rollback(int steps);

        const envelope_options& options() const noexcept { return options_; }
        void set_slow_call_ms(int ms) noexcept { options_.slow_call_ms = ms; }

      private:
        execution_outcome run(const script_call& call);

        session& session_;
        envelope_options options_{};
    };

}  // namespace galley

#include "galley/envelope.hpp"

#include "galley/encoder.hpp"
#include "galley/errors.hpp"
#include "galley/format.hpp"
#include "galley/utils.hpp"

#include "internal/scripts.hpp"

#include <glaze/glaze.hpp>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <utility>

using namespace galley::literals;

namespace galley::detail {

    struct success_json {
        bool success{true};
        glz::raw_json result{};
        int64_t elapsed_ms{};
    };

    struct failure_json {
        bool success{false};
        std::string error{};
        std::string name{};
        int line{-1};
    };

}  // namespace galley::detail

namespace glz {

    template <>
    struct meta<galley::detail::success_json> {
        using T = galley::detail::success_json;
        static constexpr auto value = object("success", &T::success, "result", &T::result, "elapsed_ms", &T::elapsed_ms);
    };

    template <>
    struct meta<galley::detail::failure_json> {
        using T = galley::detail::failure_json;
        static constexpr auto value =
                object("success", &T::success, "error", &T::error, "name", &T::name, "line", &T::line);
    };

}  // namespace glz

namespace galley {

    namespace detail {

        using clock = std::chrono::steady_clock;

        static std::chrono::milliseconds since(clock::time_point start) {
            return std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start);
        }

        // Turns whatever the session throws into an outcome. Script errors keep the host's
        // name and line; a lost link, a missing host and any other failure read as unreachable.
        template <typename F>
        static execution_outcome capture(F&& fn) {
            try {
                return std::forward<F>(fn)();
            } catch (const script_fault& e) {
                return execution_outcome::failure(fault_kind::script_error, e.what(), e.name(), e.line());
            } catch (const invalid_request& e) {
                return execution_outcome::failure(fault_kind::invalid_request, e.what());
            } catch (const host_unreachable& e) {
                return execution_outcome::failure(fault_kind::host_unreachable, e.what());
            } catch (const connection_lost& e) {
                return execution_outcome::failure(
                        fault_kind::host_unreachable, "connection to host lost: {}"_format(e.what()));
            } catch (const std::exception& e) {
                // connectors and connections outside galley may throw anything
                return execution_outcome::failure(fault_kind::host_unreachable, e.what());
            }
        }

        static value_graph report_graph(const rollback_report& report) {
            value_graph g{};
            auto root = g.add_object();
            g.set_member(root, "steps_undone", g.add_number(static_cast<double>(report.steps_undone)));
            auto labels = g.add_array();
            for (const auto& label : report.labels) {
                g.push_element(labels, g.add_string(label));
            }
            g.set_member(root, "labels", labels);
            g.set_root(root);
            return g;
        }

    }  // namespace detail

    execution_outcome execution_outcome::success(std::string encoded, std::chrono::milliseconds elapsed) {
        execution_outcome out{};
        out.status = outcome_status::success;
        out.encoded_result = std::move(encoded);
        out.elapsed = elapsed;
        return out;
    }

    execution_outcome execution_outcome::failure(fault_kind kind, std::string description, std::string name, int line) {
        execution_outcome out{};
        out.status = outcome_status::fault;
        out.fault = kind;
        out.fault_description = std::move(description);
        out.fault_name = name.empty() ? std::string{to_string(kind)} : std::move(name);
        out.fault_line = line;
        return out;
    }

    std::string execution_outcome::to_json() const {
        std::string json{};
        if (ok()) {
            detail::success_json body{};
            body.result = glz::raw_json{encoded_result.value_or("null")};
            body.elapsed_ms = static_cast<int64_t>(elapsed.count());
            if (auto ec = glz::write_json(body, json)) {
                throw std::runtime_error("failed to serialize outcome json");
            }
            return json;
        }

        detail::failure_json body{};
        body.error = fault_description.value_or(std::string{});
        body.name = fault_name;
        body.line = fault_line;
        if (auto ec = glz::write_json(body, json)) {
            throw std::runtime_error("failed to serialize outcome json");
        }
        return json;
    }

    envelope::envelope(session& s, envelope_options options) : session_{s}, options_{options} {}

    execution_outcome envelope::run(const script_call& call) {
        auto start = detail::clock::now();
        auto outcome = detail::capture([&] {
            auto graph = session_.evaluate(call);
            return execution_outcome::success(encoder::encode(graph.root()));
        });
        outcome.elapsed = detail::since(start);

        if (!options_.quiet && options_.slow_call_ms > 0 && outcome.elapsed.count() > options_.slow_call_ms) {
            std::cerr << "warning: host call took {}ms (slow call threshold {}ms)\n"_format(
                    outcome.elapsed.count(), options_.slow_call_ms);
        }
        return outcome;
    }

    execution_outcome envelope::submit(const execution_request& request) {
        if (request.mode != undo_mode::none && utils::trim_view(request.undo_name).empty()) {
            return execution_outcome::failure(
                    fault_kind::invalid_request, "undo_name is required when undo_mode is {}"_format(request.mode));
        }
        if (utils::trim_view(request.script).empty()) {
            return execution_outcome::failure(fault_kind::invalid_request, "script body is empty");
        }

        return run(script_call{.script = request.script, .mode = request.mode, .undo_name = request.undo_name});
    }

    execution_outcome envelope::evaluate_expression(std::string_view expression) {
        auto expr = utils::trim_view(expression);
        if (expr.empty()) {
            return execution_outcome::failure(fault_kind::invalid_request, "expression is empty");
        }
        return run(script_call{.script = scripts::expression(expr), .mode = undo_mode::none});
    }

    execution_outcome envelope::document_info() {
        return run(script_call{.script = std::string{scripts::document_info}, .mode = undo_mode::none});
    }

    execution_outcome envelope::selection(selection_detail detail) {
        return run(
                script_call{.script = scripts::selection(detail == selection_detail::full), .mode = undo_mode::none});
    }

    execution_outcome envelope::rollback(int steps) {
        if (steps < 1) {
            return execution_outcome::failure(
                    fault_kind::invalid_request, "rollback needs at least one step, got {}"_format(steps));
        }

        auto start = detail::clock::now();
        auto outcome = detail::capture([&] {
            auto report = session_.rollback(steps);
            auto graph = detail::report_graph(report);
            return execution_outcome::success(encoder::encode(graph.root()));
        });
        outcome.elapsed = detail::since(start);
        return outcome;
    }

}  // namespace galley

#include "galley/mcp.hpp"

#include "galley/format.hpp"

#include <glaze/ext/jsonrpc.hpp>
#include <glaze/glaze.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace galley::literals;
using namespace std::string_view_literals;

namespace galley::mcp {

    namespace detail {

        // ── MCP protocol types ──────────────────────────────────────────

        struct client_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = client_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct initialize_params {
            std::string protocolVersion{};
            client_info clientInfo{};
            struct glaze {
                using T = initialize_params;
                static constexpr auto value =
                        glz::object("protocolVersion", &T::protocolVersion, "clientInfo", &T::clientInfo);
            };
        };

        struct server_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = server_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct tools_capability {
            struct glaze {
                using T = tools_capability;
                static constexpr auto value = glz::object();
            };
        };

        struct server_capabilities {
            tools_capability tools{};
            struct glaze {
                using T = server_capabilities;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct initialize_result {
            std::string protocolVersion{};
            server_capabilities capabilities{};
            server_info serverInfo{};
            struct glaze {
                using T = initialize_result;
                static constexpr auto value = glz::object(
                        "protocolVersion",
                        &T::protocolVersion,
                        "capabilities",
                        &T::capabilities,
                        "serverInfo",
                        &T::serverInfo);
            };
        };

        struct tool_definition {
            std::string name{};
            std::string description{};
            glz::raw_json inputSchema{};
            struct glaze {
                using T = tool_definition;
                static constexpr auto value = glz::object(&T::name, &T::description, "inputSchema", &T::inputSchema);
            };
        };

        struct tools_list_result {
            std::vector<tool_definition> tools{};
            struct glaze {
                using T = tools_list_result;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct tool_call_params {
            std::string name{};
            glz::raw_json arguments{};
            struct glaze {
                using T = tool_call_params;
                static constexpr auto value = glz::object(&T::name, &T::arguments);
            };
        };

        struct text_content {
            std::string type{"text"};
            std::string text{};
            struct glaze {
                using T = text_content;
                static constexpr auto value = glz::object(&T::type, &T::text);
            };
        };

        struct tool_call_result {
            std::vector<text_content> content{};
            bool isError{false};
            struct glaze {
                using T = tool_call_result;
                static constexpr auto value = glz::object(&T::content, "isError", &T::isError);
            };
        };

        // ── Tool argument types ─────────────────────────────────────────

        struct run_script_args {
            std::string code{};
            std::optional<std::string> undo_name{};
            std::optional<std::string> undo_mode{};
            struct glaze {
                using T = run_script_args;
                static constexpr auto value = glz::object(&T::code, &T::undo_name, &T::undo_mode);
            };
        };

        struct selection_args {
            std::optional<std::string> detail_level{};
            struct glaze {
                using T = selection_args;
                static constexpr auto value = glz::object(&T::detail_level);
            };
        };

        struct expression_args {
            std::string expression{};
            struct glaze {
                using T = expression_args;
                static constexpr auto value = glz::object(&T::expression);
            };
        };

        struct undo_args {
            std::optional<int> steps{};
            struct glaze {
                using T = undo_args;
                static constexpr auto value = glz::object(&T::steps);
            };
        };

        // ── Tool schemas ────────────────────────────────────────────────

        static constexpr auto run_script_description =
                R"(Execute a script in the host application and return its result. Assign the value to report to __result. By default every change the script makes is grouped into a single undo step, so one undo call reverts the whole script.)";
        static constexpr auto run_script_input_schema =
                R"json({"type": "object","properties": {"code": {"type": "string","description": "Script body. Assign the value to return to __result."},"undo_name": {"type": "string","description": "Label of the undo step","default": "Agent Script"},"undo_mode": {"type": "string","enum": ["entire","fast_entire_script","script_request","none"],"default": "entire","description": "entire groups all changes into one undo step; fast_entire_script does the same with less bookkeeping; script_request leaves grouping to the host; none disables grouping"}},"required": ["code"]})json"sv;

        static constexpr auto document_info_description =
                R"(Summarize the active document: name, path, save state, page and spread counts, item counts, styles, swatches, current selection types and page geometry.)";
        static constexpr auto document_info_input_schema = R"json({"type": "object","properties": {}})json"sv;

        static constexpr auto selection_description =
                R"(Describe the current selection (up to 50 items): type, id, name, bounds and a text preview. detail_level full adds applied styles, colors and the parent page.)";
        static constexpr auto selection_input_schema =
                R"json({"type": "object","properties": {"detail_level": {"type": "string","enum": ["basic","full"],"default": "basic"}}})json"sv;

        static constexpr auto expression_description =
                R"(Evaluate one expression in the host and return its string conversion. No undo step is created; use run_script for anything that changes the document.)";
        static constexpr auto expression_input_schema =
                R"json({"type": "object","properties": {"expression": {"type": "string","description": "Expression to evaluate, e.g. app.activeDocument.pages.length"}},"required": ["expression"]})json"sv;

        static constexpr auto undo_description =
                R"(Undo the most recent undo steps of the active document. Each run_script call with grouping enabled is one step. Returns the number of steps undone and their labels.)";
        static constexpr auto undo_input_schema =
                R"json({"type": "object","properties": {"steps": {"type": "integer","minimum": 1,"maximum": 50,"default": 1}}})json"sv;

        // ── Response helpers ────────────────────────────────────────────

        template <typename T>
        static std::string make_response(const glz::rpc::id_t& id, T&& result) {
            glz::rpc::response_t<std::decay_t<T>> resp{};
            resp.id = id;
            resp.result = std::forward<T>(result);
            std::string json{};
            (void)glz::write_json(resp, json);
            return json;
        }

        static std::string make_error_response(
                const glz::rpc::id_t& id, glz::rpc::error_e code, const std::string& message) {
            glz::rpc::response_t<glz::raw_json> resp{};
            resp.id = id;
            resp.error = glz::rpc::error{code, std::nullopt, message};
            std::string json{};
            (void)glz::write_json(resp, json);
            return json;
        }

        static std::string make_outcome_response(const glz::rpc::id_t& id, const execution_outcome& outcome) {
            tool_call_result result{};
            result.content.push_back(text_content{.text = outcome.to_json()});
            result.isError = !outcome.ok();
            return make_response(id, std::move(result));
        }

        // Tools without required arguments may be called with none at all.
        template <typename T>
        static bool read_arguments(T& args, const glz::raw_json& raw) {
            auto text = utils::trim_view(raw.str);
            if (text.empty() || text == "null"sv) {
                return true;
            }
            return !glz::read<glz::opts{.error_on_unknown_keys = false}>(args, raw.str);
        }

        // ── Handlers ────────────────────────────────────────────────────

        static std::string handle_initialize(const glz::rpc::id_t& id, glz::raw_json_view raw_params) {
            initialize_params params{};
            if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(params, raw_params.str); ec) {
                debug_log("initialize params ignored: ", glz::format_error(ec, raw_params.str));
            }

            initialize_result result{};
            result.protocolVersion = std::string{protocol_version};
            result.capabilities = server_capabilities{};
            result.serverInfo = server_info{.name = "galley", .version = std::string{galley_version}};

            return make_response(id, std::move(result));
        }

        static std::string handle_tools_list(const glz::rpc::id_t& id) {
            tools_list_result result{};
            result.tools.push_back(
                    tool_definition{
                            .name = "run_script",
                            .description = run_script_description,
                            .inputSchema = glz::raw_json{run_script_input_schema},
                    });
            result.tools.push_back(
                    tool_definition{
                            .name = "get_document_info",
                            .description = document_info_description,
                            .inputSchema = glz::raw_json{document_info_input_schema},
                    });
            result.tools.push_back(
                    tool_definition{
                            .name = "get_selection",
                            .description = selection_description,
                            .inputSchema = glz::raw_json{selection_input_schema},
                    });
            result.tools.push_back(
                    tool_definition{
                            .name = "eval_expression",
                            .description = expression_description,
                            .inputSchema = glz::raw_json{expression_input_schema},
                    });
            result.tools.push_back(
                    tool_definition{
                            .name = "undo",
                            .description = undo_description,
                            .inputSchema = glz::raw_json{undo_input_schema},
                    });

            return make_response(id, std::move(result));
        }

        static std::string handle_run_script(
                const glz::rpc::id_t& id, const glz::raw_json& raw_arguments, envelope& env, const startup_config& cfg) {
            run_script_args args{};
            if (!read_arguments(args, raw_arguments)) {
                return make_error_response(id, glz::rpc::error_e::invalid_params, "Failed to parse run_script arguments");
            }

            execution_request request{
                    .script = std::move(args.code),
                    .undo_name = args.undo_name.value_or(cfg.undo_name),
                    .mode = cfg.undo,
            };
            if (args.undo_mode && !try_parse_undo_mode(*args.undo_mode, request.mode)) {
                return make_error_response(
                        id,
                        glz::rpc::error_e::invalid_params,
                        "Unknown undo_mode: {} (expected entire|fast_entire_script|script_request|none)"_format(
                                *args.undo_mode));
            }

            return make_outcome_response(id, env.submit(request));
        }

        static std::string handle_selection(
                const glz::rpc::id_t& id, const glz::raw_json& raw_arguments, envelope& env) {
            selection_args args{};
            if (!read_arguments(args, raw_arguments)) {
                return make_error_response(
                        id, glz::rpc::error_e::invalid_params, "Failed to parse get_selection arguments");
            }

            auto level = selection_detail::basic;
            if (args.detail_level && !try_parse_selection_detail(*args.detail_level, level)) {
                return make_error_response(
                        id,
                        glz::rpc::error_e::invalid_params,
                        "Unknown detail_level: {} (expected basic|full)"_format(*args.detail_level));
            }
            return make_outcome_response(id, env.selection(level));
        }

        static std::string handle_eval_expression(
                const glz::rpc::id_t& id, const glz::raw_json& raw_arguments, envelope& env) {
            expression_args args{};
            if (!read_arguments(args, raw_arguments)) {
                return make_error_response(
                        id, glz::rpc::error_e::invalid_params, "Failed to parse eval_expression arguments");
            }
            return make_outcome_response(id, env.evaluate_expression(args.expression));
        }

        static std::string handle_undo(const glz::rpc::id_t& id, const glz::raw_json& raw_arguments, envelope& env) {
            undo_args args{};
            if (!read_arguments(args, raw_arguments)) {
                return make_error_response(id, glz::rpc::error_e::invalid_params, "Failed to parse undo arguments");
            }
            return make_outcome_response(id, env.rollback(args.steps.value_or(1)));
        }

        static std::string handle_tools_call(
                const glz::rpc::id_t& id, glz::raw_json_view raw_params, envelope& env, const startup_config& cfg) {
            tool_call_params params{};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(params, raw_params.str);
            if (ec) {
                return make_error_response(id, glz::rpc::error_e::invalid_params, "Failed to parse tool call params");
            }

            if (params.name == "run_script") {
                return handle_run_script(id, params.arguments, env, cfg);
            }
            if (params.name == "get_document_info") {
                return make_outcome_response(id, env.document_info());
            }
            if (params.name == "get_selection") {
                return handle_selection(id, params.arguments, env);
            }
            if (params.name == "eval_expression") {
                return handle_eval_expression(id, params.arguments, env);
            }
            if (params.name == "undo") {
                return handle_undo(id, params.arguments, env);
            }

            return make_error_response(id, glz::rpc::error_e::invalid_params, "Unknown tool: {}"_format(params.name));
        }

    }  // namespace detail

    // ── Server entry point ──────────────────────────────────────────

    int run_mcp_server(envelope& env, const startup_config& cfg, std::istream& in, std::ostream& out) {
        auto send = [&out](const std::string& json) {
            out << json << '\n';
            out.flush();
        };

        std::string line{};
        while (std::getline(in, line)) {
            if (utils::trim_view(line).empty()) {
                continue;
            }

            glz::rpc::generic_request_t request{};
            auto ec = glz::read_json(request, line);
            if (ec) {
                send(detail::make_error_response({}, glz::rpc::error_e::parse_error, "JSON parse error"));
                continue;
            }

            bool is_notification = std::holds_alternative<glz::generic::null_t>(request.id);

            if (request.method == "initialize"sv) {
                send(detail::handle_initialize(request.id, request.params));
            }
            else if (request.method == "notifications/initialized"sv) {
                // notification, no response
            }
            else if (request.method == "tools/list"sv) {
                send(detail::handle_tools_list(request.id));
            }
            else if (request.method == "tools/call"sv) {
                send(detail::handle_tools_call(request.id, request.params, env, cfg));
            }
            else if (!is_notification) {
                send(detail::make_error_response(
                        request.id,
                        glz::rpc::error_e::method_not_found,
                        "Unknown method: {}"_format(std::string{request.method})));
            }
        }

        return 0;
    }

}  // namespace galley::mcp

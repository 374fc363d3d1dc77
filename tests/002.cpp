#include "utils.hpp"

#include <vector>

namespace galley::test {

    namespace detail {
        std::vector<char*> to_argv(std::vector<std::string>& args) {
            std::vector<char*> argv{};
            argv.reserve(args.size());
            for (auto& arg : args) {
                argv.push_back(arg.data());
            }
            return argv;
        }

        std::optional<int> parse(std::vector<std::string> args, startup_config& cfg) {
            auto argv = to_argv(args);
            return cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
        }
    }  // namespace detail

    TEST_CASE("002: parse_cli accepts startup options", "[002][cli]") {
        startup_config cfg{};
        auto result = detail::parse(
                {"galley",
                 "--host",
                 "unix:/tmp/host.sock",
                 "--host",
                 "fake-host --quiet",
                 "--undo-name",
                 "Layout pass",
                 "--undo-mode",
                 "fast",
                 "--slow-call-ms",
                 "500",
                 "--allow-no-document",
                 "--color",
                 "always",
                 "--verbose"},
                cfg);

        CHECK_FALSE(result.has_value());
        REQUIRE(cfg.host_endpoints.size() == 2U);
        CHECK(cfg.host_endpoints[0] == "unix:/tmp/host.sock");
        CHECK(cfg.host_endpoints[1] == "fake-host --quiet");
        CHECK(cfg.undo_name == "Layout pass");
        CHECK(cfg.undo == undo_mode::fast_entire_script);
        CHECK(cfg.slow_call_ms == 500);
        CHECK_FALSE(cfg.require_document);
        CHECK(cfg.color == color_mode::always);
        CHECK(cfg.verbose);
        CHECK_FALSE(cfg.mcp);
    }

    TEST_CASE("002: parse_cli rejects invalid startup combos", "[002][cli]") {
        startup_config cfg{};

        CHECK(detail::parse({"galley", "--quiet", "--verbose"}, cfg) == std::optional<int>{2});

        startup_config fresh{};
        CHECK(detail::parse({"galley", "--undo-mode", "partial"}, fresh) == std::optional<int>{2});
        CHECK(detail::parse({"galley", "--undo-name", "   "}, fresh) == std::optional<int>{2});
        CHECK(detail::parse({"galley", "--slow-call-ms", "0"}, fresh) == std::optional<int>{2});
        CHECK(detail::parse({"galley", "--mcp", "--eval", "1"}, fresh) == std::optional<int>{2});
        CHECK(detail::parse({"galley", "--color", "sometimes"}, fresh) == std::optional<int>{2});

        auto unknown = detail::parse({"galley", "--timeout", "5"}, fresh);
        REQUIRE(unknown.has_value());
        CHECK(*unknown != 0);
    }

    TEST_CASE("002: parse_cli handles one-shot exits", "[002][cli]") {
        startup_config version_cfg{};
        CHECK(detail::parse({"galley", "--version"}, version_cfg) == std::optional<int>{0});

        startup_config print_cfg{};
        CHECK(detail::parse({"galley", "--print-config"}, print_cfg) == std::optional<int>{0});

        startup_config eval_cfg{};
        CHECK_FALSE(detail::parse({"galley", "--eval", "__result = 1;"}, eval_cfg).has_value());
        REQUIRE(eval_cfg.eval_script.has_value());
        CHECK(*eval_cfg.eval_script == "__result = 1;");

        startup_config mcp_cfg{};
        CHECK_FALSE(detail::parse({"galley", "--mcp"}, mcp_cfg).has_value());
        CHECK(mcp_cfg.mcp);
    }

    TEST_CASE("002: parse_cli handles history toggles", "[002][cli]") {
        startup_config cfg{};
        CHECK_FALSE(detail::parse({"galley", "--history-file", "/tmp/galley-history", "--no-history", "--no-color"}, cfg)
                            .has_value());
        CHECK(cfg.history_file == std::filesystem::path{"/tmp/galley-history"});
        CHECK_FALSE(cfg.history_enabled);
        CHECK(cfg.color == color_mode::never);
    }

    TEST_CASE("002: command line wins over config file and environment", "[002][cli][precedence]") {
        detail::temp_dir temp{"galley_cli_precedence"};
        auto path = temp.path / "galley.json";
        detail::write_text_file(
                path, R"({"hosts":["from-file"],"slow_call_ms":1000,"undo_name":"From file","undo_mode":"none"})");
        detail::scoped_env_var env{"GALLEY_SLOW_CALL_MS", "2000"};

        startup_config from_file{};
        CHECK_FALSE(detail::parse({"galley", "--config", path.string()}, from_file).has_value());
        REQUIRE(from_file.config_file.has_value());
        CHECK(from_file.host_endpoints == std::vector<std::string>{"from-file"});
        CHECK(from_file.slow_call_ms == 2000);
        CHECK(from_file.undo_name == "From file");
        CHECK(from_file.undo == undo_mode::none);

        startup_config overridden{};
        CHECK_FALSE(detail::parse(
                            {"galley",
                             "--config",
                             path.string(),
                             "--host",
                             "from-cli",
                             "--slow-call-ms",
                             "3000",
                             "--undo-mode",
                             "entire"},
                            overridden)
                            .has_value());
        CHECK(overridden.host_endpoints == std::vector<std::string>{"from-cli"});
        CHECK(overridden.slow_call_ms == 3000);
        CHECK(overridden.undo == undo_mode::entire);
        CHECK(overridden.undo_name == "From file");
    }

    TEST_CASE("002: unreadable config file is an option error", "[002][cli][precedence]") {
        detail::temp_dir temp{"galley_cli_bad_config"};
        startup_config cfg{};
        CHECK(detail::parse({"galley", "--config", (temp.path / "absent.json").string()}, cfg) ==
              std::optional<int>{2});
    }

    TEST_CASE("002: split_command honors quotes and escapes", "[002][cli][endpoint]") {
        CHECK(split_command("fake-host --quiet") == std::vector<std::string>{"fake-host", "--quiet"});
        CHECK(split_command("  host   'two words'  \"say \\\"hi\\\"\" ") ==
              std::vector<std::string>{"host", "two words", "say \"hi\""});
        CHECK(split_command("a\\ b c") == std::vector<std::string>{"a b", "c"});
        CHECK(split_command("''") == std::vector<std::string>{""});
        CHECK(split_command("   ").empty());
        CHECK_THROWS_AS(split_command("host 'open"), invalid_request);
    }

}  // namespace galley::test

#include "utils.hpp"

#include <cerrno>
#include <thread>

#ifndef GALLEY_FAKE_HOST_PATH
#error "GALLEY_FAKE_HOST_PATH must name the test host executable"
#endif

namespace galley::test::detail {

    inline const std::string fake_host_path{GALLEY_FAKE_HOST_PATH};

    using endpoint_list = std::vector<std::string>;

    struct linked_rig {
        session s;
        envelope env;

        explicit linked_rig(endpoint_list endpoints, session_options options = {.quiet = true})
                : s{std::make_unique<process_connector>(std::move(endpoints)), options},
                  env{s, envelope_options{.quiet = true}} {}
    };

    // A fake host listening on a UNIX socket for the lifetime of the object.
    struct socket_host {
        pid_t pid{-1};
        std::string path{};

        socket_host(const fs::path& socket_path, std::string_view name) : path{socket_path.string()} {
            pid = ::fork();
            REQUIRE(pid >= 0);
            if (pid == 0) {
                auto owned_name = std::string{name};
                ::execl(fake_host_path.c_str(),
                        fake_host_path.c_str(),
                        "--socket",
                        path.c_str(),
                        "--name",
                        owned_name.c_str(),
                        static_cast<char*>(nullptr));
                ::_exit(127);
            }

            for (int i = 0; i < 200 && !fs::exists(socket_path); ++i) {
                std::this_thread::sleep_for(std::chrono::milliseconds{10});
            }
            REQUIRE(fs::exists(socket_path));
        }

        socket_host(const socket_host&) = delete;
        socket_host& operator=(const socket_host&) = delete;

        ~socket_host() {
            if (pid > 0) {
                ::kill(pid, SIGTERM);
                ::waitpid(pid, nullptr, 0);
            }
        }
    };

}  // namespace galley::test::detail

namespace galley::test {

    TEST_CASE("009: launched host runs scripts and reports results", "[009][process]") {
        detail::linked_rig rig{detail::endpoint_list{detail::fake_host_path + " --name 'Fake Layout'"}};

        CHECK(rig.s.application_name() == "Fake Layout");

        auto number = rig.env.submit(execution_request{.script = "return number 42"});
        REQUIRE(number.ok());
        CHECK(*number.encoded_result == "42");

        auto text = rig.env.submit(execution_request{.script = "return text hello \"world\""});
        REQUIRE(text.ok());
        CHECK(*text.encoded_result == R"("hello \"world\"")");

        auto cycle = rig.env.submit(execution_request{.script = "return cycle"});
        REQUIRE(cycle.ok());
        CHECK(*cycle.encoded_result == R"({"name":"loop","self":"[circular]"})");

        auto page = rig.env.submit(execution_request{.script = "return page"});
        REQUIRE(page.ok());
        CHECK(*page.encoded_result == R"({"page":"[HOST:Page:/document[@id=1]//page[@id=212]]"})");

        auto broken = rig.env.submit(execution_request{.script = "return broken"});
        REQUIRE(broken.ok());
        CHECK(*broken.encoded_result == R"({"ok":true})");

        auto nothing = rig.env.submit(execution_request{.script = "set pages 3"});
        REQUIRE(nothing.ok());
        CHECK(*nothing.encoded_result == "null");
    }

    TEST_CASE("009: scripts travel with the program that runs them in the host", "[009][process][program]") {
        detail::linked_rig rig{detail::endpoint_list{detail::fake_host_path}};

        auto outcome = rig.env.submit(execution_request{.script = "set w 1\nreturn program", .undo_name = "Echo"});
        REQUIRE(outcome.ok());
        auto program = detail::parse_json(*outcome.encoded_result).get<std::string>();

        auto guard = program.find("UserInteractionLevels.neverInteract");
        auto body = program.find("set w 1\nreturn program");
        auto error_restore = program.find("catch (e) {\ntry { app.scriptPreferences.userInteractionLevel = __galleyLevel; }");
        auto success_restore = program.find("app.scriptPreferences.userInteractionLevel = __galleyLevel;\nreturn '{\"ok\":true");
        REQUIRE(guard != std::string::npos);
        REQUIRE(body != std::string::npos);
        REQUIRE(error_restore != std::string::npos);
        REQUIRE(success_restore != std::string::npos);
        CHECK(guard < body);
        CHECK(body < error_restore);
        CHECK(error_restore < success_restore);
        CHECK(program.find("function __galleyExport(root)") != std::string::npos);
        CHECK(program.find("__galleyExport(__result)") != std::string::npos);
    }

    TEST_CASE("009: script errors come back with name and line", "[009][process][fault]") {
        detail::linked_rig rig{detail::endpoint_list{detail::fake_host_path}};

        auto outcome = rig.env.submit(execution_request{.script = "set a 1\nthrow RangeError 7 value out of range"});
        CHECK_FALSE(outcome.ok());
        REQUIRE(outcome.fault.has_value());
        CHECK(*outcome.fault == fault_kind::script_error);
        CHECK(outcome.fault_name == "RangeError");
        CHECK(outcome.fault_line == 7);
        CHECK(outcome.fault_description == std::optional<std::string>{"value out of range"});

        // the host stays usable after a script error
        auto after = rig.env.submit(execution_request{.script = "return number 1"});
        CHECK(after.ok());
    }

    TEST_CASE("009: undo through the host link", "[009][process][rollback]") {
        detail::linked_rig rig{detail::endpoint_list{detail::fake_host_path}};

        REQUIRE(rig.env.submit(execution_request{.script = "set a 1", .undo_name = "Add A"}).ok());
        REQUIRE(rig.env.submit(execution_request{.script = "set b 2", .undo_name = "Add B"}).ok());
        REQUIRE(rig.env.submit(execution_request{.script = "set c 3", .mode = undo_mode::none}).ok());

        auto undo = rig.env.rollback(1);
        REQUIRE(undo.ok());
        CHECK(*undo.encoded_result == R"({"steps_undone":1,"labels":["Add B"]})");

        auto doc = rig.env.submit(execution_request{.script = "return doc", .mode = undo_mode::none});
        REQUIRE(doc.ok());
        CHECK(*doc.encoded_result == R"({"a":1})");

        auto rest = rig.env.rollback(10);
        REQUIRE(rest.ok());
        CHECK(*rest.encoded_result == R"({"steps_undone":1,"labels":["Add A"]})");

        auto empty = rig.env.rollback(1);
        REQUIRE(empty.ok());
        CHECK(*empty.encoded_result == R"({"steps_undone":0,"labels":[]})");
    }

    TEST_CASE("009: canned read-only scripts", "[009][process][readonly]") {
        detail::linked_rig rig{detail::endpoint_list{detail::fake_host_path}};

        auto expr = rig.env.evaluate_expression("app.activeDocument.pages.length");
        REQUIRE(expr.ok());
        CHECK(*expr.encoded_result == R"("fake:app.activeDocument.pages.length")");

        auto info = rig.env.document_info();
        REQUIRE(info.ok());
        CHECK(*info.encoded_result == R"({"name":"fake.indd","pages":0})");

        auto full = rig.env.selection(selection_detail::full);
        REQUIRE(full.ok());
        CHECK(*full.encoded_result == R"({"count":0,"items":[],"detail":"full"})");

        auto undo = rig.env.rollback(1);
        REQUIRE(undo.ok());
        CHECK(*undo.encoded_result == R"({"steps_undone":0,"labels":[]})");
    }

    TEST_CASE("009: first answering endpoint wins", "[009][process][endpoints]") {
        detail::linked_rig rig{detail::endpoint_list{
                "/nonexistent/galley-host-binary", "unix:/nonexistent/galley.sock", detail::fake_host_path}};

        auto outcome = rig.env.submit(execution_request{.script = "return number 5"});
        REQUIRE(outcome.ok());
        CHECK(*outcome.encoded_result == "5");
    }

    TEST_CASE("009: no answering endpoint is unreachable", "[009][process][endpoints]") {
        SECTION("all endpoints fail") {
            process_connector connector{detail::endpoint_list{"/nonexistent/galley-host-binary", "unix:/nonexistent/galley.sock"}};
            try {
                (void)connector.connect();
                FAIL("expected host_unreachable");
            } catch (const host_unreachable& e) {
                CHECK(std::string_view{e.what()}.find("no host answered on 2 endpoint(s)") != std::string_view::npos);
            }
        }

        SECTION("nothing configured") {
            process_connector connector{detail::endpoint_list{}};
            CHECK_THROWS_AS(connector.connect(), host_unreachable);
        }

        SECTION("malformed command") {
            detail::linked_rig rig{detail::endpoint_list{"host 'unterminated"}};
            auto outcome = rig.env.submit(execution_request{.script = "return number 1"});
            REQUIRE(outcome.fault.has_value());
            CHECK(*outcome.fault == fault_kind::host_unreachable);
        }
    }

    TEST_CASE("009: host exit mid-call is reported and the next call relaunches", "[009][process][reconnect]") {
        detail::linked_rig rig{detail::endpoint_list{detail::fake_host_path}};

        REQUIRE(rig.env.submit(execution_request{.script = "set a 1", .undo_name = "Add A"}).ok());

        auto crashed = rig.env.submit(execution_request{.script = "exit"});
        REQUIRE(crashed.fault.has_value());
        CHECK(*crashed.fault == fault_kind::host_unreachable);
        REQUIRE(crashed.fault_description.has_value());
        CHECK(crashed.fault_description->starts_with("connection to host lost: "));
        CHECK_FALSE(rig.s.connected());

        // a fresh host starts with an empty document and history
        auto doc = rig.env.submit(execution_request{.script = "return doc", .mode = undo_mode::none});
        REQUIRE(doc.ok());
        CHECK(*doc.encoded_result == "{}");
        CHECK(rig.s.connected());
    }

    TEST_CASE("009: a host that ignores SIGTERM is still reaped", "[009][process][reconnect]") {
        detail::linked_rig rig{detail::endpoint_list{detail::fake_host_path + " --ignore-term"}};

        auto pid_outcome = rig.env.submit(execution_request{.script = "return pid", .mode = undo_mode::none});
        REQUIRE(pid_outcome.ok());
        auto pid = utils::parse_arithmetic<int>(*pid_outcome.encoded_result);
        REQUIRE(pid.has_value());

        auto start = std::chrono::steady_clock::now();
        rig.s.disconnect();
        auto waited = std::chrono::steady_clock::now() - start;
        CHECK(waited < std::chrono::seconds{5});

        // reaped, not left as a zombie
        errno = 0;
        CHECK(::kill(static_cast<pid_t>(*pid), 0) == -1);
        CHECK(errno == ESRCH);

        auto again = rig.env.submit(execution_request{.script = "return number 2"});
        REQUIRE(again.ok());
        CHECK(*again.encoded_result == "2");
    }

    TEST_CASE("009: host without a document", "[009][process][document]") {
        detail::linked_rig strict{detail::endpoint_list{detail::fake_host_path + " --no-document"}};
        auto refused = strict.env.submit(execution_request{.script = "return number 1"});
        REQUIRE(refused.fault.has_value());
        CHECK(*refused.fault == fault_kind::host_unreachable);

        detail::linked_rig relaxed{
                detail::endpoint_list{detail::fake_host_path + " --no-document"}, session_options{.require_document = false, .quiet = true}};
        auto allowed = relaxed.env.submit(execution_request{.script = "return number 1"});
        CHECK(allowed.ok());
    }

    TEST_CASE("009: attach to a host listening on a socket", "[009][process][socket]") {
        detail::temp_dir temp{"galley_socket"};
        auto socket_path = temp.path / "host.sock";
        detail::socket_host host{socket_path, "Socket Host"};

        detail::linked_rig rig{detail::endpoint_list{"unix:" + socket_path.string()}};
        CHECK(rig.s.application_name() == "Socket Host");

        REQUIRE(rig.env.submit(execution_request{.script = "set k 2", .undo_name = "Set K"}).ok());

        // the host outlives our connection; state is still there after reattaching
        rig.s.disconnect();
        auto doc = rig.env.submit(execution_request{.script = "return doc", .mode = undo_mode::none});
        REQUIRE(doc.ok());
        CHECK(*doc.encoded_result == R"({"k":2})");

        auto undo = rig.env.rollback(1);
        REQUIRE(undo.ok());
        CHECK(*undo.encoded_result == R"({"steps_undone":1,"labels":["Set K"]})");
    }

}  // namespace galley::test

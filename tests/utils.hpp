#pragma once

#include "galley/galley.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

#include "../src/internal/types.hpp"
#include "../src/internal/wire.hpp"

extern "C" {
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace galley::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    inline void write_text_file(const fs::path& path, std::string_view text) {
        std::ofstream out{path};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    struct scoped_env_var {
        std::string key{};
        std::optional<std::string> previous{};

        scoped_env_var(std::string key_value, std::optional<std::string> next) : key(std::move(key_value)) {
            if (auto* existing = std::getenv(key.c_str()); existing != nullptr) {
                previous = std::string{existing};
            }

            if (next) {
                REQUIRE(::setenv(key.c_str(), next->c_str(), 1) == 0);
            }
            else {
                REQUIRE(::unsetenv(key.c_str()) == 0);
            }
        }

        ~scoped_env_var() {
            if (previous) {
                (void)::setenv(key.c_str(), previous->c_str(), 1);
            }
            else {
                (void)::unsetenv(key.c_str());
            }
        }
    };

    /*
     * Shared state of the in-memory host. The document is a flat map of numbered properties;
     * every grouped call pushes one undo entry holding the document as it was before the call.
     * Bumping `generation` makes every connection handed out so far stale.
     */
    struct host_state {
        struct undo_entry {
            std::string label{};
            std::map<std::string, double> before{};
        };

        std::string app_name{"Scripted Host"};
        std::size_t documents{1U};
        bool reachable{true};
        int generation{0};

        int connects{0};
        int name_probes{0};
        int undo_calls{0};
        int last_undo_steps{0};
        std::vector<script_call> calls{};

        std::map<std::string, double> document{};
        std::vector<undo_entry> undo_stack{};

        // Runs the script; may mutate `document`, throw script_fault or connection_lost.
        std::function<value_graph(const script_call&, host_state&)> on_script{};

        // Makes existing connections stale; new ones still succeed.
        void restart() { ++generation; }

        // Makes existing connections stale and refuses new ones.
        void shut_down() {
            ++generation;
            reachable = false;
        }
    };

    class scripted_connection final : public host_connection {
      public:
        scripted_connection(std::shared_ptr<host_state> state, int generation)
                : state_{std::move(state)}, generation_{generation} {}

        std::string application_name() override {
            check_alive();
            ++state_->name_probes;
            return state_->app_name;
        }

        std::size_t document_count() override {
            check_alive();
            return state_->documents;
        }

        value_graph do_script(const script_call& call) override {
            check_alive();
            state_->calls.push_back(call);

            auto before = state_->document;
            bool grouped = call.mode != undo_mode::none;
            try {
                auto result = state_->on_script ? state_->on_script(call, *state_) : value_graph{};
                if (grouped) {
                    state_->undo_stack.push_back({.label = call.undo_name, .before = std::move(before)});
                }
                return result;
            } catch (const script_fault&) {
                // partial changes stay, grouped under the request's label
                if (grouped) {
                    state_->undo_stack.push_back({.label = call.undo_name, .before = std::move(before)});
                }
                throw;
            }
        }

        rollback_report undo(int steps) override {
            check_alive();
            ++state_->undo_calls;
            state_->last_undo_steps = steps;

            rollback_report report{};
            while (report.steps_undone < steps && !state_->undo_stack.empty()) {
                auto entry = std::move(state_->undo_stack.back());
                state_->undo_stack.pop_back();
                state_->document = std::move(entry.before);
                report.labels.push_back(std::move(entry.label));
                ++report.steps_undone;
            }
            return report;
        }

      private:
        void check_alive() const {
            if (generation_ != state_->generation) {
                throw connection_lost{"scripted host went away"};
            }
        }

        std::shared_ptr<host_state> state_;
        int generation_{0};
    };

    class scripted_connector final : public host_connector {
      public:
        explicit scripted_connector(std::shared_ptr<host_state> state) : state_{std::move(state)} {}

        std::unique_ptr<host_connection> connect() override {
            ++state_->connects;
            if (!state_->reachable) {
                throw host_unreachable{"scripted host is not running"};
            }
            return std::make_unique<scripted_connection>(state_, state_->generation);
        }

      private:
        std::shared_ptr<host_state> state_;
    };

    // A session wired to a fresh in-memory host.
    struct scripted_rig {
        std::shared_ptr<host_state> host{std::make_shared<host_state>()};
        session s;
        envelope env;

        explicit scripted_rig(session_options options = {.require_document = true, .quiet = true})
                : s{std::make_unique<scripted_connector>(host), options}, env{s, envelope_options{.quiet = true}} {}
    };

    // Redirects cout and cerr into string buffers for the lifetime of the object.
    struct captured_streams {
        std::ostringstream out{};
        std::ostringstream err{};
        std::streambuf* saved_out{std::cout.rdbuf(out.rdbuf())};
        std::streambuf* saved_err{std::cerr.rdbuf(err.rdbuf())};

        captured_streams() = default;
        captured_streams(const captured_streams&) = delete;
        captured_streams& operator=(const captured_streams&) = delete;

        ~captured_streams() {
            std::cout.flush();
            std::cerr.flush();
            std::cout.rdbuf(saved_out);
            std::cerr.rdbuf(saved_err);
        }
    };

    inline value_graph string_result(std::string_view value) {
        value_graph g{};
        g.set_root(g.add_string(std::string{value}));
        return g;
    }

    inline value_graph number_result(double value) {
        value_graph g{};
        g.set_root(g.add_number(value));
        return g;
    }

    // Parses encoder output with glaze's generic JSON type.
    inline glz::generic parse_json(std::string_view text) {
        glz::generic parsed{};
        auto buffer = std::string{text};
        auto ec = glz::read_json(parsed, buffer);
        REQUIRE_FALSE(ec);
        return parsed;
    }

}  // namespace galley::test::detail

#include "galley/process.hpp"

#include "galley/errors.hpp"
#include "galley/format.hpp"

#include "internal/scripts.hpp"
#include "internal/wire.hpp"

#include <sys/socket.h>
#include <sys/un.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <optional>
#include <thread>
#include <utility>

using namespace galley::literals;

namespace galley {

    namespace detail {

        static std::string errno_text() {
            return std::strerror(errno);
        }

        // Either a launched child (pid > 0, two pipes) or an attached socket (in_fd == out_fd).
        struct host_link {
            pid_t pid{-1};
            int in_fd{-1};
            int out_fd{-1};
        };

        static constexpr auto child_exit_grace = std::chrono::milliseconds{500};

        // SIGTERM first; a host still running after the grace period is killed outright.
        static void reap_child(pid_t pid) {
            ::kill(pid, SIGTERM);

            auto deadline = std::chrono::steady_clock::now() + child_exit_grace;
            for (;;) {
                auto rc = ::waitpid(pid, nullptr, WNOHANG);
                if (rc == pid || (rc < 0 && errno != EINTR)) {
                    return;
                }
                if (std::chrono::steady_clock::now() >= deadline) {
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds{5});
            }

            debug_log("host pid ", pid, " ignored SIGTERM, killing");
            ::kill(pid, SIGKILL);
            while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {
            }
        }

        static void close_link(host_link& link) {
            if (link.in_fd >= 0) {
                ::close(link.in_fd);
            }
            if (link.out_fd >= 0 && link.out_fd != link.in_fd) {
                ::close(link.out_fd);
            }
            link.in_fd = -1;
            link.out_fd = -1;

            if (link.pid > 0) {
                reap_child(link.pid);
                link.pid = -1;
            }
        }

        static host_link attach_socket(std::string_view path) {
            sockaddr_un addr{};
            addr.sun_family = AF_UNIX;
            if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
                throw host_unreachable{"invalid host socket path '{}'"_format(path)};
            }
            std::memcpy(addr.sun_path, path.data(), path.size());

            int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
            if (fd < 0) {
                throw host_unreachable{"socket() failed: {}"_format(errno_text())};
            }
            if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
                auto reason = errno_text();
                ::close(fd);
                throw host_unreachable{"cannot attach to host at {}: {}"_format(path, reason)};
            }
            return {.pid = -1, .in_fd = fd, .out_fd = fd};
        }

        static host_link spawn_host(const std::vector<std::string>& args) {
            int in_pipe[2]{};
            int out_pipe[2]{};
            if (::pipe(in_pipe) != 0) {
                throw host_unreachable{"pipe() failed for host: {}"_format(errno_text())};
            }
            if (::pipe(out_pipe) != 0) {
                auto reason = errno_text();
                ::close(in_pipe[0]);
                ::close(in_pipe[1]);
                throw host_unreachable{"pipe() failed for host: {}"_format(reason)};
            }

            auto pid = ::fork();
            if (pid < 0) {
                auto reason = errno_text();
                ::close(in_pipe[0]);
                ::close(in_pipe[1]);
                ::close(out_pipe[0]);
                ::close(out_pipe[1]);
                throw host_unreachable{"fork() failed for host: {}"_format(reason)};
            }

            if (pid == 0) {
                ::close(in_pipe[1]);
                ::close(out_pipe[0]);
                ::dup2(in_pipe[0], STDIN_FILENO);
                ::dup2(out_pipe[1], STDOUT_FILENO);
                ::close(in_pipe[0]);
                ::close(out_pipe[1]);

                std::vector<std::string> owned{args};
                std::vector<char*> argv{};
                argv.reserve(owned.size() + 1);
                for (auto& arg : owned) {
                    argv.push_back(arg.data());
                }
                argv.push_back(nullptr);
                ::execvp(argv[0], argv.data());
                _exit(127);
            }

            ::close(in_pipe[0]);
            ::close(out_pipe[1]);

            return {.pid = pid, .in_fd = in_pipe[1], .out_fd = out_pipe[0]};
        }

        static void write_all(int fd, std::string_view data) {
            size_t off{0};
            while (off < data.size()) {
                auto n = ::write(fd, data.data() + off, data.size() - off);
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    throw connection_lost{"write to host failed: {}"_format(errno_text())};
                }
                off += static_cast<size_t>(n);
            }
        }

        class process_connection final : public host_connection {
          public:
            process_connection(host_link link, std::string endpoint)
                    : link_{link}, endpoint_{std::move(endpoint)} {}

            ~process_connection() override { close_link(link_); }

            process_connection(const process_connection&) = delete;
            process_connection& operator=(const process_connection&) = delete;

            std::string application_name() override {
                auto resp = roundtrip(wire::request{.method = std::string{wire::method::app_name}});
                if (!resp.ok || !resp.text) {
                    throw connection_lost{"{} did not answer the application name probe"_format(endpoint_)};
                }
                return *resp.text;
            }

            std::size_t document_count() override {
                auto resp = roundtrip(wire::request{.method = std::string{wire::method::document_count}});
                if (!resp.ok || !resp.count || *resp.count < 0) {
                    throw connection_lost{"{} sent no document count"_format(endpoint_)};
                }
                return static_cast<std::size_t>(*resp.count);
            }

            value_graph do_script(const script_call& call) override {
                wire::request req{.method = std::string{wire::method::do_script}};
                req.script = call.script;
                req.program = scripts::host_program(call.script, call.slot);
                req.undo_mode = std::string{to_string(call.mode)};
                if (call.mode != undo_mode::none) {
                    req.undo_name = call.undo_name;
                }
                req.result_slot = call.slot;

                auto resp = roundtrip(std::move(req));
                raise_fault(resp);
                if (!resp.result) {
                    return value_graph{};
                }
                return value_graph::from_wire(*resp.result);
            }

            rollback_report undo(int steps) override {
                wire::request req{.method = std::string{wire::method::undo}};
                req.steps = steps;

                auto resp = roundtrip(std::move(req));
                raise_fault(resp);
                return {.steps_undone = static_cast<int>(resp.labels.size()), .labels = std::move(resp.labels)};
            }

          private:
            void raise_fault(const wire::response& resp) const {
                if (resp.ok) {
                    return;
                }
                if (!resp.error) {
                    throw connection_lost{"{} reported failure without an error"_format(endpoint_)};
                }
                throw script_fault{resp.error->name, resp.error->message, resp.error->line};
            }

            wire::response roundtrip(wire::request req) {
                if (link_.in_fd < 0) {
                    throw connection_lost{"connection to {} is closed"_format(endpoint_)};
                }
                req.id = ++next_id_;

                std::string line{};
                if (auto ec = glz::write_json(req, line); ec) {
                    throw connection_lost{"failed to encode host request"};
                }
                line.push_back('\n');

                try {
                    write_all(link_.in_fd, line);
                    auto frame = read_frame();

                    wire::response resp{};
                    if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(resp, frame); ec) {
                        throw connection_lost{"malformed response from {}: {}"_format(
                                endpoint_, glz::format_error(ec, frame))};
                    }
                    if (resp.id != req.id) {
                        throw connection_lost{
                                "response id {} from {} does not match request {}"_format(resp.id, endpoint_, req.id)};
                    }
                    return resp;
                } catch (const connection_lost&) {
                    // the stream position is unknown now; never reuse it
                    close_link(link_);
                    throw;
                }
            }

            // Blocks until one full frame arrives. Host calls have no deadline; the envelope only
            // warns about slow calls.
            std::string read_frame() {
                for (;;) {
                    if (auto pos = pending_.find(wire::frame_delimiter); pos != std::string::npos) {
                        auto frame = pending_.substr(0, pos);
                        pending_.erase(0, pos + wire::frame_delimiter.size());
                        return frame;
                    }

                    char chunk[4096]{};
                    auto n = ::read(link_.out_fd, chunk, sizeof(chunk));
                    if (n < 0) {
                        if (errno == EINTR) {
                            continue;
                        }
                        throw connection_lost{"read from {} failed: {}"_format(endpoint_, errno_text())};
                    }
                    if (n == 0) {
                        throw connection_lost{"{} closed the connection"_format(endpoint_)};
                    }
                    pending_.append(chunk, static_cast<size_t>(n));
                }
            }

            host_link link_{};
            std::string endpoint_;
            std::string pending_{};
            uint64_t next_id_{0};
        };

        static std::unique_ptr<process_connection> open_endpoint(const std::string& endpoint) {
            std::string_view view{endpoint};
            if (view.starts_with(unix_endpoint_prefix)) {
                view.remove_prefix(unix_endpoint_prefix.size());
                return std::make_unique<process_connection>(attach_socket(view), endpoint);
            }

            auto args = split_command(endpoint);
            if (args.empty()) {
                throw host_unreachable{"empty host command"};
            }
            return std::make_unique<process_connection>(spawn_host(args), endpoint);
        }

    }  // namespace detail

    std::vector<std::string> split_command(std::string_view command) {
        std::vector<std::string> out{};
        std::string current{};
        bool in_word{false};
        char quote{0};

        for (size_t i = 0; i < command.size(); ++i) {
            char c = command[i];
            if (quote == '\'') {
                if (c == '\'') {
                    quote = 0;
                }
                else {
                    current.push_back(c);
                }
                continue;
            }
            if (c == '\\' && i + 1 < command.size()) {
                current.push_back(command[++i]);
                in_word = true;
                continue;
            }
            if (quote == '"') {
                if (c == '"') {
                    quote = 0;
                }
                else {
                    current.push_back(c);
                }
                continue;
            }
            if (c == '\'' || c == '"') {
                quote = c;
                in_word = true;
                continue;
            }
            if (c == ' ' || c == '\t' || c == '\n') {
                if (in_word) {
                    out.push_back(std::move(current));
                    current.clear();
                    in_word = false;
                }
                continue;
            }
            current.push_back(c);
            in_word = true;
        }

        if (quote != 0) {
            throw invalid_request{"unterminated quote in host command: {}"_format(command)};
        }
        if (in_word) {
            out.push_back(std::move(current));
        }
        return out;
    }

    process_connector::process_connector(std::vector<std::string> endpoints) : endpoints_{std::move(endpoints)} {
        // a host that dies mid-write must surface as connection_lost, not kill us
        ::signal(SIGPIPE, SIG_IGN);
    }

    std::unique_ptr<host_connection> process_connector::connect() {
        if (endpoints_.empty()) {
            throw host_unreachable{"no host endpoints configured"};
        }

        std::string last_error{};
        for (const auto& endpoint : endpoints_) {
            try {
                auto conn = detail::open_endpoint(endpoint);
                auto name = conn->application_name();
                debug_log("attached to ", name, " via ", endpoint);
                return conn;
            } catch (const host_unreachable& e) {
                last_error = e.what();
            } catch (const connection_lost& e) {
                last_error = e.what();
            } catch (const invalid_request& e) {
                last_error = e.what();
            }
            debug_log("endpoint ", endpoint, " failed: ", last_error);
        }

        throw host_unreachable{"no host answered on {} endpoint(s); last error: {}"_format(endpoints_.size(), last_error)};
    }

}  // namespace galley

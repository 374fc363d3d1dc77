#pragma once

#include <glaze/glaze.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/*
 * Host link protocol.
 *
 * The client writes one JSON request per line to the host. The host answers every request
 * with one JSON response followed by the frame delimiter (ASCII record separator + newline).
 * Script results travel as a value graph: a flat node table whose links are node indices, so
 * cyclic host structures survive the trip. Probes that faulted inside the host are carried as
 * fault strings on the node or slot and are replayed as host_fault on the client side.
 *
 * A do_script request carries both the bare script and the program that runs it in the host.
 * The program evaluates to the response body minus its id, so a bridge in front of a real host
 * only runs `program` through doScript with the requested undo mode and name, then splices the
 * id into the string it gets back.
 */
namespace galley::wire {

    using namespace std::string_view_literals;

    inline constexpr std::string_view frame_delimiter = "\x1e\n"sv;

    namespace method {
        inline constexpr auto app_name = "app_name"sv;
        inline constexpr auto document_count = "document_count"sv;
        inline constexpr auto do_script = "do_script"sv;
        inline constexpr auto undo = "undo"sv;
    }  // namespace method

    struct slot {
        std::optional<uint32_t> ref{};
        std::optional<std::string> fault{};
    };

    struct member {
        std::string key{};
        std::optional<uint32_t> ref{};
        std::optional<std::string> fault{};
        std::optional<bool> inherited{};
    };

    struct node {
        std::string kind{"undefined"};
        std::optional<bool> boolean{};
        std::optional<double> number{};
        // "nan", "inf" or "-inf"; JSON has no spelling for non-finite numbers
        std::optional<std::string> special{};
        std::optional<std::string> text{};
        std::optional<std::string> type_name{};
        std::optional<std::string> type_fault{};
        std::optional<std::string> specifier{};
        std::optional<std::string> specifier_fault{};
        std::vector<slot> elements{};
        std::vector<member> members{};
    };

    struct graph {
        uint32_t root{};
        std::vector<node> nodes{};
    };

    struct fault {
        std::string name{"Error"};
        std::string message{};
        int line{-1};
    };

    struct request {
        uint64_t id{};
        std::string method{};
        std::optional<std::string> script{};
        // script wrapped by scripts::host_program; what a bridge passes to doScript
        std::optional<std::string> program{};
        std::optional<std::string> undo_mode{};
        std::optional<std::string> undo_name{};
        std::optional<std::string> result_slot{};
        std::optional<int> steps{};
    };

    struct response {
        uint64_t id{};
        bool ok{false};
        std::optional<std::string> text{};
        std::optional<int64_t> count{};
        std::optional<graph> result{};
        std::optional<fault> error{};
        std::vector<std::string> labels{};
    };

}  // namespace galley::wire

namespace glz {

    template <>
    struct meta<galley::wire::slot> {
        using T = galley::wire::slot;
        static constexpr auto value = object("ref", &T::ref, "fault", &T::fault);
    };

    template <>
    struct meta<galley::wire::member> {
        using T = galley::wire::member;
        static constexpr auto value =
                object("key", &T::key, "ref", &T::ref, "fault", &T::fault, "inherited", &T::inherited);
    };

    template <>
    struct meta<galley::wire::node> {
        using T = galley::wire::node;
        static constexpr auto value =
                object("kind",
                       &T::kind,
                       "boolean",
                       &T::boolean,
                       "number",
                       &T::number,
                       "special",
                       &T::special,
                       "text",
                       &T::text,
                       "type_name",
                       &T::type_name,
                       "type_fault",
                       &T::type_fault,
                       "specifier",
                       &T::specifier,
                       "specifier_fault",
                       &T::specifier_fault,
                       "elements",
                       &T::elements,
                       "members",
                       &T::members);
    };

    template <>
    struct meta<galley::wire::graph> {
        using T = galley::wire::graph;
        static constexpr auto value = object("root", &T::root, "nodes", &T::nodes);
    };

    template <>
    struct meta<galley::wire::fault> {
        using T = galley::wire::fault;
        static constexpr auto value = object("name", &T::name, "message", &T::message, "line", &T::line);
    };

    template <>
    struct meta<galley::wire::request> {
        using T = galley::wire::request;
        static constexpr auto value =
                object("id",
                       &T::id,
                       "method",
                       &T::method,
                       "script",
                       &T::script,
                       "program",
                       &T::program,
                       "undo_mode",
                       &T::undo_mode,
                       "undo_name",
                       &T::undo_name,
                       "result_slot",
                       &T::result_slot,
                       "steps",
                       &T::steps);
    };

    template <>
    struct meta<galley::wire::response> {
        using T = galley::wire::response;
        static constexpr auto value =
                object("id",
                       &T::id,
                       "ok",
                       &T::ok,
                       "text",
                       &T::text,
                       "count",
                       &T::count,
                       "result",
                       &T::result,
                       "error",
                       &T::error,
                       "labels",
                       &T::labels);
    };

}  // namespace glz

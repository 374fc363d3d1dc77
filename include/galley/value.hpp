#pragma once

#include "utils.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace galley {

    using namespace std::string_view_literals;

    namespace wire {
        struct graph;
    }

    enum class value_kind : uint8_t {
        undefined,
        null,
        boolean,
        number,
        string,
        function,
        array,
        object,
    };

    inline constexpr std::string_view to_string(value_kind kind) {
        switch (kind) {
            case value_kind::undefined:
                return "undefined"sv;
            case value_kind::null:
                return "null"sv;
            case value_kind::boolean:
                return "boolean"sv;
            case value_kind::number:
                return "number"sv;
            case value_kind::string:
                return "string"sv;
            case value_kind::function:
                return "function"sv;
            case value_kind::array:
                return "array"sv;
            case value_kind::object:
                return "object"sv;
        }
        return "undefined"sv;
    }

    inline constexpr bool try_parse_value_kind(std::string_view text, value_kind& out) {
        constexpr value_kind all[] = {
                value_kind::undefined,
                value_kind::null,
                value_kind::boolean,
                value_kind::number,
                value_kind::string,
                value_kind::function,
                value_kind::array,
                value_kind::object};
        for (auto kind : all) {
            if (text == to_string(kind)) {
                out = kind;
                return true;
            }
        }
        return false;
    }

    /*
     * One value produced by the host. kind() is the only probe guaranteed not to fault; every
     * other accessor may throw host_fault the way a native host binding does when a property read
     * crashes. Scalar accessors are only meaningful for the matching kind. Value identity is the
     * object address.
     */
    class host_value {
      public:
        virtual ~host_value() = default;

        virtual value_kind kind() const noexcept = 0;

        virtual bool boolean() const = 0;
        virtual double number() const = 0;
        virtual std::string_view text() const = 0;

        // Runtime type name ("constructor.name"); the identity probe.
        virtual std::string type_name() const = 0;

        // Host objects expose a stable address string; nothing else about them is safe to read.
        virtual bool addressable() const = 0;
        virtual std::string specifier() const = 0;

        virtual std::size_t length() const = 0;
        virtual const host_value& element(std::size_t index) const = 0;

        // Own enumerable member names, in host order. Inherited members are never listed.
        virtual std::vector<std::string> own_keys() const = 0;
        virtual const host_value& member(std::string_view key) const = 0;
    };

    namespace detail {
        struct graph_node;
    }

    /*
     * Owning store for a (possibly cyclic) graph of host values, as reported by the host for one
     * script result. Nodes are addressed by id; links may point anywhere in the graph, including
     * back at an ancestor. A fresh graph holds one undefined node as its root.
     */
    class value_graph {
      public:
        using node_id = std::uint32_t;

        value_graph();
        ~value_graph();
        value_graph(value_graph&&) noexcept;
        value_graph& operator=(value_graph&&) noexcept;
        value_graph(const value_graph&) = delete;
        value_graph& operator=(const value_graph&) = delete;

        node_id add_undefined();
        node_id add_null();
        node_id add_boolean(bool value);
        node_id add_number(double value);
        node_id add_string(std::string value);
        node_id add_function(std::string name = {});
        node_id add_array(std::string type_name = "Array");
        node_id add_object(std::string type_name = "Object");
        node_id add_host_object(std::string type_name, std::string specifier);

        void push_element(node_id array, node_id element);
        void push_element_fault(node_id array, std::string message);

        void set_member(node_id object, std::string key, node_id value);
        void set_member_fault(node_id object, std::string key, std::string message);
        void set_inherited_member(node_id object, std::string key, node_id value);

        void set_type_fault(node_id node, std::string message);
        void set_specifier_fault(node_id node, std::string message);

        void set_root(node_id node);
        node_id root_id() const noexcept { return root_; }
        const host_value& root() const;
        const host_value& at(node_id node) const;
        std::size_t size() const noexcept { return nodes_.size(); }

        // Throws connection_lost when the wire graph is malformed (dangling ref, unknown kind).
        static value_graph from_wire(const wire::graph& g);
        wire::graph to_wire() const;

      private:
        node_id add_node(std::unique_ptr<detail::graph_node> node);
        detail::graph_node& node_at(node_id node);

        std::vector<std::unique_ptr<detail::graph_node>> nodes_{};
        node_id root_{0U};
    };

}  // namespace galley

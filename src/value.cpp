#include "galley/value.hpp"

#include "galley/errors.hpp"
#include "galley/format.hpp"

#include "internal/wire.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace galley::literals;

namespace galley::detail {

    struct graph_slot {
        const graph_node* target{nullptr};
        std::optional<std::string> fault{};
    };

    struct graph_member {
        std::string key{};
        graph_slot slot{};
        bool inherited{false};
    };

    struct graph_node final : host_value {
        value_graph::node_id id{};
        value_kind node_kind{value_kind::undefined};
        bool boolean_value{false};
        double number_value{0.0};
        std::string text_value{};
        std::string type{};
        std::optional<std::string> type_fault{};
        bool has_specifier{false};
        std::string specifier_value{};
        std::optional<std::string> specifier_fault{};
        std::vector<graph_slot> elements{};
        std::vector<graph_member> members{};

        value_kind kind() const noexcept override { return node_kind; }
        bool boolean() const override { return boolean_value; }
        double number() const override { return number_value; }
        std::string_view text() const override { return text_value; }

        std::string type_name() const override {
            if (type_fault) {
                throw host_fault{*type_fault};
            }
            return type;
        }

        bool addressable() const override { return has_specifier; }

        std::string specifier() const override {
            if (!has_specifier) {
                throw host_fault{"{} has no specifier"_format(type)};
            }
            if (specifier_fault) {
                throw host_fault{*specifier_fault};
            }
            return specifier_value;
        }

        std::size_t length() const override { return elements.size(); }

        const host_value& element(std::size_t index) const override {
            if (index >= elements.size()) {
                throw host_fault{"index {} out of range (length {})"_format(index, elements.size())};
            }
            return resolve(elements[index]);
        }

        std::vector<std::string> own_keys() const override {
            std::vector<std::string> keys{};
            keys.reserve(members.size());
            for (const auto& m : members) {
                if (!m.inherited) {
                    keys.push_back(m.key);
                }
            }
            return keys;
        }

        const host_value& member(std::string_view key) const override {
            for (const auto& m : members) {
                if (m.key == key) {
                    return resolve(m.slot);
                }
            }
            throw host_fault{"{} has no member '{}'"_format(type, key)};
        }

        static const host_value& resolve(const graph_slot& slot) {
            if (slot.fault) {
                throw host_fault{*slot.fault};
            }
            return *slot.target;
        }
    };

}  // namespace galley::detail

namespace galley {

    namespace detail {

        static std::unique_ptr<graph_node> make_node(value_kind kind, std::string type) {
            auto node = std::make_unique<graph_node>();
            node->node_kind = kind;
            node->type = std::move(type);
            return node;
        }

        static void set_slot_member(graph_node& object, graph_member entry) {
            for (auto& m : object.members) {
                if (m.key == entry.key) {
                    m = std::move(entry);
                    return;
                }
            }
            object.members.push_back(std::move(entry));
        }

        static std::optional<double> special_number(std::string_view special) {
            if (special == "nan"sv) {
                return std::numeric_limits<double>::quiet_NaN();
            }
            if (special == "inf"sv) {
                return std::numeric_limits<double>::infinity();
            }
            if (special == "-inf"sv) {
                return -std::numeric_limits<double>::infinity();
            }
            return std::nullopt;
        }

        [[noreturn]] static void malformed(std::string_view what) {
            throw connection_lost{"host sent a malformed value graph: {}"_format(what)};
        }

    }  // namespace detail

    value_graph::value_graph() {
        root_ = add_undefined();
    }

    value_graph::~value_graph() = default;
    value_graph::value_graph(value_graph&&) noexcept = default;
    value_graph& value_graph::operator=(value_graph&&) noexcept = default;

    value_graph::node_id value_graph::add_node(std::unique_ptr<detail::graph_node> node) {
        auto id = static_cast<node_id>(nodes_.size());
        node->id = id;
        nodes_.push_back(std::move(node));
        return id;
    }

    detail::graph_node& value_graph::node_at(node_id node) {
        if (node >= nodes_.size()) {
            throw std::out_of_range{"value_graph node {} out of range"_format(node)};
        }
        return *nodes_[node];
    }

    const host_value& value_graph::at(node_id node) const {
        if (node >= nodes_.size()) {
            throw std::out_of_range{"value_graph node {} out of range"_format(node)};
        }
        return *nodes_[node];
    }

    const host_value& value_graph::root() const {
        return at(root_);
    }

    void value_graph::set_root(node_id node) {
        (void)at(node);
        root_ = node;
    }

    value_graph::node_id value_graph::add_undefined() {
        return add_node(detail::make_node(value_kind::undefined, "undefined"));
    }

    value_graph::node_id value_graph::add_null() {
        auto node = detail::make_node(value_kind::null, "null");
        node->type_fault = "null is not an object";
        return add_node(std::move(node));
    }

    value_graph::node_id value_graph::add_boolean(bool value) {
        auto node = detail::make_node(value_kind::boolean, "Boolean");
        node->boolean_value = value;
        return add_node(std::move(node));
    }

    value_graph::node_id value_graph::add_number(double value) {
        auto node = detail::make_node(value_kind::number, "Number");
        node->number_value = value;
        return add_node(std::move(node));
    }

    value_graph::node_id value_graph::add_string(std::string value) {
        auto node = detail::make_node(value_kind::string, "String");
        node->text_value = std::move(value);
        return add_node(std::move(node));
    }

    value_graph::node_id value_graph::add_function(std::string name) {
        auto node = detail::make_node(value_kind::function, "Function");
        node->text_value = std::move(name);
        return add_node(std::move(node));
    }

    value_graph::node_id value_graph::add_array(std::string type_name) {
        return add_node(detail::make_node(value_kind::array, std::move(type_name)));
    }

    value_graph::node_id value_graph::add_object(std::string type_name) {
        return add_node(detail::make_node(value_kind::object, std::move(type_name)));
    }

    value_graph::node_id value_graph::add_host_object(std::string type_name, std::string specifier) {
        auto node = detail::make_node(value_kind::object, std::move(type_name));
        node->has_specifier = true;
        node->specifier_value = std::move(specifier);
        return add_node(std::move(node));
    }

    void value_graph::push_element(node_id array, node_id element) {
        auto* target = nodes_.at(element).get();
        node_at(array).elements.push_back(detail::graph_slot{.target = target});
    }

    void value_graph::push_element_fault(node_id array, std::string message) {
        node_at(array).elements.push_back(detail::graph_slot{.fault = std::move(message)});
    }

    void value_graph::set_member(node_id object, std::string key, node_id value) {
        auto* target = nodes_.at(value).get();
        detail::set_slot_member(node_at(object), detail::graph_member{.key = std::move(key), .slot = {.target = target}});
    }

    void value_graph::set_member_fault(node_id object, std::string key, std::string message) {
        detail::set_slot_member(
                node_at(object), detail::graph_member{.key = std::move(key), .slot = {.fault = std::move(message)}});
    }

    void value_graph::set_inherited_member(node_id object, std::string key, node_id value) {
        auto* target = nodes_.at(value).get();
        detail::set_slot_member(
                node_at(object),
                detail::graph_member{.key = std::move(key), .slot = {.target = target}, .inherited = true});
    }

    void value_graph::set_type_fault(node_id node, std::string message) {
        node_at(node).type_fault = std::move(message);
    }

    void value_graph::set_specifier_fault(node_id node, std::string message) {
        auto& target = node_at(node);
        target.has_specifier = true;
        target.specifier_fault = std::move(message);
    }

    value_graph value_graph::from_wire(const wire::graph& g) {
        value_graph out{};
        out.nodes_.clear();
        out.nodes_.reserve(g.nodes.size());

        if (g.nodes.empty()) {
            out.root_ = out.add_undefined();
            return out;
        }

        // first pass creates every node so links can point forward or backward
        for (const auto& wn : g.nodes) {
            value_kind kind{};
            if (!try_parse_value_kind(wn.kind, kind)) {
                detail::malformed("unknown kind '{}'"_format(wn.kind));
            }

            auto node = detail::make_node(kind, wn.type_name.value_or(std::string{}));
            switch (kind) {
                case value_kind::boolean:
                    node->boolean_value = wn.boolean.value_or(false);
                    break;
                case value_kind::number:
                    if (wn.special) {
                        auto special = detail::special_number(*wn.special);
                        if (!special) {
                            detail::malformed("unknown number special '{}'"_format(*wn.special));
                        }
                        node->number_value = *special;
                    }
                    else {
                        node->number_value = wn.number.value_or(0.0);
                    }
                    break;
                case value_kind::string:
                case value_kind::function:
                    node->text_value = wn.text.value_or(std::string{});
                    break;
                default:
                    break;
            }
            node->type_fault = wn.type_fault;
            if (kind == value_kind::null && !node->type_fault) {
                node->type_fault = "null is not an object";
            }
            node->has_specifier = wn.specifier.has_value() || wn.specifier_fault.has_value();
            node->specifier_value = wn.specifier.value_or(std::string{});
            node->specifier_fault = wn.specifier_fault;
            (void)out.add_node(std::move(node));
        }

        auto link = [&](std::optional<uint32_t> ref, const std::optional<std::string>& fault) {
            if (fault) {
                return detail::graph_slot{.fault = *fault};
            }
            if (!ref) {
                detail::malformed("slot without ref or fault");
            }
            if (*ref >= out.nodes_.size()) {
                detail::malformed("dangling ref {}"_format(*ref));
            }
            return detail::graph_slot{.target = out.nodes_[*ref].get()};
        };

        for (std::size_t i = 0; i < g.nodes.size(); ++i) {
            const auto& wn = g.nodes[i];
            auto& node = *out.nodes_[i];
            for (const auto& s : wn.elements) {
                node.elements.push_back(link(s.ref, s.fault));
            }
            for (const auto& m : wn.members) {
                node.members.push_back(
                        detail::graph_member{
                                .key = m.key, .slot = link(m.ref, m.fault), .inherited = m.inherited.value_or(false)});
            }
        }

        if (g.root >= out.nodes_.size()) {
            detail::malformed("root {} out of range"_format(g.root));
        }
        out.root_ = g.root;
        return out;
    }

    wire::graph value_graph::to_wire() const {
        wire::graph g{};
        g.root = root_;
        g.nodes.reserve(nodes_.size());

        auto slot_ref = [](const detail::graph_slot& s) -> std::optional<uint32_t> {
            if (s.fault) {
                return std::nullopt;
            }
            return s.target->id;
        };

        for (const auto& node : nodes_) {
            wire::node wn{};
            wn.kind = std::string{to_string(node->node_kind)};
            switch (node->node_kind) {
                case value_kind::boolean:
                    wn.boolean = node->boolean_value;
                    break;
                case value_kind::number:
                    if (std::isnan(node->number_value)) {
                        wn.special = "nan";
                    }
                    else if (std::isinf(node->number_value)) {
                        wn.special = node->number_value > 0 ? "inf" : "-inf";
                    }
                    else {
                        wn.number = node->number_value;
                    }
                    break;
                case value_kind::string:
                case value_kind::function:
                    wn.text = node->text_value;
                    break;
                default:
                    break;
            }
            if (!node->type.empty()) {
                wn.type_name = node->type;
            }
            if (node->node_kind != value_kind::null) {
                wn.type_fault = node->type_fault;
            }
            if (node->has_specifier) {
                if (node->specifier_fault) {
                    wn.specifier_fault = node->specifier_fault;
                }
                else {
                    wn.specifier = node->specifier_value;
                }
            }
            for (const auto& s : node->elements) {
                wn.elements.push_back(wire::slot{.ref = slot_ref(s), .fault = s.fault});
            }
            for (const auto& m : node->members) {
                wn.members.push_back(
                        wire::member{
                                .key = m.key,
                                .ref = slot_ref(m.slot),
                                .fault = m.slot.fault,
                                .inherited = m.inherited ? std::optional<bool>{true} : std::nullopt});
            }
            g.nodes.push_back(std::move(wn));
        }
        return g;
    }

}  // namespace galley

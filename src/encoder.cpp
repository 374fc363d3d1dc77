#include "galley/encoder.hpp"

#include "galley/format.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

using namespace galley::literals;

namespace galley::encoder {

    namespace detail {

        // Runs one probe against a host value; a fault degrades to nullopt.
        template <typename F>
        static auto attempt(F&& probe) -> std::optional<std::invoke_result_t<F>> {
            try {
                return std::optional<std::invoke_result_t<F>>{std::in_place, std::forward<F>(probe)()};
            } catch (const std::exception& e) {
                debug_log("host probe faulted: ", e.what());
                return std::nullopt;
            }
        }

        // Keeps a container on the visited path, one level deeper, for exactly the duration of
        // its subtree.
        class visit_guard {
          public:
            visit_guard(encoding_context& ctx, const host_value* value) : ctx_{ctx} {
                ctx_.visited.push_back(value);
                ++ctx_.depth;
            }
            ~visit_guard() {
                --ctx_.depth;
                ctx_.visited.pop_back();
            }

            visit_guard(const visit_guard&) = delete;
            visit_guard& operator=(const visit_guard&) = delete;

          private:
            encoding_context& ctx_;
        };

        static std::string format_number(double value) {
            if (value == 0.0) {
                return "0";
            }
            char buf[64]{};
            auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
            if (ec != std::errc{}) {
                return "null";
            }
            return std::string(buf, end);
        }

        static std::optional<std::string> encode_value(const host_value& value, encoding_context& ctx);

        static std::string encode_array(const host_value& value, encoding_context& ctx) {
            std::string out{"["};
            auto count = value.length();
            for (std::size_t i = 0; i < count; ++i) {
                if (i != 0U) {
                    out.push_back(',');
                }
                // functions keep their slot so indices stay aligned
                out += encode_value(value.element(i), ctx).value_or("null");
            }
            out.push_back(']');
            return out;
        }

        static std::string encode_object(const host_value& value, encoding_context& ctx) {
            std::string out{"{"};
            bool first = true;
            for (const auto& key : value.own_keys()) {
                auto encoded = attempt([&] { return encode_value(value.member(key), ctx); });
                if (!encoded) {
                    // unreadable member
                    continue;
                }
                if (!*encoded) {
                    continue;
                }
                if (!first) {
                    out.push_back(',');
                }
                first = false;
                out += quote(key);
                out.push_back(':');
                out += **encoded;
            }
            out.push_back('}');
            return out;
        }

        static std::string encode_host_object(const host_value& value, const std::string& type) {
            auto where = attempt([&] { return value.specifier(); });
            if (!where) {
                return quote(placeholder::host_object);
            }
            return quote("[HOST:{}:{}]"_format(type, *where));
        }

        static std::optional<std::string> encode_value(const host_value& value, encoding_context& ctx) {
            if (ctx.depth > max_depth) {
                return quote(placeholder::max_depth);
            }

            switch (value.kind()) {
                case value_kind::undefined:
                case value_kind::null:
                    return "null";
                case value_kind::boolean:
                    return value.boolean() ? "true" : "false";
                case value_kind::number: {
                    auto n = value.number();
                    return std::isfinite(n) ? format_number(n) : "null";
                }
                case value_kind::string:
                    return quote(value.text());
                case value_kind::function:
                    return std::nullopt;
                case value_kind::array:
                case value_kind::object:
                    break;
            }

            // identity probe first: some host values fault on any property access
            auto type = attempt([&] { return value.type_name(); });
            if (!type) {
                return "null";
            }

            // never enumerate host objects, the specifier is the only safe view of them
            auto addressable = attempt([&] { return value.addressable(); });
            if (!addressable) {
                return quote(placeholder::host_object);
            }
            if (*addressable) {
                return encode_host_object(value, *type);
            }

            if (std::ranges::find(ctx.visited, &value) != ctx.visited.end()) {
                return quote(placeholder::circular);
            }
            visit_guard guard{ctx, &value};

            if (value.kind() == value_kind::array) {
                return encode_array(value, ctx);
            }
            return encode_object(value, ctx);
        }

    }  // namespace detail

    std::string quote(std::string_view text) {
        static constexpr char hex_digits[] = "0123456789abcdef";

        std::string out{};
        out.reserve(text.size() + 2U);
        out.push_back('"');
        for (char ch : text) {
            auto cc = static_cast<unsigned char>(ch);
            switch (ch) {
                case '\\':
                    out += "\\\\";
                    break;
                case '"':
                    out += "\\\"";
                    break;
                case '\b':
                    out += "\\b";
                    break;
                case '\t':
                    out += "\\t";
                    break;
                case '\n':
                    out += "\\n";
                    break;
                case '\f':
                    out += "\\f";
                    break;
                case '\r':
                    out += "\\r";
                    break;
                default:
                    if (cc < 0x20U) {
                        out += "\\u00";
                        out.push_back(hex_digits[cc >> 4U]);
                        out.push_back(hex_digits[cc & 0x0FU]);
                    }
                    else {
                        out.push_back(ch);
                    }
                    break;
            }
        }
        out.push_back('"');
        return out;
    }

    std::string encode(const host_value& value) {
        encoding_context ctx{};
        try {
            return detail::encode_value(value, ctx).value_or("null");
        } catch (const std::exception& e) {
            // a sequence element faulted with no enclosing member to absorb it
            debug_log("encode degraded to null: ", e.what());
            return "null";
        }
    }

    bool is_placeholder(std::string_view text) {
        if (text == placeholder::circular || text == placeholder::max_depth || text == placeholder::host_object) {
            return true;
        }
        return text.starts_with(placeholder::host_prefix) && text.ends_with(']');
    }

}  // namespace galley::encoder

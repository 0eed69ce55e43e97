#pragma once

#include "core/utils.hpp"

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace egress {

/**
 * @brief Thin wrapper around glz::json_t for the JSON the egress core touches
 *
 * Stores json_t by value. Const operator[] returns copies, missing keys and
 * type mismatches yield null rather than throwing, which suits parsing
 * untrusted upstream responses.
 *
 * For mutation (workflow sanitizer), use raw() and convert back at the
 * boundary.
 */
class JsonValue {
public:
    using array_t = glz::json_t::array_t;
    using object_t = glz::json_t::object_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // ===== Constructors =====

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}
    JsonValue(std::nullptr_t) {}
    JsonValue(bool v) { data_ = v; }
    JsonValue(double v) { data_ = v; }
    JsonValue(const char* v) { data_ = std::string(v); }
    JsonValue(const std::string& v) { data_ = v; }

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }
    [[nodiscard]] bool is_number() const { return data_.is_number(); }
    [[nodiscard]] bool is_boolean() const { return data_.is_boolean(); }

    [[nodiscard]] size_t size() const { return data_.size(); }

    [[nodiscard]] bool contains(std::string_view key) const {
        if (!data_.is_object()) return false;
        const auto& obj = data_.get_object();
        return obj.find(std::string(key)) != obj.end();
    }

    // ===== Const Element Access (returns copy) =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it != obj.end()) return JsonValue(it->second);
        return {};
    }

    [[nodiscard]] JsonValue operator[](size_t idx) const {
        if (!data_.is_array()) return {};
        const auto& arr = data_.get_array();
        if (idx < arr.size()) return JsonValue(arr[idx]);
        return {};
    }

    /// Array elements (empty for non-arrays)
    [[nodiscard]] std::vector<JsonValue> elements() const {
        std::vector<JsonValue> out;
        if (!data_.is_array()) return out;
        const auto& arr = data_.get_array();
        out.reserve(arr.size());
        for (const auto& v : arr) out.emplace_back(v);
        return out;
    }

    // ===== Value Extraction =====

    template <typename T>
    [[nodiscard]] T get() const {
        if constexpr (std::is_same_v<T, std::string>) {
            return data_.get<std::string>();
        } else if constexpr (std::is_same_v<T, bool>) {
            return data_.get<bool>();
        } else if constexpr (std::is_same_v<T, double>) {
            return data_.get<double>();
        } else if constexpr (std::is_integral_v<T>) {
            // json_t stores all numbers as double; cast to target integral type
            return static_cast<T>(data_.get<double>());
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::get<T>()");
        }
    }

    /// String member or default; non-string members also yield the default
    [[nodiscard]] std::string string_or(std::string_view key, std::string default_value) const {
        const JsonValue v = (*this)[key];
        return v.is_string() ? v.get<std::string>() : std::move(default_value);
    }

    [[nodiscard]] std::optional<double> number(std::string_view key) const {
        const JsonValue v = (*this)[key];
        if (!v.is_number()) return std::nullopt;
        return v.get<double>();
    }

    // ===== Parse / Serialize =====

    [[nodiscard]] static JsonValue parse(const std::string& json_str) {
        glz::json_t result;
        auto ec = glz::read_json(result, json_str);
        if (ec) {
            throw parse_error("JSON parse error");
        }
        return JsonValue(std::move(result));
    }

    /// Compact serialization; `indent` > 0 pretty-prints.
    [[nodiscard]] std::string dump(int indent = 0) const {
        std::string out;
        dump_node(data_, out, indent, 0);
        return out;
    }

    // ===== Raw Access =====

    [[nodiscard]] glz::json_t& raw() { return data_; }
    [[nodiscard]] const glz::json_t& raw() const { return data_; }

private:
    static void newline(std::string& out, int indent, int depth) {
        if (indent <= 0) return;
        out += '\n';
        out.append(static_cast<size_t>(indent * depth), ' ');
    }

    static void dump_node(const glz::json_t& node, std::string& out, int indent, int depth) {
        if (node.is_null()) {
            out += "null";
        } else if (node.is_boolean()) {
            out += node.get<bool>() ? "true" : "false";
        } else if (node.is_number()) {
            const double d = node.get<double>();
            if (!std::isfinite(d)) {
                out += "null";
            } else if (d == std::floor(d) && std::fabs(d) < 9007199254740992.0) {
                out += std::format("{}", static_cast<int64_t>(d));
            } else {
                out += std::format("{}", d);
            }
        } else if (node.is_string()) {
            out += '"';
            out += utils::escape_json(node.get<std::string>());
            out += '"';
        } else if (node.is_array()) {
            const auto& arr = node.get_array();
            out += '[';
            for (size_t i = 0; i < arr.size(); ++i) {
                if (i > 0) out += ',';
                newline(out, indent, depth + 1);
                dump_node(arr[i], out, indent, depth + 1);
            }
            if (!arr.empty()) newline(out, indent, depth);
            out += ']';
        } else if (node.is_object()) {
            const auto& obj = node.get_object();
            out += '{';
            bool first = true;
            for (const auto& [key, value] : obj) {
                if (!first) out += ',';
                first = false;
                newline(out, indent, depth + 1);
                out += '"';
                out += utils::escape_json(key);
                out += indent > 0 ? "\": " : "\":";
                dump_node(value, out, indent, depth + 1);
            }
            if (!obj.empty()) newline(out, indent, depth);
            out += '}';
        }
    }

    glz::json_t data_{};
};

} // namespace egress

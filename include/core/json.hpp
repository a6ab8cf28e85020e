#pragma once

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace privguard {

/**
 * @brief Read-only wrapper around glz::json_t
 *
 * Stores json_t by value. Const operator[] returns copies. Used to navigate
 * model replies (entity lists, classifications, residual checks).
 */
class JsonValue {
public:
    using array_t = glz::json_t::array_t;
    using object_t = glz::json_t::object_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}

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

    // ===== Element Access =====

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

    template <typename T>
    [[nodiscard]] T get() const {
        if constexpr (std::is_same_v<T, std::string>) {
            return data_.get<std::string>();
        } else if constexpr (std::is_same_v<T, bool>) {
            return data_.get<bool>();
        } else if constexpr (std::is_same_v<T, double>) {
            return data_.get<double>();
        } else if constexpr (std::is_integral_v<T>) {
            return static_cast<T>(data_.get<double>());
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::get<T>()");
        }
    }

    /// Member lookup with fallback; also falls back on a type mismatch
    template <typename T>
    [[nodiscard]] T value(std::string_view key, T default_value) const {
        const JsonValue member = (*this)[key];
        if constexpr (std::is_same_v<T, std::string>) {
            return member.is_string() ? member.get<std::string>() : default_value;
        } else if constexpr (std::is_same_v<T, bool>) {
            return member.is_boolean() ? member.get<bool>() : default_value;
        } else {
            return member.is_number() ? member.get<T>() : default_value;
        }
    }

    /// Copies of the array elements (empty for non-arrays)
    [[nodiscard]] std::vector<JsonValue> elements() const {
        std::vector<JsonValue> out;
        if (!data_.is_array()) return out;
        const auto& arr = data_.get_array();
        out.reserve(arr.size());
        for (const auto& item : arr) {
            out.emplace_back(item);
        }
        return out;
    }

    [[nodiscard]] static JsonValue parse(const std::string& json_str) {
        glz::json_t result;
        auto ec = glz::read_json(result, json_str);
        if (ec) {
            throw parse_error("JSON parse error");
        }
        return JsonValue(std::move(result));
    }

    [[nodiscard]] const glz::json_t& raw() const { return data_; }

private:
    glz::json_t data_{};
};

} // namespace privguard

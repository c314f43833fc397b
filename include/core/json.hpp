#pragma once

#include <glaze/glaze.hpp>

#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace docredact {

/**
 * @brief Read-only view over a parsed glz::json_t document
 *
 * Used when reading JSON templates and suggestion-service responses.
 * Lookups on missing keys or wrong types yield a null value instead of
 * throwing, so callers validate with the is_* checks.
 */
class JsonValue {
public:
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

    // ===== Element Access (copies) =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        const auto it = obj.find(std::string(key));
        if (it == obj.end()) return {};
        return JsonValue(it->second);
    }

    [[nodiscard]] JsonValue operator[](size_t idx) const {
        if (!data_.is_array()) return {};
        const auto& arr = data_.get_array();
        if (idx >= arr.size()) return {};
        return JsonValue(arr[idx]);
    }

    [[nodiscard]] std::vector<JsonValue> elements() const {
        std::vector<JsonValue> out;
        if (!data_.is_array()) return out;
        for (const auto& v : data_.get_array()) out.emplace_back(v);
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
            return static_cast<T>(data_.get<double>());
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::get<T>()");
        }
    }

    // String member if present and a string; numbers are rendered as text
    [[nodiscard]] std::optional<std::string> optional_string(std::string_view key) const {
        const JsonValue v = (*this)[key];
        if (v.is_string()) return v.get<std::string>();
        if (v.is_number()) {
            const double d = v.get<double>();
            if (d == static_cast<double>(static_cast<long long>(d))) {
                return std::to_string(static_cast<long long>(d));
            }
            return std::to_string(d);
        }
        return std::nullopt;
    }

    [[nodiscard]] std::string string_or(std::string_view key, std::string fallback) const {
        auto v = optional_string(key);
        return v ? std::move(*v) : std::move(fallback);
    }

    [[nodiscard]] static JsonValue parse(const std::string& json_str) {
        glz::json_t result;
        const auto ec = glz::read_json(result, json_str);
        if (ec) {
            throw parse_error(std::format("JSON parse error: {}", glz::format_error(ec, json_str)));
        }
        return JsonValue(std::move(result));
    }

private:
    glz::json_t data_{};
};

} // namespace docredact

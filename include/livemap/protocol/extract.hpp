#pragma once

#include "livemap/protocol/errors.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace livemap::protocol {

/// JSON kind check and conversion for a scalar target type.
template <typename T> struct JsonKind;

template <> struct JsonKind<std::string> {
    static constexpr const char *kName = "string";
    static bool matches(const nlohmann::json &v) { return v.is_string(); }
    static std::string get(const nlohmann::json &v) { return v.get<std::string>(); }
};

template <> struct JsonKind<int64_t> {
    static constexpr const char *kName = "integer";
    // Unsigned values past INT64_MAX would wrap in get<int64_t>().
    static bool matches(const nlohmann::json &v) {
        if (v.is_number_unsigned()) {
            return v.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
        }
        return v.is_number_integer();
    }
    static int64_t get(const nlohmann::json &v) { return v.get<int64_t>(); }
};

template <> struct JsonKind<double> {
    static constexpr const char *kName = "number";
    static bool matches(const nlohmann::json &v) { return v.is_number(); }
    static double get(const nlohmann::json &v) { return v.get<double>(); }
};

template <> struct JsonKind<bool> {
    static constexpr const char *kName = "boolean";
    static bool matches(const nlohmann::json &v) { return v.is_boolean(); }
    static bool get(const nlohmann::json &v) { return v.get<bool>(); }
};

/// Per-target-type extraction policy. Each instance decides what a missing
/// key and a present value turn into.
/// Default: required field of a scalar kind.
template <typename T> struct FieldExtractor {
    static T missing(const std::string &name) { throw DecodeError::missing_property(name); }

    static T present(const std::string & /*name*/, const nlohmann::json &value) {
        if (!JsonKind<T>::matches(value)) {
            throw DecodeError::incorrect_value_type(JsonKind<T>::kName, value.dump(),
                                                    value.type_name());
        }
        return JsonKind<T>::get(value);
    }
};

/// Optional fields: missing or null yield no value, wrong kinds still fail.
template <typename T> struct FieldExtractor<std::optional<T>> {
    static std::optional<T> missing(const std::string & /*name*/) { return std::nullopt; }

    static std::optional<T> present(const std::string &name, const nlohmann::json &value) {
        if (value.is_null()) {
            return std::nullopt;
        }
        return FieldExtractor<T>::present(name, value);
    }
};

/// Flags default to false when absent or not a boolean.
template <> struct FieldExtractor<bool> {
    static bool missing(const std::string & /*name*/) { return false; }

    static bool present(const std::string & /*name*/, const nlohmann::json &value) {
        return value.is_boolean() && value.get<bool>();
    }
};

/// Extract a named property from a JSON object as T.
template <typename T> T extract(const nlohmann::json &object, const std::string &name) {
    const auto it = object.find(name);
    if (it == object.end()) {
        return FieldExtractor<T>::missing(name);
    }
    return FieldExtractor<T>::present(name, *it);
}

} // namespace livemap::protocol

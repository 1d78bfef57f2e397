/**
 * @file Value.hpp
 * @brief Dynamic value type validated by vetter
 *
 * Uses nlohmann::json as the underlying value model:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...})
 *
 * A property that is absent from its object is passed to rules as an
 * "undefined" value, represented by a discarded json value.
 */

#ifndef VETTER_VALUE_HPP
#define VETTER_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace vetter {

/**
 * @brief JSON-like value type
 *
 * Alias for nlohmann::json. See nlohmann::json documentation for the
 * complete API (type queries, get<T>(), iteration, comparison).
 */
using Value = nlohmann::json;

/**
 * @brief Make the value standing for an absent property
 */
inline Value undefined() {
    return Value(Value::value_t::discarded);
}

/**
 * @brief Check if value is the absent-property marker
 */
inline bool is_undefined(const Value& val) {
    return val.is_discarded();
}

/**
 * @brief Check if value is null or undefined
 */
inline bool is_nil(const Value& val) {
    return val.is_null() || val.is_discarded();
}

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object", "undefined")
 */
inline std::string type_name(const Value& val) {
    if (val.is_discarded()) return "undefined";
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

/**
 * @brief Check if value is a container (array or object)
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

} // namespace vetter

#endif // VETTER_VALUE_HPP

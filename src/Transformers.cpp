/**
 * @file Transformers.cpp
 * @brief Object, array and dynamic-map transformers
 */

#include "vetter/Transformers.hpp"
#include <algorithm>
#include <iterator>

namespace vetter {

// ============================================================================
// ObjectTransformer
// ============================================================================

ObjectTransformer::ObjectTransformer(ObjectSchema schema)
    : schema_(std::move(schema))
    , sorted_keys_(schema_.sorted_keys()) {}

Value ObjectTransformer::process(const Value& input, PathContext& context) const {
    if (!input.is_object()) {
        return input;
    }

    // nlohmann::json objects iterate in key order, so both sides are sorted
    std::vector<std::string> input_keys;
    input_keys.reserve(input.size());
    for (auto it = input.begin(); it != input.end(); ++it) {
        input_keys.push_back(it.key());
    }

    std::vector<std::string> unknown;
    std::set_difference(input_keys.begin(), input_keys.end(),
                        sorted_keys_.begin(), sorted_keys_.end(),
                        std::back_inserter(unknown));
    if (!unknown.empty()) {
        const std::string& key = unknown.front();
        ScopedSegment segment(context, key);
        raise_error(context, "'" + key + "'", kUnknownPropertyPrefix);
    }

    Value copy = Value::object();
    for (const auto& [key, rule] : schema_.entries()) {
        ScopedSegment segment(context, key);
        auto it = input.find(key);
        Value result = perform_property_rule(it != input.end() ? *it : undefined(),
                                             rule, context);
        // an absent property stays absent
        if (!is_undefined(result)) {
            copy[key] = std::move(result);
        }
    }
    return copy;
}

// ============================================================================
// ArrayTransformer
// ============================================================================

ArrayTransformer::ArrayTransformer(PropertyRule child_rule)
    : child_rule_(std::move(child_rule)) {}

Value ArrayTransformer::process(const Value& input, PathContext& context) const {
    if (!input.is_array()) {
        return input;
    }

    Value copy = Value::array();
    for (std::size_t i = 0; i < input.size(); ++i) {
        ScopedSegment segment(context, i);
        Value result = perform_property_rule(input[i], child_rule_, context);
        if (is_undefined(result)) {
            result = nullptr;
        }
        copy.push_back(std::move(result));
    }
    return copy;
}

// ============================================================================
// IndexedObjectTransformer
// ============================================================================

IndexedObjectTransformer::IndexedObjectTransformer(PropertyRule child_rule)
    : child_rule_(std::move(child_rule)) {}

Value IndexedObjectTransformer::process(const Value& input, PathContext& context) const {
    if (!input.is_object()) {
        return input;
    }

    Value copy = Value::object();
    for (auto it = input.begin(); it != input.end(); ++it) {
        ScopedSegment segment(context, it.key());
        Value result = perform_property_rule(it.value(), child_rule_, context);
        if (!is_undefined(result)) {
            copy[it.key()] = std::move(result);
        }
    }
    return copy;
}

} // namespace vetter

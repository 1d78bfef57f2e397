/**
 * @file Rule.cpp
 * @brief Rule construction and execution
 */

#include "vetter/Rule.hpp"
#include <stdexcept>

namespace vetter {

Rule::Rule(std::string description, Predicate predicate, Sanitizer sanitizer)
    : description_(std::move(description))
    , predicate_(std::move(predicate))
    , sanitizer_(std::move(sanitizer)) {
    if (!predicate_) {
        throw std::invalid_argument("Rule '" + description_ + "' has no predicate");
    }
}

Value perform_rule(Value value, const Rule& rule, PathContext& context,
                   const Transform& transform) {
    const Sanitizer& sanitizer = rule.sanitizer();

    if (sanitizer.before) {
        value = sanitizer.before(value);
    }

    if (!rule.test(value)) {
        raise_error(context, rule.description());
    }

    if (transform) {
        value = transform(value);
    }

    if (sanitizer.after) {
        value = sanitizer.after(value);
    }

    return value;
}

} // namespace vetter

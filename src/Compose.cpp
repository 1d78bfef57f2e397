/**
 * @file Compose.cpp
 * @brief Validator composition from command line choices
 */

#include "vetter/Compose.hpp"
#include "vetter/Rules.hpp"
#include <limits>
#include <stdexcept>

namespace vetter {

const std::vector<std::string>& rule_names() {
    static const std::vector<std::string> names = {
        "string", "boolean", "number", "integer", "object", "array", "any"
    };
    return names;
}

Rule rule_by_name(const std::string& name) {
    if (name == "string") return rules::string();
    if (name == "boolean") return rules::boolean();
    if (name == "number") return rules::number();
    if (name == "integer") return rules::integer();
    if (name == "object") return rules::object();
    if (name == "array") return rules::array();
    if (name == "any") return rules::any();
    throw std::invalid_argument("Unknown rule: '" + name + "'");
}

Validator compose_validator(const ComposeOptions& opts) {
    Rule base = rule_by_name(opts.rule);
    if (opts.trim) {
        base = rules::with_sanitizer(base, Sanitizer{rules::trim(), {}});
    }

    std::vector<Rule> extras;
    if (opts.min.has_value() || opts.max.has_value()) {
        double lo = opts.min.value_or(-std::numeric_limits<double>::infinity());
        double hi = opts.max.value_or(std::numeric_limits<double>::infinity());
        if (lo > hi) {
            throw std::invalid_argument("--min must not exceed --max");
        }
        extras.push_back(rules::range(lo, hi));
    }
    if (opts.pattern.has_value()) {
        extras.push_back(rules::matches(*opts.pattern));
    }

    Validator validator = Validator::regular(base);
    for (const auto& rule : extras) {
        validator = validator.extra(opts.nilable ? rules::allow_nil(rule) : rule);
    }
    if (opts.nilable) {
        validator = validator.nilable();
    }

    switch (opts.wrap) {
        case Wrap::Each:
            return validator.for_array();
        case Wrap::Map:
            return validator.for_indexed_object();
        case Wrap::None:
            break;
    }
    return validator;
}

} // namespace vetter

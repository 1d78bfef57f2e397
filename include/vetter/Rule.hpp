/**
 * @file Rule.hpp
 * @brief The atomic unit of validation
 *
 * A Rule pairs a human-readable description with a predicate, plus an
 * optional sanitizer applied before and/or after the predicate check.
 */

#ifndef VETTER_RULE_HPP
#define VETTER_RULE_HPP

#include "vetter/Value.hpp"
#include "vetter/Path.hpp"
#include <functional>
#include <string>

namespace vetter {

using Predicate = std::function<bool(const Value&)>;
using Transform = std::function<Value(const Value&)>;

/**
 * @brief Transforms applied around a predicate check
 *
 * Either member may be empty.
 */
struct Sanitizer {
    Transform before;
    Transform after;
};

/**
 * @brief Description + predicate + optional sanitizer
 *
 * Immutable once constructed.
 *
 * Example:
 * ```cpp
 * Rule positive{"positive", [](const Value& v) {
 *     return v.is_number() && v.get<double>() > 0;
 * }};
 * ```
 */
class Rule {
public:
    /**
     * @throws std::invalid_argument if predicate is empty
     */
    Rule(std::string description, Predicate predicate, Sanitizer sanitizer = {});

    const std::string& description() const noexcept { return description_; }
    const Predicate& predicate() const noexcept { return predicate_; }
    const Sanitizer& sanitizer() const noexcept { return sanitizer_; }

    /// Evaluate the predicate alone, no sanitizing
    bool test(const Value& value) const { return predicate_(value); }

private:
    std::string description_;
    Predicate predicate_;
    Sanitizer sanitizer_;
};

/**
 * @brief Execute one rule on a value
 *
 * Steps, in fixed order:
 * 1. apply sanitizer.before if present
 * 2. evaluate the predicate; raise "<path>: requires <description>" if false
 * 3. apply transform if supplied
 * 4. apply sanitizer.after if present
 *
 * @param value Value to check
 * @param rule Rule to apply
 * @param context Current traversal path, used for error messages
 * @param transform Structural step run between the check and sanitizer.after
 * @return The sanitized/transformed value
 * @throws ValidationError if the predicate rejects the value
 */
Value perform_rule(Value value, const Rule& rule, PathContext& context,
                   const Transform& transform = {});

} // namespace vetter

#endif // VETTER_RULE_HPP

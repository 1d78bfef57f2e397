/**
 * @file Validator.hpp
 * @brief Immutable composable validators
 *
 * A Validator is {primary rule, optional transformer, ordered extra rules}.
 * Every combinator returns a new Validator; the transformer and the extra
 * rule list are shared between a validator and the ones derived from it.
 *
 * Example:
 * ```cpp
 * auto name = Validator::regular(rules::string());
 * auto user = Validator::object({
 *     {"name", name},
 *     {"tags", name.for_array()},
 *     {"age",  Validator::regular(rules::integer()).extra(rules::range(0, 150)).nilable()},
 * });
 * Value clean = user.run(input, "user");
 * ```
 */

#ifndef VETTER_VALIDATOR_HPP
#define VETTER_VALIDATOR_HPP

#include "vetter/Value.hpp"
#include "vetter/Path.hpp"
#include "vetter/Rule.hpp"
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace vetter {

class Transformer;
class ObjectSchema;

class Validator {
public:
    /**
     * @brief Leaf validator: one rule, no transformer, no extra rules
     */
    static Validator regular(Rule rule);

    /**
     * @brief Strict object validator
     *
     * Primary rule "object"; the transformer rejects keys absent from
     * schema and rebuilds the object from the declared keys.
     */
    static Validator object(ObjectSchema schema);

    /// Validator over arrays whose elements satisfy this validator
    Validator for_array() const;

    /// Validator over objects with arbitrary keys whose values satisfy this validator
    Validator for_indexed_object() const;

    /// Same transformer and extra rules, new primary rule
    Validator alter(Rule rule) const;

    /**
     * @brief Accept null and undefined in addition to what this accepts
     *
     * Only the primary predicate changes. The sanitizer, the transformer
     * and the extra rules are carried over and still run on nil values.
     */
    Validator nilable() const;

    /// Append a rule run after the primary rule and its transform
    Validator extra(Rule rule) const;

    /**
     * @brief Validate and sanitize a value
     * @return Sanitized value; a new container when a transformer is present
     * @throws ValidationError on the first violation
     */
    Value run(const Value& value) const;

    /**
     * @brief Validate with a root label
     *
     * Errors are reported under scope, e.g. "root.user.name". An empty
     * scope adds no segment.
     */
    Value run(const Value& value, const std::string& scope) const;

    /// Validate on a caller-owned path (nested use)
    Value run(const Value& value, PathContext& context) const;

    /// Validate on a caller-owned path, pushing scope for the duration
    Value run(const Value& value, PathContext& context, const std::string& scope) const;

    const Rule& rule() const noexcept { return rule_; }
    bool has_transformer() const noexcept { return transformer_ != nullptr; }
    const std::vector<Rule>& extra_rules() const noexcept { return *extra_rules_; }

private:
    using RuleList = std::vector<Rule>;

    Validator(Rule rule,
              std::shared_ptr<const Transformer> transformer,
              std::shared_ptr<const RuleList> extra_rules);

    Value execute(const Value& value, PathContext& context) const;

    Rule rule_;
    std::shared_ptr<const Transformer> transformer_;
    std::shared_ptr<const RuleList> extra_rules_;
};

/**
 * @brief Rule applied to one property or element
 *
 * Closed set of variants:
 * - Rule: checked by perform_rule()
 * - Validator: run on the caller's path
 * - Transform: applied as-is, nothing is checked
 */
class PropertyRule {
public:
    using Variant = std::variant<Rule, Validator, Transform>;

    PropertyRule(Rule rule) : rule_(std::move(rule)) {}
    PropertyRule(Validator validator) : rule_(std::move(validator)) {}
    PropertyRule(Transform transform) : rule_(std::move(transform)) {}

    const Variant& get() const noexcept { return rule_; }

private:
    Variant rule_;
};

/**
 * @brief Run a property rule on a value
 *
 * The caller is responsible for pushing the property/index segment.
 */
Value perform_property_rule(const Value& value, const PropertyRule& rule,
                            PathContext& context);

/**
 * @brief Exhaustive, ordered mapping of property key to PropertyRule
 *
 * Every key a valid object may carry must be declared; optional keys are
 * declared with a nilable validator. Declaration order is processing order.
 */
class ObjectSchema {
public:
    using Entry = std::pair<std::string, PropertyRule>;

    ObjectSchema() = default;

    /**
     * @throws std::invalid_argument on a duplicate key
     */
    ObjectSchema(std::initializer_list<Entry> entries);

    /**
     * @brief Declare one more key
     * @throws std::invalid_argument if key is already declared
     */
    ObjectSchema& add(std::string key, PropertyRule rule);

    /// Rule declared for key, or nullptr
    const PropertyRule* find(const std::string& key) const;
    bool contains(const std::string& key) const { return find(key) != nullptr; }

    const std::vector<Entry>& entries() const noexcept { return entries_; }
    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    /// Declared keys, sorted
    std::vector<std::string> sorted_keys() const;

private:
    std::vector<Entry> entries_;
};

} // namespace vetter

#endif // VETTER_VALIDATOR_HPP

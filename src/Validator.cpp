/**
 * @file Validator.cpp
 * @brief Validator composition and execution
 */

#include "vetter/Validator.hpp"
#include "vetter/Transformers.hpp"
#include <algorithm>
#include <stdexcept>

namespace vetter {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

const std::shared_ptr<const std::vector<Rule>>& no_extra_rules() {
    static const auto empty = std::make_shared<const std::vector<Rule>>();
    return empty;
}

Rule object_rule() {
    return Rule("object", [](const Value& v) { return v.is_object(); });
}

Rule array_rule() {
    return Rule("array", [](const Value& v) { return v.is_array(); });
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

Validator::Validator(Rule rule,
                     std::shared_ptr<const Transformer> transformer,
                     std::shared_ptr<const RuleList> extra_rules)
    : rule_(std::move(rule))
    , transformer_(std::move(transformer))
    , extra_rules_(std::move(extra_rules)) {}

Validator Validator::regular(Rule rule) {
    return Validator(std::move(rule), nullptr, no_extra_rules());
}

Validator Validator::object(ObjectSchema schema) {
    return Validator(object_rule(),
                     std::make_shared<ObjectTransformer>(std::move(schema)),
                     no_extra_rules());
}

// ============================================================================
// Combinators
// ============================================================================

Validator Validator::for_array() const {
    return Validator(array_rule(),
                     std::make_shared<ArrayTransformer>(PropertyRule(*this)),
                     no_extra_rules());
}

Validator Validator::for_indexed_object() const {
    return Validator(object_rule(),
                     std::make_shared<IndexedObjectTransformer>(PropertyRule(*this)),
                     no_extra_rules());
}

Validator Validator::alter(Rule rule) const {
    return Validator(std::move(rule), transformer_, extra_rules_);
}

Validator Validator::nilable() const {
    Predicate inner = rule_.predicate();
    Rule rule(rule_.description(),
              [inner](const Value& v) { return is_nil(v) || inner(v); },
              rule_.sanitizer());
    return Validator(std::move(rule), transformer_, extra_rules_);
}

Validator Validator::extra(Rule rule) const {
    auto rules = std::make_shared<RuleList>(*extra_rules_);
    rules->push_back(std::move(rule));
    return Validator(rule_, transformer_, std::move(rules));
}

// ============================================================================
// Execution
// ============================================================================

Value Validator::run(const Value& value) const {
    PathContext context;
    return execute(value, context);
}

Value Validator::run(const Value& value, const std::string& scope) const {
    PathContext context;
    return run(value, context, scope);
}

Value Validator::run(const Value& value, PathContext& context) const {
    return execute(value, context);
}

Value Validator::run(const Value& value, PathContext& context, const std::string& scope) const {
    if (scope.empty()) {
        return execute(value, context);
    }
    ScopedSegment label(context, scope);
    return execute(value, context);
}

Value Validator::execute(const Value& value, PathContext& context) const {
    Transform transform;
    if (transformer_) {
        const Transformer* transformer = transformer_.get();
        transform = [transformer, &context](const Value& v) {
            return transformer->process(v, context);
        };
    }

    Value result = perform_rule(value, rule_, context, transform);
    for (const auto& extra_rule : *extra_rules_) {
        result = perform_rule(std::move(result), extra_rule, context);
    }
    return result;
}

// ============================================================================
// Property rules
// ============================================================================

Value perform_property_rule(const Value& value, const PropertyRule& rule,
                            PathContext& context) {
    return std::visit(overloaded{
        [&](const Rule& r) { return perform_rule(value, r, context); },
        [&](const Validator& v) { return v.run(value, context); },
        [&](const Transform& t) { return t(value); },
    }, rule.get());
}

// ============================================================================
// ObjectSchema
// ============================================================================

ObjectSchema::ObjectSchema(std::initializer_list<Entry> entries) {
    for (const auto& entry : entries) {
        add(entry.first, entry.second);
    }
}

ObjectSchema& ObjectSchema::add(std::string key, PropertyRule rule) {
    if (contains(key)) {
        throw std::invalid_argument("Duplicate schema key: '" + key + "'");
    }
    entries_.emplace_back(std::move(key), std::move(rule));
    return *this;
}

const PropertyRule* ObjectSchema::find(const std::string& key) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.first == key; });
    return it == entries_.end() ? nullptr : &it->second;
}

std::vector<std::string> ObjectSchema::sorted_keys() const {
    std::vector<std::string> keys;
    keys.reserve(entries_.size());
    for (const auto& entry : entries_) {
        keys.push_back(entry.first);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

} // namespace vetter

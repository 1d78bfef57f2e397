/**
 * @file Transformers.hpp
 * @brief Structural validation strategies for containers
 *
 * A transformer validates the children of a container against per-child
 * rules and rebuilds a sanitized copy. Transformers never mutate their
 * input.
 *
 * Contract: a transformer is only defined on its container type. Any other
 * input, including null and undefined reaching it through a nilable
 * validator, is returned unchanged.
 */

#ifndef VETTER_TRANSFORMERS_HPP
#define VETTER_TRANSFORMERS_HPP

#include "vetter/Validator.hpp"

namespace vetter {

class Transformer {
public:
    virtual ~Transformer() = default;

    /**
     * @brief Validate children and build a fresh container
     * @param input Value already accepted by the owning primary rule
     * @param context Current traversal path
     */
    virtual Value process(const Value& input, PathContext& context) const = 0;
};

/**
 * @brief Strict fixed-shape object
 *
 * Raises "unknown property '<key>'" for any input key missing from the
 * schema before any declared key is processed. Unknown keys are found by
 * set difference and the smallest one is reported.
 */
class ObjectTransformer : public Transformer {
public:
    explicit ObjectTransformer(ObjectSchema schema);

    Value process(const Value& input, PathContext& context) const override;

    const ObjectSchema& schema() const noexcept { return schema_; }

private:
    ObjectSchema schema_;
    std::vector<std::string> sorted_keys_;
};

/**
 * @brief Array whose elements all follow one rule
 */
class ArrayTransformer : public Transformer {
public:
    explicit ArrayTransformer(PropertyRule child_rule);

    Value process(const Value& input, PathContext& context) const override;

private:
    PropertyRule child_rule_;
};

/**
 * @brief Object with arbitrary keys whose values all follow one rule
 */
class IndexedObjectTransformer : public Transformer {
public:
    explicit IndexedObjectTransformer(PropertyRule child_rule);

    Value process(const Value& input, PathContext& context) const override;

private:
    PropertyRule child_rule_;
};

} // namespace vetter

#endif // VETTER_TRANSFORMERS_HPP

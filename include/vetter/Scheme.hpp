/**
 * @file Scheme.hpp
 * @brief Lightweight scheme checking without sanitizing
 *
 * A simpler sibling of Validator: walks a value along a nested scheme of
 * object fields, array elements and check functions. It returns the input
 * unchanged and does not reject undeclared object keys.
 *
 * Contexts are dotted, with array elements written "#<index>":
 * - "" (root), "user", "user.name", "tags.#2", "#0.id"
 *
 * Example:
 * ```cpp
 * Scheme point = Scheme::object({
 *     {"x", Scheme::check(number_check)},
 *     {"y", optional(Scheme::check(number_check))},
 * });
 * validate(doc, Scheme::array(point), "points");
 * ```
 */

#ifndef VETTER_SCHEME_HPP
#define VETTER_SCHEME_HPP

#include "vetter/Value.hpp"
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace vetter {

/**
 * @brief Check function: a non-empty return value is the error message
 */
using CheckFunc = std::function<std::string(const Value& value, const std::string& context)>;

class Scheme {
public:
    using Field = std::pair<std::string, Scheme>;

    enum class Kind {
        Check,
        Object,
        Array
    };

    static Scheme check(CheckFunc check);
    static Scheme object(std::vector<Field> fields);
    static Scheme array(Scheme element);

    Kind kind() const noexcept { return kind_; }

    /// @pre kind() == Kind::Check
    const CheckFunc& check_func() const { return check_; }

    /// @pre kind() == Kind::Object
    const std::vector<Field>& fields() const { return *fields_; }

    /// @pre kind() == Kind::Array
    const Scheme& element() const { return *element_; }

private:
    explicit Scheme(Kind kind) : kind_(kind) {}

    Kind kind_;
    CheckFunc check_;
    std::shared_ptr<const std::vector<Field>> fields_;
    std::shared_ptr<const Scheme> element_;
};

/**
 * @brief Check value against scheme
 *
 * - Array scheme: value must be an array ("expected array"); each element
 *   is checked with context "<context>.#<i>"
 * - Object scheme: value must be an object ("expected object"); each
 *   declared key is checked with context "<context>.<key>"; missing keys
 *   are checked as undefined; extra keys are ignored
 * - Check: a non-empty message is raised as is
 *
 * @param value Value to check
 * @param scheme Expected shape
 * @param context Context of value, "" for the root
 * @return value, unchanged
 * @throws SchemeError on the first violation
 */
Value validate(const Value& value, const Scheme& scheme, const std::string& context = "");

/// Check that lets undefined through and checks anything else against scheme
Scheme optional(Scheme scheme);

/// Check that lets null through and checks anything else against scheme
Scheme nullable(Scheme scheme);

/**
 * @brief Reusable holder of a scheme
 */
class SchemeValidator {
public:
    explicit SchemeValidator(Scheme scheme) : scheme_(std::move(scheme)) {}

    Value test(const Value& value, const std::string& context = "") const {
        return validate(value, scheme_, context);
    }

    const Scheme& scheme() const noexcept { return scheme_; }

private:
    Scheme scheme_;
};

} // namespace vetter

#endif // VETTER_SCHEME_HPP

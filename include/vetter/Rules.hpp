/**
 * @file Rules.hpp
 * @brief Ready-made rules and sanitizers
 *
 * Type rules:
 * - string(), boolean(), number(), integer(), object(), array(), any()
 *
 * Constraint rules (usually attached with Validator::extra()):
 * - non_empty(), range(min, max), min_length(n), max_length(n),
 *   matches(pattern), one_of(values)
 *
 * Sanitizers (Transform, no-ops on non-string values):
 * - trim(), lower()
 */

#ifndef VETTER_RULES_HPP
#define VETTER_RULES_HPP

#include "vetter/Rule.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace vetter {
namespace rules {

Rule string();
Rule boolean();
Rule number();
Rule integer();
Rule object();
Rule array();

/// Accepts anything, including undefined
Rule any();

/// Non-empty string, array or object
Rule non_empty();

/**
 * @brief Number within [min, max], bounds included
 *
 * Description: "in range [min, max]"
 */
Rule range(double min, double max);

/**
 * @brief String or array with at least n elements
 *
 * Strings are measured in bytes. Description: "length >= n"
 */
Rule min_length(std::size_t n);

/// String or array with at most n elements. Description: "length <= n"
Rule max_length(std::size_t n);

/**
 * @brief String containing a match of an ECMAScript regular expression
 *
 * Description: "matching /pattern/"
 * @throws std::invalid_argument if pattern does not compile
 */
Rule matches(const std::string& pattern);

/// Equal to one of values. Description: "one of [...]" (JSON rendering)
Rule one_of(std::vector<Value> values);

/// Same rule, also passing null and undefined
Rule allow_nil(const Rule& rule);

/// Same description and predicate with a different sanitizer
Rule with_sanitizer(const Rule& rule, Sanitizer sanitizer);

/// Strip leading/trailing ASCII whitespace from strings
Transform trim();

/// Lower-case ASCII letters of strings
Transform lower();

} // namespace rules
} // namespace vetter

#endif // VETTER_RULES_HPP

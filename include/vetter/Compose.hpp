/**
 * @file Compose.hpp
 * @brief Building a Validator from command line choices
 *
 * Used by the vetter command line tool. The composition order is:
 * 1. base rule by name, with the trim sanitizer when requested
 * 2. range / pattern extra rules
 * 3. nilable()
 * 4. for_array() or for_indexed_object()
 */

#ifndef VETTER_COMPOSE_HPP
#define VETTER_COMPOSE_HPP

#include "vetter/Validator.hpp"
#include <optional>
#include <string>
#include <vector>

namespace vetter {

enum class Wrap {
    None,
    Each,   ///< for_array()
    Map     ///< for_indexed_object()
};

/**
 * @brief Options for composing a validator
 */
struct ComposeOptions {
    std::string rule = "any";
    std::optional<double> min;
    std::optional<double> max;
    std::optional<std::string> pattern;
    bool trim = false;
    bool nilable = false;
    Wrap wrap = Wrap::None;
};

/**
 * @brief Stock type rule by name
 *
 * Names: string, boolean, number, integer, object, array, any
 *
 * @throws std::invalid_argument for an unknown name
 */
Rule rule_by_name(const std::string& name);

/// Names accepted by rule_by_name()
const std::vector<std::string>& rule_names();

/**
 * @brief Compose a validator from options
 *
 * With nilable set, the range and pattern rules also let nil values
 * through, since extra rules run after the nilable primary rule.
 *
 * @throws std::invalid_argument for an unknown rule name, min > max,
 *         or an invalid pattern
 */
Validator compose_validator(const ComposeOptions& opts);

} // namespace vetter

#endif // VETTER_COMPOSE_HPP

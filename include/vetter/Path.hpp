/**
 * @file Path.hpp
 * @brief Traversal path tracking for error reporting
 *
 * A PathContext is owned by one top-level Validator::run() call and passed
 * by reference through the recursive descent. Segments are pushed and
 * popped in strict LIFO order through ScopedSegment, so the context is
 * balanced again whenever a nested call returns or throws.
 *
 * Rendering rules:
 * - the first segment is unprefixed when it is a property name
 * - later property names are prefixed with '.'
 * - indices always render as "[n]"
 */

#ifndef VETTER_PATH_HPP
#define VETTER_PATH_HPP

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace vetter {

/**
 * @brief One step of a traversal path: a property name or an index
 */
using PathSegment = std::variant<std::string, std::size_t>;

/// Prefix used for predicate failures
inline constexpr const char* kRequiresPrefix = "requires";

/// Prefix used when a strict object meets an undeclared key
inline constexpr const char* kUnknownPropertyPrefix = "unknown property";

/**
 * @brief Ordered stack of path segments
 */
class PathContext {
public:
    PathContext() = default;

    void push(PathSegment segment);

    /**
     * @brief Remove the innermost segment
     * @throws std::logic_error if the context is empty
     */
    void pop();

    std::size_t size() const noexcept { return segments_.size(); }
    bool empty() const noexcept { return segments_.empty(); }
    const std::vector<PathSegment>& segments() const noexcept { return segments_; }

    /**
     * @brief Render the full path
     *
     * Examples:
     * - ["root", "user", "name"] → "root.user.name"
     * - [0] → "[0]"
     * - ["items", 2, "id"] → "items[2].id"
     * - [] → ""
     */
    std::string render() const;

private:
    std::vector<PathSegment> segments_;
};

/**
 * @brief RAII guard pushing one segment for its lifetime
 */
class ScopedSegment {
public:
    ScopedSegment(PathContext& context, PathSegment segment);
    ~ScopedSegment();

    ScopedSegment(const ScopedSegment&) = delete;
    ScopedSegment& operator=(const ScopedSegment&) = delete;

private:
    PathContext& context_;
};

/**
 * @brief Throw a ValidationError located at the current path
 *
 * The message is "<path>: <prefix> <description>".
 *
 * @param context Current traversal path
 * @param description Description of the violated rule
 * @param prefix Failure category
 * @throws ValidationError always
 */
[[noreturn]] void raise_error(const PathContext& context,
                              const std::string& description,
                              const std::string& prefix = kRequiresPrefix);

} // namespace vetter

#endif // VETTER_PATH_HPP

/**
 * @file Path.cpp
 * @brief Implementation of path tracking
 */

#include "vetter/Path.hpp"
#include "vetter/Errors.hpp"
#include <sstream>
#include <stdexcept>

namespace vetter {

void PathContext::push(PathSegment segment) {
    segments_.push_back(std::move(segment));
}

void PathContext::pop() {
    if (segments_.empty()) {
        throw std::logic_error("PathContext::pop() on empty path");
    }
    segments_.pop_back();
}

std::string PathContext::render() const {
    std::ostringstream oss;
    for (size_t i = 0; i < segments_.size(); ++i) {
        const auto& seg = segments_[i];
        if (const auto* index = std::get_if<std::size_t>(&seg)) {
            oss << '[' << *index << ']';
        } else {
            if (i > 0) oss << '.';
            oss << std::get<std::string>(seg);
        }
    }
    return oss.str();
}

ScopedSegment::ScopedSegment(PathContext& context, PathSegment segment)
    : context_(context) {
    context_.push(std::move(segment));
}

ScopedSegment::~ScopedSegment() {
    context_.pop();
}

void raise_error(const PathContext& context,
                 const std::string& description,
                 const std::string& prefix) {
    throw ValidationError(context.render(), prefix, description);
}

} // namespace vetter

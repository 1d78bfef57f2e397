/**
 * @file Rules.cpp
 * @brief Stock rules and sanitizers
 */

#include "vetter/Rules.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace vetter {
namespace rules {

namespace {

std::string format_number(double n) {
    std::ostringstream oss;
    oss << n;
    return oss.str();
}

bool has_size(const Value& v) {
    return v.is_string() || v.is_array() || v.is_object();
}

std::size_t size_of(const Value& v) {
    if (v.is_string()) return v.get_ref<const std::string&>().size();
    return v.size();
}

} // anonymous namespace

Rule string() {
    return Rule("string", [](const Value& v) { return v.is_string(); });
}

Rule boolean() {
    return Rule("boolean", [](const Value& v) { return v.is_boolean(); });
}

Rule number() {
    return Rule("number", [](const Value& v) { return v.is_number(); });
}

Rule integer() {
    return Rule("integer", [](const Value& v) { return v.is_number_integer(); });
}

Rule object() {
    return Rule("object", [](const Value& v) { return v.is_object(); });
}

Rule array() {
    return Rule("array", [](const Value& v) { return v.is_array(); });
}

Rule any() {
    return Rule("any value", [](const Value&) { return true; });
}

Rule non_empty() {
    return Rule("non-empty value", [](const Value& v) {
        return has_size(v) && size_of(v) > 0;
    });
}

Rule range(double min, double max) {
    return Rule("in range [" + format_number(min) + ", " + format_number(max) + "]",
                [min, max](const Value& v) {
                    if (!v.is_number()) return false;
                    const double n = v.get<double>();
                    return n >= min && n <= max;
                });
}

Rule min_length(std::size_t n) {
    return Rule("length >= " + std::to_string(n), [n](const Value& v) {
        return (v.is_string() || v.is_array()) && size_of(v) >= n;
    });
}

Rule max_length(std::size_t n) {
    return Rule("length <= " + std::to_string(n), [n](const Value& v) {
        return (v.is_string() || v.is_array()) && size_of(v) <= n;
    });
}

Rule matches(const std::string& pattern) {
    std::regex re;
    try {
        re = std::regex(pattern, std::regex_constants::ECMAScript);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("Invalid pattern '" + pattern + "': " + e.what());
    }
    return Rule("matching /" + pattern + "/", [re](const Value& v) {
        return v.is_string() && std::regex_search(v.get_ref<const std::string&>(), re);
    });
}

Rule one_of(std::vector<Value> values) {
    Value listed = Value::array();
    for (const auto& v : values) listed.push_back(v);
    return Rule("one of " + listed.dump(), [values = std::move(values)](const Value& v) {
        return std::find(values.begin(), values.end(), v) != values.end();
    });
}

Rule allow_nil(const Rule& rule) {
    Predicate inner = rule.predicate();
    return Rule(rule.description(),
                [inner](const Value& v) { return is_nil(v) || inner(v); },
                rule.sanitizer());
}

Rule with_sanitizer(const Rule& rule, Sanitizer sanitizer) {
    return Rule(rule.description(), rule.predicate(), std::move(sanitizer));
}

Transform trim() {
    return [](const Value& v) -> Value {
        if (!v.is_string()) return v;
        const auto& s = v.get_ref<const std::string&>();
        auto start = s.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        auto end = s.find_last_not_of(" \t\r\n");
        return s.substr(start, end - start + 1);
    };
}

Transform lower() {
    return [](const Value& v) -> Value {
        if (!v.is_string()) return v;
        std::string result = v.get<std::string>();
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return result;
    };
}

} // namespace rules
} // namespace vetter

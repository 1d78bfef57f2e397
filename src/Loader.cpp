/**
 * @file Loader.cpp
 * @brief Document loading implementation
 */

#include "vetter/Loader.hpp"
#include "vetter/Errors.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace vetter {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

template <typename T>
Value streamed_string(const T& v) {
    std::ostringstream ss;
    ss << v;
    return Value(ss.str());
}

/**
 * @brief Convert toml++ node to nlohmann::json.
 */
Value toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date:
            return streamed_string(node.as_date()->get());

        case toml::node_type::time:
            return streamed_string(node.as_time()->get());

        case toml::node_type::date_time:
            return streamed_string(node.as_date_time()->get());

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

Value parse_json_text(const std::string& text, const std::string& source_name) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw DocumentParseError(source_name, 0, 0, e.what());
    }
}

Value parse_toml_text(const std::string& text, const std::string& source_name) {
    try {
        toml::table table = toml::parse(text, source_name);
        return toml_value_to_json(table);
    } catch (const toml::parse_error& e) {
        throw DocumentParseError(
            source_name,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }
}

} // anonymous namespace

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    return parse_json_text(read_file(path), path);
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    return parse_toml_text(read_file(path), path);
}

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

Value load_document(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    } else if (ext == ".toml") {
        return load_toml_file(path);
    } else {
        throw std::runtime_error(
            "Unsupported document type: " + ext + " (expected .json or .toml)"
        );
    }
}

Value parse_document(const std::string& text, DocumentFormat format,
                     const std::string& source_name) {
    switch (format) {
        case DocumentFormat::Json:
            return parse_json_text(text, source_name);
        case DocumentFormat::Toml:
            return parse_toml_text(text, source_name);
    }
    throw std::invalid_argument("Unknown document format");
}

} // namespace vetter

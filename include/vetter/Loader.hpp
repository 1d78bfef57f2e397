/**
 * @file Loader.hpp
 * @brief Loading documents to validate
 *
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++); tables become objects, dates and times
 *   become strings
 */

#ifndef VETTER_LOADER_HPP
#define VETTER_LOADER_HPP

#include "vetter/Value.hpp"
#include <string>

namespace vetter {

enum class DocumentFormat {
    Json,
    Toml
};

/**
 * @brief Load a JSON file
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a TOML file
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a document, detecting the format by extension
 *
 * ".json" → JSON, ".toml" → TOML (case-insensitive).
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError if file has syntax errors
 * @throws std::runtime_error if extension is not .json or .toml
 */
Value load_document(const std::string& path);

/**
 * @brief Parse in-memory text
 * @param text Document text
 * @param format Syntax of text
 * @param source_name Name used in parse errors
 * @throws DocumentParseError on syntax errors
 */
Value parse_document(const std::string& text, DocumentFormat format,
                     const std::string& source_name = "<string>");

/**
 * @brief Get file extension (lowercase), including the dot
 */
std::string get_file_extension(const std::string& path);

} // namespace vetter

#endif // VETTER_LOADER_HPP

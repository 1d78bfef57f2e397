/**
 * @file Errors.hpp
 * @brief Exception types raised by vetter
 *
 * - VetterError: Base class
 * - ValidationError: A rule rejected a value (the "invalid" error)
 * - SchemeError: The lightweight scheme walker rejected a value
 * - FileNotFoundError: Document file not found
 * - DocumentParseError: JSON/TOML syntax errors
 */

#ifndef VETTER_ERRORS_HPP
#define VETTER_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace vetter {

/**
 * @brief Base class for all vetter exceptions
 */
class VetterError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A value violated a rule
 *
 * The message has the exact shape "<path>: <prefix> <description>",
 * e.g. "root.user.name: requires string" or "b: unknown property 'b'".
 */
class ValidationError : public VetterError {
public:
    /**
     * @brief Construct from the rendered path and the failing rule
     * @param path Rendered traversal path (may be empty)
     * @param prefix Failure category ("requires", "unknown property")
     * @param description Rule description
     */
    ValidationError(std::string path, std::string prefix, std::string description)
        : VetterError(path + ": " + prefix + " " + description)
        , path_(std::move(path))
        , prefix_(std::move(prefix))
        , description_(std::move(description))
    {}

    /**
     * @brief Get the rendered path of the rejected value
     */
    const std::string& path() const noexcept {
        return path_;
    }

    /**
     * @brief Get the failure category
     */
    const std::string& prefix() const noexcept {
        return prefix_;
    }

    /**
     * @brief Get the description of the violated rule
     */
    const std::string& description() const noexcept {
        return description_;
    }

private:
    std::string path_;
    std::string prefix_;
    std::string description_;
};

/**
 * @brief Error raised by validate() for a scheme violation
 */
class SchemeError : public VetterError {
public:
    /**
     * @brief Construct with message and context
     * @param message Message returned by the failing check
     * @param context Dotted context of the value ("" at the root)
     */
    SchemeError(const std::string& message, std::string context)
        : VetterError(message)
        , context_(std::move(context))
    {}

    /**
     * @brief Get the dotted context of the rejected value
     */
    const std::string& context() const noexcept {
        return context_;
    }

private:
    std::string context_;
};

/**
 * @brief Document file not found
 */
class FileNotFoundError : public VetterError {
public:
    explicit FileNotFoundError(std::string path)
        : VetterError("Document file not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Document parse error (JSON/TOML syntax)
 *
 * Line and column are 1-based; 0 when the parser did not report them.
 */
class DocumentParseError : public VetterError {
public:
    DocumentParseError(std::string file, int line, int column, std::string details)
        : VetterError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    int line() const noexcept {
        return line_;
    }

    int column() const noexcept {
        return column_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line, int column,
                                      const std::string& details) {
        std::string msg = "Parse error in '" + file + "'";
        if (line > 0) {
            msg += " at line " + std::to_string(line) + ", column " + std::to_string(column);
        }
        return msg + ": " + details;
    }
};

} // namespace vetter

#endif // VETTER_ERRORS_HPP

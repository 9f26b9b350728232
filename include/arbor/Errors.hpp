/**
 * @file Errors.hpp
 * @brief Exception types for arbor
 *
 * Error taxonomy:
 * - ArborError: Base class
 * - PathSyntaxError: Malformed path text (the only failure of the core)
 * - KindError: Typed accessor called on a value of another kind
 * - FileNotFoundError: Document file not found
 * - DocumentParseError: JSON/TOML syntax errors
 * - UnsupportedFormatError: Document extension is neither .json nor .toml
 *
 * Absence is never an error: reads return Undefined, a fallback or false.
 */

#ifndef ARBOR_ERRORS_HPP
#define ARBOR_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace arbor {

/**
 * @brief Base class for all arbor exceptions
 */
class ArborError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Path text could not be parsed into keys
 *
 * Raised by parse_path() before any tree is touched, so a write that
 * fails with this error has not allocated or mutated anything.
 */
class PathSyntaxError : public ArborError {
public:
    /**
     * @brief Construct with the path text and error location
     * @param text The full path text being parsed
     * @param position Zero-based offset of the offending character
     * @param details What was expected at that position
     */
    PathSyntaxError(std::string text, std::size_t position, std::string details)
        : ArborError("Invalid path '" + text + "' at position " +
                     std::to_string(position) + ": " + details)
        , text_(std::move(text))
        , position_(position)
        , details_(std::move(details))
    {}

    /**
     * @brief Get the path text that failed to parse
     */
    const std::string& text() const noexcept {
        return text_;
    }

    /**
     * @brief Get the offset of the offending character
     */
    std::size_t position() const noexcept {
        return position_;
    }

    /**
     * @brief Get the detailed error message
     */
    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string text_;
    std::size_t position_;
    std::string details_;
};

/**
 * @brief A typed accessor was called on a value of another kind
 *
 * For example calling as_integer() on a string value.
 */
class KindError : public ArborError {
public:
    /**
     * @brief Construct with expected and actual kind names
     * @param expected Kind the accessor requires (e.g., "sequence")
     * @param actual Kind of the value (e.g., "string")
     */
    KindError(std::string expected, std::string actual)
        : ArborError("Expected " + expected + " but value is " + actual)
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string expected_;
    std::string actual_;
};

/**
 * @brief Document file not found
 */
class FileNotFoundError : public ArborError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : ArborError("Document file not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Document parse error (JSON/TOML syntax)
 *
 * Line and column are 1-based; 0 means the parser did not report one.
 */
class DocumentParseError : public ArborError {
public:
    DocumentParseError(std::string file, int line, int column, std::string details)
        : ArborError(format_message(file, line, column, details))
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

    static std::string format_message(const std::string& file, int line,
                                      int column, const std::string& details) {
        std::string msg = "Parse error in '" + file + "'";
        if (line > 0) {
            msg += " at line " + std::to_string(line);
            if (column > 0) {
                msg += ", column " + std::to_string(column);
            }
        }
        return msg + ": " + details;
    }
};

/**
 * @brief Document file has an extension arbor cannot read
 */
class UnsupportedFormatError : public ArborError {
public:
    UnsupportedFormatError(std::string path, std::string extension)
        : ArborError("Unsupported document type '" + extension + "' for " + path +
                     " (expected .json or .toml)")
        , path_(std::move(path))
        , extension_(std::move(extension))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& extension() const noexcept {
        return extension_;
    }

private:
    std::string path_;
    std::string extension_;
};

} // namespace arbor

#endif // ARBOR_ERRORS_HPP

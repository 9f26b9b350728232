/**
 * @file Document.hpp
 * @brief Reading and writing trees as JSON/TOML documents
 *
 * Loads documents into Value trees:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 *
 * and writes trees back out as JSON.
 */

#ifndef ARBOR_DOCUMENT_HPP
#define ARBOR_DOCUMENT_HPP

#include "arbor/Value.hpp"

#include <string>

namespace arbor {

// ============================================================================
// JSON
// ============================================================================

/**
 * @brief Parse JSON text into a tree
 *
 * @param text JSON document text
 * @param source Name used in error messages
 * @return Parsed tree
 * @throws DocumentParseError if the JSON syntax is invalid
 */
Value parse_json_text(const std::string& text, const std::string& source = "<string>");

/**
 * @brief Parse @p raw as JSON when it is valid JSON, else take it as a string
 *
 * Used for values typed on the command line: "42" is an integer,
 * "[1,2]" a sequence, "hello" the string "hello".
 */
Value parse_json_or_string(const std::string& raw);

/**
 * @brief Load a tree from a JSON file
 *
 * @param path Path to the JSON file
 * @return Parsed tree
 * @throws FileNotFoundError if the file doesn't exist
 * @throws DocumentParseError if the JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

// ============================================================================
// TOML
// ============================================================================

/**
 * @brief Load a tree from a TOML file
 *
 * Tables become plain mappings and arrays sequences. Offset date-times,
 * local date-times and local dates become Date leaves (local values are
 * read as UTC); local times become strings.
 *
 * @param path Path to the TOML file
 * @return Parsed tree (always a mapping)
 * @throws FileNotFoundError if the file doesn't exist
 * @throws DocumentParseError if the TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

// ============================================================================
// Auto-detect
// ============================================================================

/**
 * @brief Lower-cased extension of @p path including the dot, e.g. ".json"
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Load a document, choosing the format by extension
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws UnsupportedFormatError if the extension is not .json or .toml
 * @throws DocumentParseError on syntax errors
 */
Value load_document(const std::string& path);

// ============================================================================
// Output
// ============================================================================

/**
 * @brief Serialize a tree as JSON text
 * @param indent Spaces per level; negative for a single line
 */
std::string dump_json(const Value& value, int indent = 2);

/**
 * @brief Write a tree to a JSON file, replacing its contents
 * @throws ArborError if the file cannot be opened for writing
 */
void write_json_file(const std::string& path, const Value& value, int indent = 2);

} // namespace arbor

#endif // ARBOR_DOCUMENT_HPP

/**
 * @file Json.hpp
 * @brief Conversion between arbor::Value and nlohmann::json
 *
 * Uses nlohmann::ordered_json so mapping field order survives a round
 * trip.
 *
 * Value -> JSON:
 * - Undefined fields are omitted from objects, Undefined elements become
 *   null, a top-level Undefined becomes null
 * - Dates become ISO-8601 UTC strings ("2024-03-01T00:00:00.000Z")
 * - Regexes become "/pattern/flags" strings
 * - Mappings of every shape become objects
 *
 * JSON -> Value:
 * - Objects become plain mappings, arrays sequences
 * - Unsigned integers above INT64_MAX become floats
 * - Strings stay strings (no date detection)
 */

#ifndef ARBOR_JSON_HPP
#define ARBOR_JSON_HPP

#include "arbor/Value.hpp"

#include <nlohmann/json.hpp>

namespace arbor {

/**
 * @brief JSON document type used at arbor's boundaries
 */
using Json = nlohmann::ordered_json;

/**
 * @brief Convert a tree to JSON
 */
Json to_json(const Value& value);

/**
 * @brief Convert JSON to a tree
 */
Value from_json(const Json& json);

// nlohmann ADL hooks, so `Json j = value;` and `j.get<Value>()` work
void to_json(Json& json, const Value& value);
void from_json(const Json& json, Value& value);

} // namespace arbor

#endif // ARBOR_JSON_HPP

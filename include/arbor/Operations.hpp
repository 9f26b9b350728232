/**
 * @file Operations.hpp
 * @brief Public path-addressed read and write operations
 *
 * Every operation takes its path as text ("a.b[0]") or as keys
 * ({"a", "b", 0}). Text is parsed before anything else happens, so a
 * PathSyntaxError never leaves a partial result behind.
 *
 * Writes return a new root and leave the given root untouched. Only the
 * containers on the path to the edited position are copied; every other
 * subtree of the new root is the same instance as in the old root:
 *
 * ```cpp
 * Value tree = Value::mapping({
 *     {"a", Value::mapping({{"b", 1}})},
 *     {"c", Value::mapping({{"d", 2}})}
 * });
 * Value next = set("a.b", 99, tree);
 *
 * get("a.b", tree);                                     // 1
 * get("a.b", next);                                     // 99
 * Value::identical(get("c", next), get("c", tree));     // true
 * ```
 *
 * An empty path addresses the root itself.
 */

#ifndef ARBOR_OPERATIONS_HPP
#define ARBOR_OPERATIONS_HPP

#include "arbor/Path.hpp"
#include "arbor/Value.hpp"

#include <functional>

namespace arbor {

/**
 * @brief Transform applied by update() to the value at a path
 */
using Updater = std::function<Value(const Value& current)>;

// ============================================================================
// Reads
// ============================================================================

/**
 * @brief Value at @p path, or Undefined when the path does not exist
 */
Value get(const PathArg& path, const Value& root);

/**
 * @brief Value at @p path, or @p fallback when it is Undefined
 */
Value get_or(const Value& fallback, const PathArg& path, const Value& root);

/**
 * @brief Does @p path lead to a value that is not Undefined?
 *
 * A null at the path counts as present.
 */
bool has(const PathArg& path, const Value& root);

/**
 * @brief Is the value at @p path identical to @p value?
 *
 * Containers compare by instance, leaves by value (NaN matches NaN).
 */
bool is(const PathArg& path, const Value& value, const Value& root);

// ============================================================================
// Writes
// ============================================================================

/**
 * @brief New root with @p value stored at @p path
 *
 * Missing containers along the path are created: a sequence when the
 * next key is an index, a mapping when it is a name. An existing
 * container of the wrong kind is replaced, not converted.
 */
Value set(const PathArg& path, const Value& value, const Value& root);

/**
 * @brief New root with @p fn applied to the value at @p path
 *
 * @p fn receives Undefined when the path does not exist yet.
 */
Value update(const PathArg& path, const Updater& fn, const Value& root);

/**
 * @brief New root without the value at @p path
 *
 * Mapping fields are deleted; sequence elements are spliced out and later
 * elements shift down. When the path does not exist @p root itself is
 * returned. An empty path yields an empty container of the root's kind.
 */
Value remove(const PathArg& path, const Value& root);

/**
 * @brief New root with @p value appended to the sequence at @p path
 *
 * When the value at @p path is not a sequence this behaves like set().
 */
Value add(const PathArg& path, const Value& value, const Value& root);

/**
 * @brief New root with @p value shallow-merged into the value at @p path
 * @see shallow_merge()
 */
Value assign(const PathArg& path, const Value& value, const Value& root);

/**
 * @brief Deep merge of two whole trees
 * @see deep_merge()
 */
Value merge(const Value& base, const Value& override_val);

/**
 * @brief New root with @p value deep-merged into the value at @p path
 *
 * A @p value that is not cloneable replaces the value at @p path.
 */
Value merge_at(const PathArg& path, const Value& value, const Value& root);

} // namespace arbor

#endif // ARBOR_OPERATIONS_HPP

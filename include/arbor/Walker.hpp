/**
 * @file Walker.hpp
 * @brief Path walker: the one traversal behind every path operation
 *
 * on_match_at_path() walks a path through a tree in one of two modes:
 *
 * - Read mode (should_clone = false): descends through existing children
 *   only. Stops with @p no_match as soon as a step is absent, without
 *   allocating. At the last key it returns whatever the handler returns.
 *
 * - Write mode (should_clone = true): the root passed in must already be
 *   a container owned by the caller. Each intermediate step replaces the
 *   child with child_clone_or_fresh() and recurses, so every ancestor of
 *   the target is a shallow clone and every other subtree is shared. At
 *   the last key the handler edits the owned container in place.
 *
 * get_nested_property(), has_nested_property() and get_deep_clone() are
 * the three primitives built on it.
 */

#ifndef ARBOR_WALKER_HPP
#define ARBOR_WALKER_HPP

#include "arbor/Path.hpp"
#include "arbor/Value.hpp"

#include <cstddef>
#include <functional>

namespace arbor {

/**
 * @brief Terminal callback: receives the container holding the last key
 *        and the last key itself
 */
using MatchHandler = std::function<Value(Value& container, const Key& key)>;

/**
 * @brief Terminal edit for write mode; the container is owned by the walk
 */
using EditHandler = std::function<void(Value& container, const Key& key)>;

/**
 * @brief Walk @p path through @p object and run @p on_match at the end
 *
 * @param path Keys to walk; must not be empty
 * @param object Current node (in write mode, an owned container)
 * @param on_match Terminal callback
 * @param should_clone Write mode when true, read mode when false
 * @param no_match Result when read mode cannot reach the last key
 * @param index Position in @p path of the key to process
 * @return Read mode: the handler's result or @p no_match.
 *         Write mode: @p object after the edit.
 */
Value on_match_at_path(const Path& path,
                       Value object,
                       const MatchHandler& on_match,
                       bool should_clone,
                       const Value& no_match = Value(),
                       std::size_t index = 0);

/**
 * @brief Value at @p path, or Undefined when any step is absent
 *
 * An empty path addresses @p root itself.
 */
Value get_nested_property(const Path& path, const Value& root);

/**
 * @brief Value at @p path, or @p fallback when it is Undefined
 *
 * Null is a value: a null at the path is returned, not the fallback.
 */
Value get_nested_property_or(const Path& path, const Value& root, const Value& fallback);

/**
 * @brief Does @p path lead to a value that is not Undefined?
 *
 * ```cpp
 * has_nested_property({"a", "b"}, Value::mapping({{"a", Value::mapping()}})); // false
 * has_nested_property({"a"}, Value::mapping({{"a", nullptr}}));              // true
 * ```
 */
bool has_nested_property(const Path& path, const Value& root);

/**
 * @brief Copy-on-write edit at @p path
 *
 * The first clone is shallow_clone(root) when the root is cloneable and
 * of the kind path[0] addresses, otherwise an empty container for
 * path[0]. A mapping root keeps its fields under an index key, which
 * names the field by its decimal text. The walker then clones or
 * creates every container down to the parent of the last key and calls
 * @p on_match with that parent and the last key. @p root is never
 * modified.
 *
 * @param path Keys to the edited position; must not be empty
 * @param root Original tree
 * @param on_match Edit applied to the cloned parent container
 * @return The new root
 */
Value get_deep_clone(const Path& path, const Value& root, const EditHandler& on_match);

// ============================================================================
// Terminal edits (owned containers only)
// ============================================================================

/**
 * @brief Store @p value at @p key in an owned container
 *
 * Sequences grow with Undefined holes when the index is past the end; a
 * name that is not a canonical index is ignored on a sequence. Mappings
 * store under key.to_string(). Leaves are left unchanged.
 */
void assign_child(Value& container, const Key& key, Value value);

/**
 * @brief Does @p container hold an entry at @p key?
 *
 * True for a mapping field even when it holds Undefined.
 */
bool has_child(const Value& container, const Key& key);

/**
 * @brief Remove @p key from an owned container
 *
 * Sequence elements are spliced out, shifting later elements down.
 *
 * @return true if something was removed
 */
bool erase_child(Value& container, const Key& key);

} // namespace arbor

#endif // ARBOR_WALKER_HPP

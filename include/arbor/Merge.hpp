/**
 * @file Merge.hpp
 * @brief Deep and shallow merging of whole trees
 *
 * Merging never modifies either operand. Leaves and non-cloneable values
 * are shared by reference with the operands.
 */

#ifndef ARBOR_MERGE_HPP
#define ARBOR_MERGE_HPP

#include "arbor/Value.hpp"

#include <vector>

namespace arbor {

/**
 * @brief Deep merge two trees
 *
 * Merging rules:
 * - Sequence vs non-sequence: the override wins outright, cloned when
 *   cloneable; no field-level merge
 * - Both sequences: concatenation; base elements as they are, then each
 *   override element through clone_if_possible()
 * - Otherwise: a new plain mapping with every base field (cloned when
 *   cloneable) in base order, then each override field in override
 *   order. A cloneable override field is merged recursively with the base
 *   field (an absent base field acts as an empty container); any other
 *   override field replaces the base field as-is. Operands that are not
 *   mappings contribute no fields.
 *
 * @param base Base tree (lower precedence)
 * @param override_val Override tree (higher precedence)
 * @return Merged tree
 *
 * Examples:
 * ```cpp
 * // Nested mappings are merged
 * deep_merge({a: {x: 1}}, {a: {y: 2}});    // {a: {x: 1, y: 2}}
 *
 * // Sequences concatenate
 * deep_merge([1, 2], [3, 4]);              // [1, 2, 3, 4]
 *
 * // Kind conflict: override wins
 * deep_merge({a: 1}, [1, 2]);              // [1, 2]
 * ```
 */
Value deep_merge(const Value& base, const Value& override_val);

/**
 * @brief Deep merge several trees in order
 *
 * Applies each source in sequence from lowest to highest precedence.
 *
 * @param sources Trees to merge (in precedence order)
 * @return Merged result; an empty plain mapping when @p sources is empty
 */
Value deep_merge_all(const std::vector<Value>& sources);

/**
 * @brief One-level merge
 *
 * - Override not cloneable: the override itself
 * - Base not cloneable, or kinds differ: clone_if_possible(override)
 * - Both sequences: base clone with override elements written over the
 *   same positions
 * - Both mappings: base clone (same shape) with override fields set on
 *   top, without recursing
 */
Value shallow_merge(const Value& base, const Value& override_val);

} // namespace arbor

#endif // ARBOR_MERGE_HPP

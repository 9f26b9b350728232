/**
 * @file Factory.hpp
 * @brief Container factory: fresh empties and shallow clones
 *
 * Every container returned here is newly allocated and owned only by the
 * caller, so the caller may edit it through detail::Edit before handing
 * it out. Elements and field values inside a clone are shared with the
 * source container.
 */

#ifndef ARBOR_FACTORY_HPP
#define ARBOR_FACTORY_HPP

#include "arbor/Path.hpp"
#include "arbor/Value.hpp"

namespace arbor {

/**
 * @brief Empty container for the kind of key that will address it
 * @return Empty sequence for an index, empty plain mapping for a name
 */
Value empty_container_for_key(const Key& key);

/**
 * @brief Empty container of the same kind as @p node
 * @return Empty sequence if @p node is a sequence, else empty plain mapping
 */
Value empty_container_like(const Value& node);

/**
 * @brief One-level copy of a cloneable container
 *
 * - Sequence: new sequence, same elements in the same order
 * - Plain or record mapping: new mapping of the same shape, same fields
 *   in the same order
 * - Native mapping: empty plain mapping (the shape cannot be rebuilt)
 *
 * Non-cloneable values are returned unchanged; callers that need a fresh
 * container should use clone_if_possible() or check is_cloneable() first.
 */
Value shallow_clone(const Value& node);

/**
 * @brief Shallow clone when cloneable, otherwise the value itself
 */
Value clone_if_possible(const Value& value);

/**
 * @brief Container to descend into when writing through @p existing_child
 *
 * Returns a shallow clone of @p existing_child when it is cloneable and its
 * kind matches the kind @p next_key needs (index -> sequence,
 * name -> mapping). Otherwise returns a fresh empty container for
 * @p next_key; a mismatched subtree is dropped, not converted.
 */
Value child_clone_or_fresh(const Value& existing_child, const Key& next_key);

} // namespace arbor

#endif // ARBOR_FACTORY_HPP

/**
 * @file Classify.hpp
 * @brief Cloneability classifier
 *
 * Decides whether a value is a container that may be shallow-cloned and
 * merged, or an opaque leaf that is always shared as-is.
 */

#ifndef ARBOR_CLASSIFY_HPP
#define ARBOR_CLASSIFY_HPP

#include "arbor/Value.hpp"

namespace arbor {

/**
 * @brief Can the value be cloned and merged?
 *
 * True for sequences and for mappings whose shape is not atomic.
 * Scalars, dates, regexes, Undefined, null and element-shaped mappings
 * are leaves.
 *
 * ```cpp
 * is_cloneable(Value::sequence({1}));                        // true
 * is_cloneable(Value::mapping({}));                          // true
 * is_cloneable(Value(Date{0}));                              // false
 * is_cloneable(Value::mapping({}, Shape::element()));        // false
 * ```
 */
bool is_cloneable(const Value& value) noexcept;

/**
 * @brief Is the value "nothing to act on"?
 *
 * True for Undefined, null, and a sequence with no elements. Empty
 * mappings are not empty keys.
 */
bool is_empty_key(const Value& value) noexcept;

/**
 * @brief Sequence test used for the sequence-vs-mapping decisions of the
 *        factory and the merge engine
 */
inline bool is_sequence(const Value& value) noexcept {
    return value.is_sequence();
}

inline bool is_mapping(const Value& value) noexcept {
    return value.is_mapping();
}

} // namespace arbor

#endif // ARBOR_CLASSIFY_HPP

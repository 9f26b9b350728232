/**
 * @file Factory.cpp
 * @brief Implementation of the container factory
 */

#include "arbor/Factory.hpp"
#include "arbor/Classify.hpp"

namespace arbor {

Value empty_container_for_key(const Key& key) {
    return key.is_index() ? Value(Sequence{}) : Value(Mapping{});
}

Value empty_container_like(const Value& node) {
    return is_sequence(node) ? Value(Sequence{}) : Value(Mapping{});
}

Value shallow_clone(const Value& node) {
    if (!is_cloneable(node)) {
        return node;
    }

    if (node.is_sequence()) {
        return Value(node.as_sequence());
    }

    const Mapping& source = node.as_mapping();
    if (!source.shape().is_reconstructible()) {
        return Value(Mapping{});
    }

    return Value(source);
}

Value clone_if_possible(const Value& value) {
    return is_cloneable(value) ? shallow_clone(value) : value;
}

Value child_clone_or_fresh(const Value& existing_child, const Key& next_key) {
    if (!is_cloneable(existing_child)) {
        return empty_container_for_key(next_key);
    }

    if (is_sequence(existing_child) != next_key.is_index()) {
        return empty_container_for_key(next_key);
    }

    return clone_if_possible(existing_child);
}

} // namespace arbor

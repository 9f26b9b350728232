/**
 * @file Classify.cpp
 * @brief Implementation of the cloneability classifier
 */

#include "arbor/Classify.hpp"

namespace arbor {

bool is_cloneable(const Value& value) noexcept {
    if (value.is_sequence()) {
        return true;
    }
    if (value.is_mapping()) {
        // Element-shaped mappings are atomic even though they carry fields
        return !value.as_mapping().shape().is_atomic();
    }
    return false;
}

bool is_empty_key(const Value& value) noexcept {
    return value.is_nullish() || (value.is_sequence() && value.size() == 0);
}

} // namespace arbor

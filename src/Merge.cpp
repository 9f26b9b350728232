/**
 * @file Merge.cpp
 * @brief Implementation of deep and shallow merge
 */

#include "arbor/Merge.hpp"
#include "arbor/Classify.hpp"
#include "arbor/Factory.hpp"

namespace arbor {

Value deep_merge(const Value& base, const Value& override_val) {
    const bool base_is_sequence = is_sequence(base);

    // Kind conflict: override replaces base entirely
    if (base_is_sequence != is_sequence(override_val)) {
        return clone_if_possible(override_val);
    }

    // Both sequences: concatenate, never merge by index
    if (base_is_sequence) {
        const Sequence& head = base.as_sequence();
        const Sequence& tail = override_val.as_sequence();

        Sequence merged;
        merged.reserve(head.size() + tail.size());
        merged.insert(merged.end(), head.begin(), head.end());
        for (const auto& item : tail) {
            merged.push_back(clone_if_possible(item));
        }
        return Value(std::move(merged));
    }

    Mapping merged;
    if (base.is_mapping()) {
        for (const auto& entry : base.as_mapping()) {
            merged.set(entry.first, clone_if_possible(entry.second));
        }
    }

    if (override_val.is_mapping()) {
        for (const auto& entry : override_val.as_mapping()) {
            const auto& key = entry.first;
            const auto& value = entry.second;

            if (is_cloneable(value)) {
                const Value* existing = base.is_mapping() ? base.as_mapping().find(key) : nullptr;
                merged.set(key, deep_merge(existing ? *existing : Value(), value));
            } else {
                merged.set(key, value);
            }
        }
    }

    return Value(std::move(merged));
}

Value deep_merge_all(const std::vector<Value>& sources) {
    if (sources.empty()) {
        return Value(Mapping{});
    }

    Value result = sources[0];
    for (size_t i = 1; i < sources.size(); ++i) {
        result = deep_merge(result, sources[i]);
    }

    return result;
}

Value shallow_merge(const Value& base, const Value& override_val) {
    if (!is_cloneable(override_val)) {
        return override_val;
    }
    if (!is_cloneable(base) || is_sequence(base) != is_sequence(override_val)) {
        return clone_if_possible(override_val);
    }

    Value result = shallow_clone(base);

    if (is_sequence(result)) {
        Sequence& items = detail::Edit::sequence(result);
        const Sequence& overrides = override_val.as_sequence();
        if (items.size() < overrides.size()) {
            items.resize(overrides.size());
        }
        for (std::size_t i = 0; i < overrides.size(); ++i) {
            items[i] = overrides[i];
        }
        return result;
    }

    // A native-shaped base clones to an empty plain mapping, which is
    // still ours to edit.
    Mapping& fields = detail::Edit::mapping(result);
    for (const auto& entry : override_val.as_mapping()) {
        fields.set(entry.first, entry.second);
    }
    return result;
}

} // namespace arbor

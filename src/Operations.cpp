/**
 * @file Operations.cpp
 * @brief Implementation of the public path operations
 */

#include "arbor/Operations.hpp"
#include "arbor/Classify.hpp"
#include "arbor/Factory.hpp"
#include "arbor/Merge.hpp"
#include "arbor/Walker.hpp"

namespace arbor {

namespace {
    Value merged_or_replaced(const Value& current, const Value& value) {
        return is_cloneable(value) ? deep_merge(current, value) : value;
    }
}

Value get(const PathArg& path, const Value& root) {
    return get_nested_property(path.path(), root);
}

Value get_or(const Value& fallback, const PathArg& path, const Value& root) {
    return get_nested_property_or(path.path(), root, fallback);
}

bool has(const PathArg& path, const Value& root) {
    return has_nested_property(path.path(), root);
}

bool is(const PathArg& path, const Value& value, const Value& root) {
    return Value::identical(get_nested_property(path.path(), root), value);
}

Value set(const PathArg& path, const Value& value, const Value& root) {
    if (path.path().empty()) {
        return value;
    }

    return get_deep_clone(path.path(), root, [&value](Value& container, const Key& key) {
        assign_child(container, key, value);
    });
}

Value update(const PathArg& path, const Updater& fn, const Value& root) {
    if (path.path().empty()) {
        return fn(root);
    }

    return get_deep_clone(path.path(), root, [&fn](Value& container, const Key& key) {
        assign_child(container, key, fn(container.child(key)));
    });
}

Value remove(const PathArg& path, const Value& root) {
    if (path.path().empty()) {
        return empty_container_like(root);
    }

    const Path& keys = path.path();
    const Path parent_path(keys.begin(), keys.end() - 1);
    if (!has_child(get_nested_property(parent_path, root), keys.back())) {
        return root;
    }

    return get_deep_clone(path.path(), root, [](Value& container, const Key& key) {
        erase_child(container, key);
    });
}

Value add(const PathArg& path, const Value& value, const Value& root) {
    const Value target = get_nested_property(path.path(), root);
    if (!is_sequence(target)) {
        return set(path, value, root);
    }

    Path appended = path.path();
    appended.emplace_back(target.size());
    return set(appended, value, root);
}

Value assign(const PathArg& path, const Value& value, const Value& root) {
    if (path.path().empty()) {
        return shallow_merge(root, value);
    }

    return get_deep_clone(path.path(), root, [&value](Value& container, const Key& key) {
        assign_child(container, key, shallow_merge(container.child(key), value));
    });
}

Value merge(const Value& base, const Value& override_val) {
    return deep_merge(base, override_val);
}

Value merge_at(const PathArg& path, const Value& value, const Value& root) {
    if (path.path().empty()) {
        return merged_or_replaced(root, value);
    }

    return get_deep_clone(path.path(), root, [&value](Value& container, const Key& key) {
        assign_child(container, key, merged_or_replaced(container.child(key), value));
    });
}

} // namespace arbor

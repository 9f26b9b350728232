/**
 * @file Walker.cpp
 * @brief Implementation of the path walker and its primitives
 */

#include "arbor/Walker.hpp"
#include "arbor/Classify.hpp"
#include "arbor/Factory.hpp"

namespace arbor {

namespace {
    /**
     * @brief Resolve a key to a sequence position
     * @return false when the key is a name that is not a canonical index
     */
    bool sequence_position(const Key& key, std::size_t& out) {
        if (key.is_index()) {
            out = key.index();
            return true;
        }
        return parse_index(key.name(), out);
    }
}

Value on_match_at_path(const Path& path,
                       Value object,
                       const MatchHandler& on_match,
                       bool should_clone,
                       const Value& no_match,
                       std::size_t index) {
    if (index >= path.size()) {
        return should_clone ? object : no_match;
    }

    const Key& key = path[index];
    const std::size_t next_index = index + 1;

    if (next_index == path.size()) {
        if (should_clone) {
            on_match(object, key);
            return object;
        }
        return object.truthy() ? on_match(object, key) : no_match;
    }

    if (should_clone) {
        Value child = child_clone_or_fresh(object.child(key), path[next_index]);
        assign_child(object, key,
                     on_match_at_path(path, std::move(child), on_match,
                                      should_clone, no_match, next_index));
        return object;
    }

    if (!object.truthy()) {
        return no_match;
    }
    Value child = object.child(key);
    return child.truthy()
        ? on_match_at_path(path, std::move(child), on_match, should_clone, no_match, next_index)
        : no_match;
}

Value get_nested_property(const Path& path, const Value& root) {
    if (path.empty()) {
        return root;
    }
    if (path.size() == 1) {
        return root.child(path[0]);
    }

    return on_match_at_path(path, root, [](Value& container, const Key& key) {
        return container.child(key);
    }, false);
}

Value get_nested_property_or(const Path& path, const Value& root, const Value& fallback) {
    if (path.empty()) {
        return root.is_undefined() ? fallback : root;
    }

    return on_match_at_path(path, root, [&fallback](Value& container, const Key& key) {
        Value found = container.child(key);
        return found.is_undefined() ? fallback : found;
    }, false, fallback);
}

bool has_nested_property(const Path& path, const Value& root) {
    if (path.empty()) {
        return !root.is_undefined();
    }
    if (path.size() == 1) {
        return !root.child(path[0]).is_undefined();
    }

    const Value found = on_match_at_path(path, root, [](Value& container, const Key& key) {
        return Value(container.truthy() && !container.child(key).is_undefined());
    }, false, Value(false));
    return found.is_boolean() && found.as_boolean();
}

Value get_deep_clone(const Path& path, const Value& root, const EditHandler& on_match) {
    if (path.empty()) {
        return clone_if_possible(root);
    }

    // A sequence root addressed by a plain name is replaced like any
    // intermediate container of the wrong kind.
    std::size_t position = 0;
    Value top = is_sequence(root) && !sequence_position(path[0], position)
        ? empty_container_for_key(path[0])
        : is_cloneable(root) ? shallow_clone(root) : empty_container_for_key(path[0]);

    if (path.size() == 1) {
        on_match(top, path[0]);
        return top;
    }

    return on_match_at_path(path, std::move(top), [&on_match](Value& container, const Key& key) {
        on_match(container, key);
        return Value();
    }, true);
}

// ============================================================================
// Terminal edits
// ============================================================================

void assign_child(Value& container, const Key& key, Value value) {
    if (container.is_sequence()) {
        std::size_t position = 0;
        if (!sequence_position(key, position)) {
            return;
        }
        Sequence& items = detail::Edit::sequence(container);
        if (position >= items.size()) {
            items.resize(position + 1);
        }
        items[position] = std::move(value);
        return;
    }

    if (container.is_mapping()) {
        detail::Edit::mapping(container).set(key.to_string(), std::move(value));
    }
}

bool has_child(const Value& container, const Key& key) {
    if (container.is_sequence()) {
        std::size_t position = 0;
        return sequence_position(key, position) && position < container.size();
    }
    if (container.is_mapping()) {
        return container.as_mapping().contains(key.to_string());
    }
    return false;
}

bool erase_child(Value& container, const Key& key) {
    if (container.is_sequence()) {
        std::size_t position = 0;
        Sequence& items = detail::Edit::sequence(container);
        if (!sequence_position(key, position) || position >= items.size()) {
            return false;
        }
        items.erase(items.begin() + static_cast<std::ptrdiff_t>(position));
        return true;
    }

    if (container.is_mapping()) {
        return detail::Edit::mapping(container).erase(key.to_string());
    }

    return false;
}

} // namespace arbor

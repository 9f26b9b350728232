/**
 * @file Value.hpp
 * @brief Tree node type for arbor
 *
 * A Value is one of:
 * - Undefined (absence; distinct from null)
 * - Null
 * - Boolean
 * - Integer (int64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Date (milliseconds since the Unix epoch, UTC)
 * - Regex (pattern and flags)
 * - Sequence ([Value, ...])
 * - Mapping ({String: Value, ...} plus a Shape)
 *
 * Containers are held by shared pointer and never change once a Value
 * handing them out has been returned to a caller. Copying a Value copies
 * the handle, not the container, which is what lets writes share every
 * untouched subtree between the old and the new root.
 */

#ifndef ARBOR_VALUE_HPP
#define ARBOR_VALUE_HPP

#include "arbor/Errors.hpp"
#include "arbor/Path.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <ostream>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace arbor {

class Value;
class Mapping;

namespace detail {
class Edit;
}

/**
 * @brief Ordered list of values, index-addressed
 */
using Sequence = std::vector<Value>;

/**
 * @brief Marker for the absent value
 */
struct Undefined {
    bool operator==(const Undefined&) const noexcept { return true; }
};

/**
 * @brief Point in time, milliseconds since 1970-01-01T00:00:00Z
 */
struct Date {
    std::int64_t millis = 0;

    /**
     * @brief Build a date from calendar fields (proleptic Gregorian, UTC)
     */
    static Date from_civil(int year, unsigned month, unsigned day,
                           unsigned hour = 0, unsigned minute = 0,
                           unsigned second = 0, unsigned millisecond = 0);

    /**
     * @brief ISO-8601 text, e.g. "2024-03-01T12:30:00.000Z"
     */
    std::string to_iso_string() const;

    bool operator==(const Date& other) const noexcept { return millis == other.millis; }
};

/**
 * @brief Regular-expression literal, kept as text
 */
struct Regex {
    std::string pattern;
    std::string flags;

    bool operator==(const Regex& other) const noexcept {
        return pattern == other.pattern && flags == other.flags;
    }
};

/**
 * @brief Runtime kind of a mapping
 *
 * - Plain: ordinary record; clones to a plain mapping
 * - Record: named data-only kind; clones to a mapping of the same shape
 * - Native: named kind that cannot be rebuilt field-by-field; clones
 *           degrade to an empty plain mapping
 * - Element: framework element marker; never cloned or merged
 */
class Shape {
public:
    enum class Kind { Plain, Record, Native, Element };

    Shape() = default;

    static Shape plain() { return Shape(); }
    static Shape record(std::string name) { return Shape(Kind::Record, std::move(name)); }
    static Shape native(std::string name) { return Shape(Kind::Native, std::move(name)); }
    static Shape element(std::string name = "element") { return Shape(Kind::Element, std::move(name)); }

    Kind kind() const noexcept { return kind_; }
    const std::string& name() const noexcept { return name_; }

    bool is_plain() const noexcept { return kind_ == Kind::Plain; }
    bool is_atomic() const noexcept { return kind_ == Kind::Element; }

    /**
     * @brief Can a same-shaped instance be built generically from fields?
     */
    bool is_reconstructible() const noexcept {
        return kind_ == Kind::Plain || kind_ == Kind::Record;
    }

    bool operator==(const Shape& other) const noexcept {
        return kind_ == other.kind_ && name_ == other.name_;
    }
    bool operator!=(const Shape& other) const noexcept { return !(*this == other); }

private:
    Shape(Kind kind, std::string name) : kind_(kind), name_(std::move(name)) {}

    Kind kind_ = Kind::Plain;
    std::string name_;
};

/**
 * @brief Tree node
 *
 * Construction from C++ values:
 * ```cpp
 * Value tree = Value::mapping({
 *     {"name", "arbor"},
 *     {"ports", Value::sequence({80, 443})},
 *     {"tls", true}
 * });
 * ```
 */
class Value {
public:
    enum class Kind {
        Undefined,
        Null,
        Boolean,
        Integer,
        Float,
        String,
        Date,
        Regex,
        Sequence,
        Mapping
    };

    Value() = default;
    Value(Undefined) {}
    Value(std::nullptr_t) : data_(nullptr) {}
    Value(bool b) : data_(b) {}

    template <typename T,
              typename std::enable_if<std::is_integral<T>::value &&
                                      !std::is_same<T, bool>::value, int>::type = 0>
    Value(T i) : data_(static_cast<std::int64_t>(i)) {}

    template <typename T,
              typename std::enable_if<std::is_floating_point<T>::value, int>::type = 0>
    Value(T f) : data_(static_cast<double>(f)) {}

    Value(std::string s) : data_(std::move(s)) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(Date d) : data_(d) {}
    Value(Regex r) : data_(std::move(r)) {}

    explicit Value(Sequence items);
    explicit Value(Mapping fields);

    /**
     * @brief Build a sequence from listed elements
     */
    static Value sequence(std::initializer_list<Value> items = {});

    /**
     * @brief Build a mapping from listed fields, in the given order
     *
     * A later duplicate key replaces the earlier value in place.
     */
    static Value mapping(std::initializer_list<std::pair<std::string, Value>> fields = {},
                         Shape shape = Shape::plain());

    Kind kind() const noexcept { return static_cast<Kind>(data_.index()); }

    bool is_undefined() const noexcept { return kind() == Kind::Undefined; }
    bool is_null() const noexcept { return kind() == Kind::Null; }
    bool is_boolean() const noexcept { return kind() == Kind::Boolean; }
    bool is_integer() const noexcept { return kind() == Kind::Integer; }
    bool is_float() const noexcept { return kind() == Kind::Float; }
    bool is_number() const noexcept { return is_integer() || is_float(); }
    bool is_string() const noexcept { return kind() == Kind::String; }
    bool is_date() const noexcept { return kind() == Kind::Date; }
    bool is_regex() const noexcept { return kind() == Kind::Regex; }
    bool is_sequence() const noexcept { return kind() == Kind::Sequence; }
    bool is_mapping() const noexcept { return kind() == Kind::Mapping; }

    /**
     * @brief Undefined or null
     */
    bool is_nullish() const noexcept { return is_undefined() || is_null(); }

    // Typed accessors; each throws KindError on another kind.
    bool as_boolean() const;
    std::int64_t as_integer() const;
    double as_float() const;
    const std::string& as_string() const;
    const Date& as_date() const;
    const Regex& as_regex() const;
    const Sequence& as_sequence() const;
    const Mapping& as_mapping() const;

    /**
     * @brief Element count of a container, 0 for anything else
     */
    std::size_t size() const noexcept;

    /**
     * @brief Child addressed by @p key, or Undefined
     *
     * - Sequence + index: element, Undefined past the end
     * - Sequence + name: element when the name is a canonical index
     * - Mapping: field named key.to_string()
     * - Anything else: Undefined
     */
    Value child(const Key& key) const;

    /**
     * @brief Truthiness used when deciding whether to descend
     *
     * False for Undefined, Null, false, 0, NaN and the empty string.
     * Containers, dates and regexes are always truthy.
     */
    bool truthy() const noexcept;

    /**
     * @brief Same node: same container instance, or equal leaves
     *
     * This is the identity test used to observe structural sharing.
     */
    static bool identical(const Value& a, const Value& b) noexcept;

    /**
     * @brief Deep structural equality (mapping field order ignored)
     */
    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    friend class detail::Edit;

    using Storage = std::variant<Undefined,
                                 std::nullptr_t,
                                 bool,
                                 std::int64_t,
                                 double,
                                 std::string,
                                 Date,
                                 Regex,
                                 std::shared_ptr<Sequence>,
                                 std::shared_ptr<Mapping>>;

    Storage data_;
};

/**
 * @brief Insertion-ordered name -> Value map carrying a Shape
 */
class Mapping {
public:
    using Entry = std::pair<std::string, Value>;
    using const_iterator = std::vector<Entry>::const_iterator;

    Mapping() = default;
    explicit Mapping(Shape shape) : shape_(std::move(shape)) {}

    const Shape& shape() const noexcept { return shape_; }

    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

    /**
     * @brief Field value, or nullptr when absent
     */
    const Value* find(const std::string& key) const;

    bool contains(const std::string& key) const { return find(key) != nullptr; }

    /**
     * @brief Insert at the end, or replace in place when present
     */
    void set(std::string key, Value value);

    /**
     * @brief Remove a field, keeping the order of the rest
     * @return true if the field existed
     */
    bool erase(const std::string& key);

private:
    void reindex_from(std::size_t position);

    Shape shape_;
    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

namespace detail {

/**
 * @brief Mutable access to a container owned by the caller
 *
 * Only for containers the caller allocated itself during the current
 * operation (fresh empties and shallow clones from the Container
 * Factory). Editing a container reachable from a caller-supplied root
 * breaks immutability for every holder of that root.
 */
class Edit {
public:
    static Sequence& sequence(Value& value);
    static Mapping& mapping(Value& value);
};

} // namespace detail

/**
 * @brief Human-readable kind name ("undefined", "null", "boolean",
 *        "integer", "float", "string", "date", "regex", "sequence",
 *        "mapping")
 */
std::string type_name(const Value& value);

std::ostream& operator<<(std::ostream& os, const Value& value);

} // namespace arbor

#endif // ARBOR_VALUE_HPP

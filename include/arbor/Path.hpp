/**
 * @file Path.hpp
 * @brief Path keys and path-text parsing
 *
 * A path addresses a position in a nested tree as an ordered sequence of
 * keys, root first. Each key is either an index (sequence position) or a
 * name (mapping field).
 *
 * Text notation accepted by parse_path():
 * - Dotted segments:      "db.hosts.0.name"
 * - Bracketed indices:    "db.hosts[0].name"
 * - Quoted bracket names: "labels['app.kubernetes.io/name']"
 *
 * A bare or bracketed segment made only of digits becomes an index;
 * a quoted segment is always a name.
 */

#ifndef ARBOR_PATH_HPP
#define ARBOR_PATH_HPP

#include "arbor/Errors.hpp"

#include <cstddef>
#include <initializer_list>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace arbor {

/**
 * @brief One step of a path: an index or a name
 *
 * Integral arguments build an index, strings build a name:
 * ```cpp
 * Path p = {"servers", 0, "host"};
 * ```
 */
class Key {
public:
    template <typename T,
              typename std::enable_if<std::is_integral<T>::value &&
                                      !std::is_same<T, bool>::value, int>::type = 0>
    Key(T index)
        : is_index_(true)
        , index_(checked_index(index))
    {}

    Key(std::string name)
        : is_index_(false)
        , name_(std::move(name))
    {}

    Key(const char* name)
        : is_index_(false)
        , name_(name)
    {}

    bool is_index() const noexcept { return is_index_; }
    bool is_name() const noexcept { return !is_index_; }

    /**
     * @brief Get the index value
     * @throws KindError if this key is a name
     */
    std::size_t index() const;

    /**
     * @brief Get the name value
     * @throws KindError if this key is an index
     */
    const std::string& name() const;

    /**
     * @brief Field name this key addresses in a mapping
     *
     * Names are returned as-is, indices as their decimal text, so the
     * index 3 and the name "3" address the same mapping field.
     */
    std::string to_string() const;

    bool operator==(const Key& other) const noexcept;
    bool operator!=(const Key& other) const noexcept { return !(*this == other); }

private:
    template <typename T>
    static std::size_t checked_index(T index) {
        if (std::is_signed<T>::value && index < 0) {
            throw std::out_of_range("Path index must be non-negative: " +
                                    std::to_string(index));
        }
        return static_cast<std::size_t>(index);
    }

    bool is_index_;
    std::size_t index_ = 0;
    std::string name_;
};

/**
 * @brief Ordered sequence of keys, root to target
 */
using Path = std::vector<Key>;

/**
 * @brief Parse path text into keys
 *
 * @param text Dotted/bracketed path text
 * @return Parsed path; empty text yields an empty path
 * @throws PathSyntaxError on malformed text
 *
 * Examples:
 * - "a.b.c"           -> [a, b, c]
 * - "items[2].name"   -> [items, 2, name]
 * - "a['b.c'][\"d\"]" -> [a, "b.c", "d"]
 * - "a..b"            -> throws (empty segment)
 * - "a[0"             -> throws (unterminated bracket)
 */
Path parse_path(const std::string& text);

/**
 * @brief Render a path as text that parse_path() reads back unchanged
 *
 * Indices render as "[n]", names that are plain identifiers as ".name",
 * everything else as "['...']" with quotes and backslashes escaped.
 */
std::string to_string(const Path& path);

/**
 * @brief Parse a canonical decimal index ("0", "17"; not "01" or "-1")
 * @return true and sets @p out when @p text is a canonical index
 */
bool parse_index(const std::string& text, std::size_t& out) noexcept;

/**
 * @brief A path given either as text or as pre-built keys
 *
 * Text is parsed on construction, so a malformed path throws at the call
 * site of the operation, before any tree is read or written. Pre-built
 * paths are used as-is.
 */
class PathArg {
public:
    PathArg(Path path) : path_(std::move(path)) {}
    PathArg(std::initializer_list<Key> keys) : path_(keys) {}
    PathArg(const std::string& text) : path_(parse_path(text)) {}
    PathArg(const char* text) : path_(parse_path(text)) {}

    const Path& path() const noexcept { return path_; }

private:
    Path path_;
};

std::ostream& operator<<(std::ostream& os, const Key& key);
std::ostream& operator<<(std::ostream& os, const Path& path);

} // namespace arbor

#endif // ARBOR_PATH_HPP

/**
 * @file Path.cpp
 * @brief Implementation of path keys and path-text parsing
 */

#include "arbor/Path.hpp"

#include <cctype>
#include <limits>
#include <sstream>

namespace arbor {

// ============================================================================
// Key
// ============================================================================

std::size_t Key::index() const {
    if (!is_index_) {
        throw KindError("index key", "name key");
    }
    return index_;
}

const std::string& Key::name() const {
    if (is_index_) {
        throw KindError("name key", "index key");
    }
    return name_;
}

std::string Key::to_string() const {
    return is_index_ ? std::to_string(index_) : name_;
}

bool Key::operator==(const Key& other) const noexcept {
    if (is_index_ != other.is_index_) return false;
    return is_index_ ? index_ == other.index_ : name_ == other.name_;
}

bool parse_index(const std::string& text, std::size_t& out) noexcept {
    if (text.empty()) return false;
    // Must be all digits, no leading zeros except "0" itself
    if (text[0] == '0' && text.size() > 1) return false;

    std::size_t value = 0;
    constexpr std::size_t max = std::numeric_limits<std::size_t>::max();
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        const auto digit = static_cast<std::size_t>(c - '0');
        if (value > (max - digit) / 10) return false;
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

// ============================================================================
// Parsing
// ============================================================================

namespace {
    enum class State {
        Start,         // nothing consumed yet
        AfterDot,      // a '.' was consumed, a bare segment must follow
        AfterSegment   // a segment was consumed, '.', '[' or end must follow
    };

    Key bare_key(const std::string& segment) {
        std::size_t index = 0;
        if (parse_index(segment, index)) {
            return Key(index);
        }
        return Key(segment);
    }

    /**
     * @brief Parse one "[...]" group starting at @p open
     * @return Offset just past the closing bracket
     */
    std::size_t parse_bracket(const std::string& text, std::size_t open, Path& out) {
        std::size_t i = open + 1;
        if (i >= text.size()) {
            throw PathSyntaxError(text, open, "unterminated '['");
        }

        const char quote = text[i];
        if (quote == '\'' || quote == '"') {
            std::string name;
            ++i;
            bool closed = false;
            while (i < text.size()) {
                const char c = text[i];
                if (c == '\\' && i + 1 < text.size()) {
                    name += text[i + 1];
                    i += 2;
                    continue;
                }
                if (c == quote) {
                    closed = true;
                    ++i;
                    break;
                }
                name += c;
                ++i;
            }
            if (!closed) {
                throw PathSyntaxError(text, open + 1, "unterminated quote");
            }
            if (i >= text.size() || text[i] != ']') {
                throw PathSyntaxError(text, i, "expected ']' after closing quote");
            }
            out.emplace_back(std::move(name));
            return i + 1;
        }

        const auto close = text.find(']', i);
        if (close == std::string::npos) {
            throw PathSyntaxError(text, open, "unterminated '['");
        }
        if (close == i) {
            throw PathSyntaxError(text, open, "empty brackets");
        }
        const std::string segment = text.substr(i, close - i);
        if (segment.find('[') != std::string::npos) {
            throw PathSyntaxError(text, i + segment.find('['), "nested '['");
        }
        out.push_back(bare_key(segment));
        return close + 1;
    }

    bool is_bare_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '$';
    }

    bool renders_bare(const std::string& name) {
        if (name.empty()) return false;
        std::size_t ignored = 0;
        if (parse_index(name, ignored)) return false;
        for (char c : name) {
            if (!is_bare_char(c)) return false;
        }
        return true;
    }
}

Path parse_path(const std::string& text) {
    Path path;
    State state = State::Start;
    std::size_t i = 0;

    while (i < text.size()) {
        const char c = text[i];

        if (c == '.') {
            if (state != State::AfterSegment) {
                throw PathSyntaxError(text, i, "empty segment");
            }
            state = State::AfterDot;
            ++i;
            continue;
        }

        if (c == '[') {
            if (state == State::AfterDot) {
                throw PathSyntaxError(text, i, "empty segment before '['");
            }
            i = parse_bracket(text, i, path);
            state = State::AfterSegment;
            continue;
        }

        if (c == ']') {
            throw PathSyntaxError(text, i, "unexpected ']'");
        }

        if (state == State::AfterSegment) {
            throw PathSyntaxError(text, i, "expected '.' or '['");
        }

        const auto end = text.find_first_of(".[]", i);
        const std::string segment = text.substr(i, end == std::string::npos ? std::string::npos : end - i);
        path.push_back(bare_key(segment));
        i += segment.size();
        state = State::AfterSegment;
    }

    if (state == State::AfterDot) {
        throw PathSyntaxError(text, text.size(), "trailing '.'");
    }

    return path;
}

std::string to_string(const Path& path) {
    std::ostringstream oss;
    bool first = true;

    for (const auto& key : path) {
        if (key.is_index()) {
            oss << '[' << key.index() << ']';
        } else if (renders_bare(key.name())) {
            if (!first) oss << '.';
            oss << key.name();
        } else {
            oss << "['";
            for (char c : key.name()) {
                if (c == '\'' || c == '\\') oss << '\\';
                oss << c;
            }
            oss << "']";
        }
        first = false;
    }

    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Key& key) {
    if (key.is_index()) {
        return os << key.index();
    }
    return os << '"' << key.name() << '"';
}

std::ostream& operator<<(std::ostream& os, const Path& path) {
    return os << to_string(path);
}

} // namespace arbor

/**
 * @file Document.cpp
 * @brief Document loading implementation
 */

#include "arbor/Document.hpp"
#include "arbor/Errors.hpp"
#include "arbor/Json.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace arbor {

namespace {

/**
 * @brief Check if file exists.
 */
bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/**
 * @brief Read entire file into string.
 */
std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

Date toml_date(const toml::date& d, const toml::time& t = toml::time{}) {
    return Date::from_civil(d.year, d.month, d.day,
                            t.hour, t.minute, t.second,
                            t.nanosecond / 1000000);
}

/**
 * @brief Convert a toml++ node to a tree.
 */
Value toml_node_to_value(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date:
            return Value(toml_date(node.as_date()->get()));

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::date_time: {
            const auto& dt = node.as_date_time()->get();
            Date date = toml_date(dt.date, dt.time);
            if (dt.offset) {
                date.millis -= static_cast<std::int64_t>(dt.offset->minutes) * 60000;
            }
            return Value(date);
        }

        case toml::node_type::array: {
            Sequence items;
            for (const auto& elem : *node.as_array()) {
                items.push_back(toml_node_to_value(elem));
            }
            return Value(std::move(items));
        }

        case toml::node_type::table: {
            Mapping fields;
            for (const auto& [key, val] : *node.as_table()) {
                fields.set(std::string(key.str()), toml_node_to_value(val));
            }
            return Value(std::move(fields));
        }

        default:
            return Value(nullptr);
    }
}

} // anonymous namespace

// ============================================================================
// JSON
// ============================================================================

Value parse_json_text(const std::string& text, const std::string& source) {
    try {
        return from_json(Json::parse(text));
    } catch (const Json::parse_error& e) {
        throw DocumentParseError(source, 0, 0, e.what());
    }
}

Value parse_json_or_string(const std::string& raw) {
    try {
        return from_json(Json::parse(raw));
    } catch (const Json::parse_error&) {
        return Value(raw);
    }
}

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    return parse_json_text(read_file(path), path);
}

// ============================================================================
// TOML
// ============================================================================

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        throw DocumentParseError(
            path,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }

    return toml_node_to_value(table);
}

// ============================================================================
// Auto-detect
// ============================================================================

std::string get_file_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return ext;
}

Value load_document(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    }
    if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw UnsupportedFormatError(path, ext);
}

// ============================================================================
// Output
// ============================================================================

std::string dump_json(const Value& value, int indent) {
    return to_json(value).dump(indent);
}

void write_json_file(const std::string& path, const Value& value, int indent) {
    std::ofstream ofs(path);
    if (!ofs) {
        throw ArborError("Failed to open for write: " + path);
    }
    ofs << dump_json(value, indent) << "\n";
    ofs.flush();
    if (!ofs) {
        throw ArborError("Failed to write: " + path);
    }
}

} // namespace arbor

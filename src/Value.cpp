/**
 * @file Value.cpp
 * @brief Implementation of the tree node type
 */

#include "arbor/Value.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace arbor {

namespace {
    // Howard Hinnant's days_from_civil / civil_from_days
    std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
        y -= m <= 2;
        const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
        const auto yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
    }

    void civil_from_days(std::int64_t z, std::int64_t& y, unsigned& m, unsigned& d) {
        z += 719468;
        const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const auto doe = static_cast<unsigned>(z - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp = (5 * doy + 2) / 153;
        d = doy - (153 * mp + 2) / 5 + 1;
        m = mp < 10 ? mp + 3 : mp - 9;
        y = static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2);
    }

    constexpr std::int64_t kMillisPerDay = 86400000;

    const char* kind_name(Value::Kind kind) {
        switch (kind) {
            case Value::Kind::Undefined: return "undefined";
            case Value::Kind::Null: return "null";
            case Value::Kind::Boolean: return "boolean";
            case Value::Kind::Integer: return "integer";
            case Value::Kind::Float: return "float";
            case Value::Kind::String: return "string";
            case Value::Kind::Date: return "date";
            case Value::Kind::Regex: return "regex";
            case Value::Kind::Sequence: return "sequence";
            case Value::Kind::Mapping: return "mapping";
        }
        return "unknown";
    }

    void write_quoted(std::ostream& os, const std::string& s) {
        os << '"';
        for (char c : s) {
            if (c == '"' || c == '\\') os << '\\';
            os << c;
        }
        os << '"';
    }
}

// ============================================================================
// Date
// ============================================================================

Date Date::from_civil(int year, unsigned month, unsigned day,
                      unsigned hour, unsigned minute,
                      unsigned second, unsigned millisecond) {
    const std::int64_t days = days_from_civil(year, month, day);
    Date date;
    date.millis = days * kMillisPerDay +
                  static_cast<std::int64_t>(hour) * 3600000 +
                  static_cast<std::int64_t>(minute) * 60000 +
                  static_cast<std::int64_t>(second) * 1000 +
                  static_cast<std::int64_t>(millisecond);
    return date;
}

std::string Date::to_iso_string() const {
    std::int64_t days = millis / kMillisPerDay;
    std::int64_t rem = millis % kMillisPerDay;
    if (rem < 0) {
        rem += kMillisPerDay;
        --days;
    }

    std::int64_t year = 0;
    unsigned month = 0;
    unsigned day = 0;
    civil_from_days(days, year, month, day);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02u:%02u:%02u.%03uZ",
                  static_cast<long long>(year), month, day,
                  static_cast<unsigned>(rem / 3600000),
                  static_cast<unsigned>(rem / 60000 % 60),
                  static_cast<unsigned>(rem / 1000 % 60),
                  static_cast<unsigned>(rem % 1000));
    return buf;
}

// ============================================================================
// Value
// ============================================================================

Value::Value(Sequence items)
    : data_(std::make_shared<Sequence>(std::move(items)))
{}

Value::Value(Mapping fields)
    : data_(std::make_shared<Mapping>(std::move(fields)))
{}

Value Value::sequence(std::initializer_list<Value> items) {
    return Value(Sequence(items));
}

Value Value::mapping(std::initializer_list<std::pair<std::string, Value>> fields, Shape shape) {
    Mapping m(std::move(shape));
    for (const auto& field : fields) {
        m.set(field.first, field.second);
    }
    return Value(std::move(m));
}

bool Value::as_boolean() const {
    if (!is_boolean()) throw KindError("boolean", type_name(*this));
    return std::get<bool>(data_);
}

std::int64_t Value::as_integer() const {
    if (!is_integer()) throw KindError("integer", type_name(*this));
    return std::get<std::int64_t>(data_);
}

double Value::as_float() const {
    if (is_integer()) return static_cast<double>(std::get<std::int64_t>(data_));
    if (!is_float()) throw KindError("float", type_name(*this));
    return std::get<double>(data_);
}

const std::string& Value::as_string() const {
    if (!is_string()) throw KindError("string", type_name(*this));
    return std::get<std::string>(data_);
}

const Date& Value::as_date() const {
    if (!is_date()) throw KindError("date", type_name(*this));
    return std::get<Date>(data_);
}

const Regex& Value::as_regex() const {
    if (!is_regex()) throw KindError("regex", type_name(*this));
    return std::get<Regex>(data_);
}

const Sequence& Value::as_sequence() const {
    if (!is_sequence()) throw KindError("sequence", type_name(*this));
    return *std::get<std::shared_ptr<Sequence>>(data_);
}

const Mapping& Value::as_mapping() const {
    if (!is_mapping()) throw KindError("mapping", type_name(*this));
    return *std::get<std::shared_ptr<Mapping>>(data_);
}

std::size_t Value::size() const noexcept {
    if (is_sequence()) return std::get<std::shared_ptr<Sequence>>(data_)->size();
    if (is_mapping()) return std::get<std::shared_ptr<Mapping>>(data_)->size();
    return 0;
}

Value Value::child(const Key& key) const {
    if (is_sequence()) {
        const auto& items = *std::get<std::shared_ptr<Sequence>>(data_);
        std::size_t index = 0;
        if (key.is_index()) {
            index = key.index();
        } else if (!parse_index(key.name(), index)) {
            return Value();
        }
        return index < items.size() ? items[index] : Value();
    }

    if (is_mapping()) {
        const Value* found = std::get<std::shared_ptr<Mapping>>(data_)->find(key.to_string());
        return found ? *found : Value();
    }

    return Value();
}

bool Value::truthy() const noexcept {
    switch (kind()) {
        case Kind::Undefined:
        case Kind::Null:
            return false;
        case Kind::Boolean:
            return std::get<bool>(data_);
        case Kind::Integer:
            return std::get<std::int64_t>(data_) != 0;
        case Kind::Float: {
            const double f = std::get<double>(data_);
            return f != 0.0 && !std::isnan(f);
        }
        case Kind::String:
            return !std::get<std::string>(data_).empty();
        default:
            return true;
    }
}

bool Value::identical(const Value& a, const Value& b) noexcept {
    if (a.kind() != b.kind()) return false;

    switch (a.kind()) {
        case Kind::Sequence:
            return std::get<std::shared_ptr<Sequence>>(a.data_) ==
                   std::get<std::shared_ptr<Sequence>>(b.data_);
        case Kind::Mapping:
            return std::get<std::shared_ptr<Mapping>>(a.data_) ==
                   std::get<std::shared_ptr<Mapping>>(b.data_);
        case Kind::Float: {
            const double x = std::get<double>(a.data_);
            const double y = std::get<double>(b.data_);
            return x == y || (std::isnan(x) && std::isnan(y));
        }
        default:
            return a.data_ == b.data_;
    }
}

bool Value::operator==(const Value& other) const {
    if (kind() != other.kind()) return false;

    if (is_sequence()) {
        const auto& a = as_sequence();
        const auto& b = other.as_sequence();
        if (&a == &b) return true;
        if (a.size() != b.size()) return false;
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (a[i] != b[i]) return false;
        }
        return true;
    }

    if (is_mapping()) {
        const auto& a = as_mapping();
        const auto& b = other.as_mapping();
        if (&a == &b) return true;
        if (a.shape() != b.shape() || a.size() != b.size()) return false;
        for (const auto& entry : a) {
            const Value* theirs = b.find(entry.first);
            if (!theirs || entry.second != *theirs) return false;
        }
        return true;
    }

    return data_ == other.data_;
}

// ============================================================================
// Mapping
// ============================================================================

const Value* Mapping::find(const std::string& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].second;
}

void Mapping::set(std::string key, Value value) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        entries_[it->second].second = std::move(value);
        return;
    }
    index_.emplace(key, entries_.size());
    entries_.emplace_back(std::move(key), std::move(value));
}

bool Mapping::erase(const std::string& key) {
    auto it = index_.find(key);
    if (it == index_.end()) return false;

    const std::size_t position = it->second;
    index_.erase(it);
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(position));
    reindex_from(position);
    return true;
}

void Mapping::reindex_from(std::size_t position) {
    for (std::size_t i = position; i < entries_.size(); ++i) {
        index_[entries_[i].first] = i;
    }
}

// ============================================================================
// detail::Edit
// ============================================================================

namespace detail {

Sequence& Edit::sequence(Value& value) {
    if (!value.is_sequence()) throw KindError("sequence", type_name(value));
    return *std::get<std::shared_ptr<Sequence>>(value.data_);
}

Mapping& Edit::mapping(Value& value) {
    if (!value.is_mapping()) throw KindError("mapping", type_name(value));
    return *std::get<std::shared_ptr<Mapping>>(value.data_);
}

} // namespace detail

// ============================================================================
// Printing
// ============================================================================

std::string type_name(const Value& value) {
    return kind_name(value.kind());
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    switch (value.kind()) {
        case Value::Kind::Undefined: return os << "undefined";
        case Value::Kind::Null: return os << "null";
        case Value::Kind::Boolean: return os << (value.as_boolean() ? "true" : "false");
        case Value::Kind::Integer: return os << value.as_integer();
        case Value::Kind::Float: return os << value.as_float();
        case Value::Kind::String:
            write_quoted(os, value.as_string());
            return os;
        case Value::Kind::Date: return os << "Date(" << value.as_date().to_iso_string() << ")";
        case Value::Kind::Regex:
            return os << '/' << value.as_regex().pattern << '/' << value.as_regex().flags;
        case Value::Kind::Sequence: {
            os << '[';
            bool first = true;
            for (const auto& item : value.as_sequence()) {
                if (!first) os << ',';
                os << item;
                first = false;
            }
            return os << ']';
        }
        case Value::Kind::Mapping: {
            const auto& m = value.as_mapping();
            if (!m.shape().is_plain()) os << m.shape().name();
            os << '{';
            bool first = true;
            for (const auto& entry : m) {
                if (!first) os << ',';
                write_quoted(os, entry.first);
                os << ':' << entry.second;
                first = false;
            }
            return os << '}';
        }
    }
    return os;
}

} // namespace arbor

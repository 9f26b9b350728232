/**
 * @file Json.cpp
 * @brief Implementation of Value <-> nlohmann::json conversion
 */

#include "arbor/Json.hpp"

#include <cstdint>
#include <limits>

namespace arbor {

Json to_json(const Value& value) {
    switch (value.kind()) {
        case Value::Kind::Undefined:
        case Value::Kind::Null:
            return Json(nullptr);

        case Value::Kind::Boolean:
            return Json(value.as_boolean());

        case Value::Kind::Integer:
            return Json(value.as_integer());

        case Value::Kind::Float:
            return Json(value.as_float());

        case Value::Kind::String:
            return Json(value.as_string());

        case Value::Kind::Date:
            return Json(value.as_date().to_iso_string());

        case Value::Kind::Regex: {
            const auto& rx = value.as_regex();
            return Json("/" + rx.pattern + "/" + rx.flags);
        }

        case Value::Kind::Sequence: {
            Json arr = Json::array();
            for (const auto& item : value.as_sequence()) {
                arr.push_back(to_json(item));
            }
            return arr;
        }

        case Value::Kind::Mapping: {
            Json obj = Json::object();
            for (const auto& entry : value.as_mapping()) {
                // JSON has no undefined: drop the field
                if (entry.second.is_undefined()) continue;
                obj[entry.first] = to_json(entry.second);
            }
            return obj;
        }
    }
    return Json(nullptr);
}

Value from_json(const Json& json) {
    switch (json.type()) {
        case Json::value_t::null:
            return Value(nullptr);

        case Json::value_t::boolean:
            return Value(json.get<bool>());

        case Json::value_t::number_integer:
            return Value(json.get<std::int64_t>());

        case Json::value_t::number_unsigned: {
            const auto u = json.get<std::uint64_t>();
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return Value(static_cast<std::int64_t>(u));
            }
            // Oversize for int64; fall back to double
            return Value(static_cast<double>(u));
        }

        case Json::value_t::number_float:
            return Value(json.get<double>());

        case Json::value_t::string:
            return Value(json.get<std::string>());

        case Json::value_t::array: {
            Sequence items;
            items.reserve(json.size());
            for (const auto& elem : json) {
                items.push_back(from_json(elem));
            }
            return Value(std::move(items));
        }

        case Json::value_t::object: {
            Mapping fields;
            for (auto it = json.begin(); it != json.end(); ++it) {
                fields.set(it.key(), from_json(it.value()));
            }
            return Value(std::move(fields));
        }

        case Json::value_t::binary: {
            Sequence bytes;
            for (auto byte : json.get_binary()) {
                bytes.emplace_back(static_cast<std::int64_t>(byte));
            }
            return Value(std::move(bytes));
        }

        case Json::value_t::discarded:
            return Value();
    }
    return Value();
}

void to_json(Json& json, const Value& value) {
    json = to_json(value);
}

void from_json(const Json& json, Value& value) {
    value = from_json(json);
}

} // namespace arbor

#include "field_serializer.hpp"

#include <stdexcept>
#include <utility>

Record stringify_nested_fields(Record record) {
    if (!record.is_object()) return record;

    for (auto& field : record.items()) {
        auto& value = field.value();
        if (value.is_object() || value.is_array() || value.is_boolean()) {
            value = value.dump();
        }
    }
    return record;
}

RecordTransform make_field_stringifier(std::vector<std::string> field_names) {
    return [names = std::move(field_names)](Record record) {
        if (!record.is_object()) return record;

        for (const auto& name : names) {
            auto it = record.find(name);
            if (it != record.end()) {
                *it = it->dump();
            }
        }
        return record;
    };
}

Record parse_stringified_fields(Record record, const std::vector<std::string>& field_names) {
    if (!record.is_object()) return record;

    for (const auto& name : field_names) {
        auto it = record.find(name);
        if (it == record.end() || !it->is_string()) continue;

        try {
            *it = nlohmann::json::parse(it->get<std::string>());
        } catch (const nlohmann::json::parse_error& e) {
            throw std::invalid_argument("field '" + name + "' does not hold JSON text: " + e.what());
        }
    }
    return record;
}

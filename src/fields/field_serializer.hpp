#ifndef FIELD_SERIALIZER_HPP
#define FIELD_SERIALIZER_HPP

#include <string>
#include <vector>

#include "../../include/record.hpp"

// Replace every object, array or boolean field of an object record by its compact JSON text.
// Other fields, and records that are not objects, pass through unchanged.
Record stringify_nested_fields(Record record);

// Transform that replaces the named fields (whatever their type) by their JSON text; absent fields are skipped
RecordTransform make_field_stringifier(std::vector<std::string> field_names);

// Inverse of the above for the named fields: string values holding JSON text are parsed back.
// Throws std::invalid_argument if a named field holds text that is not valid JSON.
Record parse_stringified_fields(Record record, const std::vector<std::string>& field_names);

#endif // FIELD_SERIALIZER_HPP

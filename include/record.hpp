#pragma once
#include <functional>
#include <vector>

#include <nlohmann/json.hpp>

// A single Record: an opaque mapping of named fields to heterogeneous values.
// The container never looks inside a record, it only moves, counts and indexes them.
using Record = nlohmann::json;

// Ordered group of records (one chunk, the tail, or a slice)
using RecordGroup = std::vector<Record>;

// Function applied to every record by PagedSequence::transform_all.
// May be invoked concurrently on records of different chunks.
using RecordTransform = std::function<Record(Record)>;

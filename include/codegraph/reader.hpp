// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include "types.hpp"
#include <functional>
#include <istream>
#include <nlohmann/json.hpp>
#include <string>

namespace codegraph {

// One parsed line of a graph stream
struct Record {
    GraphEvent event;
    std::string file; // Emitting file; empty if the record carries none
};

using RecordCallback = std::function<void(const Record &record, size_t line)>;

// Convert a decoded JSON object into a Record. Throws std::runtime_error on an
// unknown "type", a missing or non-string required field, or an unknown
// class_ref "kind". Unknown extra fields are ignored.
Record parse_record(const nlohmann::json &j);

// Parse a single JSON Lines entry
Record parse_record_line(const std::string &line);

// Stream records one line at a time, skipping blank lines. Errors are
// rethrown as std::runtime_error prefixed with the 1-based line number.
// Returns the number of records read.
size_t read_records(std::istream &in, const RecordCallback &callback);

// Same as above for a file on disk
size_t read_records(const std::string &filepath, const RecordCallback &callback);

} // namespace codegraph

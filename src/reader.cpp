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

#include "codegraph/reader.hpp"
#include <fstream>
#include <stdexcept>

namespace codegraph {

using json = nlohmann::json;

namespace {

std::string require_string(const json &j, const char *field, const char *type) {
    auto it = j.find(field);
    if (it == j.end()) {
        throw std::runtime_error(std::string(type) + " record is missing \"" + field + "\"");
    }
    if (!it->is_string()) {
        throw std::runtime_error(std::string(type) + " record field \"" + field +
                                 "\" must be a string");
    }
    return it->get<std::string>();
}

} // namespace

Record parse_record(const json &j) {
    if (!j.is_object()) {
        throw std::runtime_error("record is not a JSON object");
    }
    auto type_it = j.find("type");
    if (type_it == j.end() || !type_it->is_string()) {
        throw std::runtime_error("record has no \"type\"");
    }

    const std::string type_name = type_it->get<std::string>();
    EventType type;
    if (!event_type_from_string(type_name, type)) {
        throw std::runtime_error("unknown record type: " + type_name);
    }
    const char *t = type_name.c_str();

    Record record;
    switch (type) {
    case EventType::Module:
        record.event = ModuleEvent{require_string(j, "module", t)};
        break;
    case EventType::Import:
        record.event = ImportEvent{require_string(j, "importer", t),
                                   require_string(j, "importee", t)};
        break;
    case EventType::Invalidate:
        record.event = InvalidateEvent{require_string(j, "module", t)};
        break;
    case EventType::ClassDef:
        // Either "fullname" or the split "module" + "name" form
        if (j.contains("fullname") || !j.contains("name")) {
            record.event = ClassDefEvent{require_string(j, "fullname", t)};
        } else {
            record.event = ClassDefEvent{require_string(j, "module", t) + "." +
                                         require_string(j, "name", t)};
        }
        break;
    case EventType::ClassRef: {
        std::string kind_name = require_string(j, "kind", t);
        ClassRefKind kind;
        if (!class_ref_kind_from_string(kind_name, kind)) {
            throw std::runtime_error("unknown class_ref kind: " + kind_name);
        }
        record.event = ClassRefEvent{require_string(j, "src", t), require_string(j, "dst", t),
                                     kind};
        break;
    }
    case EventType::FunctionDef:
        record.event = FunctionDefEvent{require_string(j, "fullname", t)};
        break;
    case EventType::Call:
        record.event = FunctionCallEvent{require_string(j, "caller", t),
                                         require_string(j, "callee", t)};
        break;
    }

    if (j.contains("file")) {
        record.file = require_string(j, "file", t);
    }
    return record;
}

Record parse_record_line(const std::string &line) {
    json j;
    try {
        j = json::parse(line);
    } catch (const json::parse_error &e) {
        throw std::runtime_error(std::string("malformed JSON: ") + e.what());
    }
    return parse_record(j);
}

size_t read_records(std::istream &in, const RecordCallback &callback) {
    std::string line;
    size_t line_num = 0;
    size_t count = 0;

    while (std::getline(in, line)) {
        line_num++;
        if (line.find_first_not_of(" \t\r") == std::string::npos)
            continue;

        Record record;
        try {
            record = parse_record_line(line);
        } catch (const std::exception &e) {
            throw std::runtime_error("line " + std::to_string(line_num) + ": " + e.what());
        }
        callback(record, line_num);
        count++;
    }
    return count;
}

size_t read_records(const std::string &filepath, const RecordCallback &callback) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open graph file: " + filepath);
    }
    return read_records(file, callback);
}

} // namespace codegraph

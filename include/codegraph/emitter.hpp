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

#include "path_filter.hpp"
#include "types.hpp"
#include <fstream>
#include <memory>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace codegraph {

using json = nlohmann::json;

// Destination name that selects standard output instead of a file
constexpr const char *STDOUT_SINK = "stdout";

// Serialize an event's own fields (without the "file" tag)
json event_to_json(const GraphEvent &event);

// Writes graph events as JSON Lines. Inert until open() or attach() is called.
class EventEmitter {
public:
    EventEmitter() = default;

    EventEmitter(const EventEmitter &) = delete;
    EventEmitter &operator=(const EventEmitter &) = delete;

    // Open a file (or standard output for STDOUT_SINK). Replaces any previous
    // sink. Throws std::runtime_error if the file cannot be opened.
    void open(const std::string &destination, bool append = false);

    // Write to a caller-owned stream; the stream must outlive the emitter
    void attach(std::ostream &stream);

    void set_filter(PathFilter filter) { filter_ = std::move(filter); }
    const PathFilter &filter() const { return filter_; }

    void set_flush_each_record(bool flush) { flush_each_record_ = flush; }

    bool enabled() const { return out_ != nullptr; }

    // Append one record tagged with "file": scope_file if enabled and
    // scope_file passes the filter. Returns true if a record was written.
    // Throws std::runtime_error if the sink fails.
    bool emit(const GraphEvent &event, const std::string &scope_file) {
        return emit(event, scope_file, scope_file);
    }

    // Filter on scope_file but tag the record with file_tag
    bool emit(const GraphEvent &event, const std::string &scope_file,
              const std::string &file_tag);

    void flush();

private:
    std::unique_ptr<std::ofstream> file_;
    std::ostream *out_ = nullptr;
    std::string destination_;
    PathFilter filter_;
    bool flush_each_record_ = false;
};

} // namespace codegraph

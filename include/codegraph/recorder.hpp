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

#include "emitter.hpp"
#include "module_resolver.hpp"
#include "path_filter.hpp"
#include "types.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace codegraph {

// Recorder configuration
struct RecorderConfig {
    std::string output = STDOUT_SINK;      // File path, or STDOUT_SINK
    std::vector<std::string> filter_paths; // Empty = record everything
    bool append = false;                   // Append to an existing file instead of truncating
    bool flush_each_record = false;
};

// Records the code graph of a host analysis run. The host calls one hook per
// instrumentation point, passing the code unit it is currently processing.
//
// Definitions, imports and invalidations are scoped by the unit's own file.
// Class references and calls are scoped by the file of the module defining
// the *destination* symbol, which must already have been seen through
// on_module_seen; references into unknown or filtered modules are dropped.
//
// Nothing is written until enable() is called. Records are only ever
// appended; consumers deduplicate using the invalidate records.
class Recorder {
public:
    Recorder() = default;

    // Open the configured output. Throws std::runtime_error if it cannot be
    // opened. Calling enable again replaces the output and filter.
    void enable(const RecorderConfig &config);

    // Record into a caller-owned stream
    void enable(std::ostream &sink, const std::vector<std::string> &filter_paths = {});

    bool enabled() const { return emitter_.enabled(); }

    // Module definition; binds unit.module to unit.path for later reference
    // resolution (also while disabled)
    void on_module_seen(const CodeUnit &unit);

    // Import edge. Must be called while the import graph is built, before
    // invalidation is decided.
    void on_import(const CodeUnit &unit, const std::string &importer,
                   const std::string &importee);

    // The host is about to recheck `module` because its component is stale
    void on_invalidate(const CodeUnit &unit, const std::string &module);

    void on_class_def(const CodeUnit &unit, const std::string &fullname);

    void on_class_ref(const CodeUnit &unit, const std::string &src, const std::string &dst,
                      ClassRefKind kind);

    void on_function_def(const CodeUnit &unit, const std::string &fullname);

    void on_function_call(const CodeUnit &unit, const std::string &caller,
                          const std::string &callee);

    void flush() { emitter_.flush(); }

    const ModuleResolver &modules() const { return modules_; }
    const PathFilter &filter() const { return emitter_.filter(); }

    struct Stats {
        size_t records_written = 0;
        size_t records_filtered = 0;       // Rejected by the path filter
        size_t references_unresolved = 0;  // Destination module never seen
    };
    const Stats &stats() const { return stats_; }

private:
    EventEmitter emitter_;
    ModuleResolver modules_;
    Stats stats_;

    void record(const GraphEvent &event, const std::string &scope_file,
                const std::string &unit_file);

    // Emit a class_ref or call whose scope is the destination's module file
    void record_reference(const CodeUnit &unit, const GraphEvent &event,
                          const std::string &destination);
};

} // namespace codegraph

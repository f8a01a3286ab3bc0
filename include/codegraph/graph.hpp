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

#include "reader.hpp"
#include "types.hpp"
#include <istream>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace codegraph {

using json = nlohmann::json;

// In-memory code graph rebuilt from a recorded stream.
//
// The stream is append-only, so the same edge can appear many times. Facts
// (definitions, class references, calls) are grouped by the file that emitted
// them; an invalidate record drops everything previously emitted from that
// module's file, and the records that follow the recheck repopulate it. The
// result is the last generation of every file. Modules are kept by name,
// last file wins. Imports are emitted per importer in one batch ahead of the
// checks, and a later batch for the same importer replaces the earlier one;
// a rechecked module that no longer imports anything keeps its old imports.
class Graph {
public:
    // Apply one record in stream order
    void apply(const Record &record);

    // Build from a JSON Lines stream / file. Throws std::runtime_error on a
    // malformed record.
    static Graph from_stream(std::istream &in);
    static Graph load(const std::string &filepath);

    // Calls
    std::vector<std::string> callees(const std::string &caller) const;
    std::vector<std::string> callers(const std::string &callee) const;

    // Classes inheriting directly from `fullname`
    std::vector<std::string> subclasses(const std::string &fullname) const;

    // Symbols instantiating `fullname`
    std::vector<std::string> instantiations(const std::string &fullname) const;

    // Modules imported by `module`
    std::vector<std::string> imports_of(const std::string &module) const;

    std::optional<std::string> module_file(const std::string &module) const;

    bool has_class(const std::string &fullname) const;
    bool has_function(const std::string &fullname) const;

    // Number of invalidate records seen for a module
    size_t generation(const std::string &module) const;

    struct Summary {
        size_t records = 0;
        size_t modules = 0;
        size_t imports = 0;
        size_t classes = 0;
        size_t functions = 0;
        size_t class_refs = 0;
        size_t calls = 0;
        size_t invalidations = 0;
    };
    Summary summary() const;

    // Deduplicated graph as a single JSON document
    json to_json() const;

    // Write to_json() to a file
    void save(const std::string &filepath) const;

private:
    using SymbolIdx = size_t;
    using ClassRef = std::tuple<SymbolIdx, SymbolIdx, ClassRefKind>;
    using Edge = std::pair<SymbolIdx, SymbolIdx>;

    // Everything one file emitted in its latest generation
    struct FileFacts {
        std::set<SymbolIdx> class_defs;
        std::set<SymbolIdx> function_defs;
        std::set<ClassRef> class_refs;
        std::set<Edge> calls;
    };

    StringPool symbols_;
    std::map<std::string, std::string> modules_; // module -> file
    std::map<SymbolIdx, std::set<SymbolIdx>> imports_; // importer -> importees
    std::unordered_map<SymbolIdx, size_t> import_epoch_; // importer -> batch
    size_t epoch_ = 0; // bumped by every non-import record
    std::map<std::string, FileFacts> facts_;     // emitting file -> facts
    std::unordered_map<std::string, size_t> generations_;
    size_t records_ = 0;
    size_t invalidations_ = 0;

    const std::string &name(SymbolIdx idx) const { return symbols_.get(idx); }

    static std::vector<std::string> sorted(std::set<std::string> names);
};

} // namespace codegraph

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

#include "parser.hpp"
#include "recorder.hpp"
#include <filesystem>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace codegraph {

namespace fs = std::filesystem;

// Callback for progress reporting
using AnalyzeProgressCallback =
    std::function<void(const std::string &module, size_t current, size_t total)>;

// Analyzer configuration
struct AnalyzerConfig {
    // Source roots; module names are file paths relative to a root
    std::vector<std::string> roots = {"."};
    bool verbose = false;
    AnalyzeProgressCallback progress_callback = nullptr;

    // Directory names to ignore
    std::vector<std::string> ignore_patterns = {"build", "node_modules", "__pycache__", ".git",
                                                ".venv", "venv",         "dist",        ".tox",
                                                ".mypy_cache", "site-packages"};
};

// Reference host for the recorder: a lightweight Python front end that
// drives the recorder hooks in the order a type-checking pipeline would.
//
//   1. load:    every module is bound to its file (on_module_seen)
//   2. imports: the import graph is built (on_import)
//   3. check:   modules are checked dependencies-first; each check starts
//               with on_invalidate, then reports definitions, inheritance,
//               instantiations and calls
//
// Names are resolved syntactically through the module's imports and
// definitions; anything that does not resolve (builtins, locals, attribute
// access on values) is not reported.
class Analyzer {
public:
    explicit Analyzer(Recorder &recorder, const AnalyzerConfig &config = AnalyzerConfig{});

    // Full pass over every source file under the roots
    void run();

    // Reload the given modules from disk, report their imports again and
    // recheck them. Unknown module names are reported and skipped.
    void recheck(const std::vector<std::string> &modules);

    // Module names in check order
    const std::vector<std::string> &check_order() const { return order_; }

    // Module name for a file under root ("pkg/__init__.py" -> "pkg");
    // empty if the file is not a Python module under root
    static std::string module_name_for(const fs::path &root, const fs::path &file);

    // Absolute module a (possibly relative) import refers to
    static std::string resolve_import_base(const std::string &module, bool is_package,
                                           int level, const std::string &imported);

    struct Stats {
        size_t files_found = 0;
        size_t files_failed = 0;
        size_t modules_checked = 0;
    };
    const Stats &stats() const { return stats_; }

private:
    // Calls made directly in one scope of a module
    struct ScopeCalls {
        std::string scope;            // Qualified scope name, empty for module level
        std::string containing_class; // Class "self" refers to, if any
        std::vector<FunctionCall> calls;
    };

    // What the host knows about a loaded module. Syntax trees do not outlive
    // load(), so the node members of classes/functions are reset.
    struct ModuleInfo {
        CodeUnit unit;
        bool is_package = false;
        std::vector<ImportDecl> imports;
        std::vector<ClassDef> classes;
        std::vector<FunctionDef> functions;
        std::vector<ScopeCalls> scope_calls;
        std::vector<std::string> top_level_names;
        std::set<std::string> dependencies; // Imported modules that are loaded
    };

    Recorder &recorder_;
    AnalyzerConfig config_;
    Stats stats_;

    std::map<std::string, ModuleInfo> modules_;
    std::vector<std::string> order_;
    std::unordered_set<std::string> class_index_; // Fully qualified class names

    // Discover all source files under one root
    std::vector<fs::path> discover_files(const fs::path &root) const;

    // Check if a path relative to its root should be ignored
    bool should_ignore(const fs::path &relative) const;

    bool read_source(const std::string &path, std::string &source) const;

    // Parse a module's file and refresh its ModuleInfo. Returns false if the
    // file cannot be read or parsed.
    bool load(ModuleInfo &info);

    // Report the import edges of one module
    void record_imports(ModuleInfo &info);

    void compute_order();
    void rebuild_class_index();

    // Semantic pass over one module
    void check(ModuleInfo &info);

    // Local name -> fully qualified name for a module's top level
    std::unordered_map<std::string, std::string> bindings_for(const ModuleInfo &info) const;

    // Fully qualified target of a dotted expression, or empty
    static std::string resolve_name(const std::string &expr,
                                    const std::unordered_map<std::string, std::string> &bindings,
                                    const std::string &class_fullname);

    void record_call(const CodeUnit &unit, const std::string &caller,
                     const std::string &callee_expr,
                     const std::unordered_map<std::string, std::string> &bindings,
                     const std::string &class_fullname);
};

} // namespace codegraph

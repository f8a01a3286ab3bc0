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

#include "codegraph/analyzer.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

namespace codegraph {

namespace {

std::string parent_module(const std::string &module) {
    size_t dot = module.rfind('.');
    return (dot == std::string::npos) ? std::string() : module.substr(0, dot);
}

std::string join_name(const std::string &prefix, const std::string &name) {
    if (prefix.empty())
        return name;
    if (name.empty())
        return prefix;
    return prefix + "." + name;
}

} // namespace

Analyzer::Analyzer(Recorder &recorder, const AnalyzerConfig &config)
    : recorder_(recorder), config_(config) {
    if (config_.roots.empty())
        config_.roots.push_back(".");
}

bool Analyzer::should_ignore(const fs::path &relative) const {
    for (const auto &component : relative) {
        std::string comp = component.string();
        for (const auto &pattern : config_.ignore_patterns) {
            if (comp == pattern)
                return true;
        }
        // Ignore hidden files/directories
        if (!comp.empty() && comp[0] == '.' && comp != "." && comp != "..")
            return true;
    }
    return false;
}

std::vector<fs::path> Analyzer::discover_files(const fs::path &root) const {
    std::vector<fs::path> files;

    // Iterative directory traversal
    std::vector<fs::path> dirs_to_visit;
    dirs_to_visit.push_back(root);

    while (!dirs_to_visit.empty()) {
        fs::path current_dir = dirs_to_visit.back();
        dirs_to_visit.pop_back();

        std::error_code ec;
        fs::directory_iterator dir_it(current_dir, ec);
        if (ec) {
            std::cerr << "Warning: cannot list " << current_dir.string() << ": " << ec.message()
                      << std::endl;
            continue;
        }

        for (const auto &entry : dir_it) {
            const fs::path &path = entry.path();
            if (should_ignore(path.lexically_relative(root)))
                continue;

            std::error_code entry_ec;
            if (entry.is_directory(entry_ec)) {
                dirs_to_visit.push_back(path);
            } else if (entry.is_regular_file(entry_ec) && path.extension() == ".py") {
                files.push_back(path);
            }
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::string Analyzer::module_name_for(const fs::path &root, const fs::path &file) {
    if (file.extension() != ".py")
        return "";

    fs::path rel = file.lexically_normal().lexically_relative(root.lexically_normal());
    if (rel.empty() || *rel.begin() == "..")
        return "";

    std::vector<std::string> parts;
    for (const auto &component : rel.parent_path()) {
        parts.push_back(component.string());
    }
    std::string stem = rel.stem().string();
    if (stem != "__init__")
        parts.push_back(stem);

    std::string name;
    for (const auto &part : parts) {
        // Each component must be a plain identifier
        if (part.find('.') != std::string::npos || !is_dotted_name(part))
            return "";
        name = join_name(name, part);
    }
    return name;
}

std::string Analyzer::resolve_import_base(const std::string &module, bool is_package, int level,
                                          const std::string &imported) {
    if (level <= 0)
        return imported;

    std::string package = is_package ? module : parent_module(module);
    for (int i = 1; i < level; ++i) {
        package = parent_module(package);
    }
    return join_name(package, imported);
}

bool Analyzer::read_source(const std::string &path, std::string &source) const {
    std::ifstream file(path);
    if (!file.is_open())
        return false;

    std::stringstream buffer;
    buffer << file.rdbuf();
    source = buffer.str();
    return true;
}

bool Analyzer::load(ModuleInfo &info) {
    std::string source;
    if (!read_source(info.unit.path, source))
        return false;

    PythonParser parser;
    if (!parser.parse(source))
        return false;

    info.imports = parser.extract_imports();
    info.classes = parser.extract_classes();
    info.functions = parser.extract_functions();
    info.top_level_names = parser.top_level_names();

    info.scope_calls.clear();
    info.scope_calls.push_back({"", "", parser.extract_calls(parser.root())});
    for (auto &cls : info.classes) {
        info.scope_calls.push_back({cls.qualified_name, cls.qualified_name,
                                    parser.extract_calls(cls.node)});
        cls.node = TSNode{};
    }
    for (auto &func : info.functions) {
        info.scope_calls.push_back({func.qualified_name, func.containing_class,
                                    parser.extract_calls(func.node)});
        func.node = TSNode{};
    }
    return true;
}

void Analyzer::record_imports(ModuleInfo &info) {
    const std::string &module = info.unit.module;
    std::set<std::string> seen;
    info.dependencies.clear();

    for (const auto &decl : info.imports) {
        std::string base = resolve_import_base(module, info.is_package, decl.level, decl.module);

        // "from pkg import mod" imports the submodule when there is one
        std::string importee = base;
        if (!decl.name.empty() && decl.name != "*") {
            std::string submodule = join_name(base, decl.name);
            if (modules_.count(submodule))
                importee = submodule;
        }
        if (importee.empty() || importee == module)
            continue;

        if (seen.insert(importee).second) {
            recorder_.on_import(info.unit, module, importee);
        }
        if (modules_.count(importee))
            info.dependencies.insert(importee);
        if (base != importee && base != module && modules_.count(base))
            info.dependencies.insert(base);
    }
}

void Analyzer::compute_order() {
    order_.clear();
    std::unordered_set<std::string> visited;

    for (const auto &[name, info] : modules_) {
        if (!visited.insert(name).second)
            continue;

        // Iterative post-order DFS: dependencies are checked first. Cycles
        // are broken by visitation order.
        using Frame = std::pair<const ModuleInfo *, std::set<std::string>::const_iterator>;
        std::vector<Frame> stack;
        stack.emplace_back(&info, info.dependencies.begin());

        while (!stack.empty()) {
            const ModuleInfo *current = stack.back().first;
            auto &it = stack.back().second;
            if (it == current->dependencies.end()) {
                order_.push_back(current->unit.module);
                stack.pop_back();
                continue;
            }

            const std::string &dep = *it;
            ++it;
            auto dep_it = modules_.find(dep);
            if (dep_it == modules_.end() || !visited.insert(dep).second)
                continue;
            stack.emplace_back(&dep_it->second, dep_it->second.dependencies.begin());
        }
    }
}

void Analyzer::rebuild_class_index() {
    class_index_.clear();
    for (const auto &[name, info] : modules_) {
        for (const auto &cls : info.classes) {
            class_index_.insert(join_name(name, cls.qualified_name));
        }
    }
}

std::unordered_map<std::string, std::string>
Analyzer::bindings_for(const ModuleInfo &info) const {
    std::unordered_map<std::string, std::string> bindings;
    const std::string &module = info.unit.module;

    for (const auto &decl : info.imports) {
        if (decl.name.empty()) {
            // import a.b      binds a
            // import a.b as c binds c to a.b
            if (!decl.alias.empty()) {
                bindings[decl.alias] = decl.module;
            } else {
                std::string head = decl.module.substr(0, decl.module.find('.'));
                bindings[head] = head;
            }
            continue;
        }

        std::string base = resolve_import_base(module, info.is_package, decl.level, decl.module);
        if (decl.name == "*") {
            auto it = modules_.find(base);
            if (it == modules_.end())
                continue;
            for (const auto &name : it->second.top_level_names) {
                bindings[name] = join_name(base, name);
            }
            continue;
        }

        const std::string &local = decl.alias.empty() ? decl.name : decl.alias;
        bindings[local] = join_name(base, decl.name);
    }

    // Module-level definitions shadow imports
    for (const auto &name : info.top_level_names) {
        bindings[name] = join_name(module, name);
    }
    return bindings;
}

std::string Analyzer::resolve_name(const std::string &expr,
                                   const std::unordered_map<std::string, std::string> &bindings,
                                   const std::string &class_fullname) {
    size_t dot = expr.find('.');
    std::string head = expr.substr(0, dot);
    std::string rest = (dot == std::string::npos) ? std::string() : expr.substr(dot);

    if ((head == "self" || head == "cls") && !class_fullname.empty()) {
        return rest.empty() ? std::string() : class_fullname + rest;
    }

    auto it = bindings.find(head);
    if (it == bindings.end())
        return "";
    return it->second + rest;
}

void Analyzer::record_call(const CodeUnit &unit, const std::string &caller,
                           const std::string &callee_expr,
                           const std::unordered_map<std::string, std::string> &bindings,
                           const std::string &class_fullname) {
    std::string callee = resolve_name(callee_expr, bindings, class_fullname);
    if (callee.empty())
        return;

    if (class_index_.count(callee)) {
        recorder_.on_class_ref(unit, caller, callee, ClassRefKind::Instantiation);
    } else {
        recorder_.on_function_call(unit, caller, callee);
    }
}

void Analyzer::check(ModuleInfo &info) {
    const CodeUnit &unit = info.unit;
    const std::string &module = unit.module;

    recorder_.on_invalidate(unit, module);

    auto bindings = bindings_for(info);

    for (const auto &cls : info.classes) {
        std::string fullname = join_name(module, cls.qualified_name);
        recorder_.on_class_def(unit, fullname);

        for (const auto &base : cls.bases) {
            std::string dst = resolve_name(base, bindings, "");
            if (!dst.empty())
                recorder_.on_class_ref(unit, fullname, dst, ClassRefKind::Inheritance);
        }
    }

    for (const auto &func : info.functions) {
        recorder_.on_function_def(unit, join_name(module, func.qualified_name));
    }

    for (const auto &scope : info.scope_calls) {
        std::string caller = join_name(module, scope.scope);
        std::string class_fullname =
            scope.containing_class.empty() ? std::string() : join_name(module, scope.containing_class);
        for (const auto &call : scope.calls) {
            record_call(unit, caller, call.name, bindings, class_fullname);
        }
    }

    stats_.modules_checked++;
}

void Analyzer::run() {
    modules_.clear();
    order_.clear();
    stats_ = Stats{};

    for (const auto &root_str : config_.roots) {
        std::error_code ec;
        fs::path root = fs::absolute(root_str, ec).lexically_normal();
        if (ec || !fs::is_directory(root, ec)) {
            std::cerr << "Error: Path does not exist: " << root_str << std::endl;
            continue;
        }
        if (!root.has_filename())
            root = root.parent_path();

        for (const auto &file : discover_files(root)) {
            std::string name = module_name_for(root, file);
            if (name.empty())
                continue;
            if (modules_.count(name)) {
                std::cerr << "Warning: module " << name << " found again at " << file.string()
                          << ", keeping " << modules_[name].unit.path << std::endl;
                continue;
            }

            ModuleInfo info;
            info.unit = CodeUnit{name, file.string()};
            info.is_package = file.filename() == "__init__.py";
            modules_.emplace(name, std::move(info));
            stats_.files_found++;
        }
    }

    // Load: bind every module to its file
    for (auto it = modules_.begin(); it != modules_.end();) {
        if (!load(it->second)) {
            std::cerr << "Error: failed to parse " << it->second.unit.path << std::endl;
            stats_.files_failed++;
            it = modules_.erase(it);
            continue;
        }
        recorder_.on_module_seen(it->second.unit);
        ++it;
    }

    // Imports: the graph the check order is derived from
    for (auto &[name, info] : modules_) {
        record_imports(info);
    }

    rebuild_class_index();
    compute_order();

    size_t current = 0;
    for (const auto &name : order_) {
        current++;
        if (config_.progress_callback)
            config_.progress_callback(name, current, order_.size());
        else if (config_.verbose)
            std::cerr << "\r[" << current << "/" << order_.size() << "] " << name << std::flush;
        check(modules_.at(name));
    }
    if (config_.verbose && !config_.progress_callback && !order_.empty())
        std::cerr << std::endl;
}

void Analyzer::recheck(const std::vector<std::string> &modules) {
    std::set<std::string> stale;

    for (const auto &name : modules) {
        auto it = modules_.find(name);
        if (it == modules_.end()) {
            std::cerr << "Warning: unknown module: " << name << std::endl;
            continue;
        }
        if (!load(it->second)) {
            std::cerr << "Error: failed to parse " << it->second.unit.path << std::endl;
            stats_.files_failed++;
            continue;
        }
        stale.insert(name);
    }

    for (const auto &name : stale) {
        record_imports(modules_.at(name));
    }

    rebuild_class_index();
    compute_order();

    for (const auto &name : order_) {
        if (stale.count(name))
            check(modules_.at(name));
    }
}

} // namespace codegraph

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

#include "codegraph/graph.hpp"
#include <fstream>
#include <stdexcept>

namespace codegraph {

void Graph::apply(const Record &record) {
    records_++;
    if (event_type(record.event) != EventType::Import)
        epoch_++;

    switch (event_type(record.event)) {
    case EventType::Module: {
        const auto &e = std::get<ModuleEvent>(record.event);
        if (!record.file.empty())
            modules_[e.module] = record.file;
        break;
    }
    case EventType::Import: {
        const auto &e = std::get<ImportEvent>(record.event);
        SymbolIdx importer = symbols_.intern(e.importer);
        auto &importees = imports_[importer];
        auto [it, first] = import_epoch_.emplace(importer, epoch_);
        if (!first && it->second != epoch_) {
            // New batch for this importer
            importees.clear();
            it->second = epoch_;
        }
        importees.insert(symbols_.intern(e.importee));
        break;
    }
    case EventType::Invalidate: {
        // Start a new generation for the module's file
        const auto &e = std::get<InvalidateEvent>(record.event);
        invalidations_++;
        generations_[e.module]++;
        std::string file = record.file;
        if (file.empty()) {
            auto it = modules_.find(e.module);
            if (it != modules_.end())
                file = it->second;
        }
        facts_.erase(file);
        break;
    }
    case EventType::ClassDef: {
        const auto &e = std::get<ClassDefEvent>(record.event);
        facts_[record.file].class_defs.insert(symbols_.intern(e.fullname));
        break;
    }
    case EventType::ClassRef: {
        const auto &e = std::get<ClassRefEvent>(record.event);
        facts_[record.file].class_refs.emplace(symbols_.intern(e.src), symbols_.intern(e.dst),
                                               e.kind);
        break;
    }
    case EventType::FunctionDef: {
        const auto &e = std::get<FunctionDefEvent>(record.event);
        facts_[record.file].function_defs.insert(symbols_.intern(e.fullname));
        break;
    }
    case EventType::Call: {
        const auto &e = std::get<FunctionCallEvent>(record.event);
        facts_[record.file].calls.emplace(symbols_.intern(e.caller), symbols_.intern(e.callee));
        break;
    }
    }
}

Graph Graph::from_stream(std::istream &in) {
    Graph graph;
    read_records(in, [&graph](const Record &record, size_t) { graph.apply(record); });
    return graph;
}

Graph Graph::load(const std::string &filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open graph file: " + filepath);
    }
    return from_stream(file);
}

std::vector<std::string> Graph::sorted(std::set<std::string> names) {
    return std::vector<std::string>(names.begin(), names.end());
}

std::vector<std::string> Graph::callees(const std::string &caller) const {
    size_t idx = symbols_.find(caller);
    std::set<std::string> result;
    if (idx == SIZE_MAX)
        return {};
    for (const auto &[file, facts] : facts_) {
        for (const auto &[from, to] : facts.calls) {
            if (from == idx)
                result.insert(name(to));
        }
    }
    return sorted(std::move(result));
}

std::vector<std::string> Graph::callers(const std::string &callee) const {
    size_t idx = symbols_.find(callee);
    std::set<std::string> result;
    if (idx == SIZE_MAX)
        return {};
    for (const auto &[file, facts] : facts_) {
        for (const auto &[from, to] : facts.calls) {
            if (to == idx)
                result.insert(name(from));
        }
    }
    return sorted(std::move(result));
}

std::vector<std::string> Graph::subclasses(const std::string &fullname) const {
    size_t idx = symbols_.find(fullname);
    std::set<std::string> result;
    if (idx == SIZE_MAX)
        return {};
    for (const auto &[file, facts] : facts_) {
        for (const auto &[src, dst, kind] : facts.class_refs) {
            if (dst == idx && kind == ClassRefKind::Inheritance)
                result.insert(name(src));
        }
    }
    return sorted(std::move(result));
}

std::vector<std::string> Graph::instantiations(const std::string &fullname) const {
    size_t idx = symbols_.find(fullname);
    std::set<std::string> result;
    if (idx == SIZE_MAX)
        return {};
    for (const auto &[file, facts] : facts_) {
        for (const auto &[src, dst, kind] : facts.class_refs) {
            if (dst == idx && kind == ClassRefKind::Instantiation)
                result.insert(name(src));
        }
    }
    return sorted(std::move(result));
}

std::vector<std::string> Graph::imports_of(const std::string &module) const {
    size_t idx = symbols_.find(module);
    std::set<std::string> result;
    if (idx == SIZE_MAX)
        return {};
    auto it = imports_.find(idx);
    if (it != imports_.end()) {
        for (SymbolIdx importee : it->second)
            result.insert(name(importee));
    }
    return sorted(std::move(result));
}

std::optional<std::string> Graph::module_file(const std::string &module) const {
    auto it = modules_.find(module);
    if (it == modules_.end())
        return std::nullopt;
    return it->second;
}

bool Graph::has_class(const std::string &fullname) const {
    size_t idx = symbols_.find(fullname);
    if (idx == SIZE_MAX)
        return false;
    for (const auto &[file, facts] : facts_) {
        if (facts.class_defs.count(idx))
            return true;
    }
    return false;
}

bool Graph::has_function(const std::string &fullname) const {
    size_t idx = symbols_.find(fullname);
    if (idx == SIZE_MAX)
        return false;
    for (const auto &[file, facts] : facts_) {
        if (facts.function_defs.count(idx))
            return true;
    }
    return false;
}

size_t Graph::generation(const std::string &module) const {
    auto it = generations_.find(module);
    return (it != generations_.end()) ? it->second : 0;
}

Graph::Summary Graph::summary() const {
    Summary s;
    s.records = records_;
    s.modules = modules_.size();
    for (const auto &[importer, importees] : imports_)
        s.imports += importees.size();
    s.invalidations = invalidations_;

    // The same symbol may be defined from several files; count it once
    std::set<SymbolIdx> classes, functions;
    std::set<ClassRef> class_refs;
    std::set<Edge> calls;
    for (const auto &[file, facts] : facts_) {
        classes.insert(facts.class_defs.begin(), facts.class_defs.end());
        functions.insert(facts.function_defs.begin(), facts.function_defs.end());
        class_refs.insert(facts.class_refs.begin(), facts.class_refs.end());
        calls.insert(facts.calls.begin(), facts.calls.end());
    }
    s.classes = classes.size();
    s.functions = functions.size();
    s.class_refs = class_refs.size();
    s.calls = calls.size();
    return s;
}

json Graph::to_json() const {
    json j;

    json modules = json::object();
    for (const auto &[module, file] : modules_) {
        modules[module] = file;
    }
    j["modules"] = std::move(modules);

    std::set<std::pair<std::string, std::string>> import_names;
    for (const auto &[importer, importees] : imports_) {
        for (SymbolIdx importee : importees)
            import_names.emplace(name(importer), name(importee));
    }
    json imports = json::array();
    for (const auto &[importer, importee] : import_names) {
        imports.push_back({{"importer", importer}, {"importee", importee}});
    }
    j["imports"] = std::move(imports);

    std::set<std::string> classes, functions;
    std::set<std::tuple<std::string, std::string, std::string>> class_refs;
    std::set<std::pair<std::string, std::string>> calls;
    for (const auto &[file, facts] : facts_) {
        for (SymbolIdx idx : facts.class_defs)
            classes.insert(name(idx));
        for (SymbolIdx idx : facts.function_defs)
            functions.insert(name(idx));
        for (const auto &[src, dst, kind] : facts.class_refs)
            class_refs.emplace(name(src), name(dst), class_ref_kind_to_string(kind));
        for (const auto &[caller, callee] : facts.calls)
            calls.emplace(name(caller), name(callee));
    }

    j["classes"] = classes;
    j["functions"] = functions;

    json refs = json::array();
    for (const auto &[src, dst, kind] : class_refs) {
        refs.push_back({{"src", src}, {"dst", dst}, {"kind", kind}});
    }
    j["class_refs"] = std::move(refs);

    json call_list = json::array();
    for (const auto &[caller, callee] : calls) {
        call_list.push_back({{"caller", caller}, {"callee", callee}});
    }
    j["calls"] = std::move(call_list);

    return j;
}

void Graph::save(const std::string &filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filepath);
    }
    file << to_json().dump(-1, ' ', false, json::error_handler_t::replace);
    if (!file) {
        throw std::runtime_error("Failed to write graph to: " + filepath);
    }
}

} // namespace codegraph

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

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace codegraph {

// Fully qualified module name -> defining source file. Entries are never
// removed during a run; registering a name again overwrites its file.
// Known class names let method and nested class names find their module.
class ModuleResolver {
public:
    void register_module(const std::string &module, const std::string &file);

    void register_class(const std::string &fullname) { classes_.insert(fullname); }

    std::optional<std::string> resolve(const std::string &module) const;

    // Module defining `fullname`: the name without its last component, or,
    // while that is a known class, without further components
    // ("pkg.mod.Class.meth" -> "pkg.mod" once "pkg.mod.Class" is known).
    // Registered ancestor packages never stand in for an unknown module.
    std::optional<std::string> defining_module(const std::string &fullname) const;

    // File of defining_module(fullname)
    std::optional<std::string> resolve_symbol(const std::string &fullname) const;

    bool contains(const std::string &module) const { return modules_.count(module) > 0; }
    size_t size() const { return modules_.size(); }

    const std::unordered_map<std::string, std::string> &modules() const { return modules_; }

private:
    std::unordered_map<std::string, std::string> modules_;
    std::unordered_set<std::string> classes_;
};

} // namespace codegraph

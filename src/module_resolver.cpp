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

#include "codegraph/module_resolver.hpp"

namespace codegraph {

void ModuleResolver::register_module(const std::string &module, const std::string &file) {
    modules_[module] = file;
}

std::optional<std::string> ModuleResolver::resolve(const std::string &module) const {
    auto it = modules_.find(module);
    if (it == modules_.end())
        return std::nullopt;
    return it->second;
}

std::optional<std::string> ModuleResolver::defining_module(const std::string &fullname) const {
    std::string candidate = fullname;
    size_t dot = candidate.rfind('.');
    while (dot != std::string::npos && dot > 0) {
        candidate.resize(dot);
        if (modules_.count(candidate))
            return candidate;
        if (!classes_.count(candidate))
            break;
        dot = candidate.rfind('.');
    }
    return std::nullopt;
}

std::optional<std::string> ModuleResolver::resolve_symbol(const std::string &fullname) const {
    auto module = defining_module(fullname);
    if (!module)
        return std::nullopt;
    return resolve(*module);
}

} // namespace codegraph

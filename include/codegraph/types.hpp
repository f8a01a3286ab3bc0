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

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace codegraph {

// ============================================================================
// String Pool - Intern strings to avoid duplication
// ============================================================================
class StringPool {
public:
    // Intern a string and return its index
    size_t intern(const std::string& str) {
        auto it = index_.find(str);
        if (it != index_.end()) {
            return it->second;
        }
        size_t idx = strings_.size();
        strings_.push_back(str);
        index_[strings_.back()] = idx;
        return idx;
    }

    // Get string by index
    const std::string& get(size_t idx) const {
        static const std::string empty;
        return (idx < strings_.size()) ? strings_[idx] : empty;
    }

    // Get index for string (returns SIZE_MAX if not found)
    size_t find(const std::string& str) const {
        auto it = index_.find(str);
        return (it != index_.end()) ? it->second : SIZE_MAX;
    }

    size_t size() const { return strings_.size(); }

    void clear() {
        strings_.clear();
        index_.clear();
    }

private:
    std::vector<std::string> strings_;
    std::unordered_map<std::string, size_t> index_;
};

// The code unit the host is currently processing. Every record is scoped to
// (and tagged with) this file.
struct CodeUnit {
    std::string module; // Fully qualified module name, e.g. "pkg.sub.mod"
    std::string path;   // Source file defining the module
};

// How one class refers to another
enum class ClassRefKind {
    Inheritance,
    Instantiation,
    // Reserved: no host instrumentation populates these yet
    TypeInFunctionPrototype, // used in a function's argument or return types
    InstanceVarType,         // type of an instance variable
    ClassVarType,            // type of a class variable
};

inline const char *class_ref_kind_to_string(ClassRefKind kind) {
    switch (kind) {
    case ClassRefKind::Inheritance:
        return "INHERITANCE";
    case ClassRefKind::Instantiation:
        return "INSTANTIATION";
    case ClassRefKind::TypeInFunctionPrototype:
        return "TYPE_IN_FUNCTION_PROTOTYPE";
    case ClassRefKind::InstanceVarType:
        return "IVAR_TYPE";
    case ClassRefKind::ClassVarType:
        return "CVAR_TYPE";
    }
    return "UNKNOWN";
}

// Returns false if the name is not one of the kinds above
inline bool class_ref_kind_from_string(std::string_view name, ClassRefKind &out) {
    if (name == "INHERITANCE")
        out = ClassRefKind::Inheritance;
    else if (name == "INSTANTIATION")
        out = ClassRefKind::Instantiation;
    else if (name == "TYPE_IN_FUNCTION_PROTOTYPE")
        out = ClassRefKind::TypeInFunctionPrototype;
    else if (name == "IVAR_TYPE")
        out = ClassRefKind::InstanceVarType;
    else if (name == "CVAR_TYPE")
        out = ClassRefKind::ClassVarType;
    else
        return false;
    return true;
}

// ============================================================================
// Graph events
// ============================================================================

struct ModuleEvent {
    std::string module;
};

struct ImportEvent {
    std::string importer;
    std::string importee;
};

struct InvalidateEvent {
    std::string module;
};

struct ClassDefEvent {
    std::string fullname;
};

struct ClassRefEvent {
    std::string src;
    std::string dst;
    ClassRefKind kind = ClassRefKind::Inheritance;
};

struct FunctionDefEvent {
    std::string fullname;
};

struct FunctionCallEvent {
    std::string caller;
    std::string callee;
};

using GraphEvent = std::variant<ModuleEvent, ImportEvent, InvalidateEvent, ClassDefEvent,
                                ClassRefEvent, FunctionDefEvent, FunctionCallEvent>;

// Wire discriminator ("type" field) of each event, in variant order
enum class EventType { Module, Import, Invalidate, ClassDef, ClassRef, FunctionDef, Call };

inline EventType event_type(const GraphEvent &event) {
    return static_cast<EventType>(event.index());
}

inline const char *event_type_to_string(EventType type) {
    switch (type) {
    case EventType::Module:
        return "module";
    case EventType::Import:
        return "import";
    case EventType::Invalidate:
        return "invalidate";
    case EventType::ClassDef:
        return "class_def";
    case EventType::ClassRef:
        return "class_ref";
    case EventType::FunctionDef:
        return "function_def";
    case EventType::Call:
        return "call";
    }
    return "unknown";
}

inline bool event_type_from_string(std::string_view name, EventType &out) {
    static const std::pair<std::string_view, EventType> names[] = {
        {"module", EventType::Module},         {"import", EventType::Import},
        {"invalidate", EventType::Invalidate}, {"class_def", EventType::ClassDef},
        {"class_ref", EventType::ClassRef},    {"function_def", EventType::FunctionDef},
        {"call", EventType::Call},
    };
    for (const auto &[n, t] : names) {
        if (n == name) {
            out = t;
            return true;
        }
    }
    return false;
}

} // namespace codegraph

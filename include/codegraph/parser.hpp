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

#include "types.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <tree_sitter/api.h>
#include <vector>

// Forward declaration for the tree-sitter grammar
extern "C" {
const TSLanguage *tree_sitter_python();
}

namespace codegraph {

// One imported name.
//   import a.b as c       -> module "a.b", name "",  alias "c"
//   from ..x import y     -> module "x",   name "y", level 2
//   from x import *       -> module "x",   name "*"
struct ImportDecl {
    std::string module; // Module as written, without leading dots
    std::string name;   // Imported member for "from" imports, empty otherwise
    std::string alias;  // "as" name, if any
    int level = 0;      // Number of leading dots of a relative import
    uint32_t line = 0;
};

// Parsed class definition
struct ClassDef {
    std::string name;               // Simple name
    std::string qualified_name;     // Relative to the module, e.g. "Outer.Inner"
    std::vector<std::string> bases; // Base class expressions as written (dotted names)
    uint32_t line = 0;
    TSNode node;
};

// Parsed function definition
struct FunctionDef {
    std::string name;             // Simple name
    std::string qualified_name;   // Relative to the module, e.g. "Class.method"
    std::string containing_class; // Qualified name of the enclosing class, if a method
    uint32_t start_line = 0;
    uint32_t end_line = 0;
    TSNode node;
};

// Parsed call site
struct FunctionCall {
    std::string name; // Callee as written, e.g. "self.helper" or "os.path.join"
    uint32_t line = 0;
};

// tree-sitter based extractor for Python sources
class PythonParser {
public:
    PythonParser();
    ~PythonParser();

    // Non-copyable
    PythonParser(const PythonParser &) = delete;
    PythonParser &operator=(const PythonParser &) = delete;

    // Movable
    PythonParser(PythonParser &&other) noexcept;
    PythonParser &operator=(PythonParser &&other) noexcept;

    // Parse source code
    bool parse(const std::string &source);

    std::vector<ImportDecl> extract_imports() const;
    std::vector<ClassDef> extract_classes() const;
    std::vector<FunctionDef> extract_functions() const;

    // Calls made directly in `scope` (a function, a class body or the module
    // root), not descending into nested function or class definitions
    std::vector<FunctionCall> extract_calls(TSNode scope) const;

    // Names bound at module level by class and function definitions
    std::vector<std::string> top_level_names() const;

    TSNode root() const;

    const std::string &source() const { return source_; }

private:
    TSParser *parser_ = nullptr;
    TSTree *tree_ = nullptr;
    std::string source_;

    std::string node_text(TSNode node) const;

    // Iterative pre-order walk; children are skipped when the visitor
    // returns false
    void visit_nodes(TSNode node, const std::function<bool(TSNode)> &visitor) const;

    // Qualified prefix ("Outer.method.") of the classes/functions enclosing `node`
    std::string scope_prefix(TSNode node, std::string *containing_class) const;

    void add_import_name(TSNode name_node, const std::string &module, int level, uint32_t line,
                         bool from_import, std::vector<ImportDecl> &out) const;
};

// "a.b.c" made only of identifiers and dots
bool is_dotted_name(const std::string &text);

} // namespace codegraph

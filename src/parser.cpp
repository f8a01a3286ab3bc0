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

#include "codegraph/parser.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <stdexcept>

namespace codegraph {

bool is_dotted_name(const std::string &text) {
    if (text.empty())
        return false;
    bool at_start = true;
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (c == '.') {
            if (at_start)
                return false;
            at_start = true;
        } else if (std::isalpha(uc) || c == '_' || uc >= 0x80) {
            at_start = false;
        } else if (std::isdigit(uc)) {
            if (at_start)
                return false;
        } else {
            return false;
        }
    }
    return !at_start;
}

PythonParser::PythonParser() {
    parser_ = ts_parser_new();
    if (!parser_) {
        throw std::runtime_error("Failed to create tree-sitter parser");
    }
    if (!ts_parser_set_language(parser_, tree_sitter_python())) {
        ts_parser_delete(parser_);
        throw std::runtime_error("Failed to set parser language");
    }
}

PythonParser::~PythonParser() {
    if (tree_) ts_tree_delete(tree_);
    if (parser_) ts_parser_delete(parser_);
}

PythonParser::PythonParser(PythonParser&& other) noexcept
    : parser_(other.parser_)
    , tree_(other.tree_)
    , source_(std::move(other.source_)) {
    other.parser_ = nullptr;
    other.tree_ = nullptr;
}

PythonParser& PythonParser::operator=(PythonParser&& other) noexcept {
    if (this != &other) {
        if (tree_) ts_tree_delete(tree_);
        if (parser_) ts_parser_delete(parser_);

        parser_ = other.parser_;
        tree_ = other.tree_;
        source_ = std::move(other.source_);

        other.parser_ = nullptr;
        other.tree_ = nullptr;
    }
    return *this;
}

bool PythonParser::parse(const std::string& source) {
    source_ = source;

    if (tree_) {
        ts_tree_delete(tree_);
        tree_ = nullptr;
    }

    tree_ = ts_parser_parse_string(parser_, nullptr, source_.c_str(), source_.size());
    return tree_ != nullptr;
}

TSNode PythonParser::root() const {
    if (!tree_) {
        return TSNode{};
    }
    return ts_tree_root_node(tree_);
}

std::string PythonParser::node_text(TSNode node) const {
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (start < source_.size() && end <= source_.size()) {
        return source_.substr(start, end - start);
    }
    return "";
}

void PythonParser::visit_nodes(TSNode node, const std::function<bool(TSNode)>& visitor) const {
    // Explicit stack instead of recursion
    std::vector<TSNode> stack;
    stack.push_back(node);

    while (!stack.empty()) {
        TSNode current = stack.back();
        stack.pop_back();

        if (!visitor(current))
            continue;

        uint32_t child_count = ts_node_child_count(current);
        // Add children in reverse order so they're processed in order
        for (uint32_t i = child_count; i > 0; --i) {
            stack.push_back(ts_node_child(current, i - 1));
        }
    }
}

std::string PythonParser::scope_prefix(TSNode node, std::string* containing_class) const {
    std::vector<std::string> names;
    bool in_class = false; // Innermost enclosing definition is a class

    for (TSNode parent = ts_node_parent(node); !ts_node_is_null(parent);
         parent = ts_node_parent(parent)) {
        const char* type = ts_node_type(parent);
        bool is_class = strcmp(type, "class_definition") == 0;
        if (!is_class && strcmp(type, "function_definition") != 0)
            continue;

        TSNode name_node = ts_node_child_by_field_name(parent, "name", 4);
        if (ts_node_is_null(name_node))
            continue;
        if (names.empty())
            in_class = is_class;
        names.push_back(node_text(name_node));
    }

    std::string prefix;
    for (auto it = names.rbegin(); it != names.rend(); ++it) {
        prefix += *it;
        prefix += '.';
    }

    if (containing_class) {
        containing_class->clear();
        if (in_class)
            *containing_class = prefix.substr(0, prefix.size() - 1);
    }
    return prefix;
}

// ============ Imports ============

void PythonParser::add_import_name(TSNode name_node, const std::string& module, int level,
                                   uint32_t line, bool from_import,
                                   std::vector<ImportDecl>& out) const {
    const char* type = ts_node_type(name_node);
    ImportDecl decl;
    decl.level = level;
    decl.line = line;

    std::string name;
    if (strcmp(type, "dotted_name") == 0) {
        name = node_text(name_node);
    } else if (strcmp(type, "aliased_import") == 0) {
        TSNode inner = ts_node_child_by_field_name(name_node, "name", 4);
        TSNode alias = ts_node_child_by_field_name(name_node, "alias", 5);
        if (ts_node_is_null(inner))
            return;
        name = node_text(inner);
        if (!ts_node_is_null(alias))
            decl.alias = node_text(alias);
    } else {
        return;
    }

    if (from_import) {
        decl.module = module;
        decl.name = name;
    } else {
        decl.module = name;
    }
    out.push_back(decl);
}

std::vector<ImportDecl> PythonParser::extract_imports() const {
    std::vector<ImportDecl> imports;
    if (!tree_) return imports;

    visit_nodes(root(), [&](TSNode node) {
        const char* type = ts_node_type(node);
        uint32_t line = ts_node_start_point(node).row + 1;

        if (strcmp(type, "import_statement") == 0) {
            uint32_t count = ts_node_child_count(node);
            for (uint32_t i = 0; i < count; ++i) {
                const char* field = ts_node_field_name_for_child(node, i);
                if (field && strcmp(field, "name") == 0) {
                    add_import_name(ts_node_child(node, i), "", 0, line, false, imports);
                }
            }
            return false;
        }

        if (strcmp(type, "import_from_statement") == 0) {
            std::string module;
            int level = 0;

            TSNode module_node = ts_node_child_by_field_name(node, "module_name", 11);
            if (!ts_node_is_null(module_node)) {
                if (strcmp(ts_node_type(module_node), "relative_import") == 0) {
                    uint32_t n = ts_node_child_count(module_node);
                    for (uint32_t i = 0; i < n; ++i) {
                        TSNode part = ts_node_child(module_node, i);
                        const char* part_type = ts_node_type(part);
                        if (strcmp(part_type, "import_prefix") == 0) {
                            std::string dots = node_text(part);
                            level = static_cast<int>(std::count(dots.begin(), dots.end(), '.'));
                        } else if (strcmp(part_type, "dotted_name") == 0) {
                            module = node_text(part);
                        }
                    }
                } else {
                    module = node_text(module_node);
                }
            }

            uint32_t count = ts_node_child_count(node);
            for (uint32_t i = 0; i < count; ++i) {
                TSNode child = ts_node_child(node, i);
                if (strcmp(ts_node_type(child), "wildcard_import") == 0) {
                    ImportDecl decl;
                    decl.module = module;
                    decl.name = "*";
                    decl.level = level;
                    decl.line = line;
                    imports.push_back(decl);
                    continue;
                }
                const char* field = ts_node_field_name_for_child(node, i);
                if (field && strcmp(field, "name") == 0) {
                    add_import_name(child, module, level, line, true, imports);
                }
            }
            return false;
        }

        // Imports inside functions and classes are still imports
        return true;
    });

    return imports;
}

// ============ Definitions ============

std::vector<ClassDef> PythonParser::extract_classes() const {
    std::vector<ClassDef> classes;
    if (!tree_) return classes;

    visit_nodes(root(), [&](TSNode node) {
        if (strcmp(ts_node_type(node), "class_definition") != 0)
            return true;

        TSNode name_node = ts_node_child_by_field_name(node, "name", 4);
        if (ts_node_is_null(name_node))
            return true;

        ClassDef cls;
        cls.name = node_text(name_node);
        cls.qualified_name = scope_prefix(node, nullptr) + cls.name;
        cls.line = ts_node_start_point(node).row + 1;
        cls.node = node;

        TSNode bases = ts_node_child_by_field_name(node, "superclasses", 12);
        if (!ts_node_is_null(bases)) {
            uint32_t count = ts_node_named_child_count(bases);
            for (uint32_t i = 0; i < count; ++i) {
                TSNode base = ts_node_named_child(bases, i);
                const char* base_type = ts_node_type(base);
                // Skips keyword arguments such as metaclass=...
                if (strcmp(base_type, "identifier") != 0 && strcmp(base_type, "attribute") != 0)
                    continue;
                std::string text = node_text(base);
                if (is_dotted_name(text))
                    cls.bases.push_back(text);
            }
        }

        classes.push_back(cls);
        return true;
    });

    return classes;
}

std::vector<FunctionDef> PythonParser::extract_functions() const {
    std::vector<FunctionDef> functions;
    if (!tree_) return functions;

    visit_nodes(root(), [&](TSNode node) {
        if (strcmp(ts_node_type(node), "function_definition") != 0)
            return true;

        TSNode name_node = ts_node_child_by_field_name(node, "name", 4);
        if (ts_node_is_null(name_node))
            return true;

        FunctionDef func;
        func.name = node_text(name_node);
        func.qualified_name = scope_prefix(node, &func.containing_class) + func.name;
        func.start_line = ts_node_start_point(node).row + 1;
        func.end_line = ts_node_end_point(node).row + 1;
        func.node = node;

        functions.push_back(func);
        return true;
    });

    return functions;
}

std::vector<FunctionCall> PythonParser::extract_calls(TSNode scope) const {
    std::vector<FunctionCall> calls;
    if (!tree_ || ts_node_is_null(scope)) return calls;

    visit_nodes(scope, [&](TSNode node) {
        const char* type = ts_node_type(node);

        if (!ts_node_eq(node, scope) && (strcmp(type, "function_definition") == 0 ||
                                         strcmp(type, "class_definition") == 0)) {
            return false;
        }

        if (strcmp(type, "call") == 0) {
            TSNode func_node = ts_node_child_by_field_name(node, "function", 8);
            if (!ts_node_is_null(func_node)) {
                const char* func_type = ts_node_type(func_node);
                if (strcmp(func_type, "identifier") == 0 || strcmp(func_type, "attribute") == 0) {
                    // obj.method() keeps the full attribute chain; chains
                    // through calls or subscripts are not names
                    std::string name = node_text(func_node);
                    if (is_dotted_name(name)) {
                        FunctionCall call;
                        call.name = name;
                        call.line = ts_node_start_point(node).row + 1;
                        calls.push_back(call);
                    }
                }
            }
        }
        return true;
    });

    return calls;
}

std::vector<std::string> PythonParser::top_level_names() const {
    std::vector<std::string> names;
    if (!tree_) return names;

    TSNode module = root();
    uint32_t count = ts_node_named_child_count(module);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(module, i);
        if (strcmp(ts_node_type(child), "decorated_definition") == 0) {
            child = ts_node_child_by_field_name(child, "definition", 10);
            if (ts_node_is_null(child))
                continue;
        }
        const char* type = ts_node_type(child);
        if (strcmp(type, "class_definition") == 0 || strcmp(type, "function_definition") == 0) {
            TSNode name_node = ts_node_child_by_field_name(child, "name", 4);
            if (!ts_node_is_null(name_node))
                names.push_back(node_text(name_node));
        }
    }
    return names;
}

} // namespace codegraph

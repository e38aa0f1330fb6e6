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
#include <memory>
#include <string>
#include <tree_sitter/api.h>
#include <vector>

// Forward declarations for tree-sitter language functions
extern "C" {
const TSLanguage *tree_sitter_typescript();
const TSLanguage *tree_sitter_tsx();
}

namespace surveyor {

// Top-level import or re-export
struct ImportDecl {
    std::string specifier; // Module specifier as written, without quotes
    bool reexport = false; // export ... from '...'
    uint32_t line = 0;
};

// Decorator attached to a class
struct DecoratorInfo {
    std::string name;               // "Component", "Injectable", ...
    json metadata = json::object(); // First object-literal argument, parsed
};

// Constructor parameter with a type annotation
struct ParameterDecl {
    std::string name;
    std::string type;
};

// Class declaration (plain or abstract)
struct ClassDecl {
    std::string name;
    bool is_abstract = false;
    std::vector<DecoratorInfo> decorators;
    std::vector<ParameterDecl> constructor_params;
    std::vector<std::string> implements;
    std::string extends;
    std::vector<std::string> members; // Method names
    uint32_t start_line = 0;
    uint32_t end_line = 0;
};

struct InterfaceDecl {
    std::string name;
    uint32_t line = 0;
};

// Parser for a single language
class LanguageParser {
public:

    explicit LanguageParser(Language lang);
    ~LanguageParser();

    // Non-copyable
    LanguageParser(const LanguageParser &) = delete;
    LanguageParser &operator=(const LanguageParser &) = delete;

    // Movable
    LanguageParser(LanguageParser &&other) noexcept;
    LanguageParser &operator=(LanguageParser &&other) noexcept;

    // Parse source code
    bool parse(const std::string &source);

    // True if the last parse produced error nodes (results are partial)
    bool has_errors() const;

    // Top-level imports and re-exports
    std::vector<ImportDecl> extract_imports() const;

    // Top-level class declarations, exported or not
    std::vector<ClassDecl> extract_classes() const;

    // Top-level interface declarations, exported or not
    std::vector<InterfaceDecl> extract_interfaces() const;

    // Get root node
    TSNode root() const;

    const std::string &source() const { return source_; }

    Language language() const { return language_; }

private:

    Language language_;
    TSParser *parser_ = nullptr;
    TSTree *tree_ = nullptr;
    std::string source_;

    std::string node_text(TSNode node) const;

    // Contents of a string literal without quotes
    std::string string_value(TSNode node) const;

    ClassDecl parse_class(TSNode node, TSNode exporter) const;
    DecoratorInfo parse_decorator(TSNode node) const;
    json parse_metadata(TSNode object) const;
    json parse_value(TSNode value) const;

    // Bare name of a metadata list entry (X, X.forRoot(...), { provide: X })
    std::string entry_name(TSNode node) const;

    // Top-level statements with export wrappers peeled off: (declaration, export_statement or null)
    std::vector<std::pair<TSNode, TSNode>> top_level_declarations() const;
};

// Factory to create parser for a language
std::unique_ptr<LanguageParser> create_parser(Language lang);

} // namespace surveyor

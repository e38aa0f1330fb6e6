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

#include "surveyor/parser.hpp"
#include <cstring>
#include <stdexcept>

namespace surveyor {

namespace {

TSNode field(TSNode node, const char *name) {
    return ts_node_child_by_field_name(node, name, static_cast<uint32_t>(std::strlen(name)));
}

bool is_type(TSNode node, const char *type) {
    return std::strcmp(ts_node_type(node), type) == 0;
}

// First named child of the given type, or a null node
TSNode named_child_of_type(TSNode node, const char *type) {
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(node, i);
        if (is_type(child, type))
            return child;
    }
    return TSNode{};
}

// First named child that is not a comment, or a null node
TSNode first_named_non_comment(TSNode node) {
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(node, i);
        if (!is_type(child, "comment"))
            return child;
    }
    return TSNode{};
}

uint32_t line_of(TSNode node) { return ts_node_start_point(node).row + 1; }

} // namespace

LanguageParser::LanguageParser(Language lang) : language_(lang) {
    parser_ = ts_parser_new();
    if (!parser_) {
        throw std::runtime_error("Failed to create tree-sitter parser");
    }

    const TSLanguage *ts_lang = nullptr;
    switch (lang) {
    case Language::TypeScript:
        ts_lang = tree_sitter_typescript();
        break;
    case Language::Tsx:
        ts_lang = tree_sitter_tsx();
        break;
    default:
        ts_parser_delete(parser_);
        throw std::runtime_error("Unsupported language");
    }

    if (!ts_parser_set_language(parser_, ts_lang)) {
        ts_parser_delete(parser_);
        throw std::runtime_error("Failed to set parser language");
    }
}

LanguageParser::~LanguageParser() {
    if (tree_) ts_tree_delete(tree_);
    if (parser_) ts_parser_delete(parser_);
}

LanguageParser::LanguageParser(LanguageParser &&other) noexcept
    : language_(other.language_)
    , parser_(other.parser_)
    , tree_(other.tree_)
    , source_(std::move(other.source_)) {
    other.parser_ = nullptr;
    other.tree_ = nullptr;
}

LanguageParser &LanguageParser::operator=(LanguageParser &&other) noexcept {
    if (this != &other) {
        if (tree_) ts_tree_delete(tree_);
        if (parser_) ts_parser_delete(parser_);

        language_ = other.language_;
        parser_ = other.parser_;
        tree_ = other.tree_;
        source_ = std::move(other.source_);

        other.parser_ = nullptr;
        other.tree_ = nullptr;
    }
    return *this;
}

bool LanguageParser::parse(const std::string &source) {
    source_ = source;

    if (tree_) {
        ts_tree_delete(tree_);
        tree_ = nullptr;
    }

    tree_ = ts_parser_parse_string(parser_, nullptr, source_.c_str(),
                                   static_cast<uint32_t>(source_.size()));
    return tree_ != nullptr;
}

bool LanguageParser::has_errors() const {
    return tree_ && ts_node_has_error(root());
}

TSNode LanguageParser::root() const {
    if (!tree_) {
        return TSNode{};
    }
    return ts_tree_root_node(tree_);
}

std::string LanguageParser::node_text(TSNode node) const {
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (start < source_.size() && end <= source_.size()) {
        return source_.substr(start, end - start);
    }
    return "";
}

std::string LanguageParser::string_value(TSNode node) const {
    std::string out;
    bool has_parts = false;
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode part = ts_node_named_child(node, i);
        if (is_type(part, "string_fragment") || is_type(part, "escape_sequence")) {
            out += node_text(part);
            has_parts = true;
        }
    }
    if (has_parts)
        return out;

    // Empty literal: strip the quotes
    std::string text = node_text(node);
    if (text.size() >= 2)
        return text.substr(1, text.size() - 2);
    return "";
}

std::vector<std::pair<TSNode, TSNode>> LanguageParser::top_level_declarations() const {
    std::vector<std::pair<TSNode, TSNode>> out;
    if (!tree_) return out;

    TSNode program = root();
    uint32_t count = ts_node_named_child_count(program);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode node = ts_node_named_child(program, i);
        if (is_type(node, "export_statement")) {
            TSNode decl = field(node, "declaration");
            if (ts_node_is_null(decl)) {
                // export default class Foo {}
                TSNode value = field(node, "value");
                if (!ts_node_is_null(value) && is_type(value, "class"))
                    decl = value;
            }
            if (!ts_node_is_null(decl))
                out.emplace_back(decl, node);
        } else {
            out.emplace_back(node, TSNode{});
        }
    }
    return out;
}

std::vector<ImportDecl> LanguageParser::extract_imports() const {
    std::vector<ImportDecl> imports;
    if (!tree_) return imports;

    TSNode program = root();
    uint32_t count = ts_node_named_child_count(program);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode node = ts_node_named_child(program, i);
        bool is_import = is_type(node, "import_statement");
        bool is_export = is_type(node, "export_statement");
        if (!is_import && !is_export)
            continue;

        TSNode source = field(node, "source");
        if (ts_node_is_null(source) && is_import) {
            source = named_child_of_type(node, "string");
        }
        if (ts_node_is_null(source))
            continue;

        ImportDecl decl;
        decl.specifier = string_value(source);
        decl.reexport = is_export;
        decl.line = line_of(node);
        if (!decl.specifier.empty())
            imports.push_back(std::move(decl));
    }
    return imports;
}

std::vector<ClassDecl> LanguageParser::extract_classes() const {
    std::vector<ClassDecl> classes;
    for (const auto &[decl, exporter] : top_level_declarations()) {
        if (is_type(decl, "class_declaration") || is_type(decl, "abstract_class_declaration") ||
            is_type(decl, "class")) {
            ClassDecl cls = parse_class(decl, exporter);
            if (!cls.name.empty())
                classes.push_back(std::move(cls));
        }
    }
    return classes;
}

std::vector<InterfaceDecl> LanguageParser::extract_interfaces() const {
    std::vector<InterfaceDecl> interfaces;
    for (const auto &[decl, exporter] : top_level_declarations()) {
        (void)exporter;
        if (!is_type(decl, "interface_declaration"))
            continue;
        TSNode name_node = field(decl, "name");
        if (ts_node_is_null(name_node))
            continue;
        InterfaceDecl iface;
        iface.name = node_text(name_node);
        iface.line = line_of(decl);
        interfaces.push_back(std::move(iface));
    }
    return interfaces;
}

ClassDecl LanguageParser::parse_class(TSNode node, TSNode exporter) const {
    ClassDecl cls;
    TSNode name_node = field(node, "name");
    if (ts_node_is_null(name_node))
        return cls;

    cls.name = node_text(name_node);
    cls.is_abstract = is_type(node, "abstract_class_declaration");
    cls.start_line = line_of(node);
    cls.end_line = ts_node_end_point(node).row + 1;

    // Decorators sit on the export statement when they precede "export"
    for (TSNode owner : {exporter, node}) {
        if (ts_node_is_null(owner))
            continue;
        uint32_t count = ts_node_child_count(owner);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_child(owner, i);
            if (is_type(child, "decorator"))
                cls.decorators.push_back(parse_decorator(child));
        }
    }

    TSNode heritage = named_child_of_type(node, "class_heritage");
    if (!ts_node_is_null(heritage)) {
        uint32_t count = ts_node_named_child_count(heritage);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode clause = ts_node_named_child(heritage, i);
            if (is_type(clause, "extends_clause")) {
                TSNode value = field(clause, "value");
                if (ts_node_is_null(value))
                    value = first_named_non_comment(clause);
                if (!ts_node_is_null(value))
                    cls.extends = node_text(value);
            } else if (is_type(clause, "implements_clause")) {
                uint32_t type_count = ts_node_named_child_count(clause);
                for (uint32_t j = 0; j < type_count; ++j) {
                    TSNode type = ts_node_named_child(clause, j);
                    if (is_type(type, "comment"))
                        continue;
                    // Foo<T> implements Foo
                    if (is_type(type, "generic_type")) {
                        TSNode base = field(type, "name");
                        if (!ts_node_is_null(base))
                            type = base;
                    }
                    cls.implements.push_back(node_text(type));
                }
            }
        }
    }

    TSNode body = field(node, "body");
    if (ts_node_is_null(body))
        return cls;

    uint32_t member_count = ts_node_named_child_count(body);
    for (uint32_t i = 0; i < member_count; ++i) {
        TSNode member = ts_node_named_child(body, i);
        bool is_method = is_type(member, "method_definition");
        if (!is_method && !is_type(member, "abstract_method_signature") &&
            !is_type(member, "method_signature"))
            continue;

        TSNode member_name = field(member, "name");
        if (ts_node_is_null(member_name))
            continue;
        std::string name = node_text(member_name);

        if (!is_method || name != "constructor") {
            cls.members.push_back(name);
            continue;
        }

        TSNode params = field(member, "parameters");
        if (ts_node_is_null(params))
            continue;
        uint32_t param_count = ts_node_named_child_count(params);
        for (uint32_t j = 0; j < param_count; ++j) {
            TSNode param = ts_node_named_child(params, j);
            if (!is_type(param, "required_parameter") && !is_type(param, "optional_parameter"))
                continue;
            TSNode pattern = field(param, "pattern");
            TSNode type = field(param, "type");
            if (ts_node_is_null(pattern) || ts_node_is_null(type) ||
                !is_type(pattern, "identifier"))
                continue;
            // type_annotation wraps the type after ':'
            TSNode type_node = first_named_non_comment(type);
            if (ts_node_is_null(type_node))
                continue;
            cls.constructor_params.push_back({node_text(pattern), node_text(type_node)});
        }
    }

    return cls;
}

DecoratorInfo LanguageParser::parse_decorator(TSNode node) const {
    DecoratorInfo info;
    TSNode expr = first_named_non_comment(node);
    if (ts_node_is_null(expr))
        return info;

    if (!is_type(expr, "call_expression")) {
        info.name = node_text(expr);
        return info;
    }

    TSNode function = field(expr, "function");
    if (!ts_node_is_null(function))
        info.name = node_text(function);

    TSNode args = field(expr, "arguments");
    if (!ts_node_is_null(args)) {
        TSNode first = first_named_non_comment(args);
        if (!ts_node_is_null(first) && is_type(first, "object"))
            info.metadata = parse_metadata(first);
    }
    return info;
}

json LanguageParser::parse_metadata(TSNode object) const {
    json metadata = json::object();
    uint32_t count = ts_node_named_child_count(object);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode pair = ts_node_named_child(object, i);
        if (!is_type(pair, "pair"))
            continue;
        TSNode key = field(pair, "key");
        TSNode value = field(pair, "value");
        if (ts_node_is_null(key) || ts_node_is_null(value) ||
            !is_type(key, "property_identifier"))
            continue;
        metadata[node_text(key)] = parse_value(value);
    }
    return metadata;
}

json LanguageParser::parse_value(TSNode value) const {
    if (is_type(value, "string"))
        return string_value(value);
    if (is_type(value, "number"))
        return node_text(value);
    if (is_type(value, "true"))
        return true;
    if (is_type(value, "false"))
        return false;
    if (is_type(value, "identifier") || is_type(value, "member_expression"))
        return node_text(value);
    if (is_type(value, "array")) {
        json list = json::array();
        uint32_t count = ts_node_named_child_count(value);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode element = ts_node_named_child(value, i);
            if (is_type(element, "comment") || is_type(element, "spread_element"))
                continue;
            std::string name = entry_name(element);
            if (!name.empty())
                list.push_back(std::move(name));
        }
        return list;
    }
    return std::string("[Complex Value: ") + ts_node_type(value) + "]";
}

std::string LanguageParser::entry_name(TSNode node) const {
    if (is_type(node, "string"))
        return string_value(node);

    if (is_type(node, "call_expression")) {
        // RouterModule.forRoot(routes) -> RouterModule
        TSNode function = field(node, "function");
        if (ts_node_is_null(function))
            return node_text(node);
        if (is_type(function, "member_expression")) {
            TSNode object = field(function, "object");
            if (!ts_node_is_null(object))
                return entry_name(object);
        }
        return node_text(function);
    }

    if (is_type(node, "object")) {
        // { provide: Token, useClass: Impl } -> Token
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode pair = ts_node_named_child(node, i);
            if (!is_type(pair, "pair"))
                continue;
            TSNode key = field(pair, "key");
            TSNode value = field(pair, "value");
            if (!ts_node_is_null(key) && !ts_node_is_null(value) && node_text(key) == "provide")
                return entry_name(value);
        }
    }

    return node_text(node);
}

// Factory function
std::unique_ptr<LanguageParser> create_parser(Language lang) {
    return std::make_unique<LanguageParser>(lang);
}

} // namespace surveyor

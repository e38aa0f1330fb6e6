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

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace surveyor {

using json = nlohmann::json;

// Path suffix used by placeholder targets whose declaring file is not known yet
constexpr const char *UNKNOWN_PATH = "UNKNOWN_PATH";

// Supported source languages (one tree-sitter grammar each)
enum class Language { Unknown, TypeScript, Tsx };

inline const char *language_to_string(Language lang) {
    switch (lang) {
    case Language::TypeScript:
        return "typescript";
    case Language::Tsx:
        return "tsx";
    default:
        return "unknown";
    }
}

// Get language from a file name. Declaration files (*.d.ts) are never analyzed.
inline Language language_from_filename(const std::string &filename) {
    auto ends_with = [&](const char *suffix) {
        size_t len = std::char_traits<char>::length(suffix);
        return filename.size() >= len && filename.compare(filename.size() - len, len, suffix) == 0;
    };
    if (ends_with(".d.ts"))
        return Language::Unknown;
    if (ends_with(".ts"))
        return Language::TypeScript;
    if (ends_with(".tsx"))
        return Language::Tsx;
    return Language::Unknown;
}

// ============================================================================
// Entity kinds
// ============================================================================

// Class (plain type), Component (UI), Service (injectable), Module (aggregation)
enum class EntityKind { File, Class, Component, Service, Module, Pipe, Directive, Interface, Unknown };

// Persisted node label
inline const char *entity_kind_to_string(EntityKind kind) {
    switch (kind) {
    case EntityKind::File:
        return "File";
    case EntityKind::Class:
        return "Class";
    case EntityKind::Component:
        return "Component";
    case EntityKind::Service:
        return "Service";
    case EntityKind::Module:
        return "Module";
    case EntityKind::Pipe:
        return "Pipe";
    case EntityKind::Directive:
        return "Directive";
    case EntityKind::Interface:
        return "Interface";
    default:
        return "Unknown";
    }
}

inline std::optional<EntityKind> entity_kind_from_string(const std::string &label) {
    static const EntityKind all[] = {EntityKind::File,      EntityKind::Class,
                                     EntityKind::Component, EntityKind::Service,
                                     EntityKind::Module,    EntityKind::Pipe,
                                     EntityKind::Directive, EntityKind::Interface,
                                     EntityKind::Unknown};
    for (EntityKind kind : all) {
        if (label == entity_kind_to_string(kind))
            return kind;
    }
    return std::nullopt;
}

// Rank used when a kind is refined: the higher rank wins, equal ranks take the later kind
inline int entity_kind_specificity(EntityKind kind) {
    switch (kind) {
    case EntityKind::Unknown:
        return 0;
    case EntityKind::Class:
        return 1;
    default:
        return 2;
    }
}

// ============================================================================
// Relationship kinds
// ============================================================================

enum class RelationKind {
    Imports,
    Declares,
    Provides,
    ImportsModule,
    ExportsModule,
    Bootstraps,
    Injects,
    DefinedIn,
    Implements,
    UsesPipe,
    UsesDirective
};

inline const char *relation_kind_to_string(RelationKind kind) {
    switch (kind) {
    case RelationKind::Imports:
        return "IMPORTS";
    case RelationKind::Declares:
        return "DECLARES";
    case RelationKind::Provides:
        return "PROVIDES";
    case RelationKind::ImportsModule:
        return "IMPORTS_MODULE";
    case RelationKind::ExportsModule:
        return "EXPORTS_MODULE";
    case RelationKind::Bootstraps:
        return "BOOTSTRAPS";
    case RelationKind::Injects:
        return "INJECTS";
    case RelationKind::DefinedIn:
        return "DEFINED_IN";
    case RelationKind::Implements:
        return "IMPLEMENTS";
    case RelationKind::UsesPipe:
        return "USES_PIPE";
    default:
        return "USES_DIRECTIVE";
    }
}

inline std::optional<RelationKind> relation_kind_from_string(const std::string &name) {
    static const RelationKind all[] = {
        RelationKind::Imports,       RelationKind::Declares,   RelationKind::Provides,
        RelationKind::ImportsModule, RelationKind::ExportsModule, RelationKind::Bootstraps,
        RelationKind::Injects,       RelationKind::DefinedIn,  RelationKind::Implements,
        RelationKind::UsesPipe,      RelationKind::UsesDirective};
    for (RelationKind kind : all) {
        if (name == relation_kind_to_string(kind))
            return kind;
    }
    return std::nullopt;
}

// ============================================================================
// Relationship targets
// ============================================================================

enum class TargetState {
    Resolved,    // key holds a concrete identity
    Placeholder, // hint + name, waiting for the resolver
    External,    // name holds the original import specifier
    Unresolved,  // no candidate found
    Ambiguous    // two or more candidates found
};

struct Target {
    TargetState state = TargetState::Unresolved;
    std::string key;                // Resolved only
    std::optional<EntityKind> hint; // Placeholder only, nullopt matches any kind
    std::string name;               // Bare name (or import specifier for External)

    static Target resolved(std::string key) {
        Target t;
        t.state = TargetState::Resolved;
        t.key = std::move(key);
        return t;
    }

    static Target placeholder(std::optional<EntityKind> hint, std::string name) {
        Target t;
        t.state = TargetState::Placeholder;
        t.hint = hint;
        t.name = std::move(name);
        return t;
    }

    static Target external(std::string specifier) {
        Target t;
        t.state = TargetState::External;
        t.name = std::move(specifier);
        return t;
    }

    static Target unresolved(std::string name) {
        Target t;
        t.state = TargetState::Unresolved;
        t.name = std::move(name);
        return t;
    }

    static Target ambiguous(std::string name) {
        Target t;
        t.state = TargetState::Ambiguous;
        t.name = std::move(name);
        return t;
    }

    bool is_resolved() const { return state == TargetState::Resolved; }
    bool is_placeholder() const { return state == TargetState::Placeholder; }

    // Encoded form: identity key, "<Hint>:<name>:UNKNOWN_PATH", "External:<spec>",
    // "Unresolved:<name>" or "Ambiguous:<name>"
    std::string to_string() const;

    // Parse the encoded form (throws std::invalid_argument on malformed input)
    static Target parse(const std::string &encoded);

    bool operator==(const Target &other) const {
        return state == other.state && key == other.key && hint == other.hint &&
               name == other.name;
    }
    bool operator!=(const Target &other) const { return !(*this == other); }
};

// ============================================================================
// Entities and relationships
// ============================================================================

struct Relationship {
    RelationKind kind = RelationKind::Imports;
    Target target;
    json properties = json::object();

    bool operator==(const Relationship &other) const {
        return kind == other.kind && target == other.target && properties == other.properties;
    }
};

struct Entity {
    EntityKind kind = EntityKind::Unknown;
    std::string name;      // Class/interface name, or basename for files
    std::string file_path; // Path relative to the global root, '/' separated
    json properties = json::object();
    std::vector<Relationship> relationships;

    // Identity key: "File:<path>" or "<Label>:<name>:<path>"
    std::string key() const { return make_key(kind, name, file_path); }

    static std::string make_key(EntityKind kind, const std::string &name,
                                const std::string &file_path) {
        if (kind == EntityKind::File)
            return std::string("File:") + file_path;
        return std::string(entity_kind_to_string(kind)) + ":" + name + ":" + file_path;
    }
};

} // namespace surveyor

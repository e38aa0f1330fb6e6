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

#include "surveyor/analyzer.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

namespace surveyor {

namespace {

// Stereotype decorators
constexpr const char *COMPONENT = "Component";
constexpr const char *INJECTABLE = "Injectable";
constexpr const char *NG_MODULE = "NgModule";
constexpr const char *PIPE = "Pipe";
constexpr const char *DIRECTIVE = "Directive";

const char *const SOURCE_SUFFIXES[] = {".ts", ".tsx"};
const char *const INDEX_FILES[] = {"index.ts", "index.tsx"};

bool ends_with(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_relative_specifier(const std::string &spec) {
    return !spec.empty() && spec[0] == '.';
}

// Store<AppState> -> Store
std::string strip_type_arguments(const std::string &type) {
    std::string base = type.substr(0, type.find('<'));
    size_t start = base.find_first_not_of(" \t\r\n");
    size_t end = base.find_last_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    return base.substr(start, end - start + 1);
}

void copy_metadata(const json &metadata, json &properties,
                   std::initializer_list<std::pair<const char *, const char *>> keys) {
    for (const auto &[from, to] : keys) {
        auto it = metadata.find(from);
        if (it != metadata.end())
            properties[to] = *it;
    }
}

// One placeholder relationship per name listed under key
void add_placeholders(Entity &entity, const json &metadata, const char *key, RelationKind kind,
                      std::optional<EntityKind> hint) {
    auto it = metadata.find(key);
    if (it == metadata.end() || !it->is_array())
        return;
    for (const auto &item : *it) {
        if (!item.is_string())
            continue;
        entity.relationships.push_back(
            {kind, Target::placeholder(hint, item.get<std::string>()), json::object()});
    }
}

std::optional<fs::path> try_source_candidates(const fs::path &base) {
    std::error_code ec;
    for (const char *suffix : SOURCE_SUFFIXES) {
        fs::path candidate = base;
        candidate += suffix;
        if (fs::is_regular_file(candidate, ec))
            return candidate.lexically_normal();
    }
    // ESM imports name the emitted file: './foo.js' is foo.ts
    std::string ext = base.extension().string();
    if (ext == ".js" || ext == ".jsx") {
        for (const char *suffix : SOURCE_SUFFIXES) {
            fs::path candidate = base;
            candidate.replace_extension(suffix);
            if (fs::is_regular_file(candidate, ec))
                return candidate.lexically_normal();
        }
    }
    for (const char *index : INDEX_FILES) {
        fs::path candidate = base / index;
        if (fs::is_regular_file(candidate, ec))
            return candidate.lexically_normal();
    }
    if (fs::is_regular_file(base, ec) &&
        language_from_filename(base.filename().string()) != Language::Unknown)
        return base.lexically_normal();
    return std::nullopt;
}

} // namespace

SourceAnalyzer::SourceAnalyzer(const AnalyzerConfig &config)
    : config_(config), discoverer_(config.discovery) {
    root_ = fs::absolute(config_.root_path).lexically_normal();
    if (!root_.has_filename() && root_.has_relative_path())
        root_ = root_.parent_path(); // drop trailing separator

    // Auto-detect thread count if not specified
    if (config_.num_threads == 0) {
        config_.num_threads = std::thread::hardware_concurrency();
        if (config_.num_threads == 0)
            config_.num_threads = 4; // Fallback
    }
}

std::optional<std::string> SourceAnalyzer::relative_to_root(const fs::path &path) const {
    fs::path rel = fs::absolute(path).lexically_normal().lexically_relative(root_);
    if (rel.empty() || *rel.begin() == "..")
        return std::nullopt;
    return rel.generic_string();
}

void SourceAnalyzer::warn(ProjectResult &result, const std::string &message) const {
    result.warnings.push_back(message);
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cerr << "Warning: " << message << std::endl;
}

std::optional<fs::path> SourceAnalyzer::resolve_import(const std::string &specifier,
                                                       const fs::path &importing_file,
                                                       const ProjectManifest &manifest) const {
    if (is_relative_specifier(specifier)) {
        return try_source_candidates(importing_file.parent_path() / specifier);
    }

    for (const auto &alias : manifest.aliases) {
        std::string rest;
        if (alias.wildcard) {
            if (specifier.compare(0, alias.prefix.size(), alias.prefix) != 0)
                continue;
            rest = specifier.substr(alias.prefix.size());
        } else if (specifier != alias.prefix) {
            continue;
        }
        for (const auto &dir : alias.directories) {
            auto found = try_source_candidates(rest.empty() ? dir : dir / rest);
            if (found)
                return found;
        }
    }

    if (!manifest.base_url.empty()) {
        if (auto found = try_source_candidates(manifest.base_url / specifier))
            return found;
    }

    return try_source_candidates(root_ / specifier);
}

Entity SourceAnalyzer::build_class_entity(const ClassDecl &cls, const std::string &rel_path) const {
    Entity entity;
    entity.kind = EntityKind::Class;
    entity.name = cls.name;
    entity.file_path = rel_path;

    for (const auto &decorator : cls.decorators) {
        const json &meta = decorator.metadata;

        if (decorator.name == COMPONENT) {
            entity.kind = EntityKind::Component;
            copy_metadata(meta, entity.properties,
                          {{"selector", "selector"},
                           {"templateUrl", "templateUrl"},
                           {"styleUrls", "styleUrls"},
                           {"styleUrl", "styleUrl"},
                           {"standalone", "standalone"}});
            add_placeholders(entity, meta, "providers", RelationKind::Provides,
                             EntityKind::Service);

            // Standalone components import pipes, directives and modules directly
            auto imports = meta.find("imports");
            if (imports != meta.end() && imports->is_array()) {
                entity.properties["imports"] = *imports;
                for (const auto &item : *imports) {
                    if (!item.is_string())
                        continue;
                    std::string name = item.get<std::string>();
                    if (ends_with(name, PIPE)) {
                        entity.relationships.push_back(
                            {RelationKind::UsesPipe, Target::placeholder(EntityKind::Pipe, name),
                             json::object()});
                    } else if (ends_with(name, DIRECTIVE)) {
                        entity.relationships.push_back({RelationKind::UsesDirective,
                                                        Target::placeholder(EntityKind::Directive, name),
                                                        json::object()});
                    } else {
                        entity.relationships.push_back({RelationKind::ImportsModule,
                                                        Target::placeholder(std::nullopt, name),
                                                        json::object()});
                    }
                }
            }
        } else if (decorator.name == INJECTABLE) {
            entity.kind = EntityKind::Service;
            copy_metadata(meta, entity.properties, {{"providedIn", "providedIn"}});
        } else if (decorator.name == NG_MODULE) {
            entity.kind = EntityKind::Module;
            copy_metadata(meta, entity.properties,
                          {{"declarations", "declarations"},
                           {"imports", "imports"},
                           {"providers", "providers"},
                           {"exports", "exports"},
                           {"bootstrap", "bootstrap"}});
            // Module metadata lists bare names, never paths
            add_placeholders(entity, meta, "declarations", RelationKind::Declares, std::nullopt);
            add_placeholders(entity, meta, "imports", RelationKind::ImportsModule,
                             EntityKind::Module);
            add_placeholders(entity, meta, "providers", RelationKind::Provides,
                             EntityKind::Service);
            add_placeholders(entity, meta, "exports", RelationKind::ExportsModule, std::nullopt);
            add_placeholders(entity, meta, "bootstrap", RelationKind::Bootstraps,
                             EntityKind::Component);
        } else if (decorator.name == PIPE) {
            entity.kind = EntityKind::Pipe;
            copy_metadata(meta, entity.properties,
                          {{"name", "pipeName"}, {"pure", "pure"}, {"standalone", "standalone"}});
        } else if (decorator.name == DIRECTIVE) {
            entity.kind = EntityKind::Directive;
            copy_metadata(meta, entity.properties,
                          {{"selector", "selector"}, {"standalone", "standalone"}});
            add_placeholders(entity, meta, "providers", RelationKind::Provides,
                             EntityKind::Service);
        }
    }

    // Constructor injection
    if (!cls.constructor_params.empty()) {
        json bindings = json::array();
        for (const auto &param : cls.constructor_params) {
            std::string type_name = strip_type_arguments(param.type);
            bindings.push_back(param.name + ":" + param.type);
            if (type_name.empty())
                continue;
            entity.relationships.push_back({RelationKind::Injects,
                                            Target::placeholder(EntityKind::Service, type_name),
                                            {{"parameterName", param.name}}});
        }
        entity.properties["constructorParameters"] = std::move(bindings);
    }

    for (const auto &iface : cls.implements) {
        entity.relationships.push_back(
            {RelationKind::Implements, Target::placeholder(EntityKind::Interface, iface),
             json::object()});
    }

    if (!cls.members.empty())
        entity.properties["members"] = cls.members;
    if (!cls.extends.empty())
        entity.properties["extends"] = cls.extends;
    if (cls.is_abstract)
        entity.properties["abstract"] = true;

    return entity;
}

bool SourceAnalyzer::analyze_file(const fs::path &filepath, const ProjectManifest &manifest,
                                  const std::string &manifest_rel, LanguageParser &parser,
                                  EntityRegistry &local, ProjectResult &result) const {
    auto rel_path = relative_to_root(filepath);
    if (!rel_path)
        return true; // Outside the global root: not ours to emit

    // Read file
    std::ifstream file(filepath);
    if (!file.is_open()) {
        warn(result, "Cannot read " + filepath.string());
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    if (!parser.parse(buffer.str())) {
        warn(result, "Cannot parse " + filepath.string());
        return false;
    }
    if (parser.has_errors()) {
        warn(result, "Syntax errors in " + *rel_path + "; results may be partial");
    }

    Entity file_entity;
    file_entity.kind = EntityKind::File;
    file_entity.name = filepath.filename().string();
    file_entity.file_path = *rel_path;
    file_entity.properties["project"] = json::array({manifest_rel});

    for (const auto &decl : parser.extract_imports()) {
        json props = {{"from", decl.specifier}};
        if (decl.reexport)
            props["reexport"] = true;

        auto resolved = resolve_import(decl.specifier, filepath, manifest);
        std::optional<std::string> target_rel;
        if (resolved)
            target_rel = relative_to_root(*resolved);

        if (target_rel) {
            file_entity.relationships.push_back(
                {RelationKind::Imports,
                 Target::resolved(Entity::make_key(EntityKind::File, "", *target_rel)),
                 std::move(props)});
        } else if (!is_relative_specifier(decl.specifier)) {
            file_entity.relationships.push_back(
                {RelationKind::Imports, Target::external(decl.specifier), std::move(props)});
        } else {
            result.imports_dropped++;
            warn(result, "Unresolvable import '" + decl.specifier + "' in " + *rel_path + ":" +
                             std::to_string(decl.line));
        }
    }
    local.upsert(std::move(file_entity));

    for (const auto &cls : parser.extract_classes()) {
        local.upsert(build_class_entity(cls, *rel_path));
    }

    // Interfaces carry their full identity already
    for (const auto &iface : parser.extract_interfaces()) {
        Entity entity;
        entity.kind = EntityKind::Interface;
        entity.name = iface.name;
        entity.file_path = *rel_path;
        local.upsert(std::move(entity));
    }

    if (config_.verbose) {
        std::lock_guard<std::mutex> lock(output_mutex_);
        std::cout << "Parsed: " << *rel_path << std::endl;
    }
    return true;
}

ProjectResult SourceAnalyzer::analyze_project(const ProjectManifest &manifest) const {
    ProjectResult result;
    result.manifest = relative_to_root(manifest.path).value_or(manifest.path.generic_string());

    std::vector<std::string> discovery_warnings;
    std::vector<fs::path> files = discoverer_.member_files(manifest, &discovery_warnings);
    for (const auto &w : discovery_warnings)
        warn(result, w);

    {
        std::lock_guard<std::mutex> lock(output_mutex_);
        std::cout << "--- Parsing project from: " << result.manifest << " (" << files.size()
                  << " files) ---" << std::endl;
    }

    // One parser per grammar, reused across the project's files
    std::unique_ptr<LanguageParser> ts_parser;
    std::unique_ptr<LanguageParser> tsx_parser;
    EntityRegistry local;

    for (const auto &filepath : files) {
        Language lang = language_from_filename(filepath.filename().string());
        std::unique_ptr<LanguageParser> &parser =
            lang == Language::Tsx ? tsx_parser : ts_parser;
        if (!parser)
            parser = create_parser(lang);

        if (analyze_file(filepath, manifest, result.manifest, *parser, local, result)) {
            result.files_parsed++;
        } else {
            result.files_failed++;
        }
    }

    stats_.projects_analyzed++;
    stats_.files_parsed += result.files_parsed;
    stats_.files_failed += result.files_failed;
    stats_.imports_dropped += result.imports_dropped;
    stats_.entities_found += local.size();
    stats_.relationships_found += local.relationship_count();

    result.entities = local.release();
    return result;
}

void SourceAnalyzer::analyze(const std::vector<ProjectManifest> &manifests,
                             EntityRegistry &registry) {
    if (manifests.empty()) {
        std::cout << "No projects to analyze." << std::endl;
        return;
    }

    std::cout << "Found " << manifests.size() << " projects to analyze." << std::endl;
    std::cout << "Using " << std::min<size_t>(config_.num_threads, manifests.size())
              << " threads." << std::endl;

    // One slot per project; workers never share a slot
    std::vector<std::optional<ProjectResult>> results(manifests.size());

    auto worker = [&](size_t start_idx, size_t end_idx) {
        for (size_t i = start_idx; i < end_idx; ++i) {
            try {
                results[i] = analyze_project(manifests[i]);
            } catch (const std::exception &e) {
                stats_.projects_failed++;
                std::lock_guard<std::mutex> lock(output_mutex_);
                std::cerr << "Error: failed to analyze project " << manifests[i].path.string()
                          << ". Skipping.\n  Details: " << e.what() << std::endl;
            }
        }
    };

    // Create worker threads
    std::vector<std::thread> threads;
    size_t per_thread = (manifests.size() + config_.num_threads - 1) / config_.num_threads;

    for (unsigned int t = 0; t < config_.num_threads; ++t) {
        size_t start_idx = t * per_thread;
        size_t end_idx = std::min(start_idx + per_thread, manifests.size());

        if (start_idx >= manifests.size())
            break;

        threads.emplace_back(worker, start_idx, end_idx);
    }

    // Wait for all threads
    for (auto &t : threads) {
        t.join();
    }

    // Single writer: merge partial results one project at a time
    for (auto &result : results) {
        if (result)
            registry.merge(std::move(result->entities));
    }

    std::cout << "\nAnalysis complete." << std::endl;
    std::cout << "  Projects analyzed: " << stats_.projects_analyzed.load() << std::endl;
    std::cout << "  Projects failed: " << stats_.projects_failed.load() << std::endl;
    std::cout << "  Files parsed: " << stats_.files_parsed.load() << std::endl;
    std::cout << "  Files failed: " << stats_.files_failed.load() << std::endl;
    std::cout << "  Imports dropped: " << stats_.imports_dropped.load() << std::endl;
    std::cout << "  Entities registered: " << registry.size() << std::endl;
}

} // namespace surveyor

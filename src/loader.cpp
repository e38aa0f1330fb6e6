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

#include "surveyor/loader.hpp"
#include <algorithm>
#include <iostream>

namespace surveyor {

namespace {

constexpr const char *REPOSITORY_LABEL = "Repository";
constexpr const char *DEFAULT_REPOSITORY_NAME = "repository";

} // namespace

const char *skip_reason_to_string(SkipReason reason) {
    switch (reason) {
    case SkipReason::Unresolved:
        return "unresolved";
    case SkipReason::Ambiguous:
        return "ambiguous";
    case SkipReason::External:
        return "external";
    case SkipReason::UnresolvedPlaceholder:
        return "unresolved-placeholder";
    default:
        return "missing-endpoint";
    }
}

size_t LoadReport::skipped_count(SkipReason reason) const {
    return static_cast<size_t>(std::count_if(skipped.begin(), skipped.end(),
                                             [&](const SkippedEdge &e) { return e.reason == reason; }));
}

GraphLoader::GraphLoader(GraphStore &store, const LoaderConfig &config)
    : store_(store), config_(config) {
    if (config_.repository_name.empty())
        config_.repository_name = DEFAULT_REPOSITORY_NAME;
}

std::string GraphLoader::repository_key() const {
    return std::string(REPOSITORY_LABEL) + ":" + config_.repository_name;
}

LoadReport GraphLoader::load(const std::vector<Entity> &entities) {
    LoadReport report;
    node_ids_.clear();
    written_edges_.clear();

    // Phase 1 must be committed for the whole corpus before any dependency edge
    {
        GraphStore::Transaction txn(store_);
        load_hierarchy(entities, report);
        txn.commit();
    }
    {
        GraphStore::Transaction txn(store_);
        load_dependencies(entities, report);
        txn.commit();
    }

    std::cout << "Load complete." << std::endl;
    std::cout << "  Nodes created: " << report.nodes_created << std::endl;
    std::cout << "  Nodes updated: " << report.nodes_updated << std::endl;
    std::cout << "  Ownership edges: " << report.ownership_edges << std::endl;
    std::cout << "  Dependency edges created: " << report.edges_created << std::endl;
    std::cout << "  Dependency edges already present: " << report.edges_existing << std::endl;
    std::cout << "  Dependency edges merged: " << report.edges_merged << std::endl;
    std::cout << "  Edges skipped: " << report.edges_skipped() << " (unresolved "
              << report.skipped_count(SkipReason::Unresolved) << ", ambiguous "
              << report.skipped_count(SkipReason::Ambiguous) << ", external "
              << report.skipped_count(SkipReason::External) << ", missing "
              << report.skipped_count(SkipReason::MissingEndpoint) +
                     report.skipped_count(SkipReason::UnresolvedPlaceholder)
              << ")" << std::endl;
    return report;
}

void GraphLoader::load_hierarchy(const std::vector<Entity> &entities, LoadReport &report) {
    auto [repo_id, repo_created] =
        store_.upsert_node(repository_key(), REPOSITORY_LABEL, config_.repository_name, "");
    node_ids_[repository_key()] = repo_id;
    (repo_created ? report.nodes_created : report.nodes_updated)++;

    for (const auto &entity : entities) {
        std::string key = entity.key();
        auto [id, created] = store_.upsert_node(key, entity_kind_to_string(entity.kind),
                                                entity.name, entity.file_path, entity.properties);
        node_ids_[key] = id;
        (created ? report.nodes_created : report.nodes_updated)++;
    }

    // Ownership: File -> Repository, declaration -> File
    for (const auto &entity : entities) {
        std::string key = entity.key();
        NodeId id = node_ids_.at(key);

        if (entity.kind == EntityKind::File) {
            store_.upsert_edge(id, repo_id, relation_kind_to_string(RelationKind::DefinedIn));
            report.ownership_edges++;
            continue;
        }

        std::string file_key = Entity::make_key(EntityKind::File, "", entity.file_path);
        auto file_id = lookup(file_key);
        if (!file_id) {
            report.ownership_missing++;
            std::cerr << "Warning: No file node " << file_key << " for " << key << std::endl;
            continue;
        }
        store_.upsert_edge(id, *file_id, relation_kind_to_string(RelationKind::DefinedIn));
        report.ownership_edges++;
    }
}

void GraphLoader::load_dependencies(const std::vector<Entity> &entities, LoadReport &report) {
    for (const auto &entity : entities) {
        std::string source_key = entity.key();
        NodeId source_id = node_ids_.at(source_key);

        for (const auto &rel : entity.relationships) {
            std::optional<NodeId> target_id;
            switch (rel.target.state) {
            case TargetState::Unresolved:
                skip(report, source_key, rel, SkipReason::Unresolved);
                continue;
            case TargetState::Ambiguous:
                skip(report, source_key, rel, SkipReason::Ambiguous);
                continue;
            case TargetState::External:
                skip(report, source_key, rel, SkipReason::External);
                continue;
            case TargetState::Placeholder:
                skip(report, source_key, rel, SkipReason::UnresolvedPlaceholder);
                continue;
            case TargetState::Resolved:
                target_id = lookup(rel.target.key);
                break;
            }

            if (!target_id) {
                skip(report, source_key, rel, SkipReason::MissingEndpoint);
                continue;
            }

            std::string type = relation_kind_to_string(rel.kind);
            bool repeated = !written_edges_.emplace(source_id, *target_id, type).second;
            if (store_.upsert_edge(source_id, *target_id, type, rel.properties)) {
                report.edges_created++;
            } else if (repeated) {
                report.edges_merged++;
            } else {
                report.edges_existing++;
            }
        }
    }
}

std::optional<NodeId> GraphLoader::lookup(const std::string &key) const {
    auto it = node_ids_.find(key);
    if (it != node_ids_.end())
        return it->second;
    // Nodes written by an earlier load
    return store_.find_node(key);
}

void GraphLoader::skip(LoadReport &report, const std::string &source, const Relationship &rel,
                       SkipReason reason) const {
    SkippedEdge edge{source, relation_kind_to_string(rel.kind), rel.target.to_string(), reason};

    if (reason != SkipReason::External || config_.verbose) {
        std::cerr << "Warning: Skipping " << edge.type << " edge from " << edge.source << " to "
                  << edge.target << " (" << skip_reason_to_string(reason) << ")" << std::endl;
    }
    report.skipped.push_back(std::move(edge));
}

} // namespace surveyor

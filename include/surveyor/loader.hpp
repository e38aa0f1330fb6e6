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

#include "graph_store.hpp"
#include "types.hpp"
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace surveyor {

// Loader configuration
struct LoaderConfig {
    std::string repository_name; // Root node name; "repository" if empty
    bool verbose = false;
};

// Why a dependency edge was not written
enum class SkipReason {
    Unresolved,            // Target resolved to Unresolved:<name>
    Ambiguous,             // Target resolved to Ambiguous:<name>
    External,              // Import of an external package
    UnresolvedPlaceholder, // Target never went through the resolver
    MissingEndpoint        // Identity key not present in the store
};

const char *skip_reason_to_string(SkipReason reason);

struct SkippedEdge {
    std::string source; // Source identity key
    std::string type;   // Relationship type
    std::string target; // Encoded target
    SkipReason reason;
};

struct LoadReport {
    size_t nodes_created = 0;
    size_t nodes_updated = 0;
    size_t ownership_edges = 0;
    size_t ownership_missing = 0; // Declarations whose file node is absent
    size_t edges_created = 0;
    size_t edges_existing = 0; // Already in the store before this load
    size_t edges_merged = 0;   // Repeated within this load, merged into one edge
    std::vector<SkippedEdge> skipped;

    size_t edges_skipped() const { return skipped.size(); }
    size_t skipped_count(SkipReason reason) const;
};

// Writes resolved entities into a graph store in two phases.
//
// Phase 1 creates or updates every node, the repository root and the
// DEFINED_IN ownership edges. Phase 2 starts only after phase 1 has committed
// and writes the dependency edges, skipping (never fabricating) any edge
// whose endpoint is not a node.
class GraphLoader {
public:

    GraphLoader(GraphStore &store, const LoaderConfig &config = LoaderConfig{});

    LoadReport load(const std::vector<Entity> &entities);

    // Identity key of the repository root node
    std::string repository_key() const;

private:

    GraphStore &store_;
    LoaderConfig config_;

    // Identity key -> node id for everything written in phase 1
    std::unordered_map<std::string, NodeId> node_ids_;

    // (source, target, type) of every dependency edge written by this load
    std::set<std::tuple<NodeId, NodeId, std::string>> written_edges_;

    void load_hierarchy(const std::vector<Entity> &entities, LoadReport &report);
    void load_dependencies(const std::vector<Entity> &entities, LoadReport &report);

    std::optional<NodeId> lookup(const std::string &key) const;
    void skip(LoadReport &report, const std::string &source, const Relationship &rel,
              SkipReason reason) const;
};

} // namespace surveyor

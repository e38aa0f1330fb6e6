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
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

struct sqlite3;

namespace surveyor {

// Fatal store failure: cannot open, cannot prepare the schema, or a write failed
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using NodeId = std::int64_t;

struct NodeRecord {
    NodeId id = 0;
    std::string key;
    std::string label;
    std::string name;
    std::string path;
    json properties = json::object();
};

// Persistent property graph backed by SQLite.
//
// At most one node per identity key and one edge per (source, target, type);
// every write is create-or-update, so reloading the same input is a no-op.
class GraphStore {
public:

    // Open (or create) the store. ":memory:" gives a private in-memory store.
    explicit GraphStore(const std::string &path);
    ~GraphStore();

    // Non-copyable, non-movable
    GraphStore(const GraphStore &) = delete;
    GraphStore &operator=(const GraphStore &) = delete;

    // Create the node or merge into it (non-null new property values win).
    // Returns the node id and whether it was created.
    std::pair<NodeId, bool> upsert_node(const std::string &key, const std::string &label,
                                        const std::string &name, const std::string &path,
                                        const json &properties = json::object());

    std::optional<NodeId> find_node(const std::string &key) const;
    std::optional<NodeRecord> get_node(const std::string &key) const;

    // Create the typed edge; returns false if it already existed. The new
    // properties are then merged in, and a key given two different values
    // (two parameters injecting the same type) keeps both as a list.
    bool upsert_edge(NodeId source, NodeId target, const std::string &type,
                     const json &properties = json::object());

    std::optional<json> edge_properties(const std::string &source_key,
                                        const std::string &target_key,
                                        const std::string &type) const;

    bool has_edge(const std::string &source_key, const std::string &target_key,
                  const std::string &type) const;

    // Keys of the nodes reached from source_key over edges of the given type
    std::vector<std::string> edge_targets(const std::string &source_key,
                                          const std::string &type) const;

    size_t node_count() const;
    size_t edge_count() const;

    // (label, count) and (type, count), sorted by name
    std::vector<std::pair<std::string, size_t>> node_counts_by_label() const;
    std::vector<std::pair<std::string, size_t>> edge_counts_by_type() const;

    // Remove every node and edge
    void clear();

    const std::string &path() const { return path_; }

    // RAII transaction: rolls back unless commit() was called
    class Transaction {
    public:
        explicit Transaction(GraphStore &store);
        ~Transaction();

        Transaction(const Transaction &) = delete;
        Transaction &operator=(const Transaction &) = delete;

        void commit();

    private:
        GraphStore &store_;
        bool active_ = true;
    };

private:

    sqlite3 *db_ = nullptr;
    std::string path_;

    void exec(const char *sql);
    void init_schema();
    size_t count(const char *sql) const;
    std::vector<std::pair<std::string, size_t>> grouped_counts(const char *sql) const;
};

} // namespace surveyor

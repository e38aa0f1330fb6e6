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

#include "surveyor/graph_store.hpp"
#include <algorithm>
#include <iostream>
#include <sqlite3.h>

namespace surveyor {

namespace {

constexpr int BUSY_TIMEOUT_MS = 5000;

const char *SCHEMA_SQL = R"(
CREATE TABLE IF NOT EXISTS nodes (
    id         INTEGER PRIMARY KEY,
    key        TEXT NOT NULL UNIQUE,
    label      TEXT NOT NULL,
    name       TEXT NOT NULL,
    path       TEXT NOT NULL,
    properties TEXT NOT NULL DEFAULT '{}'
);
CREATE TABLE IF NOT EXISTS edges (
    id         INTEGER PRIMARY KEY,
    source     INTEGER NOT NULL REFERENCES nodes(id) ON DELETE CASCADE,
    target     INTEGER NOT NULL REFERENCES nodes(id) ON DELETE CASCADE,
    type       TEXT NOT NULL,
    properties TEXT NOT NULL DEFAULT '{}',
    UNIQUE (source, target, type)
);
CREATE INDEX IF NOT EXISTS idx_nodes_label ON nodes(label);
CREATE INDEX IF NOT EXISTS idx_edges_type ON edges(type);
CREATE INDEX IF NOT EXISTS idx_edges_target ON edges(target);
)";

// Prepared statement, finalized on scope exit
class Statement {
public:
    Statement(sqlite3 *db, const char *sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement() {
        if (stmt_)
            sqlite3_finalize(stmt_);
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    void bind(int index, const std::string &value) {
        check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                                SQLITE_TRANSIENT));
    }

    void bind(int index, NodeId value) { check(sqlite3_bind_int64(stmt_, index, value)); }

    // true while rows remain
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW)
            return true;
        if (rc == SQLITE_DONE)
            return false;
        throw StoreError(std::string("Statement failed: ") + sqlite3_errmsg(db_));
    }

    NodeId get_int64(int column) const { return sqlite3_column_int64(stmt_, column); }

    std::string get_string(int column) const {
        const unsigned char *text = sqlite3_column_text(stmt_, column);
        return text ? reinterpret_cast<const char *>(text) : "";
    }

private:
    sqlite3 *db_;
    sqlite3_stmt *stmt_ = nullptr;

    void check(int rc) {
        if (rc != SQLITE_OK)
            throw StoreError(std::string("Failed to bind parameter: ") + sqlite3_errmsg(db_));
    }
};

json parse_properties(const std::string &text) {
    json j = json::parse(text, nullptr, false);
    return j.is_object() ? j : json::object();
}

// Stored text form; invalid UTF-8 read from source files becomes U+FFFD
std::string dump_properties(const json &properties) {
    if (!properties.is_object())
        return "{}";
    return properties.dump(-1, ' ', false, json::error_handler_t::replace);
}

// Fold new edge properties into the stored ones. A key seen with two
// different values keeps all of them as a list. Returns true on change.
bool merge_edge_properties(json &into, const json &from) {
    bool changed = false;
    for (auto it = from.begin(); it != from.end(); ++it) {
        if (it.value().is_null())
            continue;
        auto existing = into.find(it.key());
        if (existing == into.end()) {
            into[it.key()] = it.value();
            changed = true;
            continue;
        }
        if (*existing == it.value())
            continue;
        if (!existing->is_array()) {
            json first = *existing;
            *existing = json::array();
            existing->push_back(std::move(first));
            changed = true;
        }

        auto add = [&](const json &value) {
            if (std::find(existing->begin(), existing->end(), value) == existing->end()) {
                existing->push_back(value);
                changed = true;
            }
        };
        if (it.value().is_array()) {
            for (const auto &value : it.value())
                add(value);
        } else {
            add(it.value());
        }
    }
    return changed;
}

} // namespace

GraphStore::GraphStore(const std::string &path) : path_(path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("Failed to open graph store " + path + ": " + message);
    }

    sqlite3_busy_timeout(db_, BUSY_TIMEOUT_MS);

    try {
        exec("PRAGMA foreign_keys = ON");
        init_schema();
    } catch (const StoreError &) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

GraphStore::~GraphStore() {
    if (db_)
        sqlite3_close(db_);
}

void GraphStore::exec(const char *sql) {
    char *err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw StoreError("SQL error: " + message);
    }
}

void GraphStore::init_schema() {
    exec(SCHEMA_SQL);
}

std::pair<NodeId, bool> GraphStore::upsert_node(const std::string &key, const std::string &label,
                                                const std::string &name, const std::string &path,
                                                const json &properties) {
    Statement select(db_, "SELECT id, properties FROM nodes WHERE key = ?");
    select.bind(1, key);

    if (select.step()) {
        NodeId id = select.get_int64(0);
        json merged = parse_properties(select.get_string(1));
        if (properties.is_object()) {
            for (auto it = properties.begin(); it != properties.end(); ++it) {
                if (!it.value().is_null())
                    merged[it.key()] = it.value();
            }
        }

        Statement update(db_,
                         "UPDATE nodes SET label = ?, name = ?, path = ?, properties = ? "
                         "WHERE id = ?");
        update.bind(1, label);
        update.bind(2, name);
        update.bind(3, path);
        update.bind(4, dump_properties(merged));
        update.bind(5, id);
        update.step();
        return {id, false};
    }

    Statement insert(db_,
                     "INSERT INTO nodes (key, label, name, path, properties) "
                     "VALUES (?, ?, ?, ?, ?)");
    insert.bind(1, key);
    insert.bind(2, label);
    insert.bind(3, name);
    insert.bind(4, path);
    insert.bind(5, dump_properties(properties));
    insert.step();
    return {sqlite3_last_insert_rowid(db_), true};
}

std::optional<NodeId> GraphStore::find_node(const std::string &key) const {
    Statement stmt(db_, "SELECT id FROM nodes WHERE key = ?");
    stmt.bind(1, key);
    if (!stmt.step())
        return std::nullopt;
    return stmt.get_int64(0);
}

std::optional<NodeRecord> GraphStore::get_node(const std::string &key) const {
    Statement stmt(db_, "SELECT id, key, label, name, path, properties FROM nodes WHERE key = ?");
    stmt.bind(1, key);
    if (!stmt.step())
        return std::nullopt;

    NodeRecord record;
    record.id = stmt.get_int64(0);
    record.key = stmt.get_string(1);
    record.label = stmt.get_string(2);
    record.name = stmt.get_string(3);
    record.path = stmt.get_string(4);
    record.properties = parse_properties(stmt.get_string(5));
    return record;
}

bool GraphStore::upsert_edge(NodeId source, NodeId target, const std::string &type,
                             const json &properties) {
    std::string props = dump_properties(properties);

    Statement insert(db_,
                     "INSERT OR IGNORE INTO edges (source, target, type, properties) "
                     "VALUES (?, ?, ?, ?)");
    insert.bind(1, source);
    insert.bind(2, target);
    insert.bind(3, type);
    insert.bind(4, props);
    insert.step();

    if (sqlite3_changes(db_) > 0)
        return true;

    // Compare in stored form so replaced bytes match on reload
    json incoming = parse_properties(props);
    if (incoming.empty())
        return false;

    Statement select(db_,
                     "SELECT id, properties FROM edges "
                     "WHERE source = ? AND target = ? AND type = ?");
    select.bind(1, source);
    select.bind(2, target);
    select.bind(3, type);
    if (!select.step())
        return false;

    NodeId edge_id = select.get_int64(0);
    json merged = parse_properties(select.get_string(1));
    if (merge_edge_properties(merged, incoming)) {
        Statement update(db_, "UPDATE edges SET properties = ? WHERE id = ?");
        update.bind(1, dump_properties(merged));
        update.bind(2, edge_id);
        update.step();
    }
    return false;
}

std::optional<json> GraphStore::edge_properties(const std::string &source_key,
                                                const std::string &target_key,
                                                const std::string &type) const {
    Statement stmt(db_,
                   "SELECT e.properties FROM edges e "
                   "JOIN nodes s ON s.id = e.source JOIN nodes t ON t.id = e.target "
                   "WHERE s.key = ? AND t.key = ? AND e.type = ?");
    stmt.bind(1, source_key);
    stmt.bind(2, target_key);
    stmt.bind(3, type);
    if (!stmt.step())
        return std::nullopt;
    return parse_properties(stmt.get_string(0));
}

bool GraphStore::has_edge(const std::string &source_key, const std::string &target_key,
                          const std::string &type) const {
    Statement stmt(db_,
                   "SELECT 1 FROM edges e "
                   "JOIN nodes s ON s.id = e.source JOIN nodes t ON t.id = e.target "
                   "WHERE s.key = ? AND t.key = ? AND e.type = ?");
    stmt.bind(1, source_key);
    stmt.bind(2, target_key);
    stmt.bind(3, type);
    return stmt.step();
}

std::vector<std::string> GraphStore::edge_targets(const std::string &source_key,
                                                  const std::string &type) const {
    Statement stmt(db_,
                   "SELECT t.key FROM edges e "
                   "JOIN nodes s ON s.id = e.source JOIN nodes t ON t.id = e.target "
                   "WHERE s.key = ? AND e.type = ? ORDER BY t.key");
    stmt.bind(1, source_key);
    stmt.bind(2, type);

    std::vector<std::string> keys;
    while (stmt.step())
        keys.push_back(stmt.get_string(0));
    return keys;
}

size_t GraphStore::count(const char *sql) const {
    Statement stmt(db_, sql);
    return stmt.step() ? static_cast<size_t>(stmt.get_int64(0)) : 0;
}

std::vector<std::pair<std::string, size_t>> GraphStore::grouped_counts(const char *sql) const {
    Statement stmt(db_, sql);
    std::vector<std::pair<std::string, size_t>> rows;
    while (stmt.step())
        rows.emplace_back(stmt.get_string(0), static_cast<size_t>(stmt.get_int64(1)));
    return rows;
}

size_t GraphStore::node_count() const {
    return count("SELECT COUNT(*) FROM nodes");
}

size_t GraphStore::edge_count() const {
    return count("SELECT COUNT(*) FROM edges");
}

std::vector<std::pair<std::string, size_t>> GraphStore::node_counts_by_label() const {
    return grouped_counts("SELECT label, COUNT(*) FROM nodes GROUP BY label ORDER BY label");
}

std::vector<std::pair<std::string, size_t>> GraphStore::edge_counts_by_type() const {
    return grouped_counts("SELECT type, COUNT(*) FROM edges GROUP BY type ORDER BY type");
}

void GraphStore::clear() {
    exec("DELETE FROM edges; DELETE FROM nodes;");
}

GraphStore::Transaction::Transaction(GraphStore &store) : store_(store) {
    store_.exec("BEGIN");
}

GraphStore::Transaction::~Transaction() {
    if (!active_)
        return;
    char *err = nullptr;
    if (sqlite3_exec(store_.db_, "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
        std::cerr << "Error: rollback failed: " << (err ? err : "unknown error") << std::endl;
    }
    sqlite3_free(err);
}

void GraphStore::Transaction::commit() {
    store_.exec("COMMIT");
    active_ = false;
}

} // namespace surveyor

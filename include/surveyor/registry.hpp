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
#include <string>
#include <unordered_map>
#include <vector>

namespace surveyor {

// Merge a re-encountered entity into an existing one with the same identity.
// Kind: most specific wins (ties take the later kind). Properties: arrays are
// unioned, other non-empty values override. Relationships: appended unless an
// identical one is already present.
void merge_entity(Entity &into, Entity &&from);

// Global entity registry.
//
// Created empty, populated only through upsert()/merge() by a single writer,
// then frozen. After freeze() entities can no longer be added; the resolver
// may still rewrite relationship targets through entities().
class EntityRegistry {
public:

    // Register an entity or merge it into the one with the same identity
    Entity &upsert(Entity entity);

    // Merge a batch of entities (one project's partial result)
    void merge(std::vector<Entity> batch);

    // Stop accepting new entities
    void freeze() { frozen_ = true; }
    bool frozen() const { return frozen_; }

    // Look up by identity key ("File:<path>" or "<Label>:<name>:<path>")
    const Entity *find(const std::string &key) const;
    const Entity *find(EntityKind kind, const std::string &name, const std::string &path) const;

    size_t size() const { return entities_.size(); }
    size_t relationship_count() const;

    // Entities in first-registration order
    const std::vector<Entity> &entities() const { return entities_; }
    std::vector<Entity> &entities() { return entities_; }

    // Move all entities out, leaving the registry empty and unfrozen
    std::vector<Entity> release();

private:

    std::vector<Entity> entities_;

    // (family, name, path) -> index; the family stays stable under kind refinement
    std::unordered_map<std::string, size_t> slots_;
    bool frozen_ = false;

    static std::string slot_key(EntityKind kind, const std::string &name, const std::string &path);
};

} // namespace surveyor

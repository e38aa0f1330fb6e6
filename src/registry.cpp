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

#include "surveyor/registry.hpp"
#include <algorithm>
#include <stdexcept>

namespace surveyor {

namespace {

bool is_empty_value(const json &value) {
    if (value.is_null())
        return true;
    if (value.is_string())
        return value.get_ref<const std::string &>().empty();
    if (value.is_array() || value.is_object())
        return value.empty();
    return false;
}

void merge_properties(json &into, const json &from) {
    if (!into.is_object())
        into = json::object();
    if (!from.is_object())
        return;

    for (auto it = from.begin(); it != from.end(); ++it) {
        auto existing = into.find(it.key());
        if (existing == into.end()) {
            into[it.key()] = it.value();
            continue;
        }
        if (is_empty_value(it.value()))
            continue;
        if (existing->is_array() && it.value().is_array()) {
            for (const auto &item : it.value()) {
                if (std::find(existing->begin(), existing->end(), item) == existing->end())
                    existing->push_back(item);
            }
        } else {
            *existing = it.value();
        }
    }
}

} // namespace

void merge_entity(Entity &into, Entity &&from) {
    if (entity_kind_specificity(from.kind) >= entity_kind_specificity(into.kind))
        into.kind = from.kind;

    merge_properties(into.properties, from.properties);

    for (auto &rel : from.relationships) {
        if (std::find(into.relationships.begin(), into.relationships.end(), rel) ==
            into.relationships.end())
            into.relationships.push_back(std::move(rel));
    }
}

std::string EntityRegistry::slot_key(EntityKind kind, const std::string &name,
                                     const std::string &path) {
    switch (kind) {
    case EntityKind::File:
        return "F|" + path;
    case EntityKind::Interface:
        return "I|" + name + "|" + path;
    default:
        return "C|" + name + "|" + path;
    }
}

Entity &EntityRegistry::upsert(Entity entity) {
    if (frozen_) {
        throw std::logic_error("Entity registry is frozen; cannot register " + entity.key());
    }

    std::string slot = slot_key(entity.kind, entity.name, entity.file_path);
    auto it = slots_.find(slot);
    if (it != slots_.end()) {
        Entity &existing = entities_[it->second];
        merge_entity(existing, std::move(entity));
        return existing;
    }

    slots_.emplace(std::move(slot), entities_.size());
    entities_.push_back(std::move(entity));
    return entities_.back();
}

void EntityRegistry::merge(std::vector<Entity> batch) {
    for (auto &entity : batch) {
        upsert(std::move(entity));
    }
}

const Entity *EntityRegistry::find(EntityKind kind, const std::string &name,
                                   const std::string &path) const {
    auto it = slots_.find(slot_key(kind, name, path));
    if (it == slots_.end())
        return nullptr;
    const Entity &entity = entities_[it->second];
    return entity.kind == kind ? &entity : nullptr;
}

const Entity *EntityRegistry::find(const std::string &key) const {
    size_t first = key.find(':');
    if (first == std::string::npos)
        return nullptr;

    std::string label = key.substr(0, first);
    if (label == "File") {
        // File slots are keyed by path alone
        return find(EntityKind::File, std::string(), key.substr(first + 1));
    }

    auto kind = entity_kind_from_string(label);
    size_t second = key.find(':', first + 1);
    if (!kind || second == std::string::npos)
        return nullptr;
    return find(*kind, key.substr(first + 1, second - first - 1), key.substr(second + 1));
}

size_t EntityRegistry::relationship_count() const {
    size_t count = 0;
    for (const auto &entity : entities_)
        count += entity.relationships.size();
    return count;
}

std::vector<Entity> EntityRegistry::release() {
    std::vector<Entity> out = std::move(entities_);
    entities_.clear();
    slots_.clear();
    frozen_ = false;
    return out;
}

} // namespace surveyor

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

#include "surveyor/resolver.hpp"
#include <iostream>
#include <stdexcept>

namespace surveyor {

std::string SymbolResolver::kind_slot(EntityKind kind, const std::string &name) {
    return std::string(entity_kind_to_string(kind)) + "|" + name;
}

SymbolResolver::SymbolResolver(const EntityRegistry &registry) {
    for (const auto &entity : registry.entities()) {
        if (entity.kind == EntityKind::File)
            continue;
        std::string key = entity.key();
        by_kind_[kind_slot(entity.kind, entity.name)].push_back(key);
        by_name_[entity.name].push_back(std::move(key));
    }
}

const std::vector<std::string> &SymbolResolver::candidates(std::optional<EntityKind> hint,
                                                           const std::string &name) const {
    if (!hint) {
        auto it = by_name_.find(name);
        return it != by_name_.end() ? it->second : none_;
    }
    auto it = by_kind_.find(kind_slot(*hint, name));
    return it != by_kind_.end() ? it->second : none_;
}

Target SymbolResolver::resolve(const Target &target) const {
    if (!target.is_placeholder())
        return target;

    const auto &found = candidates(target.hint, target.name);
    if (found.empty())
        return Target::unresolved(target.name);
    if (found.size() > 1)
        return Target::ambiguous(target.name);
    return Target::resolved(found.front());
}

ResolveStats resolve_registry(EntityRegistry &registry) {
    if (!registry.frozen()) {
        throw std::logic_error("Resolver requires a frozen entity registry");
    }

    SymbolResolver resolver(registry);
    ResolveStats stats;

    for (auto &entity : registry.entities()) {
        std::string source_key;
        for (auto &rel : entity.relationships) {
            if (!rel.target.is_placeholder())
                continue;
            stats.placeholders++;

            Target placeholder = rel.target;
            rel.target = resolver.resolve(placeholder);

            switch (rel.target.state) {
            case TargetState::Resolved:
                stats.resolved++;
                break;
            case TargetState::Ambiguous: {
                stats.ambiguous++;
                if (source_key.empty())
                    source_key = entity.key();
                std::string message = "Ambiguous relationship: " + source_key + " -[" +
                                      relation_kind_to_string(rel.kind) + "]-> " +
                                      placeholder.to_string() + ". Found " +
                                      std::to_string(resolver.candidates(placeholder.hint,
                                                                         placeholder.name)
                                                         .size()) +
                                      " candidates.";
                std::cerr << "Warning: " << message << std::endl;
                stats.warnings.push_back(std::move(message));
                break;
            }
            default:
                stats.unresolved++;
                break;
            }
        }
    }

    return stats;
}

} // namespace surveyor

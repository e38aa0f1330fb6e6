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

#include "registry.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace surveyor {

struct ResolveStats {
    size_t placeholders = 0;
    size_t resolved = 0;
    size_t unresolved = 0;
    size_t ambiguous = 0;
    std::vector<std::string> warnings;
};

// Name index over a frozen registry.
//
// Candidates are looked up by (kind, name), or by name alone for the "any
// kind" hint. File entities are never candidates.
class SymbolResolver {
public:

    explicit SymbolResolver(const EntityRegistry &registry);

    // Identity keys of all entities compatible with the hint and name
    const std::vector<std::string> &candidates(std::optional<EntityKind> hint,
                                               const std::string &name) const;

    // Resolved, Unresolved or Ambiguous for a placeholder; any other target is returned as is
    Target resolve(const Target &target) const;

private:

    std::unordered_map<std::string, std::vector<std::string>> by_kind_;
    std::unordered_map<std::string, std::vector<std::string>> by_name_;
    std::vector<std::string> none_;

    static std::string kind_slot(EntityKind kind, const std::string &name);
};

// Rewrite every placeholder target in the registry exactly once.
// Only targets change; kinds, properties and entity order stay as they are.
// Throws std::logic_error if the registry is not frozen.
ResolveStats resolve_registry(EntityRegistry &registry);

} // namespace surveyor

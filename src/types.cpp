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

#include "surveyor/types.hpp"
#include <stdexcept>

namespace surveyor {

namespace {

constexpr const char *EXTERNAL_PREFIX = "External:";
constexpr const char *UNRESOLVED_PREFIX = "Unresolved:";
constexpr const char *AMBIGUOUS_PREFIX = "Ambiguous:";
constexpr const char *ANY_HINT = "Any";

bool starts_with(const std::string &s, const char *prefix) {
    return s.rfind(prefix, 0) == 0;
}

} // namespace

std::string Target::to_string() const {
    switch (state) {
    case TargetState::Resolved:
        return key;
    case TargetState::Placeholder:
        return std::string(hint ? entity_kind_to_string(*hint) : ANY_HINT) + ":" + name + ":" +
               UNKNOWN_PATH;
    case TargetState::External:
        return EXTERNAL_PREFIX + name;
    case TargetState::Ambiguous:
        return AMBIGUOUS_PREFIX + name;
    default:
        return UNRESOLVED_PREFIX + name;
    }
}

Target Target::parse(const std::string &encoded) {
    if (starts_with(encoded, EXTERNAL_PREFIX))
        return external(encoded.substr(std::char_traits<char>::length(EXTERNAL_PREFIX)));
    if (starts_with(encoded, UNRESOLVED_PREFIX))
        return unresolved(encoded.substr(std::char_traits<char>::length(UNRESOLVED_PREFIX)));
    if (starts_with(encoded, AMBIGUOUS_PREFIX))
        return ambiguous(encoded.substr(std::char_traits<char>::length(AMBIGUOUS_PREFIX)));

    size_t first = encoded.find(':');
    if (first == std::string::npos || first == 0)
        throw std::invalid_argument("Malformed relationship target: " + encoded);

    std::string label = encoded.substr(0, first);
    if (label == "File") {
        if (first + 1 >= encoded.size())
            throw std::invalid_argument("File target without path: " + encoded);
        return resolved(encoded);
    }

    size_t second = encoded.find(':', first + 1);
    if (second == std::string::npos || second == first + 1 || second + 1 >= encoded.size())
        throw std::invalid_argument("Malformed relationship target: " + encoded);

    std::string name = encoded.substr(first + 1, second - first - 1);
    std::string path = encoded.substr(second + 1);

    std::optional<EntityKind> kind;
    if (label != ANY_HINT) {
        kind = entity_kind_from_string(label);
        if (!kind)
            throw std::invalid_argument("Unknown entity label in target: " + encoded);
    }

    if (path == UNKNOWN_PATH)
        return placeholder(kind, name);
    if (!kind)
        throw std::invalid_argument("'Any' hint on a resolved target: " + encoded);
    return resolved(encoded);
}

} // namespace surveyor

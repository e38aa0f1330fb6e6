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
#include <stdexcept>
#include <string>
#include <vector>

namespace surveyor {

// Thrown when an analysis document cannot be read, parsed or is of an
// incompatible schema version
class DocumentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Resolved analysis result, handed from the analyzer to the loader
struct AnalysisDocument {
    std::string version;               // Document schema version
    std::string root;                  // Absolute root the paths are relative to
    std::vector<std::string> projects; // Manifest paths relative to root
    std::vector<Entity> entities;

    // Serialize to JSON
    json to_json() const;

    // Save to file
    void save(const std::string &filepath) const;

    // Load from JSON
    static AnalysisDocument from_json(const json &j);

    // Load from file
    static AnalysisDocument load(const std::string &filepath);
};

} // namespace surveyor

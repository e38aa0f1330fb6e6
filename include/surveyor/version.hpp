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

#include <string>

namespace surveyor {

// ============================================================================
// Surveyor Version Information
// ============================================================================

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

constexpr const char* VERSION_STRING = "1.0.0";

// Analysis document schema version
// Increment when the document format changes
constexpr int DOCUMENT_SCHEMA_MAJOR = 1;
constexpr int DOCUMENT_SCHEMA_MINOR = 0;
constexpr int DOCUMENT_SCHEMA_PATCH = 0;
constexpr const char* DOCUMENT_SCHEMA_VERSION = "1.0.0";

// Oldest document schema this build still reads
constexpr int MIN_COMPAT_SCHEMA_MINOR = 0;

// Check if a document schema version is compatible
inline bool is_schema_compatible(int major, int minor, int /*patch*/) {
    if (major == DOCUMENT_SCHEMA_MAJOR) {
        return minor >= MIN_COMPAT_SCHEMA_MINOR;
    }
    return false;  // Documents from another major version use a different target encoding
}

// Parse version string "X.Y.Z" into components
inline bool parse_version(const std::string& version, int& major, int& minor, int& patch) {
    size_t pos1 = version.find('.');
    if (pos1 == std::string::npos) return false;

    size_t pos2 = version.find('.', pos1 + 1);
    if (pos2 == std::string::npos) return false;

    try {
        major = std::stoi(version.substr(0, pos1));
        minor = std::stoi(version.substr(pos1 + 1, pos2 - pos1 - 1));
        patch = std::stoi(version.substr(pos2 + 1));
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace surveyor

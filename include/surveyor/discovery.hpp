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

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace surveyor {

namespace fs = std::filesystem;

// Thrown when a manifest cannot be read or is not valid JSON
class ManifestError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Discovery configuration
struct DiscoveryConfig {
    // Directory names never entered (build output, VCS, dependency caches)
    std::vector<std::string> ignore_dirs = {"node_modules", ".git",  "dist",      "build",
                                            "out",          "tmp",   "coverage",  ".angular",
                                            ".cache"};

    // File names recognized as project manifests
    std::vector<std::string> manifest_names = {"tsconfig.json", "tsconfig.app.json"};
};

// One entry of the manifest's path-alias table, e.g. "@app/*" -> ["src/app/*"]
struct PathAlias {
    std::string prefix;                  // Alias with the trailing '*' removed
    bool wildcard = false;               // Alias ended in '*' (prefix match)
    std::vector<fs::path> directories;   // Absolute candidate directories
};

// A compilation-unit manifest with its inherited options applied
struct ProjectManifest {
    fs::path path;      // Manifest file (absolute)
    fs::path directory; // Directory holding the manifest

    // Member-file declarations, all absolute and lexically normal
    std::vector<fs::path> files;
    std::vector<std::string> include;
    std::vector<std::string> exclude;
    bool has_exclude = false;

    fs::path base_url; // Empty when the manifest chain sets none
    fs::path out_dir;
    std::vector<PathAlias> aliases;
};

// Load a manifest and follow its relative "extends" chain.
// Throws ManifestError if the manifest itself is unreadable; problems in
// inherited configs are appended to warnings and otherwise ignored.
ProjectManifest load_manifest(const fs::path &path, std::vector<std::string> &warnings);

// Translate a tsconfig-style glob (with '*', '?', '**') into an ECMAScript regex
std::string glob_to_regex(const std::string &pattern);

class ProjectDiscoverer {
public:

    explicit ProjectDiscoverer(const DiscoveryConfig &config = DiscoveryConfig{});

    // Find every manifest under root that declares "files" or "include".
    // Sorted by path; an empty result is not an error.
    std::vector<ProjectManifest> discover(const fs::path &root);

    // Expand a manifest into the sorted list of source files it declares.
    // Safe to call from several threads; problems go to warnings if given.
    std::vector<fs::path> member_files(const ProjectManifest &manifest,
                                       std::vector<std::string> *warnings = nullptr) const;

    // Check if a directory name is denylisted
    bool should_ignore(const fs::path &dir) const;

    // Warnings collected by the last discover() call
    const std::vector<std::string> &warnings() const { return warnings_; }

    const DiscoveryConfig &config() const { return config_; }

private:

    DiscoveryConfig config_;
    std::vector<std::string> warnings_;

    bool is_manifest_name(const std::string &filename) const;

    void warn(const std::string &message);
};

} // namespace surveyor

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

#include "discovery.hpp"
#include "parser.hpp"
#include "registry.hpp"
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace surveyor {

// Analyzer configuration
struct AnalyzerConfig {
    std::string root_path = ".";
    bool verbose = false;

    // Threading config
    unsigned int num_threads = 0; // 0 = auto-detect

    DiscoveryConfig discovery;
};

// Partial result of scanning one project
struct ProjectResult {
    std::string manifest;         // Manifest path relative to the root
    std::vector<Entity> entities; // Already merged within the project
    std::vector<std::string> warnings;
    size_t files_parsed = 0;
    size_t files_failed = 0;
    size_t imports_dropped = 0;
};

class SourceAnalyzer {
public:

    explicit SourceAnalyzer(const AnalyzerConfig &config = AnalyzerConfig{});
    virtual ~SourceAnalyzer() = default;

    // Scan every project in parallel and merge the partial results into the
    // registry one project at a time, in manifest order. A project whose scan
    // throws is reported and skipped.
    void analyze(const std::vector<ProjectManifest> &manifests, EntityRegistry &registry);

    // Scan one project. Shares no mutable state with other calls except stats.
    virtual ProjectResult analyze_project(const ProjectManifest &manifest) const;

    // Resolve an import specifier to an existing source file:
    // relative path, then alias table, then baseUrl, then root-relative
    std::optional<fs::path> resolve_import(const std::string &specifier,
                                           const fs::path &importing_file,
                                           const ProjectManifest &manifest) const;

    // Path relative to the global root ('/' separated), or nullopt if outside it
    std::optional<std::string> relative_to_root(const fs::path &path) const;

    const fs::path &root() const { return root_; }

    // Get statistics
    struct Stats {
        std::atomic<size_t> projects_analyzed{0};
        std::atomic<size_t> projects_failed{0};
        std::atomic<size_t> files_parsed{0};
        std::atomic<size_t> files_failed{0};
        std::atomic<size_t> entities_found{0};
        std::atomic<size_t> relationships_found{0};
        std::atomic<size_t> imports_dropped{0};
    };
    const Stats &stats() const { return stats_; }

private:

    AnalyzerConfig config_;
    fs::path root_;
    ProjectDiscoverer discoverer_;
    mutable Stats stats_;

    // Serializes console output from worker threads
    mutable std::mutex output_mutex_;

    // Parse one file into the project-local registry; false if it could not be read or parsed
    bool analyze_file(const fs::path &filepath, const ProjectManifest &manifest,
                      const std::string &manifest_rel, LanguageParser &parser,
                      EntityRegistry &local, ProjectResult &result) const;

    Entity build_class_entity(const ClassDecl &cls, const std::string &rel_path) const;

    void warn(ProjectResult &result, const std::string &message) const;
};

} // namespace surveyor

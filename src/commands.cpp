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

#include "surveyor/commands.hpp"
#include "surveyor/analyzer.hpp"
#include "surveyor/resolver.hpp"
#include "surveyor/version.hpp"
#include <cstdlib>
#include <iostream>

namespace surveyor {

std::string default_db_path() {
    const char *env = std::getenv(DB_ENV_VAR);
    if (env && *env)
        return env;
    return DEFAULT_DB_FILE;
}

std::string repository_name(const std::string &root, const std::string &explicit_name) {
    if (!explicit_name.empty())
        return explicit_name;
    fs::path path = fs::path(root).lexically_normal();
    if (!path.has_filename() && path.has_parent_path())
        path = path.parent_path();
    return path.filename().string();
}

AnalysisDocument analyze_tree(const std::string &root, const RunOptions &opts) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw std::runtime_error("Root is not a directory: " + root);
    }

    DiscoveryConfig discovery;
    discovery.ignore_dirs.insert(discovery.ignore_dirs.end(), opts.ignore.begin(),
                                 opts.ignore.end());

    AnalyzerConfig config;
    config.root_path = root;
    config.verbose = opts.verbose;
    config.num_threads = opts.num_threads;
    config.discovery = discovery;

    std::cout << "Discovering projects under " << root << "..." << std::endl;
    ProjectDiscoverer discoverer(discovery);
    std::vector<ProjectManifest> manifests = discoverer.discover(root);
    if (manifests.empty()) {
        std::cerr << "Warning: No project manifests found under " << root << std::endl;
    }

    SourceAnalyzer analyzer(config);
    EntityRegistry registry;
    analyzer.analyze(manifests, registry);

    // Every project has been merged; nothing may be added from here on
    registry.freeze();
    ResolveStats stats = resolve_registry(registry);

    std::cout << "\nResolution complete." << std::endl;
    std::cout << "  Placeholders: " << stats.placeholders << std::endl;
    std::cout << "  Resolved: " << stats.resolved << std::endl;
    std::cout << "  Unresolved: " << stats.unresolved << std::endl;
    std::cout << "  Ambiguous: " << stats.ambiguous << std::endl;

    AnalysisDocument doc;
    doc.version = DOCUMENT_SCHEMA_VERSION;
    doc.root = analyzer.root().generic_string();
    for (const auto &manifest : manifests) {
        doc.projects.push_back(
            analyzer.relative_to_root(manifest.path).value_or(manifest.path.generic_string()));
    }
    doc.entities = registry.release();
    return doc;
}

LoadReport load_document(const AnalysisDocument &doc, const RunOptions &opts) {
    GraphStore store(opts.db_path);
    if (opts.clear) {
        std::cout << "Clearing graph store " << opts.db_path << std::endl;
        store.clear();
    }

    LoaderConfig config;
    config.repository_name = repository_name(doc.root, opts.repo_name);
    config.verbose = opts.verbose;

    GraphLoader loader(store, config);
    return loader.load(doc.entities);
}

int cmd_analyze(const std::string &root, const std::string &output, const RunOptions &opts) {
    AnalysisDocument doc;
    try {
        doc = analyze_tree(root, opts);
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    try {
        doc.save(output);
        std::cout << "\nAnalysis saved to: " << output << " (" << doc.entities.size()
                  << " entities)" << std::endl;
    } catch (const std::exception &e) {
        std::cerr << "Error saving analysis: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

int cmd_load(const std::string &document, const RunOptions &opts) {
    AnalysisDocument doc;
    try {
        doc = AnalysisDocument::load(document);
    } catch (const DocumentError &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Please run 'surveyor --analyze <root>' first." << std::endl;
        return 1;
    }

    std::cout << "Loading " << doc.entities.size() << " entities into " << opts.db_path << "..."
              << std::endl;
    try {
        load_document(doc, opts);
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

int cmd_build(const std::string &root, const RunOptions &opts) {
    AnalysisDocument doc;
    try {
        doc = analyze_tree(root, opts);
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\nLoading " << doc.entities.size() << " entities into " << opts.db_path
              << "..." << std::endl;
    try {
        load_document(doc, opts);
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

int cmd_stats(const RunOptions &opts) {
    std::error_code ec;
    if (opts.db_path != ":memory:" && !fs::exists(opts.db_path, ec)) {
        std::cerr << "Error: graph store not found: " << opts.db_path << std::endl;
        std::cerr << "Please run 'surveyor --build <root>' first." << std::endl;
        return 1;
    }

    try {
        GraphStore store(opts.db_path);

        std::cout << "Nodes (" << store.node_count() << "):" << std::endl;
        for (const auto &[label, count] : store.node_counts_by_label()) {
            std::cout << "  " << label << ": " << count << std::endl;
        }
        std::cout << "Edges (" << store.edge_count() << "):" << std::endl;
        for (const auto &[type, count] : store.edge_counts_by_type()) {
            std::cout << "  " << type << ": " << count << std::endl;
        }
        return 0;
    } catch (const StoreError &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

} // namespace surveyor

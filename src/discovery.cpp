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

#include "surveyor/discovery.hpp"
#include "surveyor/types.hpp"
#include <algorithm>
#include <cstring>
#include <fstream>
#include <iostream>
#include <optional>
#include <regex>
#include <set>

namespace surveyor {

namespace {

// Maximum depth of an "extends" chain
constexpr int MAX_EXTENDS_DEPTH = 16;

json read_json_file(const fs::path &path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ManifestError("Cannot open " + path.string());
    }
    try {
        // tsconfig files are JSON with comments
        return json::parse(in, nullptr, true, true);
    } catch (const json::parse_error &e) {
        throw ManifestError("Cannot parse " + path.string() + ": " + e.what());
    }
}

// Read an array of strings; anything that is not a string is dropped
std::optional<std::vector<std::string>> string_list(const json &j, const char *key,
                                                    const fs::path &source,
                                                    std::vector<std::string> &warnings) {
    auto it = j.find(key);
    if (it == j.end())
        return std::nullopt;
    if (!it->is_array()) {
        warnings.push_back(std::string("'") + key + "' is not an array in " + source.string());
        return std::nullopt;
    }
    std::vector<std::string> out;
    for (const auto &item : *it) {
        if (item.is_string())
            out.push_back(item.get<std::string>());
    }
    return out;
}

// Options accumulated along an "extends" chain, base first
struct InheritedOptions {
    std::optional<std::vector<fs::path>> files;
    std::optional<std::vector<std::string>> include;
    std::optional<std::vector<std::string>> exclude;
    fs::path base_url;
    fs::path out_dir;
    json paths;
    fs::path paths_base;
};

// Lexically normal directory path without a trailing separator
fs::path normal_dir(const fs::path &p) {
    fs::path n = p.lexically_normal();
    if (!n.has_filename() && n.has_relative_path())
        n = n.parent_path();
    return n;
}

fs::path resolve_extends(const fs::path &dir, const std::string &spec) {
    fs::path p = (dir / spec).lexically_normal();
    if (!fs::exists(p) && p.extension() != ".json") {
        p += ".json";
    }
    return p;
}

void apply_config(const fs::path &path, const json &config, InheritedOptions &opts,
                  std::set<std::string> &visiting, std::vector<std::string> &warnings,
                  int depth);

void apply_base_config(const fs::path &dir, const std::string &spec, InheritedOptions &opts,
                       std::set<std::string> &visiting, std::vector<std::string> &warnings,
                       int depth) {
    if (spec.empty() || (spec[0] != '.' && !fs::path(spec).is_absolute())) {
        // Package configs live in node_modules, which is never analyzed
        warnings.push_back("Ignoring package config in \"extends\": " + spec);
        return;
    }
    if (depth >= MAX_EXTENDS_DEPTH) {
        warnings.push_back("\"extends\" chain too deep at " + spec);
        return;
    }

    fs::path base = resolve_extends(dir, spec);
    if (visiting.count(base.generic_string())) {
        warnings.push_back("Circular \"extends\" through " + base.string());
        return;
    }

    try {
        json config = read_json_file(base);
        apply_config(base, config, opts, visiting, warnings, depth + 1);
    } catch (const ManifestError &e) {
        warnings.push_back(std::string("Skipping base config: ") + e.what());
    }
}

void apply_config(const fs::path &path, const json &config, InheritedOptions &opts,
                  std::set<std::string> &visiting, std::vector<std::string> &warnings,
                  int depth) {
    if (!config.is_object()) {
        warnings.push_back("Config is not a JSON object: " + path.string());
        return;
    }

    fs::path dir = path.parent_path();
    visiting.insert(path.generic_string());

    auto ext = config.find("extends");
    if (ext != config.end()) {
        if (ext->is_string()) {
            apply_base_config(dir, ext->get<std::string>(), opts, visiting, warnings, depth);
        } else if (ext->is_array()) {
            for (const auto &item : *ext) {
                if (item.is_string())
                    apply_base_config(dir, item.get<std::string>(), opts, visiting, warnings,
                                      depth);
            }
        }
    }

    // files/include/exclude are relative to the config that declares them
    if (auto files = string_list(config, "files", path, warnings)) {
        std::vector<fs::path> abs;
        for (const auto &f : *files)
            abs.push_back((dir / f).lexically_normal());
        opts.files = std::move(abs);
    }
    if (auto include = string_list(config, "include", path, warnings)) {
        std::vector<std::string> abs;
        for (const auto &p : *include)
            abs.push_back((dir / p).lexically_normal().generic_string());
        opts.include = std::move(abs);
    }
    if (auto exclude = string_list(config, "exclude", path, warnings)) {
        std::vector<std::string> abs;
        for (const auto &p : *exclude)
            abs.push_back((dir / p).lexically_normal().generic_string());
        opts.exclude = std::move(abs);
    }

    auto co = config.find("compilerOptions");
    if (co != config.end() && co->is_object()) {
        auto base_url = co->find("baseUrl");
        if (base_url != co->end() && base_url->is_string()) {
            opts.base_url = normal_dir(dir / base_url->get<std::string>());
        }
        auto out_dir = co->find("outDir");
        if (out_dir != co->end() && out_dir->is_string()) {
            opts.out_dir = normal_dir(dir / out_dir->get<std::string>());
        }
        auto paths = co->find("paths");
        if (paths != co->end() && paths->is_object()) {
            opts.paths = *paths;
            opts.paths_base = dir;
        }
    }

    visiting.erase(path.generic_string());
}

std::vector<PathAlias> build_aliases(const InheritedOptions &opts) {
    std::vector<PathAlias> aliases;
    if (!opts.paths.is_object())
        return aliases;

    fs::path base = opts.base_url.empty() ? opts.paths_base : opts.base_url;
    for (auto it = opts.paths.begin(); it != opts.paths.end(); ++it) {
        if (!it.value().is_array())
            continue;
        PathAlias alias;
        alias.prefix = it.key();
        if (!alias.prefix.empty() && alias.prefix.back() == '*') {
            alias.prefix.pop_back();
            alias.wildcard = true;
        }
        for (const auto &target : it.value()) {
            if (!target.is_string())
                continue;
            std::string t = target.get<std::string>();
            if (!t.empty() && t.back() == '*')
                t.pop_back();
            alias.directories.push_back(normal_dir(base / t));
        }
        aliases.push_back(std::move(alias));
    }

    // Exact aliases first, then the longest wildcard prefix wins
    std::stable_sort(aliases.begin(), aliases.end(), [](const PathAlias &a, const PathAlias &b) {
        if (a.wildcard != b.wildcard)
            return !a.wildcard;
        return a.prefix.size() > b.prefix.size();
    });
    return aliases;
}

// A last segment with no wildcard and no extension names a directory
std::string expand_directory_pattern(std::string pattern) {
    while (pattern.size() > 1 && pattern.back() == '/')
        pattern.pop_back();
    size_t slash = pattern.rfind('/');
    std::string last = slash == std::string::npos ? pattern : pattern.substr(slash + 1);
    if (last.find_first_of("*?") == std::string::npos && last.find('.') == std::string::npos) {
        pattern += "/**/*";
    }
    return pattern;
}

// Longest leading run of segments without wildcards
fs::path literal_base(const std::string &pattern) {
    fs::path base;
    size_t start = 0;
    while (start <= pattern.size()) {
        size_t end = pattern.find('/', start);
        std::string segment =
            pattern.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (segment.find_first_of("*?") != std::string::npos)
            break;
        if (segment.empty() && start == 0) {
            base = "/";
        } else {
            base /= segment;
        }
        if (end == std::string::npos)
            break;
        start = end + 1;
    }
    return base;
}

bool is_hidden(const std::string &name) {
    return !name.empty() && name[0] == '.' && name != "." && name != "..";
}

} // namespace

std::string glob_to_regex(const std::string &pattern) {
    std::string out;
    out.reserve(pattern.size() * 2);
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '*') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
                if (i + 2 < pattern.size() && pattern[i + 2] == '/') {
                    out += "(?:[^/]*/)*";
                    i += 2;
                } else {
                    out += ".*";
                    i += 1;
                }
            } else {
                out += "[^/]*";
            }
        } else if (c == '?') {
            out += "[^/]";
        } else if (std::strchr(".+()[]{}^$|\\", c) != nullptr) {
            out += '\\';
            out += c;
        } else {
            out += c;
        }
    }
    return out;
}

ProjectManifest load_manifest(const fs::path &path, std::vector<std::string> &warnings) {
    fs::path abs = fs::absolute(path).lexically_normal();
    json config = read_json_file(abs);

    InheritedOptions opts;
    std::set<std::string> visiting;
    apply_config(abs, config, opts, visiting, warnings, 0);

    ProjectManifest manifest;
    manifest.path = abs;
    manifest.directory = abs.parent_path();
    if (opts.files)
        manifest.files = std::move(*opts.files);
    if (opts.include)
        manifest.include = std::move(*opts.include);
    if (opts.exclude) {
        manifest.exclude = std::move(*opts.exclude);
        manifest.has_exclude = true;
    }
    manifest.base_url = opts.base_url;
    manifest.out_dir = opts.out_dir;
    manifest.aliases = build_aliases(opts);
    return manifest;
}

ProjectDiscoverer::ProjectDiscoverer(const DiscoveryConfig &config) : config_(config) {}

bool ProjectDiscoverer::should_ignore(const fs::path &dir) const {
    std::string name = dir.filename().string();
    for (const auto &pattern : config_.ignore_dirs) {
        if (name == pattern)
            return true;
    }
    return is_hidden(name);
}

bool ProjectDiscoverer::is_manifest_name(const std::string &filename) const {
    return std::find(config_.manifest_names.begin(), config_.manifest_names.end(), filename) !=
           config_.manifest_names.end();
}

void ProjectDiscoverer::warn(const std::string &message) {
    warnings_.push_back(message);
    std::cerr << "Warning: " << message << std::endl;
}

std::vector<ProjectManifest> ProjectDiscoverer::discover(const fs::path &root) {
    warnings_.clear();
    std::vector<ProjectManifest> manifests;

    fs::path abs_root = fs::absolute(root).lexically_normal();
    std::error_code ec;
    if (!fs::is_directory(abs_root, ec)) {
        warn("Root is not a directory: " + abs_root.string());
        return manifests;
    }

    // Iterative directory traversal
    std::vector<fs::path> candidates;
    std::vector<fs::path> dirs_to_visit;
    dirs_to_visit.push_back(abs_root);

    while (!dirs_to_visit.empty()) {
        fs::path current_dir = dirs_to_visit.back();
        dirs_to_visit.pop_back();

        fs::directory_iterator it(current_dir, ec);
        if (ec) {
            warn("Cannot read directory " + current_dir.string() + ": " + ec.message());
            ec.clear();
            continue;
        }
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            const fs::path &path = it->path();
            std::error_code entry_ec;
            if (it->is_symlink(entry_ec))
                continue;
            if (it->is_directory(entry_ec)) {
                if (!should_ignore(path))
                    dirs_to_visit.push_back(path);
            } else if (it->is_regular_file(entry_ec) &&
                       is_manifest_name(path.filename().string())) {
                candidates.push_back(path);
            }
        }
        if (ec) {
            warn("Stopped reading directory " + current_dir.string() + ": " + ec.message());
            ec.clear();
        }
    }

    std::sort(candidates.begin(), candidates.end());

    for (const auto &path : candidates) {
        try {
            // Only manifests that list their own member files are projects
            json raw = read_json_file(path);
            if (!raw.is_object() || !(raw.contains("files") || raw.contains("include"))) {
                warn("Skipping " + path.string() + ": declares neither \"files\" nor \"include\"");
                continue;
            }

            std::vector<std::string> manifest_warnings;
            ProjectManifest manifest = load_manifest(path, manifest_warnings);
            for (const auto &w : manifest_warnings)
                warn(w);
            manifests.push_back(std::move(manifest));
        } catch (const ManifestError &e) {
            warn(std::string(e.what()) + ". Skipping.");
        }
    }

    return manifests;
}

std::vector<fs::path> ProjectDiscoverer::member_files(const ProjectManifest &manifest,
                                                      std::vector<std::string> *warnings) const {
    std::set<fs::path> selected;

    for (const auto &file : manifest.files) {
        std::error_code ec;
        if (!fs::is_regular_file(file, ec)) {
            if (warnings)
                warnings->push_back("Declared file not found: " + file.string());
            continue;
        }
        if (language_from_filename(file.filename().string()) != Language::Unknown)
            selected.insert(file);
    }

    std::vector<std::string> exclude = manifest.exclude;
    if (!manifest.has_exclude) {
        for (const char *dir : {"node_modules", "bower_components", "jspm_packages"})
            exclude.push_back((manifest.directory / dir).generic_string());
        if (!manifest.out_dir.empty())
            exclude.push_back(manifest.out_dir.generic_string());
    }

    std::vector<std::regex> exclude_regexes;
    for (const auto &pattern : exclude)
        exclude_regexes.emplace_back(glob_to_regex(expand_directory_pattern(pattern)));

    auto excluded = [&](const std::string &generic) {
        for (const auto &re : exclude_regexes) {
            if (std::regex_match(generic, re))
                return true;
        }
        return false;
    };

    for (const auto &raw_pattern : manifest.include) {
        std::string pattern = expand_directory_pattern(raw_pattern);
        std::regex include_regex(glob_to_regex(pattern));
        fs::path base = literal_base(pattern);

        std::error_code ec;
        if (fs::is_regular_file(base, ec)) {
            std::string generic = base.generic_string();
            if (std::regex_match(generic, include_regex) && !excluded(generic) &&
                language_from_filename(base.filename().string()) != Language::Unknown)
                selected.insert(base);
            continue;
        }
        if (!fs::is_directory(base, ec))
            continue;

        std::vector<fs::path> dirs_to_visit;
        dirs_to_visit.push_back(base);
        while (!dirs_to_visit.empty()) {
            fs::path current_dir = dirs_to_visit.back();
            dirs_to_visit.pop_back();

            fs::directory_iterator it(current_dir, ec);
            if (ec) {
                if (warnings)
                    warnings->push_back("Cannot read directory " + current_dir.string());
                ec.clear();
                continue;
            }
            for (; it != fs::directory_iterator(); it.increment(ec)) {
                const fs::path &path = it->path();
                std::error_code entry_ec;
                if (it->is_symlink(entry_ec))
                    continue;
                if (it->is_directory(entry_ec)) {
                    if (!should_ignore(path))
                        dirs_to_visit.push_back(path);
                } else if (it->is_regular_file(entry_ec)) {
                    if (language_from_filename(path.filename().string()) == Language::Unknown)
                        continue;
                    std::string generic = path.lexically_normal().generic_string();
                    if (std::regex_match(generic, include_regex) && !excluded(generic))
                        selected.insert(path.lexically_normal());
                }
            }
            if (ec) {
                if (warnings)
                    warnings->push_back("Stopped reading directory " + current_dir.string());
                ec.clear();
            }
        }
    }

    return std::vector<fs::path>(selected.begin(), selected.end());
}

} // namespace surveyor

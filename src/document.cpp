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

#include "surveyor/document.hpp"
#include "surveyor/version.hpp"
#include <fstream>

namespace surveyor {

namespace {

json relationship_to_json(const Relationship &rel) {
    json j;
    j["type"] = relation_kind_to_string(rel.kind);
    j["targetId"] = rel.target.to_string();
    if (!rel.properties.empty())
        j["properties"] = rel.properties;
    return j;
}

json entity_to_json(const Entity &entity) {
    json j;
    j["id"] = entity.key();
    j["type"] = entity_kind_to_string(entity.kind);
    j["name"] = entity.name;
    j["filePath"] = entity.file_path;
    j["properties"] = entity.properties;

    json rels = json::array();
    for (const auto &rel : entity.relationships) {
        rels.push_back(relationship_to_json(rel));
    }
    j["relationships"] = std::move(rels);
    return j;
}

Entity entity_from_json(const json &j) {
    Entity entity;

    std::string type = j.at("type").get<std::string>();
    auto kind = entity_kind_from_string(type);
    if (!kind)
        throw DocumentError("Unknown node type '" + type + "'");
    entity.kind = *kind;
    entity.name = j.value("name", "");
    entity.file_path = j.at("filePath").get<std::string>();
    entity.properties = j.value("properties", json::object());

    std::string id = j.value("id", "");
    if (!id.empty() && id != entity.key())
        throw DocumentError("Node id '" + id + "' does not match its identity " + entity.key());

    if (j.contains("relationships")) {
        for (const auto &r : j["relationships"]) {
            Relationship rel;
            std::string rel_type = r.at("type").get<std::string>();
            auto rel_kind = relation_kind_from_string(rel_type);
            if (!rel_kind)
                throw DocumentError("Unknown relationship type '" + rel_type + "' on " +
                                    entity.key());
            rel.kind = *rel_kind;
            try {
                rel.target = Target::parse(r.at("targetId").get<std::string>());
            } catch (const std::invalid_argument &e) {
                throw DocumentError(std::string(e.what()) + " (on " + entity.key() + ")");
            }
            rel.properties = r.value("properties", json::object());
            entity.relationships.push_back(std::move(rel));
        }
    }
    return entity;
}

} // namespace

json AnalysisDocument::to_json() const {
    json j;
    j["version"] = version.empty() ? DOCUMENT_SCHEMA_VERSION : version;
    j["root"] = root;
    j["projects"] = projects;

    json nodes = json::array();
    for (const auto &entity : entities) {
        nodes.push_back(entity_to_json(entity));
    }
    j["nodes"] = std::move(nodes);
    return j;
}

void AnalysisDocument::save(const std::string &filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw DocumentError("Failed to open file for writing: " + filepath);
    }
    // Invalid UTF-8 read from source files is written as U+FFFD
    file << to_json().dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
    if (!file) {
        throw DocumentError("Failed to write analysis document: " + filepath);
    }
}

AnalysisDocument AnalysisDocument::from_json(const json &j) {
    AnalysisDocument doc;

    // Check schema version compatibility
    int major = 0, minor = 0, patch = 0;
    if (j.contains("version") && j["version"].is_string())
        doc.version = j["version"].get<std::string>();
    if (!parse_version(doc.version, major, minor, patch)) {
        throw DocumentError("Analysis document has no valid schema version");
    }
    if (!is_schema_compatible(major, minor, patch)) {
        throw DocumentError("Analysis document version " + doc.version +
                            " is not compatible with this version of surveyor (requires " +
                            std::to_string(DOCUMENT_SCHEMA_MAJOR) + ".x). Please re-analyze.");
    }

    try {
        doc.root = j.value("root", "");
        doc.projects = j.value("projects", std::vector<std::string>{});
        for (const auto &node : j.at("nodes")) {
            doc.entities.push_back(entity_from_json(node));
        }
    } catch (const json::exception &e) {
        throw DocumentError(std::string("Malformed analysis document: ") + e.what());
    }
    return doc;
}

AnalysisDocument AnalysisDocument::load(const std::string &filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw DocumentError("Failed to open file for reading: " + filepath);
    }

    json j = json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw DocumentError("Failed to parse analysis document: " + filepath);
    }
    return from_json(j);
}

} // namespace surveyor

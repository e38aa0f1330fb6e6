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

#include <gtest/gtest.h>
#include "surveyor/document.hpp"
#include "surveyor/version.hpp"
#include "test_helpers.hpp"

using namespace surveyor;
using surveyor::testing::TempTree;

namespace {

AnalysisDocument sample_document() {
    AnalysisDocument doc;
    doc.version = DOCUMENT_SCHEMA_VERSION;
    doc.root = "/work/shop";
    doc.projects = {"apps/shop/tsconfig.app.json"};

    Entity file;
    file.kind = EntityKind::File;
    file.name = "app.module.ts";
    file.file_path = "apps/shop/src/app/app.module.ts";
    file.properties = {{"project", {"apps/shop/tsconfig.app.json"}}};
    file.relationships.push_back({RelationKind::Imports, Target::external("@angular/core"),
                                  {{"from", "@angular/core"}}});
    doc.entities.push_back(file);

    Entity module;
    module.kind = EntityKind::Module;
    module.name = "AppModule";
    module.file_path = "apps/shop/src/app/app.module.ts";
    module.relationships.push_back(
        {RelationKind::Provides, Target::unresolved("Gamma"), json::object()});
    module.relationships.push_back(
        {RelationKind::Declares, Target::placeholder(std::nullopt, "Home"), json::object()});
    doc.entities.push_back(module);
    return doc;
}

} // namespace

TEST(DocumentTest, JsonLayout) {
    json j = sample_document().to_json();

    EXPECT_EQ(j.at("version"), DOCUMENT_SCHEMA_VERSION);
    EXPECT_EQ(j.at("root"), "/work/shop");
    ASSERT_EQ(j.at("nodes").size(), 2u);

    const json &module = j.at("nodes")[1];
    EXPECT_EQ(module.at("id"), "Module:AppModule:apps/shop/src/app/app.module.ts");
    EXPECT_EQ(module.at("type"), "Module");
    EXPECT_EQ(module.at("filePath"), "apps/shop/src/app/app.module.ts");
    EXPECT_EQ(module.at("relationships")[0].at("type"), "PROVIDES");
    EXPECT_EQ(module.at("relationships")[0].at("targetId"), "Unresolved:Gamma");
    EXPECT_FALSE(module.at("relationships")[0].contains("properties"));
    EXPECT_EQ(module.at("relationships")[1].at("targetId"), "Any:Home:UNKNOWN_PATH");
}

TEST(DocumentTest, SaveAndLoad) {
    TempTree tree;
    std::string path = tree.path("analysis.json").string();

    AnalysisDocument original = sample_document();
    original.save(path);
    AnalysisDocument loaded = AnalysisDocument::load(path);

    EXPECT_EQ(loaded.root, original.root);
    EXPECT_EQ(loaded.projects, original.projects);
    ASSERT_EQ(loaded.entities.size(), 2u);
    EXPECT_EQ(loaded.entities[0].key(), "File:apps/shop/src/app/app.module.ts");
    EXPECT_EQ(loaded.entities[0].properties, original.entities[0].properties);
    EXPECT_EQ(loaded.entities[0].relationships, original.entities[0].relationships);
    EXPECT_EQ(loaded.entities[1].relationships, original.entities[1].relationships);
}

TEST(DocumentTest, RejectsIncompatibleVersion) {
    json j = sample_document().to_json();
    j["version"] = std::to_string(DOCUMENT_SCHEMA_MAJOR + 1) + ".0.0";
    EXPECT_THROW(AnalysisDocument::from_json(j), DocumentError);

    j.erase("version");
    EXPECT_THROW(AnalysisDocument::from_json(j), DocumentError);
}

TEST(DocumentTest, RejectsMalformedNodes) {
    json j = sample_document().to_json();
    j["nodes"][1]["type"] = "Widget";
    EXPECT_THROW(AnalysisDocument::from_json(j), DocumentError);

    j = sample_document().to_json();
    j["nodes"][1]["relationships"][0]["targetId"] = "nonsense";
    EXPECT_THROW(AnalysisDocument::from_json(j), DocumentError);

    j = sample_document().to_json();
    j["nodes"][0]["id"] = "File:somewhere/else.ts";
    EXPECT_THROW(AnalysisDocument::from_json(j), DocumentError);

    j = sample_document().to_json();
    j["nodes"][0].erase("filePath");
    EXPECT_THROW(AnalysisDocument::from_json(j), DocumentError);
}

TEST(DocumentTest, UnreadableFiles) {
    TempTree tree;
    EXPECT_THROW(AnalysisDocument::load(tree.path("missing.json").string()), DocumentError);

    tree.write("broken.json", "{ \"version\": ");
    EXPECT_THROW(AnalysisDocument::load(tree.path("broken.json").string()), DocumentError);
}

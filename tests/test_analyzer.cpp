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
#include "surveyor/analyzer.hpp"
#include "surveyor/resolver.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>

using namespace surveyor;
using surveyor::testing::TempTree;

namespace {

// Small two-project monorepo: an app and a UI library reached through an alias
void write_monorepo(const TempTree &tree) {
    tree.write("tsconfig.base.json", R"({
  "compilerOptions": {
    "baseUrl": ".",
    "paths": {
      "@shop/ui": ["libs/ui/src/index.ts"],
      "@shop/ui/*": ["libs/ui/src/*"]
    }
  }
})");
    tree.write("apps/shop/tsconfig.app.json", R"({
  "extends": "../../tsconfig.base.json",
  "include": ["src/**/*.ts"]
})");
    tree.write("libs/ui/tsconfig.json", R"({
  "extends": "../../tsconfig.base.json",
  "include": ["src/**/*.ts"]
})");

    tree.write("apps/shop/src/app/app.module.ts", R"(
import { NgModule } from '@angular/core';
import { BrowserModule } from '@angular/platform-browser';
import { AppComponent } from './app.component';
import { UiModule } from '@shop/ui';
import { Missing } from './does-not-exist';

@NgModule({
  declarations: [AppComponent],
  imports: [BrowserModule, UiModule],
  providers: [CartService, Gamma],
  bootstrap: [AppComponent]
})
export class AppModule {}
)");
    tree.write("apps/shop/src/app/app.component.ts", R"(
import { Component, OnInit } from '@angular/core';
import { CartService } from './cart.service';

@Component({
  selector: 'app-root',
  templateUrl: './app.component.html',
  standalone: true,
  imports: [CurrencyPipe, TooltipDirective, SharedModule]
})
export class AppComponent implements OnInit {
  constructor(private cart: CartService) {}
  ngOnInit(): void {}
}
)");
    tree.write("apps/shop/src/app/cart.service.ts", R"(
import { Injectable } from '@angular/core';

@Injectable({ providedIn: 'root' })
export class CartService {}
)");

    tree.write("libs/ui/src/index.ts", R"(
export * from './button.component';
export * from './ui.module';
)");
    tree.write("libs/ui/src/button.component.ts", R"(
@Component({ selector: 'ui-button' })
export class ButtonComponent {}
)");
    tree.write("libs/ui/src/ui.module.ts", R"(
import { ButtonComponent } from '@shop/ui/button.component';

@NgModule({ declarations: [ButtonComponent], exports: [ButtonComponent] })
export class UiModule {}
)");
    tree.write("libs/ui/src/currency.pipe.ts", R"(
@Pipe({ name: 'currency', pure: true })
export class CurrencyPipe {}
)");
}

AnalyzerConfig config_for(const TempTree &tree) {
    AnalyzerConfig config;
    config.root_path = tree.root().string();
    config.num_threads = 2;
    return config;
}

// Every relationship as "<source> -[TYPE]-> <target>", sorted
std::vector<std::string> edge_list(const EntityRegistry &registry) {
    std::vector<std::string> out;
    for (const auto &entity : registry.entities()) {
        for (const auto &rel : entity.relationships) {
            out.push_back(entity.key() + " -[" + relation_kind_to_string(rel.kind) + "]-> " +
                          rel.target.to_string());
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

bool has_edge(const EntityRegistry &registry, const std::string &source, RelationKind kind,
              const std::string &target) {
    const Entity *entity = registry.find(source);
    if (!entity)
        return false;
    for (const auto &rel : entity->relationships) {
        if (rel.kind == kind && rel.target.to_string() == target)
            return true;
    }
    return false;
}

} // namespace

class AnalyzerTest : public ::testing::Test {
protected:
    void SetUp() override {
        write_monorepo(tree);
        ProjectDiscoverer discoverer;
        manifests = discoverer.discover(tree.root());
    }

    TempTree tree;
    std::vector<ProjectManifest> manifests;
};

TEST_F(AnalyzerTest, DiscoversBothProjects) {
    ASSERT_EQ(manifests.size(), 2u);
    EXPECT_EQ(manifests[0].path, tree.path("apps/shop/tsconfig.app.json"));
    EXPECT_EQ(manifests[1].path, tree.path("libs/ui/tsconfig.json"));
}

TEST_F(AnalyzerTest, ResolvesImportSpecifiers) {
    SourceAnalyzer analyzer(config_for(tree));
    const ProjectManifest &app = manifests.at(0);
    fs::path importer = tree.path("apps/shop/src/app/app.module.ts");

    EXPECT_EQ(analyzer.resolve_import("./app.component", importer, app),
              tree.path("apps/shop/src/app/app.component.ts"));
    EXPECT_EQ(analyzer.resolve_import("@shop/ui", importer, app), tree.path("libs/ui/src/index.ts"));
    EXPECT_EQ(analyzer.resolve_import("@shop/ui/ui.module", importer, app),
              tree.path("libs/ui/src/ui.module.ts"));
    // baseUrl-relative
    EXPECT_EQ(analyzer.resolve_import("libs/ui/src", importer, app),
              tree.path("libs/ui/src/index.ts"));

    EXPECT_FALSE(analyzer.resolve_import("./does-not-exist", importer, app).has_value());
    EXPECT_FALSE(analyzer.resolve_import("@angular/core", importer, app).has_value());
}

TEST_F(AnalyzerTest, RelativeToRoot) {
    SourceAnalyzer analyzer(config_for(tree));
    EXPECT_EQ(analyzer.relative_to_root(tree.path("libs/ui/src/index.ts")),
              std::optional<std::string>("libs/ui/src/index.ts"));
    EXPECT_FALSE(analyzer.relative_to_root(tree.root().parent_path() / "elsewhere.ts").has_value());
}

TEST_F(AnalyzerTest, ProjectScanBuildsEntities) {
    SourceAnalyzer analyzer(config_for(tree));
    ProjectResult result = analyzer.analyze_project(manifests.at(0));

    EXPECT_EQ(result.manifest, "apps/shop/tsconfig.app.json");
    EXPECT_EQ(result.files_parsed, 3u);
    EXPECT_EQ(result.files_failed, 0u);
    EXPECT_EQ(result.imports_dropped, 1u);

    auto by_key = [&](const std::string &key) -> const Entity * {
        for (const auto &e : result.entities) {
            if (e.key() == key)
                return &e;
        }
        return nullptr;
    };

    const Entity *file = by_key("File:apps/shop/src/app/app.module.ts");
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->name, "app.module.ts");
    EXPECT_EQ(file->properties.at("project"), json::array({"apps/shop/tsconfig.app.json"}));

    const Entity *component = by_key("Component:AppComponent:apps/shop/src/app/app.component.ts");
    ASSERT_NE(component, nullptr);
    EXPECT_EQ(component->properties.at("selector"), "app-root");
    EXPECT_EQ(component->properties.at("standalone"), true);
    EXPECT_EQ(component->properties.at("constructorParameters"),
              json::array({"cart:CartService"}));
    EXPECT_EQ(component->properties.at("members"), json::array({"ngOnInit"}));

    const Entity *service = by_key("Service:CartService:apps/shop/src/app/cart.service.ts");
    ASSERT_NE(service, nullptr);
    EXPECT_EQ(service->properties.at("providedIn"), "root");

    // Before resolution every cross reference is a placeholder
    const Entity *module = by_key("Module:AppModule:apps/shop/src/app/app.module.ts");
    ASSERT_NE(module, nullptr);
    ASSERT_EQ(module->relationships.size(), 6u);
    for (const auto &rel : module->relationships)
        EXPECT_TRUE(rel.target.is_placeholder());
    EXPECT_EQ(module->relationships[0].target.to_string(), "Any:AppComponent:UNKNOWN_PATH");
    EXPECT_EQ(module->relationships[1].target.to_string(), "Module:BrowserModule:UNKNOWN_PATH");
    EXPECT_EQ(module->relationships[3].target.to_string(), "Service:CartService:UNKNOWN_PATH");
    EXPECT_EQ(module->relationships[5].target.to_string(), "Component:AppComponent:UNKNOWN_PATH");
}

TEST_F(AnalyzerTest, ImportEdges) {
    SourceAnalyzer analyzer(config_for(tree));
    EntityRegistry registry;
    analyzer.analyze(manifests, registry);

    const std::string module_file = "File:apps/shop/src/app/app.module.ts";
    EXPECT_TRUE(has_edge(registry, module_file, RelationKind::Imports, "External:@angular/core"));
    EXPECT_TRUE(has_edge(registry, module_file, RelationKind::Imports,
                         "File:apps/shop/src/app/app.component.ts"));
    EXPECT_TRUE(has_edge(registry, module_file, RelationKind::Imports, "File:libs/ui/src/index.ts"));

    const Entity *file = registry.find(module_file);
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->relationships.size(), 4u);
    EXPECT_EQ(file->relationships[3].properties.at("from"), "@shop/ui");

    const Entity *index = registry.find("File:libs/ui/src/index.ts");
    ASSERT_NE(index, nullptr);
    ASSERT_EQ(index->relationships.size(), 2u);
    EXPECT_EQ(index->relationships[0].properties.at("reexport"), true);

    EXPECT_EQ(analyzer.stats().projects_analyzed.load(), 2u);
    EXPECT_EQ(analyzer.stats().files_parsed.load(), 7u);
    EXPECT_EQ(analyzer.stats().imports_dropped.load(), 1u);
}

TEST_F(AnalyzerTest, ResolvesAcrossProjects) {
    SourceAnalyzer analyzer(config_for(tree));
    EntityRegistry registry;
    analyzer.analyze(manifests, registry);
    registry.freeze();
    ResolveStats stats = resolve_registry(registry);

    const std::string app_module = "Module:AppModule:apps/shop/src/app/app.module.ts";
    const std::string app_component = "Component:AppComponent:apps/shop/src/app/app.component.ts";

    EXPECT_TRUE(has_edge(registry, app_module, RelationKind::Declares, app_component));
    EXPECT_TRUE(has_edge(registry, app_module, RelationKind::ImportsModule,
                         "Module:UiModule:libs/ui/src/ui.module.ts"));
    EXPECT_TRUE(has_edge(registry, app_module, RelationKind::ImportsModule,
                         "Unresolved:BrowserModule"));
    EXPECT_TRUE(has_edge(registry, app_module, RelationKind::Provides,
                         "Service:CartService:apps/shop/src/app/cart.service.ts"));
    EXPECT_TRUE(has_edge(registry, app_module, RelationKind::Provides, "Unresolved:Gamma"));
    EXPECT_TRUE(has_edge(registry, app_module, RelationKind::Bootstraps, app_component));

    EXPECT_TRUE(has_edge(registry, app_component, RelationKind::Injects,
                         "Service:CartService:apps/shop/src/app/cart.service.ts"));
    EXPECT_TRUE(has_edge(registry, app_component, RelationKind::UsesPipe,
                         "Pipe:CurrencyPipe:libs/ui/src/currency.pipe.ts"));
    EXPECT_TRUE(has_edge(registry, app_component, RelationKind::UsesDirective,
                         "Unresolved:TooltipDirective"));
    EXPECT_TRUE(has_edge(registry, app_component, RelationKind::ImportsModule,
                         "Unresolved:SharedModule"));
    EXPECT_TRUE(has_edge(registry, app_component, RelationKind::Implements, "Unresolved:OnInit"));

    const std::string ui_module = "Module:UiModule:libs/ui/src/ui.module.ts";
    EXPECT_TRUE(has_edge(registry, ui_module, RelationKind::ExportsModule,
                         "Component:ButtonComponent:libs/ui/src/button.component.ts"));

    EXPECT_EQ(stats.ambiguous, 0u);
    EXPECT_EQ(stats.placeholders, stats.resolved + stats.unresolved);
    for (const auto &edge : edge_list(registry))
        EXPECT_EQ(edge.find("UNKNOWN_PATH"), std::string::npos) << edge;
}

TEST_F(AnalyzerTest, ScanOrderDoesNotChangeResolvedTargets) {
    auto run = [&](std::vector<ProjectManifest> order) {
        SourceAnalyzer analyzer(config_for(tree));
        EntityRegistry registry;
        analyzer.analyze(order, registry);
        registry.freeze();
        resolve_registry(registry);
        return edge_list(registry);
    };

    std::vector<ProjectManifest> reversed(manifests.rbegin(), manifests.rend());
    EXPECT_EQ(run(manifests), run(reversed));
}

TEST(AnalyzerScenarioTest, InjectedServiceResolvesRegardlessOfScanOrder) {
    TempTree tree;
    tree.write("a/tsconfig.json", R"({ "files": ["a.ts"] })");
    tree.write("a/a.ts", "@Injectable()\nexport class Alpha {}\n");
    tree.write("b/tsconfig.json", R"({ "files": ["b.ts"] })");
    tree.write("b/b.ts", "@Injectable()\nexport class Beta {\n  constructor(private alpha: Alpha) {}\n}\n");

    ProjectDiscoverer discoverer;
    auto manifests = discoverer.discover(tree.root());
    ASSERT_EQ(manifests.size(), 2u);
    // Scan b before a, one project at a time
    std::reverse(manifests.begin(), manifests.end());

    AnalyzerConfig config;
    config.root_path = tree.root().string();
    config.num_threads = 1;
    SourceAnalyzer analyzer(config);
    EntityRegistry registry;
    analyzer.analyze(manifests, registry);
    ASSERT_EQ(registry.entities().at(0).key(), "File:b/b.ts");

    registry.freeze();
    resolve_registry(registry);

    EXPECT_TRUE(has_edge(registry, "Service:Beta:b/b.ts", RelationKind::Injects,
                         "Service:Alpha:a/a.ts"));
    const Entity *beta = registry.find("Service:Beta:b/b.ts");
    ASSERT_NE(beta, nullptr);
    EXPECT_EQ(beta->relationships.at(0).properties.at("parameterName"), "alpha");
}

TEST(AnalyzerScenarioTest, SharedFileIsOneEntity) {
    TempTree tree;
    tree.write("a/tsconfig.json", R"({ "files": ["../shared/util.ts", "main.ts"] })");
    tree.write("b/tsconfig.json", R"({ "files": ["../shared/util.ts"] })");
    tree.write("a/main.ts", "import { x } from '../shared/util';\n");
    tree.write("shared/util.ts", "export class Util {}\n");

    ProjectDiscoverer discoverer;
    auto manifests = discoverer.discover(tree.root());
    ASSERT_EQ(manifests.size(), 2u);

    AnalyzerConfig config;
    config.root_path = tree.root().string();
    SourceAnalyzer analyzer(config);
    EntityRegistry registry;
    analyzer.analyze(manifests, registry);

    const Entity *util = registry.find("File:shared/util.ts");
    ASSERT_NE(util, nullptr);
    EXPECT_EQ(util->properties.at("project"),
              json::array({"a/tsconfig.json", "b/tsconfig.json"}));
    EXPECT_EQ(std::count_if(registry.entities().begin(), registry.entities().end(),
                            [](const Entity &e) { return e.name == "Util"; }),
              1);
}

TEST(AnalyzerScenarioTest, FilesOutsideRootAreNotEmitted) {
    TempTree outer;
    outer.write("outside.ts", "export class Outside {}\n");
    outer.write("repo/tsconfig.json", R"({ "files": ["../outside.ts", "inside.ts"] })");
    outer.write("repo/inside.ts", "export class Inside {}\n");

    AnalyzerConfig config;
    config.root_path = outer.path("repo").string();
    ProjectDiscoverer discoverer;
    auto manifests = discoverer.discover(outer.path("repo"));
    ASSERT_EQ(manifests.size(), 1u);

    SourceAnalyzer analyzer(config);
    EntityRegistry registry;
    analyzer.analyze(manifests, registry);

    EXPECT_NE(registry.find("Class:Inside:inside.ts"), nullptr);
    for (const auto &entity : registry.entities())
        EXPECT_NE(entity.name, "Outside");
}

TEST(AnalyzerScenarioTest, LongestAliasPrefixWins) {
    TempTree tree;
    tree.write("tsconfig.json", R"({
  "compilerOptions": {
    "baseUrl": ".",
    "paths": {
      "@app/*": ["src/*"],
      "@app/core/*": ["core/*"]
    }
  },
  "include": ["**/*.ts"]
})");
    tree.write("src/core/log.ts", "export class ShadowLog {}\n");
    tree.write("core/log.ts", "export class Log {}\n");
    tree.write("src/main.ts", "import { Log } from '@app/core/log';\n");

    std::vector<std::string> warnings;
    ProjectManifest manifest = load_manifest(tree.path("tsconfig.json"), warnings);
    ASSERT_EQ(manifest.aliases.size(), 2u);
    EXPECT_EQ(manifest.aliases[0].prefix, "@app/core/");

    AnalyzerConfig config;
    config.root_path = tree.root().string();
    SourceAnalyzer analyzer(config);
    EXPECT_EQ(analyzer.resolve_import("@app/core/log", tree.path("src/main.ts"), manifest),
              tree.path("core/log.ts"));
    EXPECT_EQ(analyzer.resolve_import("@app/main", tree.path("src/main.ts"), manifest),
              tree.path("src/main.ts"));
}

TEST(AnalyzerScenarioTest, EsmJsSpecifierResolvesToTypeScriptSource) {
    TempTree tree;
    tree.write("tsconfig.json", R"({ "include": ["src/**/*.ts", "src/**/*.tsx"] })");
    tree.write("src/log.ts", "export class Log {}\n");
    tree.write("src/view.tsx", "export class View {}\n");
    tree.write("src/main.ts", "import { Log } from './log.js';\nimport { View } from './view.jsx';\n");

    ProjectDiscoverer discoverer;
    auto manifests = discoverer.discover(tree.root());
    ASSERT_EQ(manifests.size(), 1u);

    AnalyzerConfig config;
    config.root_path = tree.root().string();
    SourceAnalyzer analyzer(config);
    fs::path importer = tree.path("src/main.ts");
    EXPECT_EQ(analyzer.resolve_import("./log.js", importer, manifests[0]), tree.path("src/log.ts"));
    EXPECT_EQ(analyzer.resolve_import("./view.jsx", importer, manifests[0]),
              tree.path("src/view.tsx"));
    EXPECT_FALSE(analyzer.resolve_import("./gone.js", importer, manifests[0]).has_value());

    EntityRegistry registry;
    analyzer.analyze(manifests, registry);
    EXPECT_EQ(analyzer.stats().imports_dropped.load(), 0u);
    EXPECT_TRUE(has_edge(registry, "File:src/main.ts", RelationKind::Imports, "File:src/log.ts"));
    EXPECT_TRUE(has_edge(registry, "File:src/main.ts", RelationKind::Imports, "File:src/view.tsx"));
}

namespace {

// Fails the scan of any project living in a directory named "broken"
class FailingAnalyzer : public SourceAnalyzer {
public:
    using SourceAnalyzer::SourceAnalyzer;

    ProjectResult analyze_project(const ProjectManifest &manifest) const override {
        if (manifest.directory.filename() == "broken")
            throw std::runtime_error("scan failed");
        return SourceAnalyzer::analyze_project(manifest);
    }
};

} // namespace

TEST(AnalyzerScenarioTest, FailedProjectIsSkippedAndOthersMerge) {
    TempTree tree;
    tree.write("a/tsconfig.json", R"({ "files": ["a.ts"] })");
    tree.write("a/a.ts", "@Injectable()\nexport class Alpha {}\n");
    tree.write("broken/tsconfig.json", R"({ "files": ["broken.ts"] })");
    tree.write("broken/broken.ts", "export class Broken {}\n");
    tree.write("c/tsconfig.json", R"({ "files": ["c.ts"] })");
    tree.write("c/c.ts", "@Injectable()\nexport class Gamma {\n  constructor(private alpha: Alpha) {}\n}\n");

    ProjectDiscoverer discoverer;
    auto manifests = discoverer.discover(tree.root());
    ASSERT_EQ(manifests.size(), 3u);

    AnalyzerConfig config;
    config.root_path = tree.root().string();
    config.num_threads = 2;
    FailingAnalyzer analyzer(config);
    EntityRegistry registry;
    analyzer.analyze(manifests, registry);

    EXPECT_EQ(analyzer.stats().projects_failed.load(), 1u);
    EXPECT_EQ(analyzer.stats().projects_analyzed.load(), 2u);
    EXPECT_NE(registry.find("Service:Alpha:a/a.ts"), nullptr);
    EXPECT_NE(registry.find("Service:Gamma:c/c.ts"), nullptr);
    EXPECT_EQ(registry.find("File:broken/broken.ts"), nullptr);
    EXPECT_EQ(registry.find("Class:Broken:broken/broken.ts"), nullptr);

    registry.freeze();
    resolve_registry(registry);
    EXPECT_TRUE(has_edge(registry, "Service:Gamma:c/c.ts", RelationKind::Injects,
                         "Service:Alpha:a/a.ts"));
}

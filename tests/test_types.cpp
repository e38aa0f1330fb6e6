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
#include "surveyor/types.hpp"
#include "surveyor/version.hpp"

using namespace surveyor;

TEST(TypesTest, LanguageFromFilename) {
    EXPECT_EQ(language_from_filename("app.component.ts"), Language::TypeScript);
    EXPECT_EQ(language_from_filename("view.tsx"), Language::Tsx);
    EXPECT_EQ(language_from_filename("globals.d.ts"), Language::Unknown);
    EXPECT_EQ(language_from_filename("main.js"), Language::Unknown);
    EXPECT_EQ(language_from_filename("tsconfig.json"), Language::Unknown);
}

TEST(TypesTest, EntityKindLabelsRoundTrip) {
    for (EntityKind kind : {EntityKind::File, EntityKind::Class, EntityKind::Component,
                            EntityKind::Service, EntityKind::Module, EntityKind::Pipe,
                            EntityKind::Directive, EntityKind::Interface, EntityKind::Unknown}) {
        auto parsed = entity_kind_from_string(entity_kind_to_string(kind));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, kind);
    }
    EXPECT_FALSE(entity_kind_from_string("Any").has_value());
    EXPECT_FALSE(entity_kind_from_string("Repository").has_value());
}

TEST(TypesTest, RelationKindNames) {
    EXPECT_STREQ(relation_kind_to_string(RelationKind::ImportsModule), "IMPORTS_MODULE");
    EXPECT_STREQ(relation_kind_to_string(RelationKind::UsesDirective), "USES_DIRECTIVE");
    auto injects = relation_kind_from_string("INJECTS");
    ASSERT_TRUE(injects.has_value());
    EXPECT_EQ(*injects, RelationKind::Injects);
    EXPECT_FALSE(relation_kind_from_string("CALLS").has_value());
}

TEST(TypesTest, SpecificityPrefersStereotypes) {
    EXPECT_LT(entity_kind_specificity(EntityKind::Unknown),
              entity_kind_specificity(EntityKind::Class));
    EXPECT_LT(entity_kind_specificity(EntityKind::Class),
              entity_kind_specificity(EntityKind::Component));
    EXPECT_EQ(entity_kind_specificity(EntityKind::Service),
              entity_kind_specificity(EntityKind::Module));
}

TEST(TypesTest, EntityKeys) {
    Entity file;
    file.kind = EntityKind::File;
    file.name = "app.module.ts";
    file.file_path = "apps/shop/src/app/app.module.ts";
    EXPECT_EQ(file.key(), "File:apps/shop/src/app/app.module.ts");

    Entity cls;
    cls.kind = EntityKind::Module;
    cls.name = "AppModule";
    cls.file_path = "apps/shop/src/app/app.module.ts";
    EXPECT_EQ(cls.key(), "Module:AppModule:apps/shop/src/app/app.module.ts");
}

// ============================================================================
// Target encoding
// ============================================================================

TEST(TargetTest, EncodesEveryState) {
    EXPECT_EQ(Target::resolved("Service:Api:a/api.ts").to_string(), "Service:Api:a/api.ts");
    EXPECT_EQ(Target::placeholder(EntityKind::Service, "Api").to_string(),
              "Service:Api:UNKNOWN_PATH");
    EXPECT_EQ(Target::placeholder(std::nullopt, "Shared").to_string(), "Any:Shared:UNKNOWN_PATH");
    EXPECT_EQ(Target::external("@angular/core").to_string(), "External:@angular/core");
    EXPECT_EQ(Target::unresolved("Gamma").to_string(), "Unresolved:Gamma");
    EXPECT_EQ(Target::ambiguous("X").to_string(), "Ambiguous:X");
}

TEST(TargetTest, ParsesPlaceholders) {
    Target t = Target::parse("Module:SharedModule:UNKNOWN_PATH");
    EXPECT_TRUE(t.is_placeholder());
    ASSERT_TRUE(t.hint.has_value());
    EXPECT_EQ(*t.hint, EntityKind::Module);
    EXPECT_EQ(t.name, "SharedModule");

    Target any = Target::parse("Any:Widget:UNKNOWN_PATH");
    EXPECT_TRUE(any.is_placeholder());
    EXPECT_FALSE(any.hint.has_value());
}

TEST(TargetTest, ParsesResolvedAndTerminal) {
    Target file = Target::parse("File:libs/a/index.ts");
    EXPECT_TRUE(file.is_resolved());
    EXPECT_EQ(file.key, "File:libs/a/index.ts");

    Target ext = Target::parse("External:@ngrx/store");
    EXPECT_EQ(ext.state, TargetState::External);
    EXPECT_EQ(ext.name, "@ngrx/store");

    EXPECT_EQ(Target::parse("Unresolved:Gamma"), Target::unresolved("Gamma"));
    EXPECT_EQ(Target::parse("Ambiguous:X"), Target::ambiguous("X"));
    EXPECT_EQ(Target::parse("Class:Base:a/base.ts"), Target::resolved("Class:Base:a/base.ts"));
}

TEST(TargetTest, RejectsMalformedTargets) {
    EXPECT_THROW(Target::parse("nonsense"), std::invalid_argument);
    EXPECT_THROW(Target::parse("Widget:X:a.ts"), std::invalid_argument);
    EXPECT_THROW(Target::parse("Any:X:a/x.ts"), std::invalid_argument);
    EXPECT_THROW(Target::parse("Service::a/x.ts"), std::invalid_argument);
    EXPECT_THROW(Target::parse("File:"), std::invalid_argument);
}

TEST(VersionTest, SchemaCompatibility) {
    int major = 0, minor = 0, patch = 0;
    ASSERT_TRUE(parse_version(DOCUMENT_SCHEMA_VERSION, major, minor, patch));
    EXPECT_TRUE(is_schema_compatible(major, minor, patch));
    EXPECT_TRUE(is_schema_compatible(DOCUMENT_SCHEMA_MAJOR, DOCUMENT_SCHEMA_MINOR + 3, 0));
    EXPECT_FALSE(is_schema_compatible(DOCUMENT_SCHEMA_MAJOR + 1, 0, 0));
    EXPECT_FALSE(parse_version("1.x", major, minor, patch));
    EXPECT_FALSE(parse_version("one.two.three", major, minor, patch));
}

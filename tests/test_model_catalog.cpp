// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <geminimcp/model_catalog.hpp>
#include <gtest/gtest.h>

#include <algorithm>

using namespace geminimcp;

namespace
{

ModelCatalog two_models()
{
    return ModelCatalog({
        {"A", "reasoning model", 1000, {ModelCapability::ExtendedReasoning, ModelCapability::Vision}},
        {"B", "plain model", 1000, {ModelCapability::Vision}},
    });
}

} // namespace

TEST(ModelCatalogTest, FilterAllReturnsEverything)
{
    auto catalog = two_models();
    EXPECT_EQ(catalog.filter(kFilterAll).size(), 2u);
}

TEST(ModelCatalogTest, FilterByCapability)
{
    auto catalog = two_models();
    auto reasoning = catalog.filter(kFilterExtendedReasoning);
    ASSERT_EQ(reasoning.size(), 1u);
    EXPECT_EQ(reasoning[0].name, "A");

    EXPECT_EQ(catalog.filter(kFilterVision).size(), 2u);
    EXPECT_TRUE(catalog.filter(kFilterGrounding).empty());
}

TEST(ModelCatalogTest, UnknownFilterMeansAll)
{
    auto catalog = two_models();
    EXPECT_EQ(catalog.filter("supports-teleportation").size(), 2u);
}

TEST(ModelCatalogTest, FindByName)
{
    auto catalog = two_models();
    ASSERT_NE(catalog.find("B"), nullptr);
    EXPECT_EQ(catalog.find("B")->description, "plain model");
    EXPECT_EQ(catalog.find("C"), nullptr);
}

TEST(ModelCatalogTest, ModelInfoSerialization)
{
    json j = two_models().all()[0];
    EXPECT_EQ(j["name"], "A");
    EXPECT_EQ(j["contextWindow"], 1000);
    EXPECT_NE(
        std::find(j["capabilities"].begin(), j["capabilities"].end(), json("extended_reasoning")),
        j["capabilities"].end()
    );
}

TEST(ModelCatalogTest, GeminiDefaults)
{
    auto catalog = ModelCatalog::gemini_defaults();

    const ModelInfo* flash = catalog.find("gemini-2.5-flash");
    ASSERT_NE(flash, nullptr);
    EXPECT_TRUE(flash->supports(ModelCapability::ExtendedReasoning));
    EXPECT_TRUE(flash->supports(ModelCapability::Grounding));

    const ModelInfo* lite = catalog.find("gemini-2.0-flash-lite");
    ASSERT_NE(lite, nullptr);
    EXPECT_FALSE(lite->supports(ModelCapability::Grounding));

    auto embedding = catalog.with(ModelCapability::Embedding);
    ASSERT_FALSE(embedding.empty());
    EXPECT_NE(catalog.find("text-embedding-004"), nullptr);

    // Embedding models never show up as generation models
    for (const auto& m : catalog.without(ModelCapability::Embedding))
        EXPECT_FALSE(m.supports(ModelCapability::Embedding)) << m.name;
}

TEST(ModelCatalogTest, CapabilityForFilter)
{
    EXPECT_EQ(capability_for_filter(kFilterStructuredOutput), ModelCapability::StructuredOutput);
    EXPECT_EQ(capability_for_filter(kFilterVision), ModelCapability::Vision);
    EXPECT_FALSE(capability_for_filter(kFilterAll).has_value());
}

TEST(ModelCatalogTest, NamesAsEnumValues)
{
    auto names = ModelCatalog::names(two_models().all());
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "A");
    EXPECT_EQ(names[1], "B");
}

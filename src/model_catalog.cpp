// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <geminimcp/model_catalog.hpp>

namespace geminimcp
{

std::optional<ModelCapability> capability_for_filter(const std::string& filter)
{
    if (filter == kFilterStructuredOutput)
        return ModelCapability::StructuredOutput;
    if (filter == kFilterGrounding)
        return ModelCapability::Grounding;
    if (filter == kFilterExtendedReasoning)
        return ModelCapability::ExtendedReasoning;
    if (filter == kFilterVision)
        return ModelCapability::Vision;
    return std::nullopt;
}

ModelCatalog ModelCatalog::gemini_defaults()
{
    using C = ModelCapability;
    const std::set<C> base = {C::FunctionCalling, C::StructuredOutput, C::SystemInstructions, C::Vision};

    auto with_extra = [&base](std::initializer_list<C> extra)
    {
        std::set<C> caps = base;
        caps.insert(extra.begin(), extra.end());
        return caps;
    };

    return ModelCatalog({
        // 2.5 series: thinking models
        {"gemini-2.5-pro",
         "Most capable thinking model, best for complex reasoning and coding",
         2000000,
         with_extra({C::ExtendedReasoning, C::Grounding})},
        {"gemini-2.5-flash",
         "Fast thinking model with best price/performance ratio",
         1000000,
         with_extra({C::ExtendedReasoning, C::Grounding})},
        {"gemini-2.5-flash-lite",
         "Ultra-fast, cost-efficient thinking model for high-throughput tasks",
         1000000,
         with_extra({C::ExtendedReasoning})},

        // 2.0 series
        {"gemini-2.0-flash", "Fast, efficient model with 1M context window", 1000000, with_extra({C::Grounding})},
        {"gemini-2.0-flash-lite", "Most cost-efficient model for simple tasks", 1000000, base},
        {"gemini-2.0-pro-experimental",
         "Experimental model with 2M context, excellent for coding",
         2000000,
         with_extra({C::Grounding})},

        // Legacy
        {"gemini-1.5-pro", "Previous generation pro model", 2000000, base},
        {"gemini-1.5-flash", "Previous generation fast model", 1000000, base},

        // Embeddings
        {"text-embedding-004", "Text embedding model", 2048, {C::Embedding}},
        {"text-multilingual-embedding-002", "Multilingual text embedding model", 2048, {C::Embedding}},
    });
}

std::vector<ModelInfo> ModelCatalog::with(ModelCapability capability) const
{
    std::vector<ModelInfo> out;
    for (const auto& m : models_)
        if (m.supports(capability))
            out.push_back(m);
    return out;
}

std::vector<ModelInfo> ModelCatalog::without(ModelCapability capability) const
{
    std::vector<ModelInfo> out;
    for (const auto& m : models_)
        if (!m.supports(capability))
            out.push_back(m);
    return out;
}

std::vector<ModelInfo> ModelCatalog::filter(const std::string& filter) const
{
    auto capability = capability_for_filter(filter);
    if (!capability)
        return models_;
    return with(*capability);
}

const ModelInfo* ModelCatalog::find(const std::string& name) const
{
    for (const auto& m : models_)
        if (m.name == name)
            return &m;
    return nullptr;
}

std::vector<json> ModelCatalog::names(const std::vector<ModelInfo>& models)
{
    std::vector<json> out;
    out.reserve(models.size());
    for (const auto& m : models)
        out.emplace_back(m.name);
    return out;
}

} // namespace geminimcp

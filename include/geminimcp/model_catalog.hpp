// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <geminimcp/types.hpp>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace geminimcp
{

// =============================================================================
// Model Types
// =============================================================================

/// Capability tags a model may carry
enum class ModelCapability
{
    StructuredOutput,
    Grounding,
    ExtendedReasoning,
    Vision,
    FunctionCalling,
    SystemInstructions,
    Embedding
};

NLOHMANN_JSON_SERIALIZE_ENUM(
    ModelCapability,
    {
        {ModelCapability::StructuredOutput, "structured_output"},
        {ModelCapability::Grounding, "grounding"},
        {ModelCapability::ExtendedReasoning, "extended_reasoning"},
        {ModelCapability::Vision, "vision"},
        {ModelCapability::FunctionCalling, "function_calling"},
        {ModelCapability::SystemInstructions, "system_instructions"},
        {ModelCapability::Embedding, "embedding"},
    }
)

/// Static description of one provider model
struct ModelInfo
{
    std::string name;
    std::string description;
    int64_t context_window = 0;
    std::set<ModelCapability> capabilities;

    bool supports(ModelCapability capability) const
    {
        return capabilities.count(capability) > 0;
    }
};

inline void to_json(json& j, const ModelInfo& m)
{
    j = json{
        {"name", m.name},
        {"description", m.description},
        {"contextWindow", m.context_window},
        {"capabilities", m.capabilities},
    };
}

/// Filter names accepted by `list-models`
inline constexpr const char* kFilterAll = "all";
inline constexpr const char* kFilterStructuredOutput = "supports-structured-output";
inline constexpr const char* kFilterGrounding = "supports-grounding";
inline constexpr const char* kFilterExtendedReasoning = "supports-extended-reasoning";
inline constexpr const char* kFilterVision = "supports-vision";

/// Capability selected by a filter name; nullopt means "no filter"
std::optional<ModelCapability> capability_for_filter(const std::string& filter);

// =============================================================================
// ModelCatalog
// =============================================================================

/// Ordered, immutable list of models
class ModelCatalog
{
  public:
    explicit ModelCatalog(std::vector<ModelInfo> models) : models_(std::move(models)) {}

    /// The Gemini models this server advertises
    static ModelCatalog gemini_defaults();

    const std::vector<ModelInfo>& all() const
    {
        return models_;
    }

    /// Models carrying `capability`
    std::vector<ModelInfo> with(ModelCapability capability) const;

    /// Models that do not carry `capability`
    std::vector<ModelInfo> without(ModelCapability capability) const;

    /// Apply a `list-models` filter name; unknown names return everything
    std::vector<ModelInfo> filter(const std::string& filter) const;

    const ModelInfo* find(const std::string& name) const;

    /// Names of `models`, for schema enumerations
    static std::vector<json> names(const std::vector<ModelInfo>& models);

  private:
    std::vector<ModelInfo> models_;
};

} // namespace geminimcp

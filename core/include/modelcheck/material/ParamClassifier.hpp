#pragma once

#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

#include "modelcheck/material/ParamId.hpp"

namespace modelcheck::material
{
    // Which of the seven parameter lists of a material entry holds a ParamId.
    enum class ParamKind : uint8_t
    {
        Boolean,
        Float,
        Vector4,
        Texture,
        Sampler,
        BlendState,
        RasterizerState,
        Other
    };

    enum class TextureDimension : uint8_t
    {
        Texture2d,
        Texture3d,
        TextureCube
    };

    ParamKind kindOf(ParamId id);

    inline bool isBoolean(ParamId id) { return kindOf(id) == ParamKind::Boolean; }
    inline bool isFloat(ParamId id) { return kindOf(id) == ParamKind::Float; }
    inline bool isVector(ParamId id) { return kindOf(id) == ParamKind::Vector4; }
    inline bool isTexture(ParamId id) { return kindOf(id) == ParamKind::Texture; }
    inline bool isSampler(ParamId id) { return kindOf(id) == ParamKind::Sampler; }
    inline bool isBlendState(ParamId id) { return kindOf(id) == ParamKind::BlendState; }
    inline bool isRasterizerState(ParamId id) { return kindOf(id) == ParamKind::RasterizerState; }

    const char* toString(ParamKind kind);

    // Placeholder texture path with as little visual effect as possible.
    // Every texture param has a default. Non texture params return default white.
    std::string_view defaultTexture(ParamId id);

    // Distinct values returned by defaultTexture() in first-use order.
    const std::vector<std::string_view>& defaultTextureNames();

    // Short human readable name for the editor. Empty if undocumented.
    std::string_view paramDescription(ParamId id);

    std::array<std::string_view, 4> vector4LabelsShort(ParamId id);
    std::array<std::string_view, 4> vector4LabelsLong(ParamId id);

    // Normal maps, PRM maps and the cube map slots store linear data.
    bool expectsSrgb(ParamId id);

    TextureDimension expectedTextureDimension(ParamId id);

    const char* toString(TextureDimension dimension);
}

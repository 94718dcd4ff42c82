#pragma once

#include <array>
#include <cstdint>
#include <string_view>

#include "modelcheck/material/ParamClassifier.hpp"

namespace modelcheck::material::detail
{
    // A run of consecutive ParamId values sharing a name prefix and a kind.
    // Texture16 does not follow Texture15 numerically, so a prefix may appear
    // in more than one family.
    struct ParamFamily
    {
        std::string_view prefix;
        uint32_t firstIndex;
        uint64_t firstValue;
        uint32_t count;
        ParamKind kind;

        bool contains(uint64_t value) const { return value >= firstValue && value < firstValue + count; }
    };

    inline constexpr std::array<ParamFamily, 11> kParamFamilies = {{
        {"Texture", 0, 0x5C, 16, ParamKind::Texture},
        {"Sampler", 0, 0x6C, 16, ParamKind::Sampler},
        {"CustomVector", 0, 0x98, 20, ParamKind::Vector4},
        {"CustomFloat", 0, 0xC0, 20, ParamKind::Float},
        {"CustomBoolean", 0, 0xE8, 20, ParamKind::Boolean},
        {"UvTransform", 0, 0x10C, 5, ParamKind::Other},
        {"BlendState", 0, 0x118, 11, ParamKind::BlendState},
        {"RasterizerState", 0, 0x123, 11, ParamKind::RasterizerState},
        {"Texture", 16, 0x133, 4, ParamKind::Texture},
        {"CustomVector", 20, 0x152, 44, ParamKind::Vector4},
        {"Sampler", 16, 0x17E, 4, ParamKind::Sampler},
    }};

    inline constexpr std::array<std::string_view, 22> kLegacyParamNames = {
        "Diffuse",          "Specular",           "Ambient",
        "BlendMap",         "Transparency",       "DiffuseMapLayer1",
        "CosinePower",      "SpecularPower",      "Fresnel",
        "Roughness",        "EmissiveScale",      "EnableDiffuse",
        "EnableSpecular",   "EnableAmbient",      "DiffuseMapLayer2",
        "EnableTransparency", "EnableOpacity",    "EnableCosinePower",
        "EnableSpecularPower", "EnableFresnel",   "EnableRoughness",
        "EnableEmissiveScale",
    };

    inline const ParamFamily* findFamily(ParamId id)
    {
        const uint64_t value = paramValue(id);
        for (const auto& family : kParamFamilies) {
            if (family.contains(value)) {
                return &family;
            }
        }
        return nullptr;
    }

    // Index within the name, so Texture16 returns 16.
    inline uint32_t indexInFamily(const ParamFamily& family, ParamId id)
    {
        return family.firstIndex + static_cast<uint32_t>(paramValue(id) - family.firstValue);
    }
}

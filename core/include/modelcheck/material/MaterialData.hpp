#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <glm/vec4.hpp>

#include "modelcheck/material/ParamId.hpp"

namespace modelcheck::material
{
    enum class WrapMode : uint8_t
    {
        Repeat,
        ClampToEdge,
        MirroredRepeat,
        ClampToBorder
    };

    enum class MinFilter : uint8_t
    {
        Nearest,
        LinearMipmapLinear,
        LinearMipmapLinear2
    };

    enum class MagFilter : uint8_t
    {
        Nearest,
        Linear,
        Linear2
    };

    enum class MaxAnisotropy : uint8_t
    {
        One,
        Two,
        Four,
        Eight,
        Sixteen
    };

    struct SamplerData
    {
        WrapMode wrapS = WrapMode::Repeat;
        WrapMode wrapT = WrapMode::Repeat;
        WrapMode wrapR = WrapMode::Repeat;
        MinFilter minFilter = MinFilter::LinearMipmapLinear;
        MagFilter magFilter = MagFilter::Linear;
        glm::vec4 borderColor{0.0f};
        float lodBias = 0.0f;
        bool anisotropyEnabled = false;
        MaxAnisotropy maxAnisotropy = MaxAnisotropy::One;

        bool operator==(const SamplerData&) const = default;
    };

    enum class BlendFactor : uint8_t
    {
        Zero,
        One,
        SourceAlpha,
        DestinationAlpha,
        SourceColor,
        DestinationColor,
        OneMinusSourceAlpha,
        OneMinusDestinationAlpha,
        OneMinusSourceColor,
        OneMinusDestinationColor,
        SourceAlphaSaturate
    };

    struct BlendStateData
    {
        BlendFactor sourceColor = BlendFactor::One;
        BlendFactor destinationColor = BlendFactor::Zero;
        bool alphaSampleToCoverage = false;

        bool operator==(const BlendStateData&) const = default;
    };

    enum class FillMode : uint8_t
    {
        Line,
        Solid
    };

    enum class CullMode : uint8_t
    {
        Back,
        Front,
        Disabled
    };

    struct RasterizerStateData
    {
        FillMode fillMode = FillMode::Solid;
        CullMode cullMode = CullMode::Back;
        float depthBias = 0.0f;

        bool operator==(const RasterizerStateData&) const = default;
    };

    template<typename T>
    struct MaterialParam
    {
        ParamId paramId{};
        T data{};

        bool operator==(const MaterialParam&) const = default;
    };

    using BooleanParam = MaterialParam<bool>;
    using FloatParam = MaterialParam<float>;
    using Vector4Param = MaterialParam<glm::vec4>;
    using TextureParam = MaterialParam<std::string>;
    using SamplerParam = MaterialParam<SamplerData>;
    using BlendStateParam = MaterialParam<BlendStateData>;
    using RasterizerStateParam = MaterialParam<RasterizerStateData>;

    // One material in a model.numatb. The label is unique within the file and
    // joins against model.numdlb entries and material animations.
    struct MatlEntryData
    {
        std::string materialLabel;
        std::string shaderLabel;

        std::vector<BlendStateParam> blendStates;
        std::vector<FloatParam> floats;
        std::vector<BooleanParam> booleans;
        std::vector<Vector4Param> vectors;
        std::vector<RasterizerStateParam> rasterizerStates;
        std::vector<SamplerParam> samplers;
        std::vector<TextureParam> textures;

        bool operator==(const MatlEntryData&) const = default;

        // Calls f(paramId) for every stored parameter in list order.
        template<typename F>
        void forEachParamId(F&& f) const
        {
            for (const auto& p : booleans) f(p.paramId);
            for (const auto& p : floats) f(p.paramId);
            for (const auto& p : vectors) f(p.paramId);
            for (const auto& p : textures) f(p.paramId);
            for (const auto& p : samplers) f(p.paramId);
            for (const auto& p : blendStates) f(p.paramId);
            for (const auto& p : rasterizerStates) f(p.paramId);
        }
    };

    struct MatlData
    {
        uint16_t majorVersion = 1;
        uint16_t minorVersion = 6;
        std::vector<MatlEntryData> entries;

        bool operator==(const MatlData&) const = default;
    };
}

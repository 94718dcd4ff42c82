#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "modelcheck/core/result.hpp"

namespace modelcheck::material
{
    // Material parameter slot. The numeric value is the engine's encoding and
    // defines the canonical order of parameters within a material entry.
    enum class ParamId : uint64_t
    {
        // Legacy parameters. Present in old files but never read by current shaders.
        Diffuse = 0x0,
        Specular,
        Ambient,
        BlendMap,
        Transparency,
        DiffuseMapLayer1,
        CosinePower,
        SpecularPower,
        Fresnel,
        Roughness,
        EmissiveScale,
        EnableDiffuse,
        EnableSpecular,
        EnableAmbient,
        DiffuseMapLayer2,
        EnableTransparency,
        EnableOpacity,
        EnableCosinePower,
        EnableSpecularPower,
        EnableFresnel,
        EnableRoughness,
        EnableEmissiveScale,

        Texture0 = 0x5C,
        Texture1,
        Texture2,
        Texture3,
        Texture4,
        Texture5,
        Texture6,
        Texture7,
        Texture8,
        Texture9,
        Texture10,
        Texture11,
        Texture12,
        Texture13,
        Texture14,
        Texture15,

        Sampler0 = 0x6C,
        Sampler1,
        Sampler2,
        Sampler3,
        Sampler4,
        Sampler5,
        Sampler6,
        Sampler7,
        Sampler8,
        Sampler9,
        Sampler10,
        Sampler11,
        Sampler12,
        Sampler13,
        Sampler14,
        Sampler15,

        CustomVector0 = 0x98,
        CustomVector1,
        CustomVector2,
        CustomVector3,
        CustomVector4,
        CustomVector5,
        CustomVector6,
        CustomVector7,
        CustomVector8,
        CustomVector9,
        CustomVector10,
        CustomVector11,
        CustomVector12,
        CustomVector13,
        CustomVector14,
        CustomVector15,
        CustomVector16,
        CustomVector17,
        CustomVector18,
        CustomVector19,

        CustomFloat0 = 0xC0,
        CustomFloat1,
        CustomFloat2,
        CustomFloat3,
        CustomFloat4,
        CustomFloat5,
        CustomFloat6,
        CustomFloat7,
        CustomFloat8,
        CustomFloat9,
        CustomFloat10,
        CustomFloat11,
        CustomFloat12,
        CustomFloat13,
        CustomFloat14,
        CustomFloat15,
        CustomFloat16,
        CustomFloat17,
        CustomFloat18,
        CustomFloat19,

        CustomBoolean0 = 0xE8,
        CustomBoolean1,
        CustomBoolean2,
        CustomBoolean3,
        CustomBoolean4,
        CustomBoolean5,
        CustomBoolean6,
        CustomBoolean7,
        CustomBoolean8,
        CustomBoolean9,
        CustomBoolean10,
        CustomBoolean11,
        CustomBoolean12,
        CustomBoolean13,
        CustomBoolean14,
        CustomBoolean15,
        CustomBoolean16,
        CustomBoolean17,
        CustomBoolean18,
        CustomBoolean19,

        UvTransform0 = 0x10C,
        UvTransform1,
        UvTransform2,
        UvTransform3,
        UvTransform4,

        BlendState0 = 0x118,
        BlendState1,
        BlendState2,
        BlendState3,
        BlendState4,
        BlendState5,
        BlendState6,
        BlendState7,
        BlendState8,
        BlendState9,
        BlendState10,

        RasterizerState0 = 0x123,
        RasterizerState1,
        RasterizerState2,
        RasterizerState3,
        RasterizerState4,
        RasterizerState5,
        RasterizerState6,
        RasterizerState7,
        RasterizerState8,
        RasterizerState9,
        RasterizerState10,

        Texture16 = 0x133,
        Texture17,
        Texture18,
        Texture19,

        CustomVector20 = 0x152,
        CustomVector21,
        CustomVector22,
        CustomVector23,
        CustomVector24,
        CustomVector25,
        CustomVector26,
        CustomVector27,
        CustomVector28,
        CustomVector29,
        CustomVector30,
        CustomVector31,
        CustomVector32,
        CustomVector33,
        CustomVector34,
        CustomVector35,
        CustomVector36,
        CustomVector37,
        CustomVector38,
        CustomVector39,
        CustomVector40,
        CustomVector41,
        CustomVector42,
        CustomVector43,
        CustomVector44,
        CustomVector45,
        CustomVector46,
        CustomVector47,
        CustomVector48,
        CustomVector49,
        CustomVector50,
        CustomVector51,
        CustomVector52,
        CustomVector53,
        CustomVector54,
        CustomVector55,
        CustomVector56,
        CustomVector57,
        CustomVector58,
        CustomVector59,
        CustomVector60,
        CustomVector61,
        CustomVector62,
        CustomVector63,

        Sampler16 = 0x17E,
        Sampler17,
        Sampler18,
        Sampler19,
    };

    inline uint64_t paramValue(ParamId id) { return static_cast<uint64_t>(id); }

    // Canonical name such as "CustomVector13". Unknown values format as hex.
    std::string toString(ParamId id);

    core::Result<ParamId> parseParamId(std::string_view name);

    // Splits a shader database entry such as "CustomVector8.xyz" into
    // {"CustomVector8", "xyz"}. The channel part is empty if there is no suffix.
    std::pair<std::string_view, std::string_view> splitParam(std::string_view param);
}

#include "modelcheck/material/ParamClassifier.hpp"
#include "ParamFamilies.hpp"

#include <algorithm>

namespace modelcheck::material
{
    namespace
    {
        constexpr std::string_view kDefaultWhite = "/common/shader/sfxpbs/default_white";
        constexpr std::string_view kDefaultBlack = "/common/shader/sfxpbs/default_black";
        constexpr std::string_view kDefaultNormal = "/common/shader/sfxpbs/fighter/default_normal";
        constexpr std::string_view kDefaultParams = "/common/shader/sfxpbs/fighter/default_params";
        constexpr std::string_view kReplaceCubemap = "#replace_cubemap";

        // Indexed by the texture number in the param name.
        constexpr std::array<std::string_view, 20> kDefaultTextures = {
            kDefaultWhite,   // Texture0 col
            kDefaultWhite,   // Texture1 col layer 2
            kReplaceCubemap, // Texture2 irradiance cube
            kDefaultWhite,   // Texture3 ao
            kDefaultNormal,  // Texture4 nor
            kDefaultBlack,   // Texture5 emissive
            kDefaultParams,  // Texture6 prm
            kReplaceCubemap, // Texture7 specular cube
            kReplaceCubemap, // Texture8 diffuse cube
            kDefaultBlack,   // Texture9 baked lighting
            kDefaultWhite,
            kDefaultWhite,
            kDefaultWhite,
            kDefaultWhite,
            kDefaultBlack,   // Texture14 emissive layer 2
            kDefaultWhite,
            kDefaultWhite,
            kDefaultWhite,
            kDefaultWhite,
            kDefaultWhite,
        };

        int textureNumber(ParamId id)
        {
            const auto* family = detail::findFamily(id);
            if (family == nullptr || family->kind != ParamKind::Texture) {
                return -1;
            }
            return static_cast<int>(detail::indexInFamily(*family, id));
        }

        bool isColorVector(ParamId id)
        {
            switch (id) {
            case ParamId::CustomVector1:
            case ParamId::CustomVector2:
            case ParamId::CustomVector3:
            case ParamId::CustomVector5:
            case ParamId::CustomVector7:
            case ParamId::CustomVector8:
            case ParamId::CustomVector9:
            case ParamId::CustomVector10:
            case ParamId::CustomVector13:
            case ParamId::CustomVector15:
            case ParamId::CustomVector19:
            case ParamId::CustomVector20:
            case ParamId::CustomVector21:
            case ParamId::CustomVector22:
            case ParamId::CustomVector23:
            case ParamId::CustomVector24:
            case ParamId::CustomVector35:
            case ParamId::CustomVector43:
            case ParamId::CustomVector44:
            case ParamId::CustomVector45:
                return true;
            default:
                return false;
            }
        }
    }

    ParamKind kindOf(ParamId id)
    {
        const auto* family = detail::findFamily(id);
        return family != nullptr ? family->kind : ParamKind::Other;
    }

    const char* toString(ParamKind kind)
    {
        switch (kind) {
        case ParamKind::Boolean: return "Boolean";
        case ParamKind::Float: return "Float";
        case ParamKind::Vector4: return "Vector4";
        case ParamKind::Texture: return "Texture";
        case ParamKind::Sampler: return "Sampler";
        case ParamKind::BlendState: return "BlendState";
        case ParamKind::RasterizerState: return "RasterizerState";
        case ParamKind::Other: return "Other";
        }
        return "Other";
    }

    std::string_view defaultTexture(ParamId id)
    {
        const int number = textureNumber(id);
        if (number < 0 || number >= static_cast<int>(kDefaultTextures.size())) {
            return kDefaultWhite;
        }
        return kDefaultTextures[static_cast<size_t>(number)];
    }

    const std::vector<std::string_view>& defaultTextureNames()
    {
        static const std::vector<std::string_view> names = [] {
            std::vector<std::string_view> out;
            for (const auto name : kDefaultTextures) {
                if (std::ranges::find(out, name) == out.end()) {
                    out.push_back(name);
                }
            }
            return out;
        }();
        return names;
    }

    std::string_view paramDescription(ParamId id)
    {
        switch (id) {
        case ParamId::CustomVector0: return "Alpha Params";
        case ParamId::CustomVector3: return "Emission Color Scale";
        case ParamId::CustomVector6: return "UV Transform Layer 1";
        case ParamId::CustomVector8: return "Final Color Scale";
        case ParamId::CustomVector11: return "Subsurface Color";
        case ParamId::CustomVector13: return "Diffuse Color Scale";
        case ParamId::CustomVector14: return "Rim Color";
        case ParamId::CustomVector18: return "Sprite Sheet Params";
        case ParamId::CustomVector30: return "Subsurface Params";
        case ParamId::CustomVector31: return "UV Transform Layer 2";
        case ParamId::CustomVector32: return "UV Transform Layer 3";
        case ParamId::CustomVector47: return "Prm Color";
        case ParamId::Texture0: return "Col Layer 1";
        case ParamId::Texture1: return "Col Layer 2";
        case ParamId::Texture2: return "Irradiance Cube";
        case ParamId::Texture3: return "Ambient Occlusion";
        case ParamId::Texture4: return "Nor";
        case ParamId::Texture5: return "Emissive Layer 1";
        case ParamId::Texture6: return "Prm";
        case ParamId::Texture7: return "Specular Cube";
        case ParamId::Texture8: return "Diffuse Cube";
        case ParamId::Texture9: return "Baked Lighting";
        case ParamId::Texture10: return "Diffuse Layer 1";
        case ParamId::Texture11: return "Diffuse Layer 2";
        case ParamId::Texture12: return "Diffuse Layer 3";
        case ParamId::Texture14: return "Emissive Layer 2";
        case ParamId::CustomFloat1: return "Ambient Occlusion Map Intensity";
        case ParamId::CustomFloat10: return "Anisotropy";
        case ParamId::CustomBoolean1: return "PRM Alpha";
        case ParamId::CustomBoolean2: return "Alpha Override";
        case ParamId::CustomBoolean3: return "Direct Specular";
        case ParamId::CustomBoolean4: return "Indirect Specular";
        case ParamId::CustomBoolean9: return "Sprite Sheet";
        default: return {};
        }
    }

    std::array<std::string_view, 4> vector4LabelsShort(ParamId id)
    {
        if (isColorVector(id) || id == ParamId::CustomVector11 || id == ParamId::CustomVector14) {
            return {"R", "G", "B", "A"};
        }
        return {"X", "Y", "Z", "W"};
    }

    std::array<std::string_view, 4> vector4LabelsLong(ParamId id)
    {
        if (isColorVector(id)) {
            return {"Red", "Green", "Blue", "Alpha"};
        }

        switch (id) {
        case ParamId::CustomVector0:
            return {"Min Texture Alpha", "Y", "Z", "W"};
        case ParamId::CustomVector6:
        case ParamId::CustomVector31:
        case ParamId::CustomVector32:
            return {"Scale U", "Scale V", "Translate U", "Translate V"};
        case ParamId::CustomVector11:
            return {"Red", "Green", "Blue", ""};
        case ParamId::CustomVector14:
            return {"Red", "Green", "Blue", "Blend Factor"};
        case ParamId::CustomVector18:
            return {"Column Count", "Row Count", "Frames per Sprite", "Sprite Count"};
        case ParamId::CustomVector30:
            return {"Blend Factor", "Smooth Factor", "", ""};
        case ParamId::CustomVector47:
            return {"Metalness", "Roughness", "Ambient Occlusion", "Specular"};
        default:
            return {"X", "Y", "Z", "W"};
        }
    }

    bool expectsSrgb(ParamId id)
    {
        switch (id) {
        case ParamId::Texture2:
        case ParamId::Texture4:
        case ParamId::Texture6:
        case ParamId::Texture7:
        case ParamId::Texture16:
            return false;
        default:
            return true;
        }
    }

    TextureDimension expectedTextureDimension(ParamId id)
    {
        switch (id) {
        case ParamId::Texture2:
        case ParamId::Texture7:
        case ParamId::Texture8:
            return TextureDimension::TextureCube;
        default:
            return TextureDimension::Texture2d;
        }
    }

    const char* toString(TextureDimension dimension)
    {
        switch (dimension) {
        case TextureDimension::Texture2d: return "Texture2d";
        case TextureDimension::Texture3d: return "Texture3d";
        case TextureDimension::TextureCube: return "TextureCube";
        }
        return "Texture2d";
    }
}

#include <doctest/doctest.h>
#include "modelcheck/material/ParamClassifier.hpp"
#include "modelcheck/material/ParamId.hpp"

#include <algorithm>

using namespace modelcheck::material;

TEST_CASE("ParamId names") {
    SUBCASE("Canonical names") {
        CHECK(toString(ParamId::Diffuse) == "Diffuse");
        CHECK(toString(ParamId::Texture0) == "Texture0");
        CHECK(toString(ParamId::Texture19) == "Texture19");
        CHECK(toString(ParamId::CustomVector13) == "CustomVector13");
        CHECK(toString(ParamId::CustomVector63) == "CustomVector63");
        CHECK(toString(ParamId::RasterizerState0) == "RasterizerState0");
        CHECK(toString(ParamId::UvTransform4) == "UvTransform4");
    }

    SUBCASE("Parse known names") {
        CHECK(parseParamId("Diffuse").value() == ParamId::Diffuse);
        CHECK(parseParamId("Texture4").value() == ParamId::Texture4);
        CHECK(parseParamId("Texture16").value() == ParamId::Texture16);
        CHECK(parseParamId("CustomVector20").value() == ParamId::CustomVector20);
        CHECK(parseParamId("Sampler17").value() == ParamId::Sampler17);
        CHECK(parseParamId("BlendState10").value() == ParamId::BlendState10);
    }

    SUBCASE("Reject unknown names") {
        CHECK_FALSE(parseParamId("").has_value());
        CHECK_FALSE(parseParamId("Texture").has_value());
        CHECK_FALSE(parseParamId("Texture20").has_value());
        CHECK_FALSE(parseParamId("Texture04").has_value());
        CHECK_FALSE(parseParamId("CustomVector64").has_value());
        CHECK_FALSE(parseParamId("texture0").has_value());
        CHECK_FALSE(parseParamId("Texture0.xyz").has_value());
    }

    SUBCASE("Split channel suffix") {
        const auto [name, channels] = splitParam("CustomVector8.xyz");
        CHECK(name == "CustomVector8");
        CHECK(channels == "xyz");

        const auto [plainName, plainChannels] = splitParam("Texture0");
        CHECK(plainName == "Texture0");
        CHECK(plainChannels.empty());
    }

    SUBCASE("Values increase within families") {
        CHECK(paramValue(ParamId::Texture0) < paramValue(ParamId::Texture15));
        CHECK(paramValue(ParamId::Texture15) < paramValue(ParamId::Texture16));
        CHECK(paramValue(ParamId::CustomVector19) < paramValue(ParamId::CustomVector20));
    }
}

TEST_CASE("ParamClassifier kinds") {
    CHECK(kindOf(ParamId::CustomBoolean0) == ParamKind::Boolean);
    CHECK(kindOf(ParamId::CustomBoolean19) == ParamKind::Boolean);
    CHECK(kindOf(ParamId::CustomFloat8) == ParamKind::Float);
    CHECK(kindOf(ParamId::CustomVector0) == ParamKind::Vector4);
    CHECK(kindOf(ParamId::CustomVector63) == ParamKind::Vector4);
    CHECK(kindOf(ParamId::Texture0) == ParamKind::Texture);
    CHECK(kindOf(ParamId::Texture19) == ParamKind::Texture);
    CHECK(kindOf(ParamId::Sampler0) == ParamKind::Sampler);
    CHECK(kindOf(ParamId::Sampler19) == ParamKind::Sampler);
    CHECK(kindOf(ParamId::BlendState0) == ParamKind::BlendState);
    CHECK(kindOf(ParamId::RasterizerState0) == ParamKind::RasterizerState);

    CHECK(kindOf(ParamId::Diffuse) == ParamKind::Other);
    CHECK(kindOf(ParamId::EnableEmissiveScale) == ParamKind::Other);
    CHECK(kindOf(ParamId::UvTransform0) == ParamKind::Other);

    CHECK(isTexture(ParamId::Texture7));
    CHECK_FALSE(isTexture(ParamId::Sampler7));
    CHECK(isVector(ParamId::CustomVector31));
    CHECK(isBlendState(ParamId::BlendState1));
    CHECK(std::string_view(toString(ParamKind::RasterizerState)) == "RasterizerState");
}

TEST_CASE("ParamClassifier default textures") {
    CHECK(defaultTexture(ParamId::Texture0) == "/common/shader/sfxpbs/default_white");
    CHECK(defaultTexture(ParamId::Texture4) == "/common/shader/sfxpbs/fighter/default_normal");
    CHECK(defaultTexture(ParamId::Texture5) == "/common/shader/sfxpbs/default_black");
    CHECK(defaultTexture(ParamId::Texture6) == "/common/shader/sfxpbs/fighter/default_params");
    CHECK(defaultTexture(ParamId::Texture7) == "#replace_cubemap");
    CHECK(defaultTexture(ParamId::Texture14) == "/common/shader/sfxpbs/default_black");
    CHECK(defaultTexture(ParamId::Texture19) == "/common/shader/sfxpbs/default_white");

    SUBCASE("Every texture has a known default") {
        const auto& names = defaultTextureNames();
        CHECK(names.size() == 5);
        for (int i = 0; i < 16; ++i) {
            const auto id = static_cast<ParamId>(paramValue(ParamId::Texture0) + i);
            CHECK(std::ranges::find(names, defaultTexture(id)) != names.end());
        }
    }
}

TEST_CASE("ParamClassifier texture expectations") {
    CHECK(expectsSrgb(ParamId::Texture0));
    CHECK(expectsSrgb(ParamId::Texture5));
    CHECK(expectsSrgb(ParamId::Texture8));
    CHECK_FALSE(expectsSrgb(ParamId::Texture2));
    CHECK_FALSE(expectsSrgb(ParamId::Texture4));
    CHECK_FALSE(expectsSrgb(ParamId::Texture6));
    CHECK_FALSE(expectsSrgb(ParamId::Texture7));
    CHECK_FALSE(expectsSrgb(ParamId::Texture16));

    CHECK(expectedTextureDimension(ParamId::Texture0) == TextureDimension::Texture2d);
    CHECK(expectedTextureDimension(ParamId::Texture2) == TextureDimension::TextureCube);
    CHECK(expectedTextureDimension(ParamId::Texture7) == TextureDimension::TextureCube);
    CHECK(expectedTextureDimension(ParamId::Texture8) == TextureDimension::TextureCube);
}

TEST_CASE("ParamClassifier editor labels") {
    CHECK(paramDescription(ParamId::Texture4) == "Nor");
    CHECK(paramDescription(ParamId::CustomVector47) == "Prm Color");
    CHECK(paramDescription(ParamId::CustomVector63).empty());

    const auto colorLabels = vector4LabelsShort(ParamId::CustomVector13);
    CHECK(colorLabels[0] == "R");
    CHECK(colorLabels[3] == "A");

    const auto uvLabels = vector4LabelsLong(ParamId::CustomVector6);
    CHECK(uvLabels[0] == "Scale U");
    CHECK(uvLabels[3] == "Translate V");

    const auto defaultLabels = vector4LabelsShort(ParamId::CustomVector4);
    CHECK(defaultLabels[0] == "X");
}

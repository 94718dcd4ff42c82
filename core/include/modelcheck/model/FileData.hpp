#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "modelcheck/material/MaterialData.hpp"
#include "modelcheck/material/ParamClassifier.hpp"

// Parsed contents of the files in a model folder.
// Only the fields read by the consistency checks are kept.
namespace modelcheck::model {

    using material::MatlData;

    struct AttributeData {
        std::string name;

        bool operator==(const AttributeData&) const = default;
    };

    struct MeshObjectData {
        std::string name;
        // Disambiguates objects with the same name.
        uint64_t subindex = 0;
        uint32_t vertexCount = 0;
        std::vector<AttributeData> textureCoordinates;
        std::vector<AttributeData> colorSets;

        // Texture coordinate names followed by color set names.
        std::vector<std::string> attributeNames() const {
            std::vector<std::string> names;
            names.reserve(textureCoordinates.size() + colorSets.size());
            for (const auto& a : textureCoordinates) {
                names.push_back(a.name);
            }
            for (const auto& a : colorSets) {
                names.push_back(a.name);
            }
            return names;
        }

        bool operator==(const MeshObjectData&) const = default;
    };

    struct MeshData {
        uint16_t majorVersion = 1;
        uint16_t minorVersion = 10;
        std::vector<MeshObjectData> objects;
    };

    // Assigns a material to one mesh object.
    struct ModlEntryData {
        std::string meshObjectName;
        uint64_t meshObjectSubindex = 0;
        std::string materialLabel;
    };

    struct ModlData {
        std::string modelName;
        std::string skeletonFileName;
        std::vector<std::string> materialFileNames;
        std::vector<ModlEntryData> entries;
    };

    struct AdjEntryData {
        size_t meshObjectIndex = 0;
        std::vector<int16_t> vertexAdjacency;
    };

    struct AdjData {
        std::vector<AdjEntryData> entries;
    };

    struct BoneData {
        std::string name;
        int32_t parentIndex = -1;
    };

    struct SkelData {
        std::vector<BoneData> bones;
    };

    struct AnimData {
        float finalFrameIndex = 0.0f;
    };

    struct HlpbData {
        std::vector<std::string> constraintNames;
    };

    struct MeshExEntryData {
        std::string meshObjectName;
        bool drawModel = true;
        bool castShadow = true;
    };

    struct MeshExData {
        std::vector<MeshExEntryData> entries;
    };

    enum class NutexbFormat : uint8_t {
        R8Unorm,
        R8G8B8A8Unorm,
        R8G8B8A8Srgb,
        R32G32B32A32Float,
        B8G8R8A8Unorm,
        B8G8R8A8Srgb,
        BC1Unorm,
        BC1Srgb,
        BC2Unorm,
        BC2Srgb,
        BC3Unorm,
        BC3Srgb,
        BC4Unorm,
        BC4Snorm,
        BC5Unorm,
        BC5Snorm,
        BC6Ufloat,
        BC6Sfloat,
        BC7Unorm,
        BC7Srgb
    };

    struct NutexbFooter {
        std::string name;
        uint32_t width = 1;
        uint32_t height = 1;
        uint32_t depth = 1;
        NutexbFormat imageFormat = NutexbFormat::R8G8B8A8Unorm;
        uint32_t mipmapCount = 1;
        uint32_t layerCount = 1;
    };

    struct NutexbFile {
        NutexbFooter footer;
    };

    bool isSrgb(NutexbFormat format);
    const char* toString(NutexbFormat format);

    // Array layers are not considered for depth or cube textures.
    material::TextureDimension textureDimension(const NutexbFile& nutexb);

}

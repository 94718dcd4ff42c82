#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "modelcheck/material/ParamClassifier.hpp"
#include "modelcheck/material/ParamId.hpp"
#include "modelcheck/model/FileData.hpp"

namespace modelcheck::validation
{
    // Diagnostics are grouped by the file they should be displayed next to.
    // A single finding may add a diagnostic to more than one file.

    struct MeshValidationError
    {
        struct MissingRequiredVertexAttributes
        {
            size_t meshObjectIndex = 0;
            std::string meshName;
            std::string materialLabel;
            std::vector<std::string> missingAttributes;

            std::string toString() const;
            bool operator==(const MissingRequiredVertexAttributes&) const = default;
        };

        struct DuplicateSubindex
        {
            size_t meshObjectIndex = 0;
            std::string meshName;
            uint64_t subindex = 0;

            std::string toString() const;
            bool operator==(const DuplicateSubindex&) const = default;
        };

        std::variant<MissingRequiredVertexAttributes, DuplicateSubindex> error;

        // Mesh object names are not always unique, so errors are associated by index.
        size_t meshObjectIndex() const;
        std::string toString() const;

        bool operator==(const MeshValidationError&) const = default;
    };

    struct MatlValidationError
    {
        struct MissingRequiredVertexAttributes
        {
            size_t entryIndex = 0;
            std::string materialLabel;
            std::string meshName;
            std::vector<std::string> missingAttributes;

            std::string toString() const;
            bool operator==(const MissingRequiredVertexAttributes&) const = default;
        };

        struct UnexpectedTextureFormat
        {
            size_t entryIndex = 0;
            std::string materialLabel;
            material::ParamId param{};
            std::string nutexb;
            model::NutexbFormat format{};

            std::string toString() const;
            bool operator==(const UnexpectedTextureFormat&) const = default;
        };

        struct UnexpectedTextureDimension
        {
            size_t entryIndex = 0;
            std::string materialLabel;
            material::ParamId param{};
            std::string nutexb;
            material::TextureDimension expected{};
            material::TextureDimension actual{};

            std::string toString() const;
            bool operator==(const UnexpectedTextureDimension&) const = default;
        };

        struct MissingTexture
        {
            size_t entryIndex = 0;
            std::string materialLabel;
            material::ParamId param{};
            std::string nutexb;

            std::string toString() const;
            bool operator==(const MissingTexture&) const = default;
        };

        struct RenormalMaterialMissingMeshAdjEntry
        {
            size_t entryIndex = 0;
            std::string materialLabel;
            std::string meshName;

            std::string toString() const;
            bool operator==(const RenormalMaterialMissingMeshAdjEntry&) const = default;
        };

        struct RenormalMaterialMissingAdj
        {
            size_t entryIndex = 0;
            std::string materialLabel;

            std::string toString() const;
            bool operator==(const RenormalMaterialMissingAdj&) const = default;
        };

        std::variant<MissingRequiredVertexAttributes,
                     UnexpectedTextureFormat,
                     UnexpectedTextureDimension,
                     MissingTexture,
                     RenormalMaterialMissingMeshAdjEntry,
                     RenormalMaterialMissingAdj> error;

        // Material labels in user created files are not always unique.
        size_t entryIndex() const;
        std::string toString() const;

        bool operator==(const MatlValidationError&) const = default;
    };

    struct ModlValidationError
    {
        struct MissingMaterial
        {
            size_t entryIndex = 0;
            std::string materialLabel;

            std::string toString() const;
            bool operator==(const MissingMaterial&) const = default;
        };

        struct MissingMeshObject
        {
            size_t entryIndex = 0;
            std::string meshObjectName;
            uint64_t meshObjectSubindex = 0;

            std::string toString() const;
            bool operator==(const MissingMeshObject&) const = default;
        };

        std::variant<MissingMaterial, MissingMeshObject> error;

        size_t entryIndex() const;
        std::string toString() const;

        bool operator==(const ModlValidationError&) const = default;
    };

    struct AdjValidationError
    {
        struct InvalidMeshObjectIndex
        {
            size_t entryIndex = 0;
            size_t meshObjectIndex = 0;
            size_t meshObjectCount = 0;

            std::string toString() const;
            bool operator==(const InvalidMeshObjectIndex&) const = default;
        };

        std::variant<InvalidMeshObjectIndex> error;

        size_t entryIndex() const;
        std::string toString() const;

        bool operator==(const AdjValidationError&) const = default;
    };

    struct NutexbValidationError
    {
        struct FormatInvalidForUsage
        {
            std::string nutexb;
            model::NutexbFormat format{};
            material::ParamId param{};

            std::string toString() const;
            bool operator==(const FormatInvalidForUsage&) const = default;
        };

        std::variant<FormatInvalidForUsage> error;

        // Texture file name the error belongs to.
        const std::string& fileName() const;
        std::string toString() const;

        bool operator==(const NutexbValidationError&) const = default;
    };

    // TODO: Add a severity level to separate warnings from errors.
    struct ModelValidationErrors
    {
        std::vector<MeshValidationError> meshErrors;
        std::vector<MatlValidationError> matlErrors;
        std::vector<ModlValidationError> modlErrors;
        std::vector<AdjValidationError> adjErrors;
        std::vector<NutexbValidationError> nutexbErrors;

        bool empty() const
        {
            return meshErrors.empty() && matlErrors.empty() && modlErrors.empty() && adjErrors.empty() &&
                   nutexbErrors.empty();
        }

        size_t count() const
        {
            return meshErrors.size() + matlErrors.size() + modlErrors.size() + adjErrors.size() +
                   nutexbErrors.size();
        }
    };
}

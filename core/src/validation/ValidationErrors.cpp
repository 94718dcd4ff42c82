#include "modelcheck/validation/ValidationErrors.hpp"

#include <format>

namespace modelcheck::validation
{
    namespace
    {
        std::string join(const std::vector<std::string>& items, std::string_view separator)
        {
            std::string result;
            for (size_t i = 0; i < items.size(); ++i) {
                if (i > 0) {
                    result += separator;
                }
                result += items[i];
            }
            return result;
        }

        const char* srgbExpectation(material::ParamId param)
        {
            return material::expectsSrgb(param) ? "expects" : "does not expect";
        }
    }

    std::string MeshValidationError::MissingRequiredVertexAttributes::toString() const
    {
        return std::format("Mesh \"{}\" is missing attributes {} required by assigned material \"{}\".",
                           meshName, join(missingAttributes, ", "), materialLabel);
    }

    std::string MeshValidationError::DuplicateSubindex::toString() const
    {
        return std::format("Mesh \"{}\" repeats subindex {}. Subindices must be unique.", meshName, subindex);
    }

    size_t MeshValidationError::meshObjectIndex() const
    {
        return std::visit([](const auto& e) { return e.meshObjectIndex; }, error);
    }

    std::string MeshValidationError::toString() const
    {
        return std::visit([](const auto& e) { return e.toString(); }, error);
    }

    std::string MatlValidationError::MissingRequiredVertexAttributes::toString() const
    {
        return std::format("Mesh \"{}\" is missing attributes {} required by assigned material \"{}\".",
                           meshName, join(missingAttributes, ", "), materialLabel);
    }

    std::string MatlValidationError::UnexpectedTextureFormat::toString() const
    {
        return std::format("Texture \"{}\" for material \"{}\" has format {}, but {} {} an sRGB format.",
                           nutexb, materialLabel, model::toString(format), material::toString(param),
                           srgbExpectation(param));
    }

    std::string MatlValidationError::UnexpectedTextureDimension::toString() const
    {
        return std::format("Texture \"{}\" for material \"{}\" has dimensions {}, but {} requires {}.",
                           nutexb, materialLabel, material::toString(actual), material::toString(param),
                           material::toString(expected));
    }

    std::string MatlValidationError::MissingTexture::toString() const
    {
        return std::format("Texture \"{}\" assigned to param {} for material \"{}\" is missing.",
                           nutexb, material::toString(param), materialLabel);
    }

    std::string MatlValidationError::RenormalMaterialMissingMeshAdjEntry::toString() const
    {
        return std::format(
            "Mesh \"{}\" has the RENORMAL material \"{}\" but no corresponding entry in the model.adjb.",
            meshName, materialLabel);
    }

    std::string MatlValidationError::RenormalMaterialMissingAdj::toString() const
    {
        return std::format("Material \"{}\" is a RENORMAL material, but the model.adjb file is missing.",
                           materialLabel);
    }

    size_t MatlValidationError::entryIndex() const
    {
        return std::visit([](const auto& e) { return e.entryIndex; }, error);
    }

    std::string MatlValidationError::toString() const
    {
        return std::visit([](const auto& e) { return e.toString(); }, error);
    }

    std::string ModlValidationError::MissingMaterial::toString() const
    {
        return std::format("Entry {} is assigned to material \"{}\", but the model.numatb has no such material.",
                           entryIndex, materialLabel);
    }

    std::string ModlValidationError::MissingMeshObject::toString() const
    {
        return std::format("Entry {} is assigned to mesh \"{}\" subindex {}, but the model.numshb has no such mesh.",
                           entryIndex, meshObjectName, meshObjectSubindex);
    }

    size_t ModlValidationError::entryIndex() const
    {
        return std::visit([](const auto& e) { return e.entryIndex; }, error);
    }

    std::string ModlValidationError::toString() const
    {
        return std::visit([](const auto& e) { return e.toString(); }, error);
    }

    std::string AdjValidationError::InvalidMeshObjectIndex::toString() const
    {
        return std::format("Entry {} has mesh object index {}, but the model.numshb only has {} mesh objects.",
                           entryIndex, meshObjectIndex, meshObjectCount);
    }

    size_t AdjValidationError::entryIndex() const
    {
        return std::visit([](const auto& e) { return e.entryIndex; }, error);
    }

    std::string AdjValidationError::toString() const
    {
        return std::visit([](const auto& e) { return e.toString(); }, error);
    }

    std::string NutexbValidationError::FormatInvalidForUsage::toString() const
    {
        return std::format("Texture \"{}\" has format {}, but {} {} an sRGB format.",
                           nutexb, model::toString(format), material::toString(param), srgbExpectation(param));
    }

    const std::string& NutexbValidationError::fileName() const
    {
        return std::visit([](const auto& e) -> const std::string& { return e.nutexb; }, error);
    }

    std::string NutexbValidationError::toString() const
    {
        return std::visit([](const auto& e) { return e.toString(); }, error);
    }
}

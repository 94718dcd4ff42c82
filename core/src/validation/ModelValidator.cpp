#include "modelcheck/validation/ModelValidator.hpp"
#include "modelcheck/core/logger.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <utility>
#include <vector>

namespace modelcheck::validation
{
    namespace
    {
        constexpr std::string_view kRenormalTag = "RENORMAL";

        // Mesh objects by (name, subindex). Rebuilt for every validation pass.
        class MeshObjectIndex
        {
        public:
            explicit MeshObjectIndex(const model::MeshData* mesh)
            {
                if (mesh == nullptr) {
                    return;
                }
                for (size_t i = 0; i < mesh->objects.size(); ++i) {
                    const auto& o = mesh->objects[i];
                    m_objects[{o.name, o.subindex}].push_back(i);
                }
            }

            // All objects with the name and subindex in mesh order.
            std::span<const size_t> find(std::string_view name, uint64_t subindex) const
            {
                const auto it = m_objects.find({name, subindex});
                if (it == m_objects.end()) {
                    return {};
                }
                return it->second;
            }

        private:
            std::map<std::pair<std::string_view, uint64_t>, std::vector<size_t>> m_objects;
        };

        // Mesh object indices assigned to a material through the modl, in mesh order.
        std::set<size_t> assignedMeshObjects(const model::ModlData& modl, const MeshObjectIndex& index,
                                             std::string_view materialLabel)
        {
            std::set<size_t> assigned;
            for (const auto& e : modl.entries) {
                if (e.materialLabel == materialLabel) {
                    const auto objects = index.find(e.meshObjectName, e.meshObjectSubindex);
                    assigned.insert(objects.begin(), objects.end());
                }
            }
            return assigned;
        }

        void validateMeshSubindices(ModelValidationErrors& validation, const model::MeshData& mesh)
        {
            // Material and vertex weight assignments require unique subindices per name.
            std::set<std::pair<std::string_view, uint64_t>> seen;
            for (size_t i = 0; i < mesh.objects.size(); ++i) {
                const auto& o = mesh.objects[i];
                if (!seen.insert({o.name, o.subindex}).second) {
                    validation.meshErrors.push_back(
                        {MeshValidationError::DuplicateSubindex{i, o.name, o.subindex}});
                }
            }
        }

        void validateRequiredAttributes(ModelValidationErrors& validation, const model::MatlData& matl,
                                        const model::ModlData* modl, const model::MeshData* mesh,
                                        const MeshObjectIndex& index, const shader::IShaderProgramLookup& shaders)
        {
            // Material assignments need both the modl and the mesh.
            if (modl == nullptr || mesh == nullptr) {
                return;
            }

            for (size_t entryIndex = 0; entryIndex < matl.entries.size(); ++entryIndex) {
                const auto& entry = matl.entries[entryIndex];

                const shader::ShaderProgram* program = shaders.findForShaderLabel(entry.shaderLabel);
                if (program == nullptr) {
                    core::Logger::Validation.debug("No shader program for {} used by {}", entry.shaderLabel,
                                                   entry.materialLabel);
                    continue;
                }

                for (const size_t i : assignedMeshObjects(*modl, index, entry.materialLabel)) {
                    const auto& o = mesh->objects[i];

                    auto missing = program->missingRequiredAttributes(o.attributeNames());
                    if (missing.empty()) {
                        continue;
                    }

                    // Fixed by changing either the shader or the mesh attributes, so both files get an error.
                    validation.matlErrors.push_back({MatlValidationError::MissingRequiredVertexAttributes{
                        entryIndex, entry.materialLabel, o.name, missing}});
                    validation.meshErrors.push_back({MeshValidationError::MissingRequiredVertexAttributes{
                        i, o.name, entry.materialLabel, std::move(missing)}});
                }
            }
        }

        void validateTextureFormatUsage(ModelValidationErrors& validation, const model::MatlData& matl,
                                        const model::ModelFolder& folder)
        {
            for (size_t entryIndex = 0; entryIndex < matl.entries.size(); ++entryIndex) {
                const auto& entry = matl.entries[entryIndex];
                for (const auto& texture : entry.textures) {
                    const auto* slot = folder.findNutexbSlot(texture.data);
                    const auto* nutexb = slot != nullptr ? slot->get() : nullptr;
                    if (nutexb == nullptr) {
                        continue;
                    }

                    const auto format = nutexb->footer.imageFormat;
                    if (material::expectsSrgb(texture.paramId) != model::isSrgb(format)) {
                        validation.matlErrors.push_back({MatlValidationError::UnexpectedTextureFormat{
                            entryIndex, entry.materialLabel, texture.paramId, slot->fileName, format}});
                        validation.nutexbErrors.push_back(
                            {NutexbValidationError::FormatInvalidForUsage{slot->fileName, format, texture.paramId}});
                    }
                }
            }
        }

        void validateTextureDimensions(ModelValidationErrors& validation, const model::MatlData& matl,
                                       const model::ModelFolder& folder)
        {
            for (size_t entryIndex = 0; entryIndex < matl.entries.size(); ++entryIndex) {
                const auto& entry = matl.entries[entryIndex];
                for (const auto& texture : entry.textures) {
                    const auto* slot = folder.findNutexbSlot(texture.data);
                    const auto* nutexb = slot != nullptr ? slot->get() : nullptr;
                    if (nutexb == nullptr) {
                        continue;
                    }

                    // Fixed by assigning a different texture, so only the matl gets an error.
                    const auto expected = material::expectedTextureDimension(texture.paramId);
                    const auto actual = model::textureDimension(*nutexb);
                    if (actual != expected) {
                        validation.matlErrors.push_back({MatlValidationError::UnexpectedTextureDimension{
                            entryIndex, entry.materialLabel, texture.paramId, slot->fileName, expected, actual}});
                    }
                }
            }
        }

        void validateTextureAssignments(ModelValidationErrors& validation, const model::MatlData& matl,
                                        const model::ModelFolder& folder,
                                        std::span<const std::string_view> defaultTextureNames)
        {
            for (size_t entryIndex = 0; entryIndex < matl.entries.size(); ++entryIndex) {
                const auto& entry = matl.entries[entryIndex];
                for (const auto& texture : entry.textures) {
                    if (folder.findNutexbSlot(texture.data) != nullptr) {
                        continue;
                    }

                    const bool isDefault = std::ranges::any_of(defaultTextureNames, [&](std::string_view name) {
                        return model::textureNameMatches(name, texture.data);
                    });
                    if (!isDefault) {
                        validation.matlErrors.push_back({MatlValidationError::MissingTexture{
                            entryIndex, entry.materialLabel, texture.paramId, texture.data}});
                    }
                }
            }
        }

        void validateRenormalMaterialEntries(ModelValidationErrors& validation, const model::MatlData& matl,
                                             const model::AdjData* adj, const model::ModlData* modl,
                                             const model::MeshData* mesh, const MeshObjectIndex& index)
        {
            for (size_t entryIndex = 0; entryIndex < matl.entries.size(); ++entryIndex) {
                const auto& entry = matl.entries[entryIndex];
                if (!entry.materialLabel.contains(kRenormalTag)) {
                    continue;
                }

                if (adj == nullptr) {
                    validation.matlErrors.push_back(
                        {MatlValidationError::RenormalMaterialMissingAdj{entryIndex, entry.materialLabel}});
                    continue;
                }

                if (modl == nullptr || mesh == nullptr) {
                    continue;
                }

                // Adjacency entries are matched by the position of each assigned
                // object among the assigned objects, not by its mesh object index.
                size_t position = 0;
                for (const auto& e : modl->entries) {
                    if (e.materialLabel != entry.materialLabel) {
                        continue;
                    }
                    const auto objects = index.find(e.meshObjectName, e.meshObjectSubindex);
                    if (objects.empty()) {
                        continue;
                    }

                    const bool hasAdjEntry = std::ranges::any_of(adj->entries, [&](const model::AdjEntryData& a) {
                        return a.meshObjectIndex == position;
                    });
                    if (!hasAdjEntry) {
                        validation.matlErrors.push_back({MatlValidationError::RenormalMaterialMissingMeshAdjEntry{
                            entryIndex, entry.materialLabel, mesh->objects[objects.front()].name}});
                    }
                    position++;
                }
            }
        }

        void validateModlReferences(ModelValidationErrors& validation, const model::MatlData& matl,
                                    const model::ModlData& modl, const model::MeshData* mesh,
                                    const MeshObjectIndex& index)
        {
            for (size_t entryIndex = 0; entryIndex < modl.entries.size(); ++entryIndex) {
                const auto& e = modl.entries[entryIndex];

                const bool hasMaterial = std::ranges::any_of(matl.entries, [&](const material::MatlEntryData& m) {
                    return m.materialLabel == e.materialLabel;
                });
                if (!hasMaterial) {
                    validation.modlErrors.push_back({ModlValidationError::MissingMaterial{entryIndex, e.materialLabel}});
                }

                if (mesh != nullptr && index.find(e.meshObjectName, e.meshObjectSubindex).empty()) {
                    validation.modlErrors.push_back({ModlValidationError::MissingMeshObject{
                        entryIndex, e.meshObjectName, e.meshObjectSubindex}});
                }
            }
        }

        void validateAdjIndices(ModelValidationErrors& validation, const model::AdjData& adj,
                                const model::MeshData& mesh)
        {
            for (size_t entryIndex = 0; entryIndex < adj.entries.size(); ++entryIndex) {
                const auto& a = adj.entries[entryIndex];
                if (a.meshObjectIndex >= mesh.objects.size()) {
                    validation.adjErrors.push_back(
                        {AdjValidationError::InvalidMeshObjectIndex{entryIndex, a.meshObjectIndex, mesh.objects.size()}});
                }
            }
        }
    }

    ModelValidationErrors validate(const model::ModelFolder& folder,
                                   const shader::IShaderProgramLookup& shaders,
                                   std::span<const std::string_view> defaultTextureNames,
                                   const ValidationOptions& options)
    {
        // Each check may add errors to more than one file.
        ModelValidationErrors validation;

        const model::MeshData* mesh = folder.findMesh();
        const model::ModlData* modl = folder.findModl();
        const model::AdjData* adj = folder.findAdj();
        const MeshObjectIndex index(mesh);

        if (mesh != nullptr && options.meshSubindices) {
            validateMeshSubindices(validation, *mesh);
        }

        if (const model::MatlData* matl = folder.findMatl()) {
            validateRequiredAttributes(validation, *matl, modl, mesh, index, shaders);
            validateTextureFormatUsage(validation, *matl, folder);

            if (options.textureDimensions) {
                validateTextureDimensions(validation, *matl, folder);
            }
            if (options.missingTextures) {
                validateTextureAssignments(validation, *matl, folder, defaultTextureNames);
            }

            validateRenormalMaterialEntries(validation, *matl, adj, modl, mesh, index);

            if (modl != nullptr && options.modlReferences) {
                validateModlReferences(validation, *matl, *modl, mesh, index);
            }
            if (adj != nullptr && mesh != nullptr && options.adjIndices) {
                validateAdjIndices(validation, *adj, *mesh);
            }
        }

        core::Logger::Validation.debug("Validated {}: {} mesh, {} matl, {} modl, {} adj, {} nutexb errors",
                                       folder.folderPath, validation.meshErrors.size(),
                                       validation.matlErrors.size(), validation.modlErrors.size(),
                                       validation.adjErrors.size(), validation.nutexbErrors.size());
        return validation;
    }
}

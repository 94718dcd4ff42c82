#pragma once

#include <span>
#include <string_view>

#include "modelcheck/material/ParamClassifier.hpp"
#include "modelcheck/model/ModelFolder.hpp"
#include "modelcheck/shader/ShaderDatabase.hpp"
#include "modelcheck/validation/ValidationErrors.hpp"

namespace modelcheck::validation
{
    // Checks beyond attributes, texture formats and RENORMAL adjacency.
    struct ValidationOptions
    {
        bool meshSubindices = true;
        bool textureDimensions = true;
        bool missingTextures = true;
        bool modlReferences = true;
        bool adjIndices = true;
    };

    // Checks the parsed files of a folder against each other and the shader database.
    // Files that failed to parse are skipped. Never fails; an empty folder gives an empty report.
    // Texture paths matching one of defaultTextureNames count as present.
    ModelValidationErrors validate(const model::ModelFolder& folder,
                                   const shader::IShaderProgramLookup& shaders,
                                   std::span<const std::string_view> defaultTextureNames,
                                   const ValidationOptions& options = {});

    inline ModelValidationErrors validate(const model::ModelFolder& folder,
                                          const shader::IShaderProgramLookup& shaders,
                                          const ValidationOptions& options = {})
    {
        return validate(folder, shaders, material::defaultTextureNames(), options);
    }
}

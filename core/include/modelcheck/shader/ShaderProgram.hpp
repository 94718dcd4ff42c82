#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>

#include "modelcheck/material/ParamId.hpp"

namespace modelcheck::shader
{
    // Requirements of one shader program from the shader database.
    struct ShaderProgram
    {
        // Entries as stored in the database, e.g. "Texture0" or "CustomVector8.xyz".
        // The channel suffix lists the vector components the shader reads.
        std::vector<std::string> materialParameters;

        // Vertex attribute names such as "map1" or "colorSet1", in declared order.
        std::vector<std::string> vertexAttributes;

        // The shader discards fragments (alpha testing).
        bool discard = false;

        // Declared parameters in declared order. Entries that do not name a
        // known ParamId are skipped and repeats are collapsed.
        std::vector<material::ParamId> parameters() const;

        bool hasParameter(material::ParamId id) const;

        // Components of a Vector4 param read by the shader.
        // All false if the param is not declared. All true if declared without channels.
        std::array<bool, 4> accessedChannels(material::ParamId id) const;

        // Required attributes not in attributeNames, in declared order.
        std::vector<std::string> missingRequiredAttributes(const std::vector<std::string>& attributeNames) const;

        bool operator==(const ShaderProgram&) const = default;
    };
}

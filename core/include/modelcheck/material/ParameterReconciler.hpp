#pragma once

#include <span>
#include <vector>

#include "modelcheck/material/MaterialData.hpp"
#include "modelcheck/material/ParamId.hpp"
#include "modelcheck/shader/ShaderProgram.hpp"

namespace modelcheck::material
{
    // Params declared by the program but stored in none of the entry's lists.
    // Follows the program's declared order.
    std::vector<ParamId> missingParameters(const MatlEntryData& entry, const shader::ShaderProgram& program);

    // Params stored by the entry that the program does not declare.
    // Follows entry order (booleans, floats, vectors, textures, samplers,
    // blend states, rasterizer states).
    std::vector<ParamId> unusedParameters(const MatlEntryData& entry, const shader::ShaderProgram& program);

    // Adds a default value for each id. Ids of kind Other and ids the entry
    // already stores are ignored. All lists are sorted afterwards.
    void addParameters(MatlEntryData& entry, std::span<const ParamId> ids);

    // Removes each id from its list. Absent and Other ids are ignored.
    // All lists are sorted afterwards.
    void removeParameters(MatlEntryData& entry, std::span<const ParamId> ids);

    // Restores the canonical order of each list, ascending by ParamId value.
    void sortParameters(MatlEntryData& entry);

    MatlEntryData defaultMaterial();

    // Replaces the entry's parameters with the preset's.
    // The material label is kept so model and animation references stay valid.
    // Texture paths are mesh specific and are kept for params the preset also has.
    MatlEntryData applyPreset(const MatlEntryData& entry, const MatlEntryData& preset);
}

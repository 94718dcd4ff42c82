#include "modelcheck/material/ParameterReconciler.hpp"
#include "modelcheck/material/ParamClassifier.hpp"
#include "modelcheck/core/common.hpp"
#include "modelcheck/core/logger.hpp"

#include <algorithm>

namespace modelcheck::material
{
    namespace
    {
        bool hasParameter(const MatlEntryData& entry, ParamId id)
        {
            bool found = false;
            entry.forEachParamId([&](ParamId stored) { found = found || stored == id; });
            return found;
        }

        template<typename T>
        void pushDefault(std::vector<MaterialParam<T>>& params, ParamId id, T data = T{})
        {
            params.push_back(MaterialParam<T>{id, std::move(data)});
        }

        // Order is restored by sortParameters() afterwards.
        template<typename T>
        void swapRemove(std::vector<MaterialParam<T>>& params, ParamId id)
        {
            const auto it = std::ranges::find(params, id, &MaterialParam<T>::paramId);
            if (it != params.end()) {
                std::iter_swap(it, params.end() - 1);
                params.pop_back();
            }
        }

        template<typename T>
        void sortByParamId(std::vector<MaterialParam<T>>& params)
        {
            const auto key = [](const MaterialParam<T>& p) { return paramValue(p.paramId); };
            std::ranges::stable_sort(params, {}, key);
            MODELCHECK_ASSERT(std::ranges::is_sorted(params, {}, key), "Material parameters are not sorted");
        }
    }

    std::vector<ParamId> missingParameters(const MatlEntryData& entry, const shader::ShaderProgram& program)
    {
        std::vector<ParamId> missing;
        for (const ParamId id : program.parameters()) {
            // Ids without a typed list can never be added.
            if (kindOf(id) != ParamKind::Other && !hasParameter(entry, id)) {
                missing.push_back(id);
            }
        }
        return missing;
    }

    std::vector<ParamId> unusedParameters(const MatlEntryData& entry, const shader::ShaderProgram& program)
    {
        const auto declared = program.parameters();

        std::vector<ParamId> unused;
        entry.forEachParamId([&](ParamId id) {
            if (kindOf(id) != ParamKind::Other && std::ranges::find(declared, id) == declared.end()) {
                unused.push_back(id);
            }
        });
        return unused;
    }

    void addParameters(MatlEntryData& entry, std::span<const ParamId> ids)
    {
        for (const ParamId id : ids) {
            if (hasParameter(entry, id)) {
                continue;
            }

            switch (kindOf(id)) {
            case ParamKind::Boolean: pushDefault(entry.booleans, id); break;
            case ParamKind::Float: pushDefault(entry.floats, id); break;
            case ParamKind::Vector4: pushDefault(entry.vectors, id, glm::vec4(0.0f)); break;
            case ParamKind::Texture: pushDefault(entry.textures, id, std::string(defaultTexture(id))); break;
            case ParamKind::Sampler: pushDefault(entry.samplers, id); break;
            case ParamKind::BlendState: pushDefault(entry.blendStates, id); break;
            case ParamKind::RasterizerState: pushDefault(entry.rasterizerStates, id); break;
            case ParamKind::Other:
                core::Logger::Material.debug("Ignoring unclassified parameter {} for {}", toString(id), entry.materialLabel);
                break;
            }
        }

        sortParameters(entry);
    }

    void removeParameters(MatlEntryData& entry, std::span<const ParamId> ids)
    {
        for (const ParamId id : ids) {
            switch (kindOf(id)) {
            case ParamKind::Boolean: swapRemove(entry.booleans, id); break;
            case ParamKind::Float: swapRemove(entry.floats, id); break;
            case ParamKind::Vector4: swapRemove(entry.vectors, id); break;
            case ParamKind::Texture: swapRemove(entry.textures, id); break;
            case ParamKind::Sampler: swapRemove(entry.samplers, id); break;
            case ParamKind::BlendState: swapRemove(entry.blendStates, id); break;
            case ParamKind::RasterizerState: swapRemove(entry.rasterizerStates, id); break;
            case ParamKind::Other: break;
            }
        }

        sortParameters(entry);
    }

    void sortParameters(MatlEntryData& entry)
    {
        sortByParamId(entry.booleans);
        sortByParamId(entry.floats);
        sortByParamId(entry.vectors);
        sortByParamId(entry.textures);
        sortByParamId(entry.samplers);
        sortByParamId(entry.blendStates);
        sortByParamId(entry.rasterizerStates);
    }

    MatlEntryData defaultMaterial()
    {
        MatlEntryData entry;
        entry.materialLabel = "NEW_MATERIAL";
        entry.shaderLabel = "SFX_PBS_0100000008008269_opaque";

        entry.blendStates = {{ParamId::BlendState0, {}}};
        entry.floats = {{ParamId::CustomFloat8, 0.4f}};
        entry.booleans = {
            {ParamId::CustomBoolean1, true},
            {ParamId::CustomBoolean3, true},
            {ParamId::CustomBoolean4, true},
        };
        entry.vectors = {
            // All zeros allows for transparency.
            {ParamId::CustomVector0, glm::vec4(0.0f)},
            {ParamId::CustomVector8, glm::vec4(1.0f)},
            {ParamId::CustomVector13, glm::vec4(1.0f)},
            {ParamId::CustomVector14, glm::vec4(1.0f)},
        };
        entry.rasterizerStates = {{ParamId::RasterizerState0, {}}};
        entry.samplers = {
            {ParamId::Sampler0, {}},
            {ParamId::Sampler4, {}},
            {ParamId::Sampler6, {}},
            {ParamId::Sampler7, {}},
        };

        for (const ParamId id : {ParamId::Texture0, ParamId::Texture4, ParamId::Texture6, ParamId::Texture7}) {
            entry.textures.push_back({id, std::string(defaultTexture(id))});
        }

        return entry;
    }

    MatlEntryData applyPreset(const MatlEntryData& entry, const MatlEntryData& preset)
    {
        MatlEntryData result = preset;
        result.materialLabel = entry.materialLabel;

        for (auto& texture : result.textures) {
            const auto it = std::ranges::find(entry.textures, texture.paramId, &TextureParam::paramId);
            texture.data = it != entry.textures.end() ? it->data : std::string(defaultTexture(texture.paramId));
        }

        return result;
    }
}

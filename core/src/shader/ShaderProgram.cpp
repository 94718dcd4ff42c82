#include "modelcheck/shader/ShaderProgram.hpp"

#include <algorithm>

namespace modelcheck::shader
{
    std::vector<material::ParamId> ShaderProgram::parameters() const
    {
        std::vector<material::ParamId> ids;
        ids.reserve(materialParameters.size());
        for (const auto& param : materialParameters) {
            const auto id = material::parseParamId(material::splitParam(param).first);
            if (id && std::ranges::find(ids, *id) == ids.end()) {
                ids.push_back(*id);
            }
        }
        return ids;
    }

    bool ShaderProgram::hasParameter(material::ParamId id) const
    {
        const std::string name = material::toString(id);
        return std::ranges::any_of(materialParameters, [&](const std::string& param) {
            return material::splitParam(param).first == name;
        });
    }

    std::array<bool, 4> ShaderProgram::accessedChannels(material::ParamId id) const
    {
        std::array<bool, 4> channels{false, false, false, false};

        const std::string name = material::toString(id);
        for (const auto& param : materialParameters) {
            const auto [paramName, components] = material::splitParam(param);
            if (paramName != name) {
                continue;
            }

            if (components.empty()) {
                return {true, true, true, true};
            }

            // The same param may be listed more than once with different channels.
            for (const char c : components) {
                switch (c) {
                case 'x': channels[0] = true; break;
                case 'y': channels[1] = true; break;
                case 'z': channels[2] = true; break;
                case 'w': channels[3] = true; break;
                default: break;
                }
            }
        }
        return channels;
    }

    std::vector<std::string> ShaderProgram::missingRequiredAttributes(const std::vector<std::string>& attributeNames) const
    {
        std::vector<std::string> missing;
        for (const auto& required : vertexAttributes) {
            if (std::ranges::find(attributeNames, required) == attributeNames.end()) {
                missing.push_back(required);
            }
        }
        return missing;
    }
}

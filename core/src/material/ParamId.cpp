#include "modelcheck/material/ParamId.hpp"
#include "ParamFamilies.hpp"

#include <charconv>
#include <format>

namespace modelcheck::material
{
    std::string toString(ParamId id)
    {
        const uint64_t value = paramValue(id);
        if (value < detail::kLegacyParamNames.size()) {
            return std::string(detail::kLegacyParamNames[value]);
        }

        if (const auto* family = detail::findFamily(id)) {
            return std::format("{}{}", family->prefix, detail::indexInFamily(*family, id));
        }

        return std::format("0x{:X}", value);
    }

    core::Result<ParamId> parseParamId(std::string_view name)
    {
        for (size_t i = 0; i < detail::kLegacyParamNames.size(); ++i) {
            if (detail::kLegacyParamNames[i] == name) {
                return static_cast<ParamId>(i);
            }
        }

        // Prefixes overlap ("Texture" and "CustomVector" appear twice), so the
        // numeric suffix decides the family.
        for (const auto& family : detail::kParamFamilies) {
            if (!name.starts_with(family.prefix)) {
                continue;
            }

            const std::string_view digits = name.substr(family.prefix.size());
            if (digits.empty() || (digits.size() > 1 && digits.front() == '0')) {
                continue;
            }

            uint32_t index = 0;
            const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
            if (ec != std::errc() || ptr != digits.data() + digits.size()) {
                continue;
            }

            if (index >= family.firstIndex && index < family.firstIndex + family.count) {
                return static_cast<ParamId>(family.firstValue + (index - family.firstIndex));
            }
        }

        return core::Unexpected<std::string>(std::format("Unknown material parameter \"{}\"", name));
    }

    std::pair<std::string_view, std::string_view> splitParam(std::string_view param)
    {
        const auto dot = param.find('.');
        if (dot == std::string_view::npos) {
            return {param, {}};
        }
        return {param.substr(0, dot), param.substr(dot + 1)};
    }
}

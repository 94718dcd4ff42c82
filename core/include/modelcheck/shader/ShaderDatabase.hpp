#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

#include "modelcheck/core/result.hpp"
#include "modelcheck/shader/ShaderProgram.hpp"

namespace modelcheck::shader
{
    // Number of leading shader label characters that identify a program.
    // "SFX_PBS_0100000008008269_opaque" -> "SFX_PBS_0100000008008269"
    inline constexpr size_t kProgramKeyLength = 24;

    // Labels shorter than the key length map to an empty key.
    std::string_view programKey(std::string_view shaderLabel);

    // Read-only source of shader program requirements.
    class IShaderProgramLookup
    {
    public:
        virtual ~IShaderProgramLookup() = default;

        virtual const ShaderProgram* find(std::string_view key) const = 0;

        const ShaderProgram* findForShaderLabel(std::string_view shaderLabel) const
        {
            return find(programKey(shaderLabel));
        }
    };

    class ShaderDatabase final : public IShaderProgramLookup
    {
    public:
        ShaderDatabase() = default;

        const ShaderProgram* find(std::string_view key) const override;

        // Replaces any existing program with the same key.
        void insert(std::string key, ShaderProgram program);

        size_t size() const { return m_programs.size(); }
        bool empty() const { return m_programs.empty(); }

        // Text format, one program per line:
        //   SFX_PBS_0100000008008269|0|map1,colorSet1|Texture0,CustomVector8.xyz
        // key | discard (0 or 1) | vertex attributes | material parameters.
        // Blank lines and lines starting with '#' are ignored.
        static core::Result<ShaderDatabase> parse(std::string_view text);
        static core::Result<ShaderDatabase> loadFromFile(const std::filesystem::path& path);

    private:
        std::map<std::string, ShaderProgram, std::less<>> m_programs;
    };
}

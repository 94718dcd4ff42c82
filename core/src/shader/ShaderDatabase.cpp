#include "modelcheck/shader/ShaderDatabase.hpp"
#include "modelcheck/core/logger.hpp"

#include <format>
#include <fstream>
#include <sstream>
#include <vector>

namespace modelcheck::shader
{
    static std::string_view trim(std::string_view s)
    {
        const auto first = s.find_first_not_of(" \t\r");
        if (first == std::string_view::npos) {
            return {};
        }
        const auto last = s.find_last_not_of(" \t\r");
        return s.substr(first, last - first + 1);
    }

    static std::vector<std::string_view> splitFields(std::string_view s, char delimiter)
    {
        std::vector<std::string_view> fields;
        size_t start = 0;
        while (true) {
            const auto end = s.find(delimiter, start);
            fields.push_back(trim(s.substr(start, end - start)));
            if (end == std::string_view::npos) {
                break;
            }
            start = end + 1;
        }
        return fields;
    }

    static std::vector<std::string> splitList(std::string_view s)
    {
        std::vector<std::string> items;
        if (s.empty()) {
            return items;
        }
        for (const auto item : splitFields(s, ',')) {
            if (!item.empty()) {
                items.emplace_back(item);
            }
        }
        return items;
    }

    std::string_view programKey(std::string_view shaderLabel)
    {
        if (shaderLabel.size() < kProgramKeyLength) {
            return {};
        }
        return shaderLabel.substr(0, kProgramKeyLength);
    }

    const ShaderProgram* ShaderDatabase::find(std::string_view key) const
    {
        if (key.empty()) {
            return nullptr;
        }
        const auto it = m_programs.find(key);
        return it != m_programs.end() ? &it->second : nullptr;
    }

    void ShaderDatabase::insert(std::string key, ShaderProgram program)
    {
        m_programs.insert_or_assign(std::move(key), std::move(program));
    }

    core::Result<ShaderDatabase> ShaderDatabase::parse(std::string_view text)
    {
        ShaderDatabase database;

        size_t lineNumber = 0;
        size_t start = 0;
        while (start <= text.size()) {
            auto end = text.find('\n', start);
            if (end == std::string_view::npos) {
                end = text.size();
            }
            const std::string_view line = trim(text.substr(start, end - start));
            start = end + 1;
            lineNumber++;

            if (line.empty() || line.front() == '#') {
                continue;
            }

            const auto fields = splitFields(line, '|');
            if (fields.size() != 4) {
                return core::Unexpected<std::string>(
                    std::format("Line {}: expected 4 fields but found {}", lineNumber, fields.size()));
            }

            const std::string_view key = fields[0];
            if (key.size() != kProgramKeyLength) {
                return core::Unexpected<std::string>(
                    std::format("Line {}: program key \"{}\" must be {} characters", lineNumber, key, kProgramKeyLength));
            }

            if (fields[1] != "0" && fields[1] != "1") {
                return core::Unexpected<std::string>(
                    std::format("Line {}: discard flag must be 0 or 1 but was \"{}\"", lineNumber, fields[1]));
            }

            ShaderProgram program;
            program.discard = fields[1] == "1";
            program.vertexAttributes = splitList(fields[2]);
            program.materialParameters = splitList(fields[3]);

            for (const auto& param : program.materialParameters) {
                if (!material::parseParamId(material::splitParam(param).first)) {
                    core::Logger::Shader.debug("Line {}: unrecognized parameter {} for {}", lineNumber, param, key);
                }
            }

            database.insert(std::string(key), std::move(program));
        }

        return database;
    }

    core::Result<ShaderDatabase> ShaderDatabase::loadFromFile(const std::filesystem::path& path)
    {
        std::ifstream f(path, std::ios::binary);
        if (!f) {
            return core::Unexpected<std::string>("Failed to open shader database: " + path.string());
        }

        std::ostringstream ss;
        ss << f.rdbuf();

        auto database = parse(ss.str());
        if (!database) {
            return core::Unexpected<std::string>(path.string() + ": " + database.error());
        }

        core::Logger::Shader.info("Loaded {} shader programs from {}", database->size(), path.string());
        return database;
    }
}

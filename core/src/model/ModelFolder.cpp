#include "modelcheck/model/ModelFolder.hpp"
#include "modelcheck/core/common.hpp"

#include <algorithm>

namespace modelcheck::model {

    bool textureNameMatches(std::string_view fileName, std::string_view texturePath) {
        return util::equalsIgnoreCase(util::stripExtension(fileName), texturePath);
    }

    const FileSlot<NutexbFile>* ModelFolder::findNutexbSlot(std::string_view texturePath) const {
        const auto it = std::ranges::find_if(nutexbs, [&](const FileSlot<NutexbFile>& slot) {
            return textureNameMatches(slot.fileName, texturePath);
        });
        return it != nutexbs.end() ? &*it : nullptr;
    }

    std::string folderEditorTitle(const std::filesystem::path& folderPath, std::string_view fileName) {
        std::string title = folderPath.filename().string();
        title += '/';
        title += fileName;
        return title;
    }

    std::string folderDisplayName(const std::filesystem::path& folderPath) {
        std::vector<std::filesystem::path> components;
        for (const auto& component : folderPath.relative_path()) {
            if (!component.empty()) {
                components.push_back(component);
            }
        }

        const size_t count = std::min<size_t>(components.size(), 4);
        std::filesystem::path result;
        for (size_t i = components.size() - count; i < components.size(); ++i) {
            result /= components[i];
        }
        return result.generic_string();
    }

}

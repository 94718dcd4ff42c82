#include "modelcheck/model/ModelFolderState.hpp"
#include "modelcheck/core/logger.hpp"

#include <algorithm>
#include <filesystem>

namespace modelcheck::model {

    FileChanged FileChanged::fromModel(const ModelFolder& model) {
        FileChanged changed;
        changed.meshes.assign(model.meshes.size(), false);
        changed.meshexes.assign(model.meshexes.size(), false);
        changed.skels.assign(model.skels.size(), false);
        changed.matls.assign(model.matls.size(), false);
        changed.modls.assign(model.modls.size(), false);
        changed.adjs.assign(model.adjs.size(), false);
        changed.anims.assign(model.anims.size(), false);
        changed.hlpbs.assign(model.hlpbs.size(), false);
        changed.nutexbs.assign(model.nutexbs.size(), false);
        return changed;
    }

    std::vector<bool>& FileChanged::flags(FileKind kind) {
        switch (kind) {
            case FileKind::Mesh: return meshes;
            case FileKind::MeshEx: return meshexes;
            case FileKind::Skel: return skels;
            case FileKind::Matl: return matls;
            case FileKind::Modl: return modls;
            case FileKind::Adj: return adjs;
            case FileKind::Anim: return anims;
            case FileKind::Hlpb: return hlpbs;
            case FileKind::Nutexb: return nutexbs;
        }
        return meshes;
    }

    const std::vector<bool>& FileChanged::flags(FileKind kind) const {
        return const_cast<FileChanged*>(this)->flags(kind);
    }

    bool FileChanged::any() const {
        for (const auto* v : {&meshes, &meshexes, &skels, &matls, &modls, &adjs, &anims, &hlpbs, &nutexbs}) {
            if (std::ranges::find(*v, true) != v->end()) {
                return true;
            }
        }
        return false;
    }

    ModelFolderState::ModelFolderState(ModelFolder model, bool hasSwingPrc)
        : m_model(std::move(model)), m_changed(FileChanged::fromModel(m_model)), m_hasSwingPrc(hasSwingPrc) {}

    void ModelFolderState::validate(const shader::IShaderProgramLookup& shaders,
                                    const validation::ValidationOptions& options) {
        m_validation = validation::validate(m_model, shaders, options);
    }

    bool ModelFolderState::isModelFolder() const {
        return !m_model.meshes.empty() || !m_model.modls.empty() || !m_model.skels.empty() ||
               !m_model.matls.empty();
    }

    void ModelFolderState::markChanged(FileKind kind, size_t index) {
        auto& flags = m_changed.flags(kind);
        if (index < flags.size()) {
            flags[index] = true;
        }
    }

    void ModelFolderState::clearChanged(FileKind kind, size_t index) {
        auto& flags = m_changed.flags(kind);
        if (index < flags.size()) {
            flags[index] = false;
        }
    }

    void ModelFolderState::reload(ModelFolder model) {
        m_model = std::move(model);
        m_changed = FileChanged::fromModel(m_model);
        core::Logger::Folder.debug("Reloaded {}", m_model.folderPath);
    }

    // A trailing separator yields an empty last component, which is skipped.
    static std::vector<std::filesystem::path> pathComponents(const std::filesystem::path& path) {
        std::vector<std::filesystem::path> components;
        for (const auto& component : path) {
            if (!component.empty()) {
                components.push_back(component);
            }
        }
        return components;
    }

    static size_t pathAffinity(const std::filesystem::path& a, const std::filesystem::path& b) {
        const auto componentsA = pathComponents(a);
        const auto componentsB = pathComponents(b);

        size_t count = 0;
        auto itA = componentsA.rbegin();
        auto itB = componentsB.rbegin();
        while (itA != componentsA.rend() && itB != componentsB.rend() && *itA == *itB) {
            ++count;
            ++itA;
            ++itB;
        }
        return count;
    }

    std::vector<std::pair<size_t, const ModelFolderState*>> findFoldersByPathAffinity(
        const ModelFolderState& target, const std::vector<ModelFolderState>& folders,
        const FolderPredicate& predicate) {
        const std::filesystem::path targetPath(target.model().folderPath);

        std::vector<std::pair<size_t, size_t>> scored;
        for (size_t i = 0; i < folders.size(); ++i) {
            if (predicate(folders[i])) {
                scored.emplace_back(i, pathAffinity(targetPath, folders[i].model().folderPath));
            }
        }

        std::ranges::stable_sort(scored, {}, &std::pair<size_t, size_t>::second);

        std::vector<std::pair<size_t, const ModelFolderState*>> result;
        result.reserve(scored.size());
        for (const auto& [index, score] : scored) {
            result.emplace_back(index, &folders[index]);
        }
        return result;
    }

    std::vector<std::pair<size_t, const ModelFolderState*>> findAnimFolders(
        const ModelFolderState& target, const std::vector<ModelFolderState>& folders) {
        return findFoldersByPathAffinity(target, folders,
                                         [](const ModelFolderState& f) { return !f.model().anims.empty(); });
    }

    std::vector<std::pair<size_t, const ModelFolderState*>> findSwingFolders(
        const ModelFolderState& target, const std::vector<ModelFolderState>& folders) {
        return findFoldersByPathAffinity(target, folders,
                                         [](const ModelFolderState& f) { return f.hasSwingPrc(); });
    }

}

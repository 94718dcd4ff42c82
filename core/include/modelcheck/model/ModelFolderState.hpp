#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

#include "modelcheck/model/ModelFolder.hpp"
#include "modelcheck/shader/ShaderDatabase.hpp"
#include "modelcheck/validation/ModelValidator.hpp"

namespace modelcheck::model {

    enum class FileKind : uint8_t {
        Mesh,
        MeshEx,
        Skel,
        Matl,
        Modl,
        Adj,
        Anim,
        Hlpb,
        Nutexb
    };

    // Unsaved edits, one flag per file slot.
    struct FileChanged {
        std::vector<bool> meshes;
        std::vector<bool> meshexes;
        std::vector<bool> skels;
        std::vector<bool> matls;
        std::vector<bool> modls;
        std::vector<bool> adjs;
        std::vector<bool> anims;
        std::vector<bool> hlpbs;
        std::vector<bool> nutexbs;

        static FileChanged fromModel(const ModelFolder& model);

        std::vector<bool>& flags(FileKind kind);
        const std::vector<bool>& flags(FileKind kind) const;

        bool any() const;
    };

    // A loaded folder together with its latest validation report.
    class ModelFolderState {
    public:
        explicit ModelFolderState(ModelFolder model, bool hasSwingPrc = false);

        const ModelFolder& model() const { return m_model; }

        // Slots may be replaced on save or reload. Call validate() afterwards.
        ModelFolder& model() { return m_model; }

        const validation::ModelValidationErrors& validation() const { return m_validation; }
        const FileChanged& changed() const { return m_changed; }

        bool hasSwingPrc() const { return m_hasSwingPrc; }
        void setHasSwingPrc(bool value) { m_hasSwingPrc = value; }

        // Replaces the report with a fresh one.
        void validate(const shader::IShaderProgramLookup& shaders,
                      const validation::ValidationOptions& options = {});

        // Contains any of the files used for mesh rendering.
        bool isModelFolder() const;

        // Out of range indices are ignored.
        void markChanged(FileKind kind, size_t index);
        void clearChanged(FileKind kind, size_t index);

        // Replaces the folder contents, for example after reading the files again.
        void reload(ModelFolder model);

    private:
        ModelFolder m_model;
        validation::ModelValidationErrors m_validation;
        FileChanged m_changed;
        bool m_hasSwingPrc = false;
    };

    using FolderPredicate = std::function<bool(const ModelFolderState&)>;

    // Folders matching the predicate with their input index, sorted by increasing
    // affinity with the target so the best match is last. The affinity is the
    // number of equal trailing path components:
    // "/mario/model/body/c00" scores 2 against "/mario/motion/body/c00"
    // and 1 against "/mario/motion/pump/c00". Ties keep input order.
    std::vector<std::pair<size_t, const ModelFolderState*>> findFoldersByPathAffinity(
        const ModelFolderState& target, const std::vector<ModelFolderState>& folders,
        const FolderPredicate& predicate);

    // Folders with at least one animation.
    std::vector<std::pair<size_t, const ModelFolderState*>> findAnimFolders(
        const ModelFolderState& target, const std::vector<ModelFolderState>& folders);

    // Folders with a swing.prc physics file.
    std::vector<std::pair<size_t, const ModelFolderState*>> findSwingFolders(
        const ModelFolderState& target, const std::vector<ModelFolderState>& folders);

}

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "modelcheck/core/result.hpp"
#include "modelcheck/model/FileData.hpp"

namespace modelcheck::model {

    // Parse errors are opaque messages from the file readers.
    template <typename T>
    using FileResult = core::Result<T>;

    template <typename T>
    struct FileSlot {
        std::string fileName;
        FileResult<T> file;

        const T* get() const { return file ? &*file : nullptr; }
    };

    inline constexpr std::string_view kMeshFileName = "model.numshb";
    inline constexpr std::string_view kSkelFileName = "model.nusktb";
    inline constexpr std::string_view kMatlFileName = "model.numatb";
    inline constexpr std::string_view kModlFileName = "model.numdlb";
    inline constexpr std::string_view kAdjFileName = "model.adjb";
    inline constexpr std::string_view kMeshExFileName = "model.numshexb";

    // Files of one folder. Every file found occupies a slot even if it failed to parse.
    struct ModelFolder {
        std::string folderPath;

        std::vector<FileSlot<MeshData>> meshes;
        std::vector<FileSlot<SkelData>> skels;
        std::vector<FileSlot<MatlData>> matls;
        std::vector<FileSlot<ModlData>> modls;
        std::vector<FileSlot<AdjData>> adjs;
        std::vector<FileSlot<AnimData>> anims;
        std::vector<FileSlot<HlpbData>> hlpbs;
        std::vector<FileSlot<MeshExData>> meshexes;
        std::vector<FileSlot<NutexbFile>> nutexbs;

        // The successfully parsed file with the well known name or null.
        const MeshData* findMesh() const { return findFile(meshes, kMeshFileName); }
        const SkelData* findSkel() const { return findFile(skels, kSkelFileName); }
        const MatlData* findMatl() const { return findFile(matls, kMatlFileName); }
        const ModlData* findModl() const { return findFile(modls, kModlFileName); }
        const AdjData* findAdj() const { return findFile(adjs, kAdjFileName); }
        const MeshExData* findMeshEx() const { return findFile(meshexes, kMeshExFileName); }

        // First texture slot whose file name without extension matches the
        // material's texture path, ignoring ASCII case. The slot may hold a parse error.
        const FileSlot<NutexbFile>* findNutexbSlot(std::string_view texturePath) const;

    private:
        template <typename T>
        static const T* findFile(const std::vector<FileSlot<T>>& slots, std::string_view fileName) {
            for (const auto& slot : slots) {
                if (slot.fileName == fileName) {
                    return slot.get();
                }
            }
            return nullptr;
        }
    };

    // Name matching used for textures. "Def_Col.nutexb" matches "def_col".
    bool textureNameMatches(std::string_view fileName, std::string_view texturePath);

    // fighter/mario/motion/body/c00 + model.numatb -> c00/model.numatb
    std::string folderEditorTitle(const std::filesystem::path& folderPath, std::string_view fileName);

    // Enough trailing components to tell folders apart.
    // fighter/mario/motion/body/c00 -> mario/motion/body/c00
    std::string folderDisplayName(const std::filesystem::path& folderPath);

}

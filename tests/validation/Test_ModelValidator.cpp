#include <doctest/doctest.h>
#include "modelcheck/validation/ModelValidator.hpp"

#include <utility>

using namespace modelcheck;
using namespace modelcheck::validation;
using material::MatlEntryData;
using material::ParamId;
using model::ModelFolder;

namespace {
    constexpr std::string_view kShaderLabel = "SFX_PBS_010002000800824f_opaque";

    shader::ShaderDatabase shaderDatabase() {
        shader::ShaderDatabase database;
        shader::ShaderProgram program;
        program.vertexAttributes = {"map1", "uvSet"};
        program.materialParameters = {"Texture0", "CustomVector8"};
        database.insert("SFX_PBS_010002000800824f", std::move(program));
        return database;
    }

    MatlEntryData matlEntry(std::string label, std::string shaderLabel = std::string(kShaderLabel)) {
        MatlEntryData entry;
        entry.materialLabel = std::move(label);
        entry.shaderLabel = std::move(shaderLabel);
        return entry;
    }

    model::MeshObjectData meshObject(std::string name, uint64_t subindex = 0) {
        model::MeshObjectData o;
        o.name = std::move(name);
        o.subindex = subindex;
        return o;
    }

    model::ModlEntryData modlEntry(std::string meshName, uint64_t subindex, std::string materialLabel) {
        return {std::move(meshName), subindex, std::move(materialLabel)};
    }

    model::NutexbFile nutexb(model::NutexbFormat format, uint32_t layerCount = 1, uint32_t depth = 1) {
        model::NutexbFile file;
        file.footer.imageFormat = format;
        file.footer.layerCount = layerCount;
        file.footer.depth = depth;
        return file;
    }

    ModelFolder folder(std::vector<MatlEntryData> entries) {
        ModelFolder f;
        f.folderPath = "/fighter/mario/model/body/c00";
        f.matls.push_back({"model.numatb", model::MatlData{1, 6, std::move(entries)}});
        return f;
    }
}

TEST_CASE("Validation of empty folders") {
    const auto shaders = shaderDatabase();

    SUBCASE("No files") {
        CHECK(validate(ModelFolder{}, shaders).empty());
    }

    SUBCASE("Files that failed to parse are ignored") {
        ModelFolder f;
        f.meshes.push_back({"model.numshb", core::Unexpected<std::string>("error")});
        f.matls.push_back({"model.numatb", core::Unexpected<std::string>("error")});
        f.modls.push_back({"model.numdlb", core::Unexpected<std::string>("error")});
        f.adjs.push_back({"model.adjb", core::Unexpected<std::string>("error")});
        f.nutexbs.push_back({"a.nutexb", core::Unexpected<std::string>("error")});
        CHECK(validate(f, shaders).empty());
    }

    SUBCASE("Empty files") {
        ModelFolder f = folder({});
        f.meshes.push_back({"model.numshb", model::MeshData{}});
        f.modls.push_back({"model.numdlb", model::ModlData{}});
        f.adjs.push_back({"model.adjb", model::AdjData{}});
        CHECK(validate(f, shaders).empty());
    }
}

TEST_CASE("Required vertex attributes") {
    const auto shaders = shaderDatabase();

    ModelFolder f = folder({matlEntry("b"), matlEntry("a")});
    model::MeshData mesh;
    mesh.objects.push_back(meshObject("object0"));
    mesh.objects.push_back(meshObject("object1"));
    f.meshes.push_back({"model.numshb", mesh});
    f.modls.push_back({"model.numdlb", model::ModlData{"model", "model.nusktb", {"model.numatb"},
                                                       {modlEntry("object1", 0, "a")}}});

    SUBCASE("Missing attributes are reported for the mesh and the material") {
        const auto validation = validate(f, shaders);

        REQUIRE(validation.matlErrors.size() == 1);
        CHECK(validation.matlErrors[0] ==
              MatlValidationError{MatlValidationError::MissingRequiredVertexAttributes{
                  1, "a", "object1", {"map1", "uvSet"}}});
        CHECK(validation.matlErrors[0].toString() ==
              "Mesh \"object1\" is missing attributes map1, uvSet required by assigned material \"a\".");

        REQUIRE(validation.meshErrors.size() == 1);
        CHECK(validation.meshErrors[0] ==
              MeshValidationError{MeshValidationError::MissingRequiredVertexAttributes{
                  1, "object1", "a", {"map1", "uvSet"}}});
        CHECK(validation.meshErrors[0].meshObjectIndex() == 1);

        CHECK(validation.modlErrors.empty());
        CHECK(validation.adjErrors.empty());
        CHECK(validation.nutexbErrors.empty());
    }

    SUBCASE("Color sets count as attributes") {
        auto& object = f.meshes[0].file->objects[1];
        object.textureCoordinates.push_back({"map1"});
        object.colorSets.push_back({"uvSet"});
        CHECK(validate(f, shaders).empty());
    }

    SUBCASE("Unknown shaders are skipped") {
        f.matls[0].file->entries[1].shaderLabel = "SFX_PBS_0000000000000000_opaque";
        CHECK(validate(f, shaders).empty());

        f.matls[0].file->entries[1].shaderLabel = "short";
        CHECK(validate(f, shaders).empty());
    }

    SUBCASE("The modl is required") {
        f.modls.clear();
        CHECK(validate(f, shaders).empty());
    }
}

TEST_CASE("Texture format usage") {
    const auto shaders = shaderDatabase();

    SUBCASE("Linear param with an sRGB texture") {
        auto entry = matlEntry("a");
        entry.textures.push_back({ParamId::Texture4, "texture_nor"});
        ModelFolder f = folder({entry});
        f.nutexbs.push_back({"texture_nor.nutexb", nutexb(model::NutexbFormat::BC1Srgb)});

        const auto validation = validate(f, shaders);
        REQUIRE(validation.matlErrors.size() == 1);
        CHECK(validation.matlErrors[0] ==
              MatlValidationError{MatlValidationError::UnexpectedTextureFormat{
                  0, "a", ParamId::Texture4, "texture_nor.nutexb", model::NutexbFormat::BC1Srgb}});
        CHECK(validation.matlErrors[0].toString() ==
              "Texture \"texture_nor.nutexb\" for material \"a\" has format BC1Srgb, but Texture4 does not expect an sRGB format.");

        REQUIRE(validation.nutexbErrors.size() == 1);
        CHECK(validation.nutexbErrors[0].fileName() == "texture_nor.nutexb");
        CHECK(validation.nutexbErrors[0].toString() ==
              "Texture \"texture_nor.nutexb\" has format BC1Srgb, but Texture4 does not expect an sRGB format.");
    }

    SUBCASE("sRGB param with a linear texture") {
        auto entry = matlEntry("a");
        entry.textures.push_back({ParamId::Texture0, "Texture0"});
        ModelFolder f = folder({entry});
        f.nutexbs.push_back({"texture0.nutexb", nutexb(model::NutexbFormat::BC1Unorm)});

        const auto validation = validate(f, shaders);
        REQUIRE(validation.matlErrors.size() == 1);
        CHECK(validation.matlErrors[0].toString() ==
              "Texture \"texture0.nutexb\" for material \"a\" has format BC1Unorm, but Texture0 expects an sRGB format.");
        REQUIRE(validation.nutexbErrors.size() == 1);
        CHECK(validation.nutexbErrors[0].toString() ==
              "Texture \"texture0.nutexb\" has format BC1Unorm, but Texture0 expects an sRGB format.");
    }

    SUBCASE("Matching formats") {
        auto entry = matlEntry("a");
        entry.textures.push_back({ParamId::Texture0, "col"});
        entry.textures.push_back({ParamId::Texture6, "prm"});
        ModelFolder f = folder({entry});
        f.nutexbs.push_back({"col.nutexb", nutexb(model::NutexbFormat::BC7Srgb)});
        f.nutexbs.push_back({"prm.nutexb", nutexb(model::NutexbFormat::BC7Unorm)});
        CHECK(validate(f, shaders).empty());
    }
}

TEST_CASE("Texture dimensions and assignments") {
    const auto shaders = shaderDatabase();

    auto entry = matlEntry("a");
    entry.textures.push_back({ParamId::Texture0, "texture0"});
    entry.textures.push_back({ParamId::Texture7, "#replace_cubemap"});
    entry.textures.push_back({ParamId::Texture8, "cube"});
    entry.textures.push_back({ParamId::Texture5, "missing"});
    ModelFolder f = folder({entry});
    f.nutexbs.push_back({"texture0.nutexb", nutexb(model::NutexbFormat::BC1Srgb, 6)});
    f.nutexbs.push_back({"cube.nutexb", nutexb(model::NutexbFormat::BC1Srgb, 6)});

    SUBCASE("Wrong dimensions and missing textures") {
        const auto validation = validate(f, shaders);
        REQUIRE(validation.matlErrors.size() == 2);
        CHECK(validation.matlErrors[0].toString() ==
              "Texture \"texture0.nutexb\" for material \"a\" has dimensions TextureCube, but Texture0 requires Texture2d.");
        CHECK(validation.matlErrors[1].toString() ==
              "Texture \"missing\" assigned to param Texture5 for material \"a\" is missing.");
        CHECK(validation.matlErrors[1].entryIndex() == 0);
    }

    SUBCASE("Checks can be disabled") {
        ValidationOptions options;
        options.textureDimensions = false;
        options.missingTextures = false;
        CHECK(validate(f, shaders, options).empty());
        CHECK_FALSE(validate(f, shaders).empty());
    }

    SUBCASE("Custom default texture names") {
        const std::vector<std::string_view> defaults{"missing.nutexb", "#replace_cubemap"};
        const auto validation = validate(f, shaders, defaults);
        REQUIRE(validation.matlErrors.size() == 1);
        CHECK(std::holds_alternative<MatlValidationError::UnexpectedTextureDimension>(validation.matlErrors[0].error));
    }

    SUBCASE("3d textures") {
        f.nutexbs[0].file = nutexb(model::NutexbFormat::BC1Srgb, 1, 4);
        const auto validation = validate(f, shaders);
        REQUIRE(validation.matlErrors.size() == 2);
        CHECK(validation.matlErrors[0] ==
              MatlValidationError{MatlValidationError::UnexpectedTextureDimension{
                  0, "a", ParamId::Texture0, "texture0.nutexb", material::TextureDimension::Texture2d,
                  material::TextureDimension::Texture3d}});
    }
}

TEST_CASE("RENORMAL materials") {
    const auto shaders = shaderDatabase();

    auto object = meshObject("object1");
    object.textureCoordinates.push_back({"map1"});
    object.textureCoordinates.push_back({"uvSet"});

    ModelFolder f = folder({matlEntry("a"), matlEntry("a_RENORMAL")});
    model::MeshData mesh;
    mesh.objects.push_back(meshObject("object0"));
    mesh.objects.push_back(object);
    f.meshes.push_back({"model.numshb", mesh});
    f.modls.push_back({"model.numdlb", model::ModlData{"model", "model.nusktb", {"model.numatb"},
                                                       {modlEntry("object0", 0, "a"),
                                                        modlEntry("object1", 0, "a_RENORMAL")}}});

    SUBCASE("Missing adjb") {
        // object0 is not RENORMAL but lacks attributes required by the shader.
        f.meshes[0].file->objects[0] = object;
        f.meshes[0].file->objects[0].name = "object0";

        const auto validation = validate(f, shaders);
        REQUIRE(validation.matlErrors.size() == 1);
        CHECK(validation.matlErrors[0] ==
              MatlValidationError{MatlValidationError::RenormalMaterialMissingAdj{1, "a_RENORMAL"}});
        CHECK(validation.matlErrors[0].toString() ==
              "Material \"a_RENORMAL\" is a RENORMAL material, but the model.adjb file is missing.");
    }

    SUBCASE("Missing adjb entry") {
        f.meshes[0].file->objects[0] = object;
        f.meshes[0].file->objects[0].name = "object0";
        f.adjs.push_back({"model.adjb", model::AdjData{{{1, {}}}}});

        const auto validation = validate(f, shaders);
        REQUIRE(validation.matlErrors.size() == 1);
        CHECK(validation.matlErrors[0] ==
              MatlValidationError{MatlValidationError::RenormalMaterialMissingMeshAdjEntry{
                  1, "a_RENORMAL", "object1"}});
        CHECK(validation.matlErrors[0].toString() ==
              "Mesh \"object1\" has the RENORMAL material \"a_RENORMAL\" but no corresponding entry in the model.adjb.");
    }

    SUBCASE("Adjb entries match the position among assigned objects") {
        f.meshes[0].file->objects[0] = object;
        f.meshes[0].file->objects[0].name = "object0";
        f.adjs.push_back({"model.adjb", model::AdjData{{{0, {}}}}});
        CHECK(validate(f, shaders).matlErrors.empty());
    }

    SUBCASE("The label check is case sensitive") {
        f.matls[0].file->entries[1].materialLabel = "a_renormal";
        f.modls[0].file->entries[1].materialLabel = "a_renormal";

        const auto validation = validate(f, shaders);
        for (const auto& error : validation.matlErrors) {
            CHECK_FALSE(std::holds_alternative<MatlValidationError::RenormalMaterialMissingAdj>(error.error));
        }
    }
}

TEST_CASE("Mesh subindices") {
    const auto shaders = shaderDatabase();

    ModelFolder f;
    model::MeshData mesh;
    mesh.objects.push_back(meshObject("a", 0));
    mesh.objects.push_back(meshObject("a", 1));
    mesh.objects.push_back(meshObject("b", 0));
    mesh.objects.push_back(meshObject("a", 0));
    f.meshes.push_back({"model.numshb", mesh});

    SUBCASE("Repeated subindices") {
        const auto validation = validate(f, shaders);
        REQUIRE(validation.meshErrors.size() == 1);
        CHECK(validation.meshErrors[0] ==
              MeshValidationError{MeshValidationError::DuplicateSubindex{3, "a", 0}});
        CHECK(validation.meshErrors[0].toString() == "Mesh \"a\" repeats subindex 0. Subindices must be unique.");
    }

    SUBCASE("Disabled") {
        ValidationOptions options;
        options.meshSubindices = false;
        CHECK(validate(f, shaders, options).empty());
    }
}

TEST_CASE("Modl and adjb references") {
    const auto shaders = shaderDatabase();

    auto object = meshObject("object0");
    object.textureCoordinates.push_back({"map1"});
    object.colorSets.push_back({"uvSet"});

    ModelFolder f = folder({matlEntry("a")});
    model::MeshData mesh;
    mesh.objects.push_back(object);
    f.meshes.push_back({"model.numshb", mesh});
    f.modls.push_back({"model.numdlb", model::ModlData{"model", "model.nusktb", {"model.numatb"},
                                                       {modlEntry("object0", 0, "a"),
                                                        modlEntry("object0", 0, "b"),
                                                        modlEntry("object0", 1, "a")}}});
    f.adjs.push_back({"model.adjb", model::AdjData{{{0, {}}, {3, {}}}}});

    SUBCASE("Dangling references") {
        const auto validation = validate(f, shaders);

        REQUIRE(validation.modlErrors.size() == 2);
        CHECK(validation.modlErrors[0] == ModlValidationError{ModlValidationError::MissingMaterial{1, "b"}});
        CHECK(validation.modlErrors[1] ==
              ModlValidationError{ModlValidationError::MissingMeshObject{2, "object0", 1}});
        CHECK(validation.modlErrors[1].entryIndex() == 2);

        REQUIRE(validation.adjErrors.size() == 1);
        CHECK(validation.adjErrors[0] == AdjValidationError{AdjValidationError::InvalidMeshObjectIndex{1, 3, 1}});
        CHECK(validation.adjErrors[0].toString() ==
              "Entry 1 has mesh object index 3, but the model.numshb only has 1 mesh objects.");

        CHECK(validation.matlErrors.empty());
        CHECK(validation.meshErrors.empty());
        CHECK(validation.count() == 3);
    }

    SUBCASE("Disabled") {
        ValidationOptions options;
        options.modlReferences = false;
        options.adjIndices = false;
        CHECK(validate(f, shaders, options).empty());
    }
}

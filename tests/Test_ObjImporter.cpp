#include <gtest/gtest.h>
#include <cmath>
#include <string_view>

#include <glm/glm.hpp>

import Core;
import Graphics;

namespace
{
    constexpr std::string_view kQuad = R"(
# quad with normals and uvs
mtllib quad.mtl
v 0 0 0
v 1 0 0
v 1 1 0
v 0 1 0
vt 0 0
vt 1 0
vt 1 1
vt 0 1
vn 0 0 1
usemtl Painted
f 1/1/1 2/2/1 3/3/1 4/4/1
)";
}

TEST(ObjImporter, QuadIsFannedIntoTwoTriangles)
{
    auto model = Graphics::ParseObj(kQuad);
    ASSERT_TRUE(model.has_value());
    ASSERT_EQ(model->Meshes.size(), 1u);

    const auto& mesh = model->Meshes[0];
    EXPECT_EQ(mesh.Vertices.size(), 4u);
    EXPECT_EQ(mesh.Indices, (std::vector<uint32_t>{0, 1, 2, 0, 2, 3}));
    EXPECT_TRUE(model->HadNormals);
    EXPECT_EQ(model->MaterialLibraries, (std::vector<std::string>{"quad.mtl"}));
    EXPECT_EQ(model->MaterialNames, (std::vector<std::string>{"Painted"}));
    EXPECT_EQ(mesh.Name, "Painted");
}

TEST(ObjImporter, TexCoordVIsFlipped)
{
    auto model = Graphics::ParseObj(kQuad);
    ASSERT_TRUE(model.has_value());
    const auto& v = model->Meshes[0].Vertices;
    EXPECT_FLOAT_EQ(v[0].TexCoord.y, 1.0f);
    EXPECT_FLOAT_EQ(v[2].TexCoord.y, 0.0f);
}

TEST(ObjImporter, TangentsAreComputed)
{
    auto model = Graphics::ParseObj(kQuad);
    ASSERT_TRUE(model.has_value());
    for (const auto& v : model->Meshes[0].Vertices)
    {
        EXPECT_GT(glm::length(v.Tangent), 0.5f);
        EXPECT_GT(glm::length(v.Bitangent), 0.5f);
    }
}

TEST(ObjImporter, FacesWithoutTexCoordsGetNormalAlignedTangents)
{
    auto model = Graphics::ParseObj("v 0 0 0\nv 1 0 0\nv 0 1 0\nf 1 2 3\n");
    ASSERT_TRUE(model.has_value());
    for (const auto& v : model->Meshes[0].Vertices)
    {
        EXPECT_NEAR(glm::length(v.Normal), 1.0f, 1e-5f);
        EXPECT_NEAR(glm::length(v.Tangent), 1.0f, 1e-5f);
        EXPECT_NEAR(glm::length(v.Bitangent), 1.0f, 1e-5f);
        EXPECT_NEAR(glm::dot(v.Tangent, v.Normal), 0.0f, 1e-5f);
        EXPECT_FALSE(std::isnan(v.Tangent.x));
    }
}

TEST(ObjImporter, SharedCornersAreDeduplicated)
{
    constexpr std::string_view text = R"(
v 0 0 0
v 1 0 0
v 1 1 0
v 0 1 0
f 1 2 3
f 1 3 4
)";
    auto model = Graphics::ParseObj(text);
    ASSERT_TRUE(model.has_value());
    EXPECT_EQ(model->Meshes[0].Vertices.size(), 4u);
    EXPECT_EQ(model->Meshes[0].Indices.size(), 6u);
}

TEST(ObjImporter, MissingNormalsAreGenerated)
{
    constexpr std::string_view text = R"(
v 0 0 0
v 1 0 0
v 0 1 0
f 1 2 3
)";
    auto model = Graphics::ParseObj(text);
    ASSERT_TRUE(model.has_value());
    EXPECT_FALSE(model->HadNormals);
    for (const auto& v : model->Meshes[0].Vertices)
    {
        EXPECT_NEAR(v.Normal.z, 1.0f, 1e-5f);
    }
}

TEST(ObjImporter, NegativeIndicesCountFromTheEnd)
{
    constexpr std::string_view text = R"(
v 0 0 0
v 1 0 0
v 0 1 0
f -3 -2 -1
)";
    auto model = Graphics::ParseObj(text);
    ASSERT_TRUE(model.has_value());
    const auto& v = model->Meshes[0].Vertices;
    ASSERT_EQ(v.size(), 3u);
    EXPECT_EQ(v[0].Position, glm::vec3(0, 0, 0));
    EXPECT_EQ(v[2].Position, glm::vec3(0, 1, 0));
}

TEST(ObjImporter, OneMeshPerMaterial)
{
    constexpr std::string_view text = R"(
v 0 0 0
v 1 0 0
v 0 1 0
v 1 1 0
f 1 2 3
usemtl Red
f 2 4 3
usemtl Blue
f 1 2 4
usemtl Red
f 1 3 4
)";
    auto model = Graphics::ParseObj(text);
    ASSERT_TRUE(model.has_value());

    // Faces before the first usemtl go to an unnamed material.
    EXPECT_EQ(model->MaterialNames, (std::vector<std::string>{"", "Red", "Blue"}));
    ASSERT_EQ(model->Meshes.size(), 3u);
    EXPECT_EQ(model->Meshes[1].Name, "Red");
    EXPECT_EQ(model->Meshes[1].Indices.size(), 6u);
    EXPECT_EQ(model->Meshes[2].MaterialIndex, 2u);
}

TEST(ObjImporter, OutOfRangeIndexIsInvalid)
{
    constexpr std::string_view text = R"(
v 0 0 0
v 1 0 0
f 1 2 3
)";
    auto model = Graphics::ParseObj(text);
    ASSERT_FALSE(model.has_value());
    EXPECT_EQ(model.error(), Graphics::AssetError::InvalidData);
}

TEST(ObjImporter, DegenerateFaceIsInvalid)
{
    constexpr std::string_view text = R"(
v 0 0 0
v 1 0 0
f 1 2
)";
    EXPECT_FALSE(Graphics::ParseObj(text).has_value());
}

TEST(ObjImporter, NoFacesIsInvalid)
{
    EXPECT_FALSE(Graphics::ParseObj("v 0 0 0\nv 1 0 0\n").has_value());
}

// -----------------------------------------------------------------------------
// MTL
// -----------------------------------------------------------------------------

TEST(MtlImporter, DiffuseAndNormalMaps)
{
    constexpr std::string_view text = R"(
newmtl Brick
Kd 1 1 1
map_Kd textures/brick_diffuse.png
map_Bump -bm 0.5 textures/brick_normal.png

newmtl Plain
Kd 0.5 0.5 0.5
)";
    auto materials = Graphics::ParseMtl(text);
    ASSERT_TRUE(materials.has_value());
    ASSERT_EQ(materials->size(), 2u);

    EXPECT_EQ((*materials)[0].Name, "Brick");
    EXPECT_EQ((*materials)[0].DiffuseTexture, "textures/brick_diffuse.png");
    EXPECT_EQ((*materials)[0].NormalTexture, "textures/brick_normal.png");

    EXPECT_EQ((*materials)[1].Name, "Plain");
    EXPECT_TRUE((*materials)[1].DiffuseTexture.empty());
    EXPECT_TRUE((*materials)[1].NormalTexture.empty());
}

TEST(MtlImporter, NormAndBumpAliases)
{
    auto a = Graphics::ParseMtl("newmtl A\nnorm n.png\n");
    auto b = Graphics::ParseMtl("newmtl B\nbump b.png\n");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ((*a)[0].NormalTexture, "n.png");
    EXPECT_EQ((*b)[0].NormalTexture, "b.png");
}

TEST(MtlImporter, EmptyLibraryIsInvalid)
{
    auto materials = Graphics::ParseMtl("# nothing here\n");
    ASSERT_FALSE(materials.has_value());
    EXPECT_EQ(materials.error(), Graphics::AssetError::InvalidData);
}

TEST(AssetError, MapsToEngineErrorCodes)
{
    EXPECT_EQ(Graphics::ToErrorCode(Graphics::AssetError::FileNotFound), Core::ErrorCode::FileNotFound);
    EXPECT_EQ(Graphics::ToErrorCode(Graphics::AssetError::UploadFailed), Core::ErrorCode::ResourceUploadFailed);
    EXPECT_EQ(Graphics::ToErrorCode(Graphics::AssetError::InvalidData), Core::ErrorCode::AssetLoadFailed);
    EXPECT_EQ(Graphics::AssetErrorToString(Graphics::AssetError::DecodeFailed), "DecodeFailed");
}

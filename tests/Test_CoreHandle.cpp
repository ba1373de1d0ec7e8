#include <gtest/gtest.h>
#include <format>
#include <memory>
#include <string>
#include <unordered_set>

import Core;

struct MeshTag {};
struct TextureTag {};

using MeshHandle = Core::StrongHandle<MeshTag>;
using TextureHandle = Core::StrongHandle<TextureTag>;

// -----------------------------------------------------------------------------
// StrongHandle
// -----------------------------------------------------------------------------

TEST(StrongHandle, DefaultConstructor_Invalid)
{
    MeshHandle h;
    EXPECT_FALSE(h.IsValid());
    EXPECT_FALSE(static_cast<bool>(h));
    EXPECT_EQ(h.Index, MeshHandle::INVALID_INDEX);
    EXPECT_EQ(h.Generation, 0u);
}

TEST(StrongHandle, ZeroIndexIsValid)
{
    MeshHandle h(0, 1);
    EXPECT_TRUE(h.IsValid());
    EXPECT_EQ(h.Index, 0u);
}

TEST(StrongHandle, EqualityUsesIndexAndGeneration)
{
    EXPECT_EQ(MeshHandle(3, 1), MeshHandle(3, 1));
    EXPECT_NE(MeshHandle(3, 1), MeshHandle(4, 1));
    EXPECT_NE(MeshHandle(3, 1), MeshHandle(3, 2));
}

TEST(StrongHandle, TagsAreDistinctTypes)
{
    static_assert(!std::is_convertible_v<MeshHandle, TextureHandle>);
    static_assert(!std::is_convertible_v<TextureHandle, MeshHandle>);
    SUCCEED();
}

TEST(StrongHandle, HashableInUnorderedSet)
{
    std::unordered_set<MeshHandle> set;
    set.insert(MeshHandle(1, 1));
    set.insert(MeshHandle(2, 1));
    set.insert(MeshHandle(1, 1));
    EXPECT_EQ(set.size(), 2u);
}

TEST(StrongHandle, FormatsIndexAndGeneration)
{
    EXPECT_EQ(std::format("{}", MeshHandle(7, 2)), "#7/2");
    EXPECT_EQ(std::format("{}", MeshHandle{}), "#invalid");
}

// -----------------------------------------------------------------------------
// ResourcePool
// -----------------------------------------------------------------------------

struct FakeResource
{
    std::string Label;
    int Value = 0;
};

using FakePool = Core::ResourcePool<FakeResource, MeshHandle>;

TEST(ResourcePool, AddReturnsSequentialHandles)
{
    FakePool pool;
    auto a = pool.Create(FakeResource{"a", 1});
    auto b = pool.Create(FakeResource{"b", 2});

    EXPECT_TRUE(a.IsValid());
    EXPECT_TRUE(b.IsValid());
    EXPECT_EQ(a.Index, 0u);
    EXPECT_EQ(b.Index, 1u);
    EXPECT_EQ(pool.Size(), 2u);
}

TEST(ResourcePool, GetResolvesOwnHandles)
{
    FakePool pool;
    auto h = pool.Add(std::make_unique<FakeResource>(FakeResource{"mesh", 7}));

    auto res = pool.Get(h);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ((*res)->Label, "mesh");
    EXPECT_EQ((*res)->Value, 7);
}

TEST(ResourcePool, GetRejectsDefaultHandle)
{
    FakePool pool;
    (void)pool.Create(FakeResource{"a", 1});

    auto res = pool.Get(MeshHandle{});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), Core::ErrorCode::ResourceNotFound);
}

TEST(ResourcePool, GetRejectsOutOfRangeAndWrongGeneration)
{
    FakePool pool;
    auto h = pool.Create(FakeResource{"a", 1});

    EXPECT_FALSE(pool.Get(MeshHandle(h.Index + 5, h.Generation)).has_value());
    EXPECT_FALSE(pool.Get(MeshHandle(h.Index, h.Generation + 1)).has_value());
}

TEST(ResourcePool, PointersStableAcrossGrowth)
{
    FakePool pool;
    auto first = pool.Create(FakeResource{"first", 0});
    FakeResource* before = *pool.Get(first);

    for (int i = 0; i < 256; ++i) (void)pool.Create(FakeResource{"filler", i});

    EXPECT_EQ(*pool.Get(first), before);
}

TEST(ResourcePool, ClearInvalidatesEverything)
{
    FakePool pool;
    auto h = pool.Create(FakeResource{"a", 1});
    pool.Clear();

    EXPECT_EQ(pool.Size(), 0u);
    EXPECT_FALSE(pool.Get(h).has_value());
}

TEST(ResourcePool, HandlesCarryFixedGenerationAndNoPoolIdentity)
{
    FakePool meshes;
    FakePool other;
    auto a = meshes.Create(FakeResource{"a", 1});
    auto b = meshes.Create(FakeResource{"b", 2});
    EXPECT_EQ(a.Generation, b.Generation);
    EXPECT_EQ(a.Generation, 1u);

    // Same index in another pool resolves to that pool's resource.
    (void)other.Create(FakeResource{"other", 3});
    auto res = other.Get(a);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ((*res)->Label, "other");
}

//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <unordered_set>

#include <Arbor/Testing/GTest.h>

#include <Arbor/Base/ResourceHandle.h>

using arbor::ResourceHandle;

namespace {

NOLINT_TEST(ResourceHandleTest, DefaultIsInvalid)
{
  constexpr ResourceHandle handle;
  EXPECT_FALSE(handle.IsValid());
  EXPECT_EQ(handle.Generation(), 0);
  EXPECT_EQ(handle.ResourceType(), ResourceHandle::kTypeNotInitialized);
  EXPECT_FALSE(handle.IsFree());
}

NOLINT_TEST(ResourceHandleTest, ValidHandle)
{
  const ResourceHandle handle(1U, 0x04);
  EXPECT_TRUE(handle.IsValid());
  EXPECT_EQ(handle.Index(), 1U);
  EXPECT_EQ(handle.ResourceType(), 0x04);
  EXPECT_EQ(handle.Generation(), 0);
}

NOLINT_TEST(ResourceHandleTest, GetHandle)
{
  const ResourceHandle handle(1U, 0x04);
  EXPECT_EQ(handle.Handle(), 0x0004'0000'0000'0001ULL);
}

NOLINT_TEST(ResourceHandleTest, Comparison)
{
  // Arrange & Act
  const ResourceHandle handle1(1U, 0x04);
  const ResourceHandle handle2(1U, 0x04);
  const ResourceHandle handle3(2U, 0x04);

  // Assert
  EXPECT_TRUE(handle1 == handle2);
  EXPECT_TRUE(handle1 < handle3);
  EXPECT_TRUE(handle1 != handle3);
}

NOLINT_TEST(ResourceHandleTest, GenerationIsPartOfIdentity)
{
  const ResourceHandle handle(7U, 0x01);
  auto next = handle;
  next.NewGeneration();

  EXPECT_EQ(next.Index(), handle.Index());
  EXPECT_NE(next, handle);
  EXPECT_TRUE(handle < next);
}

NOLINT_TEST(ResourceHandleTest, NewGenerationWrapsAround)
{
  ResourceHandle handle(1U, 0x03);
  for (ResourceHandle::GenerationT gen = 0;
    gen < ResourceHandle::kGenerationMax; gen++) {
    handle.NewGeneration();
    ASSERT_EQ(handle.Index(), 1U);
    ASSERT_EQ(handle.ResourceType(), 0x03);
    ASSERT_EQ(handle.Generation(), gen + 1);
  }
  handle.NewGeneration();
  EXPECT_EQ(handle.Generation(), 0);
}

NOLINT_TEST(ResourceHandleTest, SetFreeKeepsOtherFields)
{
  ResourceHandle handle(1U, 0x03);
  handle.NewGeneration();

  handle.SetFree(true);
  EXPECT_TRUE(handle.IsFree());
  EXPECT_EQ(handle.Index(), 1U);
  EXPECT_EQ(handle.ResourceType(), 0x03);
  EXPECT_EQ(handle.Generation(), 1);

  handle.SetFree(false);
  EXPECT_FALSE(handle.IsFree());
  EXPECT_EQ(handle.Generation(), 1);
}

NOLINT_TEST(ResourceHandleTest, SetIndexAndType)
{
  ResourceHandle handle(1U);
  EXPECT_EQ(handle.ResourceType(), ResourceHandle::kTypeNotInitialized);
  handle.SetResourceType(0x12);
  handle.SetIndex(12345);
  EXPECT_EQ(handle.ResourceType(), 0x12);
  EXPECT_EQ(handle.Index(), 12345U);
}

NOLINT_TEST(ResourceHandleTest, MovedFromHandleIsUnchanged)
{
  ResourceHandle handle1(1U, 0x04);
  const auto handle2(std::move(handle1));
  EXPECT_EQ(handle2.Index(), 1U);
  // NOLINTNEXTLINE(bugprone-use-after-move) handles are trivially copyable
  EXPECT_EQ(handle1, handle2);
}

NOLINT_TEST(ResourceHandleTest, Invalidate)
{
  ResourceHandle handle(1U, 0x04);
  ASSERT_TRUE(handle.IsValid());
  handle.Invalidate();
  EXPECT_FALSE(handle.IsValid());
}

NOLINT_TEST(ResourceHandleTest, ToString)
{
  const ResourceHandle handle(3U, 0x01);
  EXPECT_EQ(arbor::to_string_compact(handle), "RH(i:3, t:1, g:0, f:0)");
  EXPECT_EQ(arbor::to_string_compact(ResourceHandle {}), "RH(Invalid)");
  EXPECT_EQ(arbor::to_string(ResourceHandle {}), "RH(Invalid)");
}

NOLINT_TEST(ResourceHandleTest, Hashable)
{
  std::unordered_set<ResourceHandle> handles;
  handles.insert(ResourceHandle(1U, 0x01));
  handles.insert(ResourceHandle(1U, 0x01));
  handles.insert(ResourceHandle(2U, 0x01));
  EXPECT_EQ(handles.size(), 2);
}

} // namespace

//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cassert>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>

#include <Arbor/Base/ResourceHandle.h>

namespace arbor::scene {

//! Resource type tag of the handles issued by a scene graph node table.
inline constexpr ResourceHandle::ResourceTypeT kSceneNodeResourceType = 1;

/*!
 Addresses a node of a `SceneGraph`: either the graph root, or a branch node
 stored in the graph node table.

 The root is implicit. It is always present, it cannot be removed, and it has
 no handle. A branch index wraps the `ResourceHandle` returned by the node
 table when the node was attached; it stays valid until that node is removed
 from the graph, regardless of any other mutation.

 Indices compare equal when they address the same node. The root orders
 before every branch; branches order by handle value.

 ```cpp
 auto child = graph.AttachAtRoot("child");
 auto grand_child = graph.Attach(child, "grand child");
 if (grand_child) {
   DCHECK_F(graph.GetParent(*grand_child) == child);
 }
 ```
*/
class NodeIndex {
public:
  //! Creates the root index.
  constexpr NodeIndex() noexcept = default;

  [[nodiscard]] static constexpr auto Root() noexcept -> NodeIndex
  {
    return NodeIndex {};
  }

  [[nodiscard]] static constexpr auto Branch(
    const ResourceHandle& handle) noexcept -> NodeIndex
  {
    NodeIndex index;
    index.handle_ = handle;
    return index;
  }

  [[nodiscard]] constexpr auto IsRoot() const noexcept -> bool
  {
    return !handle_.has_value();
  }

  [[nodiscard]] constexpr auto IsBranch() const noexcept -> bool
  {
    return handle_.has_value();
  }

  //! The node table handle of a branch index. Must not be called on the root.
  [[nodiscard]] constexpr auto Handle() const noexcept -> const ResourceHandle&
  {
    assert(IsBranch() && "the root index has no handle");
    return *handle_;
  }

  constexpr auto operator==(const NodeIndex& rhs) const noexcept -> bool
    = default;

  constexpr auto operator<(const NodeIndex& rhs) const noexcept -> bool
  {
    if (IsRoot() || rhs.IsRoot()) {
      return IsRoot() && rhs.IsBranch();
    }
    return *handle_ < *rhs.handle_;
  }

private:
  std::optional<ResourceHandle> handle_;
};

inline auto to_string(const NodeIndex& index) -> std::string
{
  return index.IsRoot() ? std::string("Root")
                        : to_string_compact(index.Handle());
}

} // namespace arbor::scene

template <> struct std::hash<arbor::scene::NodeIndex> {
  auto operator()(const arbor::scene::NodeIndex& index) const noexcept
    -> size_t
  {
    // The root maps to the hash of an invalid handle, which no branch has.
    return std::hash<arbor::ResourceHandle> {}(
      index.IsRoot() ? arbor::ResourceHandle {} : index.Handle());
  }
};

static_assert(std::is_trivially_copyable_v<arbor::scene::NodeIndex>);

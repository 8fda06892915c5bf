//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>

#include <Arbor/Base/Macros.h>
#include <Arbor/Base/ResourceHandle.h>
#include <Arbor/Scene/Types/NodeIndex.h>

namespace arbor::scene::detail {

//! Head and tail of a non-empty child list.
struct Children {
  ResourceHandle first;
  ResourceHandle last;

  auto operator==(const Children&) const -> bool = default;
};

//! Hierarchy linkage of a scene graph node.
/*!
 Children of a node form an intrusive doubly linked list through the sibling
 handles of its members, with the head and tail stored in the parent. Both
 appending a child and unlinking any node are O(1).

 The root node is not stored in the node table; its child list is held by the
 graph itself, and the `parent` of its direct children is `NodeIndex::Root()`.
*/
class GraphData final {
public:
  explicit GraphData(const NodeIndex& parent) noexcept
    : parent_(parent)
  {
  }

  ~GraphData() = default;
  ARBOR_DEFAULT_COPYABLE(GraphData)
  ARBOR_DEFAULT_MOVABLE(GraphData)

  [[nodiscard]] auto GetParent() const noexcept -> const NodeIndex&
  {
    return parent_;
  }
  [[nodiscard]] auto GetChildren() const noexcept
    -> const std::optional<Children>&
  {
    return children_;
  }
  [[nodiscard]] auto GetNextSibling() const noexcept
    -> const std::optional<ResourceHandle>&
  {
    return next_sibling_;
  }
  [[nodiscard]] auto GetPrevSibling() const noexcept
    -> const std::optional<ResourceHandle>&
  {
    return prev_sibling_;
  }
  [[nodiscard]] auto HasChildren() const noexcept -> bool
  {
    return children_.has_value();
  }

  auto SetParent(const NodeIndex& parent) noexcept -> void
  {
    parent_ = parent;
  }
  auto SetChildren(const std::optional<Children>& children) noexcept -> void
  {
    children_ = children;
  }
  auto SetNextSibling(const std::optional<ResourceHandle>& sibling) noexcept
    -> void
  {
    next_sibling_ = sibling;
  }
  auto SetPrevSibling(const std::optional<ResourceHandle>& sibling) noexcept
    -> void
  {
    prev_sibling_ = sibling;
  }

private:
  NodeIndex parent_;
  std::optional<Children> children_;
  std::optional<ResourceHandle> prev_sibling_;
  std::optional<ResourceHandle> next_sibling_;
};

} // namespace arbor::scene::detail

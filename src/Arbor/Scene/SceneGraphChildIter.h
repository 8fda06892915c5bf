//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <functional>
#include <iterator>
#include <optional>
#include <type_traits>

#include <Arbor/Base/Macros.h>
#include <Arbor/Base/ResourceHandle.h>
#include <Arbor/Scene/Detail/GraphData.h>
#include <Arbor/Scene/Detail/NextIterator.h>
#include <Arbor/Scene/Node.h>

namespace arbor::scene {

template <typename T> class SceneGraph;

//! Iterates over the direct children of a node, in insertion order.
/*!
 Starts at the head of the child list and follows the next sibling links;
 grand children are not visited.
*/
template <typename T> class SceneGraphChildIter {
public:
  using Item = std::reference_wrapper<const T>;
  using Iterator = detail::NextIterator<SceneGraphChildIter>;

  ~SceneGraphChildIter() = default;
  ARBOR_DEFAULT_COPYABLE(SceneGraphChildIter)
  ARBOR_DEFAULT_MOVABLE(SceneGraphChildIter)

  [[nodiscard]] auto Next() -> std::optional<Item>
  {
    if (!current_) {
      return std::nullopt;
    }
    const auto& node = graph_->NodeRef(*current_);
    current_ = node.AsGraphNode().GetNextSibling();
    return std::cref(node.Value());
  }

  [[nodiscard]] auto begin() -> Iterator { return Iterator(this); }
  [[nodiscard]] auto end() const noexcept -> std::default_sentinel_t
  {
    return std::default_sentinel;
  }

private:
  friend class SceneGraph<T>;

  SceneGraphChildIter(const SceneGraph<T>& graph,
    const std::optional<detail::Children>& children) noexcept
    : graph_(&graph)
  {
    if (children) {
      current_ = children->first;
    }
  }

  const SceneGraph<T>* graph_;
  std::optional<ResourceHandle> current_;
};

} // namespace arbor::scene

//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <iterator>
#include <optional>
#include <vector>

#include <Arbor/Base/Macros.h>
#include <Arbor/Scene/Detail/GraphData.h>
#include <Arbor/Scene/Detail/NextIterator.h>
#include <Arbor/Scene/Node.h>

namespace arbor::scene {

template <typename T> class SceneGraph;

//! A value visited by a depth-first traversal, paired with its parent value.
/*!
 For the direct children of the root, `parent` is the root value.
*/
template <typename T> struct VisitedValue {
  T& parent;
  T& value;
};

//! Read-only, depth-first, pre-order traversal of a scene graph.
/*!
 Visits every descendant of the start node exactly once, a parent before its
 children, siblings in insertion order, and the subtree of a node entirely
 before its next sibling. The start node itself is not visited.

 The traversal is non-recursive: pending work is kept in an explicit stack of
 (parent value, node) frames. When a node is visited, its next sibling is
 pushed first and its first child last, so the child is visited next.

 The graph must not be modified while the traversal is in progress.
*/
template <typename T> class SceneGraphIter {
public:
  using Item = VisitedValue<const T>;
  using Iterator = detail::NextIterator<SceneGraphIter>;

  ~SceneGraphIter() = default;
  ARBOR_DEFAULT_COPYABLE(SceneGraphIter)
  ARBOR_DEFAULT_MOVABLE(SceneGraphIter)

  //! Produces the next visited value, or std::nullopt when the traversal is
  //! complete.
  [[nodiscard]] auto Next() -> std::optional<Item>
  {
    if (stack_.empty()) {
      return std::nullopt;
    }
    const auto frame = stack_.back();
    stack_.pop_back();

    const auto& graph_node = frame.node->AsGraphNode();
    if (const auto& next = graph_node.GetNextSibling()) {
      stack_.push_back({ frame.parent, &graph_->NodeRef(*next) });
    }
    if (const auto& children = graph_node.GetChildren()) {
      stack_.push_back(
        { &frame.node->Value(), &graph_->NodeRef(children->first) });
    }
    return Item { *frame.parent, frame.node->Value() };
  }

  [[nodiscard]] auto begin() -> Iterator { return Iterator(this); }
  [[nodiscard]] auto end() const noexcept -> std::default_sentinel_t
  {
    return std::default_sentinel;
  }

private:
  friend class SceneGraph<T>;

  struct Frame {
    const T* parent;
    const Node<T>* node;
  };

  SceneGraphIter(const SceneGraph<T>& graph, const T& parent_value,
    const std::optional<detail::Children>& children)
    : graph_(&graph)
  {
    if (children) {
      stack_.push_back({ &parent_value, &graph_->NodeRef(children->first) });
    }
  }

  const SceneGraph<T>* graph_;
  std::vector<Frame> stack_;
};

} // namespace arbor::scene

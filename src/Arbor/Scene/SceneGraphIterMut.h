//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <iterator>
#include <optional>
#include <vector>

#include <Arbor/Base/Logging.h>
#include <Arbor/Base/Macros.h>
#include <Arbor/Base/ResourceHandle.h>
#include <Arbor/Scene/Detail/NextIterator.h>
#include <Arbor/Scene/SceneGraphIter.h>
#include <Arbor/Scene/Types/NodeIndex.h>

namespace arbor::scene {

//! Mutable, depth-first, pre-order traversal of a scene graph.
/*!
 Same visiting order as `SceneGraphIter`, yielding mutable references to the
 parent value and the node value.

 Branch parent and child are fetched together with `ResourceTable::ItemPair`,
 which never hands out two references to the same node. Since every node is
 yielded as a child at most once, references produced by different steps
 only alias when one is the parent of a later step, never within one step.

 The traversal borrows the graph exclusively: the graph must not be
 structurally modified (attach, move, remove...) while it is in progress.
 Values may be modified freely.
*/
template <typename T> class SceneGraphIterMut {
public:
  using Item = VisitedValue<T>;
  using Iterator = detail::NextIterator<SceneGraphIterMut>;

  ~SceneGraphIterMut() = default;
  ARBOR_MAKE_NON_COPYABLE(SceneGraphIterMut)
  ARBOR_DEFAULT_MOVABLE(SceneGraphIterMut)

  [[nodiscard]] auto Next() -> std::optional<Item>
  {
    if (stack_.empty()) {
      return std::nullopt;
    }
    const auto frame = stack_.back();
    stack_.pop_back();

    T* parent_value { nullptr };
    Node<T>* node { nullptr };
    if (frame.parent.IsRoot()) {
      parent_value = &graph_->root_;
      node = &graph_->NodeRef(frame.node);
    } else {
      auto [parent_node, child_node]
        = graph_->nodes_.ItemPair(frame.parent.Handle(), frame.node);
      CHECK_NOTNULL_F(parent_node, "dangling parent link {}",
        to_string(frame.parent));
      CHECK_NOTNULL_F(
        child_node, "dangling child link {}", to_string_compact(frame.node));
      parent_value = &parent_node->Value();
      node = child_node;
    }

    const auto& graph_node = node->AsGraphNode();
    if (const auto& next = graph_node.GetNextSibling()) {
      stack_.push_back({ frame.parent, *next });
    }
    if (const auto& children = graph_node.GetChildren()) {
      stack_.push_back({ NodeIndex::Branch(frame.node), children->first });
    }
    return Item { *parent_value, node->Value() };
  }

  [[nodiscard]] auto begin() -> Iterator { return Iterator(this); }
  [[nodiscard]] auto end() const noexcept -> std::default_sentinel_t
  {
    return std::default_sentinel;
  }

private:
  friend class SceneGraph<T>;

  struct Frame {
    NodeIndex parent;
    ResourceHandle node;
  };

  SceneGraphIterMut(SceneGraph<T>& graph, const NodeIndex& start)
    : graph_(&graph)
  {
    if (const auto children = graph_->GetChildren(start)) {
      stack_.push_back({ start, children->first });
    }
  }

  SceneGraph<T>* graph_;
  std::vector<Frame> stack_;
};

} // namespace arbor::scene

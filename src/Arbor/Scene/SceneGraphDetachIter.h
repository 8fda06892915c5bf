//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <iterator>
#include <optional>
#include <utility>
#include <vector>

#include <Arbor/Base/Logging.h>
#include <Arbor/Base/Macros.h>
#include <Arbor/Base/ResourceHandle.h>
#include <Arbor/Scene/Detail/GraphData.h>
#include <Arbor/Scene/Detail/NextIterator.h>
#include <Arbor/Scene/Node.h>
#include <Arbor/Scene/Types/NodeIndex.h>

namespace arbor::scene {

template <typename T> class SceneGraph;

//! A node taken out of a scene graph by a detaching traversal.
/*!
 Both indices are the ones the node and its parent had in the graph the node
 was taken from. They are no longer valid in that graph, but can be used as
 keys to rebuild the same hierarchy elsewhere.
*/
template <typename T> struct DetachedNode {
  NodeIndex parent_index;
  NodeIndex node_index;
  T value;
};

//! Depth-first, pre-order traversal that removes every node it visits.
/*!
 Each pending frame owns a node that has already been taken out of the node
 table, so by the time a node is yielded, it is no longer in the graph. The
 visiting order is the same as `SceneGraphIter`.

 Abandoning the traversal early does not leave part of the subtree behind:
 the destructor drains the remaining frames, removing all the nodes that were
 not visited yet.
*/
template <typename T> class SceneGraphDetachIter {
public:
  using Item = DetachedNode<T>;
  using Iterator = detail::NextIterator<SceneGraphDetachIter>;

  ~SceneGraphDetachIter()
  {
    if (graph_ != nullptr) {
      while (Next()) { }
    }
  }

  ARBOR_MAKE_NON_COPYABLE(SceneGraphDetachIter)

  SceneGraphDetachIter(SceneGraphDetachIter&& other) noexcept
    : graph_(std::exchange(other.graph_, nullptr))
    , stack_(std::move(other.stack_))
  {
  }

  auto operator=(SceneGraphDetachIter&& other) noexcept
    -> SceneGraphDetachIter&
  {
    if (this != &other) {
      if (graph_ != nullptr) {
        while (Next()) { }
      }
      graph_ = std::exchange(other.graph_, nullptr);
      stack_ = std::move(other.stack_);
    }
    return *this;
  }

  [[nodiscard]] auto Next() -> std::optional<Item>
  {
    if (stack_.empty()) {
      return std::nullopt;
    }
    auto frame = std::move(stack_.back());
    stack_.pop_back();

    const auto& graph_node = frame.node.AsGraphNode();
    if (const auto& next = graph_node.GetNextSibling()) {
      Push(frame.parent, *next);
    }
    if (const auto& children = graph_node.GetChildren()) {
      Push(NodeIndex::Branch(frame.handle), children->first);
    }
    return Item {
      .parent_index = frame.parent,
      .node_index = NodeIndex::Branch(frame.handle),
      .value = std::move(frame.node.Value()),
    };
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
    ResourceHandle handle;
    Node<T> node;
  };

  SceneGraphDetachIter(SceneGraph<T>& graph, const NodeIndex& parent,
    const std::optional<detail::Children>& children)
    : graph_(&graph)
  {
    if (children) {
      Push(parent, children->first);
    }
  }

  auto Push(const NodeIndex& parent, const ResourceHandle& handle) -> void
  {
    auto node = graph_->nodes_.Remove(handle);
    CHECK_F(node.has_value(), "dangling link {} under {}",
      to_string_compact(handle), to_string(parent));
    stack_.push_back(Frame {
      .parent = parent,
      .handle = handle,
      .node = std::move(*node),
    });
  }

  SceneGraph<T>* graph_;
  std::vector<Frame> stack_;
};

} // namespace arbor::scene

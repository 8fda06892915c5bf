//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <expected>
#include <functional>
#include <iterator>
#include <optional>
#include <unordered_map>
#include <utility>

#include <Arbor/Base/Logging.h>
#include <Arbor/Base/Macros.h>
#include <Arbor/Base/ResourceHandle.h>
#include <Arbor/Base/ResourceTable.h>
#include <Arbor/Scene/Detail/GraphData.h>
#include <Arbor/Scene/Errors.h>
#include <Arbor/Scene/Node.h>
#include <Arbor/Scene/SceneGraphChildIter.h>
#include <Arbor/Scene/SceneGraphDetachIter.h>
#include <Arbor/Scene/SceneGraphIter.h>
#include <Arbor/Scene/SceneGraphIterMut.h>
#include <Arbor/Scene/SceneGraphOutOfOrderIter.h>
#include <Arbor/Scene/Types/NodeIndex.h>

namespace arbor::scene {

//! An ordered tree of values with a single, permanent root.
/*!
 The root holds a value like any other node, but it is not stored in the node
 table; it is always present, it cannot be detached, moved or removed, and it
 is addressed by `NodeIndex::Root()`. Every other node is stored in a
 generational `ResourceTable` and addressed by a `NodeIndex::Branch()` that
 stays valid until the node leaves the graph.

 ### Structure

 The children of a node form an intrusive, doubly linked sibling list, in
 insertion order. A node stores its parent index, the head and tail of its
 child list, and its previous and next siblings. Attaching a node appends it
 to its parent's list; unlinking a node splices it out. Both are O(1).

 ### Failure policy

 - Lookups (`Get()`, `GetParent()`, `Contains()`...) never fail: unknown
   indices yield std::nullopt or false.
 - Structural mutators return `std::expected<_, SceneGraphError>` and validate
   all their arguments before changing anything; a failed operation leaves the
   graph untouched.
 - A broken link found while walking the graph is an internal invariant
   violation, and aborts.

 ### Traversal

 Depth-first traversals are pre-order, visit siblings in insertion order, and
 are non-recursive, so arbitrarily deep hierarchies are safe to walk, detach
 and remove.

 | Engine                        | Yields                          |
 |-------------------------------|---------------------------------|
 | `Iter()`, `IterFromNode()`    | (const parent, const value)     |
 | `IterMut()`, `IterMutFromNode()` | (parent, value), mutable     |
 | `IterDirectChildren()`        | const value of direct children  |
 | `IterDetachFromRoot()`, `IterDetach()` | owned values, removed  |
 | `IterOutOfOrder()`            | (index, const value), any order |

 The graph must not be structurally modified while a traversal is in
 progress.

 ```cpp
 SceneGraph<std::string> graph("Root");
 const auto first = graph.AttachAtRoot("First Child");
 const auto second = graph.AttachAtRoot("Second Child");
 (void)graph.Attach(second, "First Grandchild");
 for (const auto& [parent, value] : graph) {
   LOG_F(INFO, "{} -> {}", parent, value);
 }
 ```
*/
template <typename T> class SceneGraph {
public:
  using NodeT = Node<T>;
  using NodeTable = ResourceTable<NodeT>;
  using OptionalRefToNode = std::optional<std::reference_wrapper<NodeT>>;
  using OptionalConstRefToNode
    = std::optional<std::reference_wrapper<const NodeT>>;

  static constexpr std::size_t kDefaultCapacity = 16;

  //! Creates a graph with the given \p root value and no other node.
  /*!
   \param initial_capacity number of nodes for which storage is reserved
   upfront. The graph grows as needed beyond that.
  */
  explicit SceneGraph(T root, std::size_t initial_capacity = kDefaultCapacity)
    : root_(std::move(root))
    , nodes_(kSceneNodeResourceType, initial_capacity)
  {
    DLOG_F(2, "scene graph created, capacity: {}", initial_capacity);
  }

  ~SceneGraph() = default;

  ARBOR_MAKE_NON_COPYABLE(SceneGraph)

  //! Moves the whole graph; the source keeps its (moved from) root value and
  //! no other node.
  SceneGraph(SceneGraph&& other) noexcept
    : root_(std::move(other.root_))
    , root_children_(std::exchange(other.root_children_, std::nullopt))
    , nodes_(std::move(other.nodes_))
  {
  }

  auto operator=(SceneGraph&& other) noexcept -> SceneGraph&
  {
    if (this != &other) {
      root_ = std::move(other.root_);
      root_children_ = std::exchange(other.root_children_, std::nullopt);
      nodes_ = std::move(other.nodes_);
    }
    return *this;
  }

  //=== Structure ===-------------------------------------------------------//

  //! Attaches a new node holding \p value as the last child of \p parent.
  /*!
   \return the index of the new node, or `SceneGraphError::kParentNotFound`
   if \p parent is not in the graph, in which case nothing is inserted.
  */
  [[nodiscard]] auto Attach(const NodeIndex& parent, T value)
    -> std::expected<NodeIndex, SceneGraphError>
  {
    if (!Contains(parent)) {
      LOG_F(1, "cannot attach node: parent {} not found", to_string(parent));
      return std::unexpected(SceneGraphError::kParentNotFound);
    }
    return AttachUnchecked(parent, std::move(value));
  }

  //! Attaches a new node holding \p value as the last child of the root.
  auto AttachAtRoot(T value) -> NodeIndex
  {
    return AttachUnchecked(NodeIndex::Root(), std::move(value));
  }

  //! Moves all nodes of \p other, root included, under \p parent.
  /*!
   The root of \p other becomes the last child of \p parent, and the
   hierarchy below it is rebuilt with the same shape and sibling order.
   \p other is left with no node but its (moved from) root.

   \return the index of the former root of \p other, or
   `SceneGraphError::kParentNotFound`, in which case \p other is untouched.
  */
  [[nodiscard]] auto AttachGraph(const NodeIndex& parent, SceneGraph&& other)
    -> std::expected<NodeIndex, SceneGraphError>
  {
    if (!Contains(parent)) {
      LOG_F(
        1, "cannot attach graph: parent {} not found", to_string(parent));
      return std::unexpected(SceneGraphError::kParentNotFound);
    }

    LOG_SCOPE_F(2, "Attach Graph");
    LOG_F(2, "parent: {}, nodes: {}", to_string(parent), other.Size() + 1);

    const auto new_root = AttachUnchecked(parent, std::move(other.root_));
    auto detach_iter = other.IterDetachFromRoot();
    Rebuild(detach_iter, NodeIndex::Root(), new_root);
    return new_root;
  }

  //! Takes the node at \p index and its whole subtree out of this graph.
  /*!
   The value of the node becomes the root value of the returned graph, and
   its descendants are rebuilt below it with the same shape and sibling
   order. Indices into the returned graph are new ones.

   \return the detached graph, or `SceneGraphError::kNodeNotFound` if \p index
   is the root or is not in the graph.
  */
  [[nodiscard]] auto Detach(const NodeIndex& index)
    -> std::expected<SceneGraph, SceneGraphError>
  {
    if (index.IsRoot() || !nodes_.Contains(index.Handle())) {
      LOG_F(1, "cannot detach node {}: not found", to_string(index));
      return std::unexpected(SceneGraphError::kNodeNotFound);
    }

    LOG_SCOPE_F(2, "Detach Node");
    LOG_F(2, "node: {}", to_string(index));

    auto node = nodes_.Remove(index.Handle());
    CHECK_F(node.has_value());
    UnlinkNode(index.Handle(), node->AsGraphNode());

    SceneGraph detached(std::move(node->Value()));
    auto detach_iter = SceneGraphDetachIter<T>(
      *this, index, node->AsGraphNode().GetChildren());
    detached.Rebuild(detach_iter, index, NodeIndex::Root());
    return detached;
  }

  //! Makes the node at \p index the last child of \p new_parent.
  /*!
   The node keeps its index, its value and its subtree; only the linkage
   changes.

   \return `SceneGraphError::kNodeNotFound` if \p index is the root, or if
   \p index or \p new_parent is not in the graph;
   `SceneGraphError::kWouldCreateCycle` if \p new_parent is \p index or one
   of its descendants.
  */
  [[nodiscard]] auto MoveNode(const NodeIndex& index,
    const NodeIndex& new_parent) -> std::expected<void, SceneGraphError>
  {
    if (index.IsRoot() || !nodes_.Contains(index.Handle())
      || !Contains(new_parent)) {
      LOG_F(1, "cannot move node {} under {}: not found", to_string(index),
        to_string(new_parent));
      return std::unexpected(SceneGraphError::kNodeNotFound);
    }
    if (WouldCreateCycle(index, new_parent)) {
      LOG_F(1, "cannot move node {} under {}: would create a cycle",
        to_string(index), to_string(new_parent));
      return std::unexpected(SceneGraphError::kWouldCreateCycle);
    }

    const auto handle = index.Handle();
    auto& graph_node = NodeRef(handle).GraphNode();
    UnlinkNode(handle, graph_node);
    graph_node.SetPrevSibling(std::nullopt);
    graph_node.SetNextSibling(std::nullopt);
    graph_node.SetParent(new_parent);
    LinkChild(new_parent, handle);
    return {};
  }

  //! Removes the node at \p index and its whole subtree, destroying their
  //! values.
  /*!
   \return `SceneGraphError::kNodeNotFound` if \p index is the root or is not
   in the graph.
  */
  auto Remove(const NodeIndex& index) -> std::expected<void, SceneGraphError>
  {
    if (index.IsRoot() || !nodes_.Contains(index.Handle())) {
      LOG_F(1, "cannot remove node {}: not found", to_string(index));
      return std::unexpected(SceneGraphError::kNodeNotFound);
    }

    DLOG_F(2, "remove node {}", to_string(index));

    auto node = nodes_.Remove(index.Handle());
    CHECK_F(node.has_value());
    UnlinkNode(index.Handle(), node->AsGraphNode());

    auto subtree = SceneGraphDetachIter<T>(
      *this, index, node->AsGraphNode().GetChildren());
    while (subtree.Next()) { }
    return {};
  }

  //! Removes every node but the root. Storage capacity is kept, and indices
  //! obtained before the call are no longer valid.
  auto Clear() noexcept -> void
  {
    DLOG_F(2, "clear scene graph, nodes: {}", nodes_.Size());
    nodes_.Clear();
    root_children_.reset();
  }

  //=== Lookup ===----------------------------------------------------------//

  //! The node at \p index, or std::nullopt if \p index is the root or is not
  //! in the graph.
  [[nodiscard]] auto Get(const NodeIndex& index) const noexcept
    -> OptionalConstRefToNode
  {
    if (index.IsRoot()) {
      return std::nullopt;
    }
    if (const auto* node = nodes_.TryItemAt(index.Handle())) {
      return std::cref(*node);
    }
    return std::nullopt;
  }

  //! \copydoc Get()
  [[nodiscard]] auto GetMut(const NodeIndex& index) noexcept
    -> OptionalRefToNode
  {
    if (index.IsRoot()) {
      return std::nullopt;
    }
    if (auto* node = nodes_.TryItemAt(index.Handle())) {
      return std::ref(*node);
    }
    return std::nullopt;
  }

  [[nodiscard]] auto Root() const noexcept -> const T& { return root_; }
  [[nodiscard]] auto RootMut() noexcept -> T& { return root_; }

  //! The parent of the node at \p index, or std::nullopt if \p index is the
  //! root or is not in the graph.
  [[nodiscard]] auto GetParent(const NodeIndex& index) const noexcept
    -> std::optional<NodeIndex>
  {
    if (const auto node = Get(index)) {
      return node->get().GetParent();
    }
    return std::nullopt;
  }

  //! Whether \p index addresses a node of the graph. Always true for the root.
  [[nodiscard]] auto Contains(const NodeIndex& index) const noexcept -> bool
  {
    return index.IsRoot() || nodes_.Contains(index.Handle());
  }

  //! Number of nodes, not counting the root.
  [[nodiscard]] auto Size() const noexcept -> std::size_t
  {
    return nodes_.Size();
  }

  //! True when the root has no children.
  [[nodiscard]] auto IsEmpty() const noexcept -> bool
  {
    return nodes_.IsEmpty();
  }

  //=== Traversal ===-------------------------------------------------------//

  [[nodiscard]] auto Iter() const -> SceneGraphIter<T>
  {
    return SceneGraphIter<T>(*this, root_, root_children_);
  }

  //! Depth-first traversal of the descendants of \p index. The node itself is
  //! not visited.
  [[nodiscard]] auto IterFromNode(const NodeIndex& index) const
    -> std::expected<SceneGraphIter<T>, SceneGraphError>
  {
    if (index.IsRoot()) {
      return Iter();
    }
    const auto* node = nodes_.TryItemAt(index.Handle());
    if (node == nullptr) {
      return std::unexpected(SceneGraphError::kNodeNotFound);
    }
    return SceneGraphIter<T>(
      *this, node->Value(), node->AsGraphNode().GetChildren());
  }

  [[nodiscard]] auto IterMut() -> SceneGraphIterMut<T>
  {
    return SceneGraphIterMut<T>(*this, NodeIndex::Root());
  }

  //! Mutable depth-first traversal of the descendants of \p index.
  [[nodiscard]] auto IterMutFromNode(const NodeIndex& index)
    -> std::expected<SceneGraphIterMut<T>, SceneGraphError>
  {
    if (!Contains(index)) {
      return std::unexpected(SceneGraphError::kNodeNotFound);
    }
    return SceneGraphIterMut<T>(*this, index);
  }

  //! Iterates over the direct children of \p index only.
  [[nodiscard]] auto IterDirectChildren(const NodeIndex& index) const
    -> std::expected<SceneGraphChildIter<T>, SceneGraphError>
  {
    if (!Contains(index)) {
      return std::unexpected(SceneGraphError::kNodeNotFound);
    }
    return SceneGraphChildIter<T>(*this, GetChildren(index));
  }

  //! Removes every node but the root, yielding their values in depth-first
  //! order. Nodes not yet visited when the traversal is destroyed are removed
  //! too.
  [[nodiscard]] auto IterDetachFromRoot() -> SceneGraphDetachIter<T>
  {
    return SceneGraphDetachIter<T>(
      *this, NodeIndex::Root(), std::exchange(root_children_, std::nullopt));
  }

  //! Removes the descendants of \p index, yielding their values in
  //! depth-first order. The node at \p index stays in the graph.
  [[nodiscard]] auto IterDetach(const NodeIndex& index)
    -> std::expected<SceneGraphDetachIter<T>, SceneGraphError>
  {
    if (!Contains(index)) {
      return std::unexpected(SceneGraphError::kNodeNotFound);
    }
    const auto children = GetChildren(index);
    SetChildren(index, std::nullopt);
    return SceneGraphDetachIter<T>(*this, index, children);
  }

  [[nodiscard]] auto IterOutOfOrder() const -> SceneGraphOutOfOrderIter<T>
  {
    return SceneGraphOutOfOrderIter<T>(*this);
  }

  //! Range access, same as `Iter()`.
  [[nodiscard]] auto begin() const -> typename SceneGraphIter<T>::Iterator
  {
    return typename SceneGraphIter<T>::Iterator(Iter());
  }
  [[nodiscard]] auto end() const noexcept -> std::default_sentinel_t
  {
    return std::default_sentinel;
  }

private:
  friend class SceneGraphIter<T>;
  friend class SceneGraphIterMut<T>;
  friend class SceneGraphChildIter<T>;
  friend class SceneGraphDetachIter<T>;
  friend class SceneGraphOutOfOrderIter<T>;

  auto AttachUnchecked(const NodeIndex& parent, T value) -> NodeIndex
  {
    const auto handle = nodes_.Insert(NodeT(std::move(value), parent));
    LinkChild(parent, handle);
    return NodeIndex::Branch(handle);
  }

  //! Re-attaches, below \p new_parent, everything yielded by \p detach_iter.
  //! Nodes yielded with \p old_parent as parent go directly under
  //! \p new_parent.
  auto Rebuild(SceneGraphDetachIter<T>& detach_iter,
    const NodeIndex& old_parent, const NodeIndex& new_parent) -> void
  {
    std::unordered_map<NodeIndex, NodeIndex> remap { { old_parent,
      new_parent } };
    while (auto detached = detach_iter.Next()) {
      const auto parent = remap.find(detached->parent_index);
      CHECK_F(parent != remap.end(), "node {} yielded before its parent {}",
        to_string(detached->node_index), to_string(detached->parent_index));
      remap.emplace(detached->node_index,
        AttachUnchecked(parent->second, std::move(detached->value)));
    }
  }

  //! Appends the node \p child_handle to the child list of \p parent. The
  //! node must not have any sibling, and its parent must already be set.
  auto LinkChild(const NodeIndex& parent, const ResourceHandle& child_handle)
    -> void
  {
    auto& child = NodeRef(child_handle).GraphNode();
    DCHECK_F(child.GetParent() == parent);
    DCHECK_F(!child.GetPrevSibling().has_value());
    DCHECK_F(!child.GetNextSibling().has_value());

    DLOG_F(3, "link child {} to parent {}", to_string_compact(child_handle),
      to_string(parent));

    auto children = GetChildren(parent);
    if (!children) {
      SetChildren(parent, detail::Children { child_handle, child_handle });
      return;
    }
    NodeRef(children->last).GraphNode().SetNextSibling(child_handle);
    child.SetPrevSibling(children->last);
    children->last = child_handle;
    SetChildren(parent, children);
  }

  //! Splices a node out of its parent's child list, fixing the list head and
  //! tail and the links of its former siblings. \p graph_node is the linkage
  //! of the node, which may already be out of the node table.
  auto UnlinkNode(const ResourceHandle& handle,
    const detail::GraphData& graph_node) -> void
  {
    const auto& parent = graph_node.GetParent();
    const auto& prev = graph_node.GetPrevSibling();
    const auto& next = graph_node.GetNextSibling();

    DLOG_F(3, "unlink node {} from parent {}", to_string_compact(handle),
      to_string(parent));

    if (!prev && !next) {
      SetChildren(parent, std::nullopt);
      return;
    }

    auto children = GetChildren(parent);
    CHECK_F(children.has_value(), "node {} has siblings but parent {} has no "
      "children", to_string_compact(handle), to_string(parent));
    if (prev) {
      NodeRef(*prev).GraphNode().SetNextSibling(next);
    } else {
      children->first = *next;
    }
    if (next) {
      NodeRef(*next).GraphNode().SetPrevSibling(prev);
    } else {
      children->last = *prev;
    }
    SetChildren(parent, children);
  }

  [[nodiscard]] auto WouldCreateCycle(
    const NodeIndex& index, const NodeIndex& new_parent) const -> bool
  {
    // Walk up the ancestor chain of new_parent looking for index.
    for (auto ancestor = new_parent; ancestor.IsBranch();
      ancestor = NodeRef(ancestor.Handle()).GetParent()) {
      if (ancestor == index) {
        return true;
      }
    }
    return false;
  }

  [[nodiscard]] auto GetChildren(const NodeIndex& index) const
    -> std::optional<detail::Children>
  {
    return index.IsRoot() ? root_children_
                          : NodeRef(index.Handle()).AsGraphNode().GetChildren();
  }

  auto SetChildren(const NodeIndex& index,
    const std::optional<detail::Children>& children) -> void
  {
    if (index.IsRoot()) {
      root_children_ = children;
    } else {
      NodeRef(index.Handle()).GraphNode().SetChildren(children);
    }
  }

  //! Node reached by following a link owned by the graph. A dangling link is
  //! a broken invariant.
  [[nodiscard]] auto NodeRef(const ResourceHandle& handle) -> NodeT&
  {
    auto* node = nodes_.TryItemAt(handle);
    CHECK_NOTNULL_F(node, "dangling link {}", to_string_compact(handle));
    return *node;
  }

  [[nodiscard]] auto NodeRef(const ResourceHandle& handle) const
    -> const NodeT&
  {
    const auto* node = nodes_.TryItemAt(handle);
    CHECK_NOTNULL_F(node, "dangling link {}", to_string_compact(handle));
    return *node;
  }

  T root_;
  std::optional<detail::Children> root_children_;
  NodeTable nodes_;
};

} // namespace arbor::scene

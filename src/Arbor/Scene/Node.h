//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <utility>

#include <Arbor/Base/Macros.h>
#include <Arbor/Scene/Detail/GraphData.h>
#include <Arbor/Scene/Types/NodeIndex.h>

namespace arbor::scene {

template <typename T> class SceneGraph;

//! A node record stored in the node table of a `SceneGraph<T>`.
/*!
 Holds the user value and the hierarchy linkage of the node. The value is
 freely accessible; the linkage can only be read, and is maintained by the
 owning graph.
*/
template <typename T> class Node {
public:
  Node(T value, const NodeIndex& parent)
    : value_(std::move(value))
    , graph_data_(parent)
  {
  }

  ~Node() = default;
  ARBOR_DEFAULT_COPYABLE(Node)
  ARBOR_DEFAULT_MOVABLE(Node)

  [[nodiscard]] auto Value() noexcept -> T& { return value_; }
  [[nodiscard]] auto Value() const noexcept -> const T& { return value_; }

  [[nodiscard]] auto GetParent() const noexcept -> const NodeIndex&
  {
    return graph_data_.GetParent();
  }

  [[nodiscard]] auto HasChildren() const noexcept -> bool
  {
    return graph_data_.HasChildren();
  }

  [[nodiscard]] auto AsGraphNode() const noexcept -> const detail::GraphData&
  {
    return graph_data_;
  }

private:
  friend class SceneGraph<T>;

  [[nodiscard]] auto GraphNode() noexcept -> detail::GraphData&
  {
    return graph_data_;
  }

  T value_;
  detail::GraphData graph_data_;
};

} // namespace arbor::scene

//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <iterator>
#include <optional>

#include <Arbor/Base/Macros.h>
#include <Arbor/Scene/Detail/NextIterator.h>
#include <Arbor/Scene/Types/NodeIndex.h>

namespace arbor::scene {

template <typename T> class SceneGraph;

template <typename T> struct IndexedValue {
  NodeIndex index;
  const T& value;
};

//! Visits every node but the root, in node table storage order.
/*!
 Fastest way to scan all values when the hierarchy does not matter. The order
 is unspecified and changes as nodes are removed.
*/
template <typename T> class SceneGraphOutOfOrderIter {
public:
  using Item = IndexedValue<T>;
  using Iterator = detail::NextIterator<SceneGraphOutOfOrderIter>;

  ~SceneGraphOutOfOrderIter() = default;
  ARBOR_DEFAULT_COPYABLE(SceneGraphOutOfOrderIter)
  ARBOR_DEFAULT_MOVABLE(SceneGraphOutOfOrderIter)

  [[nodiscard]] auto Next() -> std::optional<Item>
  {
    const auto items = graph_->nodes_.Items();
    if (position_ >= items.size()) {
      return std::nullopt;
    }
    const auto position = position_++;
    return Item {
      .index = NodeIndex::Branch(graph_->nodes_.HandleAt(position)),
      .value = items[position].Value(),
    };
  }

  [[nodiscard]] auto begin() -> Iterator { return Iterator(this); }
  [[nodiscard]] auto end() const noexcept -> std::default_sentinel_t
  {
    return std::default_sentinel;
  }

private:
  friend class SceneGraph<T>;

  explicit SceneGraphOutOfOrderIter(const SceneGraph<T>& graph) noexcept
    : graph_(&graph)
  {
  }

  const SceneGraph<T>* graph_;
  std::size_t position_ { 0 };
};

} // namespace arbor::scene

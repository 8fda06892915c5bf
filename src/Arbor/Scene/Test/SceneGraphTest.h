//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include <Arbor/Testing/GTest.h>

#include <Arbor/Scene/SceneGraph.h>

namespace arbor::scene::testing {

using StringGraph = SceneGraph<std::string>;
using VisitedPair = std::pair<std::string, std::string>;

//! Walks the child list of `parent` from its head, checking the sibling and
//! parent links of each child. Returns the number of children through
//! `count`.
inline auto ExpectChildListConsistent(const StringGraph& graph,
  const NodeIndex& parent, const std::optional<ResourceHandle>& first,
  const std::optional<ResourceHandle>& last, std::size_t& count) -> void
{
  count = 0;
  ASSERT_EQ(first.has_value(), last.has_value());
  std::optional<ResourceHandle> prev;
  auto current = first;
  while (current) {
    const auto node = graph.Get(NodeIndex::Branch(*current));
    ASSERT_TRUE(node.has_value()) << "dangling sibling link";
    const auto& graph_node = node->get().AsGraphNode();
    EXPECT_EQ(graph_node.GetParent(), parent);
    EXPECT_EQ(graph_node.GetPrevSibling(), prev);
    ++count;
    ASSERT_LE(count, graph.Size()) << "sibling list loops";
    prev = current;
    current = graph_node.GetNextSibling();
  }
  EXPECT_EQ(prev, last);
}

//! Checks the tree and sibling list invariants of the whole graph.
inline auto ExpectConsistent(const StringGraph& graph) -> void
{
  std::size_t linked = 0;
  std::vector<ResourceHandle> root_children;

  for (const auto& [index, value] : graph.IterOutOfOrder()) {
    const auto node = graph.Get(index);
    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(node->get().Value(), value);
    const auto& graph_node = node->get().AsGraphNode();
    EXPECT_TRUE(graph.Contains(graph_node.GetParent()));

    if (graph_node.GetParent().IsRoot()
      && !graph_node.GetPrevSibling().has_value()) {
      root_children.push_back(index.Handle());
    }

    std::optional<ResourceHandle> first;
    std::optional<ResourceHandle> last;
    if (const auto& children = graph_node.GetChildren()) {
      first = children->first;
      last = children->last;
    }
    std::size_t count = 0;
    ASSERT_NO_FATAL_FAILURE(
      ExpectChildListConsistent(graph, index, first, last, count));
    linked += count;

    // Walking up from any node must reach the root.
    std::size_t depth = 0;
    for (auto ancestor = index; ancestor.IsBranch();
      ancestor = *graph.GetParent(ancestor)) {
      ASSERT_LE(++depth, graph.Size()) << "cycle through " << to_string(index);
    }
  }

  // Exactly one head for the root child list, unless it is empty.
  ASSERT_LE(root_children.size(), 1U);
  std::size_t root_count = 0;
  if (!root_children.empty()) {
    auto last = root_children.front();
    for (auto next = graph.Get(NodeIndex::Branch(last))
                       ->get()
                       .AsGraphNode()
                       .GetNextSibling();
      next; next = graph.Get(NodeIndex::Branch(*next))
                     ->get()
                     .AsGraphNode()
                     .GetNextSibling()) {
      last = *next;
    }
    ASSERT_NO_FATAL_FAILURE(ExpectChildListConsistent(
      graph, NodeIndex::Root(), root_children.front(), last, root_count));
  }
  linked += root_count;

  EXPECT_EQ(linked, graph.Size()) << "some nodes are not linked to a parent";
  EXPECT_EQ(graph.IsEmpty(), root_count == 0);
}

//! Values of a depth-first traversal, as (parent, value) pairs.
template <typename Traversal>
auto Collect(Traversal&& traversal) -> std::vector<VisitedPair>
{
  std::vector<VisitedPair> result;
  while (auto item = traversal.Next()) {
    result.emplace_back(item->parent, item->value);
  }
  return result;
}

class SceneGraphTest : public ::testing::Test {
protected:
  SceneGraphTest()
    : graph_("Root")
  {
  }

  // Pattern: Root -> First Child, Second Child -> First Grandchild
  struct Family {
    NodeIndex first_child;
    NodeIndex second_child;
    NodeIndex first_grandchild;
  };

  auto CreateFamily() -> Family
  {
    Family family {};
    family.first_child = graph_.AttachAtRoot("First Child");
    family.second_child = graph_.AttachAtRoot("Second Child");
    const auto grandchild
      = graph_.Attach(family.second_child, "First Grandchild");
    EXPECT_TRUE(grandchild.has_value());
    family.first_grandchild = *grandchild;
    return family;
  }

  // Pattern: Root -> A -> A1, A2 ; Root -> B -> B1 -> B11 ; Root -> C
  struct Forest {
    NodeIndex a;
    NodeIndex a1;
    NodeIndex a2;
    NodeIndex b;
    NodeIndex b1;
    NodeIndex b11;
    NodeIndex c;
  };

  auto CreateForest() -> Forest
  {
    Forest forest {};
    forest.a = graph_.AttachAtRoot("A");
    forest.a1 = *graph_.Attach(forest.a, "A1");
    forest.a2 = *graph_.Attach(forest.a, "A2");
    forest.b = graph_.AttachAtRoot("B");
    forest.b1 = *graph_.Attach(forest.b, "B1");
    forest.b11 = *graph_.Attach(forest.b1, "B11");
    forest.c = graph_.AttachAtRoot("C");
    return forest;
  }

  //! Creates a node, removes it and returns its now stale index.
  auto CreateStaleIndex() -> NodeIndex
  {
    const auto index = graph_.AttachAtRoot("Stale");
    EXPECT_TRUE(graph_.Remove(index).has_value());
    return index;
  }

  StringGraph graph_;
};

} // namespace arbor::scene::testing

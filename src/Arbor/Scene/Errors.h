//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <system_error>

#include <Arbor/Scene/api_export.h>

namespace arbor::scene {

//! Failures reported by the structural mutators of a `SceneGraph`.
enum class SceneGraphError : int {
  //! The parent given to an attach operation is not in the graph.
  kParentNotFound = 1,
  //! The node to detach, move or remove is not in the graph, or is the root.
  kNodeNotFound,
  //! The move would make a node its own ancestor.
  kWouldCreateCycle,
};

//! Category for scene graph errors.
class SceneGraphErrorCategory : public std::error_category {
public:
  const char* name() const noexcept override { return "Scene Graph Error"; }

  std::string message(int ev) const override
  {
    switch (static_cast<SceneGraphError>(ev)) {
    case SceneGraphError::kParentNotFound:
      return "Parent node was not found in the scene graph";
    case SceneGraphError::kNodeNotFound:
      return "Node was not found in the scene graph, or is the root";
    case SceneGraphError::kWouldCreateCycle:
      return "Node cannot be moved under itself or one of its descendants";
    default:
      return "Unknown scene graph error";
    }
  }
};

// Implement in .cpp to avoid multiple definitions so that we can reliably
// compare error_code for identity.
ARBOR_SCN_NDAPI const SceneGraphErrorCategory&
GetSceneGraphErrorCategory() noexcept;

inline std::error_code make_error_code(SceneGraphError e) noexcept
{
  return { static_cast<int>(e), GetSceneGraphErrorCategory() };
}

} // namespace arbor::scene

template <>
struct std::is_error_code_enum<arbor::scene::SceneGraphError> : true_type { };

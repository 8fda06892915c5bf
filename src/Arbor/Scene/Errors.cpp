//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Arbor/Scene/Errors.h>

namespace arbor::scene {

const SceneGraphErrorCategory& GetSceneGraphErrorCategory() noexcept
{
  static SceneGraphErrorCategory instance;
  return instance;
}

} // namespace arbor::scene

//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

//! Single entry point for logging in Arbor.
/*!
 All Arbor code logs through loguru, built with `LOGURU_USE_FMTLIB=1` so that
 the `LOG_F`, `DLOG_F`, `CHECK_F` family take fmt-style `{}` format strings.
 The build system sets the definition for every target linking `Arbor.Base`.

 Verbosity levels used across the code base:
 - `INFO`/`WARNING`/`ERROR`: lifecycle events and rejected requests worth
   seeing in a default run.
 - `1`: rejected operations on a graph (bad handle, cycle).
 - `2`: graph creation/destruction and bulk operations.
 - `3`: link/unlink tracing, debug builds only (`DLOG_F`).
*/

#if !defined(LOGURU_USE_FMTLIB) || !LOGURU_USE_FMTLIB
#  error "Arbor requires loguru with LOGURU_USE_FMTLIB=1"
#endif

#include <loguru.hpp>

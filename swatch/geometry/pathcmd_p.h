// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_GEOMETRY_PATHCMD_P_H_INCLUDED
#define SWATCH_GEOMETRY_PATHCMD_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {

// sw::PathCmd
// ===========

//! Commands returned by a vertex source.
//!
//! A vertex source is any type that provides `rewind(uint32_t path_id)` and `uint32_t vertex(double* x, double* y)`.
//! It returns vertices until `kPathCmdStop`. Swatch doesn't flatten curves, control points are treated as vertices.
enum PathCmd : uint32_t {
  kPathCmdStop = 0,
  kPathCmdMoveTo = 1,
  kPathCmdLineTo = 2,
  kPathCmdCurve3 = 3,
  kPathCmdCurve4 = 4,
  kPathCmdEndPoly = 0x0F,
  kPathCmdMask = 0x0F
};

//! Flags that can be combined with `kPathCmdEndPoly`.
enum PathFlag : uint32_t {
  kPathFlagNone = 0,
  kPathFlagCcw = 0x10,
  kPathFlagCw = 0x20,
  kPathFlagClose = 0x40,
  kPathFlagMask = 0xF0
};

namespace PathCmdOps {

[[nodiscard]]
static SW_INLINE_CONSTEXPR bool is_stop(uint32_t cmd) noexcept { return cmd == kPathCmdStop; }

[[nodiscard]]
static SW_INLINE_CONSTEXPR bool is_vertex(uint32_t cmd) noexcept { return cmd >= kPathCmdMoveTo && cmd < kPathCmdEndPoly; }

[[nodiscard]]
static SW_INLINE_CONSTEXPR bool is_move_to(uint32_t cmd) noexcept { return cmd == kPathCmdMoveTo; }

[[nodiscard]]
static SW_INLINE_CONSTEXPR bool is_end_poly(uint32_t cmd) noexcept { return (cmd & kPathCmdMask) == kPathCmdEndPoly; }

[[nodiscard]]
static SW_INLINE_CONSTEXPR bool is_closed(uint32_t cmd) noexcept { return (cmd & ~uint32_t(kPathFlagCw | kPathFlagCcw)) == (kPathCmdEndPoly | kPathFlagClose); }

} // {PathCmdOps}

} // {sw}

//! \}
//! \endcond

#endif // SWATCH_GEOMETRY_PATHCMD_P_H_INCLUDED

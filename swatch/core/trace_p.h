// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_CORE_TRACE_P_H_INCLUDED
#define SWATCH_CORE_TRACE_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

// SWDebugTrace
// ============

//! Debug trace, used by subsystems that were compiled with their `SW_TRACE_...` switch enabled.
class SWDebugTrace {
public:
  uint32_t _indentation = 0;

  SW_INLINE_NODEBUG void indent() noexcept { _indentation++; }
  SW_INLINE_NODEBUG void deindent() noexcept { _indentation--; }

  template<typename... Args>
  SW_INLINE void out(Args&&... args) noexcept { log(0, 0xFFFFFFFFu, std::forward<Args>(args)...); }

  template<typename... Args>
  SW_INLINE void info(Args&&... args) noexcept { log(0, _indentation, std::forward<Args>(args)...); }

  template<typename... Args>
  SW_INLINE bool warn(Args&&... args) noexcept { log(1, _indentation, std::forward<Args>(args)...); return false; }

  template<typename... Args>
  SW_INLINE bool fail(Args&&... args) noexcept { log(2, _indentation, std::forward<Args>(args)...); return false; }

  SW_HIDDEN static void log(uint32_t severity, uint32_t indentation, const char* fmt, ...) noexcept;
};

// SWDummyTrace
// ============

//! Dummy trace - compiles out everything.
class SWDummyTrace {
public:
  SW_INLINE_NODEBUG void indent() noexcept {}
  SW_INLINE_NODEBUG void deindent() noexcept {}

  template<typename... Args>
  SW_INLINE_NODEBUG void out(Args&&...) noexcept {}

  template<typename... Args>
  SW_INLINE_NODEBUG void info(Args&&...) noexcept {}

  template<typename... Args>
  SW_INLINE_NODEBUG bool warn(Args&&...) noexcept { return false; }

  template<typename... Args>
  SW_INLINE_NODEBUG bool fail(Args&&...) noexcept { return false; }
};

//! \}
//! \endcond

#endif // SWATCH_CORE_TRACE_P_H_INCLUDED

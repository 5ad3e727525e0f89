// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_SPAN_SPANSOLID_P_H_INCLUDED
#define SWATCH_SPAN_SPANSOLID_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>
#include <swatch/core/rgba_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {

// sw::SpanSolid
// =============

//! Generates spans of a single color.
template<typename Color>
class SpanSolid {
public:
  typedef Color ColorType;

  Color _color;

  SW_INLINE_NODEBUG SpanSolid() noexcept
    : _color(ColorOps::no_color<Color>()) {}

  SW_INLINE_NODEBUG explicit SpanSolid(const Color& color) noexcept
    : _color(color) {}

  [[nodiscard]]
  SW_INLINE_NODEBUG const Color& color() const noexcept { return _color; }

  SW_INLINE_NODEBUG void set_color(const Color& color) noexcept { _color = color; }

  SW_INLINE_NODEBUG void prepare() noexcept {}

  SW_INLINE void generate(Color* span, int x, int y, uint32_t len) noexcept {
    sw_unused(x, y);
    for (uint32_t i = 0; i < len; i++)
      span[i] = _color;
  }
};

} // {sw}

//! \}
//! \endcond

#endif // SWATCH_SPAN_SPANSOLID_P_H_INCLUDED

// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_SPAN_PATTERNFILTER_P_H_INCLUDED
#define SWATCH_SPAN_PATTERNFILTER_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>
#include <swatch/core/rgba_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {

// sw::LinePattern
// ===============

//! Subpixel precision of line pattern coordinates.
namespace LinePattern {

static constexpr uint32_t kSubpixelShift = 8;
static constexpr int kSubpixelScale = 1 << kSubpixelShift;
static constexpr int kSubpixelMask = kSubpixelScale - 1;

} // {LinePattern}

// sw::PatternRows
// ===============

//! Row table of a pattern used by line pattern renderers.
//!
//! Rows are arrays of `width` colors, the table doesn't own them.
template<typename Color>
struct PatternRows {
  const Color* const* _rows;
  int _width;
  int _height;

  [[nodiscard]]
  SW_INLINE bool contains(int x, int y) const noexcept {
    return x >= 0 && y >= 0 && x < _width && y < _height;
  }

  [[nodiscard]]
  SW_INLINE const Color& at(int x, int y) const noexcept { return _rows[y][x]; }
};

// sw::PatternFilterNN
// ===================

//! Samples the nearest pattern pixel. Pixels outside of the pattern leave the output untouched.
template<typename Color>
struct PatternFilterNN {
  typedef Color ColorType;

  static SW_INLINE_NODEBUG constexpr int dilation() noexcept { return 0; }

  static SW_INLINE void pixel_low_res(const PatternRows<Color>& rows, Color* p, int x, int y) noexcept {
    if (rows.contains(x, y))
      *p = rows.at(x, y);
  }

  static SW_INLINE void pixel_high_res(const PatternRows<Color>& rows, Color* p, int x, int y) noexcept {
    pixel_low_res(rows, p, x >> LinePattern::kSubpixelShift, y >> LinePattern::kSubpixelShift);
  }
};

// sw::PatternFilterBilinear
// =========================

//! Bilinear interpolation of pattern pixels at subpixel coordinates.
//!
//! The top-left pixel must be inside of the pattern, otherwise the output is cleared. Neighbors outside of the
//! pattern don't contribute. The pattern is expected to be dilated by `dilation()` pixels.
template<typename Color>
struct PatternFilterBilinear {
  typedef Color ColorType;
  typedef ColorTraits<Color> Traits;
  typedef typename Traits::AccumType AccumType;

  static SW_INLINE_NODEBUG constexpr int dilation() noexcept { return 1; }

  static SW_INLINE void pixel_low_res(const PatternRows<Color>& rows, Color* p, int x, int y) noexcept {
    if (rows.contains(x, y))
      *p = rows.at(x, y);
  }

  static void pixel_high_res(const PatternRows<Color>& rows, Color* p, int x, int y) noexcept {
    constexpr int kScale = LinePattern::kSubpixelScale;

    int x_lr = x >> LinePattern::kSubpixelShift;
    int y_lr = y >> LinePattern::kSubpixelShift;

    x &= LinePattern::kSubpixelMask;
    y &= LinePattern::kSubpixelMask;

    if (!rows.contains(x_lr, y_lr)) {
      *p = ColorOps::no_color<Color>();
      return;
    }

    AccumType acc[Traits::kChannels] {};

    add(acc, rows.at(x_lr, y_lr), (kScale - x) * (kScale - y));

    if (rows.contains(x_lr + 1, y_lr))
      add(acc, rows.at(x_lr + 1, y_lr), x * (kScale - y));

    if (rows.contains(x_lr, y_lr + 1))
      add(acc, rows.at(x_lr, y_lr + 1), (kScale - x) * y);

    if (rows.contains(x_lr + 1, y_lr + 1))
      add(acc, rows.at(x_lr + 1, y_lr + 1), x * y);

    for (uint32_t i = 0; i < Traits::kChannels; i++)
      Traits::set(*p, i, Traits::from_accum(Traits::downshift(acc[i], LinePattern::kSubpixelShift * 2)));
  }

private:
  static SW_INLINE void add(AccumType* acc, const Color& c, int weight) noexcept {
    for (uint32_t i = 0; i < Traits::kChannels; i++)
      acc[i] += AccumType(weight) * AccumType(Traits::get(c, i));
  }
};

} // {sw}

//! \}
//! \endcond

#endif // SWATCH_SPAN_PATTERNFILTER_P_H_INCLUDED

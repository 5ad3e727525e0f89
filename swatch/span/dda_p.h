// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_SPAN_DDA_P_H_INCLUDED
#define SWATCH_SPAN_DDA_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {

// sw::DdaLineInterpolator
// =======================

//! Fixed-point DDA that interpolates `y1 -> y2` over `count` steps with `FractionShift` bits of fraction.
//!
//! Stepping accumulates the slope in `_dy`, so any number of steps can be taken at once by `+=` and `-=`. The value
//! returned by `y()` has `YShift` fractional bits (zero by default).
//!
//! The slope and the accumulator are 64-bit, a short extent makes the slope large and rolling it over a long
//! distance must not overflow.
template<uint32_t FractionShift, uint32_t YShift = 0>
class DdaLineInterpolator {
public:
  static constexpr int64_t kFactor = int64_t(1) << FractionShift;

  int _y;
  int64_t _inc;
  int64_t _dy;

  SW_INLINE_NODEBUG DdaLineInterpolator() noexcept = default;

  SW_INLINE DdaLineInterpolator(int y1, int y2, uint32_t count) noexcept
    : _y(y1),
      _inc((int64_t(y2 - y1) * kFactor) / int64_t(count ? count : 1u)),
      _dy(0) {}

  SW_INLINE void inc() noexcept { _dy += _inc; }
  SW_INLINE void dec() noexcept { _dy -= _inc; }

  SW_INLINE void operator+=(int n) noexcept { _dy += _inc * int64_t(n); }
  SW_INLINE void operator-=(int n) noexcept { _dy -= _inc * int64_t(n); }

  [[nodiscard]]
  SW_INLINE int y() const noexcept { return _y + int(_dy >> (FractionShift - YShift)); }

  [[nodiscard]]
  SW_INLINE_NODEBUG int64_t dy() const noexcept { return _dy; }
};

// sw::Dda2LineInterpolator
// ========================

//! Integer DDA that distributes `y2 - y1` over `count` steps without drift.
//!
//! The remainder is kept in `_mod`, which is always negative or zero between steps. After exactly `count` calls to
//! `inc()` the value equals `y2`, and every intermediate value is monotonic between `y1` and `y2`. The `dec()`
//! operation is the exact inverse of `inc()`.
class Dda2LineInterpolator {
public:
  int _cnt;
  int _lft;
  int _rem;
  int _mod;
  int _y;

  SW_INLINE_NODEBUG Dda2LineInterpolator() noexcept = default;

  SW_INLINE Dda2LineInterpolator(int y1, int y2, int count) noexcept
    : _cnt(count <= 0 ? 1 : count),
      _lft((y2 - y1) / _cnt),
      _rem((y2 - y1) % _cnt),
      _mod(_rem),
      _y(y1) {

    if (_mod <= 0) {
      _mod += _cnt;
      _rem += _cnt;
      _lft--;
    }
    _mod -= _cnt;
  }

  //! \name Stepping
  //! \{

  SW_INLINE void inc() noexcept {
    _mod += _rem;
    _y += _lft;
    if (_mod > 0) {
      _mod -= _cnt;
      _y++;
    }
  }

  SW_INLINE void dec() noexcept {
    if (_mod <= _rem) {
      _mod += _cnt;
      _y--;
    }
    _mod -= _rem;
    _y -= _lft;
  }

  SW_INLINE void operator++() noexcept { inc(); }
  SW_INLINE void operator--() noexcept { dec(); }

  SW_INLINE void adjust_forward() noexcept { _mod -= _cnt; }
  SW_INLINE void adjust_backward() noexcept { _mod += _cnt; }

  //! \}

  //! \name Accessors
  //! \{

  [[nodiscard]]
  SW_INLINE_NODEBUG int y() const noexcept { return _y; }

  [[nodiscard]]
  SW_INLINE_NODEBUG int mod() const noexcept { return _mod; }

  [[nodiscard]]
  SW_INLINE_NODEBUG int rem() const noexcept { return _rem; }

  [[nodiscard]]
  SW_INLINE_NODEBUG int lft() const noexcept { return _lft; }

  //! \}
};

// sw::LineBresenhamInterpolator
// =============================

//! Bresenham walker of a line given in 8-bit subpixel coordinates.
//!
//! The line is stepped along its major axis one pixel at a time, the minor axis is interpolated in subpixel
//! precision by `Dda2LineInterpolator`.
class LineBresenhamInterpolator {
public:
  static constexpr uint32_t kSubpixelShift = 8;
  static constexpr int kSubpixelScale = 1 << kSubpixelShift;
  static constexpr int kSubpixelMask = kSubpixelScale - 1;

  int _x1_lr;
  int _y1_lr;
  int _x2_lr;
  int _y2_lr;
  bool _ver;
  uint32_t _len;
  int _inc;
  Dda2LineInterpolator _interpolator;

  [[nodiscard]]
  static SW_INLINE_NODEBUG int line_lr(int v) noexcept { return v >> kSubpixelShift; }

  SW_INLINE LineBresenhamInterpolator(int x1, int y1, int x2, int y2) noexcept
    : _x1_lr(line_lr(x1)),
      _y1_lr(line_lr(y1)),
      _x2_lr(line_lr(x2)),
      _y2_lr(line_lr(y2)),
      _ver(sw_abs(_x2_lr - _x1_lr) < sw_abs(_y2_lr - _y1_lr)),
      _len(uint32_t(_ver ? sw_abs(_y2_lr - _y1_lr) : sw_abs(_x2_lr - _x1_lr))),
      _inc(_ver ? (y2 > y1 ? 1 : -1) : (x2 > x1 ? 1 : -1)),
      _interpolator(_ver ? x1 : y1, _ver ? x2 : y2, int(_len)) {}

  [[nodiscard]]
  SW_INLINE_NODEBUG bool is_ver() const noexcept { return _ver; }

  [[nodiscard]]
  SW_INLINE_NODEBUG uint32_t len() const noexcept { return _len; }

  [[nodiscard]]
  SW_INLINE_NODEBUG int inc() const noexcept { return _inc; }

  //! Steps horizontally (the line is mostly horizontal).
  SW_INLINE void hstep() noexcept {
    _interpolator.inc();
    _x1_lr += _inc;
  }

  //! Steps vertically (the line is mostly vertical).
  SW_INLINE void vstep() noexcept {
    _interpolator.inc();
    _y1_lr += _inc;
  }

  [[nodiscard]]
  SW_INLINE_NODEBUG int x1() const noexcept { return _x1_lr; }

  [[nodiscard]]
  SW_INLINE_NODEBUG int y1() const noexcept { return _y1_lr; }

  [[nodiscard]]
  SW_INLINE_NODEBUG int x2() const noexcept { return line_lr(_interpolator.y()); }

  [[nodiscard]]
  SW_INLINE_NODEBUG int y2() const noexcept { return line_lr(_interpolator.y()); }

  [[nodiscard]]
  SW_INLINE_NODEBUG int x2_hr() const noexcept { return _interpolator.y(); }

  [[nodiscard]]
  SW_INLINE_NODEBUG int y2_hr() const noexcept { return _interpolator.y(); }
};

} // {sw}

//! \}
//! \endcond

#endif // SWATCH_SPAN_DDA_P_H_INCLUDED

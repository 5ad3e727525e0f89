// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_SPAN_SPANGOURAUD_P_H_INCLUDED
#define SWATCH_SPAN_SPANGOURAUD_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>
#include <swatch/core/rgba_p.h>
#include <swatch/geometry/pathcmd_p.h>
#include <swatch/span/dda_p.h>
#include <swatch/span/spantraits_p.h>
#include <swatch/support/math_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {

// sw::SpanGouraud
// ===============

//! Triangle with a color at each vertex.
//!
//! The triangle can be dilated by `d` to compensate for the half pixel lost by anti-aliasing at its edges. The
//! object is also a vertex source that emits the triangle (or the dilated hexagon when `d != 0`), so it can be
//! passed to a rasterizer directly.
template<typename Color>
class SpanGouraud {
public:
  typedef Color ColorType;

  struct Coord {
    double x;
    double y;
    Color color;
  };

  Coord _coord[3];
  double _x[8];
  double _y[8];
  uint32_t _cmd[8];
  uint32_t _vertex;

  SW_INLINE SpanGouraud() noexcept
    : _vertex(0) {
    _cmd[0] = kPathCmdStop;
  }

  SW_INLINE SpanGouraud(const Color& c1, const Color& c2, const Color& c3,
                        double x1, double y1, double x2, double y2, double x3, double y3, double d) noexcept
    : _vertex(0) {
    colors(c1, c2, c3);
    triangle(x1, y1, x2, y2, x3, y3, d);
  }

  SW_INLINE void colors(const Color& c1, const Color& c2, const Color& c3) noexcept {
    _coord[0].color = c1;
    _coord[1].color = c2;
    _coord[2].color = c3;
  }

  //! Sets the triangle and dilates it by `d` if non-zero.
  //!
  //! Dilation moves every edge outwards by `d` and places the shading vertices at the intersections of the moved
  //! edges (miter join). The vertex source then emits six points, two per moved edge.
  void triangle(double x1, double y1, double x2, double y2, double x3, double y3, double d) noexcept {
    _coord[0].x = _x[0] = x1;
    _coord[0].y = _y[0] = y1;
    _coord[1].x = _x[1] = x2;
    _coord[1].y = _y[1] = y2;
    _coord[2].x = _x[2] = x3;
    _coord[2].y = _y[2] = y3;

    _cmd[0] = kPathCmdMoveTo;
    _cmd[1] = kPathCmdLineTo;
    _cmd[2] = kPathCmdLineTo;
    _cmd[3] = kPathCmdStop;

    if (d != 0.0) {
      dilate_triangle(_coord[0].x, _coord[0].y, _coord[1].x, _coord[1].y, _coord[2].x, _coord[2].y, d);

      miter_vertex(_coord[0], 4, 5, 0, 1);
      miter_vertex(_coord[1], 0, 1, 2, 3);
      miter_vertex(_coord[2], 2, 3, 4, 5);

      _cmd[3] = kPathCmdLineTo;
      _cmd[4] = kPathCmdLineTo;
      _cmd[5] = kPathCmdLineTo;
      _cmd[6] = kPathCmdStop;
    }
  }

  //! \name Vertex Source
  //! \{

  SW_INLINE void rewind(uint32_t path_id) noexcept {
    sw_unused(path_id);
    _vertex = 0;
  }

  SW_INLINE uint32_t vertex(double* x, double* y) noexcept {
    uint32_t cmd = _cmd[_vertex];
    if (cmd == kPathCmdStop)
      return cmd;

    *x = _x[_vertex];
    *y = _y[_vertex];
    _vertex++;
    return cmd;
  }

  //! \}

  //! Copies the vertices to `coord` sorted by `y` (ascending).
  SW_INLINE void arrange_vertices(Coord* coord) const noexcept {
    coord[0] = _coord[0];
    coord[1] = _coord[1];
    coord[2] = _coord[2];

    if (_coord[0].y > _coord[2].y) {
      coord[0] = _coord[2];
      coord[2] = _coord[0];
    }

    if (coord[0].y > coord[1].y)
      std::swap(coord[0], coord[1]);

    if (coord[1].y > coord[2].y)
      std::swap(coord[1], coord[2]);
  }

private:
  //! Emits the six points of the triangle with each edge moved outwards by `d`.
  //!
  //! A degenerate triangle has no outside, its points are emitted unchanged.
  void dilate_triangle(double x1, double y1, double x2, double y2, double x3, double y3, double d) noexcept {
    double dx1 = 0.0, dy1 = 0.0;
    double dx2 = 0.0, dy2 = 0.0;
    double dx3 = 0.0, dy3 = 0.0;

    double loc = Math::cross_product(x1, y1, x2, y2, x3, y3);
    if (::fabs(loc) > Math::kIntersectionEpsilon) {
      if (loc > 0.0)
        d = -d;

      Math::calc_orthogonal(d, x1, y1, x2, y2, &dx1, &dy1);
      Math::calc_orthogonal(d, x2, y2, x3, y3, &dx2, &dy2);
      Math::calc_orthogonal(d, x3, y3, x1, y1, &dx3, &dy3);
    }

    _x[0] = x1 + dx1; _y[0] = y1 + dy1;
    _x[1] = x2 + dx1; _y[1] = y2 + dy1;
    _x[2] = x2 + dx2; _y[2] = y2 + dy2;
    _x[3] = x3 + dx2; _y[3] = y3 + dy2;
    _x[4] = x3 + dx3; _y[4] = y3 + dy3;
    _x[5] = x1 + dx3; _y[5] = y1 + dy3;
  }

  //! Moves `c` to the intersection of the lines `a0-a1` and `b0-b1`. Parallel lines keep `c` unchanged.
  SW_INLINE void miter_vertex(Coord& c, uint32_t a0, uint32_t a1, uint32_t b0, uint32_t b1) noexcept {
    double ix, iy;
    if (Math::calc_intersection(_x[a0], _y[a0], _x[a1], _y[a1], _x[b0], _y[b0], _x[b1], _y[b1], &ix, &iy)) {
      c.x = ix;
      c.y = iy;
    }
  }
};

namespace Internal {

// sw::Internal::GouraudEdge
// =========================

//! Interpolates position and channels along a single triangle edge.
template<typename Color>
struct GouraudEdge {
  using Traits = ColorTraits<Color>;
  using Coord = typename SpanGouraud<Color>::Coord;

  static constexpr uint32_t kChannels = Traits::kChannels;

  double _x1;
  double _y1;
  double _dx;
  double _1dy;
  int _c1[kChannels];
  int _dc[kChannels];
  int _c[kChannels];
  int _x;

  SW_INLINE void init(const Coord& c1, const Coord& c2) noexcept {
    _x1 = c1.x - 0.5;
    _y1 = c1.y - 0.5;
    _dx = c2.x - c1.x;

    // Horizontal edges get a huge slope reciprocal, which clamps `k` to either end.
    double dy = c2.y - c1.y;
    _1dy = dy < 1e-5 ? 1e5 : 1.0 / dy;

    for (uint32_t i = 0; i < kChannels; i++) {
      _c1[i] = int(Traits::get(c1.color, i));
      _dc[i] = int(Traits::get(c2.color, i)) - _c1[i];
    }
  }

  SW_INLINE void calc(double y) noexcept {
    double k = sw_clamp((y - _y1) * _1dy, 0.0, 1.0);

    for (uint32_t i = 0; i < kChannels; i++)
      _c[i] = _c1[i] + Math::iround(double(_dc[i]) * k);
    _x = Math::iround((_x1 + _dx * k) * double(Gradient::kSubpixelScale));
  }
};

// sw::Internal::SpanGouraudShader
// ===============================

//! Scanline shader shared by Gouraud generators of all channel layouts.
template<typename Color>
class SpanGouraudShader : public SpanGouraud<Color> {
public:
  using Base = SpanGouraud<Color>;
  using Traits = ColorTraits<Color>;
  using Coord = typename Base::Coord;
  using ValueType = typename Traits::ValueType;
  using Edge = GouraudEdge<Color>;
  using ChannelInterpolator = DdaLineInterpolator<14>;

  static constexpr uint32_t kChannels = Traits::kChannels;

  SW_STATIC_ASSERT(!Traits::kIsFloat && Traits::kBaseShift == 8);

  bool _swap;
  int _y2;
  Edge _edge1;
  Edge _edge2;
  Edge _edge3;

  SW_INLINE SpanGouraudShader() noexcept
    : _swap(false),
      _y2(0) {}

  SW_INLINE SpanGouraudShader(const Color& c1, const Color& c2, const Color& c3,
                              double x1, double y1, double x2, double y2, double x3, double y3, double d) noexcept
    : Base(c1, c2, c3, x1, y1, x2, y2, x3, y3, d),
      _swap(false),
      _y2(0) {}

  void prepare() noexcept {
    Coord coord[3];
    this->arrange_vertices(coord);

    _y2 = int(coord[1].y);

    // The long edge 0-2 is on the left unless the middle vertex lies to its left.
    _swap = Math::cross_product(coord[0].x, coord[0].y, coord[2].x, coord[2].y, coord[1].x, coord[1].y) < 0.0;

    _edge1.init(coord[0], coord[2]);
    _edge2.init(coord[0], coord[1]);
    _edge3.init(coord[1], coord[2]);
  }

  void generate(Color* span, int x, int y, uint32_t len) noexcept {
    _edge1.calc(double(y));

    const Edge* pc1 = &_edge1;
    const Edge* pc2 = &_edge2;

    // Sampling a bit further along the short edges keeps the scanline inside the triangle at its tips.
    if (y <= _y2) {
      _edge2.calc(double(y) + _edge2._1dy);
    }
    else {
      _edge3.calc(double(y) - _edge3._1dy);
      pc2 = &_edge3;
    }

    if (_swap)
      std::swap(pc1, pc2);

    int nlen = sw_abs(pc2->_x - pc1->_x);
    if (nlen <= 0)
      nlen = 1;

    ChannelInterpolator c[kChannels];
    int lo[kChannels];
    int hi[kChannels];

    // Pixels outside of the extent are clamped to the colors of both edges, the extent can be shorter than the
    // covered pixels at the tips.
    for (uint32_t i = 0; i < kChannels; i++) {
      c[i] = ChannelInterpolator(pc1->_c[i], pc2->_c[i], uint32_t(nlen));
      lo[i] = sw_clamp(sw_min(pc1->_c[i], pc2->_c[i]), 0, int(Traits::base_mask()));
      hi[i] = sw_clamp(sw_max(pc1->_c[i], pc2->_c[i]), 0, int(Traits::base_mask()));
    }

    // Roll the interpolators back to `x`, which may lie on either side of the left edge.
    int start = pc1->_x - x * Gradient::kSubpixelScale;
    for (uint32_t i = 0; i < kChannels; i++)
      c[i] -= start;
    nlen += start;

    // Leading part, outside of the triangle on the left.
    while (len && start > 0) {
      for (uint32_t i = 0; i < kChannels; i++) {
        Traits::set(*span, i, ValueType(sw_clamp(c[i].y(), lo[i], hi[i])));
        c[i] += Gradient::kSubpixelScale;
      }
      nlen -= Gradient::kSubpixelScale;
      start -= Gradient::kSubpixelScale;
      span++;
      len--;
    }

    // Inside, channels never leave the range of the edge colors.
    while (len && nlen > 0) {
      for (uint32_t i = 0; i < kChannels; i++) {
        Traits::set(*span, i, ValueType(c[i].y()));
        c[i] += Gradient::kSubpixelScale;
      }
      nlen -= Gradient::kSubpixelScale;
      span++;
      len--;
    }

    // Trailing part, outside of the triangle on the right.
    while (len) {
      for (uint32_t i = 0; i < kChannels; i++) {
        Traits::set(*span, i, ValueType(sw_clamp(c[i].y(), lo[i], hi[i])));
        c[i] += Gradient::kSubpixelScale;
      }
      span++;
      len--;
    }
  }
};

} // {Internal}

// sw::SpanGouraudRgba
// ===================

//! Gouraud shaded triangle generating RGBA spans.
template<typename Color = SWRgba8>
class SpanGouraudRgba : public Internal::SpanGouraudShader<Color> {
public:
  using Base = Internal::SpanGouraudShader<Color>;

  SW_STATIC_ASSERT(ColorTraits<Color>::kChannels == 4);

  SW_INLINE SpanGouraudRgba() noexcept {}

  SW_INLINE SpanGouraudRgba(const Color& c1, const Color& c2, const Color& c3,
                            double x1, double y1, double x2, double y2, double x3, double y3, double d = 0.0) noexcept
    : Base(c1, c2, c3, x1, y1, x2, y2, x3, y3, d) {}
};

// sw::SpanGouraudGray
// ===================

//! Gouraud shaded triangle generating gray spans.
template<typename Color = SWGray8>
class SpanGouraudGray : public Internal::SpanGouraudShader<Color> {
public:
  using Base = Internal::SpanGouraudShader<Color>;

  SW_STATIC_ASSERT(ColorTraits<Color>::kChannels == 2);

  SW_INLINE SpanGouraudGray() noexcept {}

  SW_INLINE SpanGouraudGray(const Color& c1, const Color& c2, const Color& c3,
                            double x1, double y1, double x2, double y2, double x3, double y3, double d = 0.0) noexcept
    : Base(c1, c2, c3, x1, y1, x2, y2, x3, y3, d) {}
};

} // {sw}

//! \}
//! \endcond

#endif // SWATCH_SPAN_SPANGOURAUD_P_H_INCLUDED

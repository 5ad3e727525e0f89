// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_SPAN_GRADIENTCONTOUR_P_H_INCLUDED
#define SWATCH_SPAN_GRADIENTCONTOUR_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>
#include <swatch/geometry/pathcmd_p.h>
#include <swatch/span/spantraits_p.h>
#include <swatch/support/math_p.h>
#include <swatch/support/podarray_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {

// sw::GradientContour
// ===================

//! Gradient shape that follows the outline of a path.
//!
//! `create()` rasterizes the outline of a path into an 8-bit buffer and replaces every pixel by its distance to
//! the nearest outline pixel (Felzenszwalb-Huttenlocher distance transform), normalized to `[0, 255]`. The buffer
//! has `frame` pixels of padding on each side and repeats infinitely in both directions when sampled.
class GradientContour {
public:
  SW_NONCOPYABLE(GradientContour)

  struct Vertex {
    double x;
    double y;
    uint32_t cmd;
  };

  PodArray<uint8_t> _buffer;
  int _width;
  int _height;
  int _frame;
  double _d1;
  double _d2;

  SW_INLINE GradientContour() noexcept
    : _width(0),
      _height(0),
      _frame(10),
      _d1(0.0),
      _d2(100.0) {}

  SW_INLINE GradientContour(double d1, double d2) noexcept
    : _width(0),
      _height(0),
      _frame(10),
      _d1(d1),
      _d2(d2) {}

  //! \name Accessors
  //! \{

  [[nodiscard]]
  SW_INLINE_NODEBUG bool empty() const noexcept { return _buffer.empty(); }

  [[nodiscard]]
  SW_INLINE_NODEBUG const uint8_t* buffer() const noexcept { return _buffer.data(); }

  [[nodiscard]]
  SW_INLINE_NODEBUG int width() const noexcept { return _width; }

  [[nodiscard]]
  SW_INLINE_NODEBUG int height() const noexcept { return _height; }

  [[nodiscard]]
  SW_INLINE_NODEBUG int frame() const noexcept { return _frame; }

  [[nodiscard]]
  SW_INLINE_NODEBUG double d1() const noexcept { return _d1; }

  [[nodiscard]]
  SW_INLINE_NODEBUG double d2() const noexcept { return _d2; }

  SW_INLINE_NODEBUG void set_frame(int frame) noexcept { _frame = sw_max(frame, 0); }
  SW_INLINE_NODEBUG void set_d1(double d) noexcept { _d1 = d; }
  SW_INLINE_NODEBUG void set_d2(double d) noexcept { _d2 = d; }

  //! Returns the distance value at buffer position `[x, y]` (no wrapping).
  [[nodiscard]]
  SW_INLINE uint8_t value_at(int x, int y) const noexcept { return _buffer[size_t(y) * size_t(_width) + size_t(x)]; }

  //! \}

  //! \name Creation
  //! \{

  //! Builds the distance buffer from `path_id` of a vertex source.
  template<typename VertexSource>
  SWResult create(VertexSource& vs, uint32_t path_id = 0) noexcept {
    PodArray<Vertex> vertices;

    double x, y;
    uint32_t cmd;

    vs.rewind(path_id);
    while (!PathCmdOps::is_stop(cmd = vs.vertex(&x, &y)))
      SW_PROPAGATE(vertices.append(Vertex{x, y, cmd}));

    return create_from_vertices(vertices.data(), vertices.size());
  }

  //! Builds the distance buffer from an array of path vertices.
  SW_API SWResult create_from_vertices(const Vertex* vertices, size_t count) noexcept;

  SW_INLINE void reset() noexcept {
    _buffer.reset();
    _width = 0;
    _height = 0;
  }

  //! \}

  //! \name Shape Function
  //! \{

  [[nodiscard]]
  SW_INLINE int calculate(int x, int y, int d) const noexcept {
    sw_unused(d);
    if (_buffer.empty())
      return 0;

    int px = (x >> Gradient::kSubpixelShift) % _width;
    int py = (y >> Gradient::kSubpixelShift) % _height;

    if (px < 0) px += _width;
    if (py < 0) py += _height;

    return Math::iround(double(value_at(px, py)) * (_d2 / 256.0) + _d1) * Gradient::kSubpixelScale;
  }

  //! \}
};

} // {sw}

//! \}
//! \endcond

#endif // SWATCH_SPAN_GRADIENTCONTOUR_P_H_INCLUDED

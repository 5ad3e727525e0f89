// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <swatch/core/api-build_p.h>
#include <swatch/core/runtime.h>
#include <swatch/core/trace_p.h>
#include <swatch/span/dda_p.h>
#include <swatch/span/gradientcontour_p.h>
#include <swatch/support/intops_p.h>
#include <swatch/support/scopedbuffer_p.h>

// sw::GradientContour - Tracing
// =============================

#if defined(SW_TRACE_ALL) && !defined(SW_TRACE_GRADIENT_CONTOUR)
  #define SW_TRACE_GRADIENT_CONTOUR
#endif

#if defined(SW_TRACE_GRADIENT_CONTOUR)
  #define Trace SWDebugTrace
#else
  #define Trace SWDummyTrace
#endif

namespace sw {
namespace {

// sw::GradientContour - Outline Rasterizer
// ========================================

static constexpr float kDistanceInfinity = 1e20f;

struct OutlineCanvas {
  uint8_t* data;
  int width;
  int height;

  SW_INLINE void plot(int x, int y) noexcept {
    if (unsigned(x) < unsigned(width) && unsigned(y) < unsigned(height))
      data[size_t(y) * size_t(width) + size_t(x)] = 0;
  }
};

//! Draws a line given in 8-bit subpixel coordinates, the last pixel is only drawn when `last` is true.
static void draw_outline_line(OutlineCanvas& canvas, int x1, int y1, int x2, int y2, bool last) noexcept {
  LineBresenhamInterpolator li(x1, y1, x2, y2);
  uint32_t len = li.len();

  if (len == 0) {
    if (last)
      canvas.plot(LineBresenhamInterpolator::line_lr(x1), LineBresenhamInterpolator::line_lr(y1));
    return;
  }

  if (last)
    len++;

  if (li.is_ver()) {
    do {
      canvas.plot(li.x2(), li.y1());
      li.vstep();
    } while (--len);
  }
  else {
    do {
      canvas.plot(li.x1(), li.y2());
      li.hstep();
    } while (--len);
  }
}

static void draw_outline(OutlineCanvas& canvas, const GradientContour::Vertex* vertices, size_t count, double tx, double ty) noexcept {
  constexpr double kScale = double(LineBresenhamInterpolator::kSubpixelScale);

  int cur_x = 0;
  int cur_y = 0;
  int start_x = 0;
  int start_y = 0;
  uint32_t n = 0;

  for (size_t i = 0; i < count; i++) {
    uint32_t cmd = vertices[i].cmd;

    if (PathCmdOps::is_move_to(cmd)) {
      cur_x = start_x = Math::iround((vertices[i].x + tx) * kScale);
      cur_y = start_y = Math::iround((vertices[i].y + ty) * kScale);
      n = 1;
    }
    else if (PathCmdOps::is_vertex(cmd)) {
      int x = Math::iround((vertices[i].x + tx) * kScale);
      int y = Math::iround((vertices[i].y + ty) * kScale);

      draw_outline_line(canvas, cur_x, cur_y, x, y, false);
      cur_x = x;
      cur_y = y;
      n++;
    }
    else if (PathCmdOps::is_closed(cmd)) {
      if (n > 2) {
        draw_outline_line(canvas, cur_x, cur_y, start_x, start_y, false);
        cur_x = start_x;
        cur_y = start_y;
      }
      n = 0;
    }
  }
}

// sw::GradientContour - Distance Transform
// ========================================

//! One dimensional squared distance transform of `f` into `r` (lower envelope of parabolas).
//!
//! `v` holds parabola locations and `z` the boundaries between them, `z` must have `len + 1` items.
static void distance_transform_1d(const float* f, float* r, float* z, int* v, int len) noexcept {
  int k = 0;
  v[0] = 0;
  z[0] = -kDistanceInfinity;
  z[1] = kDistanceInfinity;

  for (int q = 1; q < len; q++) {
    float fq = f[q] + float(q) * float(q);
    float s = (fq - (f[v[k]] + float(v[k]) * float(v[k]))) / float(2 * (q - v[k]));

    // Terminates at `k == 0` as `z[0]` is lower than any `s`.
    while (s <= z[k]) {
      k--;
      s = (fq - (f[v[k]] + float(v[k]) * float(v[k]))) / float(2 * (q - v[k]));
    }

    k++;
    v[k] = q;
    z[k] = s;
    z[k + 1] = kDistanceInfinity;
  }

  k = 0;
  for (int q = 0; q < len; q++) {
    while (z[k + 1] < float(q))
      k++;

    float d = float(q - v[k]);
    r[q] = d * d + f[v[k]];
  }
}

} // {anonymous}

// sw::GradientContour - Create
// ============================

SWResult GradientContour::create_from_vertices(const Vertex* vertices, size_t count) noexcept {
  Trace trace;
  trace.info("GradientContour::create() VertexCount=%zu Frame=%d\n", count, _frame);
  trace.indent();

  // Bounding box of all vertices.
  bool found = false;
  double x1 = 0.0;
  double y1 = 0.0;
  double x2 = 0.0;
  double y2 = 0.0;

  for (size_t i = 0; i < count; i++) {
    if (!PathCmdOps::is_vertex(vertices[i].cmd))
      continue;

    double x = vertices[i].x;
    double y = vertices[i].y;

    if (!found) {
      x1 = x2 = x;
      y1 = y2 = y;
      found = true;
    }
    else {
      x1 = sw_min(x1, x);
      y1 = sw_min(y1, y);
      x2 = sw_max(x2, x);
      y2 = sw_max(y2, y);
    }
  }

  if (!found) {
    trace.fail("Path has no vertices\n");
    trace.deindent();
    reset();
    return sw_make_error(SW_ERROR_INVALID_GEOMETRY);
  }

  double bw = Math::ceil(x2 - x1) + double(_frame) * 2.0 + 1.0;
  double bh = Math::ceil(y2 - y1) + double(_frame) * 2.0 + 1.0;

  if (!(bw <= double(SW_RUNTIME_MAX_IMAGE_SIZE) && bh <= double(SW_RUNTIME_MAX_IMAGE_SIZE))) {
    trace.fail("Buffer [%g x %g] is too large\n", bw, bh);
    trace.deindent();
    reset();
    return sw_make_error(SW_ERROR_IMAGE_TOO_LARGE);
  }

  int w = int(bw);
  int h = int(bh);
  size_t size = size_t(w) * size_t(h);
  trace.info("Buffer [%d x %d] Bounds [%g %g %g %g]\n", w, h, x1, y1, x2, y2);

  // Outline drawn as zeros on a white background.
  PodArray<uint8_t> buffer;
  SW_PROPAGATE(buffer.resize_fill(size, uint8_t(255)));

  OutlineCanvas canvas { buffer.data(), w, h };
  draw_outline(canvas, vertices, count, double(_frame) - x1, double(_frame) - y1);

  // Squared distance transform, columns first, then rows.
  ScopedBuffer image_buffer;
  float* image = image_buffer.alloc_t<float>(size);
  SW_RETURN_ERROR_IF_NULL(image);

  for (size_t i = 0; i < size; i++)
    image[i] = buffer[i] == 0 ? 0.0f : kDistanceInfinity;

  size_t length = size_t(sw_max(w, h));
  ScopedBufferTmp<8192> span_buffer;
  void* span_mem = span_buffer.alloc(sizeof(float) * (length * 3u + 1u) + sizeof(int) * length);
  SW_RETURN_ERROR_IF_NULL(span_mem);

  float* span_f = static_cast<float*>(span_mem);
  float* span_r = span_f + length;
  float* span_z = span_r + length;
  int* span_v = reinterpret_cast<int*>(span_z + length + 1u);

  for (int x = 0; x < w; x++) {
    for (int y = 0; y < h; y++)
      span_f[y] = image[size_t(y) * size_t(w) + size_t(x)];

    distance_transform_1d(span_f, span_r, span_z, span_v, h);

    for (int y = 0; y < h; y++)
      image[size_t(y) * size_t(w) + size_t(x)] = span_r[y];
  }

  for (int y = 0; y < h; y++) {
    float* row = image + size_t(y) * size_t(w);
    memcpy(span_f, row, size_t(w) * sizeof(float));
    distance_transform_1d(span_f, span_r, span_z, span_v, w);
    memcpy(row, span_r, size_t(w) * sizeof(float));
  }

  // Distances normalized to [0, 255].
  float min_value = std::numeric_limits<float>::max();
  float max_value = 0.0f;

  for (size_t i = 0; i < size; i++) {
    float v = float(Math::sqrt(double(image[i])));
    image[i] = v;
    min_value = sw_min(min_value, v);
    max_value = sw_max(max_value, v);
  }

  trace.info("Distance range [%f, %f]\n", double(min_value), double(max_value));

  uint8_t* dst = buffer.data();
  if (min_value == max_value) {
    memset(dst, 0, size);
  }
  else {
    float scale = 255.0f / (max_value - min_value);
    for (size_t i = 0; i < size; i++)
      dst[i] = IntOps::clamp_to_byte(int((image[i] - min_value) * scale + 0.5f));
  }

  _buffer = std::move(buffer);
  _width = w;
  _height = h;

  trace.deindent();
  return SW_SUCCESS;
}

} // {sw}

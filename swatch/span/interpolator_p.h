// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_SPAN_INTERPOLATOR_P_H_INCLUDED
#define SWATCH_SPAN_INTERPOLATOR_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>
#include <swatch/span/dda_p.h>
#include <swatch/span/spantraits_p.h>
#include <swatch/support/math_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {

// Span interpolators map consecutive destination pixels of a span into source space. The protocol is shared by
// all of them:
//
//   - `begin(x, y, len)` - starts a span of `len` pixels at destination position `[x, y]`.
//   - `next()` - advances to the next pixel.
//   - `coordinates(&ix, &iy)` - returns the current source position in `kSubpixelShift` precision.
//   - `resynchronize(xe, ye, len)` - corrects accumulated error so the interpolator reaches the exact mapping of
//     `[xe, ye]` after `len` more pixels.
//
// A `Transform` is any type providing `transform(double* x, double* y) const`.

// sw::SpanInterpolatorLinear
// ==========================

//! Maps both span endpoints and interpolates linearly between them. Exact for affine transforms.
template<typename Transform, uint32_t SubpixelShift = 8>
class SpanInterpolatorLinear {
public:
  typedef Transform TransformType;

  static constexpr uint32_t kSubpixelShift = SubpixelShift;
  static constexpr int kSubpixelScale = 1 << kSubpixelShift;

  const Transform* _transform;
  Dda2LineInterpolator _li_x;
  Dda2LineInterpolator _li_y;

  SW_INLINE_NODEBUG SpanInterpolatorLinear() noexcept
    : _transform(nullptr) {}

  SW_INLINE_NODEBUG explicit SpanInterpolatorLinear(const Transform& transform) noexcept
    : _transform(&transform) {}

  SW_INLINE SpanInterpolatorLinear(const Transform& transform, double x, double y, uint32_t len) noexcept
    : _transform(&transform) { begin(x, y, len); }

  [[nodiscard]]
  SW_INLINE_NODEBUG const Transform& transformer() const noexcept { return *_transform; }

  SW_INLINE_NODEBUG void set_transformer(const Transform& transform) noexcept { _transform = &transform; }

  [[nodiscard]]
  SW_INLINE_NODEBUG uint32_t subpixel_shift() const noexcept { return kSubpixelShift; }

  SW_INLINE void begin(double x, double y, uint32_t len) noexcept {
    double tx = x;
    double ty = y;
    _transform->transform(&tx, &ty);
    int x1 = Math::iround(tx * kSubpixelScale);
    int y1 = Math::iround(ty * kSubpixelScale);

    tx = x + double(len);
    ty = y;
    _transform->transform(&tx, &ty);
    int x2 = Math::iround(tx * kSubpixelScale);
    int y2 = Math::iround(ty * kSubpixelScale);

    _li_x = Dda2LineInterpolator(x1, x2, int(len));
    _li_y = Dda2LineInterpolator(y1, y2, int(len));
  }

  SW_INLINE void resynchronize(double xe, double ye, uint32_t len) noexcept {
    _transform->transform(&xe, &ye);
    _li_x = Dda2LineInterpolator(_li_x.y(), Math::iround(xe * kSubpixelScale), int(len));
    _li_y = Dda2LineInterpolator(_li_y.y(), Math::iround(ye * kSubpixelScale), int(len));
  }

  SW_INLINE void next() noexcept {
    _li_x.inc();
    _li_y.inc();
  }

  SW_INLINE void coordinates(int* x, int* y) const noexcept {
    *x = _li_x.y();
    *y = _li_y.y();
  }
};

// sw::SpanInterpolatorLinearSubdiv
// ================================

//! Linear interpolator that re-maps the exact position every `1 << subdiv_shift` pixels.
//!
//! Suitable for non-linear transforms that are locally close to affine.
template<typename Transform, uint32_t SubpixelShift = 8>
class SpanInterpolatorLinearSubdiv {
public:
  typedef Transform TransformType;

  static constexpr uint32_t kSubpixelShift = SubpixelShift;
  static constexpr int kSubpixelScale = 1 << kSubpixelShift;
  static constexpr uint32_t kDefaultSubdivShift = 4;

  const Transform* _transform;
  uint32_t _subdiv_shift;
  uint32_t _subdiv_size;
  Dda2LineInterpolator _li_x;
  Dda2LineInterpolator _li_y;
  int _src_x;
  double _src_y;
  uint32_t _pos;
  uint32_t _len;

  SW_INLINE_NODEBUG SpanInterpolatorLinearSubdiv() noexcept
    : _transform(nullptr),
      _subdiv_shift(kDefaultSubdivShift),
      _subdiv_size(1u << kDefaultSubdivShift) {}

  SW_INLINE_NODEBUG explicit SpanInterpolatorLinearSubdiv(const Transform& transform, uint32_t subdiv_shift = kDefaultSubdivShift) noexcept
    : _transform(&transform),
      _subdiv_shift(subdiv_shift),
      _subdiv_size(1u << subdiv_shift) {}

  [[nodiscard]]
  SW_INLINE_NODEBUG const Transform& transformer() const noexcept { return *_transform; }

  SW_INLINE_NODEBUG void set_transformer(const Transform& transform) noexcept { _transform = &transform; }

  [[nodiscard]]
  SW_INLINE_NODEBUG uint32_t subpixel_shift() const noexcept { return kSubpixelShift; }

  [[nodiscard]]
  SW_INLINE_NODEBUG uint32_t subdiv_shift() const noexcept { return _subdiv_shift; }

  SW_INLINE void set_subdiv_shift(uint32_t shift) noexcept {
    _subdiv_shift = shift;
    _subdiv_size = 1u << shift;
  }

  SW_INLINE void begin(double x, double y, uint32_t len) noexcept {
    _pos = 1;
    _src_x = Math::iround(x * kSubpixelScale) + kSubpixelScale;
    _src_y = y;
    _len = len;

    if (len > _subdiv_size)
      len = _subdiv_size;

    double tx = x;
    double ty = y;
    _transform->transform(&tx, &ty);
    int x1 = Math::iround(tx * kSubpixelScale);
    int y1 = Math::iround(ty * kSubpixelScale);

    tx = x + double(len);
    ty = y;
    _transform->transform(&tx, &ty);

    _li_x = Dda2LineInterpolator(x1, Math::iround(tx * kSubpixelScale), int(len));
    _li_y = Dda2LineInterpolator(y1, Math::iround(ty * kSubpixelScale), int(len));
  }

  //! Subdivision handles resynchronization internally.
  SW_INLINE_NODEBUG void resynchronize(double xe, double ye, uint32_t len) noexcept { sw_unused(xe, ye, len); }

  SW_INLINE void next() noexcept {
    _li_x.inc();
    _li_y.inc();

    if (_pos >= _subdiv_size) {
      uint32_t len = sw_min(_len, _subdiv_size);
      double tx = double(_src_x) / double(kSubpixelScale) + double(len);
      double ty = _src_y;
      _transform->transform(&tx, &ty);

      _li_x = Dda2LineInterpolator(_li_x.y(), Math::iround(tx * kSubpixelScale), int(len));
      _li_y = Dda2LineInterpolator(_li_y.y(), Math::iround(ty * kSubpixelScale), int(len));
      _pos = 0;
    }

    _src_x += kSubpixelScale;
    _pos++;
    _len--;
  }

  SW_INLINE void coordinates(int* x, int* y) const noexcept {
    *x = _li_x.y();
    *y = _li_y.y();
  }
};

// sw::SpanInterpolatorTrans
// =========================

//! Maps every pixel through the transform. Exact for any transform, but the slowest option.
template<typename Transform, uint32_t SubpixelShift = 8>
class SpanInterpolatorTrans {
public:
  typedef Transform TransformType;

  static constexpr uint32_t kSubpixelShift = SubpixelShift;
  static constexpr int kSubpixelScale = 1 << kSubpixelShift;

  const Transform* _transform;
  double _x;
  double _y;
  int _ix;
  int _iy;

  SW_INLINE_NODEBUG SpanInterpolatorTrans() noexcept
    : _transform(nullptr) {}

  SW_INLINE_NODEBUG explicit SpanInterpolatorTrans(const Transform& transform) noexcept
    : _transform(&transform) {}

  [[nodiscard]]
  SW_INLINE_NODEBUG const Transform& transformer() const noexcept { return *_transform; }

  SW_INLINE_NODEBUG void set_transformer(const Transform& transform) noexcept { _transform = &transform; }

  [[nodiscard]]
  SW_INLINE_NODEBUG uint32_t subpixel_shift() const noexcept { return kSubpixelShift; }

  SW_INLINE void begin(double x, double y, uint32_t len) noexcept {
    sw_unused(len);
    _x = x;
    _y = y;
    _map();
  }

  //! Every pixel is mapped exactly, nothing to correct.
  SW_INLINE_NODEBUG void resynchronize(double xe, double ye, uint32_t len) noexcept { sw_unused(xe, ye, len); }

  SW_INLINE void next() noexcept {
    _x += 1.0;
    _map();
  }

  SW_INLINE void coordinates(int* x, int* y) const noexcept {
    *x = _ix;
    *y = _iy;
  }

  SW_INLINE void _map() noexcept {
    double tx = _x;
    double ty = _y;
    _transform->transform(&tx, &ty);
    _ix = Math::iround(tx * kSubpixelScale);
    _iy = Math::iround(ty * kSubpixelScale);
  }
};

// sw::SpanSubdivAdaptor
// =====================

//! Drives any interpolator in chunks of `1 << subdiv_shift` pixels, calling its `resynchronize()` at each chunk
//! boundary.
template<typename Interpolator, uint32_t SubpixelShift = 8>
class SpanSubdivAdaptor {
public:
  typedef Interpolator InterpolatorType;

  static constexpr uint32_t kSubpixelShift = SubpixelShift;
  static constexpr int kSubpixelScale = 1 << kSubpixelShift;
  static constexpr uint32_t kDefaultSubdivShift = 4;

  Interpolator* _interpolator;
  uint32_t _subdiv_shift;
  uint32_t _subdiv_size;
  int _src_x;
  double _src_y;
  uint32_t _pos;
  uint32_t _len;

  SW_INLINE_NODEBUG SpanSubdivAdaptor() noexcept
    : _interpolator(nullptr),
      _subdiv_shift(kDefaultSubdivShift),
      _subdiv_size(1u << kDefaultSubdivShift) {}

  SW_INLINE_NODEBUG explicit SpanSubdivAdaptor(Interpolator& interpolator, uint32_t subdiv_shift = kDefaultSubdivShift) noexcept
    : _interpolator(&interpolator),
      _subdiv_shift(subdiv_shift),
      _subdiv_size(1u << subdiv_shift) {}

  [[nodiscard]]
  SW_INLINE_NODEBUG Interpolator& interpolator() const noexcept { return *_interpolator; }

  SW_INLINE_NODEBUG void set_interpolator(Interpolator& interpolator) noexcept { _interpolator = &interpolator; }

  [[nodiscard]]
  SW_INLINE_NODEBUG uint32_t subpixel_shift() const noexcept { return kSubpixelShift; }

  [[nodiscard]]
  SW_INLINE_NODEBUG uint32_t subdiv_shift() const noexcept { return _subdiv_shift; }

  SW_INLINE void set_subdiv_shift(uint32_t shift) noexcept {
    _subdiv_shift = shift;
    _subdiv_size = 1u << shift;
  }

  SW_INLINE void begin(double x, double y, uint32_t len) noexcept {
    _pos = 1;
    _src_x = Math::iround(x * kSubpixelScale) + kSubpixelScale;
    _src_y = y;
    _len = len;
    _interpolator->begin(x, y, sw_min(len, _subdiv_size));
  }

  SW_INLINE_NODEBUG void resynchronize(double xe, double ye, uint32_t len) noexcept { sw_unused(xe, ye, len); }

  SW_INLINE void next() noexcept {
    _interpolator->next();

    if (_pos >= _subdiv_size) {
      uint32_t len = sw_min(_len, _subdiv_size);
      _interpolator->resynchronize(double(_src_x) / double(kSubpixelScale) + double(len), _src_y, len);
      _pos = 0;
    }

    _src_x += kSubpixelScale;
    _pos++;
    _len--;
  }

  SW_INLINE void coordinates(int* x, int* y) const noexcept { _interpolator->coordinates(x, y); }

  //! Local scale of the wrapped interpolator, identity if it doesn't provide one.
  SW_INLINE void local_scale(int* x, int* y) const noexcept { SpanTraits<Interpolator>::local_scale(*_interpolator, x, y); }
};

// sw::SpanInterpolatorAdaptor
// ===========================

//! Applies a distortion to the coordinates produced by `Interpolator`.
//!
//! `Distortion` provides `calculate(int* x, int* y) const`, which receives and modifies coordinates in the subpixel
//! precision of the interpolator.
template<typename Interpolator, typename Distortion>
class SpanInterpolatorAdaptor : public Interpolator {
public:
  typedef Interpolator Base;
  typedef Distortion DistortionType;

  const Distortion* _distortion;

  SW_INLINE_NODEBUG SpanInterpolatorAdaptor() noexcept
    : Base(),
      _distortion(nullptr) {}

  template<typename... Args>
  SW_INLINE_NODEBUG explicit SpanInterpolatorAdaptor(const Distortion& distortion, Args&&... args) noexcept
    : Base(std::forward<Args>(args)...),
      _distortion(&distortion) {}

  [[nodiscard]]
  SW_INLINE_NODEBUG const Distortion& distortion() const noexcept { return *_distortion; }

  SW_INLINE_NODEBUG void set_distortion(const Distortion& distortion) noexcept { _distortion = &distortion; }

  SW_INLINE void coordinates(int* x, int* y) const noexcept {
    Base::coordinates(x, y);
    _distortion->calculate(x, y);
  }
};

} // {sw}

//! \}
//! \endcond

#endif // SWATCH_SPAN_INTERPOLATOR_P_H_INCLUDED

// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <swatch/core/api-build_p.h>
#include <swatch/core/trace_p.h>
#include <swatch/image/imagefilter_p.h>

// sw::ImageFilterLUT - Tracing
// ============================

#if defined(SW_TRACE_ALL) && !defined(SW_TRACE_IMAGE_FILTER)
  #define SW_TRACE_IMAGE_FILTER
#endif

#if defined(SW_TRACE_IMAGE_FILTER)
  #define Trace SWDebugTrace
#else
  #define Trace SWDummyTrace
#endif

namespace sw {

// sw::ImageFilterLUT - Allocation
// ===============================

SWResult ImageFilterLUT::_realloc_lut(double radius) noexcept {
  Trace trace;

  if (!Math::is_finite(radius) || radius <= 0.0 || radius > kMaxRadius) {
    trace.fail("ImageFilterLUT: Invalid radius %g\n", radius);
    return sw_make_error(SW_ERROR_INVALID_VALUE);
  }

  uint32_t diameter = Math::uceil(radius) * 2u;
  SW_PROPAGATE(_weights.resize(size_t(diameter) << Image::kSubpixelShift));

  _radius = radius;
  _diameter = diameter;
  _start = -int(diameter / 2u - 1u);

  trace.info("ImageFilterLUT: Radius=%g Diameter=%u Start=%d\n", radius, diameter, _start);
  return SW_SUCCESS;
}

// sw::ImageFilterLUT - Normalization
// ==================================

SWResult ImageFilterLUT::normalize() noexcept {
  Trace trace;

  if (_diameter == 0)
    return sw_make_error(SW_ERROR_INVALID_STATE);

  constexpr uint32_t kScale = Image::kSubpixelScale;
  int16_t* weights = _weights.data();
  int flip = 1;

  for (uint32_t i = 0; i < kScale; i++) {
    for (;;) {
      int sum = 0;
      for (uint32_t j = 0; j < _diameter; j++)
        sum += weights[j * kScale + i];

      if (sum == Image::kFilterScale)
        break;

      if (sum == 0) {
        trace.fail("ImageFilterLUT: Weights of phase %u sum to zero\n", i);
        return sw_make_error(SW_ERROR_INVALID_VALUE);
      }

      double k = double(Image::kFilterScale) / double(sum);
      sum = 0;

      for (uint32_t j = 0; j < _diameter; j++) {
        int16_t w = int16_t(Math::iround(double(weights[j * kScale + i]) * k));
        weights[j * kScale + i] = w;
        sum += w;
      }

      // Distribute the rounding error, alternating around the center of the kernel.
      sum -= Image::kFilterScale;
      int inc = sum > 0 ? -1 : 1;

      for (uint32_t j = 0; j < _diameter && sum; j++) {
        flip ^= 1;
        uint32_t idx = flip ? _diameter / 2u + j / 2u : _diameter / 2u - j / 2u;
        int v = weights[idx * kScale + i];

        if (v < Image::kFilterScale) {
          weights[idx * kScale + i] = int16_t(v + inc);
          sum += inc;
        }
      }
    }
  }

  uint32_t pivot = _diameter << (Image::kSubpixelShift - 1u);
  for (uint32_t i = 0; i < pivot; i++)
    weights[pivot + i] = weights[pivot - i];

  uint32_t end = (_diameter << Image::kSubpixelShift) - 1u;
  weights[0] = weights[end];

  trace.info("ImageFilterLUT: Normalized %u phases\n", kScale);
  return SW_SUCCESS;
}

} // {sw}

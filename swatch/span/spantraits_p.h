// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_SPAN_SPANTRAITS_P_H_INCLUDED
#define SWATCH_SPAN_SPANTRAITS_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {

// sw::Gradient - Constants
// ========================

namespace Gradient {

//! Subpixel precision of coordinates passed to gradient shape functions.
static constexpr uint32_t kSubpixelShift = 4;
static constexpr int kSubpixelScale = 1 << kSubpixelShift;
static constexpr int kSubpixelMask = kSubpixelScale - 1;

} // {Gradient}

// sw::Image - Constants
// =====================

namespace Image {

//! Subpixel precision of coordinates produced by span interpolators and consumed by image filters.
static constexpr uint32_t kSubpixelShift = 8;
static constexpr int kSubpixelScale = 1 << kSubpixelShift;
static constexpr int kSubpixelMask = kSubpixelScale - 1;

//! Precision of image filter weights.
static constexpr uint32_t kFilterShift = 14;
static constexpr int kFilterScale = 1 << kFilterShift;
static constexpr int kFilterMask = kFilterScale - 1;

} // {Image}

// sw::SpanTraits
// ==============

namespace Internal {

template<typename T, typename = void>
struct HasLocalScale : public std::false_type {};

template<typename T>
struct HasLocalScale<T, std::void_t<decltype(std::declval<const T&>().local_scale(static_cast<int*>(nullptr), static_cast<int*>(nullptr)))>>
  : public std::true_type {};

template<typename T, typename = void>
struct HasTransformer : public std::false_type {};

template<typename T>
struct HasTransformer<T, std::void_t<decltype(std::declval<const T&>().transformer())>> : public std::true_type {};

} // {Internal}

//! Compile-time view of optional interpolator capabilities.
//!
//! An interpolator may provide `local_scale(int* sx, int* sy)`, which reports the current scale of the mapping in
//! `Image::kSubpixelShift` precision, and `transformer()`, which exposes the transform it was built with. Consumers
//! query them through `SpanTraits` so every interpolator can be plugged into every generator.
template<typename Interpolator>
struct SpanTraits {
  static constexpr bool kHasLocalScale = Internal::HasLocalScale<Interpolator>::value;
  static constexpr bool kHasTransformer = Internal::HasTransformer<Interpolator>::value;

  //! Returns the local scale of `interpolator` or an identity scale if it doesn't provide one.
  static SW_INLINE void local_scale(const Interpolator& interpolator, int* sx, int* sy) noexcept {
    if constexpr (kHasLocalScale) {
      interpolator.local_scale(sx, sy);
    }
    else {
      sw_unused(interpolator);
      *sx = Image::kSubpixelScale;
      *sy = Image::kSubpixelScale;
    }
  }
};

} // {sw}

//! \}
//! \endcond

#endif // SWATCH_SPAN_SPANTRAITS_P_H_INCLUDED

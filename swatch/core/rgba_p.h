// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_CORE_RGBA_P_H_INCLUDED
#define SWATCH_CORE_RGBA_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>
#include <swatch/core/rgba.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {

// sw::ColorTraits
// ===============

//! Compile-time description of a color type.
//!
//! Every color type provides:
//!
//!   - `ValueType` - channel storage type.
//!   - `CalcType` - type used by intermediate per-channel arithmetic.
//!   - `AccumType` - signed type used by filters that accumulate weighted sums (possibly negative).
//!   - `kChannels` - number of channels (alpha included), `kAlphaIndex` - index of alpha channel.
//!   - `kIsFloat` - whether the channels are floating point (no rounding bias, no integer shifts).
//!   - `base_mask()` - value of a fully saturated channel.
//!   - `get()` / `set()` - channel access by index.
//!   - `from_accum()` - clamps an accumulated value to the channel range.
template<typename Color>
struct ColorTraits;

namespace Internal {

template<typename Color, typename Value, typename Calc, typename Accum, uint32_t BaseShift>
struct IntColorTraitsBase {
  typedef Value ValueType;
  typedef Calc CalcType;
  typedef Accum AccumType;

  static constexpr bool kIsFloat = false;
  static constexpr uint32_t kBaseShift = BaseShift;

  [[nodiscard]]
  static SW_INLINE_CONSTEXPR ValueType base_mask() noexcept { return ValueType((1u << BaseShift) - 1u); }

  //! Rounding bias used when an accumulator is later shifted right by `shift`.
  [[nodiscard]]
  static SW_INLINE_CONSTEXPR AccumType round_bias(uint32_t shift) noexcept { return AccumType(1) << (shift - 1u); }

  //! Divides an accumulated value by `1 << shift` (the rounding bias must have been already added).
  [[nodiscard]]
  static SW_INLINE_CONSTEXPR AccumType downshift(AccumType v, uint32_t shift) noexcept { return v >> shift; }

  [[nodiscard]]
  static SW_INLINE_CONSTEXPR ValueType from_accum(AccumType v) noexcept {
    return v < AccumType(0) ? ValueType(0) : v > AccumType(base_mask()) ? base_mask() : ValueType(v);
  }

  //! Converts a normalized `[0, 1]` value into a channel value.
  [[nodiscard]]
  static SW_INLINE ValueType from_double(double v) noexcept {
    double x = v * double(base_mask()) + 0.5;
    return x <= 0.0 ? ValueType(0) : x >= double(base_mask()) ? base_mask() : ValueType(x);
  }

  //! Linear interpolation of a single channel `a -> b` at `k` (in `[0, 1]`).
  [[nodiscard]]
  static SW_INLINE ValueType lerp(ValueType a, ValueType b, double k) noexcept {
    double v = double(a) + (double(int(b) - int(a))) * k;
    return from_accum(AccumType(v < 0.0 ? v - 0.5 : v + 0.5));
  }

  //! Multiplies two channel values, as if both were normalized to `[0, 1]`.
  [[nodiscard]]
  static SW_INLINE ValueType multiply(ValueType a, ValueType b) noexcept {
    CalcType t = CalcType(a) * CalcType(b) + CalcType(1u << (BaseShift - 1u));
    return ValueType(((t >> BaseShift) + t) >> BaseShift);
  }
};

template<typename Color>
struct FloatColorTraitsBase {
  typedef float ValueType;
  typedef double CalcType;
  typedef double AccumType;

  static constexpr bool kIsFloat = true;
  static constexpr uint32_t kBaseShift = 0;

  [[nodiscard]]
  static SW_INLINE_CONSTEXPR ValueType base_mask() noexcept { return 1.0f; }

  [[nodiscard]]
  static SW_INLINE_CONSTEXPR AccumType round_bias(uint32_t) noexcept { return 0.0; }

  [[nodiscard]]
  static SW_INLINE_CONSTEXPR AccumType downshift(AccumType v, uint32_t shift) noexcept {
    return v / double(uint64_t(1) << shift);
  }

  [[nodiscard]]
  static SW_INLINE_CONSTEXPR ValueType from_accum(AccumType v) noexcept {
    return v < 0.0 ? 0.0f : v > 1.0 ? 1.0f : ValueType(v);
  }

  [[nodiscard]]
  static SW_INLINE ValueType from_double(double v) noexcept { return from_accum(v); }

  [[nodiscard]]
  static SW_INLINE ValueType lerp(ValueType a, ValueType b, double k) noexcept {
    return ValueType(double(a) + (double(b) - double(a)) * k);
  }

  [[nodiscard]]
  static SW_INLINE ValueType multiply(ValueType a, ValueType b) noexcept { return a * b; }
};

} // {Internal}

template<>
struct ColorTraits<SWGray8> : public Internal::IntColorTraitsBase<SWGray8, uint8_t, uint32_t, int32_t, 8> {
  static constexpr uint32_t kChannels = 2;
  static constexpr uint32_t kAlphaIndex = 1;

  [[nodiscard]]
  static SW_INLINE ValueType get(const SWGray8& c, uint32_t i) noexcept { return i == 0 ? c.v : c.a; }

  static SW_INLINE void set(SWGray8& c, uint32_t i, ValueType v) noexcept {
    if (i == 0) c.v = v; else c.a = v;
  }
};

template<>
struct ColorTraits<SWRgba8> : public Internal::IntColorTraitsBase<SWRgba8, uint8_t, uint32_t, int32_t, 8> {
  static constexpr uint32_t kChannels = 4;
  static constexpr uint32_t kAlphaIndex = 3;

  [[nodiscard]]
  static SW_INLINE ValueType get(const SWRgba8& c, uint32_t i) noexcept {
    return i == 0 ? c.r : i == 1 ? c.g : i == 2 ? c.b : c.a;
  }

  static SW_INLINE void set(SWRgba8& c, uint32_t i, ValueType v) noexcept {
    switch (i) {
      case 0: c.r = v; break;
      case 1: c.g = v; break;
      case 2: c.b = v; break;
      default: c.a = v; break;
    }
  }
};

template<>
struct ColorTraits<SWRgba16> : public Internal::IntColorTraitsBase<SWRgba16, uint16_t, uint32_t, int64_t, 16> {
  static constexpr uint32_t kChannels = 4;
  static constexpr uint32_t kAlphaIndex = 3;

  [[nodiscard]]
  static SW_INLINE ValueType get(const SWRgba16& c, uint32_t i) noexcept {
    return i == 0 ? c.r : i == 1 ? c.g : i == 2 ? c.b : c.a;
  }

  static SW_INLINE void set(SWRgba16& c, uint32_t i, ValueType v) noexcept {
    switch (i) {
      case 0: c.r = v; break;
      case 1: c.g = v; break;
      case 2: c.b = v; break;
      default: c.a = v; break;
    }
  }
};

template<>
struct ColorTraits<SWRgba32f> : public Internal::FloatColorTraitsBase<SWRgba32f> {
  static constexpr uint32_t kChannels = 4;
  static constexpr uint32_t kAlphaIndex = 3;

  [[nodiscard]]
  static SW_INLINE ValueType get(const SWRgba32f& c, uint32_t i) noexcept {
    return i == 0 ? c.r : i == 1 ? c.g : i == 2 ? c.b : c.a;
  }

  static SW_INLINE void set(SWRgba32f& c, uint32_t i, ValueType v) noexcept {
    switch (i) {
      case 0: c.r = v; break;
      case 1: c.g = v; break;
      case 2: c.b = v; break;
      default: c.a = v; break;
    }
  }
};

// sw::ColorOps
// ============

//! Color operations shared by gradients, converters and shaders.
namespace ColorOps {

//! Returns a color that is `k` of the way from `a` to `b`, channel by channel.
template<typename Color>
[[nodiscard]]
static SW_INLINE Color gradient(const Color& a, const Color& b, double k) noexcept {
  using Traits = ColorTraits<Color>;

  Color out;
  for (uint32_t i = 0; i < Traits::kChannels; i++)
    Traits::set(out, i, Traits::lerp(Traits::get(a, i), Traits::get(b, i), k));
  return out;
}

template<typename Color>
[[nodiscard]]
static SW_INLINE typename ColorTraits<Color>::ValueType alpha(const Color& c) noexcept {
  return ColorTraits<Color>::get(c, ColorTraits<Color>::kAlphaIndex);
}

template<typename Color>
static SW_INLINE void set_alpha(Color& c, typename ColorTraits<Color>::ValueType a) noexcept {
  ColorTraits<Color>::set(c, ColorTraits<Color>::kAlphaIndex, a);
}

//! Returns a fully transparent (all zero) color.
template<typename Color>
[[nodiscard]]
static SW_INLINE Color no_color() noexcept {
  Color c;
  c.reset();
  return c;
}

} // {ColorOps}
} // {sw}

//! \}
//! \endcond

#endif // SWATCH_CORE_RGBA_P_H_INCLUDED

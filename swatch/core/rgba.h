// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_CORE_RGBA_H_INCLUDED
#define SWATCH_CORE_RGBA_H_INCLUDED

#include <swatch/core/api.h>

//! \addtogroup sw_colors
//! \{

//! 8-bit gray color with 8-bit alpha.
struct SWGray8 {
  uint8_t v;
  uint8_t a;

#ifdef __cplusplus
  //! \name Construction & Destruction
  //! \{

  SW_INLINE_NODEBUG SWGray8() noexcept = default;
  SW_INLINE_CONSTEXPR SWGray8(const SWGray8&) noexcept = default;

  SW_INLINE_CONSTEXPR explicit SWGray8(uint32_t v_, uint32_t a_ = 0xFFu) noexcept
    : v(uint8_t(v_)),
      a(uint8_t(a_)) {}

  //! \}

  //! \name Overloaded Operators
  //! \{

  SW_INLINE_NODEBUG SWGray8& operator=(const SWGray8& other) noexcept = default;

  [[nodiscard]]
  SW_INLINE_CONSTEXPR bool operator==(const SWGray8& other) const noexcept { return v == other.v && a == other.a; }

  [[nodiscard]]
  SW_INLINE_CONSTEXPR bool operator!=(const SWGray8& other) const noexcept { return !(*this == other); }

  //! \}

  SW_INLINE_NODEBUG void reset() noexcept { v = 0; a = 0; }
#endif
};

//! 32-bit RGBA color (8-bit per component).
struct SWRgba8 {
  uint8_t r;
  uint8_t g;
  uint8_t b;
  uint8_t a;

#ifdef __cplusplus
  //! \name Construction & Destruction
  //! \{

  SW_INLINE_NODEBUG SWRgba8() noexcept = default;
  SW_INLINE_CONSTEXPR SWRgba8(const SWRgba8&) noexcept = default;

  SW_INLINE_CONSTEXPR SWRgba8(uint32_t r_, uint32_t g_, uint32_t b_, uint32_t a_ = 0xFFu) noexcept
    : r(uint8_t(r_)),
      g(uint8_t(g_)),
      b(uint8_t(b_)),
      a(uint8_t(a_)) {}

  //! \}

  //! \name Overloaded Operators
  //! \{

  SW_INLINE_NODEBUG SWRgba8& operator=(const SWRgba8& other) noexcept = default;

  [[nodiscard]]
  SW_INLINE_CONSTEXPR bool operator==(const SWRgba8& other) const noexcept {
    return r == other.r && g == other.g && b == other.b && a == other.a;
  }

  [[nodiscard]]
  SW_INLINE_CONSTEXPR bool operator!=(const SWRgba8& other) const noexcept { return !(*this == other); }

  //! \}

  SW_INLINE_NODEBUG void reset() noexcept { r = 0; g = 0; b = 0; a = 0; }

  //! Tests whether the color is fully-opaque.
  [[nodiscard]]
  SW_INLINE_CONSTEXPR bool is_opaque() const noexcept { return a == 0xFFu; }
#endif
};

//! 64-bit RGBA color (16-bit per component).
struct SWRgba16 {
  uint16_t r;
  uint16_t g;
  uint16_t b;
  uint16_t a;

#ifdef __cplusplus
  SW_INLINE_NODEBUG SWRgba16() noexcept = default;
  SW_INLINE_CONSTEXPR SWRgba16(const SWRgba16&) noexcept = default;

  SW_INLINE_CONSTEXPR SWRgba16(uint32_t r_, uint32_t g_, uint32_t b_, uint32_t a_ = 0xFFFFu) noexcept
    : r(uint16_t(r_)),
      g(uint16_t(g_)),
      b(uint16_t(b_)),
      a(uint16_t(a_)) {}

  SW_INLINE_NODEBUG SWRgba16& operator=(const SWRgba16& other) noexcept = default;

  [[nodiscard]]
  SW_INLINE_CONSTEXPR bool operator==(const SWRgba16& other) const noexcept {
    return r == other.r && g == other.g && b == other.b && a == other.a;
  }

  [[nodiscard]]
  SW_INLINE_CONSTEXPR bool operator!=(const SWRgba16& other) const noexcept { return !(*this == other); }

  SW_INLINE_NODEBUG void reset() noexcept { r = 0; g = 0; b = 0; a = 0; }
#endif
};

//! 128-bit RGBA color (32-bit floating point per component), nominal range is `[0, 1]`.
struct SWRgba32f {
  float r;
  float g;
  float b;
  float a;

#ifdef __cplusplus
  SW_INLINE_NODEBUG SWRgba32f() noexcept = default;
  SW_INLINE_CONSTEXPR SWRgba32f(const SWRgba32f&) noexcept = default;

  SW_INLINE_CONSTEXPR SWRgba32f(float r_, float g_, float b_, float a_ = 1.0f) noexcept
    : r(r_),
      g(g_),
      b(b_),
      a(a_) {}

  SW_INLINE_NODEBUG SWRgba32f& operator=(const SWRgba32f& other) noexcept = default;

  [[nodiscard]]
  SW_INLINE_CONSTEXPR bool operator==(const SWRgba32f& other) const noexcept {
    return r == other.r && g == other.g && b == other.b && a == other.a;
  }

  [[nodiscard]]
  SW_INLINE_CONSTEXPR bool operator!=(const SWRgba32f& other) const noexcept { return !(*this == other); }

  SW_INLINE_NODEBUG void reset() noexcept { r = 0.0f; g = 0.0f; b = 0.0f; a = 0.0f; }
#endif
};

//! Channel order of raw pixel data - index of each channel within a single pixel.
//!
//! Three-channel layouts ignore `a`.
struct SWChannelOrder {
  uint8_t r;
  uint8_t g;
  uint8_t b;
  uint8_t a;

#ifdef __cplusplus
  [[nodiscard]]
  SW_INLINE_CONSTEXPR bool operator==(const SWChannelOrder& other) const noexcept {
    return r == other.r && g == other.g && b == other.b && a == other.a;
  }

  [[nodiscard]]
  SW_INLINE_CONSTEXPR bool operator!=(const SWChannelOrder& other) const noexcept { return !(*this == other); }

  //! Returns index of the channel `i`, where channels are numbered R=0, G=1, B=2, A=3.
  [[nodiscard]]
  SW_INLINE_CONSTEXPR uint32_t index_of(uint32_t i) const noexcept {
    return i == 0 ? r : i == 1 ? g : i == 2 ? b : a;
  }
#endif
};

#ifdef __cplusplus

static constexpr SWChannelOrder sw_channel_order_rgb  = { 0, 1, 2, 3 };
static constexpr SWChannelOrder sw_channel_order_bgr  = { 2, 1, 0, 3 };
static constexpr SWChannelOrder sw_channel_order_rgba = { 0, 1, 2, 3 };
static constexpr SWChannelOrder sw_channel_order_argb = { 1, 2, 3, 0 };
static constexpr SWChannelOrder sw_channel_order_bgra = { 2, 1, 0, 3 };
static constexpr SWChannelOrder sw_channel_order_abgr = { 3, 2, 1, 0 };

#endif // __cplusplus

//! \}

#endif // SWATCH_CORE_RGBA_H_INCLUDED

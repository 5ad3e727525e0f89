// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_SPAN_SPANCONVERTER_P_H_INCLUDED
#define SWATCH_SPAN_SPANCONVERTER_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>
#include <swatch/core/rgba_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {

// sw::SpanConverter
// =================

//! Chains a span generator with a converter that post-processes the generated colors in place.
//!
//! Both parts are referenced, not owned. A part that is not attached is skipped.
template<typename Generator, typename Converter>
class SpanConverter {
public:
  typedef typename Generator::ColorType ColorType;

  Generator* _generator;
  Converter* _converter;

  SW_INLINE_NODEBUG SpanConverter() noexcept
    : _generator(nullptr),
      _converter(nullptr) {}

  SW_INLINE_NODEBUG SpanConverter(Generator& generator, Converter& converter) noexcept
    : _generator(&generator),
      _converter(&converter) {}

  SW_INLINE_NODEBUG void attach_generator(Generator& generator) noexcept { _generator = &generator; }
  SW_INLINE_NODEBUG void attach_converter(Converter& converter) noexcept { _converter = &converter; }

  SW_INLINE void prepare() noexcept {
    if (_generator)
      _generator->prepare();

    if (_converter)
      _converter->prepare();
  }

  SW_INLINE void generate(ColorType* span, int x, int y, uint32_t len) noexcept {
    if (_generator)
      _generator->generate(span, x, y, len);

    if (_converter)
      _converter->generate(span, x, y, len);
  }
};

// sw::SpanConvAlpha
// =================

//! Converter that multiplies the alpha of every color by a constant factor.
template<typename Color>
class SpanConvAlpha {
public:
  typedef Color ColorType;
  typedef ColorTraits<Color> Traits;

  double _alpha;

  SW_INLINE_NODEBUG explicit SpanConvAlpha(double alpha = 1.0) noexcept
    : _alpha(sw_clamp(alpha, 0.0, 1.0)) {}

  [[nodiscard]]
  SW_INLINE_NODEBUG double alpha() const noexcept { return _alpha; }

  SW_INLINE_NODEBUG void set_alpha(double alpha) noexcept { _alpha = sw_clamp(alpha, 0.0, 1.0); }

  SW_INLINE_NODEBUG void prepare() noexcept {}

  SW_INLINE void generate(Color* span, int x, int y, uint32_t len) noexcept {
    sw_unused(x, y);
    for (uint32_t i = 0; i < len; i++) {
      typename Traits::ValueType a = ColorOps::alpha(span[i]);
      ColorOps::set_alpha(span[i], typename Traits::ValueType(double(a) * _alpha));
    }
  }
};

// sw::SpanConvBrightnessAlpha
// ===========================

//! Converter that replaces alpha by a value looked up by the brightness `r + g + b` of each color.
//!
//! The table has `kTableSize` entries indexed by the sum of the RGB channels scaled to 8 bits. When no table is
//! provided a linear ramp is used, so black becomes transparent and white opaque.
template<typename Color>
class SpanConvBrightnessAlpha {
public:
  typedef Color ColorType;
  typedef ColorTraits<Color> Traits;

  SW_STATIC_ASSERT(Traits::kChannels == 4);

  static constexpr uint32_t kTableSize = 256 * 3;

  uint8_t _table[kTableSize];

  SW_INLINE SpanConvBrightnessAlpha() noexcept {
    for (uint32_t i = 0; i < kTableSize; i++)
      _table[i] = uint8_t(i * 255u / (kTableSize - 1u));
  }

  SW_INLINE explicit SpanConvBrightnessAlpha(const uint8_t* table) noexcept {
    memcpy(_table, table, kTableSize);
  }

  [[nodiscard]]
  SW_INLINE_NODEBUG const uint8_t* table() const noexcept { return _table; }

  SW_INLINE_NODEBUG void prepare() noexcept {}

  SW_INLINE void generate(Color* span, int x, int y, uint32_t len) noexcept {
    sw_unused(x, y);
    for (uint32_t i = 0; i < len; i++) {
      uint32_t brightness = channel_to_8bit(span[i].r) + channel_to_8bit(span[i].g) + channel_to_8bit(span[i].b);
      uint32_t index = sw_min<uint32_t>(brightness * (kTableSize - 1u) / 765u, kTableSize - 1u);
      ColorOps::set_alpha(span[i], Traits::from_double(double(_table[index]) / 255.0));
    }
  }

  [[nodiscard]]
  static SW_INLINE uint32_t channel_to_8bit(typename Traits::ValueType v) noexcept {
    if constexpr (Traits::kIsFloat)
      return uint32_t(sw_clamp(double(v), 0.0, 1.0) * 255.0);
    else
      return uint32_t(v) >> (Traits::kBaseShift - 8u);
  }
};

} // {sw}

//! \}
//! \endcond

#endif // SWATCH_SPAN_SPANCONVERTER_P_H_INCLUDED

// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_SPAN_SPANPATTERN_P_H_INCLUDED
#define SWATCH_SPAN_SPANPATTERN_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>
#include <swatch/core/rgba_p.h>
#include <swatch/image/pixelformat_p.h>
#include <swatch/span/spanimagefilter_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {

// sw::SpanPattern
// ===============

//! Copies pixels of a source into a span, starting at `[x + offset_x, y + offset_y]`.
//!
//! Tiling is done by the source, usually an `ImageAccessorWrap`. Formats without alpha produce `alpha()` as the
//! alpha of every pixel, formats with alpha keep the stored one.
template<typename Source>
class SpanPatternBase {
public:
  typedef Source SourceType;
  typedef typename Source::FormatType FormatType;
  typedef typename FormatType::ColorType ColorType;
  typedef ColorTraits<ColorType> Traits;
  typedef typename Traits::ValueType ValueType;

  Source* _source;
  uint32_t _offset_x;
  uint32_t _offset_y;
  ValueType _alpha;

  SW_INLINE SpanPatternBase() noexcept
    : _source(nullptr),
      _offset_x(0),
      _offset_y(0),
      _alpha(Traits::base_mask()) {}

  SW_INLINE SpanPatternBase(Source& source, uint32_t offset_x, uint32_t offset_y) noexcept
    : _source(&source),
      _offset_x(offset_x),
      _offset_y(offset_y),
      _alpha(Traits::base_mask()) {}

  //! \name Accessors
  //! \{

  [[nodiscard]]
  SW_INLINE_NODEBUG Source& source() const noexcept { return *_source; }

  SW_INLINE_NODEBUG void attach(Source& source) noexcept { _source = &source; }

  [[nodiscard]]
  SW_INLINE_NODEBUG uint32_t offset_x() const noexcept { return _offset_x; }

  [[nodiscard]]
  SW_INLINE_NODEBUG uint32_t offset_y() const noexcept { return _offset_y; }

  SW_INLINE_NODEBUG void set_offset_x(uint32_t v) noexcept { _offset_x = v; }
  SW_INLINE_NODEBUG void set_offset_y(uint32_t v) noexcept { _offset_y = v; }

  [[nodiscard]]
  SW_INLINE_NODEBUG ValueType alpha() const noexcept { return _alpha; }

  SW_INLINE_NODEBUG void set_alpha(ValueType v) noexcept { _alpha = v; }

  //! \}

  SW_INLINE_NODEBUG void prepare() noexcept {}

  void generate(ColorType* span, int x, int y, uint32_t len) noexcept {
    using Ops = Internal::ImageFilterOps<FormatType>;

    x += int(_offset_x);
    y += int(_offset_y);

    const uint8_t* offset = _source->pixel_source().offsets();
    const ValueType* p = _source->span(x, y, len);

    for (uint32_t i = 0; i < len; i++) {
      Ops::copy(span[i], p, offset);
      if constexpr (!FormatType::kHasAlpha)
        Traits::set(span[i], Traits::kAlphaIndex, _alpha);

      if (i + 1 < len)
        p = _source->next_x();
    }
  }
};

//! Gray pattern, every pixel gets `alpha()`.
template<typename Source>
class SpanPatternGray : public SpanPatternBase<Source> {
public:
  SW_STATIC_ASSERT(Source::FormatType::kComponents == 1 && !Source::FormatType::kHasAlpha);

  SW_INLINE SpanPatternGray() noexcept {}

  SW_INLINE SpanPatternGray(Source& source, uint32_t offset_x, uint32_t offset_y) noexcept
    : SpanPatternBase<Source>(source, offset_x, offset_y) {}
};

//! RGB pattern, every pixel gets `alpha()`.
template<typename Source>
class SpanPatternRgb : public SpanPatternBase<Source> {
public:
  SW_STATIC_ASSERT(Source::FormatType::kComponents == 3 && !Source::FormatType::kHasAlpha);

  SW_INLINE SpanPatternRgb() noexcept {}

  SW_INLINE SpanPatternRgb(Source& source, uint32_t offset_x, uint32_t offset_y) noexcept
    : SpanPatternBase<Source>(source, offset_x, offset_y) {}
};

//! RGBA pattern, the stored alpha is kept and `alpha()` is ignored.
template<typename Source>
class SpanPatternRgba : public SpanPatternBase<Source> {
public:
  SW_STATIC_ASSERT(Source::FormatType::kComponents == 4 && Source::FormatType::kHasAlpha);

  SW_INLINE SpanPatternRgba() noexcept {}

  SW_INLINE SpanPatternRgba(Source& source, uint32_t offset_x, uint32_t offset_y) noexcept
    : SpanPatternBase<Source>(source, offset_x, offset_y) {}
};

} // {sw}

//! \}
//! \endcond

#endif // SWATCH_SPAN_SPANPATTERN_P_H_INCLUDED

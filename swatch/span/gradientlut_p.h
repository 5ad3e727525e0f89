// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_SPAN_GRADIENTLUT_P_H_INCLUDED
#define SWATCH_SPAN_GRADIENTLUT_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>
#include <swatch/core/rgba_p.h>
#include <swatch/core/trace_p.h>
#include <swatch/span/dda_p.h>
#include <swatch/support/algorithm_p.h>
#include <swatch/support/math_p.h>
#include <swatch/support/podarray_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

#if defined(SW_TRACE_ALL) && !defined(SW_TRACE_GRADIENT_LUT)
  #define SW_TRACE_GRADIENT_LUT
#endif

namespace sw {

#if defined(SW_TRACE_GRADIENT_LUT)
typedef SWDebugTrace GradientLUTTrace;
#else
typedef SWDummyTrace GradientLUTTrace;
#endif

// sw::GradientColorInterpolator
// =============================

//! Interpolates `c1 -> c2` in `len` steps.
//!
//! Integer colors use a 14-bit DDA per channel, so the sequence is exact at both ends. Floating point colors are
//! mixed directly.
template<typename Color, bool IsFloat = ColorTraits<Color>::kIsFloat>
class GradientColorInterpolator {
public:
  typedef ColorTraits<Color> Traits;
  typedef DdaLineInterpolator<14> Dda;

  Dda _channels[Traits::kChannels];

  SW_INLINE GradientColorInterpolator(const Color& c1, const Color& c2, uint32_t len) noexcept {
    for (uint32_t i = 0; i < Traits::kChannels; i++)
      _channels[i] = Dda(int(Traits::get(c1, i)), int(Traits::get(c2, i)), len);
  }

  SW_INLINE void next() noexcept {
    for (uint32_t i = 0; i < Traits::kChannels; i++)
      _channels[i].inc();
  }

  [[nodiscard]]
  SW_INLINE Color color() const noexcept {
    Color c;
    for (uint32_t i = 0; i < Traits::kChannels; i++)
      Traits::set(c, i, Traits::from_accum(typename Traits::AccumType(_channels[i].y())));
    return c;
  }
};

template<typename Color>
class GradientColorInterpolator<Color, true> {
public:
  Color _c1;
  Color _c2;
  uint32_t _len;
  uint32_t _count;

  SW_INLINE GradientColorInterpolator(const Color& c1, const Color& c2, uint32_t len) noexcept
    : _c1(c1),
      _c2(c2),
      _len(len ? len : 1u),
      _count(0) {}

  SW_INLINE void next() noexcept { _count++; }

  [[nodiscard]]
  SW_INLINE Color color() const noexcept { return ColorOps::gradient(_c1, _c2, double(_count) / double(_len)); }
};

// sw::GradientLUT
// ===============

//! Color stop.
template<typename Color>
struct GradientStop {
  double offset;
  Color color;
};

//! Multi-stop color function - a table of `N` colors built from color stops.
//!
//! Stops are accumulated by `add_color()` and turned into the table by `build_lut()`, which must be called before
//! the LUT is used by a span generator. The table is read-only during rendering.
template<typename Color, uint32_t N = 256>
class GradientLUT {
public:
  SW_NONCOPYABLE(GradientLUT)

  typedef Color ColorType;
  typedef GradientStop<Color> Stop;

  static constexpr uint32_t kSize = N;

  PodArray<Stop> _stops;
  Color _lut[N];

  SW_INLINE GradientLUT() noexcept { clear_lut(); }

  //! \name Color Stops
  //! \{

  SW_INLINE void remove_all() noexcept { _stops.clear(); }

  //! Adds a color stop, `offset` is clamped to `[0, 1]`.
  SW_INLINE SWResult add_color(double offset, const Color& color) noexcept {
    // NaN is treated as zero.
    if (!(offset >= 0.0))
      offset = 0.0;
    else if (offset > 1.0)
      offset = 1.0;

    return _stops.append(Stop{offset, color});
  }

  [[nodiscard]]
  SW_INLINE_NODEBUG size_t stop_count() const noexcept { return _stops.size(); }

  //! \}

  //! \name Table
  //! \{

  [[nodiscard]]
  static SW_INLINE_CONSTEXPR uint32_t size() noexcept { return N; }

  [[nodiscard]]
  SW_INLINE_NODEBUG const Color& operator[](uint32_t i) const noexcept { return _lut[i]; }

  //! Returns a color at `i`, clamped to the table range.
  [[nodiscard]]
  SW_INLINE_NODEBUG const Color& at(uint32_t i) const noexcept { return _lut[sw_min(i, N - 1u)]; }

  [[nodiscard]]
  SW_INLINE_NODEBUG const Color* data() const noexcept { return _lut; }

  SW_INLINE void clear_lut() noexcept {
    Color c = ColorOps::no_color<Color>();
    for (uint32_t i = 0; i < N; i++)
      _lut[i] = c;
  }

  //! Sorts stops, removes duplicates and fills the table.
  //!
  //! Stops are sorted by their offsets, stops that share an offset keep their insertion order and only the first
  //! of them is kept. No stops clear the table to a transparent color, a single stop fills the whole table.
  SW_NOINLINE SWResult build_lut() noexcept {
    GradientLUTTrace trace;
    trace.info("GradientLUT::build_lut() StopCount=%zu Size=%u\n", _stops.size(), N);
    trace.indent();

    size_t n = _normalize_stops();
    if (n != _stops.size())
      trace.info("Removed %zu duplicate stop(s)\n", _stops.size() - n);
    _stops.truncate(n);

    if (n == 0) {
      trace.warn("No color stops, the table is cleared\n");
      trace.deindent();
      clear_lut();
      return SW_SUCCESS;
    }

    if (n == 1) {
      trace.info("Single stop at %f fills the table\n", _stops[0].offset);
      trace.deindent();
      for (uint32_t i = 0; i < N; i++)
        _lut[i] = _stops[0].color;
      return SW_SUCCESS;
    }

    uint32_t start = sw_min(Math::uround(_stops[0].offset * double(N)), N);
    uint32_t end = start;

    for (uint32_t i = 0; i < start; i++)
      _lut[i] = _stops[0].color;

    for (size_t s = 1; s < n; s++) {
      end = sw_min(Math::uround(_stops[s].offset * double(N)), N);
      trace.info("Segment #%zu [%u, %u)\n", s, start, end);

      GradientColorInterpolator<Color> ci(_stops[s - 1].color, _stops[s].color, end - start + 1u);
      while (start < end) {
        _lut[start] = ci.color();
        ci.next();
        start++;
      }
    }

    const Color& last = _stops.last().color;
    for (; end < N; end++)
      _lut[end] = last;
    _lut[N - 1] = last;

    trace.deindent();
    return SW_SUCCESS;
  }

  //! \}

  //! Stable sort of stops by offset followed by removal of stops with duplicate offsets. Returns the new count.
  SW_INLINE size_t _normalize_stops() noexcept {
    size_t n = _stops.size();
    if (n < 2)
      return n;

    // Insertion sort keeps stops that share an offset in insertion order.
    insertion_sort(_stops.data(), n, [](const Stop& a, const Stop& b) noexcept -> int {
      return a.offset < b.offset ? -1 : a.offset > b.offset ? 1 : 0;
    });

    Stop* stops = _stops.data();
    size_t j = 1;
    for (size_t i = 1; i < n; i++) {
      if (stops[i].offset != stops[j - 1].offset)
        stops[j++] = stops[i];
    }
    return j;
  }
};

} // {sw}

//! \}
//! \endcond

#endif // SWATCH_SPAN_GRADIENTLUT_P_H_INCLUDED

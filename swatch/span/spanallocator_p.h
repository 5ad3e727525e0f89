// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_SPAN_SPANALLOCATOR_P_H_INCLUDED
#define SWATCH_SPAN_SPANALLOCATOR_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>
#include <swatch/support/intops_p.h>
#include <swatch/support/podarray_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {

// sw::SpanAllocator
// =================

//! Scratch buffer a renderer passes to span generators.
//!
//! The buffer only grows, in steps of `kGranularity` colors, and is zeroed on each allocation. The returned pointer
//! is valid until the next call to `allocate()`.
template<typename Color>
class SpanAllocator {
public:
  SW_NONCOPYABLE(SpanAllocator)

  static constexpr size_t kGranularity = 256;

  PodArray<Color> _span;

  SW_INLINE_NODEBUG SpanAllocator() noexcept = default;

  //! Returns a zeroed buffer of at least `len` colors or null if the allocation failed.
  [[nodiscard]]
  SW_INLINE Color* allocate(size_t len) noexcept {
    if (len > _span.size()) {
      if (_span.resize(IntOps::align_up(len, kGranularity)) != SW_SUCCESS)
        return nullptr;
    }

    memset(static_cast<void*>(_span.data()), 0, _span.size() * sizeof(Color));
    return _span.data();
  }

  [[nodiscard]]
  SW_INLINE_NODEBUG Color* span() noexcept { return _span.data(); }

  [[nodiscard]]
  SW_INLINE_NODEBUG size_t max_span_len() const noexcept { return _span.size(); }
};

} // {sw}

//! \}
//! \endcond

#endif // SWATCH_SPAN_SPANALLOCATOR_P_H_INCLUDED

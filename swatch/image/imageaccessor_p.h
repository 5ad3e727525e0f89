// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_IMAGE_IMAGEACCESSOR_P_H_INCLUDED
#define SWATCH_IMAGE_IMAGEACCESSOR_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>
#include <swatch/image/pixelformat_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {

//! \name Image Accessors
//!
//! Accessors walk a `PixelSource` the way image filters read it: `span(x, y, len)` positions the accessor at the
//! first pixel of a filter row, `next_x()` advances to the next pixel in that row, and `next_y()` returns to the
//! starting column of the next row. Each call returns a pointer to the stored channels of the pixel. What happens
//! outside of the image depends on the accessor.
//!
//! \{

// sw::ImageAccessorClip
// =====================

//! Returns a background color for pixels outside of the image.
template<typename Format>
class ImageAccessorClip {
public:
  typedef Format FormatType;
  typedef PixelSource<Format> SourceType;
  typedef typename Format::ColorType ColorType;
  typedef typename Format::ValueType ValueType;

  const SourceType* _source;
  ValueType _background[Format::kComponents];
  int _x;
  int _x0;
  int _y;
  const ValueType* _pix_ptr;

  SW_INLINE ImageAccessorClip(const SourceType& source, const ColorType& background) noexcept
    : _source(&source),
      _x(0),
      _x0(0),
      _y(0),
      _pix_ptr(nullptr) {
    set_background(background);
  }

  SW_INLINE_NODEBUG void attach(const SourceType& source) noexcept { _source = &source; }

  [[nodiscard]]
  SW_INLINE_NODEBUG const SourceType& pixel_source() const noexcept { return *_source; }

  SW_INLINE void set_background(const ColorType& background) noexcept { _source->store_color(_background, background); }

  SW_INLINE const ValueType* span(int x, int y, uint32_t len) noexcept {
    _x = _x0 = x;
    _y = y;

    if (y >= 0 && y < _source->height() && x >= 0 && int64_t(x) + int64_t(len) <= int64_t(_source->width())) {
      _pix_ptr = _source->pix_ptr(x, y);
      return _pix_ptr;
    }

    _pix_ptr = nullptr;
    return pixel();
  }

  SW_INLINE const ValueType* next_x() noexcept {
    if (_pix_ptr) {
      _pix_ptr += Format::kComponents;
      return _pix_ptr;
    }

    _x++;
    return pixel();
  }

  SW_INLINE const ValueType* next_y() noexcept {
    _y++;
    _x = _x0;

    if (_pix_ptr && _y >= 0 && _y < _source->height()) {
      _pix_ptr = _source->pix_ptr(_x, _y);
      return _pix_ptr;
    }

    _pix_ptr = nullptr;
    return pixel();
  }

private:
  SW_INLINE const ValueType* pixel() const noexcept {
    if (_y >= 0 && _y < _source->height() && _x >= 0 && _x < _source->width())
      return _source->pix_ptr(_x, _y);
    return _background;
  }
};

// sw::ImageAccessorNoClip
// =======================

//! Reads pixels without any bounds checking, the caller guarantees all accesses are inside of the image.
template<typename Format>
class ImageAccessorNoClip {
public:
  typedef Format FormatType;
  typedef PixelSource<Format> SourceType;
  typedef typename Format::ValueType ValueType;

  const SourceType* _source;
  int _x;
  int _y;
  const ValueType* _pix_ptr;

  SW_INLINE explicit ImageAccessorNoClip(const SourceType& source) noexcept
    : _source(&source),
      _x(0),
      _y(0),
      _pix_ptr(nullptr) {}

  SW_INLINE_NODEBUG void attach(const SourceType& source) noexcept { _source = &source; }

  [[nodiscard]]
  SW_INLINE_NODEBUG const SourceType& pixel_source() const noexcept { return *_source; }

  SW_INLINE const ValueType* span(int x, int y, uint32_t len) noexcept {
    sw_unused(len);
    _x = x;
    _y = y;
    _pix_ptr = _source->pix_ptr(x, y);
    return _pix_ptr;
  }

  SW_INLINE const ValueType* next_x() noexcept {
    _pix_ptr += Format::kComponents;
    return _pix_ptr;
  }

  SW_INLINE const ValueType* next_y() noexcept {
    _y++;
    _pix_ptr = _source->pix_ptr(_x, _y);
    return _pix_ptr;
  }
};

// sw::ImageAccessorClone
// ======================

//! Returns the nearest edge pixel for pixels outside of the image.
template<typename Format>
class ImageAccessorClone {
public:
  typedef Format FormatType;
  typedef PixelSource<Format> SourceType;
  typedef typename Format::ValueType ValueType;

  const SourceType* _source;
  int _x;
  int _x0;
  int _y;
  const ValueType* _pix_ptr;

  SW_INLINE explicit ImageAccessorClone(const SourceType& source) noexcept
    : _source(&source),
      _x(0),
      _x0(0),
      _y(0),
      _pix_ptr(nullptr) {}

  SW_INLINE_NODEBUG void attach(const SourceType& source) noexcept { _source = &source; }

  [[nodiscard]]
  SW_INLINE_NODEBUG const SourceType& pixel_source() const noexcept { return *_source; }

  SW_INLINE const ValueType* span(int x, int y, uint32_t len) noexcept {
    _x = _x0 = x;
    _y = y;

    if (y >= 0 && y < _source->height() && x >= 0 && int64_t(x) + int64_t(len) <= int64_t(_source->width())) {
      _pix_ptr = _source->pix_ptr(x, y);
      return _pix_ptr;
    }

    _pix_ptr = nullptr;
    return pixel();
  }

  SW_INLINE const ValueType* next_x() noexcept {
    if (_pix_ptr) {
      _pix_ptr += Format::kComponents;
      return _pix_ptr;
    }

    _x++;
    return pixel();
  }

  SW_INLINE const ValueType* next_y() noexcept {
    _y++;
    _x = _x0;

    if (_pix_ptr && _y >= 0 && _y < _source->height()) {
      _pix_ptr = _source->pix_ptr(_x, _y);
      return _pix_ptr;
    }

    _pix_ptr = nullptr;
    return pixel();
  }

private:
  SW_INLINE const ValueType* pixel() const noexcept {
    int x = sw_clamp(_x, 0, _source->width() - 1);
    int y = sw_clamp(_y, 0, _source->height() - 1);
    return _source->pix_ptr(x, y);
  }
};

// sw::WrapMode
// ============

//! Wrap modes map an unbounded coordinate into `[0, size)`.
//!
//! `operator()(v)` maps `v` and remembers the position, `operator++()` advances it by one and returns the mapped
//! value. Negative coordinates are shifted by a large multiple of the period before the modulo.

//! Tiles the image.
class WrapModeRepeat {
public:
  uint32_t _size;
  uint32_t _add;
  uint32_t _value;

  SW_INLINE explicit WrapModeRepeat(uint32_t size) noexcept
    : _size(size),
      _add(size * (0x3FFFFFFFu / size)),
      _value(0) {}

  SW_INLINE uint32_t operator()(int v) noexcept {
    _value = (uint32_t(v) + _add) % _size;
    return _value;
  }

  SW_INLINE uint32_t operator++() noexcept {
    if (++_value >= _size)
      _value = 0;
    return _value;
  }
};

//! Tiles the image, only uses the largest power of two not greater than `size`.
class WrapModeRepeatPow2 {
public:
  uint32_t _mask;
  uint32_t _value;

  SW_INLINE explicit WrapModeRepeatPow2(uint32_t size) noexcept
    : _mask(1),
      _value(0) {
    while (_mask < size)
      _mask = (_mask << 1) | 1u;
    _mask >>= 1;
  }

  SW_INLINE uint32_t operator()(int v) noexcept {
    _value = uint32_t(v) & _mask;
    return _value;
  }

  SW_INLINE uint32_t operator++() noexcept {
    if (++_value > _mask)
      _value = 0;
    return _value;
  }
};

//! Tiles the image, uses masking if `size` is a power of two, and modulo otherwise.
class WrapModeRepeatAutoPow2 {
public:
  uint32_t _size;
  uint32_t _add;
  uint32_t _mask;
  uint32_t _value;

  SW_INLINE explicit WrapModeRepeatAutoPow2(uint32_t size) noexcept
    : _size(size),
      _add(size * (0x3FFFFFFFu / size)),
      _mask((size & (size - 1u)) ? 0u : size - 1u),
      _value(0) {}

  SW_INLINE uint32_t operator()(int v) noexcept {
    if (_mask)
      _value = uint32_t(v) & _mask;
    else
      _value = (uint32_t(v) + _add) % _size;
    return _value;
  }

  SW_INLINE uint32_t operator++() noexcept {
    if (++_value >= _size)
      _value = 0;
    return _value;
  }
};

//! Tiles the image mirrored every other period.
class WrapModeReflect {
public:
  uint32_t _size;
  uint32_t _size2;
  uint32_t _add;
  uint32_t _value;

  SW_INLINE explicit WrapModeReflect(uint32_t size) noexcept
    : _size(size),
      _size2(size * 2u),
      _add(_size2 * (0x3FFFFFFFu / _size2)),
      _value(0) {}

  SW_INLINE uint32_t operator()(int v) noexcept {
    _value = (uint32_t(v) + _add) % _size2;
    return reflected();
  }

  SW_INLINE uint32_t operator++() noexcept {
    if (++_value >= _size2)
      _value = 0;
    return reflected();
  }

private:
  SW_INLINE_NODEBUG uint32_t reflected() const noexcept { return _value >= _size ? _size2 - _value - 1u : _value; }
};

//! Mirrored tiling with a period of the smallest power of two not less than `size`.
class WrapModeReflectPow2 {
public:
  uint32_t _size;
  uint32_t _mask;
  uint32_t _value;

  SW_INLINE explicit WrapModeReflectPow2(uint32_t size) noexcept
    : _size(size),
      _mask(1),
      _value(0) {
    while (_mask < size)
      _mask = (_mask << 1) | 1u;
  }

  SW_INLINE uint32_t operator()(int v) noexcept {
    _value = uint32_t(v) & _mask;
    return reflected();
  }

  SW_INLINE uint32_t operator++() noexcept {
    _value = (_value + 1u) & _mask;
    return reflected();
  }

private:
  SW_INLINE_NODEBUG uint32_t reflected() const noexcept { return _value >= _size ? _mask - _value : _value; }
};

//! Mirrored tiling, uses masking if `size * 2` is a power of two, and modulo otherwise.
class WrapModeReflectAutoPow2 {
public:
  uint32_t _size;
  uint32_t _size2;
  uint32_t _add;
  uint32_t _mask;
  uint32_t _value;

  SW_INLINE explicit WrapModeReflectAutoPow2(uint32_t size) noexcept
    : _size(size),
      _size2(size * 2u),
      _add(_size2 * (0x3FFFFFFFu / _size2)),
      _mask((_size2 & (_size2 - 1u)) ? 0u : _size2 - 1u),
      _value(0) {}

  SW_INLINE uint32_t operator()(int v) noexcept {
    if (_mask)
      _value = uint32_t(v) & _mask;
    else
      _value = (uint32_t(v) + _add) % _size2;
    return reflected();
  }

  SW_INLINE uint32_t operator++() noexcept {
    if (++_value >= _size2)
      _value = 0;
    return reflected();
  }

private:
  SW_INLINE_NODEBUG uint32_t reflected() const noexcept { return _value >= _size ? _size2 - _value - 1u : _value; }
};

// sw::ImageAccessorWrap
// =====================

//! Tiles the image in both directions according to `WrapX` and `WrapY` wrap modes.
//!
//! The source must not be empty.
template<typename Format, typename WrapX, typename WrapY>
class ImageAccessorWrap {
public:
  typedef Format FormatType;
  typedef PixelSource<Format> SourceType;
  typedef typename Format::ValueType ValueType;

  const SourceType* _source;
  const uint8_t* _row_ptr;
  int _x;
  WrapX _wrap_x;
  WrapY _wrap_y;

  SW_INLINE explicit ImageAccessorWrap(const SourceType& source) noexcept
    : _source(&source),
      _row_ptr(nullptr),
      _x(0),
      _wrap_x(uint32_t(source.width())),
      _wrap_y(uint32_t(source.height())) {}

  SW_INLINE void attach(const SourceType& source) noexcept {
    _source = &source;
    _wrap_x = WrapX(uint32_t(source.width()));
    _wrap_y = WrapY(uint32_t(source.height()));
  }

  [[nodiscard]]
  SW_INLINE_NODEBUG const SourceType& pixel_source() const noexcept { return *_source; }

  SW_INLINE const ValueType* span(int x, int y, uint32_t len) noexcept {
    sw_unused(len);
    _x = x;
    _row_ptr = _source->row_ptr(int(_wrap_y(y)));
    return pixel_at(_wrap_x(x));
  }

  SW_INLINE const ValueType* next_x() noexcept {
    return pixel_at(++_wrap_x);
  }

  SW_INLINE const ValueType* next_y() noexcept {
    _row_ptr = _source->row_ptr(int(++_wrap_y));
    return pixel_at(_wrap_x(_x));
  }

private:
  SW_INLINE const ValueType* pixel_at(uint32_t x) const noexcept {
    return reinterpret_cast<const ValueType*>(_row_ptr + size_t(x) * Format::kPixelSize);
  }
};

//! \}

} // {sw}

//! \}
//! \endcond

#endif // SWATCH_IMAGE_IMAGEACCESSOR_P_H_INCLUDED

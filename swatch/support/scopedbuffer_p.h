// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_SUPPORT_SCOPEDBUFFER_P_H_INCLUDED
#define SWATCH_SUPPORT_SCOPEDBUFFER_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {

// sw::ScopedBuffer
// ================

//! Scratch memory of setup code, released when the buffer goes out of scope.
//!
//! `alloc()` keeps the current block when it's large enough, otherwise the block is replaced by a heap allocation.
//! The content is not preserved and the returned memory is uninitialized.
class ScopedBuffer {
public:
  SW_NONCOPYABLE(ScopedBuffer)

  void* _mem;
  void* _storage;
  size_t _capacity;

  SW_INLINE ScopedBuffer() noexcept
    : _mem(nullptr),
      _storage(nullptr),
      _capacity(0) {}

  SW_INLINE ~ScopedBuffer() noexcept { release(); }

  //! Returns at least `size` bytes or null if the allocation failed.
  [[nodiscard]]
  SW_INLINE void* alloc(size_t size) noexcept {
    if (size <= _capacity)
      return _mem;

    release();
    _mem = malloc(size);
    _capacity = _mem ? size : size_t(0);
    return _mem;
  }

  //! Returns an array of `n` items or null if the allocation failed or its size doesn't fit into `size_t`.
  template<typename T>
  [[nodiscard]]
  SW_INLINE T* alloc_t(size_t n) noexcept {
    if (n > SIZE_MAX / sizeof(T))
      return nullptr;
    return static_cast<T*>(alloc(n * sizeof(T)));
  }

protected:
  SW_INLINE ScopedBuffer(void* storage, size_t capacity) noexcept
    : _mem(storage),
      _storage(storage),
      _capacity(capacity) {}

  SW_INLINE void release() noexcept {
    if (_mem != _storage)
      free(_mem);
  }
};

//! Scratch memory that starts with `N` bytes of embedded storage.
template<size_t N>
class ScopedBufferTmp : public ScopedBuffer {
public:
  SW_NONCOPYABLE(ScopedBufferTmp)

  alignas(16) uint8_t _embedded[N];

  SW_INLINE ScopedBufferTmp() noexcept
    : ScopedBuffer(_embedded, N) {}
};

} // {sw}

//! \}
//! \endcond

#endif // SWATCH_SUPPORT_SCOPEDBUFFER_P_H_INCLUDED

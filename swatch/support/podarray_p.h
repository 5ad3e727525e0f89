// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_SUPPORT_PODARRAY_P_H_INCLUDED
#define SWATCH_SUPPORT_PODARRAY_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {

//! \name POD Array
//! \{

//! Owned, heap allocated array of trivially copyable items.
//!
//! Used by objects that rebuild their tables or buffers on demand (filter weights, gradient stops, distance fields).
//! Growing never preserves more than `size()` items and never shrinks the capacity.
template<typename T>
class PodArray {
public:
  SW_NONCOPYABLE(PodArray)
  SW_STATIC_ASSERT(std::is_trivially_copyable<T>::value);

  T* _data = nullptr;
  size_t _size = 0;
  size_t _capacity = 0;

  SW_INLINE_NODEBUG PodArray() noexcept = default;

  SW_INLINE PodArray(PodArray&& other) noexcept
    : _data(other._data),
      _size(other._size),
      _capacity(other._capacity) {
    other._data = nullptr;
    other._size = 0;
    other._capacity = 0;
  }

  SW_INLINE ~PodArray() noexcept { free(_data); }

  SW_INLINE PodArray& operator=(PodArray&& other) noexcept {
    if (this != &other) {
      free(_data);
      _data = other._data;
      _size = other._size;
      _capacity = other._capacity;
      other._data = nullptr;
      other._size = 0;
      other._capacity = 0;
    }
    return *this;
  }

  //! \name Accessors
  //! \{

  [[nodiscard]]
  SW_INLINE_NODEBUG bool empty() const noexcept { return _size == 0; }

  [[nodiscard]]
  SW_INLINE_NODEBUG size_t size() const noexcept { return _size; }

  [[nodiscard]]
  SW_INLINE_NODEBUG size_t capacity() const noexcept { return _capacity; }

  [[nodiscard]]
  SW_INLINE_NODEBUG T* data() noexcept { return _data; }

  [[nodiscard]]
  SW_INLINE_NODEBUG const T* data() const noexcept { return _data; }

  [[nodiscard]]
  SW_INLINE T& operator[](size_t i) noexcept {
    SW_ASSERT(i < _size);
    return _data[i];
  }

  [[nodiscard]]
  SW_INLINE const T& operator[](size_t i) const noexcept {
    SW_ASSERT(i < _size);
    return _data[i];
  }

  [[nodiscard]]
  SW_INLINE T& last() noexcept {
    SW_ASSERT(_size > 0);
    return _data[_size - 1];
  }

  //! \}

  //! \name Modification
  //! \{

  SW_INLINE void clear() noexcept { _size = 0; }

  //! Truncates the array to at most `n` items.
  SW_INLINE void truncate(size_t n) noexcept { _size = sw_min(n, _size); }

  SW_INLINE void reset() noexcept {
    free(_data);
    _data = nullptr;
    _size = 0;
    _capacity = 0;
  }

  SW_NOINLINE SWResult reserve(size_t n) noexcept {
    if (n <= _capacity)
      return SW_SUCCESS;

    if (n > SIZE_MAX / sizeof(T))
      return sw_make_error(SW_ERROR_OUT_OF_MEMORY);

    T* new_data = static_cast<T*>(realloc(_data, n * sizeof(T)));
    SW_RETURN_ERROR_IF_NULL(new_data);

    _data = new_data;
    _capacity = n;
    return SW_SUCCESS;
  }

  //! Resizes the array to `n` items, new items are left uninitialized.
  SW_INLINE SWResult resize(size_t n) noexcept {
    SW_PROPAGATE(reserve(n));
    _size = n;
    return SW_SUCCESS;
  }

  //! Resizes the array to `n` items and fills all of them with `value`.
  SW_INLINE SWResult resize_fill(size_t n, const T& value) noexcept {
    SW_PROPAGATE(resize(n));
    for (size_t i = 0; i < n; i++)
      _data[i] = value;
    return SW_SUCCESS;
  }

  SW_INLINE SWResult append(const T& item) noexcept {
    if (_size == _capacity)
      SW_PROPAGATE(reserve(_capacity < 8 ? size_t(8) : _capacity * 2));

    _data[_size++] = item;
    return SW_SUCCESS;
  }

  //! Removes the item at `index`, moving the remaining items.
  SW_INLINE void remove_at(size_t index) noexcept {
    SW_ASSERT(index < _size);
    memmove(_data + index, _data + index + 1, (_size - index - 1) * sizeof(T));
    _size--;
  }

  //! \}
};

//! \}

} // {sw}

//! \}
//! \endcond

#endif // SWATCH_SUPPORT_PODARRAY_P_H_INCLUDED

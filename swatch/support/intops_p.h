// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_SUPPORT_INTOPS_P_H_INCLUDED
#define SWATCH_SUPPORT_INTOPS_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {

//! Integer utilities.
namespace IntOps {

template<typename T>
using UIntByType = std::make_unsigned_t<T>;

//! \name Alignment Operations
//! \{

//! Tests whether the `x` is a power of two (only one bit is set).
template<typename T>
[[nodiscard]]
static SW_INLINE_CONSTEXPR bool is_power_of_2(const T& x) noexcept {
  using U = UIntByType<T>;
  U x_minus_1 = U(U(x) - U(1));
  return U(U(x) ^ x_minus_1) > x_minus_1;
}

template<typename X, typename Y>
[[nodiscard]]
static SW_INLINE_CONSTEXPR X align_up(const X& x, const Y& alignment) noexcept {
  using U = UIntByType<X>;
  return (X)( ((U)x + ((U)(alignment) - 1u)) & ~((U)(alignment) - 1u) );
}

//! \}

//! \name Bit Operations
//! \{

//! Returns a mask that has the lowest `n` bits set.
template<typename T>
[[nodiscard]]
static SW_INLINE_CONSTEXPR T lsb_mask(uint32_t n) noexcept {
  using U = UIntByType<T>;
  return n >= sizeof(T) * 8u ? T(~U(0)) : T((U(1) << n) - 1u);
}

//! Returns index of the most significant bit set of `x`, or zero if `x` is zero.
[[nodiscard]]
static SW_INLINE_CONSTEXPR uint32_t msb_index(uint32_t x) noexcept {
  uint32_t n = 0;
  while (x > 1u) {
    x >>= 1;
    n++;
  }
  return n;
}

//! \}

//! \name Clamping
//! \{

template<typename T>
[[nodiscard]]
static SW_INLINE_CONSTEXPR uint8_t clamp_to_byte(const T& x) noexcept {
  return x < T(0) ? uint8_t(0) : x > T(255) ? uint8_t(255) : uint8_t(x);
}

//! \}

} // {IntOps}
} // {sw}

//! \}
//! \endcond

#endif // SWATCH_SUPPORT_INTOPS_P_H_INCLUDED

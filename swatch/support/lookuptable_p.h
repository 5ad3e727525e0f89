// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_SUPPORT_LOOKUPTABLE_P_H_INCLUDED
#define SWATCH_SUPPORT_LOOKUPTABLE_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {

//! \name Compile-Time Lookup Table
//! \{

//! Struct that holds `N` items of `T` type - output of lookup table generators.
template<typename T, size_t N>
struct LookupTable {
  T data[N];

  SW_INLINE_CONSTEXPR size_t size() const noexcept { return N; }
  SW_INLINE constexpr const T& operator[](size_t i) const noexcept { return data[i]; }
};

namespace Internal {
namespace {

template<typename T, size_t N, class Gen, size_t... Indexes>
SW_INLINE_CONSTEXPR LookupTable<T, N> make_lookup_table_impl(std::index_sequence<Indexes...>) noexcept {
  return LookupTable<T, N> {{ T(Gen::value(Indexes))... }};
}

} // {anonymous}
} // {Internal}

//! Creates a lookup table of `LookupTable<T[N]>` by using the generator `Gen`.
template<typename T, size_t N, class Gen>
static SW_INLINE_CONSTEXPR LookupTable<T, N> make_lookup_table() noexcept {
  // Make sure the table is a constant expression - we never want to have it runtime initialized.
  constexpr LookupTable<T, N> table = Internal::make_lookup_table_impl<T, N, Gen>(std::make_index_sequence<N>{});

  return table;
}

#define SW_CONSTEXPR_TABLE(Name, Generator, T, N) \
  static constexpr const LookupTable<T, N> Name##_constexpr = make_lookup_table<T, N, Generator>(); \
  const LookupTable<T, N> Name = Name##_constexpr

//! \}

} // {sw}

//! \}
//! \endcond

#endif // SWATCH_SUPPORT_LOOKUPTABLE_P_H_INCLUDED

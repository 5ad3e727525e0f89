// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_SUPPORT_ALGORITHM_P_H_INCLUDED
#define SWATCH_SUPPORT_ALGORITHM_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {

//! \name Sorting
//! \{

enum class SortOrder : uint32_t {
  kAscending = 0,
  kDescending = 1
};

//! A helper class that provides comparison of any user-defined type that
//! implements `<` and `>` operators (primitive types are supported as well).
template<SortOrder Order = SortOrder::kAscending>
struct CompareOp {
  template<typename A, typename B>
  SW_INLINE int operator()(const A& a, const B& b) const noexcept {
    return (Order == SortOrder::kAscending) ? (a < b ? -1 : a > b ?  1 : 0)
                                            : (a < b ?  1 : a > b ? -1 : 0);
  }
};

//! Insertion sort (stable).
template<typename T, typename Compare = CompareOp<SortOrder::kAscending>>
static SW_INLINE void insertion_sort(T* base, size_t size, const Compare& cmp = Compare()) noexcept {
  for (T* pm = base + 1; pm < base + size; pm++)
    for (T* pl = pm; pl > base && cmp(pl[-1], pl[0]) > 0; pl--)
      SWInternal::swap(pl[-1], pl[0]);
}

//! \}

} // {sw}

//! \}
//! \endcond

#endif // SWATCH_SUPPORT_ALGORITHM_P_H_INCLUDED

// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <swatch/core/api-build_p.h>
#include <swatch/support/lookuptable_p.h>
#include <swatch/support/math_p.h>

namespace sw {
namespace Math {

// sw::Math - Tables
// =================

struct SqrtTableGen {
  //! Returns `round(sqrt(i) * 2048)` computed on integers, so the table is a constant expression.
  static constexpr uint16_t value(size_t i) noexcept {
    uint64_t n = uint64_t(i) << 22;
    uint64_t lo = 0;
    uint64_t hi = 65536;

    while (lo < hi) {
      uint64_t mid = (lo + hi + 1) >> 1;
      if (mid * mid <= n)
        lo = mid;
      else
        hi = mid - 1;
    }

    if (n - lo * lo > lo)
      lo++;
    return uint16_t(lo);
  }
};

struct MsbTableGen {
  static constexpr uint8_t value(size_t i) noexcept {
    uint8_t n = 0;
    while (i > 1u) {
      i >>= 1;
      n++;
    }
    return n;
  }
};

SW_CONSTEXPR_TABLE(sqrt_table, SqrtTableGen, uint16_t, 1024);
SW_CONSTEXPR_TABLE(msb_table, MsbTableGen, uint8_t, 256);

// sw::Math - Bessel Function
// ==========================

double bessel_j(double x, int n) noexcept {
  if (n < 0)
    return 0.0;

  constexpr double kPrecision = 1e-6;
  constexpr uint32_t kMaxRounds = 100;

  double ax = ::fabs(x);
  if (ax <= kPrecision)
    return n != 0 ? 0.0 : 1.0;

  // Starting order for the downward recurrence.
  int m1 = int(ax) + 6;
  if (ax > 5.0)
    m1 = int(::fabs(1.4 * x + 60.0 / x));

  int m2 = int(n + 2 + ax / 4.0);
  if (m1 > m2)
    m2 = m1;

  double b = 0.0;
  double b_prev = 0.0;

  for (uint32_t round = 0; round < kMaxRounds; round++) {
    double c2 = 1e-30;
    double c3 = 0.0;
    double c4 = 0.0;
    int sign = (m2 & 1) ? 1 : -1;

    for (int i = 1; i <= m2 - 2; i++) {
      double c6 = 2.0 * (m2 - i) * c2 / x - c3;
      c3 = c2;
      c2 = c6;

      if (m2 - i - 1 == n)
        b = c6;

      sign = -sign;
      if (sign > 0)
        c4 += 2.0 * c6;
    }

    double c6 = 2.0 * c2 / x - c3;
    if (n == 0)
      b = c6;

    c4 += c6;
    b /= c4;

    if (::fabs(b - b_prev) < kPrecision)
      break;

    b_prev = b;
    m2 += 3;
  }

  return b;
}

} // {Math}
} // {sw}

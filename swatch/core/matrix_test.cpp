// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <swatch/core/api-build_test_p.h>
#if defined(SW_TEST)

#include <swatch/core/matrix.h>
#include <swatch/support/math_p.h>

namespace sw {
namespace Tests {

static bool almost_equal(double a, double b) noexcept { return ::fabs(a - b) < 1e-9; }

UNIT(matrix, SW_TEST_GROUP_GEOMETRY_UTILITIES) {
  INFO("Testing matrix types");
  {
    SWMatrix2D m = SWMatrix2D::make_scaling(2.0, 3.0);
    m.post_translate(10.0, 20.0);

    double x = 1.0;
    double y = 1.0;
    m.transform(&x, &y);

    EXPECT_TRUE(almost_equal(x, 12.0));
    EXPECT_TRUE(almost_equal(y, 23.0));
  }

  INFO("Testing whether invert() followed by transform() maps points back");
  {
    SWMatrix2D m = SWMatrix2D::make_rotation(0.7);
    m.post_scale(1.5, 0.5);
    m.post_translate(-3.0, 4.0);

    SWMatrix2D inv = m;
    EXPECT_SUCCESS(inv.invert());

    double x = 17.25;
    double y = -9.5;
    m.transform(&x, &y);
    inv.transform(&x, &y);

    EXPECT_TRUE(almost_equal(x, 17.25)).message("x=%f", x);
    EXPECT_TRUE(almost_equal(y, -9.5)).message("y=%f", y);
  }

  INFO("Testing whether a singular matrix cannot be inverted");
  {
    SWMatrix2D m(1.0, 2.0, 2.0, 4.0, 0.0, 0.0);
    EXPECT_EQ(m.invert(), SW_ERROR_INVALID_GEOMETRY);
  }

  INFO("Testing multiplication order");
  {
    SWMatrix2D m = SWMatrix2D::make_translation(5.0, 0.0);
    m.post_transform(SWMatrix2D::make_scaling(2.0));

    double x = 1.0;
    double y = 1.0;
    m.transform(&x, &y);

    // Translated first, then scaled.
    EXPECT_TRUE(almost_equal(x, 12.0));
    EXPECT_TRUE(almost_equal(y, 2.0));
  }

  INFO("Testing scaling_abs()");
  {
    // Rotation followed by scaling - the scale of each output axis is preserved.
    SWMatrix2D m = SWMatrix2D::make_rotation(Math::kPI_DIV_2 * 0.5);
    m.post_scale(3.0, 0.25);

    double sx;
    double sy;
    m.scaling_abs(&sx, &sy);

    EXPECT_TRUE(almost_equal(sx, 3.0)).message("sx=%f", sx);
    EXPECT_TRUE(almost_equal(sy, 0.25)).message("sy=%f", sy);
  }
}

} // {Tests}
} // {sw}

#endif // SW_TEST

// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <swatch/core/api-build_test_p.h>
#if defined(SW_TEST)

#include <swatch/geometry/perspective_p.h>

namespace sw {
namespace Tests {

static bool almost_equal(double a, double b, double eps = 1e-7) noexcept { return ::fabs(a - b) < eps; }

UNIT(geometry_perspective, SW_TEST_GROUP_GEOMETRY_UTILITIES) {
  static const double quad[8] = { 10.0, 10.0, 200.0, 30.0, 180.0, 150.0, 20.0, 120.0 };

  INFO("sw::TransPerspective - quad_to_quad() with identical quads is an identity");
  {
    TransPerspective t;
    EXPECT_SUCCESS(t.quad_to_quad(quad, quad));
    EXPECT_TRUE(t.is_valid());

    for (int i = 0; i < 10; i++) {
      double x = 15.0 + i * 17.0;
      double y = 40.0 + i * 7.5;
      double px = x;
      double py = y;

      t.transform(&px, &py);
      EXPECT_TRUE(almost_equal(px, x)).message("x=%f mapped to %f", x, px);
      EXPECT_TRUE(almost_equal(py, y)).message("y=%f mapped to %f", y, py);
    }
  }

  INFO("sw::TransPerspective - rect_to_quad() maps corners to the quad");
  {
    TransPerspective t;
    EXPECT_SUCCESS(t.rect_to_quad(0.0, 0.0, 100.0, 50.0, quad));

    static const double rect[8] = { 0.0, 0.0, 100.0, 0.0, 100.0, 50.0, 0.0, 50.0 };
    for (uint32_t i = 0; i < 4; i++) {
      double x = rect[i * 2 + 0];
      double y = rect[i * 2 + 1];

      t.transform(&x, &y);
      EXPECT_TRUE(almost_equal(x, quad[i * 2 + 0])).message("Corner #%u: x=%f", i, x);
      EXPECT_TRUE(almost_equal(y, quad[i * 2 + 1])).message("Corner #%u: y=%f", i, y);
    }
  }

  INFO("sw::TransPerspective - inverse_transform() reverts transform()");
  {
    TransPerspective t;
    EXPECT_SUCCESS(t.quad_to_rect(quad, 0.0, 0.0, 1.0, 1.0));

    double x = 100.0;
    double y = 80.0;
    t.transform(&x, &y);
    t.inverse_transform(&x, &y);

    EXPECT_TRUE(almost_equal(x, 100.0)).message("x=%f", x);
    EXPECT_TRUE(almost_equal(y, 80.0)).message("y=%f", y);
  }

  INFO("sw::TransPerspective - IteratorX follows transform()");
  {
    TransPerspective t;
    EXPECT_SUCCESS(t.rect_to_quad(0.0, 0.0, 100.0, 100.0, quad));

    TransPerspective::IteratorX it = t.begin(5.0, 20.0, 1.0);
    for (int i = 0; i < 50; i++) {
      double x = 5.0 + i;
      double y = 20.0;
      t.transform(&x, &y);

      EXPECT_TRUE(almost_equal(it.x, x, 1e-6)).message("Step %d: %f != %f", i, it.x, x);
      EXPECT_TRUE(almost_equal(it.y, y, 1e-6)).message("Step %d: %f != %f", i, it.y, y);
      it.next();
    }
  }

  INFO("sw::TransPerspective - degenerate quads are rejected");
  {
    static const double line[8] = { 0.0, 0.0, 1.0, 1.0, 2.0, 2.0, 3.0, 3.0 };
    static const double point[8] = { 5.0, 5.0, 5.0, 5.0, 5.0, 5.0, 5.0, 5.0 };

    TransPerspective t;
    EXPECT_EQ(t.quad_to_quad(line, quad), SW_ERROR_INVALID_GEOMETRY);
    EXPECT_EQ(t.quad_to_quad(point, quad), SW_ERROR_INVALID_GEOMETRY);
    EXPECT_FALSE(t.is_valid());
  }

  INFO("sw::TransPerspective - multiply() and premultiply() order");
  {
    TransPerspective a(SWMatrix2D::make_translation(10.0, 0.0));
    TransPerspective b(SWMatrix2D::make_scaling(2.0));

    TransPerspective ab(a);
    ab.multiply(b);

    TransPerspective ba(a);
    ba.premultiply(b);

    double x1 = 1.0, y1 = 1.0;
    double x2 = 1.0, y2 = 1.0;
    ab.transform(&x1, &y1);
    ba.transform(&x2, &y2);

    EXPECT_TRUE(almost_equal(x1, 22.0)).message("x1=%f", x1);
    EXPECT_TRUE(almost_equal(x2, 12.0)).message("x2=%f", x2);
  }
}

} // {Tests}
} // {sw}

#endif // SW_TEST

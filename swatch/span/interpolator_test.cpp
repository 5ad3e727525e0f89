// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <swatch/core/api-build_test_p.h>
#if defined(SW_TEST)

#include <swatch/core/matrix.h>
#include <swatch/span/interpolator_p.h>
#include <swatch/span/interpolatorpersp_p.h>

namespace sw {
namespace Tests {

namespace {

struct ShiftDistortion {
  int _dx;
  SW_INLINE void calculate(int* x, int* y) const noexcept { *x += _dx; sw_unused(y); }
};

template<typename Interpolator>
static void expect_exact_mapping(Interpolator& interpolator, const char* name, const SWMatrix2D& m, double x, double y, uint32_t len, int tolerance) noexcept {
  interpolator.begin(x, y, len);
  for (uint32_t i = 0; i < len; i++) {
    double tx = x + double(i);
    double ty = y;
    m.transform(&tx, &ty);

    int ix, iy;
    interpolator.coordinates(&ix, &iy);

    int ex = Math::iround(tx * 256.0);
    int ey = Math::iround(ty * 256.0);
    EXPECT_LE(sw_abs(ix - ex), tolerance).message("%s: pixel #%u x=%d (expected %d)", name, i, ix, ex);
    EXPECT_LE(sw_abs(iy - ey), tolerance).message("%s: pixel #%u y=%d (expected %d)", name, i, iy, ey);
    interpolator.next();
  }
}

} // {anonymous}

UNIT(span_interpolators, SW_TEST_GROUP_SPAN_INTERPOLATORS) {
  INFO("Capability detection");
  {
    EXPECT_FALSE(SpanTraits<SpanInterpolatorLinear<SWMatrix2D>>::kHasLocalScale);
    EXPECT_TRUE(SpanTraits<SpanInterpolatorLinear<SWMatrix2D>>::kHasTransformer);
    EXPECT_TRUE(SpanTraits<SpanInterpolatorPerspExact<>>::kHasLocalScale);
    EXPECT_FALSE(SpanTraits<SpanInterpolatorPerspExact<>>::kHasTransformer);
    EXPECT_TRUE(SpanTraits<SpanSubdivAdaptor<SpanInterpolatorPerspLerp<>>>::kHasLocalScale);

    SWMatrix2D m = SWMatrix2D::make_identity();
    SpanInterpolatorLinear<SWMatrix2D> linear(m);

    int sx = 0, sy = 0;
    SpanTraits<SpanInterpolatorLinear<SWMatrix2D>>::local_scale(linear, &sx, &sy);
    EXPECT_EQ(sx, Image::kSubpixelScale);
    EXPECT_EQ(sy, Image::kSubpixelScale);
  }

  INFO("sw::SpanInterpolatorLinear - identity steps by one pixel");
  {
    SWMatrix2D m = SWMatrix2D::make_identity();
    SpanInterpolatorLinear<SWMatrix2D> interpolator(m);

    interpolator.begin(10.5, 20.5, 8);
    for (int i = 0; i < 8; i++) {
      int x, y;
      interpolator.coordinates(&x, &y);
      EXPECT_EQ(x, 2688 + i * 256);
      EXPECT_EQ(y, 5248);
      interpolator.next();
    }
  }

  INFO("sw::SpanInterpolatorLinear - affine transform is exact at both ends");
  {
    SWMatrix2D m = SWMatrix2D::make_scaling(2.0, 3.0);
    m.post_rotate(0.3);
    m.post_translate(7.25, -3.5);

    SpanInterpolatorLinear<SWMatrix2D> interpolator(m);
    expect_exact_mapping(interpolator, "Linear", m, 3.5, 9.5, 37, 1);
  }

  INFO("sw::SpanInterpolatorLinearSubdiv - chunks join without error");
  {
    SWMatrix2D m = SWMatrix2D::make_identity();
    SpanInterpolatorLinearSubdiv<SWMatrix2D> interpolator(m);
    EXPECT_EQ(interpolator.subdiv_shift(), 4u);

    interpolator.begin(0.5, 0.5, 100);
    for (int i = 0; i < 100; i++) {
      int x, y;
      interpolator.coordinates(&x, &y);
      EXPECT_EQ(x, 128 + i * 256).message("Pixel #%d", i);
      EXPECT_EQ(y, 128).message("Pixel #%d", i);
      interpolator.next();
    }

    interpolator.set_subdiv_shift(2);
    SWMatrix2D r = SWMatrix2D::make_rotation(1.0);
    interpolator.set_transformer(r);
    expect_exact_mapping(interpolator, "LinearSubdiv", r, 1.5, 2.5, 50, 1);
  }

  INFO("sw::SpanInterpolatorTrans - every pixel is mapped");
  {
    SWMatrix2D m = SWMatrix2D::make_rotation(0.7);
    m.post_scale(1.5, 0.5);

    SpanInterpolatorTrans<SWMatrix2D> interpolator(m);
    expect_exact_mapping(interpolator, "Trans", m, 0.5, 0.5, 64, 0);
  }

  INFO("sw::SpanInterpolatorPerspExact - affine quad gives exact coordinates and local scale");
  {
    static const double quad[8] = { 0.0, 0.0, 200.0, 0.0, 200.0, 200.0, 0.0, 200.0 };

    SpanInterpolatorPerspExact<> interpolator;
    EXPECT_SUCCESS(interpolator.quad_to_rect(quad, 0.0, 0.0, 100.0, 100.0));
    EXPECT_TRUE(interpolator.is_valid());

    interpolator.begin(10.0, 20.0, 10);
    for (int i = 0; i < 10; i++) {
      int x, y, sx, sy;
      interpolator.coordinates(&x, &y);
      interpolator.local_scale(&sx, &sy);

      EXPECT_EQ(x, (10 + i) * 128);
      EXPECT_EQ(y, 20 * 128);
      EXPECT_EQ(sx, 128);
      EXPECT_EQ(sy, 128);
      interpolator.next();
    }
  }

  INFO("sw::SpanInterpolatorPerspExact - degenerate quad is rejected");
  {
    static const double quad[8] = { 0.0, 0.0, 1.0, 1.0, 2.0, 2.0, 3.0, 3.0 };

    SpanInterpolatorPerspExact<> interpolator;
    EXPECT_EQ(interpolator.rect_to_quad(0.0, 0.0, 10.0, 10.0, quad), SW_ERROR_INVALID_GEOMETRY);
  }

  INFO("sw::SpanSubdivAdaptor<SpanInterpolatorPerspLerp> - identity quad");
  {
    static const double quad[8] = { 5.0, 5.0, 105.0, 5.0, 105.0, 105.0, 5.0, 105.0 };

    SpanInterpolatorPerspLerp<> lerp;
    EXPECT_SUCCESS(lerp.quad_to_quad(quad, quad));

    SpanSubdivAdaptor<SpanInterpolatorPerspLerp<>> interpolator(lerp);
    SWMatrix2D m = SWMatrix2D::make_identity();
    expect_exact_mapping(interpolator, "PerspLerp", m, 7.5, 8.5, 70, 1);

    int sx, sy;
    interpolator.local_scale(&sx, &sy);
    EXPECT_EQ(sx, 256);
    EXPECT_EQ(sy, 256);
  }

  INFO("sw::SpanInterpolatorPerspLerp - follows a true perspective mapping");
  {
    static const double quad[8] = { 10.0, 10.0, 300.0, 40.0, 260.0, 280.0, 30.0, 200.0 };

    SpanInterpolatorPerspExact<> exact;
    SpanInterpolatorPerspLerp<> lerp;
    EXPECT_SUCCESS(exact.quad_to_rect(quad, 0.0, 0.0, 64.0, 64.0));
    EXPECT_SUCCESS(lerp.quad_to_rect(quad, 0.0, 0.0, 64.0, 64.0));

    SpanSubdivAdaptor<SpanInterpolatorPerspLerp<>> adaptor(lerp);
    exact.begin(40.5, 100.5, 128);
    adaptor.begin(40.5, 100.5, 128);

    for (int i = 0; i < 128; i++) {
      int x1, y1, x2, y2;
      exact.coordinates(&x1, &y1);
      adaptor.coordinates(&x2, &y2);

      EXPECT_LE(sw_abs(x1 - x2), 12).message("Pixel #%d: exact=%d lerp=%d", i, x1, x2);
      EXPECT_LE(sw_abs(y1 - y2), 12).message("Pixel #%d: exact=%d lerp=%d", i, y1, y2);

      exact.next();
      adaptor.next();
    }
  }

  INFO("sw::SpanInterpolatorAdaptor - distortion is applied after mapping");
  {
    SWMatrix2D m = SWMatrix2D::make_identity();
    ShiftDistortion distortion { 1000 };

    SpanInterpolatorAdaptor<SpanInterpolatorLinear<SWMatrix2D>, ShiftDistortion> interpolator(distortion, m);
    interpolator.begin(0.0, 0.0, 4);

    int x, y;
    interpolator.coordinates(&x, &y);
    EXPECT_EQ(x, 1000);
    EXPECT_EQ(y, 0);

    interpolator.next();
    interpolator.coordinates(&x, &y);
    EXPECT_EQ(x, 1256);
  }
}

} // {Tests}
} // {sw}

#endif // SW_TEST

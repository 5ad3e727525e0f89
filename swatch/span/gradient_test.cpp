// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <swatch/core/api-build_test_p.h>
#if defined(SW_TEST)

#include <swatch/core/matrix.h>
#include <swatch/span/gradient_p.h>
#include <swatch/span/gradientcontour_p.h>
#include <swatch/span/gradientimage_p.h>
#include <swatch/span/gradientlut_p.h>
#include <swatch/span/interpolator_p.h>
#include <swatch/span/spangradient_p.h>

namespace sw {
namespace Tests {

namespace {

//! Shape that returns the most extreme values possible.
struct ExtremeShape {
  SW_INLINE int calculate(int x, int y, int d) const noexcept {
    sw_unused(y, d);
    return x < 0 ? std::numeric_limits<int>::min() : std::numeric_limits<int>::max();
  }
};

//! Closed rectangle as a vertex source.
struct RectVertexSource {
  double _x1, _y1, _x2, _y2;
  uint32_t _index;

  SW_INLINE void rewind(uint32_t path_id) noexcept { sw_unused(path_id); _index = 0; }

  SW_INLINE uint32_t vertex(double* x, double* y) noexcept {
    switch (_index++) {
      case 0: *x = _x1; *y = _y1; return kPathCmdMoveTo;
      case 1: *x = _x2; *y = _y1; return kPathCmdLineTo;
      case 2: *x = _x2; *y = _y2; return kPathCmdLineTo;
      case 3: *x = _x1; *y = _y2; return kPathCmdLineTo;
      case 4: *x = 0.0; *y = 0.0; return kPathCmdEndPoly | kPathFlagClose;
      default: return kPathCmdStop;
    }
  }
};

struct EmptyVertexSource {
  SW_INLINE void rewind(uint32_t path_id) noexcept { sw_unused(path_id); }
  SW_INLINE uint32_t vertex(double* x, double* y) noexcept { *x = 0.0; *y = 0.0; return kPathCmdStop; }
};

static bool same_color_within(const SWRgba8& a, const SWRgba8& b, int tolerance) noexcept {
  return sw_abs(int(a.r) - int(b.r)) <= tolerance &&
         sw_abs(int(a.g) - int(b.g)) <= tolerance &&
         sw_abs(int(a.b) - int(b.b)) <= tolerance &&
         sw_abs(int(a.a) - int(b.a)) <= tolerance;
}

} // {anonymous}

UNIT(span_gradient_shapes, SW_TEST_GROUP_SPAN_GRADIENTS) {
  INFO("Basic shapes");
  {
    EXPECT_EQ(GradientX::calculate(37, -5, 100), 37);
    EXPECT_EQ(GradientY::calculate(37, -5, 100), -5);
    EXPECT_EQ(GradientRadial::calculate(30, 40, 100), 50);
    EXPECT_EQ(GradientRadialD::calculate(-30, 40, 100), 50);
    EXPECT_EQ(GradientDiamond::calculate(-30, 20, 100), 30);
    EXPECT_EQ(GradientXY::calculate(-30, 20, 100), 6);
    EXPECT_EQ(GradientXY::calculate(30, 20, 0), 600);
    EXPECT_EQ(GradientSqrtXY::calculate(-16, 4, 100), 8);
    EXPECT_EQ(GradientConic::calculate(0, 16, 100), 50);
    EXPECT_EQ(GradientConic::calculate(0, -16, 100), 50);
    EXPECT_EQ(GradientConic::calculate(-16, 0, 100), 100);
  }

  INFO("Large coordinates don't overflow radial shapes");
  {
    int big = 1 << 20;
    EXPECT_GT(GradientRadial::calculate(big, big, 100), 0);
    EXPECT_EQ(GradientRadialD::calculate(big, 0, 100), big);
  }

  INFO("sw::GradientRadialFocus - focus on the circle is moved inside");
  {
    GradientRadialFocus focus(10.0, 10.0, 0.0);
    EXPECT_EQ(focus._fx, 159);
    EXPECT_EQ(focus._fy, 0);
    EXPECT_TRUE(Math::is_finite(focus._mul));

    // Without a focal offset the shape is a plain radial gradient.
    GradientRadialFocus centered(10.0, 0.0, 0.0);
    EXPECT_EQ(centered.calculate(80, 0, 160), 80);
    EXPECT_EQ(centered.calculate(0, -48, 160), 48);
  }

  INFO("sw::GradientRepeatAdaptor & sw::GradientReflectAdaptor");
  {
    GradientX shape;
    GradientRepeatAdaptor<GradientX> repeat(shape);
    GradientReflectAdaptor<GradientX> reflect(shape);

    EXPECT_EQ(repeat.calculate(250, 0, 100), 50);
    EXPECT_EQ(repeat.calculate(-30, 0, 100), 70);
    EXPECT_EQ(repeat.calculate(-30, 0, 0), 0);

    EXPECT_EQ(reflect.calculate(150, 0, 100), 50);
    EXPECT_EQ(reflect.calculate(-30, 0, 100), 30);
    EXPECT_EQ(reflect.calculate(20, 0, 100), 20);
    EXPECT_EQ(reflect.calculate(20, 0, 0), 0);
  }
}

UNIT(span_gradient_lut, SW_TEST_GROUP_SPAN_GRADIENTS) {
  INFO("sw::GradientLUT - black to white is monotonic");
  {
    GradientLUT<SWRgba8> lut;
    EXPECT_SUCCESS(lut.add_color(0.0, SWRgba8(0, 0, 0)));
    EXPECT_SUCCESS(lut.add_color(1.0, SWRgba8(255, 255, 255)));
    EXPECT_SUCCESS(lut.build_lut());

    EXPECT_EQ(lut[0], SWRgba8(0, 0, 0));
    EXPECT_EQ(lut[255], SWRgba8(255, 255, 255));

    for (uint32_t i = 1; i < lut.size(); i++) {
      EXPECT_GE(lut[i].r, lut[i - 1].r).message("LUT is not monotonic at %u", i);
      EXPECT_EQ(lut[i].a, 255u);
    }
  }

  INFO("sw::GradientLUT - red, green and blue");
  {
    GradientLUT<SWRgba8> lut;
    EXPECT_SUCCESS(lut.add_color(1.0, SWRgba8(0, 0, 255)));
    EXPECT_SUCCESS(lut.add_color(0.0, SWRgba8(255, 0, 0)));
    EXPECT_SUCCESS(lut.add_color(0.5, SWRgba8(0, 255, 0)));
    EXPECT_SUCCESS(lut.build_lut());

    EXPECT_EQ(lut[0], SWRgba8(255, 0, 0));
    EXPECT_TRUE(same_color_within(lut.at(128), SWRgba8(0, 255, 0), 2));
    EXPECT_EQ(lut[255], SWRgba8(0, 0, 255));
    EXPECT_EQ(lut.at(1000), SWRgba8(0, 0, 255));
  }

  INFO("sw::GradientLUT - stops sharing an offset keep the first one");
  {
    GradientLUT<SWRgba8> lut;
    EXPECT_SUCCESS(lut.add_color(0.5, SWRgba8(255, 0, 0)));
    EXPECT_SUCCESS(lut.add_color(0.0, SWRgba8(0, 0, 0)));
    EXPECT_SUCCESS(lut.add_color(0.5, SWRgba8(0, 255, 0)));
    EXPECT_SUCCESS(lut.add_color(1.0, SWRgba8(255, 255, 255)));
    EXPECT_SUCCESS(lut.build_lut());

    EXPECT_EQ(lut.stop_count(), 3u);
    EXPECT_EQ(lut[128], SWRgba8(255, 0, 0));
  }

  INFO("sw::GradientLUT - offsets are clamped and the leading range is filled");
  {
    GradientLUT<SWRgba8> lut;
    EXPECT_SUCCESS(lut.add_color(-1.0, SWRgba8(10, 20, 30)));
    EXPECT_SUCCESS(lut.add_color(2.0, SWRgba8(40, 50, 60)));
    EXPECT_SUCCESS(lut.build_lut());
    EXPECT_EQ(lut[0], SWRgba8(10, 20, 30));
    EXPECT_EQ(lut[255], SWRgba8(40, 50, 60));

    GradientLUT<SWRgba8> late;
    EXPECT_SUCCESS(late.add_color(0.75, SWRgba8(1, 2, 3)));
    EXPECT_SUCCESS(late.add_color(1.0, SWRgba8(4, 5, 6)));
    EXPECT_SUCCESS(late.build_lut());
    for (uint32_t i = 0; i < 192; i++)
      EXPECT_EQ(late[i], SWRgba8(1, 2, 3)).message("Index %u", i);
  }

  INFO("sw::GradientLUT - no stops and a single stop");
  {
    GradientLUT<SWRgba8> lut;
    EXPECT_SUCCESS(lut.build_lut());
    EXPECT_EQ(lut[17], SWRgba8(0, 0, 0, 0));

    EXPECT_SUCCESS(lut.add_color(0.3, SWRgba8(9, 8, 7, 6)));
    EXPECT_SUCCESS(lut.build_lut());
    EXPECT_EQ(lut[0], SWRgba8(9, 8, 7, 6));
    EXPECT_EQ(lut[255], SWRgba8(9, 8, 7, 6));

    lut.remove_all();
    EXPECT_SUCCESS(lut.build_lut());
    EXPECT_EQ(lut[100], SWRgba8(0, 0, 0, 0));
  }

  INFO("sw::GradientLUT - 16-bit and floating point colors");
  {
    GradientLUT<SWRgba16, 512> lut16;
    EXPECT_SUCCESS(lut16.add_color(0.0, SWRgba16(0, 0, 0)));
    EXPECT_SUCCESS(lut16.add_color(1.0, SWRgba16(65535, 65535, 65535)));
    EXPECT_SUCCESS(lut16.build_lut());
    EXPECT_EQ(lut16[511], SWRgba16(65535, 65535, 65535));
    for (uint32_t i = 1; i < lut16.size(); i++)
      EXPECT_GE(lut16[i].g, lut16[i - 1].g);

    GradientLUT<SWRgba32f> lutf;
    EXPECT_SUCCESS(lutf.add_color(0.0, SWRgba32f(0.0f, 0.0f, 0.0f)));
    EXPECT_SUCCESS(lutf.add_color(1.0, SWRgba32f(1.0f, 0.5f, 0.25f)));
    EXPECT_SUCCESS(lutf.build_lut());
    EXPECT_EQ(lutf[255], SWRgba32f(1.0f, 0.5f, 0.25f));
    EXPECT_LT(::fabs(double(lutf[128].r) - 0.5), 0.01);
  }

  INFO("sw::GradientLinearColor");
  {
    GradientLinearColor<SWRgba8> linear(SWRgba8(0, 0, 0), SWRgba8(255, 255, 255));
    EXPECT_EQ(linear.size(), 256u);
    EXPECT_EQ(linear[0], SWRgba8(0, 0, 0));
    EXPECT_EQ(linear[255], SWRgba8(255, 255, 255));
    EXPECT_EQ(linear[51].r, 51u);
  }
}

UNIT(span_gradient_generators, SW_TEST_GROUP_SPAN_GRADIENTS) {
  SWMatrix2D identity = SWMatrix2D::make_identity();
  typedef SpanInterpolatorLinear<SWMatrix2D> Interpolator;

  GradientLUT<SWRgba8> lut;
  EXPECT_SUCCESS(lut.add_color(0.0, SWRgba8(0, 0, 0)));
  EXPECT_SUCCESS(lut.add_color(1.0, SWRgba8(255, 255, 255)));
  EXPECT_SUCCESS(lut.build_lut());

  INFO("sw::SpanGradient - horizontal gradient");
  {
    Interpolator interpolator(identity);
    GradientX shape;
    SpanGradient<SWRgba8, Interpolator, GradientX, GradientLUT<SWRgba8>> gen(interpolator, shape, lut, 0.0, 100.0);

    SWRgba8 span[140];
    gen.prepare();
    gen.generate(span, -20, 5, 140);

    EXPECT_EQ(span[0], lut[0]);
    EXPECT_EQ(span[139], lut[255]);
    for (uint32_t i = 1; i < 140; i++)
      EXPECT_GE(span[i].r, span[i - 1].r).message("Span is not monotonic at %u", i);

    // Pixel 50 (center 50.5) maps to index (50.5 * 16 * 256) / 1600.
    EXPECT_EQ(span[70], lut[129]);
  }

  INFO("sw::SpanGradient - any shape output is clamped into the table");
  {
    Interpolator interpolator(identity);
    ExtremeShape shape;
    SpanGradient<SWRgba8, Interpolator, ExtremeShape, GradientLUT<SWRgba8>> gen(interpolator, shape, lut, 10.0, 10.0);

    SWRgba8 span[4];
    gen.generate(span, -2, 0, 4);
    EXPECT_EQ(span[0], lut[0]);
    EXPECT_EQ(span[1], lut[0]);
    EXPECT_EQ(span[2], lut[255]);
    EXPECT_EQ(span[3], lut[255]);
  }

  INFO("sw::SpanGradientAlpha - identity alpha replaces alpha only");
  {
    Interpolator interpolator(identity);
    GradientX shape;
    GradientAlphaIdentity<uint8_t> alpha;
    SpanGradientAlpha<SWRgba8, Interpolator, GradientX, GradientAlphaIdentity<uint8_t>> gen(interpolator, shape, alpha, 0.0, 256.0);

    SWRgba8 span[10];
    for (uint32_t i = 0; i < 10; i++)
      span[i] = SWRgba8(1, 2, 3, 4);

    gen.generate(span, 100, 0, 10);
    for (uint32_t i = 0; i < 10; i++) {
      EXPECT_EQ(span[i].a, 100u + i);
      EXPECT_EQ(span[i].r, 1u);
    }
  }

  INFO("sw::SpanGradientAlpha - alpha array");
  {
    Interpolator interpolator(identity);
    GradientX shape;
    GradientAlphaArray<4> alpha;
    alpha[0] = 0;
    alpha[1] = 85;
    alpha[2] = 170;
    alpha[3] = 255;

    SpanGradientAlpha<SWGray8, Interpolator, GradientX, GradientAlphaArray<4>> gen(interpolator, shape, alpha, 0.0, 4.0);

    SWGray8 span[6];
    for (uint32_t i = 0; i < 6; i++)
      span[i] = SWGray8(50);

    gen.generate(span, -1, 0, 6);
    EXPECT_EQ(span[0].a, 0u);
    EXPECT_EQ(span[1].a, 0u);
    EXPECT_EQ(span[2].a, 85u);
    EXPECT_EQ(span[4].a, 255u);
    EXPECT_EQ(span[5].a, 255u);
    EXPECT_EQ(span[5].v, 50u);
  }
}

UNIT(span_gradient_contour, SW_TEST_GROUP_SPAN_GRADIENTS) {
  INFO("sw::GradientContour - distance field of a rectangle");
  {
    RectVertexSource rect { 0.0, 0.0, 20.0, 20.0, 0 };
    GradientContour contour;

    EXPECT_EQ(contour.frame(), 10);
    EXPECT_EQ(contour.d1(), 0.0);
    EXPECT_EQ(contour.d2(), 100.0);
    EXPECT_EQ(contour.calculate(0, 0, 100), 0);

    EXPECT_SUCCESS(contour.create(rect));
    EXPECT_EQ(contour.width(), 41);
    EXPECT_EQ(contour.height(), 41);

    // Outline pixels have zero distance.
    EXPECT_EQ(contour.value_at(10, 10), 0u);
    EXPECT_EQ(contour.value_at(20, 10), 0u);

    uint8_t center = contour.value_at(20, 20);
    uint8_t corner = contour.value_at(0, 0);
    EXPECT_GT(center, 0u);
    EXPECT_LT(center, corner);
    EXPECT_EQ(corner, 255u);

    // Sampling wraps in both directions.
    int s = Gradient::kSubpixelScale;
    EXPECT_EQ(contour.calculate(20 * s, 20 * s, 0), contour.calculate((20 + 41) * s, (20 - 41) * s, 0));
    EXPECT_EQ(contour.calculate(0, 0, 0), Math::iround(255.0 * 100.0 / 256.0) * s);
  }

  INFO("sw::GradientContour - empty path is rejected");
  {
    EmptyVertexSource empty;
    GradientContour contour;
    EXPECT_EQ(contour.create(empty), SW_ERROR_INVALID_GEOMETRY);
    EXPECT_TRUE(contour.empty());
  }

  INFO("sw::GradientContour - too large path is rejected");
  {
    RectVertexSource rect { 0.0, 0.0, 1e6, 10.0, 0 };
    GradientContour contour;
    EXPECT_EQ(contour.create(rect), SW_ERROR_IMAGE_TOO_LARGE);
  }

  INFO("sw::GradientContour - usable as a gradient shape");
  {
    RectVertexSource rect { 0.0, 0.0, 20.0, 20.0, 0 };
    GradientContour contour(0.0, 256.0);
    EXPECT_SUCCESS(contour.create(rect));

    GradientLUT<SWRgba8> lut;
    EXPECT_SUCCESS(lut.add_color(0.0, SWRgba8(0, 0, 0)));
    EXPECT_SUCCESS(lut.add_color(1.0, SWRgba8(255, 255, 255)));
    EXPECT_SUCCESS(lut.build_lut());

    SWMatrix2D identity = SWMatrix2D::make_identity();
    typedef SpanInterpolatorLinear<SWMatrix2D> Interpolator;
    Interpolator interpolator(identity);
    SpanGradient<SWRgba8, Interpolator, GradientContour, GradientLUT<SWRgba8>> gen(interpolator, contour, lut, 0.0, 256.0);

    SWRgba8 span[41];
    gen.generate(span, 0, 20, 41);
    EXPECT_EQ(span[10], lut[0]);
    EXPECT_GT(span[20].r, span[10].r);
  }
}

UNIT(span_gradient_image, SW_TEST_GROUP_SPAN_GRADIENTS) {
  INFO("sw::GradientImage - create and wrap");
  {
    GradientImage image;
    EXPECT_EQ(image.sample(0, 0), SWRgba8(0, 0, 0, 0));
    EXPECT_EQ(image.create(0, 4), SW_ERROR_INVALID_VALUE);
    EXPECT_EQ(image.create(70000, 4), SW_ERROR_IMAGE_TOO_LARGE);

    EXPECT_SUCCESS(image.create(4, 4));
    EXPECT_EQ(image.stride(), 16);
    image.row_ptr(2)[1] = SWRgba8(255, 0, 0);

    int s = Gradient::kSubpixelScale;
    EXPECT_EQ(image.sample(1 * s, 2 * s), SWRgba8(255, 0, 0));
    EXPECT_EQ(image.sample(5 * s, -2 * s), SWRgba8(255, 0, 0));
    EXPECT_EQ(image.sample(-3 * s, 6 * s), SWRgba8(255, 0, 0));
    EXPECT_EQ(image.sample(0, 0), SWRgba8(0, 0, 0, 0));
  }

  INFO("sw::SpanGradientImage - samples the image per pixel");
  {
    GradientImage image;
    EXPECT_SUCCESS(image.create(4, 4));
    image.row_ptr(2)[1] = SWRgba8(0, 255, 0);

    SWMatrix2D identity = SWMatrix2D::make_identity();
    typedef SpanInterpolatorLinear<SWMatrix2D> Interpolator;
    Interpolator interpolator(identity);
    SpanGradientImage<Interpolator> gen(interpolator, image);

    SWRgba8 span[8];
    gen.generate(span, 0, 2, 8);
    for (uint32_t i = 0; i < 8; i++) {
      SWRgba8 expected = (i & 3) == 1 ? SWRgba8(0, 255, 0) : SWRgba8(0, 0, 0, 0);
      EXPECT_EQ(span[i], expected).message("Pixel #%u", i);
    }
  }
}

} // {Tests}
} // {sw}

#endif // SW_TEST

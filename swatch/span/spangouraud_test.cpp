// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <swatch/core/api-build_test_p.h>
#if defined(SW_TEST)

#include <swatch/span/spangouraud_p.h>

namespace sw {
namespace Tests {

static bool near_equal(double a, double b) noexcept { return ::fabs(a - b) < 1e-9; }

//! Xorshift generator used to produce reproducible triangles.
class TestRandom {
public:
  uint64_t _state;

  SW_INLINE explicit TestRandom(uint64_t seed) noexcept
    : _state(seed) {}

  SW_INLINE uint32_t next_uint32() noexcept {
    _state ^= _state << 13;
    _state ^= _state >> 7;
    _state ^= _state << 17;
    return uint32_t(_state >> 32);
  }

  SW_INLINE double next_double(double scale) noexcept {
    return double(next_uint32()) * (scale / 4294967296.0);
  }
};

static uint32_t min3(uint32_t a, uint32_t b, uint32_t c) noexcept { return sw_min(a, sw_min(b, c)); }
static uint32_t max3(uint32_t a, uint32_t b, uint32_t c) noexcept { return sw_max(a, sw_max(b, c)); }

UNIT(span_gouraud, SW_TEST_GROUP_SPAN_GOURAUD) {
  INFO("Vertex source of a plain triangle");
  {
    SpanGouraudRgba<SWRgba8> g(SWRgba8(255, 0, 0), SWRgba8(0, 255, 0), SWRgba8(0, 0, 255),
                               0.0, 0.0, 10.0, 0.0, 0.0, 10.0);
    double x, y;

    g.rewind(0);
    EXPECT_EQ(g.vertex(&x, &y), uint32_t(kPathCmdMoveTo));
    EXPECT_TRUE(x == 0.0 && y == 0.0);
    EXPECT_EQ(g.vertex(&x, &y), uint32_t(kPathCmdLineTo));
    EXPECT_TRUE(x == 10.0 && y == 0.0);
    EXPECT_EQ(g.vertex(&x, &y), uint32_t(kPathCmdLineTo));
    EXPECT_TRUE(x == 0.0 && y == 10.0);
    EXPECT_EQ(g.vertex(&x, &y), uint32_t(kPathCmdStop));
    EXPECT_EQ(g.vertex(&x, &y), uint32_t(kPathCmdStop));

    g.rewind(0);
    EXPECT_EQ(g.vertex(&x, &y), uint32_t(kPathCmdMoveTo));
  }

  INFO("Dilated triangle emits a hexagon and moves shading vertices to miter points");
  {
    SpanGouraudRgba<SWRgba8> g(SWRgba8(255, 0, 0), SWRgba8(0, 255, 0), SWRgba8(0, 0, 255),
                               0.0, 0.0, 10.0, 0.0, 0.0, 10.0, 1.0);
    double x, y;
    uint32_t n = 0;

    g.rewind(0);
    EXPECT_EQ(g.vertex(&x, &y), uint32_t(kPathCmdMoveTo));
    EXPECT_TRUE(near_equal(x, 0.0) && near_equal(y, -1.0));
    n++;

    while (g.vertex(&x, &y) == kPathCmdLineTo)
      n++;
    EXPECT_EQ(n, 6u);

    EXPECT_TRUE(near_equal(g._coord[0].x, -1.0) && near_equal(g._coord[0].y, -1.0));
    EXPECT_TRUE(near_equal(g._coord[1].x, 11.0 + ::sqrt(2.0)) && near_equal(g._coord[1].y, -1.0));
    EXPECT_TRUE(near_equal(g._coord[2].x, -1.0) && near_equal(g._coord[2].y, 11.0 + ::sqrt(2.0)));
  }

  INFO("Dilation of a degenerate triangle keeps its vertices");
  {
    SpanGouraudGray<SWGray8> g(SWGray8(0), SWGray8(128), SWGray8(255), 0.0, 0.0, 5.0, 5.0, 10.0, 10.0, 1.0);

    EXPECT_TRUE(g._coord[0].x == 0.0 && g._coord[0].y == 0.0);
    EXPECT_TRUE(g._coord[1].x == 5.0 && g._coord[1].y == 5.0);
    EXPECT_TRUE(g._coord[2].x == 10.0 && g._coord[2].y == 10.0);
  }

  INFO("Vertices are arranged by y");
  {
    SpanGouraudGray<SWGray8> g(SWGray8(1), SWGray8(2), SWGray8(3), 0.0, 30.0, 5.0, 10.0, 10.0, 20.0);
    SpanGouraudGray<SWGray8>::Coord coord[3];

    g.arrange_vertices(coord);
    EXPECT_EQ(coord[0].color.v, 2);
    EXPECT_EQ(coord[1].color.v, 3);
    EXPECT_EQ(coord[2].color.v, 1);
  }

  INFO("Single color triangle is flat everywhere, also outside of the triangle");
  {
    SWRgba8 c(10, 20, 30, 200);
    SpanGouraudRgba<SWRgba8> g(c, c, c, 10.0, 10.0, 90.0, 30.0, 40.0, 80.0);
    SWRgba8 span[128];

    g.prepare();
    for (int y = -20; y < 120; y += 7) {
      g.generate(span, -10, y, 128);
      for (uint32_t i = 0; i < 128; i++) {
        EXPECT_TRUE(span[i] == c).message("Pixel [%d, %u] differs", y, i);
      }
    }
  }

  INFO("Horizontal shading with clamped leading and trailing parts");
  {
    // Value 0 at the left edge (x = 0) and 255 at the right tip (x = 100, y = 50).
    SpanGouraudGray<SWGray8> g(SWGray8(0), SWGray8(255), SWGray8(0), 0.5, 0.5, 100.5, 50.5, 0.5, 100.5);
    SWGray8 span[160];

    g.prepare();
    g.generate(span, -20, 50, 160);

    for (uint32_t i = 0; i < 20; i++) {
      EXPECT_EQ(span[i].v, 0).message("Leading pixel %u", i);
    }

    for (int j = 0; j < 100; j++) {
      int expected = (j * 41776) >> 14;
      EXPECT_EQ(int(span[20 + j].v), expected).message("Inner pixel %d", j);
    }

    EXPECT_EQ(span[120].v, 254);
    for (uint32_t i = 121; i < 160; i++) {
      EXPECT_EQ(span[i].v, 255).message("Trailing pixel %u", i);
    }

    for (uint32_t i = 0; i < 160; i++) {
      EXPECT_EQ(span[i].a, 255);
    }
  }

  INFO("Lower half of the triangle uses the third edge");
  {
    SpanGouraudGray<SWGray8> g(SWGray8(0), SWGray8(255), SWGray8(0), 0.5, 0.5, 100.5, 50.5, 0.5, 100.5);
    SWGray8 span[60];

    g.prepare();
    g.generate(span, 0, 75, 60);

    for (int j = 0; j < 60; j++) {
      int expected = (j * 41888) >> 14;
      EXPECT_EQ(int(span[j].v), expected).message("Pixel %d", j);
    }
  }

  INFO("Mirrored triangle swaps edges");
  {
    SpanGouraudGray<SWGray8> g(SWGray8(0), SWGray8(255), SWGray8(0), 100.5, 0.5, 0.5, 50.5, 100.5, 100.5);
    SWGray8 span[120];

    g.prepare();
    EXPECT_TRUE(g._swap);

    g.generate(span, 0, 50, 120);
    EXPECT_EQ(span[0].v, 255);
    EXPECT_LE(span[99].v, 3);

    for (uint32_t i = 1; i < 120; i++) {
      EXPECT_LE(span[i].v, span[i - 1].v).message("Pixel %u", i);
    }
  }

  INFO("Horizontal top edge uses the slope sentinel");
  {
    SpanGouraudGray<SWGray8> g(SWGray8(0), SWGray8(255), SWGray8(0), 0.5, 0.5, 100.5, 0.5, 0.5, 100.5);
    SWGray8 span[100];

    g.prepare();
    EXPECT_EQ(g._y2, 0);
    EXPECT_TRUE(g._edge2._1dy == 1e5);

    g.generate(span, 0, 0, 100);
    for (int j = 0; j < 100; j++) {
      int expected = (j * 41776) >> 14;
      EXPECT_EQ(int(span[j].v), expected).message("Pixel %d", j);
    }
  }
}

UNIT(span_gouraud_convexity, SW_TEST_GROUP_SPAN_GOURAUD) {
  INFO("Scanline through a sharp tip stays within the vertex colors");
  {
    SpanGouraudGray<SWGray8> g(SWGray8(194), SWGray8(164), SWGray8(161), 194.3, 57.3, 129.1, 71.0, 32.8, 92.5);
    SWGray8 span[256];

    g.prepare();
    g.generate(span, 0, 71, 256);

    for (uint32_t i = 0; i < 256; i++) {
      EXPECT_TRUE(span[i].v >= 161 && span[i].v <= 194).message("Pixel %u is %u", i, unsigned(span[i].v));
    }
  }

  INFO("Random gray triangles never leave the range of the vertex colors");
  {
    TestRandom rnd(0x123456789ABCDEFu);
    SWGray8 span[256];

    for (uint32_t n = 0; n < 300; n++) {
      uint32_t c0 = rnd.next_uint32() & 0xFFu;
      uint32_t c1 = rnd.next_uint32() & 0xFFu;
      uint32_t c2 = rnd.next_uint32() & 0xFFu;

      double x0 = rnd.next_double(200.0), y0 = rnd.next_double(200.0);
      double x1 = rnd.next_double(200.0), y1 = rnd.next_double(200.0);
      double x2 = rnd.next_double(200.0), y2 = rnd.next_double(200.0);

      SpanGouraudGray<SWGray8> g(SWGray8(c0), SWGray8(c1), SWGray8(c2), x0, y0, x1, y1, x2, y2);
      g.prepare();

      uint32_t lo = min3(c0, c1, c2);
      uint32_t hi = max3(c0, c1, c2);
      uint32_t violations = 0;

      for (int y = -2; y < 203; y++) {
        g.generate(span, -28, y, 256);
        for (uint32_t i = 0; i < 256; i++) {
          if (span[i].v < lo || span[i].v > hi || span[i].a != 255)
            violations++;
        }
      }

      EXPECT_EQ(violations, 0u).message("Triangle %u has %u pixels outside of [%u, %u]", n, violations, lo, hi);
    }
  }

  INFO("Random RGBA triangles never leave the range of the vertex colors per channel");
  {
    TestRandom rnd(0xFEDCBA987654321u);
    SWRgba8 span[256];

    for (uint32_t n = 0; n < 100; n++) {
      SWRgba8 c[3];
      for (uint32_t k = 0; k < 3; k++)
        c[k] = SWRgba8(rnd.next_uint32() & 0xFFu, rnd.next_uint32() & 0xFFu, rnd.next_uint32() & 0xFFu, rnd.next_uint32() & 0xFFu);

      double x0 = rnd.next_double(120.0), y0 = rnd.next_double(120.0);
      double x1 = rnd.next_double(120.0), y1 = rnd.next_double(120.0);
      double x2 = rnd.next_double(120.0), y2 = rnd.next_double(120.0);

      SpanGouraudRgba<SWRgba8> g(c[0], c[1], c[2], x0, y0, x1, y1, x2, y2);
      g.prepare();

      uint32_t violations = 0;
      for (int y = -2; y < 123; y++) {
        g.generate(span, -68, y, 256);
        for (uint32_t i = 0; i < 256; i++) {
          for (uint32_t ch = 0; ch < 4; ch++) {
            uint32_t v = ColorTraits<SWRgba8>::get(span[i], ch);
            uint32_t a = ColorTraits<SWRgba8>::get(c[0], ch);
            uint32_t b = ColorTraits<SWRgba8>::get(c[1], ch);
            uint32_t d = ColorTraits<SWRgba8>::get(c[2], ch);
            if (v < min3(a, b, d) || v > max3(a, b, d))
              violations++;
          }
        }
      }

      EXPECT_EQ(violations, 0u).message("Triangle %u has %u channels out of range", n, violations);
    }
  }
}

} // {Tests}
} // {sw}

#endif // SW_TEST

// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <swatch/core/api-build_test_p.h>
#if defined(SW_TEST)

#include <swatch/span/spanallocator_p.h>
#include <swatch/span/spanconverter_p.h>
#include <swatch/span/spansolid_p.h>

namespace sw {
namespace Tests {

UNIT(span_allocator, SW_TEST_GROUP_SPAN_UTILITIES) {
  INFO("Allocation is rounded up and zeroed");
  {
    SpanAllocator<SWRgba8> allocator;
    EXPECT_EQ(allocator.max_span_len(), 0u);

    SWRgba8* span = allocator.allocate(10);
    EXPECT_NE(span, nullptr);
    EXPECT_EQ(allocator.max_span_len(), 256u);

    for (uint32_t i = 0; i < 256; i++)
      span[i] = SWRgba8(1, 2, 3, 4);

    SWRgba8* again = allocator.allocate(5);
    EXPECT_EQ(again, span);
    for (uint32_t i = 0; i < 256; i++) {
      EXPECT_TRUE(again[i] == ColorOps::no_color<SWRgba8>()).message("Color at %u not zeroed", i);
    }

    SWRgba8* larger = allocator.allocate(300);
    EXPECT_NE(larger, nullptr);
    EXPECT_EQ(allocator.max_span_len(), 512u);
    EXPECT_EQ(allocator.span(), larger);
  }
}

UNIT(span_converters, SW_TEST_GROUP_SPAN_UTILITIES) {
  INFO("SpanSolid fills the whole span");
  {
    SpanSolid<SWGray8> solid(SWGray8(77, 99));
    SWGray8 span[16];

    solid.prepare();
    solid.generate(span, 3, 4, 16);
    for (uint32_t i = 0; i < 16; i++) {
      EXPECT_TRUE(span[i] == SWGray8(77, 99));
    }
  }

  INFO("SpanConvAlpha multiplies and clamps the factor");
  {
    SpanConvAlpha<SWRgba8> conv(0.5);
    SWRgba8 span[2] = { SWRgba8(10, 20, 30, 200), SWRgba8(10, 20, 30, 255) };

    conv.generate(span, 0, 0, 2);
    EXPECT_EQ(span[0].a, 100);
    EXPECT_EQ(span[1].a, 127);
    EXPECT_EQ(span[0].r, 10);

    conv.set_alpha(2.0);
    EXPECT_EQ(conv.alpha(), 1.0);
    conv.set_alpha(-1.0);
    EXPECT_EQ(conv.alpha(), 0.0);
  }

  INFO("SpanConverter chains generator and converter");
  {
    SpanSolid<SWRgba8> solid(SWRgba8(10, 20, 30, 200));
    SpanConvAlpha<SWRgba8> conv(0.5);
    SpanConverter<SpanSolid<SWRgba8>, SpanConvAlpha<SWRgba8>> chain(solid, conv);
    SWRgba8 span[8];

    chain.prepare();
    chain.generate(span, 0, 0, 8);
    for (uint32_t i = 0; i < 8; i++) {
      EXPECT_TRUE(span[i] == SWRgba8(10, 20, 30, 100));
    }

    SpanConverter<SpanSolid<SWRgba8>, SpanConvAlpha<SWRgba8>> generator_only;
    generator_only.attach_generator(solid);
    generator_only.prepare();
    generator_only.generate(span, 0, 0, 8);
    EXPECT_TRUE(span[7] == SWRgba8(10, 20, 30, 200));
  }

  INFO("SpanConvBrightnessAlpha with the default ramp");
  {
    SpanConvBrightnessAlpha<SWRgba8> conv;
    SWRgba8 span[3] = { SWRgba8(0, 0, 0, 255), SWRgba8(255, 255, 255, 0), SWRgba8(128, 128, 128, 0) };

    conv.generate(span, 0, 0, 3);
    EXPECT_EQ(span[0].a, 0);
    EXPECT_EQ(span[1].a, 255);
    EXPECT_EQ(span[2].a, 127);
    EXPECT_EQ(span[2].r, 128);
  }

  INFO("SpanConvBrightnessAlpha with a custom table and 16-bit colors");
  {
    uint8_t table[SpanConvBrightnessAlpha<SWRgba16>::kTableSize];
    for (uint32_t i = 0; i < SW_ARRAY_SIZE(table); i++)
      table[i] = uint8_t(255u - i / 3u);

    SpanConvBrightnessAlpha<SWRgba16> conv(table);
    SWRgba16 span[2] = { SWRgba16(0, 0, 0, 0), SWRgba16(65535, 65535, 65535, 0) };

    conv.generate(span, 0, 0, 2);
    EXPECT_EQ(span[0].a, 65535);
    EXPECT_EQ(span[1].a, 0);
  }
}

} // {Tests}
} // {sw}

#endif // SW_TEST

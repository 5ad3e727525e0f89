// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <swatch/core/api-build_p.h>
#include <swatch/core/runtime.h>
#include <swatch/span/gradientimage_p.h>

namespace sw {

// sw::GradientImage - Create
// ==========================

SWResult GradientImage::create(int width, int height) noexcept {
  if (SW_UNLIKELY(width <= 0 || height <= 0))
    return sw_make_error(SW_ERROR_INVALID_VALUE);

  if (SW_UNLIKELY(width > int(SW_RUNTIME_MAX_IMAGE_SIZE) || height > int(SW_RUNTIME_MAX_IMAGE_SIZE)))
    return sw_make_error(SW_ERROR_IMAGE_TOO_LARGE);

  size_t size = size_t(width) * size_t(height);
  SW_PROPAGATE(_pixels.resize_fill(size, ColorOps::no_color<SWRgba8>()));

  _width = width;
  _height = height;
  return SW_SUCCESS;
}

} // {sw}

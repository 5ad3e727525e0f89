// This file is part of Swatch project
//
// SPDX-License-Identifier: Zlib
//
// Copyright (c) 2026 The Swatch Authors
//
// This software is provided 'as-is', without any express or implied
// warranty. In no event will the authors be held liable for any damages
// arising from the use of this software.
//
// Permission is granted to anyone to use this software for any purpose,
// including commercial applications, and to alter it and redistribute it
// freely, subject to the following restrictions:
//
// 1. The origin of this software must not be misrepresented; you must not
//    claim that you wrote the original software. If you use this software
//    in a product, an acknowledgment in the product documentation would be
//    appreciated but is not required.
// 2. Altered source versions must be plainly marked as such, and must not be
//    misrepresented as being the original software.
// 3. This notice may not be removed or altered from any source distribution.

// ----------------------------------------------------------------------------
// This is a public header file designed to be used by Swatch users. It
// includes the public C/C++ API of the library: build information, colors,
// channel orders and the 2D matrix used to drive span interpolators.
//
// Span generators, interpolators and image filters are header-only templates
// placed in "swatch/" directory. Headers that end with "_p" suffix are part
// of the rendering core and are used by embedding the library, they are not
// installed by swatch-dev packages.
// ----------------------------------------------------------------------------

#ifndef SWATCH_H_INCLUDED
#define SWATCH_H_INCLUDED

#if defined(_MSC_VER)
  #pragma warning(push)
  #pragma warning(disable: 4201) // Nameless struct/union.
#endif

#include <swatch/core/api.h>
#include <swatch/core/matrix.h>
#include <swatch/core/rgba.h>
#include <swatch/core/runtime.h>

#if defined(_MSC_VER)
  #pragma warning(pop)
#endif

#endif // SWATCH_H_INCLUDED

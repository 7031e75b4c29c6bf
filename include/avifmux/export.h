// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef AVIFMUX_PUBLIC_EXPORT_H_
#define AVIFMUX_PUBLIC_EXPORT_H_

#if defined(SHARED_LIBRARY_BUILD)
#if defined(_WIN32)

#if defined(AVIFMUX_IMPLEMENTATION)
#define AVIFMUX_EXPORT __declspec(dllexport)
#else
#define AVIFMUX_EXPORT __declspec(dllimport)
#endif  // defined(AVIFMUX_IMPLEMENTATION)

#else  // defined(_WIN32)

#if defined(AVIFMUX_IMPLEMENTATION)
#define AVIFMUX_EXPORT __attribute__((visibility("default")))
#else
#define AVIFMUX_EXPORT
#endif

#endif  // defined(_WIN32)

#else  // defined(SHARED_LIBRARY_BUILD)
#define AVIFMUX_EXPORT
#endif  // defined(SHARED_LIBRARY_BUILD)

#endif  // AVIFMUX_PUBLIC_EXPORT_H_

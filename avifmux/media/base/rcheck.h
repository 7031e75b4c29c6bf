// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef AVIFMUX_MEDIA_BASE_RCHECK_H_
#define AVIFMUX_MEDIA_BASE_RCHECK_H_

#include <absl/log/log.h>

// Returns false from a bool function when |x| does not hold.
#define RCHECK(x)                                    \
  do {                                               \
    if (!(x)) {                                      \
      LOG(ERROR) << "Failure while writing: " << #x; \
      return false;                                  \
    }                                                \
  } while (0)

#endif  // AVIFMUX_MEDIA_BASE_RCHECK_H_

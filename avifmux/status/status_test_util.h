// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef AVIFMUX_STATUS_TEST_UTIL_H_
#define AVIFMUX_STATUS_TEST_UTIL_H_

#include <gtest/gtest.h>

#include <avifmux/status.h>

#define EXPECT_OK(val) EXPECT_EQ(avifmux::Status::OK, (val))
#define ASSERT_OK(val) ASSERT_EQ(avifmux::Status::OK, (val))
#define EXPECT_NOT_OK(val) EXPECT_NE(avifmux::Status::OK, (val))
#define ASSERT_NOT_OK(val) ASSERT_NE(avifmux::Status::OK, (val))

#endif  // AVIFMUX_STATUS_TEST_UTIL_H_

// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <avifmux/status.h>

#include <absl/strings/str_format.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace avifmux {

static void CheckStatus(const Status& s,
                        error::Code code,
                        const std::string& message) {
  EXPECT_EQ(code, s.error_code());
  EXPECT_EQ(message, s.error_message());

  if (code == error::OK) {
    EXPECT_TRUE(s.ok());
    EXPECT_EQ("OK", s.ToString());
  } else {
    EXPECT_FALSE(s.ok());
    EXPECT_THAT(s.ToString(), testing::HasSubstr(message));
    EXPECT_THAT(s.ToString(), testing::HasSubstr(absl::StrFormat("%d", code)));
  }
}

TEST(Status, Empty) {
  CheckStatus(Status(), error::OK, "");
}

TEST(Status, ConstructorOKDropsMessage) {
  CheckStatus(Status(error::OK, "msg"), error::OK, "");
}

TEST(Status, FileFailure) {
  CheckStatus(Status(error::FILE_FAILURE, "disk full"), error::FILE_FAILURE,
              "disk full");
}

TEST(Status, ToStringNamesTheCode) {
  EXPECT_THAT(Status(error::MUXER_FAILURE, "bad").ToString(),
              testing::HasSubstr("MUXER_FAILURE"));
}

TEST(Status, UpdateKeepsFirstError) {
  Status s;
  s.Update(Status::OK);
  ASSERT_TRUE(s.ok());
  const Status a(error::FILE_FAILURE, "message");
  s.Update(a);
  ASSERT_EQ(s, a);
  s.Update(Status(error::MUXER_FAILURE, "other message"));
  ASSERT_EQ(s, a);
}

TEST(Status, EqualsDifferentCode) {
  ASSERT_NE(Status(error::UNKNOWN, "message"),
            Status(error::FILE_FAILURE, "message"));
}

}  // namespace avifmux

// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <avifmux/status.h>

#include <absl/log/log.h>
#include <absl/strings/str_format.h>

#include <avifmux/macros/logging.h>

namespace avifmux {

namespace error {
namespace {
const char* ErrorCodeToString(Code error_code) {
  switch (error_code) {
    case OK:
      return "OK";
    case UNKNOWN:
      return "UNKNOWN";
    case FILE_FAILURE:
      return "FILE_FAILURE";
    case MUXER_FAILURE:
      return "MUXER_FAILURE";
  }

  NOTIMPLEMENTED() << "Unknown Status Code: " << error_code;
  return "UNKNOWN_STATUS";
}
}  // namespace
}  // namespace error

const Status Status::OK = Status(error::OK, "");
const Status Status::UNKNOWN = Status(error::UNKNOWN, "");

Status::Status(error::Code error_code, const std::string& error_message)
    : error_code_(error_code) {
  if (!ok()) {
    error_message_ = error_message;
    if (!error_message.empty())
      VLOG(1) << ToString();
  }
}

void Status::Update(Status new_status) {
  if (ok())
    *this = std::move(new_status);
}

std::string Status::ToString() const {
  if (error_code_ == error::OK)
    return "OK";

  return absl::StrFormat("%d (%s): %s", error_code_,
                         error::ErrorCodeToString(error_code_),
                         error_message_.c_str());
}

std::ostream& operator<<(std::ostream& os, const Status& x) {
  os << x.ToString();
  return os;
}

}  // namespace avifmux

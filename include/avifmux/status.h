// Copyright 2026 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef AVIFMUX_PUBLIC_STATUS_H_
#define AVIFMUX_PUBLIC_STATUS_H_

#include <iostream>
#include <string>

#include <avifmux/export.h>

namespace avifmux {

namespace error {

/// Error codes returned by the muxer.
enum Code {
  OK,

  // The failure carries no more specific information.
  UNKNOWN,

  // A file could not be opened, read or written.
  FILE_FAILURE,

  // The image cannot be represented in an AVIF file.
  MUXER_FAILURE,
};

}  // namespace error

/// Result of an operation: an error code plus a human readable message.
class AVIFMUX_EXPORT Status {
 public:
  Status() : error_code_(error::OK) {}

  /// The message is dropped when @a error_code is error::OK.
  Status(error::Code error_code, const std::string& error_message);

  static const Status OK;
  static const Status UNKNOWN;

  /// Keeps the first error: replaces *this with @a new_status only while
  /// *this is OK.
  void Update(Status new_status);

  bool ok() const { return error_code_ == error::OK; }
  error::Code error_code() const { return error_code_; }
  const std::string& error_message() const { return error_message_; }

  bool operator==(const Status& x) const {
    return error_code_ == x.error_code() && error_message_ == x.error_message();
  }
  bool operator!=(const Status& x) const { return !(*this == x); }

  /// @return "<code> (<name>): <message>", or "OK".
  std::string ToString() const;

 private:
  error::Code error_code_;
  std::string error_message_;
};

std::ostream& operator<<(std::ostream& os, const Status& x);

}  // namespace avifmux

#endif  // AVIFMUX_PUBLIC_STATUS_H_

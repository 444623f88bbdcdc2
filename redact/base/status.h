// Copyright 2017 Google Inc.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef REDACT_BASE_STATUS_H_
#define REDACT_BASE_STATUS_H_

#include <ostream>
#include <string>

#include "redact/base/logging.h"
#include "redact/base/types.h"

namespace redact {

// Error codes used by the redact libraries. Zero is reserved for success.
enum ErrorCode {
  E_INVALID_CONFIG = 1,   // configuration rejected at construction
  E_IO             = 2,   // file could not be read or written
  E_PARSE          = 3,   // malformed input file
  E_UNAVAILABLE    = 4,   // detector or resource not ready
  E_INTERNAL       = 5,   // unexpected failure in a collaborator
};

// A Status encapsulates the result of an operation. It may indicate success,
// or it may indicate an error with an associated error message.
class Status {
 public:
  // Create a success status.
  Status() : state_(nullptr) {}
  ~Status() { delete state_; }

  // Create an error status.
  Status(int code, const char *msg);
  Status(int code, const char *msg1, const char *msg2);
  Status(int code, const string &msg);
  Status(int code, const char *msg1, const string &msg2);
  Status(int code, const string &msg1, const string &msg2);

  // Copy the specified status.
  Status(const Status &s) : state_(CopyState(s.state_)) {}

  void operator=(const Status &s) {
    if (state_ != s.state_) {
      delete state_;
      state_ = CopyState(s.state_);
    }
  }

  // Status comparison.
  bool operator==(const Status &s) const { return s.code() == code(); }
  bool operator!=(const Status &s) const { return s.code() != code(); }

  // Returns true iff the status indicates success.
  bool ok() const { return state_ == nullptr; }

  // Returns true if status is ok. If status is not ok, it will also log an
  // error message, e.g. CHECK(File::WriteContents(...)).
  operator bool() const {
    if (!ok()) LOG(ERROR) << ToString();
    return ok();
  }

  // Returns "OK" for success or the error code and message.
  string ToString() const;

  // Returns the error code or zero for success.
  int code() const { return state_ == nullptr ? 0 : state_->code; }

  // Returns error message or empty string for success.
  const char *message() const {
    return state_ == nullptr ? "" : state_->message.c_str();
  }

  // Success status.
  static const Status &OK;

 private:
  // Error state. A null state means success.
  struct State {
    int code;
    string message;
  };

  State *state_;

  // Clone state.
  static State *CopyState(const State *s) {
    return s == nullptr ? nullptr : new State(*s);
  }
};

// Output status to stream.
inline std::ostream &operator<<(std::ostream &out, const Status &status) {
  out << status.ToString();
  return out;
}

}  // namespace redact

#endif  // REDACT_BASE_STATUS_H_

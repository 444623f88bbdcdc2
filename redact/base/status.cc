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

#include "redact/base/status.h"

#include <string>

#include "redact/base/logging.h"
#include "redact/base/types.h"

namespace redact {

static const Status ok_status;
const Status &Status::OK = ok_status;

Status::Status(int code, const char *msg) {
  DCHECK_NE(code, 0);
  state_ = new State;
  state_->code = code;
  state_->message = msg;
}

Status::Status(int code, const char *msg1, const char *msg2) {
  DCHECK_NE(code, 0);
  state_ = new State;
  state_->code = code;
  state_->message.append(msg1);
  state_->message.append(": ");
  state_->message.append(msg2);
}

Status::Status(int code, const char *msg1, const string &msg2)
  : Status(code, msg1, msg2.c_str()) {}

Status::Status(int code, const string &msg1, const string &msg2)
  : Status(code, msg1.c_str(), msg2.c_str()) {}

Status::Status(int code, const string &msg)
  : Status(code, msg.c_str()) {}

string Status::ToString() const {
  if (state_ == nullptr) {
    return "OK";
  } else {
    return "ERROR " + std::to_string(state_->code) + " : " + state_->message;
  }
}

}  // namespace redact

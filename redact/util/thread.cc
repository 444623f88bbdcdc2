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

#include "redact/util/thread.h"

#include <string.h>

#include "redact/base/logging.h"

namespace redact {

ClosureThread::~ClosureThread() {
  CHECK(!running_) << "Thread destroyed without being joined";
}

void *ClosureThread::ThreadMain(void *arg) {
  ClosureThread *thread = static_cast<ClosureThread *>(arg);
  thread->Run();
  return nullptr;
}

Status ClosureThread::Start() {
  CHECK(!running_);
  int rc = pthread_create(&thread_, nullptr, &ThreadMain, this);
  if (rc != 0) {
    return Status(E_UNAVAILABLE, "Unable to create thread", strerror(rc));
  }
  running_ = true;
  return Status::OK;
}

void ClosureThread::Join() {
  if (!running_) return;
  int rc = pthread_join(thread_, nullptr);
  CHECK_EQ(rc, 0) << "Unable to join thread: " << strerror(rc);
  running_ = false;
}

}  // namespace redact

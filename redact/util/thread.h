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

#ifndef REDACT_UTIL_THREAD_H_
#define REDACT_UTIL_THREAD_H_

#include <pthread.h>
#include <functional>

#include "redact/base/macros.h"
#include "redact/base/status.h"

namespace redact {

// A ClosureThread runs a closure in a new thread. A started thread must be
// joined before the thread object is destroyed.
class ClosureThread {
 public:
  // A closure is a void functional.
  typedef std::function<void()> Closure;

  explicit ClosureThread(const Closure &closure) : closure_(closure) {}
  ~ClosureThread();

  // Start running the closure in a new thread.
  Status Start();

  // Run the closure in the calling thread.
  void Run() { closure_(); }

  // Wait until the thread terminates. Does nothing if the thread has not
  // been started.
  void Join();

  // Check if thread has been started and not yet joined.
  bool running() const { return running_; }

 private:
  // Entry point for new thread.
  static void *ThreadMain(void *arg);

  // Closure executed by thread.
  Closure closure_;

  // Thread handle.
  pthread_t thread_;

  // Flag indicating that thread is running.
  bool running_ = false;

  DISALLOW_COPY_AND_ASSIGN(ClosureThread);
};

}  // namespace redact

#endif  // REDACT_UTIL_THREAD_H_

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

#include <atomic>
#include <iostream>
#include <vector>

#include "redact/base/init.h"
#include "redact/base/logging.h"
#include "redact/util/thread.h"

using namespace redact;

static void TestClosureThread() {
  int value = 0;
  ClosureThread thread([&value]() { value = 42; });
  CHECK(!thread.running());
  CHECK(thread.Start());
  CHECK(thread.running());
  thread.Join();
  CHECK(!thread.running());
  CHECK_EQ(value, 42);

  // Joining again has no effect.
  thread.Join();
  CHECK_EQ(value, 42);
}

static void TestRunInline() {
  int calls = 0;
  ClosureThread thread([&calls]() { calls++; });
  thread.Run();
  CHECK_EQ(calls, 1);

  // Joining a thread that was never started returns immediately.
  thread.Join();
  CHECK(!thread.running());
}

static void TestManyThreads() {
  std::vector<int> results(8);
  std::atomic<int> calls(0);
  std::vector<ClosureThread *> threads;
  for (int i = 0; i < 8; ++i) {
    threads.push_back(new ClosureThread([&results, &calls, i]() {
      results[i] = i * i;
      calls++;
    }));
  }
  for (ClosureThread *thread : threads) CHECK(thread->Start());
  for (ClosureThread *thread : threads) {
    thread->Join();
    delete thread;
  }
  CHECK_EQ(calls.load(), 8);
  for (int i = 0; i < 8; ++i) CHECK_EQ(results[i], i * i);
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestClosureThread();
  TestRunInline();
  TestManyThreads();

  std::cout << "PASS\n";
  return 0;
}

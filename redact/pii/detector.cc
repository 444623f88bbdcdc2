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

#include "redact/pii/detector.h"

#include "redact/base/logging.h"
#include "redact/util/thread.h"

namespace redact {
namespace pii {

int RunDetectors(const std::vector<const Detector *> &detectors,
                 const SourceText &text, DetectorOutputs *outputs) {
  int num_detectors = detectors.size();
  std::vector<DetectorOutputs> results(num_detectors);
  std::vector<Status> status(num_detectors);

  // Run each detector in a separate thread.
  std::vector<ClosureThread *> threads;
  for (int i = 0; i < num_detectors; ++i) {
    const Detector *detector = detectors[i];
    ClosureThread *thread = new ClosureThread([&, detector, i]() {
      if (!detector->ready()) {
        status[i] = Status(E_UNAVAILABLE, detector->name(), "not loaded");
        return;
      }
      status[i] = detector->Detect(text, &results[i]);
    });
    Status st = thread->Start();
    if (!st.ok()) {
      LOG(WARNING) << "Running " << detector->name()
                   << " in calling thread: " << st;
      thread->Run();
    }
    threads.push_back(thread);
  }

  // Wait for all detectors to finish.
  for (ClosureThread *thread : threads) {
    thread->Join();
    delete thread;
  }

  // Collect outputs from successful detectors.
  int failures = 0;
  for (int i = 0; i < num_detectors; ++i) {
    if (status[i].ok()) {
      VLOG(1) << detectors[i]->name() << ": "
              << results[i].candidates.size() << " candidates, "
              << results[i].tagged.size() << " tagged values";
      outputs->Append(results[i]);
    } else {
      LOG(WARNING) << "Detector " << detectors[i]->name() << " failed: "
                   << status[i];
      failures++;
    }
  }
  return failures;
}

}  // namespace pii
}  // namespace redact

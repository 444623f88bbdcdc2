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

#ifndef REDACT_PII_DETECTOR_H_
#define REDACT_PII_DETECTOR_H_

#include <string>
#include <vector>

#include "redact/base/status.h"
#include "redact/base/types.h"
#include "redact/pii/candidate.h"
#include "redact/pii/reconciler.h"

namespace redact {
namespace pii {

// Interface for PII detectors. Detectors can hold heavy resources like
// models. These are acquired once by Load() and released when the detector
// is deleted. Detect() can be called concurrently on a loaded detector.
class Detector {
 public:
  virtual ~Detector() = default;

  // Detector name for logging.
  virtual string name() const = 0;

  // Load detector resources.
  virtual Status Load() = 0;

  // Check if the detector has been loaded.
  virtual bool ready() const = 0;

  // Detect PII in text and add candidates or tagged values to outputs.
  virtual Status Detect(const SourceText &text,
                        DetectorOutputs *outputs) const = 0;
};

// Run detectors concurrently, one thread per detector, and collect their
// outputs in detector order. A detector that is not ready or fails adds no
// output. Returns the number of detectors that did not produce output.
int RunDetectors(const std::vector<const Detector *> &detectors,
                 const SourceText &text, DetectorOutputs *outputs);

}  // namespace pii
}  // namespace redact

#endif  // REDACT_PII_DETECTOR_H_

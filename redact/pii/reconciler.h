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

#ifndef REDACT_PII_RECONCILER_H_
#define REDACT_PII_RECONCILER_H_

#include <vector>

#include "redact/base/types.h"
#include "redact/pii/candidate.h"
#include "redact/pii/config.h"
#include "redact/pii/consensus.h"
#include "redact/pii/discard.h"
#include "redact/pii/generation-parser.h"
#include "redact/pii/merger.h"
#include "redact/pii/noise-filter.h"
#include "redact/pii/span-recovery.h"

namespace redact {
namespace pii {

// Outputs of all detectors for one text. Candidates from span detectors
// carry their source and raw label. The generative model output has no
// offsets and is given as tagged values in generation order.
struct DetectorOutputs {
  Candidates candidates;
  std::vector<TaggedValue> tagged;

  // Add outputs from another detector.
  void Append(const DetectorOutputs &other);
};

// Reconciles the outputs of all detectors into the final list of PII
// entities for a text. The pipeline is:
//   1. map raw labels to canonical types,
//   2. recover spans for the generative model output,
//   3. in strict mode, keep only entities where the pattern detector and a
//      model-based detector agree,
//   4. merge overlapping candidates,
//   5. remove allowed terms,
//   6. remove noise.
// Reconciliation never fails; rejected candidates are reported to the
// discard sink.
class Reconciler {
 public:
  // Initialize reconciler. The configuration and sink must outlive the
  // reconciler. The sink can be null.
  Reconciler(const ReconcilerConfig *config, DiscardSink *sink = nullptr);

  // Reconcile detector outputs for text.
  void Reconcile(const SourceText &text, const DetectorOutputs &outputs,
                 Candidates *result) const;

 private:
  // Assign canonical types and drop candidates outside the text.
  void Normalize(const SourceText &text, const Candidates &input,
                 Candidates *output) const;

  // Remove candidates of types that should not be detected.
  void SelectTypes(Candidates *candidates) const;

  // Split candidates into candidates agreed on by the pattern detector and
  // another detector, and rejected candidates. Candidates of types that do
  // not need agreement are verified without a partner.
  void Verify(const SourceText &text, const Candidates &input,
              Candidates *verified, Candidates *rejected) const;

  // Keep merged entities that contain a verified candidate of the same type.
  // The entity takes the source and labels of the best verified candidate.
  void KeepVerified(const Candidates &verified, Candidates *entities) const;

  // Remove candidates matching the allow list.
  void RemoveAllowed(const SourceText &text, Candidates *candidates) const;

  const ReconcilerConfig *config_;
  DiscardSink *sink_;
  SpanRecovery recovery_;
  ConsensusEngine consensus_;
  Merger merger_;
  NoiseFilter noise_filter_;
};

}  // namespace pii
}  // namespace redact

#endif  // REDACT_PII_RECONCILER_H_

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

#ifndef REDACT_PII_DISCARD_H_
#define REDACT_PII_DISCARD_H_

#include <mutex>
#include <string>
#include <vector>

#include "redact/base/status.h"
#include "redact/base/types.h"
#include "redact/pii/candidate.h"

namespace redact {
namespace pii {

// Category of a discard decision.
enum DiscardCategory {
  RECOVERY_DISCARD,   // generative value could not be placed in the text
  CONSENSUS_REJECT,   // candidate without agreeing counterpart
  NOISE_REJECT,       // degenerate span text
  MAPPING_UNKNOWN,    // detector label without canonical type
  ALLOW_LIST,         // span text is an allowed term
  INVALID_SPAN,       // detector offsets outside the text
};

// Reason for a discard decision.
enum DiscardReason {
  NO_MATCH,
  AMBIGUOUS_MATCH,
  ANCHOR_MISSING,
  LENGTH_MISMATCH,
  TAG_UNRECOGNIZED,
  TYPE_MISMATCH,
  INSUFFICIENT_OVERLAP,
  NO_COUNTERPART,
  NOISE_CONTENT,
  UNKNOWN_LABEL,
  ALLOWED_TERM,
};

// Return category and reason names.
const char *DiscardCategoryName(DiscardCategory category);
const char *DiscardReasonName(DiscardReason reason);

// A discard event records a candidate or generated value that the pipeline
// decided not to emit.
struct DiscardEvent {
  DiscardCategory category;
  DiscardReason reason;
  Source source;
  string text;       // tagged value or sliced span text
  string raw_type;   // detector label or generation tag
  int begin = -1;    // span when known, otherwise -1
  int end = -1;

  // Return event as a single log line.
  string ToString() const;
};

// Observability sink receiving discard events. Failures reported by the sink
// are logged but never change the result of the pipeline.
class DiscardSink {
 public:
  virtual ~DiscardSink() = default;

  // Report discard event.
  virtual Status Report(const DiscardEvent &event) = 0;
};

// Discard sink that writes events to the log.
class LoggingDiscardSink : public DiscardSink {
 public:
  Status Report(const DiscardEvent &event) override;
};

// Discard sink that keeps all events in memory.
class DiscardCollector : public DiscardSink {
 public:
  Status Report(const DiscardEvent &event) override;

  // Return collected events.
  const std::vector<DiscardEvent> &events() const { return events_; }

  // Return number of events with reason.
  int count(DiscardReason reason) const;

  // Return number of events in category.
  int count(DiscardCategory category) const;

  // Remove all events.
  void clear() { events_.clear(); }

 private:
  std::vector<DiscardEvent> events_;
  std::mutex mu_;
};

// Send discard event to sink. The sink can be null. Sink errors are logged.
void ReportDiscard(DiscardSink *sink, const DiscardEvent &event);

// Build discard event for candidate.
DiscardEvent MakeDiscard(DiscardCategory category, DiscardReason reason,
                         const SourceText &text, const Candidate &candidate);

}  // namespace pii
}  // namespace redact

#endif  // REDACT_PII_DISCARD_H_

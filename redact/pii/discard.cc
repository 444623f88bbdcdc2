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

#include "redact/pii/discard.h"

#include <sstream>

#include "redact/base/logging.h"

namespace redact {
namespace pii {

static const char *kCategoryNames[] = {
  "RECOVERY_DISCARD",
  "CONSENSUS_REJECT",
  "NOISE_REJECT",
  "MAPPING_UNKNOWN",
  "ALLOW_LIST",
  "INVALID_SPAN",
};

static const char *kReasonNames[] = {
  "NO_MATCH",
  "AMBIGUOUS_MATCH",
  "ANCHOR_MISSING",
  "LENGTH_MISMATCH",
  "TAG_UNRECOGNIZED",
  "TYPE_MISMATCH",
  "INSUFFICIENT_OVERLAP",
  "NO_COUNTERPART",
  "NOISE_CONTENT",
  "UNKNOWN_LABEL",
  "ALLOWED_TERM",
};

const char *DiscardCategoryName(DiscardCategory category) {
  return kCategoryNames[category];
}

const char *DiscardReasonName(DiscardReason reason) {
  return kReasonNames[reason];
}

string DiscardEvent::ToString() const {
  std::ostringstream str;
  str << DiscardCategoryName(category) << "/" << DiscardReasonName(reason)
      << " " << SourceName(source) << " " << raw_type;
  if (begin >= 0) str << " [" << begin << "," << end << "[";
  str << " '" << text << "'";
  return str.str();
}

Status LoggingDiscardSink::Report(const DiscardEvent &event) {
  LOG(INFO) << "Discard " << event.ToString();
  return Status::OK;
}

Status DiscardCollector::Report(const DiscardEvent &event) {
  std::lock_guard<std::mutex> lock(mu_);
  events_.push_back(event);
  return Status::OK;
}

int DiscardCollector::count(DiscardReason reason) const {
  int n = 0;
  for (const DiscardEvent &event : events_) {
    if (event.reason == reason) n++;
  }
  return n;
}

int DiscardCollector::count(DiscardCategory category) const {
  int n = 0;
  for (const DiscardEvent &event : events_) {
    if (event.category == category) n++;
  }
  return n;
}

void ReportDiscard(DiscardSink *sink, const DiscardEvent &event) {
  VLOG(1) << "Discard " << event.ToString();
  if (sink == nullptr) return;
  Status st = sink->Report(event);
  if (!st.ok()) {
    LOG(WARNING) << "Discard sink failed: " << st;
  }
}

DiscardEvent MakeDiscard(DiscardCategory category, DiscardReason reason,
                         const SourceText &text, const Candidate &candidate) {
  DiscardEvent event;
  event.category = category;
  event.reason = reason;
  event.source = candidate.source;
  event.text = text.Slice(candidate.begin, candidate.end);
  event.raw_type = candidate.raw_type;
  event.begin = candidate.begin;
  event.end = candidate.end;
  return event;
}

}  // namespace pii
}  // namespace redact

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

#include "redact/pii/reconciler.h"

#include <algorithm>

#include "redact/base/logging.h"

namespace redact {
namespace pii {

void DetectorOutputs::Append(const DetectorOutputs &other) {
  candidates.insert(candidates.end(),
                    other.candidates.begin(), other.candidates.end());
  tagged.insert(tagged.end(), other.tagged.begin(), other.tagged.end());
}

Reconciler::Reconciler(const ReconcilerConfig *config, DiscardSink *sink)
    : config_(config),
      sink_(sink),
      recovery_(config),
      consensus_(config->agreement_threshold()),
      merger_(config),
      noise_filter_(config->noise_ratio()) {}

void Reconciler::Reconcile(const SourceText &text,
                           const DetectorOutputs &outputs,
                           Candidates *result) const {
  // Map detector labels to canonical types.
  Candidates candidates;
  Normalize(text, outputs.candidates, &candidates);

  // Recover spans for tagged values from the generative model.
  recovery_.RecoverAll(text, outputs.tagged, &candidates, sink_);
  SelectTypes(&candidates);

  if (config_->strict()) {
    // Rejected candidates take part in merging like in non-strict mode, so
    // strict mode only removes entities from the non-strict result.
    Candidates verified;
    Candidates rejected;
    Verify(text, candidates, &verified, &rejected);
    Candidates all = verified;
    all.insert(all.end(), rejected.begin(), rejected.end());
    merger_.Merge(text, all, result, sink_);
    KeepVerified(verified, result);
  } else {
    merger_.Merge(text, candidates, result, sink_);
  }

  // Remove allowed terms and noise.
  RemoveAllowed(text, result);
  noise_filter_.Filter(text, result, sink_);

  VLOG(1) << "Reconciled " << outputs.candidates.size() << " candidates and "
          << outputs.tagged.size() << " tagged values into "
          << result->size() << " entities";
}

void Reconciler::Normalize(const SourceText &text, const Candidates &input,
                           Candidates *output) const {
  const TypeNormalizer &normalizer = config_->normalizer();
  for (const Candidate &c : input) {
    // Malformed detector offsets never reach the later stages.
    if (!c.Valid(text.length())) {
      ReportDiscard(sink_, MakeDiscard(INVALID_SPAN, NO_MATCH, text, c));
      continue;
    }

    Candidate candidate = c;
    candidate.score = std::min(std::max(c.score, 0.0f), 1.0f);
    if (!normalizer.Lookup(c.raw_type, c.source, &candidate.type)) {
      LOG(WARNING) << "Unknown " << SourceName(c.source) << " label '"
                   << c.raw_type << "'";
      candidate.type = UNKNOWN;
      ReportDiscard(sink_, MakeDiscard(MAPPING_UNKNOWN, UNKNOWN_LABEL,
                                       text, candidate));
    }
    output->push_back(candidate);
  }
}

void Reconciler::SelectTypes(Candidates *candidates) const {
  int kept = 0;
  for (int i = 0; i < candidates->size(); ++i) {
    const Candidate &c = (*candidates)[i];
    if (!config_->masked(c.type)) {
      VLOG(2) << "Ignore " << EntityTypeName(c.type) << " ["
              << c.begin << "," << c.end << "[";
      continue;
    }
    if (kept != i) (*candidates)[kept] = c;
    kept++;
  }
  candidates->resize(kept);
}

void Reconciler::Verify(const SourceText &text, const Candidates &input,
                        Candidates *verified, Candidates *rejected) const {
  // The pattern detector is checked against all model-based detectors.
  Candidates patterns;
  Candidates models;
  for (const Candidate &c : input) {
    if (!config_->dual_detection(c.type)) {
      verified->push_back(c);
    } else if (c.source == PATTERN) {
      patterns.push_back(c);
    } else {
      models.push_back(c);
    }
  }
  consensus_.Reconcile(text, patterns, models, verified, sink_, rejected);
}

void Reconciler::KeepVerified(const Candidates &verified,
                              Candidates *entities) const {
  Candidates kept;
  for (const Candidate &entity : *entities) {
    const Candidate *best = nullptr;
    for (const Candidate &c : verified) {
      if (c.type != entity.type || !entity.Contains(c)) continue;
      if (best == nullptr || c.score > best->score ||
          (c.score == best->score && c.begin < best->begin)) {
        best = &c;
      }
    }
    if (best == nullptr) {
      VLOG(1) << "Drop unverified " << EntityTypeName(entity.type) << " ["
              << entity.begin << "," << entity.end << "[";
      continue;
    }
    Candidate c = entity;
    c.source = best->source;
    c.raw_type = best->raw_type;
    c.partner_type = best->partner_type;
    kept.push_back(c);
  }
  entities->swap(kept);
}

void Reconciler::RemoveAllowed(const SourceText &text,
                               Candidates *candidates) const {
  const AllowList &allow_list = config_->allow_list();
  if (allow_list.empty()) return;
  Candidates kept;
  for (const Candidate &c : *candidates) {
    if (allow_list.Contains(text.Text(c))) {
      ReportDiscard(sink_, MakeDiscard(ALLOW_LIST, ALLOWED_TERM, text, c));
    } else {
      kept.push_back(c);
    }
  }
  candidates->swap(kept);
}

}  // namespace pii
}  // namespace redact

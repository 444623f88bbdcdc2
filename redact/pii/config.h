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

#ifndef REDACT_PII_CONFIG_H_
#define REDACT_PII_CONFIG_H_

#include <map>
#include <set>
#include <string>
#include <vector>

#include "redact/base/macros.h"
#include "redact/base/status.h"
#include "redact/base/types.h"
#include "redact/pii/allow-list.h"
#include "redact/pii/candidate.h"
#include "redact/pii/entity-type.h"
#include "redact/pii/type-normalizer.h"

namespace redact {
namespace pii {

// Label table file for a detector vocabulary.
struct LabelFile {
  Source vocabulary;
  string filename;
};

// Options for reconciling detector outputs.
struct ReconcilerOptions {
  ReconcilerOptions();

  // Only emit entities that both the pattern detector and a model-based
  // detector agree on.
  bool strict = false;

  // Types that need agreement in strict mode. Candidates of other types are
  // trusted without a second detector.
  std::set<EntityType> dual_detection_types;

  // Types to detect. Candidates of other types are ignored.
  std::set<EntityType> entities_to_mask;

  // Minimum overlap for agreement as a fraction of the shorter span.
  float agreement_threshold = 0.5;

  // Maximum relative length difference between a tagged value and a text
  // window for accepting the window.
  float length_tolerance = 0.3;

  // Minimum fraction of non-space, non-punctuation characters in a span.
  float noise_ratio = 0.5;

  // Score for spans recovered from the generative model.
  float base_score = 0.85;

  // Minimum mean token score for decoded token classifier entities.
  float min_token_score = 0.0;

  // Maximum length of generation context used as anchor.
  int anchor_length = 8;

  // Number of code points after the consumption pointer searched for anchors.
  int search_window = 700;

  // Maximum span length for masked values, per type and for other types.
  std::map<EntityType, int> max_span;
  int default_max_span = 120;

  // Containment priority, highest priority first.
  std::vector<EntityType> priority;

  // Use built-in label tables.
  bool default_labels = true;

  // Additional label tables.
  std::vector<LabelFile> label_files;

  // Allow list dictionaries and extra allowed terms.
  std::vector<string> dictionaries;
  std::vector<string> allowed_terms;
};

// Validated reconciler configuration. The configuration does not change after
// initialization and can be shared between reconcilers.
class ReconcilerConfig {
 public:
  ReconcilerConfig() {}

  // Validate options, load label tables and dictionaries. Any previous
  // configuration is replaced.
  Status Init(const ReconcilerOptions &options);

  // Label normalization tables.
  const TypeNormalizer &normalizer() const { return normalizer_; }

  // Allowed terms.
  const AllowList &allow_list() const { return allow_list_; }

  // Options.
  bool strict() const { return options_.strict; }
  float agreement_threshold() const { return options_.agreement_threshold; }
  float length_tolerance() const { return options_.length_tolerance; }
  float noise_ratio() const { return options_.noise_ratio; }
  float base_score() const { return options_.base_score; }
  float min_token_score() const { return options_.min_token_score; }
  int anchor_length() const { return options_.anchor_length; }
  int search_window() const { return options_.search_window; }

  // Check if candidates of type need agreement in strict mode.
  bool dual_detection(EntityType type) const { return dual_[type]; }

  // Check if entities of type should be detected.
  bool masked(EntityType type) const { return masked_[type]; }

  // Maximum span length for masked values of type.
  int max_span(EntityType type) const;

  // Containment priority order.
  const std::vector<EntityType> &priority() const { return options_.priority; }

  // Rank of type in priority order. Lower rank means higher priority. Types
  // not in the priority order rank below all other types.
  int rank(EntityType type) const { return rank_[type]; }

 private:
  ReconcilerOptions options_;
  TypeNormalizer normalizer_;
  AllowList allow_list_;
  int rank_[kNumEntityTypes];
  bool dual_[kNumEntityTypes];
  bool masked_[kNumEntityTypes];

  DISALLOW_COPY_AND_ASSIGN(ReconcilerConfig);
};

}  // namespace pii
}  // namespace redact

#endif  // REDACT_PII_CONFIG_H_

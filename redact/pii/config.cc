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

#include "redact/pii/config.h"

#include "redact/base/logging.h"

namespace redact {
namespace pii {

namespace {

// Check that value is in the range [low;high].
Status CheckRange(const char *name, float value, float low, float high) {
  if (value < low || value > high) {
    return Status(E_INVALID_CONFIG, name,
                  std::to_string(value) + " is outside [" +
                  std::to_string(low) + ";" + std::to_string(high) + "]");
  }
  return Status::OK;
}

}  // namespace

ReconcilerOptions::ReconcilerOptions() : priority(DefaultTypePriority()) {
  std::vector<EntityType> types = AllEntityTypes();
  dual_detection_types.insert(types.begin(), types.end());
  entities_to_mask.insert(types.begin(), types.end());

  max_span[LOCATION] = 200;
  max_span[PERSON] = 40;
  max_span[ORGANIZATION] = 80;
  max_span[CUSTOMER_ID] = 40;
  max_span[EMAIL] = 80;
  max_span[PHONE] = 40;
  max_span[ZIP_CODE] = 20;
  max_span[DATE_OF_BIRTH] = 30;
}

Status ReconcilerConfig::Init(const ReconcilerOptions &options) {
  options_ = options;
  normalizer_ = TypeNormalizer();
  allow_list_ = AllowList();

  // Check thresholds.
  Status st;
  if (options.agreement_threshold <= 0.0) {
    return Status(E_INVALID_CONFIG, "agreement_threshold",
                  "must be positive");
  }
  st = CheckRange("agreement_threshold", options.agreement_threshold, 0, 1);
  if (!st.ok()) return st;
  st = CheckRange("length_tolerance", options.length_tolerance, 0, 1);
  if (!st.ok()) return st;
  st = CheckRange("noise_ratio", options.noise_ratio, 0, 1);
  if (!st.ok()) return st;
  st = CheckRange("base_score", options.base_score, 0, 1);
  if (!st.ok()) return st;
  st = CheckRange("min_token_score", options.min_token_score, 0, 1);
  if (!st.ok()) return st;
  if (options.anchor_length <= 0) {
    return Status(E_INVALID_CONFIG, "anchor_length", "must be positive");
  }
  if (options.search_window <= 0) {
    return Status(E_INVALID_CONFIG, "search_window", "must be positive");
  }
  if (options.default_max_span <= 0) {
    return Status(E_INVALID_CONFIG, "default_max_span", "must be positive");
  }
  for (const auto &it : options.max_span) {
    if (it.second <= 0) {
      return Status(E_INVALID_CONFIG, "max_span",
                    string(EntityTypeName(it.first)) + " must be positive");
    }
  }

  // Check priority order.
  if (options.priority.empty()) {
    return Status(E_INVALID_CONFIG, "priority", "empty priority order");
  }
  int num_ranked = options.priority.size();
  for (int i = 0; i < kNumEntityTypes; ++i) rank_[i] = num_ranked;
  for (int i = 0; i < num_ranked; ++i) {
    EntityType type = options.priority[i];
    if (rank_[type] != num_ranked) {
      return Status(E_INVALID_CONFIG, "priority",
                    string("duplicate type ") + EntityTypeName(type));
    }
    rank_[type] = i;
  }

  // Select entity types.
  if (options.entities_to_mask.empty()) {
    return Status(E_INVALID_CONFIG, "entities_to_mask", "no entity types");
  }
  for (int i = 0; i < kNumEntityTypes; ++i) {
    EntityType type = static_cast<EntityType>(i);
    dual_[i] = options.dual_detection_types.count(type) > 0;
    masked_[i] = options.entities_to_mask.count(type) > 0;
  }

  // Load label tables.
  if (options.default_labels) normalizer_.AddDefaults();
  for (const LabelFile &file : options.label_files) {
    st = normalizer_.Load(file.vocabulary, file.filename);
    if (!st.ok()) return st;
  }
  if (normalizer_.empty()) {
    return Status(E_INVALID_CONFIG, "labels", "empty mapping table");
  }

  // Load allow list.
  for (const string &dictionary : options.dictionaries) {
    st = allow_list_.LoadDictionary(dictionary);
    if (!st.ok()) return st;
  }
  for (const string &term : options.allowed_terms) allow_list_.Add(term);

  VLOG(1) << "Reconciler configured, strict=" << options.strict
          << " threshold=" << options.agreement_threshold
          << " allowed terms=" << allow_list_.size();
  return Status::OK;
}

int ReconcilerConfig::max_span(EntityType type) const {
  auto f = options_.max_span.find(type);
  if (f == options_.max_span.end()) return options_.default_max_span;
  return f->second;
}

}  // namespace pii
}  // namespace redact

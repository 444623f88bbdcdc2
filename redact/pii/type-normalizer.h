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

#ifndef REDACT_PII_TYPE_NORMALIZER_H_
#define REDACT_PII_TYPE_NORMALIZER_H_

#include <string>
#include <unordered_map>
#include <vector>

#include "redact/base/status.h"
#include "redact/base/types.h"
#include "redact/pii/candidate.h"
#include "redact/pii/entity-type.h"

namespace redact {
namespace pii {

// Position of a token label in a BIO, BIOES, or BILOU tagging scheme.
enum LabelPosition {
  LABEL_OUTSIDE,   // O
  LABEL_BEGIN,     // B-
  LABEL_INSIDE,    // I-
  LABEL_LAST,      // E- and L-
  LABEL_SINGLE,    // S- and U-
  LABEL_BARE,      // label without prefix
};

// Split a raw token label into its tagging position and base label, e.g.
// "B-PER" is split into LABEL_BEGIN and "PER".
LabelPosition SplitLabel(const string &label, string *base);

// Maps the label vocabulary of each detector to canonical entity types. Each
// detector source has its own label table. Canonical type names are accepted
// in every vocabulary.
class TypeNormalizer {
 public:
  // Initialize empty normalizer.
  TypeNormalizer() {}

  // Add built-in label tables for all detector vocabularies.
  void AddDefaults();

  // Add label to the table for a vocabulary.
  void Add(Source vocabulary, const string &label, EntityType type);

  // Remove all labels for a vocabulary.
  void Clear(Source vocabulary);

  // Load label table from a text map file with a label and a canonical type
  // name on each line. A file without labels is an error.
  Status Load(Source vocabulary, const string &filename);

  // Look up the canonical type for a raw label after stripping any tagging
  // prefix. Returns false if the label is not known.
  bool Lookup(const string &raw_label, Source vocabulary,
              EntityType *type) const;

  // Return canonical type for a raw label. Unknown labels map to UNKNOWN and
  // are logged as a warning.
  EntityType Normalize(const string &raw_label, Source vocabulary) const;

  // Return all labels in vocabulary in sorted order.
  std::vector<string> Labels(Source vocabulary) const;

  // Number of labels in vocabulary.
  int size(Source vocabulary) const { return tables_[vocabulary].size(); }

  // Check if there are no labels in any vocabulary.
  bool empty() const;

 private:
  // Label tables for each vocabulary.
  std::unordered_map<string, EntityType> tables_[kNumSources];
};

}  // namespace pii
}  // namespace redact

#endif  // REDACT_PII_TYPE_NORMALIZER_H_

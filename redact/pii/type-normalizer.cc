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

#include "redact/pii/type-normalizer.h"

#include <algorithm>

#include "redact/base/logging.h"
#include "redact/file/textmap.h"

namespace redact {
namespace pii {

namespace {

struct LabelMapping {
  const char *label;
  EntityType type;
};

// Labels of the Japanese pattern recognizers. These are also produced by the
// Japanese model-based detectors.
const LabelMapping kPatternLabels[] = {
  {"JP_PERSON", PERSON},
  {"JP_ADDRESS", LOCATION},
  {"GPE_JP", LOCATION},
  {"JP_ORGANIZATION", ORGANIZATION},
  {"PHONE_NUMBER_JP", PHONE},
  {"PHONE_NUMBER", PHONE},
  {"EMAIL_ADDRESS", EMAIL},
  {"JP_ZIP_CODE", ZIP_CODE},
  {"DATE_OF_BIRTH_JP", DATE_OF_BIRTH},
  {"JP_AGE", AGE},
  {"JP_GENDER", GENDER},
  {"CUSTOMER_ID_JP", CUSTOMER_ID},
};

// Labels of statistical NER taggers.
const LabelMapping kNerLabels[] = {
  {"PER", PERSON},
  {"Person", PERSON},
  {"LOC", LOCATION},
  {"GPE", LOCATION},
  {"Province", LOCATION},
  {"City", LOCATION},
  {"ORG", ORGANIZATION},
  {"Company", ORGANIZATION},
};

// Labels of transformer token classifiers for English and Japanese.
const LabelMapping kTransformerLabels[] = {
  {"PER", PERSON},
  {"LOC", LOCATION},
  {"ORG", ORGANIZATION},
  {"人名", PERSON},
  {"地名", LOCATION},
  {"施設名", LOCATION},
  {"法人名", ORGANIZATION},
  {"その他の組織名", ORGANIZATION},
  {"政治的組織名", ORGANIZATION},
};

// Tags of the generative masking model.
const LabelMapping kGenerativeLabels[] = {
  {"name", PERSON},
  {"birthday", DATE_OF_BIRTH},
  {"phone-number", PHONE},
  {"mail-address", EMAIL},
  {"customer-id", CUSTOMER_ID},
  {"address", LOCATION},
  {"post-code", ZIP_CODE},
  {"company", ORGANIZATION},
};

template <int N>
void AddLabels(TypeNormalizer *normalizer, Source vocabulary,
               const LabelMapping (&labels)[N]) {
  for (int i = 0; i < N; ++i) {
    normalizer->Add(vocabulary, labels[i].label, labels[i].type);
  }
}

// Return ASCII uppercase version of string.
string Uppercase(const string &str) {
  string result = str;
  for (char &c : result) {
    if (c >= 'a' && c <= 'z') c -= 'a' - 'A';
  }
  return result;
}

}  // namespace

LabelPosition SplitLabel(const string &label, string *base) {
  if (label.empty() || label == "O") {
    base->clear();
    return LABEL_OUTSIDE;
  }

  // Generation tags can be written with angle brackets.
  if (label.size() > 2 && label.front() == '<' && label.back() == '>') {
    *base = label.substr(1, label.size() - 2);
    return LABEL_BARE;
  }

  if (label.size() > 2 && (label[1] == '-' || label[1] == '_')) {
    LabelPosition position = LABEL_BARE;
    switch (label[0]) {
      case 'B': position = LABEL_BEGIN; break;
      case 'I': position = LABEL_INSIDE; break;
      case 'E': case 'L': position = LABEL_LAST; break;
      case 'S': case 'U': position = LABEL_SINGLE; break;
    }
    if (position != LABEL_BARE) {
      *base = label.substr(2);
      return position;
    }
  }

  *base = label;
  return LABEL_BARE;
}

void TypeNormalizer::AddDefaults() {
  AddLabels(this, PATTERN, kPatternLabels);
  AddLabels(this, NER, kPatternLabels);
  AddLabels(this, NER, kNerLabels);
  AddLabels(this, TRANSFORMER, kPatternLabels);
  AddLabels(this, TRANSFORMER, kTransformerLabels);
  AddLabels(this, GENERATIVE, kGenerativeLabels);
}

void TypeNormalizer::Add(Source vocabulary, const string &label,
                         EntityType type) {
  tables_[vocabulary][label] = type;
}

void TypeNormalizer::Clear(Source vocabulary) {
  tables_[vocabulary].clear();
}

Status TypeNormalizer::Load(Source vocabulary, const string &filename) {
  TextMapInput input(filename);
  int entries = 0;
  while (input.Next()) {
    EntityType type;
    if (!ParseEntityType(input.value(), &type)) {
      return Status(E_PARSE, filename + ":" + std::to_string(input.line()),
                    "unknown entity type '" + input.value() + "'");
    }
    Add(vocabulary, input.key(), type);
    entries++;
  }
  if (!input.status().ok()) return input.status();
  if (entries == 0) {
    return Status(E_INVALID_CONFIG, filename, "empty label table");
  }
  VLOG(1) << "Loaded " << entries << " " << SourceName(vocabulary)
          << " labels from " << filename;
  return Status::OK;
}

bool TypeNormalizer::Lookup(const string &raw_label, Source vocabulary,
                            EntityType *type) const {
  string base;
  if (SplitLabel(raw_label, &base) == LABEL_OUTSIDE) return false;

  // Try the vocabulary table first.
  const auto &table = tables_[vocabulary];
  auto f = table.find(base);
  if (f != table.end()) {
    *type = f->second;
    return true;
  }

  // Canonical type names are valid in all vocabularies.
  if (ParseEntityType(base, type)) return true;

  // Fall back to case-insensitive match for ASCII labels. Labels that only
  // differ by case but map to different types make the match ambiguous.
  string upper = Uppercase(base);
  bool found = false;
  EntityType match = UNKNOWN;
  for (const auto &entry : table) {
    if (Uppercase(entry.first) != upper) continue;
    if (found && entry.second != match) {
      LOG(WARNING) << "Ambiguous " << SourceName(vocabulary) << " label '"
                   << raw_label << "'";
      return false;
    }
    found = true;
    match = entry.second;
  }
  if (found) {
    *type = match;
    return true;
  }
  if (upper != base && ParseEntityType(upper, type)) return true;

  return false;
}

EntityType TypeNormalizer::Normalize(const string &raw_label,
                                     Source vocabulary) const {
  EntityType type;
  if (Lookup(raw_label, vocabulary, &type)) return type;
  LOG(WARNING) << "Unknown " << SourceName(vocabulary) << " label '"
               << raw_label << "'";
  return UNKNOWN;
}

std::vector<string> TypeNormalizer::Labels(Source vocabulary) const {
  std::vector<string> labels;
  for (const auto &entry : tables_[vocabulary]) labels.push_back(entry.first);
  std::sort(labels.begin(), labels.end());
  return labels;
}

bool TypeNormalizer::empty() const {
  for (int i = 0; i < kNumSources; ++i) {
    if (!tables_[i].empty()) return false;
  }
  return true;
}

}  // namespace pii
}  // namespace redact

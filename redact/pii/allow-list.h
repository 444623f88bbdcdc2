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

#ifndef REDACT_PII_ALLOW_LIST_H_
#define REDACT_PII_ALLOW_LIST_H_

#include <string>
#include <unordered_set>

#include "redact/base/status.h"
#include "redact/base/types.h"

namespace redact {
namespace pii {

// Terms that are never reported as PII, e.g. product and technology names
// that detectors mistake for person or organization names. Terms match either
// exactly or after case folding and whitespace removal.
class AllowList {
 public:
  // Add term to allow list.
  void Add(const string &term);

  // Add the terms of a dictionary. Each line has a main term optionally
  // followed by alias and variant suffixes:
  //   Python
  //   AI/alias[AI|Artificial Intelligence]
  //   node.js/js[node]
  // Returns the number of terms on the lines.
  int AddDictionary(const string &contents);

  // Load dictionary file.
  Status LoadDictionary(const string &filename);

  // Check if text is an allowed term.
  bool Contains(const string &text) const;

  // Number of terms.
  int size() const { return terms_.size(); }
  bool empty() const { return terms_.empty(); }

 private:
  // Normalize term for matching.
  static string Normalize(const string &term);

  // Allowed terms.
  std::unordered_set<string> terms_;

  // Normalized allowed terms.
  std::unordered_set<string> normalized_;
};

}  // namespace pii
}  // namespace redact

#endif  // REDACT_PII_ALLOW_LIST_H_

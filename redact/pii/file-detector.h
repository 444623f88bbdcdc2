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

#ifndef REDACT_PII_FILE_DETECTOR_H_
#define REDACT_PII_FILE_DETECTOR_H_

#include <string>
#include <vector>

#include "redact/base/status.h"
#include "redact/base/types.h"
#include "redact/pii/bio-decoder.h"
#include "redact/pii/candidate.h"
#include "redact/pii/detector.h"
#include "redact/pii/generation-parser.h"

namespace redact {
namespace pii {

// Parse line with tab-separated begin, end, label, and optional score.
Status ParseLabelledSpan(const string &line, LabelledToken *span);

// Parse all non-empty lines of a labelled span file.
Status ParseLabelledSpans(const string &filename, const string &contents,
                          std::vector<LabelledToken> *spans);

// Detector replaying spans that an external span detector has written to a
// file, one "begin<TAB>end<TAB>label<TAB>score" line per span.
class SpanFileDetector : public Detector {
 public:
  SpanFileDetector(Source source, const string &filename)
      : source_(source), filename_(filename) {}

  string name() const override;
  Status Load() override;
  bool ready() const override { return ready_; }
  Status Detect(const SourceText &text,
                DetectorOutputs *outputs) const override;

 private:
  Source source_;
  string filename_;
  std::vector<LabelledToken> spans_;
  bool ready_ = false;
};

// Detector replaying the labelled tokens of a token classifier from a file.
// The token labels are decoded into entities.
class TokenFileDetector : public Detector {
 public:
  TokenFileDetector(const TypeNormalizer *normalizer, Source source,
                    const string &filename, float min_score = 0.0)
      : decoder_(normalizer, source, min_score),
        source_(source), filename_(filename) {}

  string name() const override;
  Status Load() override;
  bool ready() const override { return ready_; }
  Status Detect(const SourceText &text,
                DetectorOutputs *outputs) const override;

 private:
  BioDecoder decoder_;
  Source source_;
  string filename_;
  std::vector<LabelledToken> tokens_;
  bool ready_ = false;
};

// Detector replaying the raw output of a generative tagging model from a
// file.
class GenerationFileDetector : public Detector {
 public:
  GenerationFileDetector(const GenerationParser *parser,
                         const string &filename)
      : parser_(parser), filename_(filename) {}

  string name() const override;
  Status Load() override;
  bool ready() const override { return ready_; }
  Status Detect(const SourceText &text,
                DetectorOutputs *outputs) const override;

 private:
  const GenerationParser *parser_;
  string filename_;
  string generation_;
  bool ready_ = false;
};

}  // namespace pii
}  // namespace redact

#endif  // REDACT_PII_FILE_DETECTOR_H_

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

// Reconcile the outputs of PII detectors for a text file and print the
// resulting entities, one per line:
//   begin<TAB>end<TAB>type<TAB>score<TAB>source<TAB>text

#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "redact/base/flags.h"
#include "redact/base/init.h"
#include "redact/base/logging.h"
#include "redact/base/status.h"
#include "redact/base/types.h"
#include "redact/pii/config.h"
#include "redact/pii/detector.h"
#include "redact/pii/discard.h"
#include "redact/pii/file-detector.h"
#include "redact/pii/generation-parser.h"
#include "redact/pii/reconciler.h"
#include "redact/stream/file-input.h"

redact::pii::ReconcilerOptions options;

DEFINE_string(text, "", "Text file with document text");
DEFINE_string(pattern, "", "Span file from pattern detector");
DEFINE_string(ner, "", "Output file from NER tagger");
DEFINE_string(transformer, "", "Output file from transformer classifier");
DEFINE_string(generation, "", "Output file from generative tagging model");
DEFINE_bool(bio, true, "NER and transformer files contain labelled tokens");

DEFINE_bool(strict, options.strict,
            "Only output entities found by two detectors");
DEFINE_double(agreement_threshold, options.agreement_threshold,
              "Minimum overlap for agreement relative to the shorter span");
DEFINE_double(length_tolerance, options.length_tolerance,
              "Relative length tolerance for anchored windows");
DEFINE_double(noise_ratio, options.noise_ratio,
              "Minimum fraction of content characters in entities");
DEFINE_double(base_score, options.base_score,
              "Score for entities recovered from generative output");
DEFINE_double(min_token_score, options.min_token_score,
              "Minimum mean token score for decoded entities");
DEFINE_int32(anchor_length, options.anchor_length,
             "Maximum length of generation context anchors");
DEFINE_int32(search_window, options.search_window,
             "Search window for generation context anchors");
DEFINE_string(priority, "",
              "Comma-separated containment priority, highest first");
DEFINE_string(entities, "",
              "Comma-separated entity types to detect, default all");
DEFINE_string(dual_types, "",
              "Comma-separated entity types that need agreement in strict "
              "mode, default all");
DEFINE_string(labels, "",
              "Comma-separated label tables as SOURCE=filename");
DEFINE_bool(default_labels, options.default_labels,
            "Use built-in label tables");
DEFINE_string(dictionary, "", "Comma-separated allow list dictionaries");
DEFINE_string(allow, "", "Comma-separated allowed terms");
DEFINE_bool(log_discards, false, "Output discarded candidates to stderr");
DEFINE_bool(summary, false, "Output discard counts to stderr");

using namespace redact;
using namespace redact::pii;

// Split comma-separated list.
static std::vector<string> SplitList(const string &list) {
  std::vector<string> items;
  size_t pos = 0;
  while (pos < list.size()) {
    size_t comma = list.find(',', pos);
    if (comma == string::npos) comma = list.size();
    if (comma > pos) items.push_back(list.substr(pos, comma - pos));
    pos = comma + 1;
  }
  return items;
}

// Escape line breaks and tabs in entity text.
static string Escape(const string &str) {
  string escaped;
  for (char c : str) {
    switch (c) {
      case '\n': escaped.append("\\n"); break;
      case '\r': escaped.append("\\r"); break;
      case '\t': escaped.append("\\t"); break;
      default: escaped.push_back(c);
    }
  }
  return escaped;
}

// Parse comma-separated list of entity type names.
static Status ParseTypes(const char *flag, const string &list,
                         std::set<EntityType> *types) {
  types->clear();
  for (const string &name : SplitList(list)) {
    EntityType type;
    if (!ParseEntityType(name, &type)) {
      return Status(E_INVALID_CONFIG,
                    string("unknown entity type in ") + flag, name);
    }
    types->insert(type);
  }
  return Status::OK;
}

// Set reconciler options from command line flags.
static Status GetOptions(ReconcilerOptions *options) {
  options->strict = FLAGS_strict;
  options->agreement_threshold = FLAGS_agreement_threshold;
  options->length_tolerance = FLAGS_length_tolerance;
  options->noise_ratio = FLAGS_noise_ratio;
  options->base_score = FLAGS_base_score;
  options->min_token_score = FLAGS_min_token_score;
  options->anchor_length = FLAGS_anchor_length;
  options->search_window = FLAGS_search_window;
  options->default_labels = FLAGS_default_labels;

  if (!FLAGS_priority.empty()) {
    options->priority.clear();
    for (const string &name : SplitList(FLAGS_priority)) {
      EntityType type;
      if (!ParseEntityType(name, &type)) {
        return Status(E_INVALID_CONFIG, "unknown entity type in priority",
                      name);
      }
      options->priority.push_back(type);
    }
  }

  Status st;
  if (!FLAGS_entities.empty()) {
    st = ParseTypes("entities", FLAGS_entities, &options->entities_to_mask);
    if (!st.ok()) return st;
  }
  if (!FLAGS_dual_types.empty()) {
    st = ParseTypes("dual_types", FLAGS_dual_types,
                    &options->dual_detection_types);
    if (!st.ok()) return st;
  }

  for (const string &item : SplitList(FLAGS_labels)) {
    size_t eq = item.find('=');
    LabelFile file;
    if (eq == string::npos || !ParseSource(item.substr(0, eq),
                                           &file.vocabulary)) {
      return Status(E_INVALID_CONFIG, "invalid label table", item);
    }
    file.filename = item.substr(eq + 1);
    options->label_files.push_back(file);
  }

  options->dictionaries = SplitList(FLAGS_dictionary);
  options->allowed_terms = SplitList(FLAGS_allow);
  return Status::OK;
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv,
              "Reconcile PII detector outputs for a text.\n\n"
              "Usage: reconcile --text=FILE [--pattern=FILE] [--ner=FILE] "
              "[--transformer=FILE] [--generation=FILE]");

  if (FLAGS_text.empty()) {
    std::cerr << "No text file, use --text\n";
    return 1;
  }

  // Read text.
  string contents;
  Status st = FileInput::ReadContents(FLAGS_text, &contents);
  if (!st.ok()) {
    LOG(ERROR) << "Cannot read text: " << st;
    return 1;
  }
  SourceText text(contents);

  // Initialize configuration.
  ReconcilerConfig config;
  st = GetOptions(&options);
  if (st.ok()) st = config.Init(options);
  if (!st.ok()) {
    LOG(ERROR) << "Invalid configuration: " << st;
    return 1;
  }
  GenerationParser parser(config.normalizer().Labels(GENERATIVE),
                          config.anchor_length());

  // Set up detectors.
  std::vector<Detector *> detectors;
  if (!FLAGS_pattern.empty()) {
    detectors.push_back(new SpanFileDetector(PATTERN, FLAGS_pattern));
  }
  if (!FLAGS_ner.empty()) {
    if (FLAGS_bio) {
      detectors.push_back(new TokenFileDetector(
          &config.normalizer(), NER, FLAGS_ner, config.min_token_score()));
    } else {
      detectors.push_back(new SpanFileDetector(NER, FLAGS_ner));
    }
  }
  if (!FLAGS_transformer.empty()) {
    if (FLAGS_bio) {
      detectors.push_back(new TokenFileDetector(
          &config.normalizer(), TRANSFORMER, FLAGS_transformer,
          config.min_token_score()));
    } else {
      detectors.push_back(new SpanFileDetector(TRANSFORMER,
                                               FLAGS_transformer));
    }
  }
  if (!FLAGS_generation.empty()) {
    detectors.push_back(new GenerationFileDetector(&parser,
                                                   FLAGS_generation));
  }

  // Load detectors.
  std::vector<const Detector *> loaded;
  for (Detector *detector : detectors) {
    st = detector->Load();
    if (!st.ok()) {
      LOG(ERROR) << "Cannot load detector " << detector->name() << ": " << st;
      break;
    }
    loaded.push_back(detector);
  }

  if (st.ok()) {
    // Run detectors and reconcile their outputs.
    DetectorOutputs outputs;
    int failures = RunDetectors(loaded, text, &outputs);
    DiscardCollector discards;
    Reconciler reconciler(&config, &discards);
    Candidates entities;
    reconciler.Reconcile(text, outputs, &entities);

    for (const Candidate &entity : entities) {
      std::cout << entity.begin << "\t" << entity.end << "\t"
                << EntityTypeName(entity.type) << "\t"
                << entity.score << "\t"
                << SourceName(entity.source) << "\t"
                << Escape(text.Text(entity)) << "\n";
    }

    if (FLAGS_log_discards) {
      for (const DiscardEvent &event : discards.events()) {
        std::cerr << Escape(event.ToString()) << "\n";
      }
    }
    if (FLAGS_summary) {
      std::cerr << entities.size() << " entities, "
                << discards.events().size() << " discarded, "
                << failures << " detectors failed\n";
      for (int r = NO_MATCH; r <= ALLOWED_TERM; ++r) {
        DiscardReason reason = static_cast<DiscardReason>(r);
        int count = discards.count(reason);
        if (count > 0) {
          std::cerr << "  " << DiscardReasonName(reason) << ": "
                    << count << "\n";
        }
      }
    }
  }

  for (Detector *detector : detectors) delete detector;
  return st.ok() ? 0 : 1;
}

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

#include <stdlib.h>
#include <unistd.h>
#include <iostream>
#include <string>

#include "redact/base/init.h"
#include "redact/base/logging.h"
#include "redact/base/status.h"
#include "redact/file/file.h"
#include "redact/pii/config.h"

using namespace redact;
using namespace redact::pii;

static string TempFile(const string &name) {
  const char *tmpdir = getenv("TMPDIR");
  if (tmpdir == nullptr) tmpdir = "/tmp";
  return string(tmpdir) + "/config-test-" +
         std::to_string(getpid()) + "-" + name;
}

// Initialize configuration and return the status code.
static int InitCode(const ReconcilerOptions &options) {
  ReconcilerConfig config;
  return config.Init(options).code();
}

static void TestDefaults() {
  ReconcilerConfig config;
  CHECK(config.Init(ReconcilerOptions()));
  CHECK(!config.strict());
  CHECK_EQ(config.agreement_threshold(), 0.5f);
  CHECK_EQ(config.length_tolerance(), 0.3f);
  CHECK_EQ(config.anchor_length(), 8);
  CHECK_EQ(config.search_window(), 700);
  CHECK_EQ(config.max_span(LOCATION), 200);
  CHECK_EQ(config.max_span(PERSON), 40);
  CHECK_EQ(config.max_span(ZIP_CODE), 20);
  CHECK_EQ(config.max_span(AGE), 120);
  CHECK(config.allow_list().empty());
  CHECK(!config.normalizer().empty());

  // Default priority.
  CHECK_EQ(config.rank(EMAIL), 0);
  CHECK_EQ(config.rank(PHONE), 1);
  CHECK_LT(config.rank(PHONE), config.rank(PERSON));
  CHECK_LT(config.rank(LOCATION), config.rank(PERSON));
  CHECK_LT(config.rank(ORGANIZATION), config.rank(PERSON));
  CHECK_EQ(config.priority().size(), kNumEntityTypes);

  // All types are detected and need agreement in strict mode.
  for (EntityType type : AllEntityTypes()) {
    CHECK(config.masked(type));
    CHECK(config.dual_detection(type));
  }
}

static void TestEntitySelection() {
  ReconcilerOptions options;
  options.entities_to_mask.clear();
  CHECK_EQ(InitCode(options), E_INVALID_CONFIG);

  options.entities_to_mask = {PERSON, EMAIL};
  options.dual_detection_types = {PERSON};
  ReconcilerConfig config;
  CHECK(config.Init(options));
  CHECK(config.masked(PERSON));
  CHECK(config.masked(EMAIL));
  CHECK(!config.masked(PHONE));
  CHECK(config.dual_detection(PERSON));
  CHECK(!config.dual_detection(EMAIL));

  // No type needs agreement.
  options.dual_detection_types.clear();
  CHECK(config.Init(options));
  CHECK(!config.dual_detection(PERSON));
}

static void TestReinit() {
  // Initializing again replaces the previous configuration.
  string filename = TempFile("relabel");
  CHECK(File::WriteContents(filename, "MISC\tORGANIZATION\n"));
  ReconcilerOptions options;
  options.label_files.push_back({TRANSFORMER, filename});
  options.allowed_terms.push_back("Go");
  options.entities_to_mask = {PERSON};
  ReconcilerConfig config;
  CHECK(config.Init(options));
  CHECK(config.Init(options));
  CHECK_EQ(config.allow_list().size(), 1);
  EntityType type;
  CHECK(config.normalizer().Lookup("MISC", TRANSFORMER, &type));
  CHECK(File::Delete(filename));

  CHECK(config.Init(ReconcilerOptions()));
  CHECK(config.allow_list().empty());
  CHECK(!config.normalizer().Lookup("MISC", TRANSFORMER, &type));
  CHECK(config.masked(EMAIL));
}

static void TestInvalidOptions() {
  ReconcilerOptions options;
  options.agreement_threshold = 0.0;
  CHECK_EQ(InitCode(options), E_INVALID_CONFIG);
  options.agreement_threshold = 1.5;
  CHECK_EQ(InitCode(options), E_INVALID_CONFIG);
  options.agreement_threshold = 1.0;
  CHECK_EQ(InitCode(options), 0);

  options = ReconcilerOptions();
  options.length_tolerance = -0.1;
  CHECK_EQ(InitCode(options), E_INVALID_CONFIG);

  options = ReconcilerOptions();
  options.noise_ratio = 2.0;
  CHECK_EQ(InitCode(options), E_INVALID_CONFIG);

  options = ReconcilerOptions();
  options.anchor_length = 0;
  CHECK_EQ(InitCode(options), E_INVALID_CONFIG);

  options = ReconcilerOptions();
  options.search_window = -5;
  CHECK_EQ(InitCode(options), E_INVALID_CONFIG);

  options = ReconcilerOptions();
  options.max_span[PERSON] = 0;
  CHECK_EQ(InitCode(options), E_INVALID_CONFIG);
}

static void TestPriority() {
  ReconcilerOptions options;
  options.priority.clear();
  CHECK_EQ(InitCode(options), E_INVALID_CONFIG);

  options.priority = {EMAIL, PERSON, EMAIL};
  CHECK_EQ(InitCode(options), E_INVALID_CONFIG);

  options.priority = {PERSON, EMAIL};
  ReconcilerConfig config;
  CHECK(config.Init(options));
  CHECK_EQ(config.rank(PERSON), 0);
  CHECK_EQ(config.rank(EMAIL), 1);
  CHECK_EQ(config.rank(PHONE), 2);
  CHECK_EQ(config.rank(LOCATION), 2);
}

static void TestLabels() {
  // A configuration needs at least one label.
  ReconcilerOptions options;
  options.default_labels = false;
  CHECK_EQ(InitCode(options), E_INVALID_CONFIG);

  string filename = TempFile("labels");
  CHECK(File::WriteContents(filename, "MISC\tORGANIZATION\n"));
  options.label_files.push_back({TRANSFORMER, filename});
  ReconcilerConfig config;
  CHECK(config.Init(options));
  EntityType type;
  CHECK(config.normalizer().Lookup("B-MISC", TRANSFORMER, &type));
  CHECK_EQ(type, ORGANIZATION);
  CHECK(!config.normalizer().Lookup("PER", TRANSFORMER, &type));
  CHECK(File::Delete(filename));

  CHECK_EQ(InitCode(options), E_IO);
}

static void TestAllowList() {
  string filename = TempFile("dict");
  CHECK(File::WriteContents(filename, "Python\nRuby\n"));
  ReconcilerOptions options;
  options.dictionaries.push_back(filename);
  options.allowed_terms.push_back("Go");
  ReconcilerConfig config;
  CHECK(config.Init(options));
  CHECK_EQ(config.allow_list().size(), 3);
  CHECK(config.allow_list().Contains("ruby"));
  CHECK(File::Delete(filename));

  CHECK_EQ(InitCode(options), E_IO);
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestDefaults();
  TestInvalidOptions();
  TestPriority();
  TestLabels();
  TestAllowList();
  TestEntitySelection();
  TestReinit();

  std::cout << "PASS\n";
  return 0;
}

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

#include "redact/pii/entity-type.h"

namespace redact {
namespace pii {

static const char *kEntityTypeNames[kNumEntityTypes] = {
  "PERSON",
  "LOCATION",
  "ORGANIZATION",
  "PHONE",
  "EMAIL",
  "ZIP_CODE",
  "DATE_OF_BIRTH",
  "AGE",
  "GENDER",
  "CUSTOMER_ID",
  "UNKNOWN",
};

const char *EntityTypeName(EntityType type) {
  if (type < 0 || type >= kNumEntityTypes) return "UNKNOWN";
  return kEntityTypeNames[type];
}

bool ParseEntityType(const string &name, EntityType *type) {
  for (int i = 0; i < kNumEntityTypes; ++i) {
    if (name == kEntityTypeNames[i]) {
      *type = static_cast<EntityType>(i);
      return true;
    }
  }
  return false;
}

std::vector<EntityType> AllEntityTypes() {
  std::vector<EntityType> types;
  for (int i = 0; i < kNumEntityTypes; ++i) {
    types.push_back(static_cast<EntityType>(i));
  }
  return types;
}

std::vector<EntityType> DefaultTypePriority() {
  // Structured pattern types outrank generic name and place types.
  return {
    EMAIL, PHONE, ZIP_CODE, CUSTOMER_ID, DATE_OF_BIRTH,
    LOCATION, ORGANIZATION, PERSON, AGE, GENDER, UNKNOWN,
  };
}

}  // namespace pii
}  // namespace redact

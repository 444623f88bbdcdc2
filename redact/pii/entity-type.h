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

#ifndef REDACT_PII_ENTITY_TYPE_H_
#define REDACT_PII_ENTITY_TYPE_H_

#include <string>
#include <vector>

#include "redact/base/types.h"

namespace redact {
namespace pii {

// Canonical entity types. Every detector label maps to exactly one of these.
enum EntityType {
  PERSON,
  LOCATION,
  ORGANIZATION,
  PHONE,
  EMAIL,
  ZIP_CODE,
  DATE_OF_BIRTH,
  AGE,
  GENDER,
  CUSTOMER_ID,
  UNKNOWN,
};

// Number of canonical entity types.
const int kNumEntityTypes = UNKNOWN + 1;

// Return the name of an entity type, e.g. "PERSON".
const char *EntityTypeName(EntityType type);

// Parse entity type name. Returns false if the name is not a canonical type.
bool ParseEntityType(const string &name, EntityType *type);

// Return all canonical entity types.
std::vector<EntityType> AllEntityTypes();

// Default containment priority order, highest priority first.
std::vector<EntityType> DefaultTypePriority();

}  // namespace pii
}  // namespace redact

#endif  // REDACT_PII_ENTITY_TYPE_H_

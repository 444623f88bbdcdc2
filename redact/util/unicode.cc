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

#include "redact/util/unicode.h"

#include <unicode/uchar.h>
#include <string>

#include "redact/base/logging.h"
#include "redact/base/types.h"

namespace redact {

// UTF8 character length based on lead byte.
const uint8 utf8_skip_tab[256] = {
  1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,
  1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,
  1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,
  1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,
  1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,
  1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,
  2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,
  3,3,3,3,3,3,3,3,3,3,3,3,3,3,3,3,4,4,4,4,4,4,4,4,4,4,4,4,4,4,4,4,
};

// Largest valid Unicode code point.
static const int kMaxCodePoint = 0x10FFFF;

int Unicode::Category(int c) {
  if (c < 0 || c > kMaxCodePoint) return CHARCAT_UNASSIGNED;

  // The ICU general categories follow the same numbering up to the format
  // characters. The remaining categories are shifted by one since there is
  // no separate cased letter category in ICU.
  int type = u_charType(c);
  switch (type) {
    case U_PRIVATE_USE_CHAR: return CHARCAT_PRIVATE_USE;
    case U_SURROGATE: return CHARCAT_SURROGATE;
    case U_DASH_PUNCTUATION: return CHARCAT_DASH_PUNCTUATION;
    case U_START_PUNCTUATION: return CHARCAT_START_PUNCTUATION;
    case U_END_PUNCTUATION: return CHARCAT_END_PUNCTUATION;
    case U_CONNECTOR_PUNCTUATION: return CHARCAT_CONNECTOR_PUNCTUATION;
    case U_OTHER_PUNCTUATION: return CHARCAT_OTHER_PUNCTUATION;
    case U_MATH_SYMBOL: return CHARCAT_MATH_SYMBOL;
    case U_CURRENCY_SYMBOL: return CHARCAT_CURRENCY_SYMBOL;
    case U_MODIFIER_SYMBOL: return CHARCAT_MODIFIER_SYMBOL;
    case U_OTHER_SYMBOL: return CHARCAT_OTHER_SYMBOL;
    case U_INITIAL_PUNCTUATION: return CHARCAT_INITIAL_QUOTE_PUNCTUATION;
    case U_FINAL_PUNCTUATION: return CHARCAT_FINAL_QUOTE_PUNCTUATION;
    default:
      if (type > U_FORMAT_CHAR) return CHARCAT_UNASSIGNED;
      return type;
  }
}

bool Unicode::Is(int c, int mask) {
  return ((1 << Category(c)) & mask) != 0;
}

bool Unicode::IsWord(int c) {
  return Is(c, CATMASK_WORD);
}

bool Unicode::IsSpace(int c)  {
  return Is(c, CATMASK_SPACE);
}

bool Unicode::IsWhitespace(int c) {
  if (c < 0 || c > kMaxCodePoint) return false;
  return u_isUWhiteSpace(c);
}

bool Unicode::IsPunctuation(int c) {
  return Is(c, CATMASK_PUNCTUATION);
}

int Unicode::ToLower(int c) {
  if (c < 0 || c > kMaxCodePoint) return c;
  return u_tolower(c);
}

int Unicode::FoldWidth(int c) {
  if (c >= 0xFF01 && c <= 0xFF5E) return c - 0xFEE0;
  if (c == 0x3000) return ' ';
  return c;
}

int Unicode::Normalize(int c, int flags) {
  if (flags & NORMALIZE_WIDTH) {
    c = FoldWidth(c);
  }
  if (flags & NORMALIZE_CASE) {
    c = ToLower(c);
  }
  if (flags & NORMALIZE_PUNCTUATION) {
    if (IsPunctuation(c)) c = 0;
  }
  if (flags & NORMALIZE_WHITESPACE) {
    if (IsWhitespace(c)) c = 0;
  }
  return c;
}

int UTF8::Decode(const char *s, int len) {
  // No more data.
  if (len <= 0) return -1;

  // One character sequence (7-bit value).
  int c0 = *reinterpret_cast<const uint8 *>(s);
  if (c0 < 0x80) return c0;
  if (len <= 1) return -1;

  // Two character sequence (11-bit value).
  int c1 = *reinterpret_cast<const uint8 *>(s + 1) ^ 0x80;
  if (c1 & 0xc0) return -1;
  if (c0 < 0xe0) {
    if (c0 < 0xc0) return -1;
    int code = ((c0 << 6) | c1) & 0x07ff;
    if (code <= 0x7f) return -1;
    return code;
  }
  if (len <= 2) return -1;

  // Three character sequence (16-bit value).
  int c2 = *reinterpret_cast<const uint8 *>(s + 2) ^ 0x80;
  if (c2 & 0xc0) return -1;
  if (c0 < 0xf0) {
    int code = ((((c0 << 6) | c1) << 6) | c2) & 0xffff;
    if (code <= 0x07ff) return -1;
    if (code >= 0xd800 && code <= 0xdfff) return -1;
    return code;
  }
  if (len <= 3) return -1;

  // Four character sequence (21-bit value).
  int c3 = *reinterpret_cast<const uint8 *>(s + 3) ^ 0x80;
  if (c3 & 0xc0) return -1;
  if (c0 < 0xf8) {
    int code = ((((((c0 << 6) | c1) << 6) | c2) << 6) | c3) & 0x001fffff;
    if (code <= 0xffff || code > kMaxCodePoint) return -1;
    return code;
  }

  return -1;
}

void UTF8::DecodeString(const char *s, int len, ustring *result) {
  // Clear output string.
  result->clear();
  result->reserve(len);

  // Try fast conversion where all characters are below 128. All characters
  // below 128 are converted to one byte codes.
  const char *end = s + len;
  while (s < end) {
    uint8 c = *reinterpret_cast<const uint8 *>(s);
    if (c & 0x80) break;
    result->push_back(c);
    s++;
  }

  // Handle any remaining part of the string which can contain multi-byte
  // characters.
  while (s < end) {
    int code = Decode(s, end - s);
    if (code < 0) {
      result->push_back(kReplacementCharacter);
      s++;
    } else {
      result->push_back(code);
      s += CharLen(s);
    }
  }
}

int UTF8::Encode(int code, string *str) {
  uint32 c = code;

  // One character sequence.
  if (c <= 0x7f) {
    str->push_back(c);
    return 1;
  }

  // Two character sequence.
  if (c <= 0x7ff) {
    str->push_back(0xc0 | (c >> 6));
    str->push_back(0x80 | (c & 0x3f));
    return 2;
  }

  // Three character sequence.
  if (c <= 0xffff) {
    str->push_back(0xe0 | (c >> 12));
    str->push_back(0x80 | ((c >> 6) & 0x3f));
    str->push_back(0x80 | (c & 0x3f));
    return 3;
  }

  // Four character sequence.
  str->push_back(0xf0 | (c >> 18));
  str->push_back(0x80 | ((c >> 12) & 0x3f));
  str->push_back(0x80 | ((c >> 6) & 0x3f));
  str->push_back(0x80 | (c & 0x3f));
  return 4;
}

void UTF8::EncodeString(const ustring &codes, int begin, int end,
                        string *str) {
  DCHECK_LE(0, begin);
  DCHECK_LE(end, codes.size());
  for (int i = begin; i < end; ++i) Encode(codes[i], str);
}

void UTF8::Normalize(const char *s, int len, int flags, string *normalized) {
  // Clear output string.
  normalized->clear();
  normalized->reserve(len);

  const char *end = s + len;
  while (s < end) {
    int code = Decode(s, end - s);
    if (code < 0) {
      code = kReplacementCharacter;
      s++;
    } else {
      s += CharLen(s);
    }
    int ch = Unicode::Normalize(code, flags);
    if (ch > 0) Encode(ch, normalized);
  }
}

}  // namespace redact

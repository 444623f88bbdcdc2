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

#ifndef REDACT_UTIL_UNICODE_H_
#define REDACT_UTIL_UNICODE_H_

#include <string.h>
#include <string>
#include <vector>

#include "redact/base/types.h"

namespace redact {

extern const uint8 utf8_skip_tab[];

// Replacement character used for malformed UTF-8 input.
const int kReplacementCharacter = 0xFFFD;

// Unicode character categories.
enum UnicodeCategory {
  CHARCAT_UNASSIGNED                = 0,   // Cn
  CHARCAT_UPPERCASE_LETTER          = 1,   // Lu
  CHARCAT_LOWERCASE_LETTER          = 2,   // Ll
  CHARCAT_TITLECASE_LETTER          = 3,   // Lt
  CHARCAT_MODIFIER_LETTER           = 4,   // Lm
  CHARCAT_OTHER_LETTER              = 5,   // Lo
  CHARCAT_NON_SPACING_MARK          = 6,   // Mn
  CHARCAT_ENCLOSING_MARK            = 7,   // Me
  CHARCAT_COMBINING_SPACING_MARK    = 8,   // Mc
  CHARCAT_DECIMAL_DIGIT_NUMBER      = 9,   // Nd
  CHARCAT_LETTER_NUMBER             = 10,  // Nl
  CHARCAT_OTHER_NUMBER              = 11,  // No
  CHARCAT_SPACE_SEPARATOR           = 12,  // Zs
  CHARCAT_LINE_SEPARATOR            = 13,  // Zl
  CHARCAT_PARAGRAPH_SEPARATOR       = 14,  // Zp
  CHARCAT_CONTROL                   = 15,  // Cc
  CHARCAT_FORMAT                    = 16,  // Cf
  CHARCAT_PRIVATE_USE               = 18,  // Co
  CHARCAT_SURROGATE                 = 19,  // Cs
  CHARCAT_DASH_PUNCTUATION          = 20,  // Pd
  CHARCAT_START_PUNCTUATION         = 21,  // Ps
  CHARCAT_END_PUNCTUATION           = 22,  // Pe
  CHARCAT_CONNECTOR_PUNCTUATION     = 23,  // Pc
  CHARCAT_OTHER_PUNCTUATION         = 24,  // Po
  CHARCAT_MATH_SYMBOL               = 25,  // Sm
  CHARCAT_CURRENCY_SYMBOL           = 26,  // Sc
  CHARCAT_MODIFIER_SYMBOL           = 27,  // Sk
  CHARCAT_OTHER_SYMBOL              = 28,  // So
  CHARCAT_INITIAL_QUOTE_PUNCTUATION = 29,  // Pi
  CHARCAT_FINAL_QUOTE_PUNCTUATION   = 30,  // Pf
};

// Unicode category masks.
enum UnicodeCategoryMask {
  // Letters, including ideographs and kana (Lo).
  CATMASK_LETTER =
      (1 << CHARCAT_UPPERCASE_LETTER) |
      (1 << CHARCAT_LOWERCASE_LETTER) |
      (1 << CHARCAT_TITLECASE_LETTER) |
      (1 << CHARCAT_MODIFIER_LETTER) |
      (1 << CHARCAT_OTHER_LETTER),

  // All numbers, e.g. circled and roman numerals.
  CATMASK_NUMBER =
      (1 << CHARCAT_DECIMAL_DIGIT_NUMBER) |
      (1 << CHARCAT_LETTER_NUMBER) |
      (1 << CHARCAT_OTHER_NUMBER),

  // Space separators.
  CATMASK_SPACE =
      (1 << CHARCAT_SPACE_SEPARATOR) |
      (1 << CHARCAT_LINE_SEPARATOR) |
      (1 << CHARCAT_PARAGRAPH_SEPARATOR),

  // Punctuation and symbols.
  CATMASK_PUNCTUATION =
      (1 << CHARCAT_DASH_PUNCTUATION) |
      (1 << CHARCAT_START_PUNCTUATION) |
      (1 << CHARCAT_END_PUNCTUATION) |
      (1 << CHARCAT_CONNECTOR_PUNCTUATION) |
      (1 << CHARCAT_OTHER_PUNCTUATION) |
      (1 << CHARCAT_INITIAL_QUOTE_PUNCTUATION) |
      (1 << CHARCAT_FINAL_QUOTE_PUNCTUATION) |
      (1 << CHARCAT_MATH_SYMBOL) |
      (1 << CHARCAT_CURRENCY_SYMBOL) |
      (1 << CHARCAT_MODIFIER_SYMBOL) |
      (1 << CHARCAT_OTHER_SYMBOL),

  // Word characters, i.e. letters and numbers.
  CATMASK_WORD = CATMASK_LETTER | CATMASK_NUMBER,
};

// String normalization flags.
enum Normalization {
  NORMALIZE_NONE        = 0x00,  // no normalization
  NORMALIZE_CASE        = 0x01,  // lowercase
  NORMALIZE_PUNCTUATION = 0x08,  // remove punctuation
  NORMALIZE_WHITESPACE  = 0x10,  // remove whitespace
  NORMALIZE_WIDTH       = 0x40,  // fold full-width forms to ASCII

  // Normalization used for matching rewritten text against the original.
  NORMALIZE_MATCH = NORMALIZE_CASE | NORMALIZE_PUNCTUATION |
                    NORMALIZE_WHITESPACE | NORMALIZE_WIDTH,
};

// Unicode string. This is used instead of wstring where the size of wchar_t is
// platform dependent.
typedef std::vector<int> ustring;

// Unicode code point categorization and conversion. Character properties come
// from the ICU character database.
class Unicode {
 public:
  // Return Unicode category for code point.
  static int Category(int c);

  // Check if code point belongs to character mask.
  static bool Is(int c, int mask);

  // Check if code point is a word character, i.e. letter or number.
  static bool IsWord(int c);

  // Check if code point is a space.
  static bool IsSpace(int c);

  // Check if code point is whitespace, including control characters like
  // tab and newline.
  static bool IsWhitespace(int c);

  // Check if code point is punctuation or symbol.
  static bool IsPunctuation(int c);

  // Convert code point to lower case.
  static int ToLower(int c);

  // Fold full-width ASCII variants and the ideographic space to their ASCII
  // counterparts. Other code points are returned unchanged.
  static int FoldWidth(int c);

  // Normalize code point based on normalization flags. Return zero for code
  // points that should be removed.
  static int Normalize(int c, int flags);
};

// UTF-8 string categorization and conversion.
class UTF8 {
 public:
  // Return the length of the next UTF8 character.
  static int CharLen(const char *s) {
    return utf8_skip_tab[*reinterpret_cast<const uint8 *>(s)];
  }

  // Return next UTF8 code point in string. Returns -1 on errors.
  static int Decode(const char *s, int len);

  // Decode UTF8 string to sequence of Unicode code points. Malformed bytes
  // are decoded one byte at a time as the replacement character, so every
  // input byte belongs to exactly one code point.
  static void DecodeString(const char *s, int len, ustring *result);
  static void DecodeString(const string &str, ustring *result) {
    return DecodeString(str.data(), str.size(), result);
  }

  // Encode one Unicode point and append it to string.
  static int Encode(int code, string *str);

  // Encode the code points in [begin;end[ and append them to string.
  static void EncodeString(const ustring &codes, int begin, int end,
                           string *str);

  // Normalize UTF8 encoded string for matching.
  static void Normalize(const char *s, int len, int flags, string *normalized);
  static void Normalize(const string &str, int flags, string *normalized) {
    Normalize(str.data(), str.size(), flags, normalized);
  }
};

}  // namespace redact

#endif  // REDACT_UTIL_UNICODE_H_

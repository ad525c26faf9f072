#pragma once
/*
 * LookupError
 *
 * Purpose: failure kinds of non-interactive lookups (codec, prefix resolution).
 * Convention: lookup functions return bool and fill a LookupError on failure;
 *             message holds the text shown to the user.
 */
#include <string>

enum class LookupErrorKind {
  None,
  WordNotFound,
  AmbiguousPrefix,
  InvalidBinaryLength,
  InvalidBinary,
  IndexOutOfRange
};

struct LookupError {
  LookupErrorKind kind = LookupErrorKind::None;
  std::string message;

  explicit operator bool() const { return kind != LookupErrorKind::None; }
};

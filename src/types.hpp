#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight enums/structs (InputMode/Direction/SessionEvent).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <string_view>

enum class InputMode { Word, Binary };
enum class Direction { Left, Right };

struct SessionEvent {
  enum class Kind { AppendChar, Backspace, CursorLeft, CursorRight, ReviewUp, ReviewDown, Confirm, Terminate };
  Kind kind = Kind::Confirm;
  char ch = 0; // valid for AppendChar

  static SessionEvent append(char c) { return {Kind::AppendChar, c}; }
  static SessionEvent of(Kind k) { return {k, 0}; }
};

inline std::string_view mode_name(InputMode m) {
  return m == InputMode::Binary ? "binary" : "word";
}

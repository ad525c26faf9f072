#pragma once
/*
 * Terminal
 *
 * Purpose: RAII owner of the ncurses screen for the interactive session.
 * Setup: raw keys with keypad decoding, no echo, hidden cursor, short Esc
 *        delay, and the color pairs in kColorPairs when colors are on.
 * Usage: construct in main before App; destructor restores the terminal.
 */
#include <array>
#include <ncurses.h>
#include "iterminal.hpp"

struct ColorPairSpec {
  short id;
  short fg; // -1: terminal default
};

// Esc ends the session; ncurses waits this long to tell a bare Esc from an
// escape sequence.
constexpr int kEscDelayMs = 25;

extern const std::array<ColorPairSpec, 6> kColorPairs;

class Terminal {
public:
  explicit Terminal(bool enable_color);
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;

  // false when disabled by settings or unsupported by the terminal
  bool color() const { return color_; }

private:
  void init_colors();
  bool color_ = false;
};

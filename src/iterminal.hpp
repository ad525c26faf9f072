#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, refresh).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 */
#include <string>

struct TermSize { int rows; int cols; };

// color pair ids shared by the backends
enum ColorPairId : int {
  kPairAccent = 1,
  kPairDefault = 2,
  kPairPaper = 3,
  kPairDecoded = 4,
  kPairNotice = 5,
  kPairMuted = 6
};

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) = 0;
  virtual void draw_colored(int row, int col, const std::string& text, int color_pair_id) = 0;
  virtual void refresh() = 0;
};

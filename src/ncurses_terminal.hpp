#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing.
 * Note: screen setup and color pairs belong to Terminal, which must outlive
 *       this object; text is clipped at the right edge instead of wrapping.
 */
#include "iterminal.hpp"
#include "terminal.hpp"
#include <ncurses.h>

class NcursesTerminal : public ITerminal {
public:
  explicit NcursesTerminal(const Terminal& screen) : color_(screen.color()) {}
  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void refresh() override;
private:
  bool in_bounds(int row, int col) const;
  bool color_ = false;
};

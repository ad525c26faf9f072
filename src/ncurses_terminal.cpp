#include "ncurses_terminal.hpp"
#include <algorithm>

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

bool NcursesTerminal::in_bounds(int row, int col) const {
  TermSize sz = getSize();
  return row >= 0 && row < sz.rows && col >= 0 && col < sz.cols;
}

// characters that fit before the right edge; ncurses would wrap the rest
static int fit(int col, const std::string& text) {
  int r, c; getmaxyx(stdscr, r, c); (void)r;
  return std::max(0, std::min((int)text.size(), c - col));
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  if (!in_bounds(row, col)) return;
  if (color_) attron(COLOR_PAIR(kPairDefault));
  mvaddnstr(row, col, text.c_str(), fit(col, text));
  if (color_) attroff(COLOR_PAIR(kPairDefault));
}

void NcursesTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  if (!in_bounds(row, col)) return;
  int len = (int)text.size();
  if (hl_start < 0) hl_start = 0;
  if (hl_len < 0) hl_len = 0;
  int hl_end = std::min(len, hl_start + hl_len);
  hl_start = std::min(hl_start, len);
  if (hl_start > 0) {
    std::string left = text.substr(0, hl_start);
    mvaddnstr(row, col, left.c_str(), fit(col, left));
    col += (int)left.size();
  }
  if (hl_end > hl_start) {
    std::string mid = text.substr(hl_start, hl_end - hl_start);
    attron(A_REVERSE | A_BOLD);
    if (col < getSize().cols) mvaddnstr(row, col, mid.c_str(), fit(col, mid));
    attroff(A_REVERSE | A_BOLD);
    col += (int)mid.size();
  }
  if (hl_end < len) {
    std::string right = text.substr(hl_end);
    if (col < getSize().cols) mvaddnstr(row, col, right.c_str(), fit(col, right));
  }
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  if (!in_bounds(row, col)) return;
  if (color_) attron(COLOR_PAIR(color_pair_id) | A_BOLD);
  mvaddnstr(row, col, text.c_str(), fit(col, text));
  if (color_) attroff(COLOR_PAIR(color_pair_id) | A_BOLD);
}

void NcursesTerminal::refresh() { ::refresh(); }

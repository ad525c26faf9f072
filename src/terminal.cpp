#include "terminal.hpp"
#include <locale.h>

const std::array<ColorPairSpec, 6> kColorPairs = {{
  {kPairAccent, COLOR_CYAN},
  {kPairDefault, -1},
  {kPairPaper, COLOR_RED},
  {kPairDecoded, COLOR_GREEN},
  {kPairNotice, COLOR_YELLOW},
  {kPairMuted, COLOR_WHITE},
}};

Terminal::Terminal(bool enable_color) {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  set_escdelay(kEscDelayMs);
  curs_set(0);
  color_ = enable_color && has_colors();
  if (color_) init_colors();
}

Terminal::~Terminal() {
  endwin();
}

void Terminal::init_colors() {
  start_color();
  bool defaults = use_default_colors() == OK;
  short bg = defaults ? -1 : COLOR_BLACK;
  for (const ColorPairSpec& p : kColorPairs) {
    short fg = p.fg;
    if (fg < 0 && !defaults) fg = COLOR_WHITE;
    init_pair(p.id, fg, bg);
  }
}

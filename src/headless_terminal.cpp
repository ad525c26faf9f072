#include "headless_terminal.hpp"
#include <algorithm>

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
  : rows_(std::max(0, rows)), cols_(std::max(0, cols)), screen_(rows_, std::string(cols_, ' ')) {}

void HeadlessTerminal::clear() {
  for (auto& l : screen_) l.assign(cols_, ' ');
  highlights_.clear();
  colored_.clear();
}

void HeadlessTerminal::put(int row, int col, const std::string& text) {
  if (row < 0 || row >= rows_ || col >= cols_) return;
  for (size_t i = 0; i < text.size(); ++i) {
    int c = col + (int)i;
    if (c < 0) continue;
    if (c >= cols_) break;
    screen_[row][c] = text[i];
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) { put(row, col, text); }

void HeadlessTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  put(row, col, text);
  int len = (int)text.size();
  int s = std::clamp(hl_start, 0, len);
  int e = std::clamp(hl_start + std::max(0, hl_len), s, len);
  if (e > s) highlights_.push_back({row, col + s, e - s, 0});
}

void HeadlessTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  put(row, col, text);
  colored_.push_back({row, col, (int)text.size(), color_pair_id});
}

const std::string& HeadlessTerminal::line(int row) const {
  static const std::string kOutside;
  if (row < 0 || row >= rows_) return kOutside;
  return screen_[row];
}

std::string HeadlessTerminal::text() const {
  std::string out;
  for (const auto& l : screen_) { out += l; out += '\n'; }
  return out;
}

bool HeadlessTerminal::contains(const std::string& needle) const {
  return find_row(needle) >= 0;
}

int HeadlessTerminal::find_row(const std::string& needle) const {
  for (int r = 0; r < rows_; ++r) if (screen_[r].find(needle) != std::string::npos) return r;
  return -1;
}

std::string HeadlessTerminal::highlighted_text() const {
  std::string out;
  for (const auto& h : highlights_) {
    if (h.row < 0 || h.row >= rows_ || h.col >= cols_) continue;
    if (!out.empty()) out += '|';
    out += screen_[h.row].substr(h.col, h.len);
  }
  return out;
}

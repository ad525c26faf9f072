#include "renderer.hpp"
#include <algorithm>
#include <cctype>
#include "codec.hpp"

static constexpr int kBitWeights[kIndexBits] = {512, 256, 128, 64, 32, 16, 8, 4, 2, 1};
static constexpr int kCellWidth = 5;

static std::string toUpper(std::string s){ for(char& c: s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c))); return s; }

static int centered_col(int cols, size_t len) {
  return std::max(0, (cols - static_cast<int>(len)) / 2);
}

static std::string center_cell(const std::string& s) {
  int pad = std::max(0, kCellWidth - static_cast<int>(s.size()));
  int left = pad / 2;
  return std::string(left, ' ') + s + std::string(pad - left, ' ');
}

static std::string rule(int cols, const std::string& title) {
  std::string r = "-- " + title + " ";
  if ((int)r.size() < cols) r += std::string(cols - r.size(), '-');
  return r;
}

static void paint(ITerminal& term, const RenderOptions& opt, int row, int col, const std::string& text, int pair) {
  if (opt.enable_color) term.draw_colored(row, col, text, pair);
  else term.draw_text(row, col, text);
}

std::pair<size_t, size_t> carousel_range(size_t count, size_t cursor, size_t window) {
  if (count == 0 || window == 0) return {0, 0};
  size_t start = cursor > window / 2 ? cursor - window / 2 : 0;
  size_t end = std::min(start + window, count);
  if (end == count) start = end > window ? end - window : 0;
  return {start, end};
}

std::string counter_text(const SessionSnapshot& snap) {
  std::string cap = std::to_string(HistoryStore::kCapacity);
  if (snap.paper_mode) return " < Paper Mode > ";
  if (snap.review_index) {
    return " Word #" + std::to_string(*snap.review_index + 1) + "/" + std::to_string(snap.history.size()) + " [" + cap + "] ";
  }
  return " Word #" + std::to_string(snap.history.size() + 1) + "/" + cap + " ";
}

std::string prompt_text(const SessionSnapshot& snap) {
  std::string label = (snap.mode == InputMode::Binary) ? "Bits" : "Word";
  if (snap.paper_mode) return label + "/> ";
  return label + " #" + std::to_string(snap.history.size() + 1) + "/> ";
}

GridView Renderer::grid_view(const SessionSnapshot& snap) const {
  GridView g;
  if (snap.review_index && *snap.review_index < snap.history.size()) {
    g.word = snap.history[*snap.review_index];
  } else if (snap.mode == InputMode::Binary) {
    g.bits = snap.input;
    g.word = snap.decoded;
    if (g.word) g.index = catalog_.lookup_exact(*g.word);
    return g;
  } else if (!snap.suggestions.empty() && snap.suggestion_cursor < snap.suggestions.size()) {
    g.word = snap.suggestions[snap.suggestion_cursor];
  }
  if (g.word) {
    g.index = catalog_.lookup_exact(*g.word);
    if (g.index) g.bits = index_to_bits(*g.index);
  }
  return g;
}

void Renderer::render(ITerminal& term, const SessionSnapshot& snap, const RenderOptions& opt) {
  TermSize sz = term.getSize();
  term.clear();
  render_carousel(term, snap, opt, 0);
  render_grid(term, snap, opt, 3);
  render_input(term, snap, opt, std::max(12, sz.rows - 6));
  render_footer(term, snap, opt, std::max(15, sz.rows - 2));
  if (!snap.running) render_modal(term, snap, opt);
  term.refresh();
}

void Renderer::render_carousel(ITerminal& term, const SessionSnapshot& snap, const RenderOptions& opt, int row) {
  int cols = term.getSize().cols;
  if (snap.mode == InputMode::Binary) {
    paint(term, opt, row, 0, rule(cols, "Decoded Word"), kPairAccent);
    if (snap.input.size() == Session::kMaxBits) {
      if (snap.decoded) {
        std::string s = "[ " + toUpper(*snap.decoded) + " ]";
        paint(term, opt, row + 1, centered_col(cols, s.size()), s, kPairDecoded);
      } else {
        std::string s = "Invalid Binary";
        paint(term, opt, row + 1, centered_col(cols, s.size()), s, kPairPaper);
      }
    } else {
      std::string s = "Enter 10 bits...";
      term.draw_text(row + 1, centered_col(cols, s.size()), s);
    }
    return;
  }
  paint(term, opt, row, 0, rule(cols, "Suggestions"), kPairAccent);
  if (snap.suggestions.empty()) {
    std::string s = "No matches";
    term.draw_text(row + 1, centered_col(cols, s.size()), s);
    return;
  }
  auto [start, end] = carousel_range(snap.suggestions.size(), snap.suggestion_cursor,
                                     static_cast<size_t>(std::max(1, opt.carousel_window)));
  std::string line;
  int hl_start = 0, hl_len = 0;
  for (size_t i = start; i < end; ++i) {
    if (i > start) line += "   ";
    if (i == snap.suggestion_cursor) {
      std::string sel = "[ " + snap.suggestions[i] + " ]";
      hl_start = (int)line.size();
      hl_len = (int)sel.size();
      line += sel;
    } else {
      line += snap.suggestions[i];
    }
  }
  term.draw_highlighted(row + 1, centered_col(cols, line.size()), line, hl_start, hl_len);
}

void Renderer::render_grid(ITerminal& term, const SessionSnapshot& snap, const RenderOptions& opt, int row) {
  int cols = term.getSize().cols;
  int base = snap.paper_mode ? kPairPaper : kPairAccent;
  paint(term, opt, row, 0, rule(cols, "Memory Grid"), base);
  std::string counter = counter_text(snap);
  paint(term, opt, row, std::max(0, cols - (int)counter.size() - 2), counter, base);

  std::string border = "+";
  for (int i = 0; i < kIndexBits; ++i) border += std::string(kCellWidth, '-') + "+";
  int col = centered_col(cols, border.size());

  GridView g = grid_view(snap);
  paint(term, opt, row + 1, col, border, base);
  std::string weights = "|";
  for (int w : kBitWeights) weights += center_cell(std::to_string(w)) + "|";
  paint(term, opt, row + 2, col, weights, base);
  paint(term, opt, row + 3, col, border, base);
  paint(term, opt, row + 4, col, "|", base);
  int c = col + 1;
  for (int i = 0; i < kIndexBits; ++i) {
    if (i < (int)g.bits.size()) {
      char bit = g.bits[i];
      std::string cell = center_cell(std::string(1, bit));
      if (bit == '1') paint(term, opt, row + 4, c, cell, base);
      else paint(term, opt, row + 4, c, cell, kPairMuted);
    } else {
      paint(term, opt, row + 4, c, center_cell("#"), kPairMuted);
    }
    paint(term, opt, row + 4, c + kCellWidth, "|", base);
    c += kCellWidth + 1;
  }
  paint(term, opt, row + 5, col, border, base);

  std::string info;
  if (g.word) info = "Word: " + toUpper(*g.word) + " | Index: " + std::to_string(g.index.value_or(0));
  else info = "Select a word to view details";
  term.draw_text(row + 7, centered_col(cols, info.size()), info);
}

void Renderer::render_input(ITerminal& term, const SessionSnapshot& snap, const RenderOptions& opt, int row) {
  int cols = term.getSize().cols;
  paint(term, opt, row, 0, rule(cols, "Search"), kPairAccent);
  std::string line = prompt_text(snap) + snap.input + "_";
  paint(term, opt, row + 1, 1, line, kPairAccent);
  std::string help = "Esc: Exit | Enter: Select | <-->: Suggest | ^v: History";
  paint(term, opt, row + 2, std::max(0, cols - (int)help.size() - 1), help, kPairAccent);
  if (!snap.message.empty()) term.draw_text(row + 3, 1, snap.message);
}

void Renderer::render_footer(ITerminal& term, const SessionSnapshot&, const RenderOptions& opt, int row) {
  int cols = term.getSize().cols;
  const std::string l1 = "Note: Stateless mode encodes data using the SLIP-39 format,";
  const std::string l2 = "but generated phrases are independent and cannot be combined for recovery.";
  paint(term, opt, row, centered_col(cols, l1.size()), l1, kPairNotice);
  paint(term, opt, row + 1, centered_col(cols, l2.size()), l2, kPairNotice);
}

void Renderer::render_modal(ITerminal& term, const SessionSnapshot& snap, const RenderOptions& opt) {
  TermSize sz = term.getSize();
  int width = std::min(50, std::max(20, sz.cols - 4));
  int height = 7;
  int top = std::max(0, (sz.rows - height) / 2);
  int left = std::max(0, (sz.cols - width) / 2);
  std::string title = " Select Input Mode ";
  std::string top_border = "+" + std::string(width - 2, '-') + "+";
  top_border.replace(std::min<size_t>(2, top_border.size()), std::min(title.size(), top_border.size() - 3), title.substr(0, top_border.size() - 3));
  paint(term, opt, top, left, top_border, kPairAccent);
  for (int r = 1; r < height - 1; ++r) {
    paint(term, opt, top + r, left, "|", kPairAccent);
    term.draw_text(top + r, left + 1, std::string(width - 2, ' '));
    paint(term, opt, top + r, left + width - 1, "|", kPairAccent);
  }
  paint(term, opt, top + height - 1, left, "+" + std::string(width - 2, '-') + "+", kPairAccent);

  std::string word_btn = "[ Word Input ]";
  std::string bin_btn = "[ Binary Input ]";
  std::string buttons = word_btn + "    " + bin_btn;
  bool word_sel = snap.modal_selection == InputMode::Word;
  int hl_start = word_sel ? 0 : (int)(word_btn.size() + 4);
  int hl_len = word_sel ? (int)word_btn.size() : (int)bin_btn.size();
  term.draw_highlighted(top + 2, left + std::max(1, (width - (int)buttons.size()) / 2), buttons, hl_start, hl_len);
  std::string help = "Use <-/-> to select, Enter to confirm";
  term.draw_text(top + 4, left + std::max(1, (width - (int)help.size()) / 2), help);
}

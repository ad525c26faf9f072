#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: ITerminal that draws into an in-memory character grid, for tests
 *          and render verification without a tty.
 * Records: highlighted spans and colored spans alongside the text.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  struct Span { int row; int col; int len; int color_pair; };

  HeadlessTerminal(int rows, int cols);

  TermSize getSize() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void refresh() override { refresh_count_++; }

  const std::string& line(int row) const; // empty string outside the grid
  std::string text() const;
  bool contains(const std::string& needle) const;
  int find_row(const std::string& needle) const; // -1 if absent
  std::string highlighted_text() const;
  const std::vector<Span>& highlights() const { return highlights_; }
  const std::vector<Span>& colored() const { return colored_; }
  int refresh_count() const { return refresh_count_; }

private:
  void put(int row, int col, const std::string& text);
  int rows_;
  int cols_;
  std::vector<std::string> screen_;
  std::vector<Span> highlights_;
  std::vector<Span> colored_;
  int refresh_count_ = 0;
};

#pragma once
/*
 * Renderer
 *
 * Purpose: draw the session (carousel, memory grid, input line, status,
 *          footer, startup modal).
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives a SessionSnapshot and never mutates it.
 */
#include <optional>
#include <string>
#include <utility>
#include "iterminal.hpp"
#include "session.hpp"
#include "word_catalog.hpp"

struct RenderOptions {
  bool enable_color = true;
  int carousel_window = 7;
};

// What the memory grid shows: reviewed history entry first, then live binary
// input, then the current suggestion.
struct GridView {
  std::optional<std::string> word;
  std::optional<size_t> index;
  std::string bits; // may be partial (binary input) or empty
};

// [start, end) of the visible carousel window around cursor
std::pair<size_t, size_t> carousel_range(size_t count, size_t cursor, size_t window);
std::string counter_text(const SessionSnapshot& snap);
std::string prompt_text(const SessionSnapshot& snap);

class Renderer {
public:
  explicit Renderer(const WordCatalog& catalog) : catalog_(catalog) {}

  void render(ITerminal& term, const SessionSnapshot& snap, const RenderOptions& opt);
  GridView grid_view(const SessionSnapshot& snap) const;

private:
  void render_carousel(ITerminal& term, const SessionSnapshot& snap, const RenderOptions& opt, int row);
  void render_grid(ITerminal& term, const SessionSnapshot& snap, const RenderOptions& opt, int row);
  void render_input(ITerminal& term, const SessionSnapshot& snap, const RenderOptions& opt, int row);
  void render_footer(ITerminal& term, const SessionSnapshot& snap, const RenderOptions& opt, int row);
  void render_modal(ITerminal& term, const SessionSnapshot& snap, const RenderOptions& opt);

  const WordCatalog& catalog_;
};

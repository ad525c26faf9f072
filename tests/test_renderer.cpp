#include "headless_terminal.hpp"
#include "renderer.hpp"
#include "session.hpp"
#include <cassert>
#include <string>

using K = SessionEvent::Kind;

static void type(Session& s, const std::string& text) {
  for (char c : text) s.handle(SessionEvent::append(c));
}

static void test_carousel_range() {
  assert((carousel_range(0, 0, 7) == std::pair<size_t, size_t>{0, 0}));
  assert((carousel_range(3, 1, 7) == std::pair<size_t, size_t>{0, 3}));
  assert((carousel_range(1024, 0, 7) == std::pair<size_t, size_t>{0, 7}));
  assert((carousel_range(1024, 10, 7) == std::pair<size_t, size_t>{7, 14}));
  assert((carousel_range(1024, 1023, 7) == std::pair<size_t, size_t>{1017, 1024}));
  assert((carousel_range(7, 6, 7) == std::pair<size_t, size_t>{0, 7}));
}

static void test_startup_modal() {
  const WordCatalog& c = default_catalog();
  Session s(c, false);
  HeadlessTerminal term(24, 80);
  Renderer r(c);
  RenderOptions opt;
  r.render(term, s.snapshot(), opt);
  assert(term.contains("Select Input Mode"));
  // last highlight is the modal button, drawn over the carousel
  assert(term.highlights().size() == 2);
  assert(term.highlighted_text().ends_with("|[ Word Input ]"));
  s.handle(SessionEvent::of(K::CursorRight));
  r.render(term, s.snapshot(), opt);
  assert(term.highlighted_text().ends_with("|[ Binary Input ]"));
  assert(term.refresh_count() == 2);
}

static void test_word_view() {
  const WordCatalog& c = default_catalog();
  Session s(c, false, InputMode::Word);
  HeadlessTerminal term(24, 80);
  Renderer r(c);
  RenderOptions opt;
  r.render(term, s.snapshot(), opt);
  assert(!term.contains("Select Input Mode"));
  assert(term.contains("Suggestions"));
  assert(term.highlighted_text() == "[ academic ]");
  assert(term.contains("Word: ACADEMIC | Index: 0"));
  assert(term.contains("Word #1/> _"));
  assert(term.contains(" Word #1/20 "));
  assert(term.contains(" 512 "));

  type(s, "zer");
  r.render(term, s.snapshot(), opt);
  assert(term.highlighted_text() == "[ zero ]");
  assert(term.contains("Word: ZERO | Index: 1023"));
  assert(term.contains("Word #1/> zer_"));
  int bits_row = term.find_row("|  1  |  1  |");
  assert(bits_row >= 0);

  type(s, "q");
  r.render(term, s.snapshot(), opt);
  assert(term.contains("No matches"));
  assert(term.contains("Select a word to view details"));
  assert(term.contains("|  #  |"));
}

static void test_binary_view() {
  const WordCatalog& c = default_catalog();
  Session s(c, false, InputMode::Binary);
  HeadlessTerminal term(24, 80);
  Renderer r(c);
  RenderOptions opt;
  r.render(term, s.snapshot(), opt);
  assert(term.contains("Decoded Word"));
  assert(term.contains("Enter 10 bits..."));
  assert(term.contains("Bits #1/> _"));

  type(s, "0000000001");
  r.render(term, s.snapshot(), opt);
  assert(term.contains("[ ACID ]"));
  assert(term.contains("Word: ACID | Index: 1"));

  GridView g = r.grid_view(s.snapshot());
  assert(g.word == std::string("acid") && g.index == 1u && g.bits == "0000000001");

  s.handle(SessionEvent::of(K::Confirm));
  type(s, "10");
  g = r.grid_view(s.snapshot());
  assert(g.bits == "10" && !g.word);
  r.render(term, s.snapshot(), opt);
  assert(term.contains("Bits #2/> 10_"));
}

static void test_history_review_view() {
  const WordCatalog& c = default_catalog();
  Session s(c, false, InputMode::Word);
  type(s, "aca"); s.handle(SessionEvent::of(K::Confirm));
  type(s, "aci"); s.handle(SessionEvent::of(K::Confirm));
  s.handle(SessionEvent::of(K::ReviewUp));
  HeadlessTerminal term(24, 80);
  Renderer r(c);
  r.render(term, s.snapshot(), RenderOptions{});
  assert(term.contains(" Word #1/2 [20] "));
  assert(term.contains("Word: ACADEMIC | Index: 0"));
  assert(term.contains("saved 'acid' (2/20)"));
  s.handle(SessionEvent::of(K::ReviewDown));
  s.handle(SessionEvent::of(K::ReviewDown));
  r.render(term, s.snapshot(), RenderOptions{});
  assert(term.contains(" Word #3/20 "));
}

static void test_paper_view_and_no_color() {
  const WordCatalog& c = default_catalog();
  Session s(c, true, InputMode::Binary);
  HeadlessTerminal term(24, 80);
  Renderer r(c);
  RenderOptions opt;
  r.render(term, s.snapshot(), opt);
  assert(term.contains("< Paper Mode >"));
  assert(term.contains("Bits/> _"));
  bool saw_paper = false;
  for (const auto& sp : term.colored()) if (sp.color_pair == kPairPaper) saw_paper = true;
  assert(saw_paper);

  opt.enable_color = false;
  r.render(term, s.snapshot(), opt);
  assert(term.colored().empty());
  assert(term.contains("< Paper Mode >"));
}

static void test_render_does_not_mutate() {
  const WordCatalog& c = default_catalog();
  Session s(c, false, InputMode::Word);
  type(s, "ac");
  s.handle(SessionEvent::of(K::CursorRight));
  SessionSnapshot before = s.snapshot();
  HeadlessTerminal term(24, 80);
  Renderer r(c);
  for (int i = 0; i < 3; ++i) r.render(term, before, RenderOptions{});
  SessionSnapshot after = s.snapshot();
  assert(before.suggestion_cursor == after.suggestion_cursor);
  assert(before.input == after.input);
  assert(term.highlighted_text() == "[ acid ]");
}

static void test_small_screen_is_clipped() {
  const WordCatalog& c = default_catalog();
  Session s(c, false, InputMode::Word);
  type(s, "ac");
  HeadlessTerminal term(3, 10);
  Renderer r(c);
  r.render(term, s.snapshot(), RenderOptions{});
  for (int row = 0; row < 3; ++row) assert(term.line(row).size() == 10);
  assert(term.line(-1).empty());
  assert(term.line(3).empty());
  assert(term.line(1000).empty());
  assert(term.find_row("Input") == -1);
}

int main() {
  test_carousel_range();
  test_startup_modal();
  test_word_view();
  test_binary_view();
  test_history_review_view();
  test_paper_view_and_no_color();
  test_render_does_not_mutate();
  test_small_screen_is_clipped();
  return 0;
}

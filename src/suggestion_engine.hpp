#pragma once
/*
 * SuggestionEngine
 *
 * Purpose: live candidate list for the typed input plus a wrap-around cursor
 *          (the carousel).
 * Rule: empty input lists the whole catalog; otherwise the prefix matches.
 * Invariant: cursor is 0 when the list is empty, else 0 <= cursor < size.
 *            Moving the cursor never recomputes the list.
 */
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "types.hpp"
#include "word_catalog.hpp"

class SuggestionEngine {
public:
  explicit SuggestionEngine(const WordCatalog& catalog);

  void set_input(std::string_view text);
  void move_cursor(Direction dir);
  std::optional<std::string> current() const;

  const std::vector<std::string>& suggestions() const { return suggestions_; }
  size_t cursor() const { return cursor_; }
  bool empty() const { return suggestions_.empty(); }

private:
  const WordCatalog& catalog_;
  std::vector<std::string> suggestions_;
  size_t cursor_ = 0;
};

#include "suggestion_engine.hpp"
#include "query.hpp"

SuggestionEngine::SuggestionEngine(const WordCatalog& catalog) : catalog_(catalog) {
  set_input("");
}

void SuggestionEngine::set_input(std::string_view text) {
  std::string q = normalize_query(text);
  if (q.empty()) suggestions_ = catalog_.words();
  else suggestions_ = catalog_.entries_with_prefix(q);
  if (suggestions_.empty() || cursor_ >= suggestions_.size()) cursor_ = 0;
}

void SuggestionEngine::move_cursor(Direction dir) {
  if (suggestions_.empty()) return;
  size_t n = suggestions_.size();
  if (dir == Direction::Left) cursor_ = (cursor_ == 0) ? n - 1 : cursor_ - 1;
  else cursor_ = (cursor_ + 1 == n) ? 0 : cursor_ + 1;
}

std::optional<std::string> SuggestionEngine::current() const {
  if (suggestions_.empty()) return std::nullopt;
  return suggestions_[cursor_];
}

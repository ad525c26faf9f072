#include "word_catalog.hpp"
#include "wordlist_data.hpp"
#include <algorithm>

WordCatalog::WordCatalog(std::vector<std::string> words) : words_(std::move(words)) {
  std::sort(words_.begin(), words_.end());
  words_.erase(std::unique(words_.begin(), words_.end()), words_.end());
}

std::optional<size_t> WordCatalog::lookup_exact(std::string_view word) const {
  auto it = std::lower_bound(words_.begin(), words_.end(), word,
                             [](const std::string& a, std::string_view b) { return std::string_view(a) < b; });
  if (it == words_.end() || *it != word) return std::nullopt;
  return static_cast<size_t>(it - words_.begin());
}

std::vector<std::string>::const_iterator WordCatalog::prefix_begin(std::string_view prefix) const {
  // every word starting with prefix sorts at or after the prefix itself
  return std::lower_bound(words_.begin(), words_.end(), prefix,
                          [](const std::string& a, std::string_view b) { return std::string_view(a) < b; });
}

std::vector<std::string> WordCatalog::entries_with_prefix(std::string_view prefix) const {
  std::vector<std::string> out;
  for (auto it = prefix_begin(prefix); it != words_.end() && it->starts_with(prefix); ++it) out.push_back(*it);
  return out;
}

size_t WordCatalog::count_with_prefix(std::string_view prefix) const {
  size_t n = 0;
  for (auto it = prefix_begin(prefix); it != words_.end() && it->starts_with(prefix); ++it) n++;
  return n;
}

std::optional<std::string> WordCatalog::by_index(size_t i) const {
  if (i >= words_.size()) return std::nullopt;
  return words_[i];
}

std::optional<WordEntry> WordCatalog::entry(size_t i) const {
  if (i >= words_.size()) return std::nullopt;
  return WordEntry{words_[i], i};
}

const WordCatalog& default_catalog() {
  static const WordCatalog catalog(std::vector<std::string>(kSlip39Words.begin(), kSlip39Words.end()));
  return catalog;
}

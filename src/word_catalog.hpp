#pragma once
/*
 * WordCatalog
 *
 * Purpose: immutable ordered word table; index lookup and prefix search.
 * Invariant: entries strictly ascending, unique; index == position.
 * Usage: default_catalog() returns the process-wide SLIP-39 table, built once
 *        on first use and never mutated. Pass it by const reference.
 */
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct WordEntry {
  std::string word;
  size_t index = 0;
};

class WordCatalog {
public:
  // Input is sorted and de-duplicated so the ordering invariant always holds.
  explicit WordCatalog(std::vector<std::string> words);

  size_t size() const { return words_.size(); }
  bool empty() const { return words_.empty(); }
  const std::vector<std::string>& words() const { return words_; }

  std::optional<size_t> lookup_exact(std::string_view word) const;
  std::vector<std::string> entries_with_prefix(std::string_view prefix) const;
  size_t count_with_prefix(std::string_view prefix) const;
  std::optional<std::string> by_index(size_t i) const;
  std::optional<WordEntry> entry(size_t i) const;

private:
  std::vector<std::string>::const_iterator prefix_begin(std::string_view prefix) const;
  std::vector<std::string> words_;
};

const WordCatalog& default_catalog();

#pragma once
/*
 * PrefixResolver
 *
 * Purpose: resolve typed text to exactly one catalog word, or report that the
 *          prefix is ambiguous or matches nothing.
 * Rule: normalize; an exact catalog match wins over any wider prefix match.
 * Note: Ambiguous carries every match (no truncation), in catalog order.
 */
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include "lookup_error.hpp"
#include "word_catalog.hpp"

struct Resolved { std::string word; };
struct Ambiguous {
  std::string prefix;
  size_t count = 0;
  std::string examples;
};
struct NotFound { std::string query; };

using Resolution = std::variant<Resolved, Ambiguous, NotFound>;

// "a, b, c"
std::string join_words(const std::vector<std::string>& words);

class PrefixResolver {
public:
  explicit PrefixResolver(const WordCatalog& catalog) : catalog_(catalog) {}

  Resolution resolve(std::string_view query) const;

  // Exact-or-unique-prefix lookup for command-line use; on failure err holds
  // WordNotFound or AmbiguousPrefix.
  bool resolve_word(std::string_view query, std::string& word, LookupError& err) const;
  // Exact lookup only (after normalization).
  bool find_exact(std::string_view query, std::string& word, LookupError& err) const;

private:
  const WordCatalog& catalog_;
};

LookupError to_error(const Ambiguous& a);
LookupError to_error(const NotFound& n);

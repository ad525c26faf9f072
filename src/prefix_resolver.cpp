#include "prefix_resolver.hpp"
#include "codec.hpp"
#include "query.hpp"

std::string join_words(const std::vector<std::string>& words) {
  std::string out;
  for (size_t i = 0; i < words.size(); ++i) {
    if (i) out += ", ";
    out += words[i];
  }
  return out;
}

Resolution PrefixResolver::resolve(std::string_view query) const {
  Query q(query);
  if (catalog_.lookup_exact(q.normalized)) return Resolved{q.normalized};
  std::vector<std::string> matches = catalog_.entries_with_prefix(q.normalized);
  if (matches.empty()) return NotFound{q.raw};
  if (matches.size() == 1) return Resolved{matches.front()};
  return Ambiguous{q.normalized, matches.size(), join_words(matches)};
}

LookupError to_error(const Ambiguous& a) {
  return {LookupErrorKind::AmbiguousPrefix,
          "Ambiguous prefix '" + a.prefix + "' matches " + std::to_string(a.count) + " words: " + a.examples};
}

LookupError to_error(const NotFound& n) {
  return {LookupErrorKind::WordNotFound, word_not_found_message(n.query)};
}

bool PrefixResolver::resolve_word(std::string_view query, std::string& word, LookupError& err) const {
  Resolution r = resolve(query);
  if (auto* ok = std::get_if<Resolved>(&r)) { word = ok->word; return true; }
  if (auto* amb = std::get_if<Ambiguous>(&r)) { err = to_error(*amb); return false; }
  err = to_error(std::get<NotFound>(r));
  return false;
}

bool PrefixResolver::find_exact(std::string_view query, std::string& word, LookupError& err) const {
  std::string normalized = normalize_query(query);
  if (!catalog_.lookup_exact(normalized)) {
    err = to_error(NotFound{std::string(query)});
    return false;
  }
  word = normalized;
  return true;
}

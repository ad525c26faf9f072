#include "prefix_resolver.hpp"
#include "query.hpp"
#include <cassert>
#include <string>
#include <variant>

static bool same(const Resolution& a, const Resolution& b) {
  if (a.index() != b.index()) return false;
  if (auto* x = std::get_if<Resolved>(&a)) return x->word == std::get<Resolved>(b).word;
  if (auto* x = std::get_if<Ambiguous>(&a)) {
    const auto& y = std::get<Ambiguous>(b);
    return x->prefix == y.prefix && x->count == y.count && x->examples == y.examples;
  }
  return true;
}

static void test_scenarios() {
  PrefixResolver r(default_catalog());
  auto aca = r.resolve("aca");
  assert(std::get<Resolved>(aca).word == "academic");
  assert(std::get<Resolved>(r.resolve("aci")).word == "acid");
  assert(std::get<Resolved>(r.resolve("zer")).word == "zero");
  assert(std::get<Resolved>(r.resolve("  ACA  ")).word == "academic");

  auto ac = r.resolve("ac");
  const auto& amb = std::get<Ambiguous>(ac);
  assert(amb.prefix == "ac");
  assert(amb.count == 7);
  assert(amb.examples.find("academic") != std::string::npos);
  assert(amb.examples.find("acid") != std::string::npos);
  assert(amb.examples == "academic, acid, acne, acquire, acrobat, activity, actress");

  auto xyz = r.resolve("xyz");
  assert(std::get<NotFound>(xyz).query == "xyz");
  // NotFound carries the raw query text
  assert(std::get<NotFound>(r.resolve(" XyZ ")).query == " XyZ ");
}

static void test_exact_match_wins() {
  WordCatalog c({"car", "card", "care"});
  PrefixResolver r(c);
  assert(std::get<Resolved>(r.resolve("car")).word == "car");
  assert(std::get<Ambiguous>(r.resolve("ca")).count == 3);
  assert(std::get<Resolved>(r.resolve("card")).word == "card");
  assert(std::get<Resolved>(PrefixResolver(default_catalog()).resolve("academic")).word == "academic");
}

static void test_classification_matches_prefix_count() {
  const WordCatalog& c = default_catalog();
  PrefixResolver r(c);
  for (const char* p : {"a", "ac", "aca", "lea", "leaf", "sh", "sho", "z", "q", "qu", "x", "wr", "wri"}) {
    size_t n = c.count_with_prefix(p);
    auto res = r.resolve(p);
    if (c.lookup_exact(p)) assert(std::holds_alternative<Resolved>(res));
    else if (n == 0) assert(std::holds_alternative<NotFound>(res));
    else if (n == 1) assert(std::holds_alternative<Resolved>(res));
    else assert(std::holds_alternative<Ambiguous>(res) && std::get<Ambiguous>(res).count == n);
  }
}

static void test_normalization_idempotent() {
  PrefixResolver r(default_catalog());
  for (const char* s : {"  ACA  ", "Zer", "\tAc\n", "XYZ", "LeAf ", ""}) {
    std::string n = normalize_query(s);
    assert(normalize_query(n) == n);
    auto a = r.resolve(s);
    auto b = r.resolve(n);
    if (std::holds_alternative<NotFound>(a)) assert(std::holds_alternative<NotFound>(b));
    else assert(same(a, b));
  }
  // deterministic
  assert(same(r.resolve("sh"), r.resolve("sh")));
}

static void test_trim_keeps_case() {
  assert(trim_query("  ACa\t") == "ACa");
  assert(trim_query("set paper on\r") == "set paper on");
  assert(trim_query(" \n ").empty());
  assert(trim_query("").empty());
  assert(trim_query("a b") == "a b");
  assert(normalize_query("  ACa\t") == "aca");
}

static void test_cli_helpers() {
  PrefixResolver r(default_catalog());
  std::string w; LookupError e;
  assert(r.resolve_word("aca", w, e) && w == "academic");
  assert(!r.resolve_word("ac", w, e));
  assert(e.kind == LookupErrorKind::AmbiguousPrefix);
  assert(e.message.rfind("Ambiguous prefix 'ac' matches 7 words: academic, acid", 0) == 0);
  e = LookupError{};
  assert(!r.resolve_word("xyz", w, e));
  assert(e.kind == LookupErrorKind::WordNotFound);
  e = LookupError{};
  assert(r.find_exact(" Zero ", w, e) && w == "zero");
  assert(!r.find_exact("zer", w, e) && e.kind == LookupErrorKind::WordNotFound);
}

int main() {
  test_scenarios();
  test_exact_match_wins();
  test_classification_matches_prefix_count();
  test_normalization_idempotent();
  test_trim_keeps_case();
  test_cli_helpers();
  return 0;
}

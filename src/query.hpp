#pragma once
/*
 * Query
 *
 * Purpose: clean up user-typed text. trim_query strips ASCII whitespace at
 *          both ends; normalize_query also lower-cases for catalog lookups.
 * Invariant: normalize_query(normalize_query(s)) == normalize_query(s).
 */
#include <string>
#include <string_view>

std::string trim_query(std::string_view raw);
std::string normalize_query(std::string_view raw);

struct Query {
  std::string raw;
  std::string normalized;

  explicit Query(std::string_view text) : raw(text), normalized(normalize_query(text)) {}
};

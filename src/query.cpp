#include "query.hpp"
#include <cctype>

static inline bool is_space(unsigned char c) {
  return std::isspace(c) != 0;
}

std::string trim_query(std::string_view raw) {
  size_t i = 0; while (i < raw.size() && is_space(static_cast<unsigned char>(raw[i]))) i++;
  size_t j = raw.size(); while (j > i && is_space(static_cast<unsigned char>(raw[j - 1]))) j--;
  return std::string(raw.substr(i, j - i));
}

std::string normalize_query(std::string_view raw) {
  std::string out = trim_query(raw);
  for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

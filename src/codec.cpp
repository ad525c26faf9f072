#include "codec.hpp"
#include "query.hpp"

std::string index_to_bits(size_t index) {
  std::string bits(kIndexBits, '0');
  for (int i = kIndexBits - 1; i >= 0; --i) {
    if (index & 1u) bits[i] = '1';
    index >>= 1;
  }
  return bits;
}

std::string word_not_found_message(std::string_view word) {
  return "Word '" + std::string(word) + "' not found in SLIP-39 wordlist";
}

static std::string range_message(const WordCatalog& catalog, size_t index) {
  size_t last = catalog.empty() ? 0 : catalog.size() - 1;
  return "Index " + std::to_string(index) + " out of wordlist range (0-" + std::to_string(last) + ")";
}

bool encode_word(const WordCatalog& catalog, std::string_view word, std::string& bits, LookupError& err) {
  auto idx = catalog.lookup_exact(normalize_query(word));
  if (!idx) {
    err = {LookupErrorKind::WordNotFound, word_not_found_message(word)};
    return false;
  }
  bits = index_to_bits(*idx);
  return true;
}

bool decode_bits(const WordCatalog& catalog, std::string_view bits, std::string& word, LookupError& err) {
  if (bits.size() != static_cast<size_t>(kIndexBits)) {
    err = {LookupErrorKind::InvalidBinaryLength,
           "Binary must be exactly 10 bits, got " + std::to_string(bits.size()) + " bits"};
    return false;
  }
  size_t index = 0;
  for (char c : bits) {
    if (c != '0' && c != '1') {
      err = {LookupErrorKind::InvalidBinary, "Invalid binary string: Binary string must only contain '0' and '1'"};
      return false;
    }
    index = (index << 1) | static_cast<size_t>(c - '0');
  }
  auto w = catalog.by_index(index);
  if (!w) {
    err = {LookupErrorKind::InvalidBinary, "Invalid binary string: " + range_message(catalog, index)};
    return false;
  }
  word = *w;
  return true;
}

bool word_at_index(const WordCatalog& catalog, size_t index, std::string& word, LookupError& err) {
  auto w = catalog.by_index(index);
  if (!w) {
    err = {LookupErrorKind::IndexOutOfRange, range_message(catalog, index)};
    return false;
  }
  word = *w;
  return true;
}

bool explain_word(const WordCatalog& catalog, std::string_view word, std::string& line, LookupError& err) {
  std::string normalized = normalize_query(word);
  auto idx = catalog.lookup_exact(normalized);
  if (!idx) {
    err = {LookupErrorKind::WordNotFound, word_not_found_message(word)};
    return false;
  }
  line = normalized + " -> " + std::to_string(*idx) + " -> " + index_to_bits(*idx);
  return true;
}

#pragma once
/*
 * Codec
 *
 * Purpose: word <-> 10-bit binary string conversion over a WordCatalog.
 * Errors: WordNotFound (encode), InvalidBinaryLength / InvalidBinary (decode).
 * Note: pure functions; encode normalizes the word (trim, lower-case) first.
 */
#include <string>
#include <string_view>
#include "lookup_error.hpp"
#include "word_catalog.hpp"

inline constexpr int kIndexBits = 10;

std::string index_to_bits(size_t index);

bool encode_word(const WordCatalog& catalog, std::string_view word, std::string& bits, LookupError& err);
bool decode_bits(const WordCatalog& catalog, std::string_view bits, std::string& word, LookupError& err);
bool word_at_index(const WordCatalog& catalog, size_t index, std::string& word, LookupError& err);

// "acid -> 1 -> 0000000001"
bool explain_word(const WordCatalog& catalog, std::string_view word, std::string& line, LookupError& err);

std::string word_not_found_message(std::string_view word);

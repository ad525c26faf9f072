#pragma once
/*
 * FileReader
 *
 * Purpose: split a small config file into numbered lines.
 * Lines: numbers are 1-based; CRLF endings and a leading UTF-8 byte order
 *        mark are dropped; text is otherwise left as written.
 * Usage: read_numbered_lines(path, out, msg); returns false with msg on failure.
 */
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

constexpr size_t kMaxRcFileBytes = 64 * 1024;

struct NumberedLine {
  size_t number;
  std::string text;
};

bool read_numbered_lines(const std::filesystem::path& path,
                         std::vector<NumberedLine>& out_lines,
                         std::string& msg);

#pragma once
/*
 * MappedFile
 *
 * Purpose: read-only memory map of a whole file. Owns both the descriptor and
 *          the mapping; both are released on destruction.
 * Usage: MappedFile f; if (!f.open(path, msg)) ...; f.view();
 */
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

class MappedFile {
public:
  MappedFile() = default;
  ~MappedFile() { close(); }
  MappedFile(const MappedFile&) = delete;
  MappedFile& operator=(const MappedFile&) = delete;

  // Fails (false, msg set) when the file can not be opened, is larger than
  // max_bytes, or can not be mapped. An empty file opens to an empty view.
  bool open(const std::filesystem::path& path, size_t max_bytes, std::string& msg);
  void close();

  std::string_view view() const { return {static_cast<const char*>(data_), size_}; }
  size_t size() const { return size_; }

private:
  int fd_ = -1;
  void* data_ = nullptr;
  size_t size_ = 0;
};

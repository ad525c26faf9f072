#include "mapped_file.hpp"
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

bool MappedFile::open(const std::filesystem::path& path, size_t max_bytes, std::string& msg) {
  close();
  fd_ = ::open(path.string().c_str(), O_RDONLY);
  if (fd_ < 0) { msg = "can not open file: " + path.string(); return false; }
  struct stat st{};
  if (::fstat(fd_, &st) != 0) { msg = "can not read file stat: " + path.string(); close(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n > max_bytes) { msg = "rc file too large: " + path.string(); close(); return false; }
  if (n == 0) return true;
  void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd_, 0);
  if (mem == MAP_FAILED) { msg = "can not mmap file: " + path.string(); close(); return false; }
  data_ = mem;
  size_ = n;
  return true;
}

void MappedFile::close() {
  if (data_) { ::munmap(data_, size_); data_ = nullptr; }
  size_ = 0;
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

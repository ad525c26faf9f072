#include "file_reader.hpp"
#include <string_view>
#include "mapped_file.hpp"

static constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

bool read_numbered_lines(const std::filesystem::path& path,
                         std::vector<NumberedLine>& out_lines,
                         std::string& msg) {
  out_lines.clear();
  MappedFile file;
  if (!file.open(path, kMaxRcFileBytes, msg)) return false;
  std::string_view data = file.view();
  if (data.starts_with(kUtf8Bom)) data.remove_prefix(kUtf8Bom.size());
  size_t number = 1;
  while (!data.empty()) {
    size_t nl = data.find('\n');
    std::string_view line = data.substr(0, nl);
    if (line.ends_with('\r')) line.remove_suffix(1);
    out_lines.push_back({number++, std::string(line)});
    if (nl == std::string_view::npos) break;
    data.remove_prefix(nl + 1);
  }
  msg = "read " + path.string();
  return true;
}

// top100/basic/source_manager.cpp - Source file implementation
#include "top100/basic/source_manager.hpp"

#include <fstream>
#include <sstream>
#include <utility>

namespace top100
{

SourceFile::SourceFile(std::filesystem::path path, std::string content)
: path_(std::move(path)), content_(std::move(content))
{
  build_line_table();
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  const uint32_t start = line_offsets_[line_index];
  auto end = static_cast<uint32_t>(content_.size());
  if (line_index + 1 < line_offsets_.size()) {
    end = line_offsets_[line_index + 1];
    if (end > start && content_[end - 1] == '\n') {
      --end;
    }
  }
  if (end > start && content_[end - 1] == '\r') {
    --end;
  }

  return std::string_view(content_).substr(start, end - start);
}

void SourceFile::build_line_table()
{
  line_offsets_.clear();
  line_offsets_.push_back(0);

  for (size_t i = 0; i < content_.size(); ++i) {
    if (content_[i] == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

std::optional<std::string> read_file_content(const std::filesystem::path & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    return std::nullopt;
  }
  return ss.str();
}

}  // namespace top100

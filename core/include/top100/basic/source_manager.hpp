// top100/basic/source_manager.hpp - Source text and line lookup
//
// This header provides the types used to locate code inside a source file.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace top100
{

// ============================================================================
// LineColumn - Human-readable position
// ============================================================================

/**
 * Human-readable line and column position (1-indexed).
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

// ============================================================================
// SourceFile - One file's path and content
// ============================================================================

/**
 * Owns the content of one source file.
 *
 * Features:
 * - Stores the file path using std::filesystem::path
 * - Returns the text of a single line for diagnostic snippets
 */
class SourceFile
{
public:
  SourceFile() = default;

  SourceFile(std::filesystem::path path, std::string content);

  /// Get the file path
  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }

  /// Get the file name only (without directory)
  [[nodiscard]] std::string file_name() const { return path_.filename().string(); }

  /// Get the source content
  [[nodiscard]] std::string_view content() const noexcept { return content_; }

  /// Get the content of a specific line (0-indexed), without its line break
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

private:
  void build_line_table();

  std::filesystem::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;  ///< Offset of each line start
};

/**
 * Read a whole file as bytes.
 *
 * @return File content, or std::nullopt if the file cannot be opened or read
 */
[[nodiscard]] std::optional<std::string> read_file_content(const std::filesystem::path & path);

}  // namespace top100

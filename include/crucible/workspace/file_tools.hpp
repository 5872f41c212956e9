#pragma once

#include "crucible/common/result.hpp"
#include "crucible/workspace/path_resolver.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace crucible::workspace {

struct FileSpec {
  std::string path;
  std::string content;
  std::optional<std::string> description;
};

struct FileStructure {
  std::vector<FileSpec> files;
  /// Directories to create even when no file lands in them.
  std::vector<std::string> dirs;
  /// Package requirements of the structure. Carried through, never installed here.
  std::vector<std::string> dependencies;
};

struct CreatedFile {
  std::string path;
  std::optional<std::string> description;
};

struct FileStructureResult {
  std::vector<CreatedFile> files;
  /// Directories that did not exist before, each with a trailing '/'.
  std::vector<std::string> dirs;
  std::string summary;
  std::vector<std::string> dependencies;
};

/// File operations confined to one sandbox root. Every incoming path goes through
/// `resolve_within_root`, so a rejected path never causes a write.
class FileTools {
public:
  explicit FileTools(std::filesystem::path root, PathMappings mappings = {});

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] const PathMappings &mappings() const { return mappings_; }

  [[nodiscard]] common::Result<FileStructureResult>
  create_file_structure(const FileStructure &structure);

  /// Writes `content` byte for byte, replacing the target atomically. Returns the
  /// path as given.
  [[nodiscard]] common::Result<std::string> write_file(const std::string &path,
                                                       std::string_view content);

  /// File content encoded as base64.
  [[nodiscard]] common::Result<std::string> read_file(const std::string &path) const;
  [[nodiscard]] common::Result<std::string> read_file_bytes(const std::string &path) const;

  /// Recursive listing relative to `path`, sorted, directories marked with '/'.
  /// Symlinks are listed but never followed.
  [[nodiscard]] common::Result<std::vector<std::string>>
  list_files(const std::string &path = ".") const;

private:
  [[nodiscard]] common::Result<std::filesystem::path> resolve(const std::string &path) const;

  std::filesystem::path root_;
  PathMappings mappings_;
};

} // namespace crucible::workspace

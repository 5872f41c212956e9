#pragma once

#include "crucible/common/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace crucible::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string join(const std::vector<std::string> &parts, const std::string &separator);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// True when `candidate` equals `parent` or lies below it. Both paths are compared
/// component-wise; callers canonicalize first.
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                              const std::filesystem::path &parent);

/// Removes everything inside `dir` but keeps the directory itself.
[[nodiscard]] Status clear_directory(const std::filesystem::path &dir);

/// Writes through a freshly created, uniquely named temporary file in the same
/// directory and renames it over the target. Parent directories are created. A
/// target that is a symlink is refused with ErrorKind::PathSecurity.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path, std::string_view content);

/// Recursive copy that never follows symlinks on either side. Source links are
/// recreated as links; links already present in `target` are replaced.
[[nodiscard]] Status copy_tree_no_follow(const std::filesystem::path &source,
                                         const std::filesystem::path &target);
[[nodiscard]] Result<std::string> read_file_bytes(const std::filesystem::path &path);

[[nodiscard]] std::string random_hex(std::size_t length);

} // namespace crucible::common

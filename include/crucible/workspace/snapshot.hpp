#pragma once

#include "crucible/common/result.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace crucible::workspace {

/// Relative path (generic form) → content digest of every regular file and
/// symlink below a workspace directory.
using WorkspaceSnapshot = std::map<std::string, std::string>;

/// Walks `root` without following symlinks. Regular files are keyed by the
/// SHA-256 of their content, symlinks by the digest of their target string.
[[nodiscard]] common::Result<WorkspaceSnapshot> capture_snapshot(const std::filesystem::path &root);

/// Paths present in `after` that are absent from `before` or whose digest
/// changed, in sorted order.
[[nodiscard]] std::vector<std::string> diff_snapshots(const WorkspaceSnapshot &before,
                                                      const WorkspaceSnapshot &after);

} // namespace crucible::workspace

#include "crucible/workspace/snapshot.hpp"

#include "crucible/common/digest.hpp"

namespace crucible::workspace {

common::Result<WorkspaceSnapshot> capture_snapshot(const std::filesystem::path &root) {
  WorkspaceSnapshot snapshot;
  std::error_code ec;
  if (!std::filesystem::exists(root, ec)) {
    return common::Result<WorkspaceSnapshot>::success(std::move(snapshot));
  }

  std::filesystem::recursive_directory_iterator it(
      root, std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec) {
    return common::Result<WorkspaceSnapshot>::failure(
        common::ErrorKind::Io, "failed to walk workspace " + root.string() + ": " + ec.message());
  }

  for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      return common::Result<WorkspaceSnapshot>::failure(
          common::ErrorKind::Io, "failed to walk workspace " + root.string() + ": " + ec.message());
    }

    const auto &entry = *it;
    const std::string relative = entry.path().lexically_relative(root).generic_string();
    if (entry.is_symlink(ec)) {
      const auto target = std::filesystem::read_symlink(entry.path(), ec);
      snapshot[relative] = common::sha256_hex("symlink:" + target.generic_string());
      continue;
    }
    if (!entry.is_regular_file(ec)) {
      continue;
    }

    auto digest = common::sha256_file_hex(entry.path());
    if (!digest.ok()) {
      // Files removed mid-walk by a still-running process are skipped.
      if (!std::filesystem::exists(entry.path(), ec)) {
        continue;
      }
      return common::Result<WorkspaceSnapshot>::failure(digest.status());
    }
    snapshot[relative] = digest.value();
  }
  if (ec) {
    return common::Result<WorkspaceSnapshot>::failure(
        common::ErrorKind::Io, "failed to walk workspace " + root.string() + ": " + ec.message());
  }

  return common::Result<WorkspaceSnapshot>::success(std::move(snapshot));
}

std::vector<std::string> diff_snapshots(const WorkspaceSnapshot &before,
                                        const WorkspaceSnapshot &after) {
  std::vector<std::string> changed;
  for (const auto &[path, digest] : after) {
    const auto it = before.find(path);
    if (it == before.end() || it->second != digest) {
      changed.push_back(path);
    }
  }
  return changed;
}

} // namespace crucible::workspace

#pragma once

#include "crucible/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace crucible::workspace {

/// Rewrites paths expressed in container conventions (`container_prefix`) to a
/// host-side prefix before resolution.
struct PathMapping {
  std::string container_prefix;
  std::string local_prefix;
};

using PathMappings = std::vector<PathMapping>;

/// Applies the longest matching mapping. A prefix matches the whole path or a
/// leading run of components; unmatched paths come back unchanged.
[[nodiscard]] std::string map_container_path(const std::string &incoming,
                                             const PathMappings &mappings);

/// Resolves `incoming` to a location that is `root` or lies below it. Existing
/// symlinks are followed before the containment check. Fails with
/// ErrorKind::PathSecurity and never touches the filesystem beyond reading it.
[[nodiscard]] common::Result<std::filesystem::path>
resolve_within_root(const std::filesystem::path &root, const std::string &incoming,
                    const PathMappings &mappings = {});

/// Path of `resolved` relative to `root`, in generic form. Empty for the root.
[[nodiscard]] std::string relative_to_root(const std::filesystem::path &root,
                                           const std::filesystem::path &resolved);

} // namespace crucible::workspace

#include "crucible/workspace/path_resolver.hpp"

#include "crucible/common/fs.hpp"

namespace crucible::workspace {

namespace {

std::string normalize_posix(const std::string &value) {
  if (value.empty()) {
    return value;
  }
  std::string normalized = std::filesystem::path(value).lexically_normal().generic_string();
  while (normalized.size() > 1 && normalized.back() == '/') {
    normalized.pop_back();
  }
  return normalized;
}

bool prefix_matches(const std::string &path, const std::string &prefix) {
  if (prefix == "/") {
    return common::starts_with(path, "/");
  }
  return path == prefix || common::starts_with(path, prefix + "/");
}

} // namespace

std::string map_container_path(const std::string &incoming, const PathMappings &mappings) {
  const std::string normalized = normalize_posix(incoming);

  const PathMapping *best = nullptr;
  std::string best_prefix;
  for (const auto &mapping : mappings) {
    const std::string prefix = normalize_posix(mapping.container_prefix);
    if (prefix.empty() || !prefix_matches(normalized, prefix)) {
      continue;
    }
    if (best == nullptr || prefix.size() > best_prefix.size()) {
      best = &mapping;
      best_prefix = prefix;
    }
  }
  if (best == nullptr) {
    return incoming;
  }

  std::string rest = normalized.substr(best_prefix.size());
  while (!rest.empty() && rest.front() == '/') {
    rest.erase(rest.begin());
  }
  if (rest.empty()) {
    return best->local_prefix;
  }
  return (std::filesystem::path(best->local_prefix) / rest).generic_string();
}

common::Result<std::filesystem::path> resolve_within_root(const std::filesystem::path &root,
                                                          const std::string &incoming,
                                                          const PathMappings &mappings) {
  using PathResult = common::Result<std::filesystem::path>;
  if (root.empty()) {
    return PathResult::failure(common::ErrorKind::Configuration, "sandbox root is not set");
  }
  if (incoming.find('\0') != std::string::npos) {
    return PathResult::failure(common::ErrorKind::PathSecurity, "path contains null byte");
  }

  std::filesystem::path expanded(map_container_path(incoming, mappings));
  if (expanded.empty()) {
    expanded = ".";
  }
  expanded = expanded.lexically_normal();

  std::error_code ec;
  const auto canonical_root = std::filesystem::weakly_canonical(root, ec);
  if (ec) {
    return PathResult::failure(common::ErrorKind::Io,
                               "sandbox root canonicalization failed: " + ec.message());
  }

  const std::filesystem::path candidate =
      expanded.is_absolute() ? expanded : canonical_root / expanded;
  const auto canonical_candidate = std::filesystem::weakly_canonical(candidate, ec);
  if (ec) {
    return PathResult::failure(common::ErrorKind::PathSecurity,
                               "path canonicalization failed: " + ec.message());
  }

  if (!common::is_subpath(canonical_candidate, canonical_root)) {
    return PathResult::failure(common::ErrorKind::PathSecurity,
                               "path escapes sandbox root: " + incoming);
  }
  return PathResult::success(canonical_candidate);
}

std::string relative_to_root(const std::filesystem::path &root,
                             const std::filesystem::path &resolved) {
  std::error_code ec;
  auto canonical_root = std::filesystem::weakly_canonical(root, ec);
  if (ec) {
    canonical_root = root;
  }
  const std::string relative = resolved.lexically_relative(canonical_root).generic_string();
  return relative == "." ? std::string() : relative;
}

} // namespace crucible::workspace

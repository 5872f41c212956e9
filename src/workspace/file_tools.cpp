#include "crucible/workspace/file_tools.hpp"

#include "crucible/common/digest.hpp"
#include "crucible/common/fs.hpp"

#include <algorithm>
#include <set>

namespace crucible::workspace {

namespace {

std::string with_trailing_slash(std::string value) {
  if (value.empty() || value.back() != '/') {
    value.push_back('/');
  }
  return value;
}

} // namespace

FileTools::FileTools(std::filesystem::path root, PathMappings mappings)
    : root_(std::move(root)), mappings_(std::move(mappings)) {}

common::Result<std::filesystem::path> FileTools::resolve(const std::string &path) const {
  return resolve_within_root(root_, path, mappings_);
}

common::Result<FileStructureResult>
FileTools::create_file_structure(const FileStructure &structure) {
  using StructureResult = common::Result<FileStructureResult>;

  // Resolve everything up front so a single bad path leaves the tree untouched.
  std::vector<std::pair<std::string, std::filesystem::path>> dirs;
  for (const auto &dir : structure.dirs) {
    auto resolved = resolve(dir);
    if (!resolved.ok()) {
      return StructureResult::failure(resolved.status());
    }
    dirs.emplace_back(dir, resolved.value());
  }
  std::vector<std::filesystem::path> file_paths;
  for (const auto &file : structure.files) {
    auto resolved = resolve(file.path);
    if (!resolved.ok()) {
      return StructureResult::failure(resolved.status());
    }
    file_paths.push_back(resolved.value());
  }

  FileStructureResult result;
  std::set<std::filesystem::path> seen_dirs;
  const auto ensure = [&](const std::string &label,
                          const std::filesystem::path &absolute) -> common::Status {
    std::error_code ec;
    if (std::filesystem::exists(absolute, ec) || seen_dirs.count(absolute) > 0) {
      return common::Status::success();
    }
    auto created = common::ensure_dir(absolute);
    if (!created.ok()) {
      return created.status();
    }
    seen_dirs.insert(absolute);
    result.dirs.push_back(with_trailing_slash(label));
    return common::Status::success();
  };

  auto root_created = common::ensure_dir(root_);
  if (!root_created.ok()) {
    return StructureResult::failure(root_created.status());
  }

  for (const auto &[label, absolute] : dirs) {
    auto status = ensure(label, absolute);
    if (!status.ok()) {
      return StructureResult::failure(status);
    }
  }

  for (std::size_t i = 0; i < structure.files.size(); ++i) {
    const auto &file = structure.files[i];
    const auto &absolute = file_paths[i];
    const std::string parent = relative_to_root(root_, absolute.parent_path());
    if (!parent.empty()) {
      auto status = ensure(parent, absolute.parent_path());
      if (!status.ok()) {
        return StructureResult::failure(status);
      }
    }

    auto written = common::write_file_atomic(absolute, file.content);
    if (!written.ok()) {
      return StructureResult::failure(written);
    }
    result.files.push_back(CreatedFile{.path = file.path, .description = file.description});
  }

  std::vector<std::string> summary;
  if (!result.dirs.empty()) {
    summary.push_back("Created " + std::to_string(result.dirs.size()) + " directories");
    summary.insert(summary.end(), result.dirs.begin(), result.dirs.end());
  }
  if (!result.files.empty()) {
    summary.push_back("Generated " + std::to_string(result.files.size()) + " files");
    for (const auto &file : result.files) {
      summary.push_back(file.path);
    }
  }
  result.summary = common::join(summary, "\n");
  result.dependencies = structure.dependencies;
  return StructureResult::success(std::move(result));
}

common::Result<std::string> FileTools::write_file(const std::string &path,
                                                  const std::string_view content) {
  auto resolved = resolve(path);
  if (!resolved.ok()) {
    return common::Result<std::string>::failure(resolved.status());
  }

  std::error_code ec;
  if (std::filesystem::is_directory(resolved.value(), ec)) {
    return common::Result<std::string>::failure(common::ErrorKind::Io,
                                                "path is a directory: " + path);
  }

  auto written = common::write_file_atomic(resolved.value(), content);
  if (!written.ok()) {
    return common::Result<std::string>::failure(written);
  }
  return common::Result<std::string>::success(path);
}

common::Result<std::string> FileTools::read_file_bytes(const std::string &path) const {
  auto resolved = resolve(path);
  if (!resolved.ok()) {
    return common::Result<std::string>::failure(resolved.status());
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(resolved.value(), ec)) {
    return common::Result<std::string>::failure(common::ErrorKind::NotFound,
                                                "file not found: " + path);
  }
  return common::read_file_bytes(resolved.value());
}

common::Result<std::string> FileTools::read_file(const std::string &path) const {
  auto bytes = read_file_bytes(path);
  if (!bytes.ok()) {
    return bytes;
  }
  return common::Result<std::string>::success(common::base64_encode(bytes.value()));
}

common::Result<std::vector<std::string>> FileTools::list_files(const std::string &path) const {
  using ListResult = common::Result<std::vector<std::string>>;
  auto resolved = resolve(path.empty() ? std::string(".") : path);
  if (!resolved.ok()) {
    return ListResult::failure(resolved.status());
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(resolved.value(), ec)) {
    return ListResult::failure(common::ErrorKind::NotFound, "directory not found: " + path);
  }

  std::vector<std::string> entries;
  std::filesystem::recursive_directory_iterator it(resolved.value(), ec);
  for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    const std::string relative =
        it->path().lexically_relative(resolved.value()).generic_string();
    if (it->is_directory(ec) && !it->is_symlink(ec)) {
      entries.push_back(relative + "/");
    } else {
      entries.push_back(relative);
    }
  }
  if (ec) {
    return ListResult::failure(common::ErrorKind::Io,
                               "failed to list " + path + ": " + ec.message());
  }

  std::sort(entries.begin(), entries.end());
  return ListResult::success(std::move(entries));
}

} // namespace crucible::workspace

#include "crucible/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <random>
#include <regex>

#include <fcntl.h>
#include <unistd.h>

namespace crucible::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::string join(const std::vector<std::string> &parts, const std::string &separator) {
  std::string out;
  for (const auto &part : parts) {
    if (!out.empty()) {
      out += separator;
    }
    out += part;
  }
  return out;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure(ErrorKind::Configuration, "HOME is not set");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure(
        ErrorKind::Io, "Failed to create directory: " + path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  static const std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    if (const char *var = std::getenv(match[1].str().c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

bool is_subpath(const std::filesystem::path &candidate, const std::filesystem::path &parent) {
  auto c_it = candidate.begin();
  for (auto p_it = parent.begin(); p_it != parent.end(); ++p_it) {
    // "/a/b/" iterates as "/", "a", "b", "".
    if (p_it->empty()) {
      continue;
    }
    while (c_it != candidate.end() && c_it->empty()) {
      ++c_it;
    }
    if (c_it == candidate.end() || *c_it != *p_it) {
      return false;
    }
    ++c_it;
  }
  return true;
}

Status clear_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  if (!std::filesystem::exists(dir, ec)) {
    auto created = ensure_dir(dir);
    return created.status();
  }

  std::vector<std::filesystem::path> entries;
  for (auto it = std::filesystem::directory_iterator(dir, ec);
       !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    entries.push_back(it->path());
  }
  if (ec) {
    return Status::error(ErrorKind::Io, "Failed to list " + dir.string() + ": " + ec.message());
  }

  for (const auto &entry : entries) {
    std::filesystem::remove_all(entry, ec);
    if (ec) {
      return Status::error(ErrorKind::Io,
                           "Failed to remove " + entry.string() + ": " + ec.message());
    }
  }
  return Status::success();
}

Status write_file_atomic(const std::filesystem::path &path, const std::string_view content) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return Status::error(ErrorKind::Io, "Failed to create parent directory: " + ec.message());
    }
  }

  if (std::filesystem::is_symlink(std::filesystem::symlink_status(path, ec))) {
    return Status::error(ErrorKind::PathSecurity,
                         "Refusing to replace symlink " + path.string());
  }

  // O_EXCL | O_NOFOLLOW: a name planted in the directory is never written through.
  const auto temp_path =
      path.parent_path() / ("." + path.filename().string() + ".tmp-" + random_hex(12));
  const int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC,
                        0644);
  if (fd < 0) {
    return Status::error(ErrorKind::Io, "Failed to open temporary file " + temp_path.string() +
                                            ": " + std::strerror(errno));
  }

  std::size_t written = 0;
  while (written < content.size()) {
    const ssize_t n = ::write(fd, content.data() + written, content.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      const std::string reason = std::strerror(errno);
      ::close(fd);
      std::filesystem::remove(temp_path, ec);
      return Status::error(ErrorKind::Io,
                           "Failed to write temporary file " + temp_path.string() + ": " + reason);
    }
    written += static_cast<std::size_t>(n);
  }
  if (::close(fd) != 0) {
    std::filesystem::remove(temp_path, ec);
    return Status::error(ErrorKind::Io, "Failed to close temporary file " + temp_path.string());
  }

  // rename(2) replaces the directory entry itself and never follows a link at `path`.
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    return Status::error(ErrorKind::Io, "Failed to atomically replace " + path.string() + ": " +
                                            ec.message());
  }
  return Status::success();
}

Status copy_tree_no_follow(const std::filesystem::path &source,
                           const std::filesystem::path &target) {
  std::error_code ec;
  auto ensured = ensure_dir(target);
  if (!ensured.ok()) {
    return ensured.status();
  }

  for (auto it = std::filesystem::recursive_directory_iterator(source, ec);
       !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    const auto relative = it->path().lexically_relative(source);
    const auto destination = target / relative;
    const auto existing = std::filesystem::symlink_status(destination, ec);
    ec.clear();

    // Anything already sitting at the destination as a symlink is replaced, not followed.
    if (std::filesystem::is_symlink(existing)) {
      std::filesystem::remove(destination, ec);
      if (ec) {
        return Status::error(ErrorKind::Io,
                             "Failed to remove " + destination.string() + ": " + ec.message());
      }
    }

    const auto entry = it->symlink_status(ec);
    if (ec) {
      return Status::error(ErrorKind::Io, "Failed to stat " + it->path().string() + ": " +
                                              ec.message());
    }
    if (std::filesystem::is_symlink(entry)) {
      std::filesystem::remove(destination, ec);
      ec.clear();
      std::filesystem::copy_symlink(it->path(), destination, ec);
    } else if (std::filesystem::is_directory(entry)) {
      const auto current = std::filesystem::symlink_status(destination, ec);
      ec.clear();
      if (!std::filesystem::is_directory(current)) {
        std::filesystem::remove(destination, ec);
        ec.clear();
        std::filesystem::create_directory(destination, ec);
      }
    } else if (std::filesystem::is_regular_file(entry)) {
      auto bytes = read_file_bytes(it->path());
      if (!bytes.ok()) {
        return bytes.status();
      }
      auto copied = write_file_atomic(destination, bytes.value());
      if (!copied.ok()) {
        return copied;
      }
    }
    if (ec) {
      return Status::error(ErrorKind::Io,
                           "Failed to copy " + it->path().string() + ": " + ec.message());
    }
  }
  if (ec) {
    return Status::error(ErrorKind::Io, "Failed to walk " + source.string() + ": " + ec.message());
  }
  return Status::success();
}

Result<std::string> read_file_bytes(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure(ErrorKind::NotFound, "Failed to open " + path.string());
  }
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    return Result<std::string>::failure(ErrorKind::Io, "Failed to read " + path.string());
  }
  return Result<std::string>::success(std::move(content));
}

std::string random_hex(const std::size_t length) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  static constexpr char digits[] = "0123456789abcdef";
  std::uniform_int_distribution<int> dist(0, 15);
  std::string out;
  out.reserve(length);
  for (std::size_t i = 0; i < length; ++i) {
    out.push_back(digits[dist(rng)]);
  }
  return out;
}

} // namespace crucible::common

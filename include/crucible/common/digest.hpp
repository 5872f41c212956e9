#pragma once

#include "crucible/common/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace crucible::common {

[[nodiscard]] std::string sha256_hex(std::string_view data);
[[nodiscard]] Result<std::string> sha256_file_hex(const std::filesystem::path &path);

[[nodiscard]] std::string base64_encode(std::string_view bytes);
[[nodiscard]] Result<std::string> base64_decode(std::string_view text);

} // namespace crucible::common

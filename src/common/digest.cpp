#include "crucible/common/digest.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <array>
#include <fstream>
#include <memory>

namespace crucible::common {

namespace {

std::string to_hex(const unsigned char *bytes, const std::size_t size) {
  static constexpr char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(digits[bytes[i] >> 4]);
    out.push_back(digits[bytes[i] & 0x0f]);
  }
  return out;
}

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

} // namespace

std::string sha256_hex(const std::string_view data) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(data.data()), data.size(), digest);
  return to_hex(digest, SHA256_DIGEST_LENGTH);
}

Result<std::string> sha256_file_hex(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure(ErrorKind::Io, "Failed to open " + path.string());
  }

  DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    return Result<std::string>::failure(ErrorKind::Io, "Failed to initialize sha256");
  }

  std::array<char, 16384> chunk{};
  while (in) {
    in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    const auto count = in.gcount();
    if (count > 0 &&
        EVP_DigestUpdate(ctx.get(), chunk.data(), static_cast<std::size_t>(count)) != 1) {
      return Result<std::string>::failure(ErrorKind::Io, "Failed to hash " + path.string());
    }
  }
  if (in.bad()) {
    return Result<std::string>::failure(ErrorKind::Io, "Failed to read " + path.string());
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
    return Result<std::string>::failure(ErrorKind::Io, "Failed to finalize sha256");
  }
  return Result<std::string>::success(to_hex(digest, length));
}

std::string base64_encode(const std::string_view bytes) {
  if (bytes.empty()) {
    return "";
  }
  std::string output(4 * ((bytes.size() + 2) / 3), '\0');
  EVP_EncodeBlock(reinterpret_cast<unsigned char *>(output.data()),
                  reinterpret_cast<const unsigned char *>(bytes.data()),
                  static_cast<int>(bytes.size()));
  return output;
}

Result<std::string> base64_decode(const std::string_view text) {
  if (text.empty()) {
    return Result<std::string>::success("");
  }
  if (text.size() % 4 != 0) {
    return Result<std::string>::failure(ErrorKind::Configuration, "Invalid base64 input");
  }

  std::string decoded(text.size() / 4 * 3, '\0');
  const int len = EVP_DecodeBlock(reinterpret_cast<unsigned char *>(decoded.data()),
                                  reinterpret_cast<const unsigned char *>(text.data()),
                                  static_cast<int>(text.size()));
  if (len < 0) {
    return Result<std::string>::failure(ErrorKind::Configuration, "Invalid base64 input");
  }

  // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
  std::size_t padding = 0;
  if (text.back() == '=') {
    ++padding;
  }
  if (text.size() > 1 && text[text.size() - 2] == '=') {
    ++padding;
  }
  decoded.resize(static_cast<std::size_t>(len) - padding);
  return Result<std::string>::success(std::move(decoded));
}

} // namespace crucible::common

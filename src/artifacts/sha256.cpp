#include "artifacts/sha256.hpp"

#include <openssl/evp.h>

#include <array>
#include <cstddef>
#include <fstream>
#include <memory>

namespace relsync::artifacts {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

constexpr std::size_t kReadChunkBytes = 64U * 1024U;

std::string ToHex(const unsigned char* bytes, const unsigned int length) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(static_cast<std::size_t>(length) * 2U);
  for (unsigned int i = 0; i < length; ++i) {
    hex.push_back(kDigits[bytes[i] >> 4U]);
    hex.push_back(kDigits[bytes[i] & 0x0FU]);
  }
  return hex;
}

bool FinishDigest(EVP_MD_CTX* context, std::string& hex_digest, std::string& error) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int length = 0;
  if (EVP_DigestFinal_ex(context, digest.data(), &length) != 1) {
    error = "EVP_DigestFinal_ex failed";
    return false;
  }
  hex_digest = ToHex(digest.data(), length);
  return true;
}

} // namespace

bool ComputeFileSha256(const std::filesystem::path& path, std::string& hex_digest,
                       std::string& error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "unable to open file for hashing: " + path.string();
    return false;
  }

  DigestContext context(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!context || EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1) {
    error = "unable to initialize SHA-256 digest";
    return false;
  }

  std::array<char, kReadChunkBytes> buffer{};
  while (file) {
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize read = file.gcount();
    if (read > 0 &&
        EVP_DigestUpdate(context.get(), buffer.data(), static_cast<std::size_t>(read)) != 1) {
      error = "EVP_DigestUpdate failed for " + path.string();
      return false;
    }
  }
  if (file.bad()) {
    error = "failed while reading file for hashing: " + path.string();
    return false;
  }

  return FinishDigest(context.get(), hex_digest, error);
}

std::string ComputeSha256(std::string_view data) {
  DigestContext context(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  std::string hex_digest;
  std::string error;
  if (!context || EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(context.get(), data.data(), data.size()) != 1 ||
      !FinishDigest(context.get(), hex_digest, error)) {
    return {};
  }
  return hex_digest;
}

} // namespace relsync::artifacts

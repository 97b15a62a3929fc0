#include "distpack/hash.hpp"
#include "distpack/consts.hpp"

#include <memory>
#include <openssl/evp.h> // EVP_* digest API
#include <stdexcept>

namespace distpack {

namespace {

using md_ctx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

} // namespace

digest sha256(std::span<const std::uint8_t> data) {
  md_ctx ctx{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
  if (!ctx)
    throw std::runtime_error("EVP_MD_CTX_new failed");

  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
    throw std::runtime_error("EVP_DigestInit_ex(EVP_sha256) failed");
  if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1)
    throw std::runtime_error("EVP_DigestUpdate failed");

  digest out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1 || len != consts::kDigestRawLen)
    throw std::runtime_error("EVP_DigestFinal_ex(EVP_sha256) failed");
  return out;
}

std::string to_hex(const digest &d) {
  static constexpr std::string_view kHex = "0123456789abcdef";
  std::string s;
  s.reserve(consts::kDigestHexLen);
  for (const std::uint8_t b : d) {
    s.push_back(kHex[b >> 4]);
    s.push_back(kHex[b & 0xF]);
  }
  return s;
}

} // namespace distpack

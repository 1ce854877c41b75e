#include "zit/hash.hpp"
#include "zit/consts.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <openssl/evp.h>
#include <stdexcept>

namespace zit {

namespace {

struct MdCtxFree {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxFree>;

} // namespace

oid sha1(std::string_view data) {
  const MdCtx ctx{EVP_MD_CTX_new()};
  if (!ctx) {
    throw std::runtime_error("sha1: EVP_MD_CTX_new failed");
  }
  oid out{};
  unsigned int len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1 || len != out.size()) {
    throw std::runtime_error("sha1: digest computation failed");
  }
  return out;
}

std::string to_hex(const oid &id) {
  constexpr std::string_view kDigits = "0123456789abcdef";
  std::string s;
  s.reserve(consts::kOidHexLen);
  for (const std::uint8_t byte : id) {
    s.push_back(kDigits[byte >> 4]);
    s.push_back(kDigits[byte & 0x0f]);
  }
  return s;
}

bool looks_hex40(std::string_view str) {
  return str.size() == consts::kOidHexLen &&
         std::ranges::all_of(str, [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

} // namespace zit

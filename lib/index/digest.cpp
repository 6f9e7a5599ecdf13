// metadoc/index/digest.cpp - SHA-512 symbol names (OpenSSL EVP)
//
#include "metadoc/index/digest.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace metadoc
{

namespace
{

struct MdCtxDeleter
{
  void operator()(EVP_MD_CTX * ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

}  // namespace

std::string encode_symbol_name(std::string_view symbol)
{
  const MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (
    EVP_DigestInit_ex(ctx.get(), EVP_sha512(), nullptr) != 1 ||
    EVP_DigestUpdate(ctx.get(), symbol.data(), symbol.size()) != 1 ||
    EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
    throw std::runtime_error("SHA-512 digest failed");
  }

  static constexpr char k_hex[] = "0123456789abcdef";
  std::string out;
  out.reserve(static_cast<size_t>(len) * 2);
  for (unsigned int i = 0; i < len; ++i) {
    out.push_back(k_hex[digest[i] >> 4]);
    out.push_back(k_hex[digest[i] & 0x0F]);
  }
  return out;
}

}  // namespace metadoc

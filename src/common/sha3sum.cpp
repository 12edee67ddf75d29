#include "sha3sum.h"
#include <memory>
#include <stdexcept>
#include "crypto/hash.h"

extern "C" {
#include <openssl/evp.h>
}

namespace tools {

  namespace {
    struct md_ctx_free {
      void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
    };
  }

  bool sha3_512_str(std::string_view data, crypto::hash512 &hash)
  {
    std::unique_ptr<EVP_MD_CTX, md_ctx_free> ctx{EVP_MD_CTX_new()};
    if (!ctx)
      return false;
    if (!EVP_DigestInit_ex(ctx.get(), EVP_sha3_512(), nullptr))
      return false;
    if (!EVP_DigestUpdate(ctx.get(), data.data(), data.size()))
      return false;
    unsigned int len = 0;
    if (!EVP_DigestFinal_ex(ctx.get(), hash.data, &len))
      return false;
    return len == sizeof(hash.data);
  }

  crypto::hash512 sha3_512(std::string_view data)
  {
    crypto::hash512 h;
    if (!sha3_512_str(data, h))
      throw std::runtime_error{"SHA3-512 digest computation failed"};
    return h;
  }

}

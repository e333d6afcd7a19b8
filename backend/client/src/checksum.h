#ifndef CONVERTHUB_CLIENT_CHECKSUM_H
#define CONVERTHUB_CLIENT_CHECKSUM_H

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include <openssl/evp.h>

namespace converthub::client {

// Incremental SHA-256. HexDigest() may be taken at any point without ending the stream.
class Sha256 {
 public:
  Sha256();

  void Update(const char *data, std::size_t length);
  void Update(std::string_view data) { Update(data.data(), data.size()); }
  std::string HexDigest() const;

  static std::string Hex(std::string_view data);

 private:
  struct CtxDeleter {
    void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
  };

  std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
};

std::string ToHex(const unsigned char *data, std::size_t length);

}  // namespace converthub::client

#endif  // CONVERTHUB_CLIENT_CHECKSUM_H

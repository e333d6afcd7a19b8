#include "checksum.h"

#include <stdexcept>

namespace converthub::client {

std::string ToHex(const unsigned char *data, std::size_t length) {
  static const char *kHex = "0123456789abcdef";
  std::string output;
  output.reserve(length * 2);
  for (std::size_t i = 0; i < length; ++i) {
    output.push_back(kHex[data[i] >> 4]);
    output.push_back(kHex[data[i] & 0x0F]);
  }
  return output;
}

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("sha256_init_failed");
  }
}

void Sha256::Update(const char *data, std::size_t length) {
  if (length == 0) {
    return;
  }
  if (EVP_DigestUpdate(ctx_.get(), data, length) != 1) {
    throw std::runtime_error("sha256_update_failed");
  }
}

std::string Sha256::HexDigest() const {
  std::unique_ptr<EVP_MD_CTX, CtxDeleter> copy(EVP_MD_CTX_new());
  if (!copy || EVP_MD_CTX_copy_ex(copy.get(), ctx_.get()) != 1) {
    throw std::runtime_error("sha256_copy_failed");
  }
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (EVP_DigestFinal_ex(copy.get(), digest, &length) != 1) {
    throw std::runtime_error("sha256_final_failed");
  }
  return ToHex(digest, length);
}

std::string Sha256::Hex(std::string_view data) {
  Sha256 hasher;
  hasher.Update(data);
  return hasher.HexDigest();
}

}  // namespace converthub::client

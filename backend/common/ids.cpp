#include "ids.hpp"
#include <cstdio>
#include <stdexcept>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <uuid/uuid.h>

namespace common {

std::string newUuid() {
  uuid_t uuid;
  uuid_generate(uuid);
  char uuid_str[37];
  uuid_unparse_lower(uuid, uuid_str);
  return uuid_str;
}

std::string sha256Hex(const std::string& data) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  auto ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr);
  EVP_DigestUpdate(ctx, data.c_str(), data.length());
  EVP_DigestFinal_ex(ctx, hash, &hash_len);
  EVP_MD_CTX_free(ctx);

  std::string hash_str;
  for (unsigned int i = 0; i < hash_len && i < SHA256_DIGEST_LENGTH; i++) {
    char hex[3];
    snprintf(hex, sizeof(hex), "%02x", hash[i]);
    hash_str += hex;
  }
  return hash_str;
}

} // namespace common

#include "internal/crypto/sha256.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <stdexcept>
#include <string>

namespace keyserver::crypto {

namespace {

std::string OpenSslError(const char* what) {
  std::string message(what);
  const unsigned long code = ERR_get_error();
  if (code != 0) {
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    message += ": ";
    message += buffer;
  }
  return message;
}

} // namespace

Sha256Digest Sha256(std::string_view data) {
  Sha256Digest digest{};
  unsigned int length = 0;
  if (EVP_Digest(data.data(), data.size(), digest.data(), &length, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error(OpenSslError("EVP_Digest sha256"));
  }
  if (length != digest.size()) {
    throw std::runtime_error("EVP_Digest sha256: unexpected digest length " + std::to_string(length));
  }
  return digest;
}

} // namespace keyserver::crypto

#include "bgcore/exchange/request_signer.hpp"

#include "bgcore/domain/errors.hpp"

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace bgcore {

std::string hmacSha256Base64(const std::string& key,
                             const std::string& message) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;

  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
           reinterpret_cast<const unsigned char*>(message.data()),
           message.size(), digest, &digest_len) == nullptr) {
    throw std::runtime_error("HMAC-SHA256 computation failed");
  }

  // base64 through a BIO chain, single line.
  BIO* b64 = BIO_new(BIO_f_base64());
  BIO* mem = BIO_new(BIO_s_mem());
  BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
  BIO_push(b64, mem);
  BIO_write(b64, digest, static_cast<int>(digest_len));
  (void)BIO_flush(b64);

  BUF_MEM* buf = nullptr;
  BIO_get_mem_ptr(mem, &buf);
  std::string encoded(buf->data, buf->length);

  BIO_free_all(b64);  // Frees mem too
  return encoded;
}

RequestSigner::RequestSigner(ExchangeSession& session)
    : session_(session) {}

std::string RequestSigner::sign(const std::string& timestamp,
                                const std::string& method,
                                const std::string& request_path,
                                const std::string& body) const {
  return hmacSha256Base64(session_.credentials().api_secret,
                          timestamp + method + request_path + body);
}

std::vector<std::string> RequestSigner::headers(
    const std::string& method, const std::string& request_path,
    const std::string& body) const {
  const std::string timestamp = std::to_string(session_.exchangeNowMs());
  const Credentials& creds = session_.credentials();

  return {
      "ACCESS-KEY: " + creds.api_key,
      "ACCESS-SIGN: " + sign(timestamp, method, request_path, body),
      "ACCESS-TIMESTAMP: " + timestamp,
      "ACCESS-PASSPHRASE: " + creds.passphrase,
      "locale: en-US",
      "Content-Type: application/json",
  };
}

std::string RequestSigner::loginSignature(
    const std::string& timestamp_sec) const {
  return sign(timestamp_sec, "GET", "/user/verify", "");
}

void RequestSigner::checkClockSkew(std::int64_t server_ms,
                                   std::int64_t local_ms,
                                   std::int64_t tolerance_ms) {
  const std::int64_t offset = server_ms - local_ms;
  session_.setClockOffsetMs(offset);

  std::cout << "[RequestSigner] Clock offset to exchange: " << offset << " ms"
            << std::endl;

  if (std::llabs(offset) > tolerance_ms) {
    throw AuthError("local clock is " + std::to_string(offset) +
                    " ms away from exchange time (tolerance " +
                    std::to_string(tolerance_ms) + " ms)");
  }
}

}  // namespace bgcore

#include "session/secret.hpp"
#include "core/logger.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <stdexcept>
#include <vector>

namespace Secret {

SessionSecret generate() {
  std::array<unsigned char, RANDOM_BYTES> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1)
    throw std::runtime_error("RAND_bytes failed to produce a session secret");

  SessionSecret result;
  result.secret = base64url_encode(bytes.data(), bytes.size());
  result.fragments = split(result.secret);
  OPENSSL_cleanse(bytes.data(), bytes.size());
  LOG(LogLevel::DEBUG, LogComponent::SESSION_SECRET,
      "Generated a " << result.secret.size() << "-character session secret.");
  return result;
}

std::array<std::string, 3> split(const std::string &secret) {
  const size_t part = secret.size() / 3;
  return {secret.substr(0, part), secret.substr(part, part),
          secret.substr(2 * part)};
}

std::string join(const std::string &first, const std::string &second,
                 const std::string &third) {
  return first + second + third;
}

std::string base64url_encode(const unsigned char *data, size_t length) {
  // EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a terminator
  std::vector<unsigned char> encoded(4 * ((length + 2) / 3) + 1);
  int written =
      EVP_EncodeBlock(encoded.data(), data, static_cast<int>(length));
  std::string text(reinterpret_cast<const char *>(encoded.data()),
                   static_cast<size_t>(written));

  while (!text.empty() && text.back() == '=')
    text.pop_back();
  for (char &c : text) {
    if (c == '+')
      c = '-';
    else if (c == '/')
      c = '_';
  }
  return text;
}

std::string hash(const std::string &secret) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_Digest(secret.data(), secret.size(), digest, &digest_len,
                 EVP_sha256(), nullptr) != 1)
    throw std::runtime_error("SHA-256 digest failed");

  static const char *hex = "0123456789abcdef";
  std::string out;
  out.reserve(digest_len * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    out.push_back(hex[digest[i] >> 4]);
    out.push_back(hex[digest[i] & 0x0F]);
  }
  return out;
}

bool verify(const std::string &candidate, const std::string &expected_hash) {
  const std::string actual = hash(candidate);
  if (actual.size() != expected_hash.size())
    return false;
  return CRYPTO_memcmp(actual.data(), expected_hash.data(), actual.size()) ==
         0;
}

} // namespace Secret

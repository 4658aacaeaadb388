#ifndef SECRET_HPP
#define SECRET_HPP

#include <array>
#include <cstddef>
#include <string>

// The plaintext unlock secret and its three custodian fragments. Exists only
// in memory for the one-time hand-off; never persisted.
struct SessionSecret {
  std::string secret;
  std::array<std::string, 3> fragments;
};

// Split-secret helpers. Fragments are plain contiguous slices of the secret,
// so any single fragment narrows a brute-force search; this is a custody
// convenience, not threshold secret sharing.
namespace Secret {

constexpr size_t RANDOM_BYTES = 32;
constexpr size_t ENCODED_LENGTH = 43; // base64url, no padding

// Throws std::runtime_error when the CSPRNG or the digest fails
SessionSecret generate();

// Lengths len/3, len/3 and the remainder (14/14/15 for a generated secret)
std::array<std::string, 3> split(const std::string &secret);
std::string join(const std::string &first, const std::string &second,
                 const std::string &third);

std::string base64url_encode(const unsigned char *data, size_t length);

// Lower-case hex SHA-256
std::string hash(const std::string &secret);

// Constant-time comparison of hash(candidate) against a stored hash
bool verify(const std::string &candidate, const std::string &expected_hash);

} // namespace Secret

#endif // SECRET_HPP

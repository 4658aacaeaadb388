#ifndef STABLE_HASH_HPP
#define STABLE_HASH_HPP

#include <cstdint>
#include <string_view>

namespace Utils {

constexpr uint64_t FNV1A_OFFSET_BASIS = 0xcbf29ce484222325ULL;
constexpr uint64_t FNV1A_PRIME = 0x100000001b3ULL;

// 64-bit FNV-1a. Identical on every platform and in every process.
inline uint64_t fnv1a_64(std::string_view data,
                         uint64_t hash = FNV1A_OFFSET_BASIS) {
  for (unsigned char c : data) {
    hash ^= static_cast<uint64_t>(c);
    hash *= FNV1A_PRIME;
  }
  return hash;
}

} // namespace Utils

#endif // STABLE_HASH_HPP

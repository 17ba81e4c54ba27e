#include <KeyHash.hpp>
#include <string.h>

namespace {
  inline uint64_t bswap64_(uint64_t v) {
    v = ((v & 0x00FF00FF00FF00FFULL) << 8)  | ((v >> 8)  & 0x00FF00FF00FF00FFULL);
    v = ((v & 0x0000FFFF0000FFFFULL) << 16) | ((v >> 16) & 0x0000FFFF0000FFFFULL);
    return (v << 32) | (v >> 32);
  }
}

namespace KeyHash {

uint64_t fnv1a64(const uint8_t* data, size_t len) {
  uint64_t h = FNV_OFFSET;
  for (size_t i = 0; i < len; ++i) {
    h ^= data[i];
    h *= FNV_PRIME;
  }
  return h;
}

uint32_t hash(const char* key, size_t len) {
  const uint64_t h = fnv1a64(reinterpret_cast<const uint8_t*>(key), len);
  return static_cast<uint32_t>(bswap64_(h));
}

uint32_t hash(const char* key) {
  return hash(key, key ? strlen(key) : 0);
}

} // namespace KeyHash

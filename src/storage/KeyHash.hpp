#ifndef KEY_HASH_H
#define KEY_HASH_H
/**
 * @file KeyHash.h
 * @brief Setting key string -> 32-bit flash map key.
 *
 * FNV-1a 64 over the key bytes, byte-swapped, low 32 bits kept.
 * Images written by the provisioning tool and by the panel agree on it,
 * so it must never change for a deployed partition.
 */

#include <stddef.h>
#include <stdint.h>

namespace KeyHash {
  static const uint64_t FNV_OFFSET = 0xcbf29ce484222325ULL;
  static const uint64_t FNV_PRIME  = 0x00000100000001b3ULL;

  uint64_t fnv1a64(const uint8_t* data, size_t len);
  uint32_t hash(const char* key, size_t len);
  uint32_t hash(const char* key);   // NUL terminated
}

#endif // KEY_HASH_H

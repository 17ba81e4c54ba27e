#include <gtest/gtest.h>
#include <FlashMap.hpp>
#include <KeyHash.hpp>
#include <SettingsKeys.hpp>
#include <set>
#include <string>

TEST(KeyHash, MatchesFnv1aByteSwapped) {
  EXPECT_EQ(KeyHash::fnv1a64(nullptr, 0), 0xcbf29ce484222325ULL);
  EXPECT_EQ(KeyHash::hash(""), 0xe49cf2cbu);
  EXPECT_EQ(KeyHash::hash("a"), 0x4cdc63afu);
  EXPECT_EQ(KeyHash::hash(KEY_ALARM_SETTINGS), 0xe3631b8du);
  EXPECT_EQ(KeyHash::hash(KEY_PERSISTED_ALARM_STATE), 0xe5710423u);
  EXPECT_EQ(KeyHash::hash(KEY_SIREN_PIN), 0xc072a2fbu);
}

TEST(KeyHash, LengthOverloadIgnoresTrailingBytes) {
  const char buf[] = "siren-pin-and-more";
  EXPECT_EQ(KeyHash::hash(buf, 9), KeyHash::hash(KEY_SIREN_PIN));
}

TEST(KeyHash, RegistryHashesAreDistinctAndUsable) {
  const char* keys[] = SETTINGS_KEY_LIST;
  std::set<uint32_t>    hashes;
  std::set<std::string> names;

  for (size_t i = 0; i < sizeof(keys) / sizeof(keys[0]); ++i) {
    const uint32_t h = KeyHash::hash(keys[i]);
    EXPECT_NE(h, 0u) << keys[i] << " hashes onto the format marker";
    EXPECT_NE(h, FlashMap::ERASED_KEY) << keys[i] << " hashes onto erased flash";
    EXPECT_TRUE(hashes.insert(h).second) << keys[i] << " collides";
    EXPECT_TRUE(names.insert(keys[i]).second) << keys[i] << " listed twice";
  }
  EXPECT_EQ(hashes.size(), 11u);
}

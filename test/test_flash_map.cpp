#include <gtest/gtest.h>
#include <FlashMap.hpp>
#include <MemFlash.hpp>
#include <map>
#include <string>
#include <vector>

namespace {

const size_t PAGE  = 256;
const size_t PAGES = 4;

struct FlashMapTest : public ::testing::Test {
  FlashMapTest() : flash(PAGE * PAGES, 4, 4, PAGE), map(flash, 0, PAGE * PAGES) {}

  MapError put(FlashMap& m, uint32_t key, const std::string& v) {
    return m.store(key, nullptr, 0, reinterpret_cast<const uint8_t*>(v.data()), v.size(),
                   scratch, sizeof(scratch));
  }
  MapError put(uint32_t key, const std::string& v) { return put(map, key, v); }

  // "" + found=false when absent
  std::string get(FlashMap& m, uint32_t key, bool* found = nullptr) {
    uint8_t buf[PAGE];
    size_t  len = 0;
    bool    hit = false;
    EXPECT_EQ(m.fetch(key, buf, sizeof(buf), len, hit), MapError::None);
    if (found) *found = hit;
    return hit ? std::string(reinterpret_cast<const char*>(buf), len) : std::string();
  }
  std::string get(uint32_t key, bool* found = nullptr) { return get(map, key, found); }

  MemFlash flash;
  FlashMap map;
  uint8_t  scratch[PAGE];
};

std::string valueFor(int i) {
  std::string v = "v" + std::to_string(i);
  v.append((size_t)(i % 13), (char)('a' + i % 26));
  return v;
}

} // namespace

TEST_F(FlashMapTest, BlankRangeHasNoKeys) {
  ASSERT_EQ(map.mount(), MapError::None);
  bool found = true;
  EXPECT_EQ(get(7, &found), "");
  EXPECT_FALSE(found);
}

TEST_F(FlashMapTest, NewestValueWinsAndSurvivesRemount) {
  ASSERT_EQ(map.format(), MapError::None);
  ASSERT_EQ(put(1, "first"), MapError::None);
  ASSERT_EQ(put(2, "other"), MapError::None);
  ASSERT_EQ(put(1, "second"), MapError::None);

  EXPECT_EQ(get(1), "second");
  EXPECT_EQ(get(2), "other");

  FlashMap again(flash, 0, PAGE * PAGES);
  ASSERT_EQ(again.mount(), MapError::None);
  EXPECT_EQ(get(again, 1), "second");
  EXPECT_EQ(get(again, 2), "other");
}

TEST_F(FlashMapTest, EmptyValueIsStoredAndFound) {
  ASSERT_EQ(map.format(), MapError::None);
  ASSERT_EQ(put(3, ""), MapError::None);
  bool found = false;
  EXPECT_EQ(get(3, &found), "");
  EXPECT_TRUE(found);
}

TEST_F(FlashMapTest, RejectsUnusableGeometry) {
  FlashMap onePage(flash, 0, PAGE);
  EXPECT_EQ(onePage.mount(), MapError::BadRange);

  FlashMap unaligned(flash, 128, 128 + 2 * PAGE);
  EXPECT_EQ(unaligned.mount(), MapError::BadRange);

  FlashMap pastEnd(flash, 0, PAGE * (PAGES + 1));
  EXPECT_EQ(pastEnd.format(), MapError::BadRange);

  ASSERT_EQ(map.format(), MapError::None);
  EXPECT_EQ(put(FlashMap::ERASED_KEY, "x"), MapError::BadRange);
}

TEST_F(FlashMapTest, SizeLimits) {
  ASSERT_EQ(map.format(), MapError::None);
  EXPECT_EQ(map.maxValueLen(), PAGE - FlashMap::PAGE_HEADER_LEN - FlashMap::REC_HEADER_LEN);
  EXPECT_EQ(map.recordSize(5), FlashMap::REC_HEADER_LEN + 8);

  EXPECT_EQ(put(1, std::string(map.maxValueLen() + 1, 'x')), MapError::Full);

  uint8_t small[16];
  const std::string v(20, 'y');
  EXPECT_EQ(map.store(1, nullptr, 0, reinterpret_cast<const uint8_t*>(v.data()), v.size(),
                      small, sizeof(small)), MapError::BufferTooSmall);

  ASSERT_EQ(put(1, v), MapError::None);
  uint8_t out[16];
  size_t  len   = 0;
  bool    found = false;
  EXPECT_EQ(map.fetch(1, out, sizeof(out), len, found), MapError::BufferTooSmall);
  EXPECT_EQ(len, 20u);
  EXPECT_FALSE(found);
}

TEST_F(FlashMapTest, PrefixIsPartOfTheValue) {
  ASSERT_EQ(map.format(), MapError::None);
  const uint8_t prefix[3] = { 'a', 'b', ':' };
  const uint8_t data[2]   = { 'c', 'd' };
  ASSERT_EQ(map.store(9, prefix, sizeof(prefix), data, sizeof(data), scratch, sizeof(scratch)),
            MapError::None);
  EXPECT_EQ(get(9), "ab:cd");
}

TEST_F(FlashMapTest, OverwritesCompactForever) {
  ASSERT_EQ(map.format(), MapError::None);
  std::map<uint32_t, std::string> expect;

  for (int i = 0; i < 600; ++i) {
    const uint32_t key = 1 + (uint32_t)(i % 5);
    const std::string v = valueFor(i);
    ASSERT_EQ(put(key, v), MapError::None) << "iteration " << i;
    expect[key] = v;
  }
  EXPECT_GT(flash.eraseCount(), PAGES);

  for (std::map<uint32_t, std::string>::const_iterator it = expect.begin(); it != expect.end(); ++it) {
    EXPECT_EQ(get(it->first), it->second);
  }

  FlashMap again(flash, 0, PAGE * PAGES);
  ASSERT_EQ(again.mount(), MapError::None);
  for (std::map<uint32_t, std::string>::const_iterator it = expect.begin(); it != expect.end(); ++it) {
    EXPECT_EQ(get(again, it->first), it->second);
  }
}

TEST_F(FlashMapTest, FullKeepsEverythingAlreadyStored) {
  ASSERT_EQ(map.format(), MapError::None);
  const std::string v(40, 'z');

  uint32_t stored = 0;
  MapError e = MapError::None;
  for (uint32_t key = 1; key < 100; ++key) {
    e = put(key, v);
    if (e != MapError::None) break;
    stored = key;
  }
  EXPECT_EQ(e, MapError::Full);
  ASSERT_GT(stored, 0u);

  for (uint32_t key = 1; key <= stored; ++key) EXPECT_EQ(get(key), v) << key;

  // overwriting a key in a full map still fails cleanly
  EXPECT_EQ(put(1, std::string(40, 'q')), MapError::Full);
  EXPECT_EQ(get(1), v);
}

TEST_F(FlashMapTest, TornWriteKeepsPreviousValue) {
  ASSERT_EQ(map.format(), MapError::None);
  ASSERT_EQ(put(5, "stable"), MapError::None);

  flash.armPowerCut(10);
  EXPECT_EQ(put(5, "replacement"), MapError::Storage);
  EXPECT_EQ(map.lastFlashError(), FlashError::BadWrite);
  flash.disarmPowerCut();

  FlashMap again(flash, 0, PAGE * PAGES);
  ASSERT_EQ(again.mount(), MapError::None);
  EXPECT_EQ(get(again, 5), "stable");

  ASSERT_EQ(put(again, 5, "after"), MapError::None);
  EXPECT_EQ(get(again, 5), "after");
}

TEST_F(FlashMapTest, GarbageHeaderIsErasedBeforeReuse) {
  // a page whose header is neither erased nor ours
  flash.image()[PAGE + 4] = 0x12;
  ASSERT_EQ(map.mount(), MapError::None);

  for (int i = 0; i < 200; ++i) {
    ASSERT_EQ(put(1 + (uint32_t)(i % 3), valueFor(i)), MapError::None) << i;
  }
  EXPECT_EQ(get(1 + (uint32_t)(199 % 3)), valueFor(199));
}

TEST_F(FlashMapTest, TwoOpenPagesAreCorrupt) {
  ASSERT_EQ(map.format(), MapError::None);
  ASSERT_EQ(put(1, "a"), MapError::None);

  // forge a second open page with a different sequence number
  std::vector<uint8_t>& img = flash.image();
  const uint8_t header[8] = { 9, 0, 0, 0, 0x31, 0x4D, 0x53, 0x50 };
  for (int i = 0; i < 8; ++i) img[3 * PAGE + i] = header[i];

  FlashMap again(flash, 0, PAGE * PAGES);
  EXPECT_EQ(again.mount(), MapError::Corrupted);
}

// Cut the power at many points of a write-heavy run, then check that the
// remounted map holds either the acknowledged value or the one being
// written when the power went, and still accepts writes. A cut that lands
// after the last value byte leaves a complete record: the write happened,
// only its acknowledgement was lost.
TEST(FlashMapPowerCut, EveryCutPointRecovers) {
  for (size_t budget = 0; budget < 4000; budget += 29) {
    MemFlash flash(PAGE * PAGES, 4, 4, PAGE);
    FlashMap map(flash, 0, PAGE * PAGES);
    uint8_t  scratch[PAGE];
    ASSERT_EQ(map.format(), MapError::None);

    std::map<uint32_t, std::string> acked;
    std::map<uint32_t, std::string> inFlight;
    flash.armPowerCut(budget);
    for (int i = 0; i < 400; ++i) {
      const uint32_t key = 1 + (uint32_t)(i % 3);
      const std::string v = valueFor(i);
      MapError e = map.store(key, nullptr, 0, reinterpret_cast<const uint8_t*>(v.data()), v.size(),
                             scratch, sizeof(scratch));
      if (e != MapError::None) {
        inFlight[key] = v;
        break;
      }
      acked[key] = v;
    }
    flash.disarmPowerCut();

    FlashMap again(flash, 0, PAGE * PAGES);
    ASSERT_EQ(again.mount(), MapError::None) << "budget " << budget;

    for (uint32_t key = 1; key <= 3; ++key) {
      uint8_t buf[PAGE];
      size_t  len   = 0;
      bool    found = false;
      ASSERT_EQ(again.fetch(key, buf, sizeof(buf), len, found), MapError::None);
      std::map<uint32_t, std::string>::const_iterator a = acked.find(key);
      std::map<uint32_t, std::string>::const_iterator f = inFlight.find(key);
      if (!found) {
        EXPECT_TRUE(a == acked.end()) << "budget " << budget << " key " << key << " lost";
        continue;
      }
      const std::string got(reinterpret_cast<const char*>(buf), len);
      const bool isAcked    = a != acked.end() && got == a->second;
      const bool isInFlight = f != inFlight.end() && got == f->second;
      EXPECT_TRUE(isAcked || isInFlight)
          << "budget " << budget << " key " << key << " read back '" << got << "'";
    }

    const std::string v = "fresh";
    EXPECT_EQ(again.store(2, nullptr, 0, reinterpret_cast<const uint8_t*>(v.data()), v.size(),
                          scratch, sizeof(scratch)), MapError::None) << "budget " << budget;
  }
}

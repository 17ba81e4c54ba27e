#include <gtest/gtest.h>
#include <MemFlash.hpp>
#include <cstdio>
#include <string>

TEST(MemFlash, StartsErasedAndProgramsByClearingBits) {
  MemFlash f(1024, 4, 4, 256);
  uint8_t b[4];
  ASSERT_EQ(f.read(0, b, 4), FlashError::None);
  for (int i = 0; i < 4; ++i) EXPECT_EQ(b[i], 0xFF);

  const uint8_t lo[4] = { 0x0F, 0x0F, 0xFF, 0xFF };
  const uint8_t hi[4] = { 0xF0, 0xFF, 0xF0, 0xFF };
  ASSERT_EQ(f.write(8, lo, 4), FlashError::None);
  ASSERT_EQ(f.write(8, hi, 4), FlashError::None);
  ASSERT_EQ(f.read(8, b, 4), FlashError::None);
  EXPECT_EQ(b[0], 0x00);
  EXPECT_EQ(b[1], 0x0F);
  EXPECT_EQ(b[2], 0xF0);
  EXPECT_EQ(b[3], 0xFF);

  ASSERT_EQ(f.erase(0, 256), FlashError::None);
  ASSERT_EQ(f.read(8, b, 4), FlashError::None);
  EXPECT_EQ(b[0], 0xFF);
  EXPECT_EQ(f.eraseCount(), 1u);
  EXPECT_EQ(f.writeCount(), 2u);
}

TEST(MemFlash, EnforcesAlignmentAndBounds) {
  MemFlash f(1024, 4, 4, 256);
  uint8_t b[8] = { 0 };
  EXPECT_EQ(f.read(2, b, 4), FlashError::NotAligned);
  EXPECT_EQ(f.read(0, b, 3), FlashError::NotAligned);
  EXPECT_EQ(f.write(6, b, 4), FlashError::NotAligned);
  EXPECT_EQ(f.erase(128, 256), FlashError::NotAligned);
  EXPECT_EQ(f.read(1024, b, 4), FlashError::OutOfBounds);
  EXPECT_EQ(f.write(1020, b, 8), FlashError::OutOfBounds);
  EXPECT_EQ(f.erase(768, 1280), FlashError::OutOfBounds);
}

TEST(MemFlash, PowerCutLandsOnlyThePrefix) {
  MemFlash f(1024, 4, 4, 256);
  const uint8_t data[8] = { 1, 2, 3, 4, 5, 6, 7, 8 };

  f.armPowerCut(6);
  EXPECT_EQ(f.write(0, data, 8), FlashError::BadWrite);
  EXPECT_TRUE(f.powerCutTripped());
  EXPECT_EQ(f.write(16, data, 4), FlashError::BadWrite);
  EXPECT_EQ(f.erase(0, 256), FlashError::BadWrite);

  const std::vector<uint8_t>& img = f.image();
  EXPECT_EQ(img[5], 6);
  EXPECT_EQ(img[6], 0xFF);
  EXPECT_EQ(img[16], 0xFF);

  f.disarmPowerCut();
  EXPECT_EQ(f.write(16, data, 4), FlashError::None);
  EXPECT_EQ(f.image()[16], 1);
}

TEST(MemFlash, ImageFileRoundTrip) {
  const std::string path = ::testing::TempDir() + "memflash_image.bin";
  MemFlash a(512, 4, 4, 256);
  const uint8_t data[4] = { 0xDE, 0xAD, 0xBE, 0xEF };
  ASSERT_EQ(a.write(260, data, 4), FlashError::None);
  ASSERT_TRUE(a.saveFile(path));

  MemFlash b(512, 4, 4, 256);
  ASSERT_TRUE(b.loadFile(path));
  EXPECT_EQ(a.image(), b.image());
  std::remove(path.c_str());

  EXPECT_FALSE(b.loadFile(path));
}

#include <MemFlash.hpp>
#include <Utils.hpp>
#include <algorithm>
#include <stdio.h>
#include <string.h>

MemFlash::MemFlash(size_t capacity, size_t readSize, size_t writeSize, size_t eraseSize)
: image_(capacity, 0xFF),
  readSize_(readSize ? readSize : 1),
  writeSize_(writeSize ? writeSize : 1),
  eraseSize_(eraseSize ? eraseSize : 1) {}

bool MemFlash::inRange_(uint32_t offset, size_t len) const {
    return offset <= image_.size() && len <= image_.size() - offset;
}

// ======================================================
// NorFlash
// ======================================================
FlashError MemFlash::read(uint32_t offset, uint8_t* out, size_t len) {
    if ((offset % readSize_) || (len % readSize_)) return FlashError::NotAligned;
    if (!inRange_(offset, len))                    return FlashError::OutOfBounds;
    if (len) memcpy(out, &image_[offset], len);
    return FlashError::None;
}

FlashError MemFlash::write(uint32_t offset, const uint8_t* data, size_t len) {
    if ((offset % writeSize_) || (len % writeSize_)) return FlashError::NotAligned;
    if (!inRange_(offset, len))                      return FlashError::OutOfBounds;
    if (tripped_)                                    return FlashError::BadWrite;

    size_t n = len;
    if (cutArmed_ && n > budget_) {
        n = budget_;
        tripped_ = true;
    }
    for (size_t i = 0; i < n; ++i) image_[offset + i] &= data[i];
    if (cutArmed_) budget_ -= n;
    writes_++;

    return tripped_ ? FlashError::BadWrite : FlashError::None;
}

FlashError MemFlash::erase(uint32_t from, uint32_t to) {
    if (to < from)                                   return FlashError::OutOfBounds;
    if ((from % eraseSize_) || (to % eraseSize_))    return FlashError::NotAligned;
    if (!inRange_(from, to - from))                  return FlashError::OutOfBounds;
    if (tripped_)                                    return FlashError::BadWrite;

    memset(&image_[from], 0xFF, to - from);
    erases_ += (to - from) / eraseSize_;
    return FlashError::None;
}

// ======================================================
// Power-cut injection
// ======================================================
void MemFlash::armPowerCut(size_t bytes) {
    cutArmed_ = true;
    tripped_  = false;
    budget_   = bytes;
}

void MemFlash::disarmPowerCut() {
    cutArmed_ = false;
    tripped_  = false;
    budget_   = 0;
}

// ======================================================
// Image file I/O
// ======================================================
bool MemFlash::loadFile(const std::string& path) {
    FILE* f = fopen(path.c_str(), "rb");
    if (!f) {
        DBG_PRINTF("[MemFlash] open %s failed\n", path.c_str());
        return false;
    }
    std::fill(image_.begin(), image_.end(), 0xFF);
    size_t n = fread(image_.data(), 1, image_.size(), f);
    fclose(f);
    DBG_PRINTF("[MemFlash] loaded %u bytes from %s\n", (unsigned)n, path.c_str());
    return true;
}

bool MemFlash::saveFile(const std::string& path) const {
    FILE* f = fopen(path.c_str(), "wb");
    if (!f) {
        DBG_PRINTF("[MemFlash] create %s failed\n", path.c_str());
        return false;
    }
    size_t n = fwrite(image_.data(), 1, image_.size(), f);
    bool ok = (n == image_.size());
    ok = (fclose(f) == 0) && ok;
    if (!ok) DBG_PRINTF("[MemFlash] short write to %s\n", path.c_str());
    return ok;
}

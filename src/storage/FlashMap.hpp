/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef FLASH_MAP_H
#define FLASH_MAP_H
/**
 * @file FlashMap.h
 * @brief Log-structured u32 key -> bytes map over a NorFlash range.
 *
 * Layout (little endian):
 *   page   = one erase block, header 16 bytes:
 *            [seq u32][magic u32][closed u32][pad u32]
 *   record = [key u32][len u16][crc16 u16] + value padded to the I/O unit
 *
 * - New records are appended to the single open page.
 * - A full page is closed and the next erased page opened with seq+1.
 * - One erased page is always kept spare. When the spare would be used,
 *   the live records of the oldest page are copied into it and the oldest
 *   page is erased (compaction).
 * - Reads walk pages newest -> oldest; the newest record with a good CRC
 *   wins, torn records are skipped.
 * - Pages with a header that is neither erased nor valid are dirty and get
 *   erased before reuse.
 *
 * Not thread-safe. SharedSettings serializes access.
 */

#include <NorFlash.hpp>
#include <vector>

enum class MapError : uint8_t {
  None          = 0,
  Corrupted     = 1,   // page states inconsistent (e.g. two open pages)
  Full          = 2,   // no room even after compaction
  BufferTooSmall= 3,   // caller buffer cannot hold the record
  Storage       = 4,   // device error, see lastFlashError()
  BadRange      = 5,   // range/geometry unusable
};

const char* mapErrorName(MapError e);

class FlashMap {
public:
  static const uint32_t PAGE_MAGIC      = 0x50534D31;   // "1MSP"
  static const uint32_t PAGE_HEADER_LEN = 16;
  static const uint32_t REC_HEADER_LEN  = 8;
  static const uint32_t ERASED_KEY      = 0xFFFFFFFF;

  FlashMap(NorFlash& flash, uint32_t start, uint32_t end);

  // Rescan the page headers. Called lazily by every operation.
  MapError mount();

  // Erase the whole range. Leaves the map mounted and empty.
  MapError format();

  // Newest value of `key`. found=false when absent. `outLen` is the value
  // length; `buf` must hold it rounded up to the I/O unit.
  MapError fetch(uint32_t key, uint8_t* buf, size_t cap,
                 size_t& outLen, bool& found);

  // Append (prefix || data) as the new value of `key`. `scratch` holds the
  // encoded record and is used as the copy buffer during compaction.
  MapError store(uint32_t key,
                 const uint8_t* prefix, size_t prefixLen,
                 const uint8_t* data, size_t len,
                 uint8_t* scratch, size_t scratchLen);

  size_t     pageCount() const    { return pageCount_; }
  size_t     pageSize() const     { return pageSize_; }
  size_t     unit() const         { return unit_; }
  size_t     maxValueLen() const;
  size_t     recordSize(size_t valueLen) const;
  FlashError lastFlashError() const { return lastFlash_; }

private:
  enum PageState : uint8_t { PAGE_ERASED = 0, PAGE_OPEN, PAGE_CLOSED, PAGE_DIRTY };

  struct Page {
    PageState state = PAGE_DIRTY;
    uint32_t  seq   = 0;
    uint32_t  used  = 0;    // write offset inside the open page
  };

  struct Record {
    uint32_t page   = 0;
    uint32_t offset = 0;    // from page start
    uint32_t key    = 0;
    uint16_t len    = 0;
    uint16_t crc    = 0;
  };

  // --- geometry ---
  uint32_t pageBase_(uint32_t page) const { return start_ + page * pageSize_; }
  uint32_t padded_(size_t len) const { return (uint32_t)((len + unit_ - 1) & ~(unit_ - 1)); }

  // --- device wrappers (record lastFlash_) ---
  MapError read_(uint32_t addr, uint8_t* out, size_t len);
  MapError write_(uint32_t addr, const uint8_t* data, size_t len);
  MapError erasePage_(uint32_t page);

  // --- page handling ---
  MapError classify_(uint32_t page);
  MapError scanUsed_(uint32_t page);
  MapError openPage_(uint32_t page);
  MapError closePage_(uint32_t page);
  MapError compactInto_(uint32_t target);
  MapError compactFrom_(uint32_t oldest);
  MapError liveBytes_(uint32_t page, size_t& bytes);
  MapError reclaimIfDead_(bool& reclaimed);
  MapError resumeCompaction_();
  void     orderedPages_(std::vector<uint32_t>& out) const;   // oldest first
  int      oldestClosed_() const;
  int      pickFree_() const;
  size_t   freeCount_() const;

  // --- record handling ---
  MapError nextRecord_(uint32_t page, uint32_t& offset, Record& rec, bool& end);
  MapError recordCrcOk_(const Record& rec, bool& ok);
  MapError locate_(uint32_t key, Record& rec, bool& found);
  MapError isLive_(const Record& rec, bool& live);
  MapError copyRecord_(const Record& rec, uint32_t target);

  NorFlash&  flash_;
  uint32_t   start_;
  uint32_t   end_;
  size_t     pageSize_  = 0;
  size_t     pageCount_ = 0;
  size_t     unit_      = 1;
  bool       geometryOk_= false;

  std::vector<Page> pages_;
  bool       mounted_   = false;
  int        open_      = -1;
  uint32_t   maxSeq_    = 0;
  FlashError lastFlash_ = FlashError::None;
};

#endif // FLASH_MAP_H

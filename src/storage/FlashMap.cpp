#include <FlashMap.hpp>
#include <Utils.hpp>
#include <algorithm>
#include <string.h>

#define COPY_CHUNK 64

// ======================================================
// helpers
// ======================================================
namespace {
  inline void put32_(uint8_t* p, uint32_t v) {
    p[0] = (uint8_t)v; p[1] = (uint8_t)(v >> 8); p[2] = (uint8_t)(v >> 16); p[3] = (uint8_t)(v >> 24);
  }
  inline void put16_(uint8_t* p, uint16_t v) {
    p[0] = (uint8_t)v; p[1] = (uint8_t)(v >> 8);
  }
  inline uint32_t get32_(const uint8_t* p) {
    return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
  }
  inline uint16_t get16_(const uint8_t* p) {
    return (uint16_t)(p[0] | (p[1] << 8));
  }

  // CRC-16/CCITT-FALSE (poly 0x1021, init 0xFFFF)
  uint16_t crc16_(uint16_t crc, const uint8_t* data, size_t len) {
    for (size_t i = 0; i < len; i++) {
      crc ^= (uint16_t)data[i] << 8;
      for (uint8_t b = 0; b < 8; b++) {
        crc = (crc & 0x8000) ? (uint16_t)((crc << 1) ^ 0x1021) : (uint16_t)(crc << 1);
      }
    }
    return crc;
  }

  uint16_t headerCrc_(uint32_t key, uint16_t len) {
    uint8_t h[6];
    put32_(h, key);
    put16_(h + 4, len);
    return crc16_(0xFFFF, h, sizeof(h));
  }

  inline bool allErased_(const uint8_t* p, size_t n) {
    for (size_t i = 0; i < n; i++) if (p[i] != 0xFF) return false;
    return true;
  }

  inline bool isPow2_(size_t v) { return v && !(v & (v - 1)); }
}

const char* mapErrorName(MapError e) {
  switch (e) {
    case MapError::None:           return "none";
    case MapError::Corrupted:      return "corrupted";
    case MapError::Full:           return "full";
    case MapError::BufferTooSmall: return "buffer-too-small";
    case MapError::Storage:        return "storage";
    case MapError::BadRange:       return "bad-range";
  }
  return "?";
}

const uint32_t FlashMap::PAGE_MAGIC;
const uint32_t FlashMap::PAGE_HEADER_LEN;
const uint32_t FlashMap::REC_HEADER_LEN;
const uint32_t FlashMap::ERASED_KEY;

// ======================================================
// ctor
// ======================================================
FlashMap::FlashMap(NorFlash& flash, uint32_t start, uint32_t end)
: flash_(flash), start_(start), end_(end) {
  pageSize_ = flash_.eraseSize();
  unit_     = std::max(flash_.readSize(), flash_.writeSize());

  geometryOk_ = isPow2_(unit_) && unit_ <= 8 &&
                pageSize_ >= 64 && (pageSize_ % unit_) == 0 &&
                end_ > start_ && end_ <= flash_.capacity() &&
                (start_ % pageSize_) == 0 && ((end_ - start_) % pageSize_) == 0;
  pageCount_ = geometryOk_ ? (end_ - start_) / pageSize_ : 0;
  if (pageCount_ < 2) geometryOk_ = false;

  if (!geometryOk_) {
    DBG_PRINTF("[FlashMap] unusable range 0x%08lx..0x%08lx (erase=%u unit=%u)\n",
               (unsigned long)start_, (unsigned long)end_,
               (unsigned)pageSize_, (unsigned)unit_);
  }
}

size_t FlashMap::maxValueLen() const {
  if (!geometryOk_) return 0;
  size_t room = pageSize_ - PAGE_HEADER_LEN - REC_HEADER_LEN;
  return std::min(room, (size_t)0xFFFE);
}

size_t FlashMap::recordSize(size_t valueLen) const {
  return REC_HEADER_LEN + padded_(valueLen);
}

// ======================================================
// device wrappers
// ======================================================
MapError FlashMap::read_(uint32_t addr, uint8_t* out, size_t len) {
  FlashError e = flash_.read(addr, out, len);
  if (e != FlashError::None) {
    lastFlash_ = e;
    DBG_PRINTF("[FlashMap] read @0x%08lx failed: %s\n", (unsigned long)addr, flashErrorName(e));
    return MapError::Storage;
  }
  return MapError::None;
}

MapError FlashMap::write_(uint32_t addr, const uint8_t* data, size_t len) {
  FlashError e = flash_.write(addr, data, len);
  if (e != FlashError::None) {
    lastFlash_ = e;
    DBG_PRINTF("[FlashMap] write @0x%08lx failed: %s\n", (unsigned long)addr, flashErrorName(e));
    return MapError::Storage;
  }
  return MapError::None;
}

MapError FlashMap::erasePage_(uint32_t page) {
  const uint32_t base = pageBase_(page);
  FlashError e = flash_.erase(base, base + pageSize_);
  if (e != FlashError::None) {
    lastFlash_ = e;
    pages_[page].state = PAGE_DIRTY;
    DBG_PRINTF("[FlashMap] erase page %u failed: %s\n", (unsigned)page, flashErrorName(e));
    return MapError::Storage;
  }
  pages_[page] = Page();
  pages_[page].state = PAGE_ERASED;
  return MapError::None;
}

// ======================================================
// mount / format
// ======================================================
MapError FlashMap::mount() {
  if (!geometryOk_) return MapError::BadRange;

  mounted_ = false;
  open_    = -1;
  maxSeq_  = 0;
  pages_.assign(pageCount_, Page());

  for (uint32_t p = 0; p < pageCount_; ++p) {
    MapError e = classify_(p);
    if (e != MapError::None) return e;
  }

  std::vector<uint32_t> order;
  orderedPages_(order);
  for (size_t i = 1; i < order.size(); ++i) {
    if (pages_[order[i]].seq == pages_[order[i - 1]].seq) {
      DBG_PRINTF("[FlashMap] duplicate page seq %lu\n", (unsigned long)pages_[order[i]].seq);
      return MapError::Corrupted;
    }
  }

  if (open_ >= 0) {
    MapError e = scanUsed_((uint32_t)open_);
    if (e != MapError::None) return e;
  }

  mounted_ = true;

  // No spare page left with an open page: a compaction was cut short.
  if (freeCount_() == 0 && open_ >= 0) {
    MapError e = resumeCompaction_();
    if (e != MapError::None) {
      mounted_ = false;
      return (e == MapError::Storage) ? e : MapError::Corrupted;
    }
  }
  return MapError::None;
}

MapError FlashMap::format() {
  if (!geometryOk_) return MapError::BadRange;

  mounted_ = false;
  FlashError e = flash_.erase(start_, end_);
  if (e != FlashError::None) {
    lastFlash_ = e;
    DBG_PRINTF("[FlashMap] format failed: %s\n", flashErrorName(e));
    return MapError::Storage;
  }

  Page blank;
  blank.state = PAGE_ERASED;
  pages_.assign(pageCount_, blank);
  open_    = -1;
  maxSeq_  = 0;
  mounted_ = true;
  return MapError::None;
}

// ======================================================
// page handling
// ======================================================
MapError FlashMap::classify_(uint32_t page) {
  uint8_t h[PAGE_HEADER_LEN];
  const uint32_t base = pageBase_(page);
  MapError e = read_(base, h, sizeof(h));
  if (e != MapError::None) return e;

  Page& pg = pages_[page];

  if (allErased_(h, sizeof(h))) {
    uint8_t chunk[COPY_CHUNK];
    for (uint32_t off = PAGE_HEADER_LEN; off < pageSize_; off += COPY_CHUNK) {
      size_t n = std::min((size_t)COPY_CHUNK, pageSize_ - off);
      e = read_(base + off, chunk, n);
      if (e != MapError::None) return e;
      if (!allErased_(chunk, n)) {
        pg.state = PAGE_DIRTY;
        return MapError::None;
      }
    }
    pg.state = PAGE_ERASED;
    return MapError::None;
  }

  if (get32_(h + 4) != PAGE_MAGIC) {
    pg.state = PAGE_DIRTY;
    return MapError::None;
  }

  pg.seq = get32_(h);
  // Any programmed bit in the closed word counts: a torn close is still a close.
  if (get32_(h + 8) == 0xFFFFFFFF) {
    if (open_ >= 0) {
      DBG_PRINTF("[FlashMap] pages %d and %u are both open\n", open_, (unsigned)page);
      return MapError::Corrupted;
    }
    pg.state = PAGE_OPEN;
    open_ = (int)page;
  } else {
    pg.state = PAGE_CLOSED;
    pg.used  = pageSize_;
  }
  if (pg.seq > maxSeq_) maxSeq_ = pg.seq;
  return MapError::None;
}

MapError FlashMap::scanUsed_(uint32_t page) {
  uint32_t off = PAGE_HEADER_LEN;
  Record   rec;
  bool     end = false;
  while (!end) {
    MapError e = nextRecord_(page, off, rec, end);
    if (e != MapError::None) return e;
  }
  pages_[page].used = off;
  return MapError::None;
}

MapError FlashMap::openPage_(uint32_t page) {
  if (pages_[page].state == PAGE_DIRTY) {
    MapError e = erasePage_(page);
    if (e != MapError::None) return e;
  }

  const uint32_t seq = maxSeq_ + 1;
  uint8_t h[PAGE_HEADER_LEN];
  memset(h, 0xFF, sizeof(h));
  put32_(h, seq);
  put32_(h + 4, PAGE_MAGIC);

  MapError e = write_(pageBase_(page), h, sizeof(h));
  if (e != MapError::None) {
    pages_[page].state = PAGE_DIRTY;
    return e;
  }

  pages_[page].state = PAGE_OPEN;
  pages_[page].seq   = seq;
  pages_[page].used  = PAGE_HEADER_LEN;
  open_   = (int)page;
  maxSeq_ = seq;
  return MapError::None;
}

MapError FlashMap::closePage_(uint32_t page) {
  uint8_t w[8];
  put32_(w, 0);
  put32_(w + 4, 0xFFFFFFFF);

  MapError e = write_(pageBase_(page) + 8, w, sizeof(w));
  if (e != MapError::None) {
    mounted_ = false;   // rescan on next call
    return e;
  }
  pages_[page].state = PAGE_CLOSED;
  pages_[page].used  = pageSize_;
  if (open_ == (int)page) open_ = -1;
  return MapError::None;
}

MapError FlashMap::compactInto_(uint32_t target) {
  int oldest = oldestClosed_();
  if (oldest < 0) return MapError::Corrupted;

  MapError e = openPage_(target);
  if (e != MapError::None) return e;
  return compactFrom_((uint32_t)oldest);
}

// Copy every live record of `oldest` into the open page, then erase it.
MapError FlashMap::compactFrom_(uint32_t oldest) {
  if (open_ < 0) return MapError::Corrupted;

  uint32_t off = PAGE_HEADER_LEN;
  Record   rec;
  bool     end = false;
  uint16_t moved = 0;

  for (;;) {
    MapError e = nextRecord_(oldest, off, rec, end);
    if (e != MapError::None) return e;
    if (end) break;

    bool live = false;
    e = isLive_(rec, live);
    if (e != MapError::None) return e;
    if (!live) continue;

    e = copyRecord_(rec, (uint32_t)open_);
    if (e != MapError::None) return e;
    moved++;
  }

  DBG_PRINTF("[FlashMap] compacted page %u -> %d (%u live)\n",
             (unsigned)oldest, open_, (unsigned)moved);
  return erasePage_(oldest);
}

MapError FlashMap::liveBytes_(uint32_t page, size_t& bytes) {
  bytes = 0;
  uint32_t off = PAGE_HEADER_LEN;
  Record   rec;
  bool     end = false;
  for (;;) {
    MapError e = nextRecord_(page, off, rec, end);
    if (e != MapError::None) return e;
    if (end) break;

    bool live = false;
    e = isLive_(rec, live);
    if (e != MapError::None) return e;
    if (live) bytes += recordSize(rec.len);
  }
  return MapError::None;
}

MapError FlashMap::reclaimIfDead_(bool& reclaimed) {
  reclaimed = false;
  int oldest = oldestClosed_();
  if (oldest < 0) return MapError::None;

  size_t bytes = 0;
  MapError e = liveBytes_((uint32_t)oldest, bytes);
  if (e != MapError::None) return e;
  if (bytes) return MapError::None;

  e = erasePage_((uint32_t)oldest);
  if (e == MapError::None) reclaimed = true;
  return e;
}

MapError FlashMap::resumeCompaction_() {
  int oldest = oldestClosed_();
  if (oldest < 0) return MapError::Corrupted;
  DBG_PRINTF("[FlashMap] resuming compaction of page %d\n", oldest);
  return compactFrom_((uint32_t)oldest);
}

void FlashMap::orderedPages_(std::vector<uint32_t>& out) const {
  out.clear();
  for (uint32_t p = 0; p < pageCount_; ++p) {
    if (pages_[p].state == PAGE_OPEN || pages_[p].state == PAGE_CLOSED) out.push_back(p);
  }
  std::sort(out.begin(), out.end(), [this](uint32_t a, uint32_t b) {
    return pages_[a].seq < pages_[b].seq;
  });
}

int FlashMap::oldestClosed_() const {
  int best = -1;
  for (uint32_t p = 0; p < pageCount_; ++p) {
    if (pages_[p].state != PAGE_CLOSED) continue;
    if (best < 0 || pages_[p].seq < pages_[best].seq) best = (int)p;
  }
  return best;
}

// First free page after the newest one, wrapping around. Page 0 on an
// empty range.
int FlashMap::pickFree_() const {
  uint32_t first = 0;
  uint32_t bestSeq = 0;
  bool     any = false;
  for (uint32_t p = 0; p < pageCount_; ++p) {
    if ((pages_[p].state == PAGE_OPEN || pages_[p].state == PAGE_CLOSED) && (!any || pages_[p].seq >= bestSeq)) {
      bestSeq = pages_[p].seq;
      first   = (p + 1) % pageCount_;
      any     = true;
    }
  }
  for (uint32_t i = 0; i < pageCount_; ++i) {
    uint32_t p = (first + i) % pageCount_;
    if (pages_[p].state == PAGE_ERASED || pages_[p].state == PAGE_DIRTY) return (int)p;
  }
  return -1;
}

size_t FlashMap::freeCount_() const {
  size_t n = 0;
  for (uint32_t p = 0; p < pageCount_; ++p) {
    if (pages_[p].state == PAGE_ERASED || pages_[p].state == PAGE_DIRTY) n++;
  }
  return n;
}

// ======================================================
// record handling
// ======================================================
MapError FlashMap::nextRecord_(uint32_t page, uint32_t& offset, Record& rec, bool& end) {
  end = false;
  if (offset + REC_HEADER_LEN > pageSize_) {
    end = true;
    return MapError::None;
  }

  uint8_t h[REC_HEADER_LEN];
  MapError e = read_(pageBase_(page) + offset, h, sizeof(h));
  if (e != MapError::None) return e;

  if (allErased_(h, sizeof(h))) {
    end = true;                 // write position of this page
    return MapError::None;
  }

  const uint16_t len = get16_(h + 4);
  if (len > maxValueLen() || offset + recordSize(len) > pageSize_) {
    end    = true;              // garbage length: the tail is unusable
    offset = (uint32_t)pageSize_;
    return MapError::None;
  }

  rec.page   = page;
  rec.offset = offset;
  rec.key    = get32_(h);
  rec.len    = len;
  rec.crc    = get16_(h + 6);
  offset += (uint32_t)recordSize(len);
  return MapError::None;
}

MapError FlashMap::recordCrcOk_(const Record& rec, bool& ok) {
  ok = false;
  uint16_t crc = headerCrc_(rec.key, rec.len);

  uint8_t  chunk[COPY_CHUNK];
  const uint32_t base  = pageBase_(rec.page) + rec.offset + REC_HEADER_LEN;
  const uint32_t total = padded_(rec.len);
  for (uint32_t pos = 0; pos < total; pos += COPY_CHUNK) {
    size_t n = std::min((size_t)COPY_CHUNK, (size_t)(total - pos));
    MapError e = read_(base + pos, chunk, n);
    if (e != MapError::None) return e;
    size_t dataN = (pos >= rec.len) ? 0 : std::min(n, (size_t)(rec.len - pos));
    crc = crc16_(crc, chunk, dataN);
  }
  ok = (crc == rec.crc);
  return MapError::None;
}

MapError FlashMap::locate_(uint32_t key, Record& out, bool& found) {
  found = false;
  std::vector<uint32_t> order;
  orderedPages_(order);

  for (size_t i = order.size(); i-- > 0; ) {
    const uint32_t page = order[i];
    uint32_t off = PAGE_HEADER_LEN;
    Record   rec;
    bool     end = false;
    bool     hit = false;

    for (;;) {
      MapError e = nextRecord_(page, off, rec, end);
      if (e != MapError::None) return e;
      if (end) break;
      if (rec.key != key) continue;

      bool ok = false;
      e = recordCrcOk_(rec, ok);
      if (e != MapError::None) return e;
      if (!ok) continue;        // torn write
      out = rec;
      hit = true;
    }
    if (hit) {
      found = true;
      return MapError::None;
    }
  }
  return MapError::None;
}

MapError FlashMap::isLive_(const Record& rec, bool& live) {
  live = false;
  Record newest;
  bool   found = false;
  MapError e = locate_(rec.key, newest, found);
  if (e != MapError::None) return e;
  live = found && newest.page == rec.page && newest.offset == rec.offset;
  return MapError::None;
}

MapError FlashMap::copyRecord_(const Record& rec, uint32_t target) {
  const uint32_t total = (uint32_t)recordSize(rec.len);
  Page& dst = pages_[target];
  if (dst.used + total > pageSize_) return MapError::Full;

  uint8_t chunk[COPY_CHUNK];
  const uint32_t src = pageBase_(rec.page) + rec.offset;
  const uint32_t out = pageBase_(target) + dst.used;
  for (uint32_t pos = 0; pos < total; pos += COPY_CHUNK) {
    size_t n = std::min((size_t)COPY_CHUNK, (size_t)(total - pos));
    MapError e = read_(src + pos, chunk, n);
    if (e != MapError::None) return e;
    e = write_(out + pos, chunk, n);
    if (e != MapError::None) {
      dst.used = (uint32_t)pageSize_;
      return e;
    }
  }
  dst.used += total;
  return MapError::None;
}

// ======================================================
// public ops
// ======================================================
MapError FlashMap::fetch(uint32_t key, uint8_t* buf, size_t cap,
                         size_t& outLen, bool& found) {
  found  = false;
  outLen = 0;
  if (!mounted_) {
    MapError e = mount();
    if (e != MapError::None) return e;
  }

  Record rec;
  bool   hit = false;
  MapError e = locate_(key, rec, hit);
  if (e != MapError::None) return e;
  if (!hit) return MapError::None;

  outLen = rec.len;
  if (padded_(rec.len) > cap) return MapError::BufferTooSmall;

  e = read_(pageBase_(rec.page) + rec.offset + REC_HEADER_LEN, buf, padded_(rec.len));
  if (e != MapError::None) return e;
  found = true;
  return MapError::None;
}

MapError FlashMap::store(uint32_t key,
                         const uint8_t* prefix, size_t prefixLen,
                         const uint8_t* data, size_t len,
                         uint8_t* scratch, size_t scratchLen) {
  if (!geometryOk_ || key == ERASED_KEY) return MapError::BadRange;
  if (!mounted_) {
    MapError e = mount();
    if (e != MapError::None) return e;
  }

  const size_t vlen = prefixLen + len;
  if (vlen > maxValueLen()) return MapError::Full;
  const size_t rec = recordSize(vlen);
  if (rec > scratchLen) return MapError::BufferTooSmall;

  // encode the record once
  uint16_t crc = headerCrc_(key, (uint16_t)vlen);
  if (prefixLen) crc = crc16_(crc, prefix, prefixLen);
  if (len)       crc = crc16_(crc, data, len);
  put32_(scratch, key);
  put16_(scratch + 4, (uint16_t)vlen);
  put16_(scratch + 6, crc);
  if (prefixLen) memcpy(scratch + REC_HEADER_LEN, prefix, prefixLen);
  if (len)       memcpy(scratch + REC_HEADER_LEN + prefixLen, data, len);
  memset(scratch + REC_HEADER_LEN + vlen, 0xFF, rec - REC_HEADER_LEN - vlen);

  const size_t attempts = pageCount_ * 2 + 2;
  for (size_t i = 0; i < attempts; ++i) {
    if (open_ >= 0 && pages_[open_].used + rec <= pageSize_) {
      Page& pg = pages_[open_];
      MapError e = write_(pageBase_((uint32_t)open_) + pg.used, scratch, rec);
      if (e != MapError::None) {
        pg.used = (uint32_t)pageSize_;   // slot may be half programmed
        return e;
      }
      pg.used += (uint32_t)rec;
      return MapError::None;
    }

    const size_t freePages = freeCount_();
    MapError e = MapError::None;

    if (freePages >= 2) {
      if (open_ >= 0) e = closePage_((uint32_t)open_);
      if (e == MapError::None) e = openPage_((uint32_t)pickFree_());
    } else if (freePages == 1) {
      // Spare page reached: merge the oldest page into the open one when it
      // fits, otherwise roll it into the spare.
      int oldest = oldestClosed_();
      size_t live = 0;
      if (open_ >= 0 && oldest >= 0) e = liveBytes_((uint32_t)oldest, live);
      if (e != MapError::None) return e;

      if (open_ >= 0 && oldest >= 0 && pages_[open_].used + live <= pageSize_) {
        e = compactFrom_((uint32_t)oldest);
      } else {
        if (open_ >= 0) e = closePage_((uint32_t)open_);
        if (e == MapError::None) e = compactInto_((uint32_t)pickFree_());
      }
    } else {
      bool reclaimed = false;
      if (open_ >= 0) e = closePage_((uint32_t)open_);
      if (e == MapError::None) e = reclaimIfDead_(reclaimed);
      if (e == MapError::None && !reclaimed) return MapError::Full;
    }

    if (e != MapError::None) return e;
  }

  DBG_PRINTF("[FlashMap] no room for key 0x%08lx (%u bytes)\n",
             (unsigned long)key, (unsigned)vlen);
  return MapError::Full;
}

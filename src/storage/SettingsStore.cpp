#include <SettingsStore.hpp>
#include <KeyHash.hpp>
#include <Utils.hpp>
#include <string.h>

const char* settingsErrorName(SettingsError e) {
  switch (e) {
    case SettingsError::None:             return "none";
    case SettingsError::NotReady:         return "not-ready";
    case SettingsError::NotFound:         return "not-found";
    case SettingsError::CorruptOrInvalid: return "corrupt-or-invalid";
    case SettingsError::InvalidUtf8:      return "invalid-utf8";
    case SettingsError::DecodeFailed:     return "decode-failed";
    case SettingsError::EncodeFailed:     return "encode-failed";
    case SettingsError::BufferTooSmall:   return "buffer-too-small";
    case SettingsError::StorageFull:      return "storage-full";
    case SettingsError::ReservedKey:      return "reserved-key";
    case SettingsError::KeyCollision:     return "key-collision";
    case SettingsError::Storage:          return "storage";
    case SettingsError::KeyTooLong:       return "key-too-long";
  }
  return "?";
}

SettingsStore::SettingsStore(NorFlash& flash, uint32_t start, uint32_t end,
                             uint8_t* buffer, size_t bufferLen,
                             const Options& opts)
: map_(flash, start, end),
  buffer_(buffer),
  bufferLen_(buffer ? bufferLen : 0),
  opts_(opts) {}

// ======================================================
// lifecycle
// ======================================================
SettingsResult SettingsStore::init() {
  ready_ = false;

  MapError me = map_.mount();
  if (me != MapError::None) {
    DBG_PRINTF("[Settings] mount failed: %s\n", mapErrorName(me));
    return fromMap_(me);
  }

  size_t len   = 0;
  bool   found = false;
  me = map_.fetch(0, buffer_, bufferLen_, len, found);
  if (me == MapError::BufferTooSmall) {
    return SettingsResult::fail(SettingsError::CorruptOrInvalid);
  }
  if (me != MapError::None) return fromMap_(me);

  if (!found) {
    DBG_PRINTLN("[Settings] no format marker -> partition not provisioned");
    return SettingsResult::fail(SettingsError::NotFound);
  }

  const size_t markerLen = strlen(SETTINGS_FORMAT_MARKER);
  if (len != markerLen || memcmp(buffer_, SETTINGS_FORMAT_MARKER, markerLen) != 0) {
    DBG_PRINTLN("[Settings] format marker mismatch");
    return SettingsResult::fail(SettingsError::CorruptOrInvalid);
  }

  ready_ = true;
  return SettingsResult::success(true);
}

SettingsResult SettingsStore::reset() {
  ready_ = false;

  MapError me = map_.format();
  if (me != MapError::None) return fromMap_(me);

  const uint8_t* marker = reinterpret_cast<const uint8_t*>(SETTINGS_FORMAT_MARKER);
  me = map_.store(0, nullptr, 0, marker, strlen(SETTINGS_FORMAT_MARKER), buffer_, bufferLen_);
  if (me != MapError::None) return fromMap_(me);

  DBG_PRINTLN("[Settings] partition reset");
  ready_ = true;
  return SettingsResult::success(true);
}

// ======================================================
// raw bytes
// ======================================================
SettingsResult SettingsStore::get(const char* key, std::vector<uint8_t>& out) {
  out.clear();
  uint32_t hashed = 0;
  SettingsResult r = checkKey_(key, hashed);
  if (!r.ok()) return r;

  size_t off = 0, len = 0;
  r = fetch_(key, hashed, off, len);
  if (!r.ok() || !r.found) return r;

  out.assign(buffer_ + off, buffer_ + off + len);
  return r;
}

SettingsResult SettingsStore::set(const char* key, const uint8_t* data, size_t len) {
  uint32_t hashed = 0;
  SettingsResult r = checkKey_(key, hashed);
  if (!r.ok()) return r;

  // data may alias buffer_; the key check and store() both use buffer_,
  // so stage a copy first.
  std::vector<uint8_t> staged;
  if (data && buffer_ && data >= buffer_ && data < buffer_ + bufferLen_) {
    staged.assign(data, data + len);
    data = staged.data();
  }

  uint8_t prefix[1 + SETTINGS_MAX_KEY_LEN];
  size_t  prefixLen = 0;

  if (opts_.keyGuard) {
    // refuse to overwrite a different key that hashes the same
    size_t off = 0, oldLen = 0;
    r = fetch_(key, hashed, off, oldLen);
    if (!r.ok() && r.error != SettingsError::BufferTooSmall) return r;

    const size_t klen = strlen(key);
    prefix[0] = (uint8_t)klen;
    memcpy(prefix + 1, key, klen);
    prefixLen = klen + 1;
  }

  MapError me = map_.store(hashed, prefix, prefixLen, data, len, buffer_, bufferLen_);
  if (me != MapError::None) {
    DBG_PRINTF("[Settings] set '%s' failed: %s\n", key, mapErrorName(me));
    return fromMap_(me);
  }
  return SettingsResult::success(true);
}

// ======================================================
// UTF-8 text
// ======================================================
SettingsResult SettingsStore::getString(const char* key, std::string& out) {
  out.clear();
  std::vector<uint8_t> raw;
  SettingsResult r = get(key, raw);
  if (!r.ok() || !r.found) return r;

  if (!validUtf8(raw.data(), raw.size())) {
    return SettingsResult::fail(SettingsError::InvalidUtf8);
  }
  out.assign(raw.begin(), raw.end());
  return r;
}

SettingsResult SettingsStore::setString(const char* key, const std::string& value) {
  return set(key, reinterpret_cast<const uint8_t*>(value.data()), value.size());
}

bool SettingsStore::validUtf8(const uint8_t* s, size_t len) {
  size_t i = 0;
  while (i < len) {
    const uint8_t c = s[i];
    size_t   n;
    uint32_t cp;
    if (c < 0x80)                { i++; continue; }
    else if ((c & 0xE0) == 0xC0) { n = 1; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { n = 2; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { n = 3; cp = c & 0x07; }
    else return false;

    if (i + n >= len) return false;   // truncated sequence
    for (size_t k = 1; k <= n; k++) {
      if ((s[i + k] & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (s[i + k] & 0x3F);
    }
    // overlong, surrogate, out of range
    if ((n == 1 && cp < 0x80) || (n == 2 && cp < 0x800) || (n == 3 && cp < 0x10000)) return false;
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
    i += n + 1;
  }
  return true;
}

// ======================================================
// internals
// ======================================================
SettingsResult SettingsStore::fromMap_(MapError e) const {
  switch (e) {
    case MapError::None:           return SettingsResult::success(true);
    case MapError::Corrupted:      return SettingsResult::fail(SettingsError::CorruptOrInvalid);
    case MapError::Full:           return SettingsResult::fail(SettingsError::StorageFull);
    case MapError::BufferTooSmall: return SettingsResult::fail(SettingsError::BufferTooSmall);
    case MapError::BadRange:       return SettingsResult::fail(SettingsError::Storage, FlashError::OutOfBounds);
    case MapError::Storage:        break;
  }
  return SettingsResult::fail(SettingsError::Storage, map_.lastFlashError());
}

SettingsResult SettingsStore::checkKey_(const char* key, uint32_t& hashed) const {
  if (!ready_) return SettingsResult::fail(SettingsError::NotReady);
  if (!key)    return SettingsResult::fail(SettingsError::ReservedKey);

  const size_t klen = strlen(key);
  if (opts_.keyGuard && klen > SETTINGS_MAX_KEY_LEN) {
    return SettingsResult::fail(SettingsError::KeyTooLong);
  }

  hashed = KeyHash::hash(key, klen);
  if (hashed == 0 || hashed == FlashMap::ERASED_KEY) {
    DBG_PRINTF("[Settings] key '%s' hashes onto a reserved slot\n", key);
    return SettingsResult::fail(SettingsError::ReservedKey);
  }
  return SettingsResult::success(true);
}

// Value lands in buffer_[valueOff .. valueOff+valueLen).
SettingsResult SettingsStore::fetch_(const char* key, uint32_t hashed,
                                     size_t& valueOff, size_t& valueLen) {
  valueOff = 0;
  valueLen = 0;

  size_t len   = 0;
  bool   found = false;
  MapError me = map_.fetch(hashed, buffer_, bufferLen_, len, found);
  if (me != MapError::None) return fromMap_(me);
  if (!found) return SettingsResult::success(false);

  if (opts_.keyGuard) {
    const size_t klen = strlen(key);
    if (len < 1 || buffer_[0] != klen || len < klen + 1 ||
        memcmp(buffer_ + 1, key, klen) != 0) {
      DBG_PRINTF("[Settings] key '%s' collides with a stored key\n", key);
      return SettingsResult::fail(SettingsError::KeyCollision);
    }
    valueOff = klen + 1;
    valueLen = len - valueOff;
  } else {
    valueLen = len;
  }
  return SettingsResult::success(true);
}

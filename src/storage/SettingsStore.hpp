/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef SETTINGS_STORE_H
#define SETTINGS_STORE_H
/**
 * @file SettingsStore.h
 * @brief Typed key/value settings on top of FlashMap.
 *
 * - String keys are hashed (KeyHash) to the u32 map key.
 * - Key 0 holds the format marker "settings-0.0"; init() refuses anything
 *   else, reset() erases the range and writes it.
 * - Values: raw bytes, UTF-8 strings, or MessagePack structures. A type T
 *   is storable once these two free functions exist for it:
 *       bool encodeSetting(const T& v, JsonVariant dst);
 *       bool decodeSetting(JsonVariantConst src, T& v);
 * - Every call is synchronous and runs the flash work to completion.
 *
 * Usage:
 *   static uint8_t buf[SETTINGS_BUFFER_SIZE];
 *   SettingsStore store(flash, start, end, buf, sizeof(buf));
 *   if (!store.init().ok()) ...
 *   store.getStructured("alarm-settings", settings);
 */

#include <ArduinoJson.h>
#include <FlashMap.hpp>
#include <string>
#include <vector>

#ifndef SETTINGS_FORMAT_MARKER
#define SETTINGS_FORMAT_MARKER  "settings-0.0"
#endif
#ifndef SETTINGS_MAX_KEY_LEN
#define SETTINGS_MAX_KEY_LEN    32
#endif
// Capacity of the JsonDocument used to encode a structured value.
#ifndef SETTINGS_DOC_CAPACITY
#define SETTINGS_DOC_CAPACITY   2048
#endif

enum class SettingsError : uint8_t {
  None             = 0,
  NotReady         = 1,    // init()/reset() not done yet
  NotFound         = 2,    // format marker absent (never provisioned)
  CorruptOrInvalid = 3,    // marker mismatch or broken map
  InvalidUtf8      = 4,
  DecodeFailed     = 5,
  EncodeFailed     = 6,
  BufferTooSmall   = 7,
  StorageFull      = 8,
  ReservedKey      = 9,    // key hashes onto a reserved map key
  KeyCollision     = 10,   // key guard: stored key string differs
  Storage          = 11,   // device error, see SettingsResult::flash
  KeyTooLong       = 12,   // key guard: key exceeds SETTINGS_MAX_KEY_LEN
};

const char* settingsErrorName(SettingsError e);

struct SettingsResult {
  SettingsError error = SettingsError::None;
  FlashError    flash = FlashError::None;
  bool          found = false;

  bool ok() const { return error == SettingsError::None; }

  static SettingsResult success(bool found = true) {
    SettingsResult r;
    r.found = found;
    return r;
  }
  static SettingsResult fail(SettingsError e, FlashError f = FlashError::None) {
    SettingsResult r;
    r.error = e;
    r.flash = f;
    return r;
  }
};

class SettingsStore {
public:
  struct Options {
    // Prefix every value with its key string and check it on access.
    // A partition must be written and read in the same mode.
    bool keyGuard = false;
  };

  SettingsStore(NorFlash& flash, uint32_t start, uint32_t end,
                uint8_t* buffer, size_t bufferLen,
                const Options& opts = Options());

  // -------- lifecycle --------
  SettingsResult init();
  SettingsResult reset();
  bool           ready() const { return ready_; }

  // -------- raw bytes --------
  SettingsResult get(const char* key, std::vector<uint8_t>& out);
  SettingsResult set(const char* key, const uint8_t* data, size_t len);

  // -------- UTF-8 text --------
  SettingsResult getString(const char* key, std::string& out);
  SettingsResult setString(const char* key, const std::string& value);

  // -------- MessagePack structures --------
  template <typename T>
  SettingsResult getStructured(const char* key, T& out);

  template <typename T>
  SettingsResult setStructured(const char* key, const T& value,
                               uint8_t* buf, size_t bufLen);

  static bool validUtf8(const uint8_t* data, size_t len);

  const FlashMap& map() const { return map_; }

private:
  SettingsStore(const SettingsStore&) = delete;
  SettingsStore& operator=(const SettingsStore&) = delete;

  SettingsResult fromMap_(MapError e) const;
  SettingsResult checkKey_(const char* key, uint32_t& hashed) const;
  SettingsResult fetch_(const char* key, uint32_t hashed, size_t& valueOff, size_t& valueLen);

  FlashMap  map_;
  uint8_t*  buffer_;
  size_t    bufferLen_;
  Options   opts_;
  bool      ready_ = false;
};

// ======================================================
// template members
// ======================================================
template <typename T>
SettingsResult SettingsStore::getStructured(const char* key, T& out) {
  std::vector<uint8_t> raw;
  SettingsResult r = get(key, raw);
  if (!r.ok() || !r.found) return r;

  // msgpack input is copied into the pool: size it from the payload
  DynamicJsonDocument doc(raw.size() * 24 + 128);
  DeserializationError de = deserializeMsgPack(doc, reinterpret_cast<const char*>(raw.data()), raw.size());
  if (de) return SettingsResult::fail(SettingsError::DecodeFailed);
  if (!decodeSetting(doc.as<JsonVariantConst>(), out)) {
    return SettingsResult::fail(SettingsError::DecodeFailed);
  }
  return SettingsResult::success(true);
}

template <typename T>
SettingsResult SettingsStore::setStructured(const char* key, const T& value,
                                            uint8_t* buf, size_t bufLen) {
  if (!ready_) return SettingsResult::fail(SettingsError::NotReady);

  DynamicJsonDocument doc(SETTINGS_DOC_CAPACITY);
  JsonVariant root = doc.to<JsonVariant>();
  if (!encodeSetting(value, root) || doc.overflowed()) {
    return SettingsResult::fail(SettingsError::EncodeFailed);
  }
  if (measureMsgPack(doc) > bufLen) {
    return SettingsResult::fail(SettingsError::EncodeFailed);
  }
  const size_t n = serializeMsgPack(doc, buf, bufLen);
  return set(key, buf, n);
}

#endif // SETTINGS_STORE_H

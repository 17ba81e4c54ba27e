#include <Utils.hpp>

// Serial backend for the Debug helpers (panel build).
namespace {
  bool s_serialInit = false;

  inline void ensureSerial_(unsigned long baud = SERIAL_BAUD_RATE) {
    if (!s_serialInit) {
      Serial.begin(baud);
      s_serialInit = true;
    }
  }
} // namespace

namespace Debug {
  void begin(unsigned long baud) { ensureSerial_(baud); }

  void write_(const char* data, size_t n) {
    ensureSerial_();
    Serial.write(reinterpret_cast<const uint8_t*>(data), n);
  }
} // namespace Debug

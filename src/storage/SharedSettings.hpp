/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef SHARED_SETTINGS_H
#define SHARED_SETTINGS_H
/**
 * @file SharedSettings.h
 * @brief The one settings store of the panel, shared by the alarm and the
 *        scheduler tasks.
 *
 * - Every call takes the lock for its whole duration.
 * - Only one instance may be alive: a second construction is a programming
 *   error and stops the firmware.
 *
 * Boot:
 *   SharedSettings::Init(store, mutex);
 *   SETTINGS->init();
 */

#include <Lockable.hpp>
#include <SettingsStore.hpp>

class SharedSettings {
public:
  // Creates the global instance. Calling it twice aborts.
  static SharedSettings* Init(SettingsStore& store, Lockable& lock);
  static SharedSettings* Get();    // nullptr before Init()

  SharedSettings(SettingsStore& store, Lockable& lock);
  ~SharedSettings();

  SettingsResult init();
  SettingsResult reset();
  bool           ready();

  SettingsResult get(const char* key, std::vector<uint8_t>& out);
  SettingsResult set(const char* key, const uint8_t* data, size_t len);
  SettingsResult getString(const char* key, std::string& out);
  SettingsResult setString(const char* key, const std::string& value);

  template <typename T>
  SettingsResult getStructured(const char* key, T& out) {
    LockGuard g(lock_);
    return store_.getStructured(key, out);
  }

  template <typename T>
  SettingsResult setStructured(const char* key, const T& value, uint8_t* buf, size_t len) {
    LockGuard g(lock_);
    return store_.setStructured(key, value, buf, len);
  }

private:
  SharedSettings(const SharedSettings&) = delete;
  SharedSettings& operator=(const SharedSettings&) = delete;

  static SharedSettings* s_instance;
  static bool            s_alive;

  SettingsStore& store_;
  Lockable&      lock_;
};

#define SETTINGS SharedSettings::Get()

#endif // SHARED_SETTINGS_H

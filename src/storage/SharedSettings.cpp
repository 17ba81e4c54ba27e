#include <SharedSettings.hpp>
#include <Utils.hpp>
#include <stdlib.h>

SharedSettings* SharedSettings::s_instance = nullptr;
bool            SharedSettings::s_alive    = false;

SharedSettings* SharedSettings::Init(SettingsStore& store, Lockable& lock) {
    s_instance = new SharedSettings(store, lock);
    return s_instance;
}

SharedSettings* SharedSettings::Get() {
    return s_instance;
}

SharedSettings::SharedSettings(SettingsStore& store, Lockable& lock)
: store_(store), lock_(lock) {
    if (s_alive) {
        // Two owners of one flash range would interleave appends.
        DBG_PRINTLN("[Settings] FATAL: second SharedSettings instance");
        abort();
    }
    s_alive = true;
}

SharedSettings::~SharedSettings() {
    if (s_instance == this) s_instance = nullptr;
    s_alive = false;
}

SettingsResult SharedSettings::init() {
    LockGuard g(lock_);
    return store_.init();
}

SettingsResult SharedSettings::reset() {
    LockGuard g(lock_);
    return store_.reset();
}

bool SharedSettings::ready() {
    LockGuard g(lock_);
    return store_.ready();
}

SettingsResult SharedSettings::get(const char* key, std::vector<uint8_t>& out) {
    LockGuard g(lock_);
    return store_.get(key, out);
}

SettingsResult SharedSettings::set(const char* key, const uint8_t* data, size_t len) {
    LockGuard g(lock_);
    return store_.set(key, data, len);
}

SettingsResult SharedSettings::getString(const char* key, std::string& out) {
    LockGuard g(lock_);
    return store_.getString(key, out);
}

SettingsResult SharedSettings::setString(const char* key, const std::string& value) {
    LockGuard g(lock_);
    return store_.setString(key, value);
}

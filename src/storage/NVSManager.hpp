/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef NVS_MANAGER_H
#define NVS_MANAGER_H
/**
 * @file NVSManager.h
 * @brief Boot bookkeeping in ESP32 NVS (Preferences) + restart helpers.
 *
 * - Singleton (NVS::Init(), then NVS::Get()).
 * - Owns Preferences internally, opens it lazily.
 * - All calls are mutex-protected.
 * - Alarm configuration does NOT live here: it is in the raw settings
 *   partition (SharedSettings). NVS only keeps what the panel learns
 *   about itself: boot counter and why it restarted.
 *
 * Usage:
 *   NVS::Init();
 *   CONF->begin();                 // bumps the boot counter
 *   CONF->RestartSysDelay(5000, "settings partition");
 */

#include <Arduino.h>
#include <Config.hpp>
#include <Preferences.h>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <freertos/task.h>

class NVS {
public:
    // -----------------------------------------------------------------
    // Singleton access
    // -----------------------------------------------------------------
    static void Init();
    static NVS* Get();      // ALWAYS returns a valid pointer

    // -----------------------------------------------------------------
    // Lifecycle
    // -----------------------------------------------------------------
    void begin();   // open prefs, count this boot, print last reason
    void end();     // close prefs

    ~NVS();

    // -----------------------------------------------------------------
    // Boot bookkeeping
    // -----------------------------------------------------------------
    uint32_t BootCount();
    String   LastRestartReason();
    void     SetRestartReason(const char* reason);

    // -----------------------------------------------------------------
    // System helpers (reboot)
    // -----------------------------------------------------------------
    // Stores `reason`, counts down `delayTime` ms, restarts. Never returns.
    void RestartSysDelay(unsigned long delayTime, const char* reason);

private:
    NVS();
    NVS(const NVS&) = delete;
    NVS& operator=(const NVS&) = delete;

    static NVS* s_instance;

    inline void lock_();
    inline void unlock_();

    void ensureOpenRW_();
    void PutString(const char* key, const String& value);   // auto-open

    static inline void sleepMs_(uint32_t ms);

    Preferences  preferences;
    const char*  namespaceName;      // CONFIG_PARTITION

    bool is_open_   = false;
    uint32_t bootCount_ = 0;
    String   lastReason_ = LAST_RESET_REASON_DEFAULT;

    SemaphoreHandle_t mutex_ = nullptr;
};

#define CONF NVS::Get()

#endif // NVS_MANAGER_H

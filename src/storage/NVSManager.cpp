#include <NVSManager.hpp>
#include <Config.hpp>
#include <Utils.hpp>
#include <esp_system.h>
#include <esp_task_wdt.h>

// ======================================================
// Static singleton pointer
// ======================================================
NVS* NVS::s_instance = nullptr;

void NVS::Init() {
    (void)NVS::Get();
}

NVS* NVS::Get() {
    if (!s_instance) {
        s_instance = new NVS();
    }
    return s_instance;
}

// ======================================================
// ctor / dtor
// ======================================================
NVS::NVS()
: namespaceName(CONFIG_PARTITION) {
    mutex_ = xSemaphoreCreateRecursiveMutex();
}

NVS::~NVS() {
    end();
    if (mutex_) {
        vSemaphoreDelete(mutex_);
        mutex_ = nullptr;
    }
}

inline void NVS::sleepMs_(uint32_t ms) {
    if (xTaskGetSchedulerState() != taskSCHEDULER_NOT_STARTED) {
        vTaskDelay(pdMS_TO_TICKS(ms));
    } else {
        delay(ms);
    }
}

inline void NVS::lock_()   { if (mutex_) xSemaphoreTakeRecursive(mutex_, portMAX_DELAY); }
inline void NVS::unlock_() { if (mutex_) xSemaphoreGiveRecursive(mutex_); }

// ======================================================
// Preferences open state helpers
// ======================================================
void NVS::ensureOpenRW_() {
    if (!is_open_) {
        preferences.begin(namespaceName, /*readOnly=*/false);
        is_open_ = true;
    }
}

void NVS::end() {
    lock_();
    if (is_open_) {
        preferences.end();
        is_open_ = false;
    }
    unlock_();
}

// ======================================================
// begin()
// ======================================================
void NVS::begin() {
    DBGSTR();
    DBG_PRINTLN("###########################################################");
    DBG_PRINTLN("#                 Starting NVS Manager                    #");
    DBG_PRINTLN("###########################################################");
    DBGSTP();

    lock_();
    ensureOpenRW_();
    bootCount_ = (uint32_t)preferences.getInt(BOOT_COUNT_KEY, 0) + 1;
    preferences.putInt(BOOT_COUNT_KEY, (int)bootCount_);
    lastReason_ = preferences.getString(LAST_RESET_REASON_KEY, LAST_RESET_REASON_DEFAULT);
    // next unexplained restart reads as a crash / power loss
    preferences.putString(LAST_RESET_REASON_KEY, LAST_RESET_REASON_DEFAULT);
    unlock_();

    DBG_PRINTF("[NVS] boot #%lu, last restart: %s (esp reason %d)\n",
               (unsigned long)bootCount_, lastReason_.c_str(), (int)esp_reset_reason());
}

// ======================================================
// Boot bookkeeping
// ======================================================
uint32_t NVS::BootCount() {
    return bootCount_;
}

String NVS::LastRestartReason() {
    return lastReason_;     // as read by begin(), before the slot was re-armed
}

void NVS::SetRestartReason(const char* reason) {
    PutString(LAST_RESET_REASON_KEY, reason ? String(reason) : String("unspecified"));
}

// ======================================================
// Raw access
// ======================================================
void NVS::PutString(const char* key, const String& value) {
    esp_task_wdt_reset();
    lock_();
    ensureOpenRW_();
    if (preferences.isKey(key)) preferences.remove(key);
    preferences.putString(key, value);
    unlock_();
}

// ======================================================
// System helpers / reboot paths
// ======================================================
void NVS::RestartSysDelay(unsigned long delayTime, const char* reason) {
    SetRestartReason(reason);
    end();

    unsigned long interval = delayTime / 30;
    DBGSTR();
    DBG_PRINTLN("###########################################################");
    DBG_PRINTF ("#           Restarting the Device in: %lu Sec              #\n", delayTime / 1000);
    DBG_PRINTLN("###########################################################");
    DBG_PRINTF ("[NVS] Reason: %s\n", reason ? reason : "unspecified");
    DBGSTP();
    for (int i = 0; i < 30; i++) {
        DBG_PRINT(".");
        sleepMs_(interval);
        esp_task_wdt_reset();
    }
    DBG_PRINTLN();
    DBG_PRINTLN("[NVS] Restarting now...");
    esp_restart();
}

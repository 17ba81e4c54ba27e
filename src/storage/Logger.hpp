/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef LOGGER_H
#define LOGGER_H

#include <Arduino.h>
#include <ArduinoJson.h>
#include <Journal.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <freertos/task.h>

// ---------------- Tunables (override via -D at build) ---------------
#ifndef LOGGER_MAX_LINE_BYTES
#define LOGGER_MAX_LINE_BYTES  192
#endif
#ifndef LOGGER_QUEUE_DEPTH
#define LOGGER_QUEUE_DEPTH     32
#endif
#ifndef LOGGER_ROTATE_BYTES
#define LOGGER_ROTATE_BYTES    (256u * 1024u)
#endif
#ifndef LOGGER_TASK_STACK
#define LOGGER_TASK_STACK      4096
#endif
#ifndef LOGGER_TASK_PRIO
#define LOGGER_TASK_PRIO       1
#endif
#ifndef LOGGER_TICK_MS
#define LOGGER_TICK_MS         500
#endif
#ifndef LOGGER_FS_FREE_MARGIN
#define LOGGER_FS_FREE_MARGIN  (16u * 1024u)
#endif

// Recovery behavior
#ifndef LOGGER_RECOVERY_BASE_MS
#define LOGGER_RECOVERY_BASE_MS   1000
#endif
#ifndef LOGGER_RECOVERY_MAX_MS
#define LOGGER_RECOVERY_MAX_MS    30000
#endif
#ifndef LOGGER_RECOVERY_FMT_EVERY
#define LOGGER_RECOVERY_FMT_EVERY 5
#endif

/**
 * Alarm journal on SPIFFS.
 * One compact JSON object per line:
 *   {"t":<uptime ms>,"b":<boot #>,"e":"state|cmd|fault|boot","m":"...","k":0|1}
 * Lines that cannot be written (FS down) wait in a RAM ring that the
 * maintenance task flushes once the recovery task has the FS back.
 */
class Logger : public Journal {
public:
    // -------- Singleton access (pointer-style) --------
    static void    Init(uint32_t bootCount = 0);
    static Logger* Get();     // ALWAYS returns a valid pointer (auto-constructs)
    static Logger* TryGet();  // May return nullptr if not created yet

    // -------- Lifecycle --------
    bool Begin();             // mount FS, start tasks, create log file if missing
    ~Logger() override = default;

    // -------- Public API --------
    bool   createLogFile();

    // -------- Journal --------
    void   logAlarmState(const char* from, const char* to) override;
    void   logCommand(const char* command, bool applied) override;
    void   logFault(const char* where, const char* detail) override;
    void   logBoot(const char* lastReason);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static Logger* s_instance;

    bool        initialized   = false;
    uint32_t    bootCount_    = 0;

    // RTOS primitives
    TaskHandle_t      maintTask_   = nullptr;  // rotation + flushing
    TaskHandle_t      recoverTask_ = nullptr;  // FS recovery/backoff
    SemaphoreHandle_t mutex_       = nullptr;  // protects FS & queue

    struct Item { char line[LOGGER_MAX_LINE_BYTES]; };

    Item*    queue_         = nullptr;
    uint16_t qCap_          = 0;
    uint16_t qHead_         = 0;
    uint16_t qTail_         = 0;
    uint16_t qCount_        = 0;

    bool     fsHealthy_     = false;
    bool     notifiedDrop_  = false;

    enum FSState : uint8_t {
        FS_UNMOUNTED = 0,
        FS_MOUNTING,
        FS_MOUNTED,
        FS_FORMATTING,
        FS_ERROR
    };
    volatile FSState fsState_ = FS_UNMOUNTED;
    uint32_t backoffMs_       = LOGGER_RECOVERY_BASE_MS;
    uint32_t attempts_        = 0;

    // --- RTOS tasks ---
    static void MaintTaskTrampoline(void* arg);
    void        MaintTaskLoop();
    static void RecoverTaskTrampoline(void* arg);
    void        RecoverTaskLoop();

    // --- FS helpers ---
    bool   ensureFS(bool allowFormat);
    void   safeFormat();
    bool   tryAppendLine(const char* line);
    void   rotateIfNeeded();
    void   ensureFsBudget(size_t bytesNeeded);
    size_t fsFreeBytes() const;

    // --- RAM queue ops ---
    bool   allocateQueue();
    void   enqueueLine(const char* line);
    bool   dequeueLine(Item& out);
    void   flushQueue();

    // --- line formatter ---
    void   write_(const char* event, const char* message, bool status);
    size_t formatLine(char* out, size_t outSz,
                      const char* event, const char* message, bool status);
};

// Pointer-style convenience macro:
//   LOGG->Begin(); LOGG->logFault("siren", "write failed");
#define LOGG Logger::Get()

#endif // LOGGER_H

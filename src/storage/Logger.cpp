#include <Logger.hpp>
#include <Config.hpp>
#include <Utils.hpp>
#include <FS.h>
#include <SPIFFS.h>
#include <esp_heap_caps.h>
#include <stdio.h>

// simple member-aware lock macros
#define LOCK()   if (mutex_) xSemaphoreTake(mutex_, portMAX_DELAY)
#define UNLOCK() if (mutex_) xSemaphoreGive(mutex_)

// ---------------- Singleton storage ----------------
Logger* Logger::s_instance = nullptr;

void Logger::Init(uint32_t bootCount) {
    if (!s_instance) s_instance = new Logger();
    s_instance->bootCount_ = bootCount;
}

Logger* Logger::Get() {
    if (!s_instance) s_instance = new Logger();
    return s_instance;
}

Logger* Logger::TryGet() {
    return s_instance;
}

// ---------------- Begin ----------------
bool Logger::Begin() {
    if (!mutex_) mutex_ = xSemaphoreCreateMutex();

    DBGSTR();
    DBG_PRINTLN("###########################################################");
    DBG_PRINTLN("#                   Starting Log Manager                  #");
    DBG_PRINTLN("###########################################################");
    DBGSTP();

    fsHealthy_ = ensureFS(/*allowFormat=*/true);
    fsState_   = fsHealthy_ ? FS_MOUNTED : FS_UNMOUNTED;

    if (fsHealthy_ && !SPIFFS.exists(LOGFILE_PATH)) {
        createLogFile();
    }

    (void)allocateQueue();

    if (!maintTask_) {
        xTaskCreate(MaintTaskTrampoline, "LoggerMaint", LOGGER_TASK_STACK,
                    this, LOGGER_TASK_PRIO, &maintTask_);
    }
    if (!recoverTask_) {
        xTaskCreate(RecoverTaskTrampoline, "LoggerRecover", LOGGER_TASK_STACK,
                    this, LOGGER_TASK_PRIO, &recoverTask_);
    }

    initialized = true;
    return fsHealthy_;
}

// ---------------- Public API ----------------
bool Logger::createLogFile() {
    LOCK();
    File f = SPIFFS.open(LOGFILE_PATH, FILE_WRITE);
    if (!f) { UNLOCK(); return false; }
    f.close();
    UNLOCK();
    return true;
}

// ---------------- Journal ----------------
void Logger::logAlarmState(const char* from, const char* to) {
    char msg[64];
    snprintf(msg, sizeof(msg), "%s>%s", from ? from : "?", to ? to : "?");
    write_("state", msg, true);
}

void Logger::logCommand(const char* command, bool applied) {
    write_("cmd", command ? command : "?", applied);
}

void Logger::logFault(const char* where, const char* detail) {
    char msg[96];
    snprintf(msg, sizeof(msg), "%s: %s", where ? where : "?", detail ? detail : "");
    write_("fault", msg, false);
}

void Logger::logBoot(const char* lastReason) {
    write_("boot", lastReason ? lastReason : "", true);
}

void Logger::write_(const char* event, const char* message, bool status) {
    if (!initialized) return;
    char line[LOGGER_MAX_LINE_BYTES];
    formatLine(line, sizeof(line), event, message, status);
    if (!tryAppendLine(line)) enqueueLine(line);
}

// ---------------- Compact JSON lines ----------------
size_t Logger::formatLine(char* out, size_t outSz,
                          const char* event, const char* message, bool status) {
    StaticJsonDocument<256> doc;
    doc["t"] = (unsigned long)millis();
    doc["b"] = bootCount_;
    doc["e"] = event ? event : "event";
    doc["m"] = message ? message : "";
    doc["k"] = status ? 1 : 0;
    size_t n = serializeJson(doc, out, outSz);
    if (n == 0 && outSz) out[0] = '\0';
    return n;
}

// ---------------- FS helpers ----------------
bool Logger::ensureFS(bool allowFormat) {
    if (SPIFFS.begin(false)) return true;
    if (allowFormat) {
        safeFormat();
        if (SPIFFS.begin(false)) return true;
    }
    return false;
}

void Logger::safeFormat() {
    DBG_PRINTLN("[Logger] SPIFFS: formatting (requested by recovery)...");
    SPIFFS.format();
}

size_t Logger::fsFreeBytes() const {
    return SPIFFS.totalBytes() - SPIFFS.usedBytes();
}

void Logger::ensureFsBudget(size_t bytesNeeded) {
    if (fsFreeBytes() > bytesNeeded + LOGGER_FS_FREE_MARGIN) return;

    String bak = String(LOGFILE_PATH) + ".1";
    if (SPIFFS.exists(bak)) SPIFFS.remove(bak);
}

bool Logger::tryAppendLine(const char* line) {
    bool healthy;
    LOCK(); healthy = fsHealthy_; UNLOCK();
    if (!healthy) return false;

    rotateIfNeeded();
    ensureFsBudget(strlen(line) + 2);

    LOCK();
    File f = SPIFFS.open(LOGFILE_PATH, FILE_APPEND);
    if (!f) {
        fsHealthy_ = false;
        UNLOCK();
        return false;
    }
    size_t w1 = f.print(line);
    size_t w2 = f.print("\n");
    f.close();
    if (w1 == 0 || w2 == 0) {
        fsHealthy_ = false;
        UNLOCK();
        return false;
    }
    UNLOCK();
    return true;
}

void Logger::rotateIfNeeded() {
    LOCK();
    File f = SPIFFS.open(LOGFILE_PATH, FILE_READ);
    if (!f) { UNLOCK(); return; }
    size_t sz = f.size();
    f.close();
    if (sz < LOGGER_ROTATE_BYTES) { UNLOCK(); return; }

    String bak = String(LOGFILE_PATH) + ".1";
    if (SPIFFS.exists(bak)) SPIFFS.remove(bak);
    SPIFFS.rename(LOGFILE_PATH, bak);
    File nf = SPIFFS.open(LOGFILE_PATH, FILE_WRITE);
    if (nf) nf.close();
    UNLOCK();
}

// ---------------- RAM queue (PSRAM when present) ----------------
bool Logger::allocateQueue() {
    const uint32_t caps = psramFound() ? (MALLOC_CAP_SPIRAM | MALLOC_CAP_8BIT) : MALLOC_CAP_8BIT;

    uint16_t target = LOGGER_QUEUE_DEPTH;
    while (target >= 4) {
        Item* mem = (Item*)heap_caps_malloc(sizeof(Item) * target, caps);
        if (mem) {
            queue_ = mem;
            qCap_  = target;
            DBG_PRINTF("[Logger] queue depth=%u\n", (unsigned)qCap_);
            return true;
        }
        target /= 2;
    }
    DBG_PRINTLN("[Logger] no memory for the line queue -> buffering disabled.");
    return false;
}

void Logger::enqueueLine(const char* line) {
    if (!queue_ || qCap_ == 0) return;

    LOCK();
    if (qCount_ == qCap_) {
        qHead_ = (qHead_ + 1) % qCap_;
        qCount_--;
        if (!notifiedDrop_) { DBG_PRINTLN("[Logger] queue full -> dropping oldest."); notifiedDrop_ = true; }
    }
    strncpy(queue_[qTail_].line, line, LOGGER_MAX_LINE_BYTES - 1);
    queue_[qTail_].line[LOGGER_MAX_LINE_BYTES - 1] = '\0';
    qTail_ = (qTail_ + 1) % qCap_;
    qCount_++;
    UNLOCK();
}

bool Logger::dequeueLine(Item& out) {
    LOCK();
    if (!queue_ || qCount_ == 0) { UNLOCK(); return false; }
    out = queue_[qHead_];
    qHead_ = (qHead_ + 1) % qCap_;
    qCount_--;
    UNLOCK();
    return true;
}

void Logger::flushQueue() {
    bool healthy;
    LOCK(); healthy = fsHealthy_; UNLOCK();
    if (!healthy || !queue_) return;

    Item it;
    while (dequeueLine(it)) {
        if (!tryAppendLine(it.line)) {
            // put it back at the head, retry later
            LOCK();
            qHead_ = (qHead_ + qCap_ - 1) % qCap_;
            queue_[qHead_] = it;
            qCount_++;
            UNLOCK();
            break;
        }
    }
    notifiedDrop_ = false;
}

// ---------------- RTOS tasks ----------------
void Logger::MaintTaskTrampoline(void* arg) {
    static_cast<Logger*>(arg)->MaintTaskLoop();
}

void Logger::MaintTaskLoop() {
    for (;;) {
        bool healthy;
        LOCK(); healthy = fsHealthy_; UNLOCK();
        if (healthy) {
            rotateIfNeeded();
            flushQueue();
        }
        vTaskDelay(pdMS_TO_TICKS(LOGGER_TICK_MS));
    }
}

void Logger::RecoverTaskTrampoline(void* arg) {
    static_cast<Logger*>(arg)->RecoverTaskLoop();
}

void Logger::RecoverTaskLoop() {
    for (;;) {
        bool healthy;
        LOCK(); healthy = fsHealthy_; UNLOCK();

        if (!healthy) {
            FSState st;
            LOCK(); st = fsState_; UNLOCK();

            if (st == FS_UNMOUNTED || st == FS_ERROR || st == FS_MOUNTED) {
                LOCK(); fsState_ = FS_MOUNTING; UNLOCK();
                SPIFFS.end();
                bool ok = ensureFS(/*allowFormat=*/false);
                if (!ok && (++attempts_ % LOGGER_RECOVERY_FMT_EVERY) == 0) {
                    LOCK(); fsState_ = FS_FORMATTING; UNLOCK();
                    DBG_PRINTLN("[Logger] Recovery: formatting SPIFFS (escalation)...");
                    safeFormat();
                    ok = ensureFS(/*allowFormat=*/false);
                }

                if (ok) {
                    DBG_PRINTLN("[Logger] Recovery: SPIFFS mounted");
                    LOCK();
                    fsState_   = FS_MOUNTED;
                    fsHealthy_ = true;
                    UNLOCK();
                    attempts_  = 0;
                    backoffMs_ = LOGGER_RECOVERY_BASE_MS;
                    if (!SPIFFS.exists(LOGFILE_PATH)) (void)createLogFile();
                    flushQueue();
                } else {
                    LOCK(); fsState_ = FS_ERROR; UNLOCK();
                    backoffMs_ <<= 1;
                    if (backoffMs_ > LOGGER_RECOVERY_MAX_MS) backoffMs_ = LOGGER_RECOVERY_MAX_MS;
                    DBG_PRINTF("[Logger] Recovery: mount failed, backing off %lu ms\n",
                               (unsigned long)backoffMs_);
                }
            }
        }
        vTaskDelay(pdMS_TO_TICKS(healthy ? 2000 : backoffMs_));
    }
}

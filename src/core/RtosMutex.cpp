#include <RtosMutex.hpp>

RtosMutex::RtosMutex() {
    mutex_ = xSemaphoreCreateRecursiveMutex();
}

RtosMutex::~RtosMutex() {
    if (mutex_) {
        vSemaphoreDelete(mutex_);
        mutex_ = nullptr;
    }
}

void RtosMutex::lock()    { if (mutex_) xSemaphoreTakeRecursive(mutex_, portMAX_DELAY); }
void RtosMutex::unlock()  { if (mutex_) xSemaphoreGiveRecursive(mutex_); }

bool RtosMutex::tryLock() {
    if (!mutex_) return true;
    return xSemaphoreTakeRecursive(mutex_, 0) == pdTRUE;
}

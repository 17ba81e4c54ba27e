/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef RTOS_MUTEX_H
#define RTOS_MUTEX_H

#include <Lockable.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>

// Recursive FreeRTOS mutex behind the Lockable seam.
// Recursive so nested store calls from the same task stay safe.
class RtosMutex : public Lockable {
public:
    RtosMutex();
    ~RtosMutex() override;

    void lock() override;
    void unlock() override;
    bool tryLock() override;

private:
    RtosMutex(const RtosMutex&) = delete;
    RtosMutex& operator=(const RtosMutex&) = delete;

    SemaphoreHandle_t mutex_ = nullptr;
};

#endif // RTOS_MUTEX_H

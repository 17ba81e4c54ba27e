/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef SERIAL_UPLINK_H
#define SERIAL_UPLINK_H

/**
 * @file SerialUplink.h
 * @brief Bench uplink over the debug serial port (no broker needed).
 *
 * Out:  PUB <topic> <payload>          (retained publishes get "PUB+")
 * In:   CMD <word> [args]              -> Scheduler::onAlarmCommand()
 *       SET <key> <value>              -> Scheduler::onSetSetting(key, value)
 *       TOPIC <topic> <payload>        -> Scheduler::onMessage()
 */

#include <Arduino.h>
#include <Config.hpp>
#include <Scheduler.hpp>
#include <Uplink.hpp>

class SerialUplink : public Uplink {
public:
    explicit SerialUplink(Stream& port);

    void attach(Scheduler* scheduler) { scheduler_ = scheduler; }

    // Read whatever arrived; dispatch complete lines. Scheduler task only.
    void poll();

    bool isOnline() override { return true; }
    bool publish(const char* topic, const uint8_t* payload, size_t len, bool retain) override;

private:
    void handleLine_(char* line);

    Stream&    port_;
    Scheduler* scheduler_ = nullptr;
    char       line_[UPLINK_LINE_MAX];
    size_t     len_      = 0;
    bool       overflow_ = false;
};

#endif // SERIAL_UPLINK_H

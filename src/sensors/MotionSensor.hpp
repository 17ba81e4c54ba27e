/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef MOTION_SENSOR_H
#define MOTION_SENSOR_H

/**
 * Polled PIR input
 * - HIGH = motion present.
 * - Last level starts LOW, so a sensor already high at boot reports a
 *   rising edge on the first poll.
 * - poll() from the alarm loop only; no ISR, no RTOS.
 */

#include <AlarmTypes.hpp>
#include <DigitalIo.hpp>

class MotionSensor {
public:
    enum Edge : uint8_t { EDGE_NONE = 0, EDGE_RISING, EDGE_FALLING };

    MotionSensor(const Entity* entity, uint8_t pin, DigitalIo& io);

    void begin();
    Edge poll();

    const Entity* entity() const { return entity_; }
    uint8_t       pin() const    { return pin_; }
    bool          level() const  { return lastLevel_; }

private:
    const Entity* entity_;
    uint8_t       pin_;
    DigitalIo*    io_;
    bool          lastLevel_ = false;
};

#endif // MOTION_SENSOR_H

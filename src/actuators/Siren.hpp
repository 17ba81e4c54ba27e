/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef SIREN_H
#define SIREN_H

#include <DigitalIo.hpp>

// Siren relay output: HIGH = sounding. Owned by the Alarm.
class Siren {
public:
    Siren(uint8_t pin, DigitalIo& io);

    bool begin();            // configure as output, start silent
    bool set(bool on);       // false if the GPIO write failed
    bool isOn() const { return on_; }
    uint8_t pin() const { return pin_; }

private:
    uint8_t    pin_;
    DigitalIo* io_;
    bool       on_ = false;
};

#endif // SIREN_H
